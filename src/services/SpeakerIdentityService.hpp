#pragma once
#include <QObject>
#include <QThreadPool>
#include <vector>

#include "config/ServiceConfig.hpp"
#include "include/types.hpp"
#include "match/SpeakerMatcher.hpp"
#include "services/MergeEngine.hpp"
#include "services/RetroactiveLabeler.hpp"
#include "services/SuggestionEngine.hpp"
#include "store/ProfileStore.hpp"

// 화자 식별 진입점. store/matcher/engine 을 소유하고 외부 연산을 묶는다
class SpeakerIdentityService : public QObject {
	Q_OBJECT
public:
	explicit SpeakerIdentityService(const ServiceConfig& cfg, QObject* parent = nullptr);
	~SpeakerIdentityService() override;

	// DB 경로 지정 + 스키마 + 만료 redirect 정리
	bool initialize();

	// ---- 외부 인터페이스 ----
	Status listSuggestions(qint64 mediaItemId, std::vector<SpeakerSuggestion>* out) const;
	Status listCrossMediaOccurrences(qint64 profileId, std::vector<CrossMediaOccurrence>* out) const;
	Status verifySpeaker(qint64 speakerId, const VerifyAction& action, Profile* out,
						 RetroReport* retro = nullptr);
	MergeReport mergeSpeakers(const std::vector<qint64>& sourceIds, qint64 targetId);
	Status renameProfile(qint64 profileId, const QString& name, Profile* out, RetroReport* retro = nullptr);

	DiarizationReport onDiarizationComplete(qint64 mediaItemId, const std::vector<DiarizedSpeaker>& speakers);
	// 워커 풀에서 처리, 끝나면 diarizationProcessed
	void submitDiarizationJob(qint64 mediaItemId, const std::vector<DiarizedSpeaker>& speakers);
	bool waitForJobs(int msecs = -1);

	// ---- 부가 연산 ----
	Status addMediaItem(const QString& title, qint64* outId);
	Status addTranscriptSegment(qint64 mediaItemId, const QString& label, double start, double end,
								const QString& text);
	Status deleteProfile(qint64 profileId);
	Status deleteMediaItem(qint64 mediaItemId);
	bool listProfiles(std::vector<Profile>* out) const;
	Status profileStatus(qint64 speakerId, QString* out) const;
	bool checkInvariants(QString* report) const;
	int purgeRedirects();

	ProfileStore& store() { return store_; }
	MergeEngine& mergeEngine() { return merge_; }
	const ServiceConfig& config() const { return cfg_; }

signals:
	void diarizationProcessed(const DiarizationReport& report);
	void profileRenamed(qint64 profileId, const QString& name);

private:
	RetroReport propagateName(qint64 profileId);

	ServiceConfig cfg_;
	ProfileStore store_;
	SpeakerMatcher matcher_;
	SuggestionEngine suggest_;
	RetroactiveLabeler retro_;
	MergeEngine merge_;
	QThreadPool pool_;
};
