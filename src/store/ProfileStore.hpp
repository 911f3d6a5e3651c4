#pragma once
#include <optional>
#include <unordered_set>
#include <vector>
#include <QString>

#include "include/types.hpp"
#include "include/recog_params.hpp"
#include "store/EmbeddingStore.hpp"
#include "store/ProfileLockTable.hpp"
#include "store/TranscriptStore.hpp"

// 새 화자 등록 요청 (SuggestionEngine -> ProfileStore)
struct SpeakerRegistration {
	qint64				mediaItemId = -1;
	QString				label;
	std::vector<float>	vector;

	qint64				attachProfileId = -1;	// high: 이 프로필에 바로 연결. -1 이면 seed 생성
	double				confidence = 1.0;

	qint64				suggestedProfileId = -1;	// medium 제안 (seed 생성 시에만)
	double				suggestedScore = 0.0;
	QString				suggestedRationale;
};

// 기존 화자를 다른 프로필로 옮길 때의 옵션
struct AttachOptions {
	SpeakerAssignment			assignment = SpeakerAssignment::Verified;
	bool						verified = true;
	double						confidence = 1.0;
	bool						onlyIfOutstanding = false;	// 자동 연결: 그새 확정/연결된 화자는 건너뜀
	std::optional<ProfileState>	promoteTarget;				// target 상태를 (더 높을 때만) 올림
};

// Profile 과 그에 딸린 모든 행의 일관성 책임
// - 프로필 락은 항상 트랜잭션 시작 전에 id 오름차순으로 잡는다
// - 모든 변경은 version 을 확인하고 올린다
class ProfileStore {
public:
	explicit ProfileStore(int redirectMaxHops = recog::REDIRECT_MAX_HOPS);

	// ---- media ----
	Status addMediaItem(const QString& title, qint64* outId);
	Status mediaItem(qint64 mediaItemId, MediaItem* out) const;
	Status deleteMediaItem(qint64 mediaItemId);

	// ---- profiles ----
	Status createProfile(const QString& displayName, ProfileState state, qint64* outId);
	Status getProfile(qint64 profileId, Profile* out) const;
	bool listProfiles(std::vector<Profile>* out) const;

	Status renameProfile(qint64 profileId, const QString& name, Profile* out);
	Status setState(qint64 profileId, ProfileState state);
	Status deleteProfile(qint64 profileId);		// 소유 화자는 각자 새 seed 로

	// redirect 체인을 따라 살아있는 프로필 id. 없으면 NotFound
	Status resolveProfile(qint64 profileId, qint64* outLiveId) const;
	int purgeExpiredRedirects(int ttlSec);

	// ---- speakers ----
	// 이미 (media,label) 임베딩이 있으면 *alreadyExisted = true, 아무것도 바꾸지 않음
	Status registerSpeaker(const SpeakerRegistration& req, PerFileSpeaker* out, bool* alreadyExisted);

	// 화자의 임베딩을 target 으로 이동. 옛 소유자가 비면 삭제 + redirect
	// *skipped: onlyIfOutstanding 인데 이미 확정/연결된 경우
	Status attachSpeaker(qint64 speakerId, qint64 targetProfileId, const AttachOptions& opt,
						 PerFileSpeaker* out = nullptr, bool* skipped = nullptr);

	// medium 제안 기록. onlyIfBetter: 기존 제안보다 낮으면 건너뜀
	Status setPendingSuggestion(qint64 speakerId, qint64 profileId, double score,
								const QString& rationale, bool onlyIfBetter, bool* skipped = nullptr);

	// 대기 중 제안 거절 -> 거절 기록, 소유 프로필 반환
	Status rejectSuggestion(qint64 speakerId, Profile* out);

	// 화자에 새 이름 부여 (seed 단독 소유면 그 프로필 이름 변경, 아니면 새 프로필)
	Status nameSpeakerProfile(qint64 speakerId, const QString& name, Profile* out);

	Status speaker(qint64 speakerId, PerFileSpeaker* out) const;
	bool speakersOfMedia(qint64 mediaItemId, std::vector<PerFileSpeaker>* out) const;
	bool outstandingSpeakers(std::vector<PerFileSpeaker>* out) const;
	bool rejectedProfiles(qint64 speakerId, std::unordered_set<qint64>* out) const;

	// ---- segments ----
	Status addTranscriptSegment(qint64 mediaItemId, const QString& label, double start, double end,
								const QString& text, qint64* outId = nullptr);
	bool segmentsOfProfile(qint64 profileId, std::vector<TranscriptSegment>* out) const;

	// ---- matcher input ----
	bool galleryEntries(std::vector<GalleryEntry>* out) const;
	Status galleryEntry(qint64 profileId, GalleryEntry* out) const;

	// 소유 임베딩의 화자 + 이 프로필을 가리키는 대기 제안
	Status occurrencesOf(qint64 profileId, std::vector<CrossMediaOccurrence>* out) const;

	// 모든 임베딩이 살아있는 프로필 1개에 속하는지, 화자 행이 임베딩과 1:1 인지
	bool verifyOwnershipInvariant(QString* report = nullptr) const;

	// ---- MergeEngine 용 (락/트랜잭션은 호출측) ----
	bool profileRow(qint64 profileId, Profile* out) const;	// embeddingIds 제외
	Status bumpVersion(qint64 profileId, qint64 expectedVersion);
	bool recomputeStats(qint64 profileId);
	bool insertRedirect(qint64 sourceId, qint64 targetId);
	bool deleteProfileRow(qint64 profileId);
	Status missingProfileStatus(qint64 profileId) const;	// redirect 있으면 ProfileGone, 없으면 NotFound

	ProfileLockTable& locks() { return locks_; }
	EmbeddingStore& embeddings() { return embeddings_; }
	TranscriptStore& transcripts() { return transcripts_; }

private:
	Status insertProfileRow(const QString& displayName, ProfileState state, qint64* outId);
	bool updateProfileRow(qint64 profileId, const QString& displayName, ProfileState state);
	bool dropRedirectsTo(qint64 profileId);
	Status releaseEmptyProfile(qint64 profileId, qint64 successorId);
	bool ownerOfSpeaker(qint64 speakerId, qint64* outOwner) const;

	int redirectMaxHops_;
	ProfileLockTable locks_;
	EmbeddingStore embeddings_;
	TranscriptStore transcripts_;
};
