#pragma once
#include <vector>
#include <optional>
#include <QString>
#include <QDateTime>
#include <QMetaType>
#include <opencv2/core.hpp>

#include "include/Status.hpp"

// 프로필 검증 상태
enum class ProfileState {
	Unverified = 0,
	Suggested  = 1,		// 높은 신뢰도 자동 연결이 1회 이상 있었음
	Verified   = 2		// 사용자가 이름 지정/확인
};

// 신뢰도 등급
enum class Tier {
	High = 0,			// 자동 연결
	Medium,				// 사람 확인 필요
	Low					// 제안 없음
};

// 파일 단위 화자(SPEAKER_00 ...)의 식별 상태
enum class SpeakerAssignment {
	Seeded = 0,			// 자기 seed 프로필만 소유, 제안 없음
	Pending,			// medium 제안 대기
	AutoAttached,		// high 자동 연결
	Verified			// 사용자가 확정
};

inline const char* tierName(Tier t)
{
	switch (t) {
		case Tier::High:	return "high";
		case Tier::Medium:	return "medium";
		case Tier::Low:		return "low";
	}
	return "low";
}

inline const char* profileStateName(ProfileState s)
{
	switch (s) {
		case ProfileState::Unverified:	return "unverified";
		case ProfileState::Suggested:	return "suggested";
		case ProfileState::Verified:	return "verified";
	}
	return "unverified";
}

inline const char* assignmentName(SpeakerAssignment a)
{
	switch (a) {
		case SpeakerAssignment::Seeded:			return "seeded";
		case SpeakerAssignment::Pending:		return "pending";
		case SpeakerAssignment::AutoAttached:	return "auto_attached";
		case SpeakerAssignment::Verified:		return "verified";
	}
	return "seeded";
}

struct MediaItem {
	qint64		id = -1;
	QString		title;
	QDateTime	createdAt;
};

// 불변 voiceprint. (media item, label) 당 1개
struct Embedding {
	qint64				id = -1;
	qint64				mediaItemId = -1;
	QString				label;
	std::vector<float>	vector;
	qint64				profileId = -1;		// 소유 프로필 (항상 정확히 1개)
};

struct Profile {
	qint64				id = -1;
	QString				displayName;		// 비어있으면 이름 없음
	ProfileState		state = ProfileState::Unverified;
	std::vector<qint64>	embeddingIds;		// id 오름차순 = 삽입 순
	int					segmentCount = 0;
	double				talkTime = 0.0;		// seconds
	qint64				version = 0;

	bool hasName() const { return !displayName.isEmpty(); }
};

struct PerFileSpeaker {
	qint64				id = -1;
	qint64				mediaItemId = -1;
	QString				label;
	qint64				embeddingId = -1;
	qint64				profileId = -1;		// embedding 소유자 (join 결과)
	QString				displayName;
	SpeakerAssignment	assignment = SpeakerAssignment::Seeded;
	bool				verified = false;
	double				confidence = 0.0;
	qint64				suggestedProfileId = -1;
	double				suggestedScore = 0.0;
	QString				suggestedRationale;

	bool outstanding() const {
		return !verified && (assignment == SpeakerAssignment::Seeded ||
							 assignment == SpeakerAssignment::Pending);
	}
};

struct TranscriptSegment {
	qint64	id = -1;
	qint64	mediaItemId = -1;
	QString	label;					// diarization label (화자 등록 전에도 보존)
	qint64	speakerId = -1;
	qint64	profileId = -1;
	double	start = 0.0;
	double	end = 0.0;
	QString	text;
};

// 매칭 결과 (저장하지 않음)
struct MatchCandidate {
	qint64	profileId = -1;
	QString	profileName;
	float	score = 0.0f;			// [0,1]
	Tier	tier = Tier::Low;
	QString	rationale;
	int		embeddingCount = 0;
	qint64	bestEmbeddingId = -1;	// 최고 점수를 낸 임베딩
};

struct MatchRanking {
	std::vector<MatchCandidate>	candidates;		// score 내림차순
	bool						timedOut = false;
	int							scannedProfiles = 0;
};

// 매처 갤러리 항목 (프로필 단위 스냅샷)
struct GalleryEntry {
	qint64					profileId = -1;
	QString					name;
	std::vector<qint64>		embeddingIds;
	std::vector<qint64>		mediaItemIds;
	std::vector<cv::Mat>	protos;				// 1xD, CV_32F, L2=1 고정 클론
};

struct CrossMediaOccurrence {
	qint64	mediaItemId = -1;
	QString	mediaTitle;
	QString	perFileLabel;
	qint64	speakerId = -1;
	double	score = 0.0;
	bool	verified = false;
	bool	pending = false;		// medium 제안 (소유 아님)
};

// listSuggestions 한 줄
struct SpeakerSuggestion {
	qint64	speakerId = -1;
	QString	perFileLabel;
	qint64	profileId = -1;
	QString	profileName;
	double	score = 0.0;
	Tier	tier = Tier::Low;
	QString	rationale;
	bool	autoAccepted = false;
	bool	verified = false;
};

// diarization 결과 1건
struct DiarizedSpeaker {
	QString				label;
	std::vector<float>	embedding;
};

// 화자 1명 분류 결과
struct ClassificationOutcome {
	qint64						speakerId = -1;
	QString						label;
	qint64						profileId = -1;		// 최종 소유 프로필
	Tier						tier = Tier::Low;
	SpeakerAssignment			assignment = SpeakerAssignment::Seeded;
	std::optional<MatchCandidate> suggestion;		// medium 제안
	std::vector<MatchCandidate>	alternatives;		// medium 이상 후보 (순위순)
	bool						alreadyProcessed = false;
	bool						degraded = false;	// 매처 실패/타임아웃 -> 제안 없음
	Status						status;
};

struct DiarizationReport {
	qint64								mediaItemId = -1;
	std::vector<ClassificationOutcome>	outcomes;
	int									failedCount = 0;
};

// verifySpeaker 액션
struct VerifyAction {
	enum class Kind { Accept, Reject, CreateProfile };
	Kind	kind = Kind::Reject;
	qint64	profileId = -1;		// Accept
	QString	name;				// CreateProfile

	static VerifyAction accept(qint64 pid) { VerifyAction a; a.kind = Kind::Accept; a.profileId = pid; return a; }
	static VerifyAction reject() { return VerifyAction{}; }
	static VerifyAction createProfile(const QString& n) { VerifyAction a; a.kind = Kind::CreateProfile; a.name = n; return a; }
};

struct RetroFailure {
	qint64	speakerId = -1;
	Status	status;
};

struct RetroReport {
	qint64						profileId = -1;
	QString						name;
	int							scanned = 0;
	std::vector<qint64>			autoAttached;	// speaker ids
	std::vector<qint64>			suggested;		// speaker ids
	int							skipped = 0;
	std::vector<RetroFailure>	failures;
};

enum class MergeOutcome { AllSucceeded, AllFailed, Partial };

struct MergeSourceResult {
	qint64		profileId = -1;
	QString		name;
	Status		status;
	int			movedEmbeddings = 0;
	int			movedSegments = 0;
};

struct MergeReport {
	qint64							targetId = -1;
	QString							targetName;
	std::vector<MergeSourceResult>	succeeded;
	std::vector<MergeSourceResult>	failed;
	Status							requestStatus;		// InvalidMergeRequest 일 때만 실패

	MergeOutcome outcome() const {
		if (failed.empty() && requestStatus.ok()) return MergeOutcome::AllSucceeded;
		if (succeeded.empty()) return MergeOutcome::AllFailed;
		return MergeOutcome::Partial;
	}
};

inline const char* mergeOutcomeName(MergeOutcome o)
{
	switch (o) {
		case MergeOutcome::AllSucceeded:	return "all_succeeded";
		case MergeOutcome::AllFailed:		return "all_failed";
		case MergeOutcome::Partial:			return "partial";
	}
	return "all_failed";
}

Q_DECLARE_METATYPE(MergeReport)
Q_DECLARE_METATYPE(DiarizationReport)
