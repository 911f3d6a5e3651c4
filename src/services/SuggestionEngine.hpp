#pragma once
#include <vector>

#include "include/types.hpp"
#include "match/SpeakerMatcher.hpp"
#include "store/ProfileStore.hpp"

// 새 화자 분류 (high: 자동 연결 / medium: 제안 / low: seed 유지) + 사람 확인
class SuggestionEngine {
public:
	SuggestionEngine(ProfileStore& store, const SpeakerMatcher& matcher);

	// 이미 (media,label) 임베딩이 있으면 no-op (alreadyProcessed)
	ClassificationOutcome processSpeaker(qint64 mediaItemId, const DiarizedSpeaker& speaker);

	// 화자별 실패는 모아서 보고, 배치는 중단하지 않는다
	DiarizationReport processDiarization(qint64 mediaItemId, const std::vector<DiarizedSpeaker>& speakers);

	// 미디어의 화자별 제안 (연결/확정된 화자는 소유 프로필, 대기 화자는 medium 이상 후보)
	Status listSuggestions(qint64 mediaItemId, std::vector<SpeakerSuggestion>* out) const;

	Status verifySpeaker(qint64 speakerId, const VerifyAction& action, Profile* out);

	const TierPolicy& policy() const { return matcher_.policy(); }

private:
	Status acceptInto(qint64 speakerId, qint64 profileId, PerFileSpeaker* out);
	bool scoreSpeakerAgainst(const PerFileSpeaker& s, qint64 profileId, double* out) const;

	ProfileStore& store_;
	const SpeakerMatcher& matcher_;
};
