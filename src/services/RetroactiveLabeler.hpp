#pragma once
#include "include/types.hpp"
#include "match/SpeakerMatcher.hpp"
#include "store/ProfileStore.hpp"

// 이름이 붙은 프로필을 대기 중인 화자 전체에 다시 대어 본다
// - 대상 프로필 하나만 비교 (전체 갤러리 X)
// - 그새 사용자가 확정한 화자는 건너뜀
class RetroactiveLabeler {
public:
	RetroactiveLabeler(ProfileStore& store, const SpeakerMatcher& matcher);

	RetroReport run(qint64 profileId);

	// target 에 자동 연결. target 이 그새 병합됐으면 후속 프로필로 다시 읽어 재시도
	// 성공하면 *target 은 새 임베딩까지 포함한 최신 상태
	Status autoAttach(qint64 speakerId, double score, GalleryEntry* target, bool* skipped);

private:
	ProfileStore& store_;
	const SpeakerMatcher& matcher_;
};
