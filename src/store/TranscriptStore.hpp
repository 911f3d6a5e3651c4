#pragma once
#include <vector>
#include <unordered_set>
#include <QString>

#include "include/types.hpp"

// media_items / per_file_speakers / transcript_segments / speaker_rejections 행 단위 접근
// 락/트랜잭션 없음 (ProfileStore, MergeEngine 가 감싼다)
class TranscriptStore {
public:
	// ---- media items ----
	Status addMediaItem(const QString& title, qint64* outId);
	Status getMediaItem(qint64 mediaItemId, MediaItem* out) const;
	bool deleteMediaItemRow(qint64 mediaItemId);		// 임베딩 삭제 후에 호출
	bool deleteSpeakerRowsOfMedia(qint64 mediaItemId);	// 세그먼트 + 화자 (거절은 cascade)

	// ---- per-file speakers ----
	Status insertSpeaker(qint64 mediaItemId, const QString& label, qint64 embeddingId,
						 const QString& displayName, qint64* outId);
	Status getSpeaker(qint64 speakerId, PerFileSpeaker* out) const;
	Status findSpeaker(qint64 mediaItemId, const QString& label, PerFileSpeaker* out) const;
	bool speakersOfMedia(qint64 mediaItemId, std::vector<PerFileSpeaker>* out) const;
	bool speakersOfProfile(qint64 profileId, std::vector<PerFileSpeaker>* out) const;
	bool outstandingSpeakers(std::vector<PerFileSpeaker>* out) const;
	bool pendingSuggestionsFor(qint64 profileId, std::vector<PerFileSpeaker>* out) const;

	// display_name, assignment, verified, confidence, suggested_* 저장
	bool saveSpeakerState(const PerFileSpeaker& s);
	bool renameSpeakersOfProfile(qint64 profileId, const QString& name);
	int verifySpeakersOfProfile(qint64 profileId);		// seeded/pending -> verified, 변경 수 (실패 -1)
	// 병합으로 흡수된 대기 화자 -> auto_attached (이후 자동 재배치 대상에서 제외)
	int settleSpeakersOfProfile(qint64 profileId);

	// 병합/흡수: from 을 가리키는 medium 제안을 to 로. to 자기 자신을 가리키게 되면 제안 해제
	int redirectSuggestions(qint64 fromProfileId, qint64 toProfileId);
	int clearSuggestionsTo(qint64 profileId);

	// ---- rejections ----
	bool addRejection(qint64 speakerId, qint64 profileId);
	bool rejectedProfiles(qint64 speakerId, std::unordered_set<qint64>* out) const;
	bool reassignRejections(qint64 fromProfileId, qint64 toProfileId);

	// ---- transcript segments ----
	Status addSegment(const TranscriptSegment& seg, qint64* outId);
	bool bindSegmentsToSpeaker(qint64 mediaItemId, const QString& label, qint64 speakerId, qint64 profileId);
	bool setSegmentsProfileForSpeaker(qint64 speakerId, qint64 profileId);
	int reassignSegments(qint64 fromProfileId, qint64 toProfileId);
	bool segmentsOfProfile(qint64 profileId, std::vector<TranscriptSegment>* out) const;
	bool segmentStats(qint64 profileId, int* outCount, double* outTalkTime) const;
};
