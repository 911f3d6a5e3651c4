#pragma once
#include <QJsonArray>
#include <QJsonObject>
#include <vector>

#include "include/LogDtos.hpp"
#include "include/types.hpp"

// CLI 입력 1건: 미디어 + diarization 결과 + 전사 세그먼트
struct IngestRequest {
	QString							title;
	std::vector<DiarizedSpeaker>	speakers;
	std::vector<TranscriptSegment>	segments;		// mediaItemId/speakerId/profileId 미사용
};

namespace JsonCodec {
	QJsonObject toJson(const Status& s);
	QJsonObject toJson(const Profile& p);
	QJsonObject toJson(const MatchCandidate& c);
	QJsonObject toJson(const SpeakerSuggestion& s);
	QJsonObject toJson(const CrossMediaOccurrence& o);
	QJsonObject toJson(const ClassificationOutcome& o);
	QJsonObject toJson(const DiarizationReport& r);
	QJsonObject toJson(const RetroReport& r);
	QJsonObject toJson(const MergeReport& r);
	QJsonObject toJson(const SystemLog& l);

	template <typename T>
	QJsonArray toJsonArray(const std::vector<T>& items)
	{
		QJsonArray arr;
		for (const auto& it : items) arr.append(toJson(it));
		return arr;
	}

	// { "title": ..., "speakers": [{label, embedding[]}], "segments": [{label, start, end, text}] }
	bool parseIngest(const QJsonObject& root, IngestRequest* out, QString* error);
} // namespace JsonCodec
