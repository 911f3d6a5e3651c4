#include "api/JsonCodec.hpp"

#include <cmath>

namespace JsonCodec {

namespace {

QJsonArray idArray(const std::vector<qint64>& ids)
{
	QJsonArray a;
	for (qint64 id : ids) a.append(id);
	return a;
}

QJsonObject sourceResult(const MergeSourceResult& r)
{
	QJsonObject o{
		{"profile_id", r.profileId},
		{"name", r.name},
	};
	if (r.status.ok()) {
		o["moved_embeddings"] = r.movedEmbeddings;
		o["moved_segments"] = r.movedSegments;
	} else {
		o["code"] = QString::fromLatin1(errorCodeName(r.status.code));
		o["error"] = r.status.message;
	}
	return o;
}

} // namespace

QJsonObject toJson(const Status& s)
{
	QJsonObject o{
		{"ok", s.ok()},
		{"code", QString::fromLatin1(errorCodeName(s.code))},
	};
	if (!s.ok()) o["message"] = s.message;
	if (s.code == ErrorCode::ProfileGone) o["redirect_to"] = s.redirectTo;
	return o;
}

QJsonObject toJson(const Profile& p)
{
	return QJsonObject{
		{"id", p.id},
		{"name", p.hasName() ? QJsonValue(p.displayName) : QJsonValue()},
		{"state", QString::fromLatin1(profileStateName(p.state))},
		{"embedding_ids", idArray(p.embeddingIds)},
		{"segment_count", p.segmentCount},
		{"talk_time", p.talkTime},
		{"version", p.version},
	};
}

QJsonObject toJson(const MatchCandidate& c)
{
	return QJsonObject{
		{"profile_id", c.profileId},
		{"profile_name", c.profileName},
		{"score", static_cast<double>(c.score)},
		{"tier", QString::fromLatin1(tierName(c.tier))},
		{"rationale", c.rationale},
	};
}

QJsonObject toJson(const SpeakerSuggestion& s)
{
	return QJsonObject{
		{"speaker_id", s.speakerId},
		{"label", s.perFileLabel},
		{"profile_id", s.profileId},
		{"profile_name", s.profileName},
		{"score", s.score},
		{"tier", QString::fromLatin1(tierName(s.tier))},
		{"rationale", s.rationale},
		{"auto_accepted", s.autoAccepted},
		{"verified", s.verified},
	};
}

QJsonObject toJson(const CrossMediaOccurrence& o)
{
	return QJsonObject{
		{"media_item_id", o.mediaItemId},
		{"media_title", o.mediaTitle},
		{"label", o.perFileLabel},
		{"speaker_id", o.speakerId},
		{"score", o.score},
		{"verified", o.verified},
		{"pending", o.pending},
	};
}

QJsonObject toJson(const ClassificationOutcome& o)
{
	QJsonObject j{
		{"label", o.label},
		{"status", toJson(o.status)},
	};
	if (!o.status.ok()) return j;

	j["speaker_id"] = o.speakerId;
	j["profile_id"] = o.profileId;
	j["tier"] = QString::fromLatin1(tierName(o.tier));
	j["assignment"] = QString::fromLatin1(assignmentName(o.assignment));
	j["already_processed"] = o.alreadyProcessed;
	j["degraded"] = o.degraded;
	if (o.suggestion) j["suggestion"] = toJson(*o.suggestion);
	j["alternatives"] = toJsonArray(o.alternatives);
	return j;
}

QJsonObject toJson(const DiarizationReport& r)
{
	return QJsonObject{
		{"media_item_id", r.mediaItemId},
		{"failed", r.failedCount},
		{"speakers", toJsonArray(r.outcomes)},
	};
}

QJsonObject toJson(const RetroReport& r)
{
	QJsonArray failures;
	for (const auto& f : r.failures) {
		failures.append(QJsonObject{
			{"speaker_id", f.speakerId},
			{"status", toJson(f.status)},
		});
	}
	return QJsonObject{
		{"profile_id", r.profileId},
		{"name", r.name},
		{"scanned", r.scanned},
		{"auto_attached", idArray(r.autoAttached)},
		{"suggested", idArray(r.suggested)},
		{"skipped", r.skipped},
		{"failures", failures},
	};
}

QJsonObject toJson(const MergeReport& r)
{
	QJsonArray ok, failed;
	for (const auto& s : r.succeeded) ok.append(sourceResult(s));
	for (const auto& s : r.failed) failed.append(sourceResult(s));

	QJsonObject o{
		{"target_id", r.targetId},
		{"target_name", r.targetName},
		{"outcome", QString::fromLatin1(mergeOutcomeName(r.outcome()))},
		{"succeeded", ok},
		{"failed", failed},
	};
	if (!r.requestStatus.ok()) o["error"] = toJson(r.requestStatus);
	return o;
}

QJsonObject toJson(const SystemLog& l)
{
	return QJsonObject{
		{"id", l.id},
		{"level", l.level},
		{"tag", l.tag},
		{"message", l.message},
		{"timestamp", l.timestamp.toString(Qt::ISODateWithMs)},
		{"extra", l.extra},
	};
}

bool parseIngest(const QJsonObject& root, IngestRequest* out, QString* error)
{
	auto fail = [error](const QString& msg) {
		if (error) *error = msg;
		return false;
	};
	if (!out) return fail(QStringLiteral("null output"));

	IngestRequest req;
	req.title = root.value("title").toString();
	if (req.title.isEmpty()) return fail(QStringLiteral("missing title"));

	for (const QJsonValue& v : root.value("speakers").toArray()) {
		const QJsonObject o = v.toObject();
		DiarizedSpeaker sp;
		sp.label = o.value("label").toString();
		if (sp.label.isEmpty()) return fail(QStringLiteral("speaker without label"));
		// 값 검증(비유한/0 벡터)은 EmbeddingStore 에서
		for (const QJsonValue& x : o.value("embedding").toArray()) {
			if (!x.isDouble()) return fail(QString("non-numeric embedding value for %1").arg(sp.label));
			sp.embedding.push_back(static_cast<float>(x.toDouble()));
		}
		req.speakers.push_back(std::move(sp));
	}

	for (const QJsonValue& v : root.value("segments").toArray()) {
		const QJsonObject o = v.toObject();
		TranscriptSegment seg;
		seg.label = o.value("label").toString();
		seg.start = o.value("start").toDouble(NAN);
		seg.end = o.value("end").toDouble(NAN);
		seg.text = o.value("text").toString();
		if (seg.label.isEmpty() || !std::isfinite(seg.start) || !std::isfinite(seg.end))
			return fail(QStringLiteral("segment needs label, start and end"));
		req.segments.push_back(std::move(seg));
	}

	*out = std::move(req);
	return true;
}

} // namespace JsonCodec
