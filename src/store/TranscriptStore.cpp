#include "store/TranscriptStore.hpp"
#include "services/SqlCommon.hpp"
#include "logger.hpp"

#include <QDateTime>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

using namespace SqlCommon;

namespace {

const char* const kSpeakerCols =
	"SELECT s.id, s.media_item_id, s.label, s.embedding_id, e.profile_id, s.display_name, "
	"s.assignment, s.verified, s.confidence, s.suggested_profile_id, s.suggested_score, "
	"s.suggested_rationale "
	"FROM per_file_speakers s JOIN embeddings e ON e.id = s.embedding_id ";

PerFileSpeaker rowToSpeaker(const QSqlQuery& q)
{
	PerFileSpeaker s;
	s.id					= q.value(0).toLongLong();
	s.mediaItemId			= q.value(1).toLongLong();
	s.label					= q.value(2).toString();
	s.embeddingId			= q.value(3).toLongLong();
	s.profileId				= q.value(4).toLongLong();
	s.displayName			= q.value(5).toString();
	s.assignment			= static_cast<SpeakerAssignment>(q.value(6).toInt());
	s.verified				= q.value(7).toInt() != 0;
	s.confidence			= q.value(8).toDouble();
	s.suggestedProfileId	= q.value(9).isNull() ? -1 : q.value(9).toLongLong();
	s.suggestedScore		= q.value(10).toDouble();
	s.suggestedRationale	= q.value(11).toString();
	return s;
}

bool collectSpeakers(QSqlQuery& q, std::vector<PerFileSpeaker>* out, const char* what)
{
	if (!q.exec()) {
		qCritical() << "[TranscriptStore]" << what << "failed:" << q.lastError().text();
		return false;
	}
	out->clear();
	while (q.next()) out->push_back(rowToSpeaker(q));
	return true;
}

} // namespace

// ---------- media items ----------

Status TranscriptStore::addMediaItem(const QString& title, qint64* outId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare("INSERT INTO media_items (title, created_at) VALUES (?, ?)");
	q.addBindValue(title);
	q.addBindValue(QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] insert media failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (outId) *outId = q.lastInsertId().toLongLong();
	return Status::success();
}

Status TranscriptStore::getMediaItem(qint64 mediaItemId, MediaItem* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare("SELECT id, title, created_at FROM media_items WHERE id = ?");
	q.addBindValue(mediaItemId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] select media failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (!q.next())
		return Status::error(ErrorCode::NotFound, QString("media item %1 not found").arg(mediaItemId));
	if (out) {
		out->id			= q.value(0).toLongLong();
		out->title		= q.value(1).toString();
		out->createdAt	= QDateTime::fromString(q.value(2).toString(), Qt::ISODateWithMs);
	}
	return Status::success();
}

bool TranscriptStore::deleteSpeakerRowsOfMedia(qint64 mediaItemId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("DELETE FROM transcript_segments WHERE media_item_id = ?");
	q.addBindValue(mediaItemId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] delete segments failed:" << q.lastError().text();
		return false;
	}
	q.prepare("DELETE FROM per_file_speakers WHERE media_item_id = ?");
	q.addBindValue(mediaItemId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] delete speakers failed:" << q.lastError().text();
		return false;
	}
	return true;
}

bool TranscriptStore::deleteMediaItemRow(qint64 mediaItemId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("DELETE FROM media_items WHERE id = ?");
	q.addBindValue(mediaItemId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] delete media failed:" << q.lastError().text();
		return false;
	}
	return true;
}

// ---------- per-file speakers ----------

Status TranscriptStore::insertSpeaker(qint64 mediaItemId, const QString& label, qint64 embeddingId,
									  const QString& displayName, qint64* outId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare("INSERT INTO per_file_speakers (media_item_id, label, embedding_id, display_name) "
			  "VALUES (?, ?, ?, ?)");
	q.addBindValue(mediaItemId);
	q.addBindValue(label);
	q.addBindValue(embeddingId);
	q.addBindValue(displayName.isEmpty() ? QVariant() : QVariant(displayName));
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] insert speaker failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (outId) *outId = q.lastInsertId().toLongLong();
	return Status::success();
}

Status TranscriptStore::getSpeaker(qint64 speakerId, PerFileSpeaker* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare(QString(kSpeakerCols) + "WHERE s.id = ?");
	q.addBindValue(speakerId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] select speaker failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (!q.next())
		return Status::error(ErrorCode::NotFound, QString("speaker %1 not found").arg(speakerId));
	if (out) *out = rowToSpeaker(q);
	return Status::success();
}

Status TranscriptStore::findSpeaker(qint64 mediaItemId, const QString& label, PerFileSpeaker* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare(QString(kSpeakerCols) + "WHERE s.media_item_id = ? AND s.label = ?");
	q.addBindValue(mediaItemId);
	q.addBindValue(label);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] find speaker failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (!q.next())
		return Status::error(ErrorCode::NotFound,
							 QString("speaker %1 not found in media %2").arg(label).arg(mediaItemId));
	if (out) *out = rowToSpeaker(q);
	return Status::success();
}

bool TranscriptStore::speakersOfMedia(qint64 mediaItemId, std::vector<PerFileSpeaker>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	q.prepare(QString(kSpeakerCols) + "WHERE s.media_item_id = ? ORDER BY s.label");
	q.addBindValue(mediaItemId);
	return collectSpeakers(q, out, "speakers of media");
}

bool TranscriptStore::speakersOfProfile(qint64 profileId, std::vector<PerFileSpeaker>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	q.prepare(QString(kSpeakerCols) + "WHERE e.profile_id = ? ORDER BY s.media_item_id, s.label");
	q.addBindValue(profileId);
	return collectSpeakers(q, out, "speakers of profile");
}

bool TranscriptStore::outstandingSpeakers(std::vector<PerFileSpeaker>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	q.prepare(QString(kSpeakerCols) + "WHERE s.verified = 0 AND s.assignment IN (?, ?) ORDER BY s.id");
	q.addBindValue(static_cast<int>(SpeakerAssignment::Seeded));
	q.addBindValue(static_cast<int>(SpeakerAssignment::Pending));
	return collectSpeakers(q, out, "outstanding speakers");
}

bool TranscriptStore::pendingSuggestionsFor(qint64 profileId, std::vector<PerFileSpeaker>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	q.prepare(QString(kSpeakerCols) +
			  "WHERE s.suggested_profile_id = ? AND s.assignment = ? AND s.verified = 0 "
			  "AND e.profile_id <> s.suggested_profile_id ORDER BY s.media_item_id, s.label");
	q.addBindValue(profileId);
	q.addBindValue(static_cast<int>(SpeakerAssignment::Pending));
	return collectSpeakers(q, out, "pending suggestions");
}

bool TranscriptStore::saveSpeakerState(const PerFileSpeaker& s)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("UPDATE per_file_speakers SET display_name = ?, assignment = ?, verified = ?, "
			  "confidence = ?, suggested_profile_id = ?, suggested_score = ?, suggested_rationale = ? "
			  "WHERE id = ?");
	q.addBindValue(s.displayName.isEmpty() ? QVariant() : QVariant(s.displayName));
	q.addBindValue(static_cast<int>(s.assignment));
	q.addBindValue(s.verified ? 1 : 0);
	q.addBindValue(s.confidence);
	q.addBindValue(s.suggestedProfileId >= 0 ? QVariant(s.suggestedProfileId) : QVariant());
	q.addBindValue(s.suggestedScore);
	q.addBindValue(s.suggestedRationale.isEmpty() ? QVariant() : QVariant(s.suggestedRationale));
	q.addBindValue(s.id);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] save speaker failed:" << q.lastError().text() << "id=" << s.id;
		return false;
	}
	return q.numRowsAffected() == 1;
}

bool TranscriptStore::renameSpeakersOfProfile(qint64 profileId, const QString& name)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("UPDATE per_file_speakers SET display_name = ? "
			  "WHERE embedding_id IN (SELECT id FROM embeddings WHERE profile_id = ?)");
	q.addBindValue(name.isEmpty() ? QVariant() : QVariant(name));
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] rename speakers failed:" << q.lastError().text();
		return false;
	}
	return true;
}

int TranscriptStore::verifySpeakersOfProfile(qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	// 사용자가 이름 붙인 프로필의 미확정 화자는 확정으로. 자동 연결분은 그대로
	QSqlQuery q(db);
	q.prepare("UPDATE per_file_speakers SET assignment = ?, verified = 1, confidence = 1.0, "
			  "suggested_profile_id = NULL, suggested_score = 0, suggested_rationale = NULL "
			  "WHERE verified = 0 AND assignment IN (?, ?) "
			  "AND embedding_id IN (SELECT id FROM embeddings WHERE profile_id = ?)");
	q.addBindValue(static_cast<int>(SpeakerAssignment::Verified));
	q.addBindValue(static_cast<int>(SpeakerAssignment::Seeded));
	q.addBindValue(static_cast<int>(SpeakerAssignment::Pending));
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] verify speakers failed:" << q.lastError().text();
		return -1;
	}
	return q.numRowsAffected();
}

int TranscriptStore::settleSpeakersOfProfile(qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	QSqlQuery q(db);
	q.prepare("UPDATE per_file_speakers SET assignment = ?, suggested_profile_id = NULL, "
			  "suggested_score = 0, suggested_rationale = NULL "
			  "WHERE verified = 0 AND assignment IN (?, ?) "
			  "AND embedding_id IN (SELECT id FROM embeddings WHERE profile_id = ?)");
	q.addBindValue(static_cast<int>(SpeakerAssignment::AutoAttached));
	q.addBindValue(static_cast<int>(SpeakerAssignment::Seeded));
	q.addBindValue(static_cast<int>(SpeakerAssignment::Pending));
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] settle speakers failed:" << q.lastError().text();
		return -1;
	}
	return q.numRowsAffected();
}

int TranscriptStore::redirectSuggestions(qint64 fromProfileId, qint64 toProfileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	QSqlQuery q(db);
	q.prepare("UPDATE per_file_speakers SET suggested_profile_id = ? WHERE suggested_profile_id = ?");
	q.addBindValue(toProfileId);
	q.addBindValue(fromProfileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] redirect suggestions failed:" << q.lastError().text();
		return -1;
	}
	const int moved = q.numRowsAffected();

	// 이제 자기 프로필을 가리키는 제안은 의미 없음
	QSqlQuery self(db);
	self.prepare("UPDATE per_file_speakers SET suggested_profile_id = NULL, suggested_score = 0, "
				 "suggested_rationale = NULL, "
				 "assignment = CASE WHEN assignment = ? THEN ? ELSE assignment END "
				 "WHERE suggested_profile_id = ? "
				 "AND embedding_id IN (SELECT id FROM embeddings WHERE profile_id = ?)");
	self.addBindValue(static_cast<int>(SpeakerAssignment::Pending));
	self.addBindValue(static_cast<int>(SpeakerAssignment::Seeded));
	self.addBindValue(toProfileId);
	self.addBindValue(toProfileId);
	if (!self.exec()) {
		qCritical() << "[TranscriptStore] clear self suggestions failed:" << self.lastError().text();
		return -1;
	}
	return moved;
}

int TranscriptStore::clearSuggestionsTo(qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	QSqlQuery q(db);
	q.prepare("UPDATE per_file_speakers SET suggested_profile_id = NULL, suggested_score = 0, "
			  "suggested_rationale = NULL, "
			  "assignment = CASE WHEN assignment = ? THEN ? ELSE assignment END "
			  "WHERE suggested_profile_id = ?");
	q.addBindValue(static_cast<int>(SpeakerAssignment::Pending));
	q.addBindValue(static_cast<int>(SpeakerAssignment::Seeded));
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] clear suggestions failed:" << q.lastError().text();
		return -1;
	}
	return q.numRowsAffected();
}

// ---------- rejections ----------

bool TranscriptStore::addRejection(qint64 speakerId, qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("INSERT OR IGNORE INTO speaker_rejections (speaker_id, profile_id) VALUES (?, ?)");
	q.addBindValue(speakerId);
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] add rejection failed:" << q.lastError().text();
		return false;
	}
	return true;
}

bool TranscriptStore::rejectedProfiles(qint64 speakerId, std::unordered_set<qint64>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	q.prepare("SELECT profile_id FROM speaker_rejections WHERE speaker_id = ?");
	q.addBindValue(speakerId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] select rejections failed:" << q.lastError().text();
		return false;
	}
	out->clear();
	while (q.next()) out->insert(q.value(0).toLongLong());
	return true;
}

bool TranscriptStore::reassignRejections(qint64 fromProfileId, qint64 toProfileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("INSERT OR IGNORE INTO speaker_rejections (speaker_id, profile_id) "
			  "SELECT speaker_id, ? FROM speaker_rejections WHERE profile_id = ?");
	q.addBindValue(toProfileId);
	q.addBindValue(fromProfileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] copy rejections failed:" << q.lastError().text();
		return false;
	}
	q.prepare("DELETE FROM speaker_rejections WHERE profile_id = ?");
	q.addBindValue(fromProfileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] drop rejections failed:" << q.lastError().text();
		return false;
	}
	return true;
}

// ---------- transcript segments ----------

Status TranscriptStore::addSegment(const TranscriptSegment& seg, qint64* outId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare("INSERT INTO transcript_segments "
			  "(media_item_id, label, speaker_id, profile_id, start_time, end_time, text) "
			  "VALUES (?, ?, ?, ?, ?, ?, ?)");
	q.addBindValue(seg.mediaItemId);
	q.addBindValue(seg.label);
	q.addBindValue(seg.speakerId >= 0 ? QVariant(seg.speakerId) : QVariant());
	q.addBindValue(seg.profileId >= 0 ? QVariant(seg.profileId) : QVariant());
	q.addBindValue(seg.start);
	q.addBindValue(seg.end);
	q.addBindValue(seg.text);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] insert segment failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (outId) *outId = q.lastInsertId().toLongLong();
	return Status::success();
}

bool TranscriptStore::bindSegmentsToSpeaker(qint64 mediaItemId, const QString& label,
											qint64 speakerId, qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("UPDATE transcript_segments SET speaker_id = ?, profile_id = ? "
			  "WHERE media_item_id = ? AND label = ?");
	q.addBindValue(speakerId);
	q.addBindValue(profileId);
	q.addBindValue(mediaItemId);
	q.addBindValue(label);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] bind segments failed:" << q.lastError().text();
		return false;
	}
	return true;
}

bool TranscriptStore::setSegmentsProfileForSpeaker(qint64 speakerId, qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("UPDATE transcript_segments SET profile_id = ? WHERE speaker_id = ?");
	q.addBindValue(profileId);
	q.addBindValue(speakerId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] move segments failed:" << q.lastError().text();
		return false;
	}
	return true;
}

int TranscriptStore::reassignSegments(qint64 fromProfileId, qint64 toProfileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	QSqlQuery q(db);
	q.prepare("UPDATE transcript_segments SET profile_id = ? WHERE profile_id = ?");
	q.addBindValue(toProfileId);
	q.addBindValue(fromProfileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] reassign segments failed:" << q.lastError().text();
		return -1;
	}
	return q.numRowsAffected();
}

bool TranscriptStore::segmentsOfProfile(qint64 profileId, std::vector<TranscriptSegment>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	q.prepare("SELECT id, media_item_id, label, speaker_id, profile_id, start_time, end_time, text "
			  "FROM transcript_segments WHERE profile_id = ? ORDER BY media_item_id, start_time");
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[TranscriptStore] select segments failed:" << q.lastError().text();
		return false;
	}
	out->clear();
	while (q.next()) {
		TranscriptSegment s;
		s.id			= q.value(0).toLongLong();
		s.mediaItemId	= q.value(1).toLongLong();
		s.label			= q.value(2).toString();
		s.speakerId		= q.value(3).isNull() ? -1 : q.value(3).toLongLong();
		s.profileId		= q.value(4).isNull() ? -1 : q.value(4).toLongLong();
		s.start			= q.value(5).toDouble();
		s.end			= q.value(6).toDouble();
		s.text			= q.value(7).toString();
		out->push_back(s);
	}
	return true;
}

bool TranscriptStore::segmentStats(qint64 profileId, int* outCount, double* outTalkTime) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("SELECT COUNT(*), COALESCE(SUM(end_time - start_time), 0) "
			  "FROM transcript_segments WHERE profile_id = ?");
	q.addBindValue(profileId);
	if (!q.exec() || !q.next()) {
		qCritical() << "[TranscriptStore] segment stats failed:" << q.lastError().text();
		return false;
	}
	if (outCount) *outCount = q.value(0).toInt();
	if (outTalkTime) *outTalkTime = q.value(1).toDouble();
	return true;
}
