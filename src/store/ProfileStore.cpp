#include "store/ProfileStore.hpp"
#include "services/SqlCommon.hpp"
#include "logger.hpp"

#include <QDateTime>
#include <QSqlError>
#include <QSqlQuery>
#include <QStringList>
#include <QVariant>
#include <algorithm>
#include <map>
#include <set>
#include <opencv2/core.hpp>

using namespace SqlCommon;

namespace {

// 잠금 직전~직후 사이에 화자 소유자가 바뀌면 다시 잡는다
constexpr int kOwnerRetries = 3;

QString nowIso()
{
	return QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
}

Status storageError(const QString& what)
{
	qCritical() << "[ProfileStore]" << what;
	return Status::error(ErrorCode::StorageError, what);
}

Status ownerChurn(qint64 speakerId)
{
	return Status::error(ErrorCode::ConcurrentModificationConflict,
						 QString("owner of speaker %1 kept changing").arg(speakerId));
}

const char* const kProfileCols =
	"SELECT id, display_name, state, segment_count, talk_time, version FROM profiles ";

Profile rowToProfile(const QSqlQuery& q)
{
	Profile p;
	p.id			= q.value(0).toLongLong();
	p.displayName	= q.value(1).toString();
	p.state			= static_cast<ProfileState>(q.value(2).toInt());
	p.segmentCount	= q.value(3).toInt();
	p.talkTime		= q.value(4).toDouble();
	p.version		= q.value(5).toLongLong();
	return p;
}

// 정규화된 1xD 프로토타입. 0 벡터는 저장 단계에서 걸러짐
cv::Mat toProto(const std::vector<float>& v)
{
	cv::Mat m(1, static_cast<int>(v.size()), CV_32F, const_cast<float*>(v.data()));
	m = m.clone();
	const double n = cv::norm(m, cv::NORM_L2);
	if (n > 0.0) m /= n;
	return m;
}

void appendGalleryRow(std::vector<GalleryEntry>* out, qint64 profileId, const QString& name,
					  qint64 embeddingId, qint64 mediaItemId, const QByteArray& blob, int dim)
{
	std::vector<float> v;
	if (!EmbeddingStore::decodeVector(blob, dim, &v)) {
		qCWarning(LC_STORE) << "[ProfileStore] skip corrupt embedding" << embeddingId;
		return;
	}
	if (out->empty() || out->back().profileId != profileId) {
		GalleryEntry g;
		g.profileId = profileId;
		g.name = name;
		out->push_back(std::move(g));
	}
	GalleryEntry& g = out->back();
	g.embeddingIds.push_back(embeddingId);
	g.mediaItemIds.push_back(mediaItemId);
	g.protos.push_back(toProto(v));
}

bool raiseState(ProfileState current, ProfileState wanted)
{
	return static_cast<int>(wanted) > static_cast<int>(current);
}

void clearSuggestion(PerFileSpeaker* s)
{
	s->suggestedProfileId = -1;
	s->suggestedScore = 0.0;
	s->suggestedRationale.clear();
}

} // namespace

ProfileStore::ProfileStore(int redirectMaxHops)
	: redirectMaxHops_(redirectMaxHops > 0 ? redirectMaxHops : recog::REDIRECT_MAX_HOPS)
{
}

// ---------- media ----------

Status ProfileStore::addMediaItem(const QString& title, qint64* outId)
{
	return transcripts_.addMediaItem(title, outId);
}

Status ProfileStore::mediaItem(qint64 mediaItemId, MediaItem* out) const
{
	return transcripts_.getMediaItem(mediaItemId, out);
}

Status ProfileStore::deleteMediaItem(qint64 mediaItemId)
{
	for (int attempt = 0; attempt < kOwnerRetries; ++attempt) {
		Status st = transcripts_.getMediaItem(mediaItemId, nullptr);
		if (!st.ok()) return st;

		std::vector<PerFileSpeaker> before;
		if (!transcripts_.speakersOfMedia(mediaItemId, &before))
			return storageError("list speakers of media failed");
		std::vector<qint64> owners;
		for (const auto& s : before) owners.push_back(s.profileId);

		ProfileLockTable::Guard guard = locks_.lockMany(owners);
		QSqlDatabase db = ensureOpenConnectionForThisThread();
		SqlTransaction tx(db);
		if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

		std::vector<PerFileSpeaker> now;
		if (!transcripts_.speakersOfMedia(mediaItemId, &now))
			return storageError("list speakers of media failed");
		std::set<qint64> a, b;
		for (const auto& s : before) a.insert(s.profileId);
		for (const auto& s : now) b.insert(s.profileId);
		if (a != b) continue;

		std::map<qint64, qint64> versions;
		for (qint64 pid : b) {
			Profile p;
			if (profileRow(pid, &p)) versions[pid] = p.version;
		}

		if (!transcripts_.deleteSpeakerRowsOfMedia(mediaItemId))
			return storageError("delete speakers failed");
		std::vector<qint64> former;
		if (!embeddings_.deleteForMediaItem(mediaItemId, &former))
			return storageError("delete embeddings failed");

		std::sort(former.begin(), former.end());
		former.erase(std::unique(former.begin(), former.end()), former.end());
		for (qint64 pid : former) {
			const int left = embeddings_.countOfProfile(pid);
			if (left < 0) return storageError("count embeddings failed");
			if (left == 0) {
				st = releaseEmptyProfile(pid, -1);
				if (!st.ok()) return st;
				continue;
			}
			if (!recomputeStats(pid)) return storageError("recompute stats failed");
			st = bumpVersion(pid, versions[pid]);
			if (!st.ok()) return st;
		}

		if (!transcripts_.deleteMediaItemRow(mediaItemId))
			return storageError("delete media failed");
		if (!tx.commit()) return storageError("commit failed: " + tx.lastError());

		qCInfo(LC_STORE) << "[ProfileStore] media" << mediaItemId << "deleted, speakers=" << now.size();
		return Status::success();
	}
	return Status::error(ErrorCode::ConcurrentModificationConflict,
						 QString("speakers of media %1 kept changing").arg(mediaItemId));
}

// ---------- profiles ----------

Status ProfileStore::insertProfileRow(const QString& displayName, ProfileState state, qint64* outId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return storageError(db.lastError().text());

	const QString ts = nowIso();
	QSqlQuery q(db);
	q.prepare("INSERT INTO profiles (display_name, state, created_at, updated_at) VALUES (?, ?, ?, ?)");
	q.addBindValue(displayName.isEmpty() ? QVariant() : QVariant(displayName));
	q.addBindValue(static_cast<int>(state));
	q.addBindValue(ts);
	q.addBindValue(ts);
	if (!q.exec()) return storageError("insert profile failed: " + q.lastError().text());
	if (outId) *outId = q.lastInsertId().toLongLong();
	return Status::success();
}

bool ProfileStore::updateProfileRow(qint64 profileId, const QString& displayName, ProfileState state)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("UPDATE profiles SET display_name = ?, state = ?, updated_at = ? WHERE id = ?");
	q.addBindValue(displayName.isEmpty() ? QVariant() : QVariant(displayName));
	q.addBindValue(static_cast<int>(state));
	q.addBindValue(nowIso());
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[ProfileStore] update profile failed:" << q.lastError().text();
		return false;
	}
	return q.numRowsAffected() == 1;
}

Status ProfileStore::createProfile(const QString& displayName, ProfileState state, qint64* outId)
{
	return insertProfileRow(displayName.trimmed(), state, outId);
}

bool ProfileStore::profileRow(qint64 profileId, Profile* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare(QString(kProfileCols) + "WHERE id = ?");
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[ProfileStore] select profile failed:" << q.lastError().text();
		return false;
	}
	if (!q.next()) return false;
	if (out) *out = rowToProfile(q);
	return true;
}

Status ProfileStore::getProfile(qint64 profileId, Profile* out) const
{
	Profile p;
	if (!profileRow(profileId, &p)) {
		const Status gone = missingProfileStatus(profileId);
		if (gone.code == ErrorCode::ProfileGone)
			return Status::error(ErrorCode::NotFound,
								 QString("profile %1 was merged into %2").arg(profileId).arg(gone.redirectTo));
		return gone;
	}

	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("SELECT id FROM embeddings WHERE profile_id = ? ORDER BY id");
	q.addBindValue(profileId);
	if (!q.exec()) return storageError("select embedding ids failed: " + q.lastError().text());
	while (q.next()) p.embeddingIds.push_back(q.value(0).toLongLong());

	if (out) *out = std::move(p);
	return Status::success();
}

bool ProfileStore::listProfiles(std::vector<Profile>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	if (!q.exec(QString(kProfileCols) + "ORDER BY id")) {
		qCritical() << "[ProfileStore] list profiles failed:" << q.lastError().text();
		return false;
	}
	out->clear();
	std::map<qint64, size_t> index;
	while (q.next()) {
		index[q.value(0).toLongLong()] = out->size();
		out->push_back(rowToProfile(q));
	}

	QSqlQuery e(db);
	if (!e.exec("SELECT profile_id, id FROM embeddings ORDER BY id")) {
		qCritical() << "[ProfileStore] list embedding ids failed:" << e.lastError().text();
		return false;
	}
	while (e.next()) {
		auto it = index.find(e.value(0).toLongLong());
		if (it != index.end()) (*out)[it->second].embeddingIds.push_back(e.value(1).toLongLong());
	}
	return true;
}

Status ProfileStore::renameProfile(qint64 profileId, const QString& name, Profile* out)
{
	const QString trimmed = name.trimmed();
	if (trimmed.isEmpty())
		return Status::error(ErrorCode::InvalidArgument, QStringLiteral("display name must not be empty"));

	ProfileLockTable::Guard guard = locks_.lock(profileId);
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	SqlTransaction tx(db);
	if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

	Profile p;
	if (!profileRow(profileId, &p)) return missingProfileStatus(profileId);

	if (!updateProfileRow(profileId, trimmed, ProfileState::Verified))
		return storageError("rename profile failed");
	Status st = bumpVersion(profileId, p.version);
	if (!st.ok()) return st;
	if (!transcripts_.renameSpeakersOfProfile(profileId, trimmed))
		return storageError("rename speakers failed");
	const int verified = transcripts_.verifySpeakersOfProfile(profileId);
	if (verified < 0) return storageError("verify speakers failed");
	if (!tx.commit()) return storageError("commit failed: " + tx.lastError());

	qCInfo(LC_STORE) << "[ProfileStore] profile" << profileId << "renamed" << p.displayName << "->" << trimmed
					 << "verified speakers=" << verified;
	return getProfile(profileId, out);
}

Status ProfileStore::setState(qint64 profileId, ProfileState state)
{
	ProfileLockTable::Guard guard = locks_.lock(profileId);
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	SqlTransaction tx(db);
	if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

	Profile p;
	if (!profileRow(profileId, &p)) return missingProfileStatus(profileId);
	if (!updateProfileRow(profileId, p.displayName, state)) return storageError("update state failed");
	Status st = bumpVersion(profileId, p.version);
	if (!st.ok()) return st;
	if (!tx.commit()) return storageError("commit failed: " + tx.lastError());
	return Status::success();
}

Status ProfileStore::deleteProfile(qint64 profileId)
{
	ProfileLockTable::Guard guard = locks_.lock(profileId);
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	SqlTransaction tx(db);
	if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

	if (!profileRow(profileId, nullptr)) return missingProfileStatus(profileId);

	std::vector<PerFileSpeaker> owned;
	if (!transcripts_.speakersOfProfile(profileId, &owned)) return storageError("list speakers failed");

	// 새 seed 는 아직 아무도 모르는 id 라 잠글 필요 없음
	for (auto& s : owned) {
		qint64 seed = -1;
		Status st = insertProfileRow(QString(), ProfileState::Unverified, &seed);
		if (!st.ok()) return st;
		if (!embeddings_.moveEmbedding(s.embeddingId, seed)) return storageError("move embedding failed");
		if (!transcripts_.setSegmentsProfileForSpeaker(s.id, seed)) return storageError("move segments failed");

		s.profileId = seed;
		s.displayName.clear();
		s.assignment = SpeakerAssignment::Seeded;
		s.verified = false;
		s.confidence = 1.0;
		clearSuggestion(&s);
		if (!transcripts_.saveSpeakerState(s)) return storageError("save speaker failed");
		if (!recomputeStats(seed)) return storageError("recompute stats failed");
	}

	const int left = embeddings_.countOfProfile(profileId);
	if (left != 0) return storageError(QString("profile %1 still owns %2 embeddings").arg(profileId).arg(left));

	Status st = releaseEmptyProfile(profileId, -1);
	if (!st.ok()) return st;
	if (!tx.commit()) return storageError("commit failed: " + tx.lastError());

	qCInfo(LC_STORE) << "[ProfileStore] profile" << profileId << "deleted, reseeded speakers=" << owned.size();
	return Status::success();
}

Status ProfileStore::missingProfileStatus(qint64 profileId) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("SELECT target_id FROM profile_redirects WHERE source_id = ?");
	q.addBindValue(profileId);
	if (!q.exec()) return storageError("select redirect failed: " + q.lastError().text());
	if (!q.next())
		return Status::error(ErrorCode::NotFound, QString("profile %1 not found").arg(profileId));

	qint64 live = -1;
	if (!resolveProfile(q.value(0).toLongLong(), &live).ok())
		return Status::error(ErrorCode::NotFound, QString("profile %1 not found").arg(profileId));
	return Status::gone(profileId, live);
}

Status ProfileStore::resolveProfile(qint64 profileId, qint64* outLiveId) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return storageError(db.lastError().text());

	qint64 id = profileId;
	for (int hop = 0; hop <= redirectMaxHops_; ++hop) {
		if (profileRow(id, nullptr)) {
			if (outLiveId) *outLiveId = id;
			return Status::success();
		}
		QSqlQuery q(db);
		q.prepare("SELECT target_id FROM profile_redirects WHERE source_id = ?");
		q.addBindValue(id);
		if (!q.exec()) return storageError("select redirect failed: " + q.lastError().text());
		if (!q.next()) break;
		id = q.value(0).toLongLong();
	}
	return Status::error(ErrorCode::NotFound, QString("profile %1 not found").arg(profileId));
}

int ProfileStore::purgeExpiredRedirects(int ttlSec)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	const QString cutoff = QDateTime::currentDateTime().addSecs(-ttlSec).toString(Qt::ISODateWithMs);
	QSqlQuery q(db);
	q.prepare("DELETE FROM profile_redirects WHERE created_at < ?");
	q.addBindValue(cutoff);
	if (!q.exec()) {
		qCritical() << "[ProfileStore] purge redirects failed:" << q.lastError().text();
		return -1;
	}
	const int n = q.numRowsAffected();
	if (n > 0) qCDebug(LC_STORE) << "[ProfileStore] purged redirects:" << n;
	return n;
}

// ---------- low-level (호출측이 락/트랜잭션) ----------

Status ProfileStore::bumpVersion(qint64 profileId, qint64 expectedVersion)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("UPDATE profiles SET version = version + 1, updated_at = ? WHERE id = ? AND version = ?");
	q.addBindValue(nowIso());
	q.addBindValue(profileId);
	q.addBindValue(expectedVersion);
	if (!q.exec()) return storageError("bump version failed: " + q.lastError().text());
	if (q.numRowsAffected() == 1) return Status::success();

	if (!profileRow(profileId, nullptr)) return missingProfileStatus(profileId);
	return Status::error(ErrorCode::ConcurrentModificationConflict,
						 QString("profile %1 changed since version %2").arg(profileId).arg(expectedVersion));
}

bool ProfileStore::recomputeStats(qint64 profileId)
{
	int count = 0;
	double talk = 0.0;
	if (!transcripts_.segmentStats(profileId, &count, &talk)) return false;

	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("UPDATE profiles SET segment_count = ?, talk_time = ? WHERE id = ?");
	q.addBindValue(count);
	q.addBindValue(talk);
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[ProfileStore] update stats failed:" << q.lastError().text();
		return false;
	}
	return true;
}

bool ProfileStore::insertRedirect(qint64 sourceId, qint64 targetId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("INSERT OR REPLACE INTO profile_redirects (source_id, target_id, created_at) VALUES (?, ?, ?)");
	q.addBindValue(sourceId);
	q.addBindValue(targetId);
	q.addBindValue(nowIso());
	if (!q.exec()) {
		qCritical() << "[ProfileStore] insert redirect failed:" << q.lastError().text();
		return false;
	}
	// 체인 평탄화: source 를 가리키던 redirect 도 target 으로
	q.prepare("UPDATE profile_redirects SET target_id = ? WHERE target_id = ?");
	q.addBindValue(targetId);
	q.addBindValue(sourceId);
	if (!q.exec()) {
		qCritical() << "[ProfileStore] flatten redirects failed:" << q.lastError().text();
		return false;
	}
	return true;
}

bool ProfileStore::dropRedirectsTo(qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("DELETE FROM profile_redirects WHERE target_id = ?");
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[ProfileStore] drop redirects failed:" << q.lastError().text();
		return false;
	}
	return true;
}

bool ProfileStore::deleteProfileRow(qint64 profileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("DELETE FROM profiles WHERE id = ?");
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[ProfileStore] delete profile failed:" << q.lastError().text();
		return false;
	}
	return q.numRowsAffected() == 1;
}

// 빈 프로필 정리. successor 가 있으면 참조를 넘기고 redirect 를 남긴다
Status ProfileStore::releaseEmptyProfile(qint64 profileId, qint64 successorId)
{
	if (successorId >= 0) {
		if (transcripts_.redirectSuggestions(profileId, successorId) < 0)
			return storageError("redirect suggestions failed");
		if (transcripts_.reassignSegments(profileId, successorId) < 0)
			return storageError("reassign segments failed");
		if (!insertRedirect(profileId, successorId))
			return storageError("insert redirect failed");
	} else {
		if (transcripts_.clearSuggestionsTo(profileId) < 0)
			return storageError("clear suggestions failed");
		if (!dropRedirectsTo(profileId))
			return storageError("drop redirects failed");
	}
	if (!deleteProfileRow(profileId)) return storageError(QString("delete profile %1 failed").arg(profileId));
	qCDebug(LC_STORE) << "[ProfileStore] released empty profile" << profileId << "successor=" << successorId;
	return Status::success();
}

bool ProfileStore::ownerOfSpeaker(qint64 speakerId, qint64* outOwner) const
{
	PerFileSpeaker s;
	if (!transcripts_.getSpeaker(speakerId, &s).ok()) return false;
	if (outOwner) *outOwner = s.profileId;
	return true;
}

// ---------- speakers ----------

Status ProfileStore::registerSpeaker(const SpeakerRegistration& req, PerFileSpeaker* out, bool* alreadyExisted)
{
	if (alreadyExisted) *alreadyExisted = false;
	Status st = EmbeddingStore::validateVector(req.vector);
	if (!st.ok()) return st;

	ProfileLockTable::Guard guard = locks_.lockMany({req.attachProfileId});
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	SqlTransaction tx(db);
	if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

	// 재시도된 diarization: 이미 소유자가 있으면 그대로 둔다
	Embedding existing;
	st = embeddings_.findEmbedding(req.mediaItemId, req.label, &existing);
	if (st.ok()) {
		if (alreadyExisted) *alreadyExisted = true;
		return transcripts_.findSpeaker(req.mediaItemId, req.label, out);
	}
	if (st.code != ErrorCode::NotFound) return st;

	st = transcripts_.getMediaItem(req.mediaItemId, nullptr);
	if (!st.ok()) return st;

	qint64 owner = req.attachProfileId;
	Profile target;
	if (owner >= 0) {
		if (!profileRow(owner, &target)) return missingProfileStatus(owner);
	} else {
		st = insertProfileRow(QString(), ProfileState::Unverified, &owner);
		if (!st.ok()) return st;
	}

	qint64 embeddingId = -1;
	st = embeddings_.insertEmbedding(req.mediaItemId, req.label, req.vector, owner, &embeddingId);
	if (!st.ok()) return st;

	qint64 speakerId = -1;
	st = transcripts_.insertSpeaker(req.mediaItemId, req.label, embeddingId, target.displayName, &speakerId);
	if (!st.ok()) return st;

	PerFileSpeaker s;
	st = transcripts_.getSpeaker(speakerId, &s);
	if (!st.ok()) return st;

	s.confidence = req.confidence;
	if (req.attachProfileId >= 0) {
		s.assignment = SpeakerAssignment::AutoAttached;
	} else if (req.suggestedProfileId >= 0) {
		qint64 live = -1;
		if (resolveProfile(req.suggestedProfileId, &live).ok() && live != owner) {
			s.assignment = SpeakerAssignment::Pending;
			s.suggestedProfileId = live;
			s.suggestedScore = req.suggestedScore;
			s.suggestedRationale = req.suggestedRationale;
		} else {
			qCDebug(LC_STORE) << "[ProfileStore] suggestion target" << req.suggestedProfileId << "vanished";
		}
	}
	if (!transcripts_.saveSpeakerState(s)) return storageError("save speaker failed");

	if (!transcripts_.bindSegmentsToSpeaker(req.mediaItemId, req.label, speakerId, owner))
		return storageError("bind segments failed");
	if (!recomputeStats(owner)) return storageError("recompute stats failed");

	if (req.attachProfileId >= 0) {
		if (target.state == ProfileState::Unverified &&
			!updateProfileRow(owner, target.displayName, ProfileState::Suggested))
			return storageError("update state failed");
		st = bumpVersion(owner, target.version);
		if (!st.ok()) return st;
	}

	if (!tx.commit()) return storageError("commit failed: " + tx.lastError());
	if (out) *out = s;
	return Status::success();
}

Status ProfileStore::attachSpeaker(qint64 speakerId, qint64 targetProfileId, const AttachOptions& opt,
								   PerFileSpeaker* out, bool* skipped)
{
	if (skipped) *skipped = false;

	for (int attempt = 0; attempt < kOwnerRetries; ++attempt) {
		qint64 seenOwner = -1;
		if (!ownerOfSpeaker(speakerId, &seenOwner))
			return Status::error(ErrorCode::NotFound, QString("speaker %1 not found").arg(speakerId));

		ProfileLockTable::Guard guard = locks_.lockMany({seenOwner, targetProfileId});
		QSqlDatabase db = ensureOpenConnectionForThisThread();
		SqlTransaction tx(db);
		if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

		PerFileSpeaker s;
		Status st = transcripts_.getSpeaker(speakerId, &s);
		if (!st.ok()) return st;
		if (s.profileId != seenOwner) continue;

		if (opt.onlyIfOutstanding && !s.outstanding()) {
			if (skipped) *skipped = true;
			if (out) *out = s;
			return Status::success();
		}

		Profile target;
		if (!profileRow(targetProfileId, &target)) return missingProfileStatus(targetProfileId);

		const qint64 from = s.profileId;
		Profile prev;
		if (!profileRow(from, &prev)) return storageError(QString("owner %1 of speaker %2 missing").arg(from).arg(speakerId));

		if (from != targetProfileId) {
			if (!embeddings_.moveEmbedding(s.embeddingId, targetProfileId))
				return storageError("move embedding failed");
			if (!transcripts_.setSegmentsProfileForSpeaker(s.id, targetProfileId))
				return storageError("move segments failed");
		}

		s.profileId = targetProfileId;
		s.displayName = target.displayName;
		s.assignment = opt.assignment;
		s.verified = opt.verified;
		s.confidence = opt.confidence;
		clearSuggestion(&s);
		if (!transcripts_.saveSpeakerState(s)) return storageError("save speaker failed");

		if (from != targetProfileId) {
			const int left = embeddings_.countOfProfile(from);
			if (left < 0) return storageError("count embeddings failed");
			if (left == 0) {
				st = releaseEmptyProfile(from, targetProfileId);
			} else {
				if (!recomputeStats(from)) return storageError("recompute stats failed");
				st = bumpVersion(from, prev.version);
			}
			if (!st.ok()) return st;
		}

		if (!recomputeStats(targetProfileId)) return storageError("recompute stats failed");
		if (opt.promoteTarget && raiseState(target.state, *opt.promoteTarget) &&
			!updateProfileRow(targetProfileId, target.displayName, *opt.promoteTarget))
			return storageError("update state failed");
		st = bumpVersion(targetProfileId, target.version);
		if (!st.ok()) return st;

		if (!tx.commit()) return storageError("commit failed: " + tx.lastError());

		qCDebug(LC_STORE) << "[ProfileStore] speaker" << speakerId << "attached" << from << "->" << targetProfileId
						  << assignmentName(opt.assignment);
		if (out) *out = s;
		return Status::success();
	}
	return ownerChurn(speakerId);
}

Status ProfileStore::setPendingSuggestion(qint64 speakerId, qint64 profileId, double score,
										  const QString& rationale, bool onlyIfBetter, bool* skipped)
{
	if (skipped) *skipped = false;

	for (int attempt = 0; attempt < kOwnerRetries; ++attempt) {
		qint64 seenOwner = -1;
		if (!ownerOfSpeaker(speakerId, &seenOwner))
			return Status::error(ErrorCode::NotFound, QString("speaker %1 not found").arg(speakerId));

		ProfileLockTable::Guard guard = locks_.lock(seenOwner);
		QSqlDatabase db = ensureOpenConnectionForThisThread();
		SqlTransaction tx(db);
		if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

		PerFileSpeaker s;
		Status st = transcripts_.getSpeaker(speakerId, &s);
		if (!st.ok()) return st;
		if (s.profileId != seenOwner) continue;

		qint64 live = -1;
		st = resolveProfile(profileId, &live);
		if (!st.ok()) return st;

		std::unordered_set<qint64> rejected;
		if (!transcripts_.rejectedProfiles(speakerId, &rejected)) return storageError("select rejections failed");

		const bool worse = onlyIfBetter && s.suggestedProfileId >= 0 &&
						   s.suggestedProfileId != live && s.suggestedScore > score;
		if (!s.outstanding() || live == s.profileId || rejected.count(live) || worse) {
			if (skipped) *skipped = true;
			return Status::success();
		}

		s.assignment = SpeakerAssignment::Pending;
		s.suggestedProfileId = live;
		s.suggestedScore = score;
		s.suggestedRationale = rationale;
		if (!transcripts_.saveSpeakerState(s)) return storageError("save speaker failed");
		if (!tx.commit()) return storageError("commit failed: " + tx.lastError());
		return Status::success();
	}
	return ownerChurn(speakerId);
}

Status ProfileStore::rejectSuggestion(qint64 speakerId, Profile* out)
{
	for (int attempt = 0; attempt < kOwnerRetries; ++attempt) {
		qint64 seenOwner = -1;
		if (!ownerOfSpeaker(speakerId, &seenOwner))
			return Status::error(ErrorCode::NotFound, QString("speaker %1 not found").arg(speakerId));

		ProfileLockTable::Guard guard = locks_.lock(seenOwner);
		QSqlDatabase db = ensureOpenConnectionForThisThread();
		SqlTransaction tx(db);
		if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

		PerFileSpeaker s;
		Status st = transcripts_.getSpeaker(speakerId, &s);
		if (!st.ok()) return st;
		if (s.profileId != seenOwner) continue;

		qint64 owner = s.profileId;
		if (s.assignment == SpeakerAssignment::AutoAttached && !s.verified) {
			// 자동 연결 거절: 자기 seed 로 분리
			Profile prev;
			if (!profileRow(owner, &prev)) return storageError("owner profile missing");
			if (!transcripts_.addRejection(s.id, owner)) return storageError("add rejection failed");

			qint64 seed = -1;
			st = insertProfileRow(QString(), ProfileState::Unverified, &seed);
			if (!st.ok()) return st;
			if (!embeddings_.moveEmbedding(s.embeddingId, seed)) return storageError("move embedding failed");
			if (!transcripts_.setSegmentsProfileForSpeaker(s.id, seed)) return storageError("move segments failed");
			if (!recomputeStats(seed)) return storageError("recompute stats failed");

			const int left = embeddings_.countOfProfile(owner);
			if (left < 0) return storageError("count embeddings failed");
			if (left == 0) {
				st = releaseEmptyProfile(owner, -1);
			} else {
				if (!recomputeStats(owner)) return storageError("recompute stats failed");
				st = bumpVersion(owner, prev.version);
			}
			if (!st.ok()) return st;

			s.profileId = seed;
			s.displayName.clear();
			owner = seed;
		} else if (s.suggestedProfileId >= 0) {
			if (!transcripts_.addRejection(s.id, s.suggestedProfileId)) return storageError("add rejection failed");
		}

		if (!s.verified) s.assignment = SpeakerAssignment::Seeded;
		s.confidence = 1.0;
		clearSuggestion(&s);
		if (!transcripts_.saveSpeakerState(s)) return storageError("save speaker failed");
		if (!tx.commit()) return storageError("commit failed: " + tx.lastError());

		return getProfile(owner, out);
	}
	return ownerChurn(speakerId);
}

Status ProfileStore::nameSpeakerProfile(qint64 speakerId, const QString& name, Profile* out)
{
	const QString trimmed = name.trimmed();
	if (trimmed.isEmpty())
		return Status::error(ErrorCode::InvalidArgument, QStringLiteral("display name must not be empty"));

	for (int attempt = 0; attempt < kOwnerRetries; ++attempt) {
		qint64 seenOwner = -1;
		if (!ownerOfSpeaker(speakerId, &seenOwner))
			return Status::error(ErrorCode::NotFound, QString("speaker %1 not found").arg(speakerId));

		ProfileLockTable::Guard guard = locks_.lock(seenOwner);
		QSqlDatabase db = ensureOpenConnectionForThisThread();
		SqlTransaction tx(db);
		if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

		PerFileSpeaker s;
		Status st = transcripts_.getSpeaker(speakerId, &s);
		if (!st.ok()) return st;
		if (s.profileId != seenOwner) continue;

		Profile prev;
		if (!profileRow(s.profileId, &prev)) return storageError("owner profile missing");
		const int owned = embeddings_.countOfProfile(s.profileId);
		if (owned < 0) return storageError("count embeddings failed");

		qint64 named = s.profileId;
		if (owned == 1) {
			if (!updateProfileRow(named, trimmed, ProfileState::Verified)) return storageError("rename profile failed");
			st = bumpVersion(named, prev.version);
			if (!st.ok()) return st;
		} else {
			// 공유 프로필에서 떼어내 새 프로필로
			st = insertProfileRow(trimmed, ProfileState::Verified, &named);
			if (!st.ok()) return st;
			if (!embeddings_.moveEmbedding(s.embeddingId, named)) return storageError("move embedding failed");
			if (!transcripts_.setSegmentsProfileForSpeaker(s.id, named)) return storageError("move segments failed");
			if (!recomputeStats(prev.id)) return storageError("recompute stats failed");
			st = bumpVersion(prev.id, prev.version);
			if (!st.ok()) return st;
		}
		if (!recomputeStats(named)) return storageError("recompute stats failed");

		s.profileId = named;
		s.displayName = trimmed;
		s.assignment = SpeakerAssignment::Verified;
		s.verified = true;
		s.confidence = 1.0;
		clearSuggestion(&s);
		if (!transcripts_.saveSpeakerState(s)) return storageError("save speaker failed");
		if (!tx.commit()) return storageError("commit failed: " + tx.lastError());

		qCInfo(LC_STORE) << "[ProfileStore] speaker" << speakerId << "named" << trimmed << "profile=" << named;
		return getProfile(named, out);
	}
	return ownerChurn(speakerId);
}

Status ProfileStore::speaker(qint64 speakerId, PerFileSpeaker* out) const
{
	return transcripts_.getSpeaker(speakerId, out);
}

bool ProfileStore::speakersOfMedia(qint64 mediaItemId, std::vector<PerFileSpeaker>* out) const
{
	return transcripts_.speakersOfMedia(mediaItemId, out);
}

bool ProfileStore::outstandingSpeakers(std::vector<PerFileSpeaker>* out) const
{
	return transcripts_.outstandingSpeakers(out);
}

bool ProfileStore::rejectedProfiles(qint64 speakerId, std::unordered_set<qint64>* out) const
{
	return transcripts_.rejectedProfiles(speakerId, out);
}

// ---------- segments ----------

Status ProfileStore::addTranscriptSegment(qint64 mediaItemId, const QString& label, double start, double end,
										  const QString& text, qint64* outId)
{
	if (!(end >= start) || start < 0.0)
		return Status::error(ErrorCode::InvalidArgument,
							 QString("invalid segment range [%1, %2]").arg(start).arg(end));

	for (int attempt = 0; attempt < kOwnerRetries; ++attempt) {
		PerFileSpeaker seen;
		Status st = transcripts_.findSpeaker(mediaItemId, label, &seen);
		if (!st.ok() && st.code != ErrorCode::NotFound) return st;
		const qint64 seenOwner = st.ok() ? seen.profileId : -1;

		ProfileLockTable::Guard guard = locks_.lockMany({seenOwner});
		QSqlDatabase db = ensureOpenConnectionForThisThread();
		SqlTransaction tx(db);
		if (!tx.isActive()) return storageError("begin failed: " + tx.lastError());

		st = transcripts_.getMediaItem(mediaItemId, nullptr);
		if (!st.ok()) return st;

		PerFileSpeaker s;
		st = transcripts_.findSpeaker(mediaItemId, label, &s);
		if (!st.ok() && st.code != ErrorCode::NotFound) return st;
		const qint64 owner = st.ok() ? s.profileId : -1;
		if (owner != seenOwner) continue;

		TranscriptSegment seg;
		seg.mediaItemId = mediaItemId;
		seg.label = label;
		seg.speakerId = owner >= 0 ? s.id : -1;
		seg.profileId = owner;
		seg.start = start;
		seg.end = end;
		seg.text = text;
		st = transcripts_.addSegment(seg, outId);
		if (!st.ok()) return st;

		if (owner >= 0) {
			Profile p;
			if (!profileRow(owner, &p)) return storageError("owner profile missing");
			if (!recomputeStats(owner)) return storageError("recompute stats failed");
			st = bumpVersion(owner, p.version);
			if (!st.ok()) return st;
		}
		if (!tx.commit()) return storageError("commit failed: " + tx.lastError());
		return Status::success();
	}
	return Status::error(ErrorCode::ConcurrentModificationConflict,
						 QString("owner of %1/%2 kept changing").arg(mediaItemId).arg(label));
}

bool ProfileStore::segmentsOfProfile(qint64 profileId, std::vector<TranscriptSegment>* out) const
{
	return transcripts_.segmentsOfProfile(profileId, out);
}

// ---------- matcher input ----------

bool ProfileStore::galleryEntries(std::vector<GalleryEntry>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	// 단일 SELECT -> 일관된 스냅샷
	QSqlQuery q(db);
	if (!q.exec("SELECT e.profile_id, p.display_name, e.id, e.media_item_id, e.vector, e.dim "
				"FROM embeddings e JOIN profiles p ON p.id = e.profile_id "
				"ORDER BY e.profile_id, e.id")) {
		qCritical() << "[ProfileStore] gallery query failed:" << q.lastError().text();
		return false;
	}
	out->clear();
	while (q.next()) {
		appendGalleryRow(out, q.value(0).toLongLong(), q.value(1).toString(), q.value(2).toLongLong(),
						 q.value(3).toLongLong(), q.value(4).toByteArray(), q.value(5).toInt());
	}
	return true;
}

Status ProfileStore::galleryEntry(qint64 profileId, GalleryEntry* out) const
{
	Profile p;
	if (!profileRow(profileId, &p))
		return Status::error(ErrorCode::NotFound, QString("profile %1 not found").arg(profileId));

	QSqlDatabase db = ensureOpenConnectionForThisThread();
	QSqlQuery q(db);
	q.prepare("SELECT id, media_item_id, vector, dim FROM embeddings WHERE profile_id = ? ORDER BY id");
	q.addBindValue(profileId);
	if (!q.exec()) return storageError("gallery entry query failed: " + q.lastError().text());

	std::vector<GalleryEntry> one;
	while (q.next()) {
		appendGalleryRow(&one, profileId, p.displayName, q.value(0).toLongLong(), q.value(1).toLongLong(),
						 q.value(2).toByteArray(), q.value(3).toInt());
	}
	if (out) {
		if (one.empty()) {
			*out = GalleryEntry{};
			out->profileId = profileId;
			out->name = p.displayName;
		} else {
			*out = std::move(one.front());
		}
	}
	return Status::success();
}

Status ProfileStore::occurrencesOf(qint64 profileId, std::vector<CrossMediaOccurrence>* out) const
{
	if (!out) return Status::error(ErrorCode::InvalidArgument, QStringLiteral("null output"));
	Status st = getProfile(profileId, nullptr);
	if (!st.ok()) return st;

	std::vector<PerFileSpeaker> owned, pending;
	if (!transcripts_.speakersOfProfile(profileId, &owned)) return storageError("list owned speakers failed");
	if (!transcripts_.pendingSuggestionsFor(profileId, &pending)) return storageError("list pending speakers failed");

	std::map<qint64, QString> titles;
	auto titleOf = [&](qint64 mediaId) -> QString {
		auto it = titles.find(mediaId);
		if (it != titles.end()) return it->second;
		MediaItem m;
		const QString t = transcripts_.getMediaItem(mediaId, &m).ok() ? m.title : QString();
		titles[mediaId] = t;
		return t;
	};

	out->clear();
	for (const auto& s : owned) {
		CrossMediaOccurrence o;
		o.mediaItemId = s.mediaItemId;
		o.mediaTitle = titleOf(s.mediaItemId);
		o.perFileLabel = s.label;
		o.speakerId = s.id;
		o.score = s.confidence;
		o.verified = s.verified;
		out->push_back(o);
	}
	for (const auto& s : pending) {
		CrossMediaOccurrence o;
		o.mediaItemId = s.mediaItemId;
		o.mediaTitle = titleOf(s.mediaItemId);
		o.perFileLabel = s.label;
		o.speakerId = s.id;
		o.score = s.suggestedScore;
		o.pending = true;
		out->push_back(o);
	}
	return Status::success();
}

bool ProfileStore::verifyOwnershipInvariant(QString* report) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	struct Check { const char* name; const char* sql; };
	static const Check kChecks[] = {
		{ "orphan embeddings",
		  "SELECT COUNT(*) FROM embeddings e LEFT JOIN profiles p ON p.id = e.profile_id WHERE p.id IS NULL" },
		{ "embeddings without speaker",
		  "SELECT COUNT(*) FROM embeddings e LEFT JOIN per_file_speakers s ON s.embedding_id = e.id "
		  "WHERE s.id IS NULL" },
		{ "embeddings with several speakers",
		  "SELECT COUNT(*) FROM (SELECT embedding_id FROM per_file_speakers GROUP BY embedding_id "
		  "HAVING COUNT(*) > 1)" },
		{ "segments pointing away from speaker owner",
		  "SELECT COUNT(*) FROM transcript_segments t JOIN per_file_speakers s ON s.id = t.speaker_id "
		  "JOIN embeddings e ON e.id = s.embedding_id "
		  "WHERE t.profile_id IS NULL OR t.profile_id <> e.profile_id" },
		{ "suggestions pointing at owner",
		  "SELECT COUNT(*) FROM per_file_speakers s JOIN embeddings e ON e.id = s.embedding_id "
		  "WHERE s.suggested_profile_id = e.profile_id" },
	};

	QStringList problems;
	QSqlQuery q(db);
	for (const Check& c : kChecks) {
		if (!q.exec(QString::fromLatin1(c.sql)) || !q.next()) {
			qCritical() << "[ProfileStore] invariant query failed:" << c.name << q.lastError().text();
			return false;
		}
		const qint64 n = q.value(0).toLongLong();
		if (n != 0) problems << QString("%1: %2").arg(QLatin1String(c.name)).arg(n);
	}
	if (report) *report = problems.isEmpty() ? QStringLiteral("ok") : problems.join("; ");
	return problems.isEmpty();
}
