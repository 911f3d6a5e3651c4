#include "store/EmbeddingStore.hpp"
#include "services/SqlCommon.hpp"
#include "logger.hpp"

#include <QDateTime>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QtEndian>
#include <cmath>
#include <cstring>
#include <algorithm>

using namespace SqlCommon;

namespace {

Embedding rowToEmbedding(const QSqlQuery& q)
{
	// id, media_item_id, label, dim, vector, profile_id
	Embedding e;
	e.id			= q.value(0).toLongLong();
	e.mediaItemId	= q.value(1).toLongLong();
	e.label			= q.value(2).toString();
	const int dim	= q.value(3).toInt();
	if (!EmbeddingStore::decodeVector(q.value(4).toByteArray(), dim, &e.vector)) {
		qCWarning(LC_STORE) << "[EmbeddingStore] corrupt vector blob id=" << e.id << "dim=" << dim;
		e.vector.clear();
	}
	e.profileId		= q.value(5).toLongLong();
	return e;
}

const char* const kSelectCols = "SELECT id, media_item_id, label, dim, vector, profile_id FROM embeddings ";

} // namespace

QByteArray EmbeddingStore::encodeVector(const std::vector<float>& v)
{
	QByteArray blob;
	blob.resize(static_cast<int>(v.size() * sizeof(quint32)));
	char* dst = blob.data();
	for (size_t i = 0; i < v.size(); ++i) {
		quint32 bits;
		std::memcpy(&bits, &v[i], sizeof(bits));
		qToLittleEndian<quint32>(bits, dst + i * sizeof(quint32));
	}
	return blob;
}

bool EmbeddingStore::decodeVector(const QByteArray& blob, int dim, std::vector<float>* out)
{
	if (!out || dim <= 0) return false;
	if (blob.size() != dim * static_cast<int>(sizeof(quint32))) return false;

	out->resize(static_cast<size_t>(dim));
	const char* src = blob.constData();
	for (int i = 0; i < dim; ++i) {
		const quint32 bits = qFromLittleEndian<quint32>(src + i * sizeof(quint32));
		std::memcpy(&(*out)[static_cast<size_t>(i)], &bits, sizeof(bits));
	}
	return true;
}

Status EmbeddingStore::validateVector(const std::vector<float>& v)
{
	if (v.empty())
		return Status::error(ErrorCode::InvalidEmbedding, QStringLiteral("zero-length embedding"));

	double n2 = 0.0;
	for (float x : v) {
		if (!std::isfinite(x))
			return Status::error(ErrorCode::InvalidEmbedding, QStringLiteral("embedding contains NaN/Inf"));
		n2 += static_cast<double>(x) * x;
	}
	if (n2 <= 0.0)
		return Status::error(ErrorCode::InvalidEmbedding, QStringLiteral("zero-norm embedding"));
	return Status::success();
}

Status EmbeddingStore::insertEmbedding(qint64 mediaItemId, const QString& label,
									   const std::vector<float>& v, qint64 ownerProfileId, qint64* outId)
{
	const Status valid = validateVector(v);
	if (!valid.ok()) return valid;

	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen())
		return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare("INSERT INTO embeddings (media_item_id, label, dim, vector, profile_id, created_at) "
			  "VALUES (?, ?, ?, ?, ?, ?)");
	q.addBindValue(mediaItemId);
	q.addBindValue(label);
	q.addBindValue(static_cast<int>(v.size()));
	q.addBindValue(encodeVector(v));
	q.addBindValue(ownerProfileId);
	q.addBindValue(QDateTime::currentDateTime().toString(Qt::ISODateWithMs));

	if (!q.exec()) {
		qCritical() << "[EmbeddingStore] insert failed:" << q.lastError().text()
					<< "media=" << mediaItemId << "label=" << label;
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (outId) *outId = q.lastInsertId().toLongLong();
	return Status::success();
}

Status EmbeddingStore::findEmbedding(qint64 mediaItemId, const QString& label, Embedding* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen())
		return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare(QString(kSelectCols) + "WHERE media_item_id = ? AND label = ?");
	q.addBindValue(mediaItemId);
	q.addBindValue(label);
	if (!q.exec()) {
		qCritical() << "[EmbeddingStore] find failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (!q.next())
		return Status::error(ErrorCode::NotFound,
							 QString("no embedding for media %1 label %2").arg(mediaItemId).arg(label));
	if (out) *out = rowToEmbedding(q);
	return Status::success();
}

Status EmbeddingStore::getEmbedding(qint64 embeddingId, Embedding* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen())
		return Status::error(ErrorCode::StorageError, db.lastError().text());

	QSqlQuery q(db);
	q.prepare(QString(kSelectCols) + "WHERE id = ?");
	q.addBindValue(embeddingId);
	if (!q.exec()) {
		qCritical() << "[EmbeddingStore] get failed:" << q.lastError().text();
		return Status::error(ErrorCode::StorageError, q.lastError().text());
	}
	if (!q.next())
		return Status::error(ErrorCode::NotFound, QString("embedding %1 not found").arg(embeddingId));
	if (out) *out = rowToEmbedding(q);
	return Status::success();
}

bool EmbeddingStore::embeddingsOfProfile(qint64 profileId, std::vector<Embedding>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	q.prepare(QString(kSelectCols) + "WHERE profile_id = ? ORDER BY id");
	q.addBindValue(profileId);
	if (!q.exec()) {
		qCritical() << "[EmbeddingStore] select by profile failed:" << q.lastError().text();
		return false;
	}
	out->clear();
	while (q.next()) out->push_back(rowToEmbedding(q));
	return true;
}

bool EmbeddingStore::allEmbeddings(std::vector<Embedding>* out) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen() || !out) return false;

	QSqlQuery q(db);
	if (!q.exec(QString(kSelectCols) + "ORDER BY profile_id, id")) {
		qCritical() << "[EmbeddingStore] select all failed:" << q.lastError().text();
		return false;
	}
	out->clear();
	while (q.next()) out->push_back(rowToEmbedding(q));
	return true;
}

int EmbeddingStore::countOfProfile(qint64 profileId) const
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	QSqlQuery q(db);
	q.prepare("SELECT COUNT(*) FROM embeddings WHERE profile_id = ?");
	q.addBindValue(profileId);
	if (!q.exec() || !q.next()) {
		qCritical() << "[EmbeddingStore] count failed:" << q.lastError().text();
		return -1;
	}
	return q.value(0).toInt();
}

bool EmbeddingStore::moveEmbedding(qint64 embeddingId, qint64 toProfileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	QSqlQuery q(db);
	q.prepare("UPDATE embeddings SET profile_id = ? WHERE id = ?");
	q.addBindValue(toProfileId);
	q.addBindValue(embeddingId);
	if (!q.exec()) {
		qCritical() << "[EmbeddingStore] move failed:" << q.lastError().text();
		return false;
	}
	return q.numRowsAffected() == 1;
}

int EmbeddingStore::reassignOwner(qint64 fromProfileId, qint64 toProfileId)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return -1;

	QSqlQuery q(db);
	q.prepare("UPDATE embeddings SET profile_id = ? WHERE profile_id = ?");
	q.addBindValue(toProfileId);
	q.addBindValue(fromProfileId);
	if (!q.exec()) {
		qCritical() << "[EmbeddingStore] reassign failed:" << q.lastError().text();
		return -1;
	}
	return q.numRowsAffected();
}

bool EmbeddingStore::deleteForMediaItem(qint64 mediaItemId, std::vector<qint64>* formerOwners)
{
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	if (!db.isOpen()) return false;

	if (formerOwners) {
		QSqlQuery owners(db);
		owners.prepare("SELECT DISTINCT profile_id FROM embeddings WHERE media_item_id = ?");
		owners.addBindValue(mediaItemId);
		if (!owners.exec()) {
			qCritical() << "[EmbeddingStore] owner lookup failed:" << owners.lastError().text();
			return false;
		}
		formerOwners->clear();
		while (owners.next()) formerOwners->push_back(owners.value(0).toLongLong());
	}

	QSqlQuery q(db);
	q.prepare("DELETE FROM embeddings WHERE media_item_id = ?");
	q.addBindValue(mediaItemId);
	if (!q.exec()) {
		qCritical() << "[EmbeddingStore] delete by media failed:" << q.lastError().text();
		return false;
	}
	return true;
}
