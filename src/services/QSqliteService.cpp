#include "QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QStringList>
#include <QDebug>

using namespace SqlCommon;

namespace {

const char* const kSchema[] = {
	"CREATE TABLE IF NOT EXISTS media_items ("
	"id INTEGER PRIMARY KEY AUTOINCREMENT, "
	"title TEXT NOT NULL, "
	"created_at TEXT NOT NULL)",

	"CREATE TABLE IF NOT EXISTS profiles ("
	"id INTEGER PRIMARY KEY AUTOINCREMENT, "
	"display_name TEXT, "
	"state INTEGER NOT NULL DEFAULT 0, "
	"segment_count INTEGER NOT NULL DEFAULT 0, "
	"talk_time REAL NOT NULL DEFAULT 0, "
	"version INTEGER NOT NULL DEFAULT 0, "
	"created_at TEXT NOT NULL, "
	"updated_at TEXT NOT NULL)",

	"CREATE TABLE IF NOT EXISTS embeddings ("
	"id INTEGER PRIMARY KEY AUTOINCREMENT, "
	"media_item_id INTEGER NOT NULL REFERENCES media_items(id), "
	"label TEXT NOT NULL, "
	"dim INTEGER NOT NULL, "
	"vector BLOB NOT NULL, "
	"profile_id INTEGER NOT NULL REFERENCES profiles(id), "
	"created_at TEXT NOT NULL, "
	"UNIQUE(media_item_id, label))",

	"CREATE TABLE IF NOT EXISTS per_file_speakers ("
	"id INTEGER PRIMARY KEY AUTOINCREMENT, "
	"media_item_id INTEGER NOT NULL REFERENCES media_items(id), "
	"label TEXT NOT NULL, "
	"embedding_id INTEGER NOT NULL REFERENCES embeddings(id), "
	"display_name TEXT, "
	"assignment INTEGER NOT NULL DEFAULT 0, "
	"verified INTEGER NOT NULL DEFAULT 0, "
	"confidence REAL NOT NULL DEFAULT 0, "
	"suggested_profile_id INTEGER REFERENCES profiles(id) ON DELETE SET NULL, "
	"suggested_score REAL NOT NULL DEFAULT 0, "
	"suggested_rationale TEXT, "
	"UNIQUE(media_item_id, label))",

	"CREATE TABLE IF NOT EXISTS transcript_segments ("
	"id INTEGER PRIMARY KEY AUTOINCREMENT, "
	"media_item_id INTEGER NOT NULL REFERENCES media_items(id), "
	"label TEXT NOT NULL, "
	"speaker_id INTEGER REFERENCES per_file_speakers(id), "
	"profile_id INTEGER REFERENCES profiles(id), "
	"start_time REAL NOT NULL, "
	"end_time REAL NOT NULL, "
	"text TEXT NOT NULL)",

	"CREATE TABLE IF NOT EXISTS profile_redirects ("
	"source_id INTEGER PRIMARY KEY, "
	"target_id INTEGER NOT NULL, "
	"created_at TEXT NOT NULL)",

	"CREATE TABLE IF NOT EXISTS speaker_rejections ("
	"speaker_id INTEGER NOT NULL REFERENCES per_file_speakers(id) ON DELETE CASCADE, "
	"profile_id INTEGER NOT NULL REFERENCES profiles(id) ON DELETE CASCADE, "
	"PRIMARY KEY(speaker_id, profile_id))",

	"CREATE TABLE IF NOT EXISTS system_logs ("
	"id INTEGER PRIMARY KEY AUTOINCREMENT, "
	"level INTEGER NOT NULL, "
	"tag TEXT, "
	"message TEXT NOT NULL, "
	"timestamp TEXT NOT NULL, "
	"extra TEXT)",
};

const char* const kIndexes[] = {
	"CREATE INDEX IF NOT EXISTS idx_emb_profile   ON embeddings(profile_id)",
	"CREATE INDEX IF NOT EXISTS idx_spk_media     ON per_file_speakers(media_item_id)",
	"CREATE INDEX IF NOT EXISTS idx_spk_embedding ON per_file_speakers(embedding_id)",
	"CREATE INDEX IF NOT EXISTS idx_spk_suggested ON per_file_speakers(suggested_profile_id)",
	"CREATE INDEX IF NOT EXISTS idx_seg_profile   ON transcript_segments(profile_id)",
	"CREATE INDEX IF NOT EXISTS idx_seg_speaker   ON transcript_segments(speaker_id)",
	"CREATE INDEX IF NOT EXISTS idx_seg_label     ON transcript_segments(media_item_id, label)",
	"CREATE INDEX IF NOT EXISTS idx_sys_ts        ON system_logs(timestamp)",
	"CREATE INDEX IF NOT EXISTS idx_sys_level     ON system_logs(level)",
};

} // namespace

bool QSqliteService::initializeDatabase()
{
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] Open failed:" << db.lastError().text()
                    << " path=" << db.databaseName();
        return false;
    }

    {   // 신뢰성 옵션
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA journal_mode=WAL;"))
            qWarning() << "[SQL] journal_mode=WAL failed (ignored):" << pragma.lastError().text();
        if (!pragma.exec("PRAGMA synchronous=NORMAL;"))
            qWarning() << "[SQL] synchronous=NORMAL failed (ignored):" << pragma.lastError().text();
    }

    const int current = schemaVersion();
    if (current > kSchemaVersion) {
        qCritical() << "[SQL] database schema" << current << "is newer than" << kSchemaVersion;
        return false;
    }

    QSqlQuery q(db);
    for (const char* ddl : kSchema) {
        if (!q.exec(QString::fromLatin1(ddl))) {
            qCritical() << "[SQL] schema failed:" << q.lastError().text() << "ddl=" << ddl;
            return false;
        }
    }

    // 인덱스
    for (const char* ddl : kIndexes) {
        if (!q.exec(QString::fromLatin1(ddl)))
            qWarning() << "[SQL] index failed (ignored):" << q.lastError().text();
    }

    if (current < kSchemaVersion &&
        !q.exec(QString("PRAGMA user_version=%1;").arg(kSchemaVersion))) {
        qCritical() << "[SQL] set user_version failed:" << q.lastError().text();
        return false;
    }

    qDebug() << "[SQL] Database opened & schema ready. path=" << db.databaseName()
             << " driver=" << db.driverName();
    return true;
}

int QSqliteService::schemaVersion()
{
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return -1;

    QSqlQuery q(db);
    if (!q.exec("PRAGMA user_version;") || !q.next()) {
        qWarning() << "[SQL] read user_version failed:" << q.lastError().text();
        return -1;
    }
    return q.value(0).toInt();
}

bool QSqliteService::insertSystemLog(int level, const QString& tag, const QString& message,
                                     const QDateTime& timestamp, const QString& extra)
{
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    const QString timeSafe = timestamp.isValid()
                    ? timestamp.toString(Qt::ISODateWithMs)
                    : QDateTime::currentDateTime().toString(Qt::ISODateWithMs);

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag);
    q.addBindValue(message.isNull() ? QString("") : message);
    q.addBindValue(timeSafe);
    q.addBindValue(extra);

    if (!q.exec()) {
        qCritical() << "Insert system log failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool QSqliteService::selectSystemLogs(int offset, int limit,
                                      int minLevel, const QString& tagLike, const QString& sinceIso,
                                      QVector<SystemLog>* outRows, int* outTotal)
{
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return false;

    QString where = "WHERE level >= ?";
    QList<QVariant> binds; binds << minLevel;

    if (!tagLike.isEmpty()) { where += " AND tag LIKE ?";      binds << ("%"+tagLike+"%"); }
    if (!sinceIso.isEmpty()){ where += " AND timestamp >= ?";  binds << sinceIso; }

    // total
    QSqlQuery qc(db);
    qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
    for (auto& v : binds) qc.addBindValue(v);
    if (!qc.exec() || !qc.next()) {
        qCritical() << "[SQL] count system_logs failed:" << qc.lastError().text();
        return false;
    }
    if (outTotal) *outTotal = qc.value(0).toInt();

    // rows
    QSqlQuery q(db);
    q.prepare("SELECT id, level, tag, message, timestamp, extra "
              "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
    for (auto& v : binds) q.addBindValue(v);
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) {
        qCritical() << "[SQL] select system_logs failed:" << q.lastError().text();
        return false;
    }

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toLongLong();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}

int QSqliteService::purgeSystemLogsBefore(const QDateTime& cutoff)
{
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) return -1;

    QSqlQuery q(db);
    q.prepare("DELETE FROM system_logs WHERE timestamp < ?");
    q.addBindValue(cutoff.toString(Qt::ISODateWithMs));
    if (!q.exec()) {
        qCritical() << "[SQL] purge system_logs failed:" << q.lastError().text();
        return -1;
    }
    return q.numRowsAffected();
}

bool QSqliteService::deleteSysLogs()
{
    QSqlDatabase db = ensureOpenConnectionForThisThread();
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    if (!q.exec("DELETE FROM system_logs;")) {
        qCritical() << "[SQL] DELETE FROM system_logs failed:" << q.lastError().text();
        return false;
    }

    if (!q.exec("DELETE FROM sqlite_sequence WHERE name='system_logs';")) {
        qWarning() << "[SQL] reset sqlite_sequence failed (ignored):" << q.lastError().text();
    }
    return true;
}
