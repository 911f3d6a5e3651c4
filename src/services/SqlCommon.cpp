#include "services/SqlCommon.hpp"
#include "include/common_path.hpp"
#include "include/recog_params.hpp"

#include <QDir>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QSqlError>
#include <QSqlQuery>
#include <QDebug>
#include <atomic>

namespace {

QMutex			s_pathMu;
QString			s_dbPath;
std::atomic<int> s_connSeq{0};

// 스레드가 끝나면 자기 커넥션을 정리한다
struct ThreadConnection {
	QString name;
	~ThreadConnection() {
		if (name.isEmpty()) return;
		{
			QSqlDatabase db = QSqlDatabase::database(name, /*open=*/false);
			if (db.isOpen()) db.close();
		}
		QSqlDatabase::removeDatabase(name);
	}
};

thread_local ThreadConnection t_conn;

} // namespace

namespace SqlCommon {

QString dbFilePath()
{
	QMutexLocker lk(&s_pathMu);
	if (s_dbPath.isEmpty()) {
		const QString dir = QStringLiteral(DB_PATH);
		QDir().mkpath(dir);
		s_dbPath = dir + QStringLiteral(DB);
	}
	return s_dbPath;
}

void setDbFilePath(const QString& path)
{
	QMutexLocker lk(&s_pathMu);
	const QFileInfo fi(path);
	QDir().mkpath(fi.absolutePath());
	s_dbPath = fi.absoluteFilePath();
}

QString connectionNameForCurrentThread()
{
	if (t_conn.name.isEmpty()) {
		t_conn.name = QString("%1_%2").arg(baseConnName()).arg(s_connSeq.fetch_add(1));
	}
	return t_conn.name;
}

QSqlDatabase ensureOpenConnectionForThisThread()
{
	const QString name = connectionNameForCurrentThread();
	const QString path = dbFilePath();
	QSqlDatabase db;

	if (!QSqlDatabase::contains(name)) {
		db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
		db.setDatabaseName(path);
		db.setConnectOptions(QString("QSQLITE_BUSY_TIMEOUT=%1").arg(recog::SQL_BUSY_TIMEOUT_MS));
	} else {
		db = QSqlDatabase::database(name, /*open=*/false);
		// DB 파일이 바뀌었으면 다시 연다
		if (db.databaseName() != path) {
			if (db.isOpen()) db.close();
			db.setDatabaseName(path);
		}
	}

	if (!db.isOpen()) {
		if (!db.open()) {
			qCritical() << "[SQL] DB open failed:" << db.lastError().text()
						<< " path=" << db.databaseName()
						<< " drivers=" << QSqlDatabase::drivers();
			return db;
		}
		QSqlQuery pragma(db);
		if (!pragma.exec("PRAGMA foreign_keys=ON;"))
			qWarning() << "[SQL] foreign_keys=ON failed:" << pragma.lastError().text();
	}
	return db;
}

} // namespace SqlCommon

SqlTransaction::SqlTransaction(QSqlDatabase db) : db_(db)
{
	if (!db_.isOpen()) {
		lastError_ = QStringLiteral("database not open");
		return;
	}
	QSqlQuery q(db_);
	if (!q.exec("BEGIN IMMEDIATE")) {
		lastError_ = q.lastError().text();
		qCritical() << "[SQL] BEGIN IMMEDIATE failed:" << lastError_;
		return;
	}
	active_ = true;
}

SqlTransaction::~SqlTransaction()
{
	if (active_) rollback();
}

bool SqlTransaction::commit()
{
	if (!active_) return false;
	QSqlQuery q(db_);
	if (!q.exec("COMMIT")) {
		lastError_ = q.lastError().text();
		qCritical() << "[SQL] COMMIT failed:" << lastError_;
		rollback();
		return false;
	}
	active_ = false;
	return true;
}

void SqlTransaction::rollback()
{
	if (!active_) return;
	QSqlQuery q(db_);
	if (!q.exec("ROLLBACK")) {
		qWarning() << "[SQL] ROLLBACK failed:" << q.lastError().text();
	}
	active_ = false;
}
