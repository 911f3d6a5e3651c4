#pragma once
#include <QString>
#include <QSqlDatabase>

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("speakers"); }

	// 기본값은 common_path.hpp 의 DB_PATH/DB, setDbFilePath 로 교체 가능 (테스트/CLI --db)
	QString dbFilePath();
	void setDbFilePath(const QString& path);

	// 스레드마다 고유한 커넥션. 스레드 종료 시 thread_local 소멸자가 removeDatabase 한다
	QString connectionNameForCurrentThread();
	QSqlDatabase ensureOpenConnectionForThisThread();
} // namespace SqlCommon

// BEGIN IMMEDIATE ~ COMMIT/ROLLBACK RAII. commit() 하지 않고 소멸하면 rollback
class SqlTransaction {
public:
	explicit SqlTransaction(QSqlDatabase db);
	~SqlTransaction();

	SqlTransaction(const SqlTransaction&) = delete;
	SqlTransaction& operator=(const SqlTransaction&) = delete;

	bool isActive() const { return active_; }
	bool commit();
	void rollback();
	QString lastError() const { return lastError_; }

private:
	QSqlDatabase db_;
	bool active_ = false;
	QString lastError_;
};
