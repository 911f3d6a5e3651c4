#pragma once
#include <QJsonObject>
#include <QObject>
#include <QThread>
#include <atomic>

#include "SystemLogTypes.hpp"

namespace syslog_detail { class SystemLogWriter; }

// 운영 이벤트(병합, 이름 전파, 삭제 ...)를 system_logs 에 비동기로 남긴다
// 콘솔 출력은 항상, DB 기록은 init() 이후 minLevel 이상만
class SystemLogger final : public QObject {
	Q_OBJECT
public:
	static SystemLogger& instance();
	static void init();			// 앱 시작시 1회
	static void shutdown();		// 대기 중인 기록을 비우고 워커 종료

	static void setPersistEnabled(bool on);
	static void setPersistMinLevel(SysLogLevel lv);
	static int droppedCount();	// DB 기록 실패 건수

	static void debug(const QString& tag, const QString& msg, const QJsonObject& extra = {});
	static void info (const QString& tag, const QString& msg, const QJsonObject& extra = {});
	static void warn (const QString& tag, const QString& msg, const QJsonObject& extra = {});
	static void error(const QString& tag, const QString& msg, const QJsonObject& extra = {});

signals:
	void appendRequested(const SystemLogEntry& e);

private:
	friend class syslog_detail::SystemLogWriter;

	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;
	std::atomic<bool> persist_{true};
	std::atomic<bool> running_{false};
	std::atomic<int>  minLevel_{static_cast<int>(SysLogLevel::Info)};
	std::atomic<int>  dropped_{0};

	explicit SystemLogger(QObject* parent=nullptr);
	~SystemLogger() override;

	static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QJsonObject& extra);
};
