#include "SystemLogger.hpp"
#include <QDebug>
#include <QJsonDocument>
#include "services/QSqliteService.hpp"

namespace syslog_detail {
class SystemLogWriter : public QObject {
	Q_OBJECT
public slots:
	void append(const SystemLogEntry& e) {
		QSqliteService svc;
		if (svc.insertSystemLog(static_cast<int>(e.level), e.tag, e.message, e.ts, e.extra)) return;

		const int n = ++SystemLogger::instance().dropped_;
		qWarning() << "[SystemLogger] persist failed tag=" << e.tag << "dropped=" << n;
	}
};
} // namespace syslog_detail

SystemLogger& SystemLogger::instance() {
	static SystemLogger inst;
	return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init()
{
	auto& inst = instance();
	if (inst.running_.load()) return;

	qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.th = new QThread;
	inst.th->setObjectName(QStringLiteral("syslog-writer"));
	inst.wr = new syslog_detail::SystemLogWriter;
	inst.wr->moveToThread(inst.th);

	QObject::connect(&inst, &SystemLogger::appendRequested,
					 inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
	QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
	inst.th->start();
	inst.running_.store(true);
}

void SystemLogger::shutdown()
{
	auto& inst = instance();
	if (!inst.th) return;

	inst.running_.store(false);
	// 큐에 쌓인 기록을 먼저 비운다
	if (inst.wr && inst.th->isRunning())
		QMetaObject::invokeMethod(inst.wr, []{}, Qt::BlockingQueuedConnection);
	inst.th->quit();
	if (!inst.th->wait(3000)) {
		qWarning() << "[SystemLogger] writer thread did not stop in 3s";
		inst.th->terminate();
		inst.th->wait();
	}

	delete inst.th;
	inst.th = nullptr;
	inst.wr = nullptr;
}

void SystemLogger::setPersistEnabled(bool on) { instance().persist_.store(on); }

void SystemLogger::setPersistMinLevel(SysLogLevel lv) { instance().minLevel_.store(static_cast<int>(lv)); }

int SystemLogger::droppedCount() { return instance().dropped_.load(); }

void SystemLogger::post(SysLogLevel lv, const QString& tag, const QString& msg, const QJsonObject& extra)
{
	const QString extraText = extra.isEmpty()
		? QString()
		: QString::fromUtf8(QJsonDocument(extra).toJson(QJsonDocument::Compact));
	const QString line = extraText.isEmpty() ? QString("[%1] %2").arg(tag, msg)
											 : QString("[%1] %2 %3").arg(tag, msg, extraText);
	switch (lv) {
		case SysLogLevel::Debug:	qDebug().noquote()		<< line; break;
		case SysLogLevel::Info:		qInfo().noquote()		<< line; break;
		case SysLogLevel::Warn:		qWarning().noquote()	<< line; break;
		case SysLogLevel::Error:
		case SysLogLevel::Critical:	qCritical().noquote()	<< line; break;
	}

	auto& inst = instance();
	if (!inst.running_.load() || !inst.persist_.load()) return;
	if (static_cast<int>(lv) < inst.minLevel_.load()) return;

	SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extraText};
	emit inst.appendRequested(e);
}

void SystemLogger::debug(const QString& tag, const QString& msg, const QJsonObject& extra) { post(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info (const QString& tag, const QString& msg, const QJsonObject& extra) { post(SysLogLevel::Info,  tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QJsonObject& extra) { post(SysLogLevel::Warn,  tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QJsonObject& extra) { post(SysLogLevel::Error, tag, msg, extra); }

#include "SystemLogger.moc"
