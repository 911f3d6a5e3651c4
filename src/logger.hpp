// logger.hpp
#pragma once
#include <QString>
#include <QDebug>
#include <QtGlobal>
#include <QLoggingCategory>

// 컴포넌트별 카테고리 (debug 는 기본 off, config 의 log.debug_categories 로 켬)
Q_DECLARE_LOGGING_CATEGORY(LC_APP)
Q_DECLARE_LOGGING_CATEGORY(LC_MATCH)
Q_DECLARE_LOGGING_CATEGORY(LC_SUGG)
Q_DECLARE_LOGGING_CATEGORY(LC_RETRO)
Q_DECLARE_LOGGING_CATEGORY(LC_MERGE)
Q_DECLARE_LOGGING_CATEGORY(LC_STORE)

namespace GlobalLogger {

// "[함수명] 메시지" 형식, speaker.app 카테고리로 출력
inline void logMessage(QtMsgType type, const char* functionName, const QString& message)
{
		const QString fullMsg = QString("[%1] %2").arg(QLatin1String(functionName), message);

		switch (type) {
			case QtDebugMsg:
					qCDebug(LC_APP).noquote() << fullMsg;
					break;
			case QtInfoMsg:
					qCInfo(LC_APP).noquote() << fullMsg;
					break;
			case QtWarningMsg:
					qCWarning(LC_APP).noquote() << fullMsg;
					break;
			case QtCriticalMsg:
			case QtFatalMsg:
					qCCritical(LC_APP).noquote() << fullMsg;
					break;
		}
}

}		// namespace GlobalLogger

#define LOG_INFO(msg)		GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg)	GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)
