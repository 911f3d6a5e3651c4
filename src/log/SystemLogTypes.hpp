#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

// system_logs.tag 값 (컴포넌트 단위)
namespace LogTag {
	inline constexpr const char* Match = "MATCH";
	inline constexpr const char* Suggest = "SUGG";
	inline constexpr const char* Retro = "RETRO";
	inline constexpr const char* Merge = "MERGE";
	inline constexpr const char* Store = "STORE";
	inline constexpr const char* App = "APP";
}

struct SystemLogEntry {
	SysLogLevel level = SysLogLevel::Info;
	QString tag;
	QString message;
	QDateTime ts;
	QString extra;		// compact JSON (profile_id, speaker_id ...)
};

Q_DECLARE_METATYPE(SystemLogEntry)
