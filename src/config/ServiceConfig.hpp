#pragma once
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "include/recog_params.hpp"
#include "match/SpeakerMatcher.hpp"
#include "match/TierPolicy.hpp"

// 런타임 설정. 기본값은 recog_params.hpp / common_path.hpp, JSON 파일로 덮어쓴다
// 알 수 없는 키는 무시, 잘못된 값은 경고 후 기본값 유지
struct ServiceConfig {
	QString		dbPath;						// sqlite 파일 전체 경로
	TierParams	tiers;
	MatchBudget	budget;
	int			maxConflictRetries = recog::MERGE_CONFLICT_RETRIES;
	int			redirectTtlSec     = recog::REDIRECT_TTL_SEC;
	QStringList	debugCategories;			// 예: "speaker.match"
	bool		persistLogs = true;
	int			persistMinLevel = 1;		// system_logs 기록 최소 레벨 (0=debug ~ 4=critical)
	int			logRetentionDays = recog::LOG_RETENTION_DAYS;

	static ServiceConfig defaults();
	static QString defaultConfigFile();

	bool loadFromFile(const QString& path, QString* error = nullptr);
	void applyJson(const QJsonObject& root);

	// QLoggingCategory 필터 규칙 적용
	void applyLoggingRules() const;
};
