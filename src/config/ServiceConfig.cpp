#include "config/ServiceConfig.hpp"
#include "include/common_path.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

ServiceConfig ServiceConfig::defaults()
{
	ServiceConfig c;
	c.dbPath = QStringLiteral(DB_PATH DB);
	return c;
}

QString ServiceConfig::defaultConfigFile()
{
	return QStringLiteral(CONFIG_PATH CONFIG_JSON);
}

bool ServiceConfig::loadFromFile(const QString& path, QString* error)
{
	QFile f(path);
	if (!f.exists()) {
		if (error) *error = QString("%1 not found").arg(path);
		qWarning() << "[ServiceConfig]" << path << "not found";
		return false;
	}
	if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
		if (error) *error = f.errorString();
		qWarning() << "[ServiceConfig] failed to open" << path << ":" << f.errorString();
		return false;
	}

	const QByteArray raw = f.readAll();
	f.close();

	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(raw, &perr);
	if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
		const QString msg = perr.error != QJsonParseError::NoError ? perr.errorString()
																	: QStringLiteral("root is not an object");
		if (error) *error = msg;
		qWarning() << "[ServiceConfig] JSON parse error:" << msg;
		return false;
	}

	applyJson(doc.object());
	qInfo() << "[ServiceConfig] loaded" << path;
	return true;
}

void ServiceConfig::applyJson(const QJsonObject& root)
{
	const QString db = root.value("db_path").toString();
	if (!db.isEmpty()) dbPath = db;

	const QJsonObject t = root.value("tiers").toObject();
	if (!t.isEmpty()) {
		TierParams p = tiers;
		p.high   = t.value("high").toDouble(p.high);
		p.medium = t.value("medium").toDouble(p.medium);
		if (p.medium >= 0.0 && p.medium <= p.high && p.high <= 1.0) {
			tiers = p;
		} else {
			qWarning() << "[ServiceConfig] invalid tiers (medium" << p.medium << "high" << p.high << "), kept defaults";
		}
	}

	const QJsonObject m = root.value("matcher").toObject();
	if (!m.isEmpty()) {
		const int base = m.value("base_budget_ms").toInt(budget.baseMs);
		const int per  = m.value("per_embedding_budget_us").toInt(budget.perEmbeddingUs);
		if (base >= 0 && per >= 0) {
			budget.baseMs = base;
			budget.perEmbeddingUs = per;
		} else {
			qWarning() << "[ServiceConfig] negative matcher budget, kept defaults";
		}
	}

	const QJsonObject g = root.value("merge").toObject();
	if (g.contains("max_conflict_retries")) {
		const int n = g.value("max_conflict_retries").toInt(-1);
		if (n >= 0) maxConflictRetries = n;
		else qWarning() << "[ServiceConfig] invalid merge.max_conflict_retries, kept" << maxConflictRetries;
	}

	if (root.contains("redirect_ttl_sec")) {
		const int ttl = root.value("redirect_ttl_sec").toInt(-1);
		if (ttl > 0) redirectTtlSec = ttl;
		else qWarning() << "[ServiceConfig] invalid redirect_ttl_sec, kept" << redirectTtlSec;
	}

	const QJsonObject l = root.value("log").toObject();
	if (l.contains("debug_categories")) {
		debugCategories.clear();
		for (const QJsonValue& v : l.value("debug_categories").toArray()) {
			const QString name = v.toString();
			if (!name.isEmpty()) debugCategories << name;
		}
	}
	if (l.contains("persist")) persistLogs = l.value("persist").toBool(persistLogs);
	if (l.contains("persist_min_level")) {
		const int lv = l.value("persist_min_level").toInt(-1);
		if (lv >= 0 && lv <= 4) persistMinLevel = lv;
		else qWarning() << "[ServiceConfig] invalid log.persist_min_level, kept" << persistMinLevel;
	}
	if (l.contains("retention_days")) {
		const int days = l.value("retention_days").toInt(-1);
		if (days > 0) logRetentionDays = days;
		else qWarning() << "[ServiceConfig] invalid log.retention_days, kept" << logRetentionDays;
	}
}

void ServiceConfig::applyLoggingRules() const
{
	QStringList rules;
	for (const QString& c : debugCategories) rules << QString("%1.debug=true").arg(c);
	if (!rules.isEmpty()) QLoggingCategory::setFilterRules(rules.join('\n'));
}
