#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>
#include <QDebug>
#include <exception>

#include "api/JsonCodec.hpp"
#include "config/ServiceConfig.hpp"
#include "log/SystemLogger.hpp"
#include "services/QSqliteService.hpp"
#include "services/SpeakerIdentityService.hpp"

namespace {

void printJson(const QJsonValue& v)
{
	QTextStream out(stdout);
	const QJsonDocument doc = v.isArray() ? QJsonDocument(v.toArray()) : QJsonDocument(v.toObject());
	out << QString::fromUtf8(doc.toJson(QJsonDocument::Indented));
}

int printStatus(const Status& st)
{
	printJson(JsonCodec::toJson(st));
	return st.ok() ? 0 : 1;
}

int usage(const QCommandLineParser& parser)
{
	QTextStream err(stderr);
	err << parser.helpText();
	return 2;
}

bool toId(const QString& s, qint64* out)
{
	bool ok = false;
	const qint64 v = s.toLongLong(&ok);
	if (ok && out) *out = v;
	return ok;
}

int cmdIngest(SpeakerIdentityService& svc, const QStringList& args)
{
	QFile f(args.value(0));
	if (!f.open(QIODevice::ReadOnly)) {
		qCritical() << "[ingest] open failed:" << f.fileName() << f.errorString();
		return 1;
	}
	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
	f.close();
	if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
		qCritical() << "[ingest] JSON parse error:" << perr.errorString();
		return 1;
	}

	IngestRequest req;
	QString error;
	if (!JsonCodec::parseIngest(doc.object(), &req, &error)) {
		qCritical() << "[ingest] invalid input:" << error;
		return 1;
	}

	qint64 mediaId = -1;
	Status st = svc.addMediaItem(req.title, &mediaId);
	if (!st.ok()) return printStatus(st);

	// 세그먼트는 화자 등록 전이면 label 로만 보관되고 등록 시 연결된다
	for (const auto& seg : req.segments) {
		st = svc.addTranscriptSegment(mediaId, seg.label, seg.start, seg.end, seg.text);
		if (!st.ok()) return printStatus(st);
	}

	const DiarizationReport report = svc.onDiarizationComplete(mediaId, req.speakers);
	printJson(JsonCodec::toJson(report));
	return report.failedCount == 0 ? 0 : 1;
}

int cmdVerify(SpeakerIdentityService& svc, const QStringList& args, const QCommandLineParser& parser)
{
	qint64 speakerId = -1;
	if (args.size() < 2 || !toId(args[0], &speakerId)) return usage(parser);

	VerifyAction action;
	const QString kind = args[1];
	if (kind == "accept") {
		qint64 pid = -1;
		if (args.size() < 3 || !toId(args[2], &pid)) return usage(parser);
		action = VerifyAction::accept(pid);
	} else if (kind == "reject") {
		action = VerifyAction::reject();
	} else if (kind == "create") {
		if (args.size() < 3) return usage(parser);
		action = VerifyAction::createProfile(args.mid(2).join(' '));
	} else {
		return usage(parser);
	}

	Profile p;
	RetroReport retro;
	const Status st = svc.verifySpeaker(speakerId, action, &p, &retro);
	if (!st.ok()) return printStatus(st);

	QJsonObject o{{"profile", JsonCodec::toJson(p)}};
	if (retro.profileId >= 0) o["retroactive"] = JsonCodec::toJson(retro);
	printJson(o);
	return 0;
}

} // namespace

int main(int argc, char *argv[])
{
		try {
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName("speaker_identity");

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));

				QCommandLineParser parser;
				parser.setApplicationDescription(
					"Cross-corpus speaker identity resolution.\n\n"
					"Commands:\n"
					"  ingest <media.json>\n"
					"  suggestions <mediaId>\n"
					"  occurrences <profileId>\n"
					"  verify <speakerId> accept <profileId> | reject | create <name>\n"
					"  status <speakerId>\n"
					"  rename <profileId> <name>\n"
					"  merge <targetId> <sourceId>...\n"
					"  profiles\n"
					"  delete-profile <profileId>\n"
					"  delete-media <mediaId>\n"
					"  check\n"
					"  logs [minLevel]\n"
					"  clear-logs");
				parser.addHelpOption();
				QCommandLineOption dbOpt("db", "SQLite database file.", "path");
				QCommandLineOption cfgOpt("config", "JSON config file.", "file");
				parser.addOption(dbOpt);
				parser.addOption(cfgOpt);
				parser.addPositionalArgument("command", "Command to run.");
				parser.process(app);

				// 설정: 기본값 -> config 파일 -> --db
				ServiceConfig cfg = ServiceConfig::defaults();
				const QString cfgFile = parser.isSet(cfgOpt) ? parser.value(cfgOpt) : ServiceConfig::defaultConfigFile();
				if (QFile::exists(cfgFile)) {
					QString err;
					if (!cfg.loadFromFile(cfgFile, &err) && parser.isSet(cfgOpt)) {
						qCritical() << "config load failed:" << err;
						return 2;
					}
				} else if (parser.isSet(cfgOpt)) {
					qCritical() << "config not found:" << cfgFile;
					return 2;
				}
				if (parser.isSet(dbOpt)) cfg.dbPath = parser.value(dbOpt);
				cfg.applyLoggingRules();

				QStringList args = parser.positionalArguments();
				if (args.isEmpty()) return usage(parser);
				const QString cmd = args.takeFirst();

				SpeakerIdentityService svc(cfg);
				if (!svc.initialize()) {
					qCritical() << "데이터베이스 초기화 실패";
					return -1;
				}

				// 시스템로거 준비
				SystemLogger::setPersistEnabled(cfg.persistLogs);
				SystemLogger::setPersistMinLevel(static_cast<SysLogLevel>(cfg.persistMinLevel));
				SystemLogger::init();
				struct LoggerScope {
					~LoggerScope()
					{
						SystemLogger::shutdown();
						if (SystemLogger::droppedCount() > 0)
							qWarning() << "[main] system log entries dropped:" << SystemLogger::droppedCount();
					}
				} loggerScope;

				int rc = 0;
				if (cmd == "ingest" && args.size() == 1) {
					rc = cmdIngest(svc, args);
				} else if (cmd == "suggestions" && args.size() == 1) {
					qint64 id = -1;
					if (!toId(args[0], &id)) return usage(parser);
					std::vector<SpeakerSuggestion> rows;
					const Status st = svc.listSuggestions(id, &rows);
					if (!st.ok()) return printStatus(st);
					printJson(JsonCodec::toJsonArray(rows));
				} else if (cmd == "occurrences" && args.size() == 1) {
					qint64 id = -1;
					if (!toId(args[0], &id)) return usage(parser);
					std::vector<CrossMediaOccurrence> rows;
					const Status st = svc.listCrossMediaOccurrences(id, &rows);
					if (!st.ok()) return printStatus(st);
					printJson(JsonCodec::toJsonArray(rows));
				} else if (cmd == "verify") {
					rc = cmdVerify(svc, args, parser);
				} else if (cmd == "status" && args.size() == 1) {
					qint64 id = -1;
					if (!toId(args[0], &id)) return usage(parser);
					QString text;
					const Status st = svc.profileStatus(id, &text);
					if (!st.ok()) return printStatus(st);
					printJson(QJsonObject{{"speaker_id", id}, {"status", text}});
				} else if (cmd == "rename" && args.size() >= 2) {
					qint64 id = -1;
					if (!toId(args[0], &id)) return usage(parser);
					Profile p;
					RetroReport retro;
					const Status st = svc.renameProfile(id, args.mid(1).join(' '), &p, &retro);
					if (!st.ok()) return printStatus(st);
					printJson(QJsonObject{{"profile", JsonCodec::toJson(p)},
										  {"retroactive", JsonCodec::toJson(retro)}});
				} else if (cmd == "merge" && args.size() >= 2) {
					qint64 target = -1;
					if (!toId(args[0], &target)) return usage(parser);
					std::vector<qint64> sources;
					for (const QString& a : args.mid(1)) {
						qint64 id = -1;
						if (!toId(a, &id)) return usage(parser);
						sources.push_back(id);
					}
					const MergeReport r = svc.mergeSpeakers(sources, target);
					printJson(JsonCodec::toJson(r));
					rc = r.outcome() == MergeOutcome::AllSucceeded ? 0 : 1;
				} else if (cmd == "profiles" && args.isEmpty()) {
					std::vector<Profile> rows;
					if (!svc.listProfiles(&rows)) return 1;
					printJson(JsonCodec::toJsonArray(rows));
				} else if (cmd == "delete-profile" && args.size() == 1) {
					qint64 id = -1;
					if (!toId(args[0], &id)) return usage(parser);
					rc = printStatus(svc.deleteProfile(id));
				} else if (cmd == "delete-media" && args.size() == 1) {
					qint64 id = -1;
					if (!toId(args[0], &id)) return usage(parser);
					rc = printStatus(svc.deleteMediaItem(id));
				} else if (cmd == "check" && args.isEmpty()) {
					QString report;
					const bool ok = svc.checkInvariants(&report);
					printJson(QJsonObject{{"ok", ok}, {"report", report}});
					rc = ok ? 0 : 1;
				} else if (cmd == "logs" && args.size() <= 1) {
					const int minLevel = args.isEmpty() ? 0 : args[0].toInt();
					QSqliteService db;
					QVector<SystemLog> rows;
					int total = 0;
					if (!db.selectSystemLogs(0, 200, minLevel, QString(), QString(), &rows, &total)) return 1;
					QJsonArray arr;
					for (const auto& r : rows) arr.append(JsonCodec::toJson(r));
					printJson(QJsonObject{{"total", total}, {"rows", arr}});
				} else if (cmd == "clear-logs" && args.isEmpty()) {
					QSqliteService db;
					rc = db.deleteSysLogs() ? 0 : 1;
				} else {
					return usage(parser);
				}
				return rc;
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}
