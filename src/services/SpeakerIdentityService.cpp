#include "services/SpeakerIdentityService.hpp"
#include "services/QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include "log/SystemLogger.hpp"
#include "logger.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>

SpeakerIdentityService::SpeakerIdentityService(const ServiceConfig& cfg, QObject* parent)
	: QObject(parent),
	  cfg_(cfg),
	  matcher_(TierPolicy(cfg.tiers), cfg.budget),
	  suggest_(store_, matcher_),
	  retro_(store_, matcher_),
	  merge_(store_, cfg.maxConflictRetries)
{
	qRegisterMetaType<DiarizationReport>("DiarizationReport");
	qRegisterMetaType<MergeReport>("MergeReport");
	qRegisterMetaType<Status>("Status");
}

SpeakerIdentityService::~SpeakerIdentityService()
{
	pool_.waitForDone();
}

bool SpeakerIdentityService::initialize()
{
	if (!cfg_.dbPath.isEmpty()) SqlCommon::setDbFilePath(cfg_.dbPath);

	QSqliteService db;
	if (!db.initializeDatabase()) {
		LOG_CRITICAL(QString("database init failed: %1").arg(SqlCommon::dbFilePath()));
		return false;
	}
	purgeRedirects();
	const int purgedLogs = db.purgeSystemLogsBefore(QDateTime::currentDateTime().addDays(-cfg_.logRetentionDays));
	if (purgedLogs < 0) qCWarning(LC_STORE) << "[Service] system log retention purge failed";
	LOG_INFO(QString("speaker identity ready, db=%1").arg(SqlCommon::dbFilePath()));
	return true;
}

Status SpeakerIdentityService::listSuggestions(qint64 mediaItemId, std::vector<SpeakerSuggestion>* out) const
{
	return suggest_.listSuggestions(mediaItemId, out);
}

Status SpeakerIdentityService::listCrossMediaOccurrences(qint64 profileId,
														 std::vector<CrossMediaOccurrence>* out) const
{
	return store_.occurrencesOf(profileId, out);
}

RetroReport SpeakerIdentityService::propagateName(qint64 profileId)
{
	RetroReport r = retro_.run(profileId);
	const QJsonObject extra{
		{"profile_id", profileId},
		{"auto_attached", static_cast<int>(r.autoAttached.size())},
		{"suggested", static_cast<int>(r.suggested.size())},
		{"failed", static_cast<int>(r.failures.size())},
	};
	if (r.failures.empty())
		SystemLogger::info(LogTag::Retro, QString("name \"%1\" propagated").arg(r.name), extra);
	else
		SystemLogger::warn(LogTag::Retro, QString("name \"%1\" propagated with failures").arg(r.name), extra);
	return r;
}

Status SpeakerIdentityService::verifySpeaker(qint64 speakerId, const VerifyAction& action, Profile* out,
											 RetroReport* retro)
{
	Profile p;
	Status st = suggest_.verifySpeaker(speakerId, action, &p);
	if (!st.ok()) {
		SystemLogger::warn(LogTag::Suggest, QString("verify speaker %1 failed: %2").arg(speakerId).arg(st.toString()));
		return st;
	}

	// 이름이 확정되면 나머지 코퍼스에 전파
	if (action.kind != VerifyAction::Kind::Reject && p.hasName()) {
		RetroReport r = propagateName(p.id);
		if (retro) *retro = r;
		if (!store_.getProfile(p.id, &p).ok())
			qCWarning(LC_SUGG) << "[Service] profile" << p.id << "vanished after propagation";
	}
	if (out) *out = p;
	return Status::success();
}

MergeReport SpeakerIdentityService::mergeSpeakers(const std::vector<qint64>& sourceIds, qint64 targetId)
{
	MergeReport r = merge_.merge(sourceIds, targetId);

	QJsonArray failed;
	for (const auto& f : r.failed) failed.append(QString("%1: %2").arg(f.name, f.status.toString()));
	const QJsonObject extra{
		{"target_id", targetId},
		{"succeeded", static_cast<int>(r.succeeded.size())},
		{"failed", failed},
	};

	switch (r.outcome()) {
		case MergeOutcome::AllSucceeded:
			SystemLogger::info(LogTag::Merge, QString("merged %1 profile(s) into %2")
											.arg(r.succeeded.size()).arg(r.targetName), extra);
			break;
		case MergeOutcome::Partial:
			SystemLogger::warn(LogTag::Merge, QString("partial merge into %1").arg(r.targetName), extra);
			break;
		case MergeOutcome::AllFailed:
			SystemLogger::error(LogTag::Merge, r.requestStatus.ok()
								? QString("merge into %1 failed").arg(targetId)
								: r.requestStatus.toString(), extra);
			break;
	}
	return r;
}

Status SpeakerIdentityService::renameProfile(qint64 profileId, const QString& name, Profile* out,
											 RetroReport* retro)
{
	Profile p;
	Status st = store_.renameProfile(profileId, name, &p);
	if (st.code == ErrorCode::ProfileGone) {
		qCInfo(LC_STORE) << "[Service] rename target" << profileId << "gone, retry on" << st.redirectTo;
		st = store_.renameProfile(st.redirectTo, name, &p);
	}
	if (!st.ok()) return st;

	SystemLogger::info(LogTag::Store, QString("profile %1 renamed to \"%2\"").arg(p.id).arg(p.displayName));
	emit profileRenamed(p.id, p.displayName);

	RetroReport r = propagateName(p.id);
	if (retro) *retro = r;
	if (!store_.getProfile(p.id, &p).ok())
		qCWarning(LC_STORE) << "[Service] profile" << p.id << "vanished after propagation";
	if (out) *out = p;
	return Status::success();
}

DiarizationReport SpeakerIdentityService::onDiarizationComplete(qint64 mediaItemId,
																const std::vector<DiarizedSpeaker>& speakers)
{
	DiarizationReport r = suggest_.processDiarization(mediaItemId, speakers);
	if (r.failedCount > 0)
		SystemLogger::warn(LogTag::Suggest, QString("media %1: %2 of %3 speakers failed")
									   .arg(mediaItemId).arg(r.failedCount).arg(speakers.size()));
	return r;
}

void SpeakerIdentityService::submitDiarizationJob(qint64 mediaItemId, const std::vector<DiarizedSpeaker>& speakers)
{
	pool_.start([this, mediaItemId, speakers]() {
		DiarizationReport r = onDiarizationComplete(mediaItemId, speakers);
		emit diarizationProcessed(r);
	});
}

bool SpeakerIdentityService::waitForJobs(int msecs)
{
	return pool_.waitForDone(msecs);
}

Status SpeakerIdentityService::addMediaItem(const QString& title, qint64* outId)
{
	return store_.addMediaItem(title, outId);
}

Status SpeakerIdentityService::addTranscriptSegment(qint64 mediaItemId, const QString& label, double start,
													double end, const QString& text)
{
	return store_.addTranscriptSegment(mediaItemId, label, start, end, text);
}

Status SpeakerIdentityService::deleteProfile(qint64 profileId)
{
	Status st = store_.deleteProfile(profileId);
	if (st.ok()) SystemLogger::info(LogTag::Store, QString("profile %1 deleted").arg(profileId));
	return st;
}

Status SpeakerIdentityService::deleteMediaItem(qint64 mediaItemId)
{
	Status st = store_.deleteMediaItem(mediaItemId);
	if (st.ok()) SystemLogger::info(LogTag::Store, QString("media %1 deleted").arg(mediaItemId));
	return st;
}

bool SpeakerIdentityService::listProfiles(std::vector<Profile>* out) const
{
	return store_.listProfiles(out);
}

Status SpeakerIdentityService::profileStatus(qint64 speakerId, QString* out) const
{
	PerFileSpeaker s;
	Status st = store_.speaker(speakerId, &s);
	if (!st.ok()) return st;

	QString text;
	if (s.verified) {
		text = QString("Verified as %1").arg(s.displayName.isEmpty() ? QString("#%1").arg(s.profileId)
																	 : s.displayName);
	} else {
		switch (s.assignment) {
			case SpeakerAssignment::AutoAttached:	text = QStringLiteral("High confidence match - click to verify"); break;
			case SpeakerAssignment::Pending:		text = QStringLiteral("Medium confidence match - review needed"); break;
			case SpeakerAssignment::Seeded:
			case SpeakerAssignment::Verified:		text = QStringLiteral("Needs identification"); break;
		}
	}
	if (out) *out = text;
	return Status::success();
}

bool SpeakerIdentityService::checkInvariants(QString* report) const
{
	return store_.verifyOwnershipInvariant(report);
}

int SpeakerIdentityService::purgeRedirects()
{
	const int n = store_.purgeExpiredRedirects(cfg_.redirectTtlSec);
	if (n > 0) SystemLogger::debug(LogTag::Store, QString("purged %1 expired redirect(s)").arg(n));
	return n;
}
