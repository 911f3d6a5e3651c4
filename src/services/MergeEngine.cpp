#include "services/MergeEngine.hpp"
#include "services/SqlCommon.hpp"
#include "logger.hpp"

#include <algorithm>

using namespace SqlCommon;

namespace {

QString labelOf(const Profile& p)
{
	return p.hasName() ? p.displayName : QString("#%1").arg(p.id);
}

} // namespace

MergeEngine::MergeEngine(ProfileStore& store, int maxConflictRetries, QObject* parent)
	: QObject(parent), store_(store), maxConflictRetries_(maxConflictRetries < 0 ? 0 : maxConflictRetries)
{
}

MergeReport MergeEngine::merge(const std::vector<qint64>& sources, qint64 targetId)
{
	MergeReport report;
	report.targetId = targetId;

	if (sources.empty()) {
		report.requestStatus = Status::error(ErrorCode::InvalidMergeRequest, QStringLiteral("no source profiles"));
	} else if (std::find(sources.begin(), sources.end(), targetId) != sources.end()) {
		report.requestStatus = Status::error(ErrorCode::InvalidMergeRequest,
											 QString("target %1 is listed as a source").arg(targetId));
	}
	if (!report.requestStatus.ok()) {
		qCWarning(LC_MERGE) << "[Merge] rejected:" << report.requestStatus.toString();
		emit mergeFinished(report);
		return report;
	}

	Profile target;
	if (store_.getProfile(targetId, &target).ok()) report.targetName = labelOf(target);

	for (qint64 src : sources) {
		MergeSourceResult r = mergeOne(src, targetId);
		const bool ok = r.status.ok();
		if (ok) report.succeeded.push_back(r);
		else report.failed.push_back(r);
		emit sourceMerged(src, ok);
	}

	qCInfo(LC_MERGE) << "[Merge] into" << targetId << report.targetName << mergeOutcomeName(report.outcome())
					 << "ok=" << report.succeeded.size() << "failed=" << report.failed.size();
	emit mergeFinished(report);
	return report;
}

MergeSourceResult MergeEngine::mergeOne(qint64 sourceId, qint64 targetId)
{
	MergeSourceResult res;
	res.profileId = sourceId;
	res.name = QString("#%1").arg(sourceId);

	for (int attempt = 0; ; ++attempt) {
		res.movedEmbeddings = 0;
		res.movedSegments = 0;
		res.status = absorb(sourceId, targetId, &res);
		if (res.status.code != ErrorCode::ConcurrentModificationConflict || attempt >= maxConflictRetries_) break;
		qCDebug(LC_MERGE) << "[Merge] conflict on" << sourceId << "retry" << attempt + 1;
	}
	if (!res.status.ok())
		qCWarning(LC_MERGE) << "[Merge] source" << sourceId << "failed:" << res.status.toString();
	return res;
}

Status MergeEngine::absorb(qint64 sourceId, qint64 targetId, MergeSourceResult* res)
{
	ProfileLockTable::Guard guard = store_.locks().lockMany({sourceId, targetId});
	QSqlDatabase db = ensureOpenConnectionForThisThread();
	SqlTransaction tx(db);
	if (!tx.isActive()) return Status::error(ErrorCode::StorageError, "begin failed: " + tx.lastError());

	Profile src;
	if (!store_.profileRow(sourceId, &src)) {
		// 이미 흡수된 소스: target 은 건드리지 않음
		const Status gone = store_.missingProfileStatus(sourceId);
		if (gone.code == ErrorCode::ProfileGone)
			return Status::error(ErrorCode::NotFound,
								 QString("profile %1 already merged into %2").arg(sourceId).arg(gone.redirectTo));
		return gone;
	}
	res->name = labelOf(src);

	Profile target;
	if (!store_.profileRow(targetId, &target)) return store_.missingProfileStatus(targetId);

	Status st = store_.bumpVersion(sourceId, src.version);
	if (!st.ok()) return st;

	const int movedEmb = store_.embeddings().reassignOwner(sourceId, targetId);
	if (movedEmb < 0) return Status::error(ErrorCode::StorageError, QStringLiteral("reassign embeddings failed"));
	const int movedSeg = store_.transcripts().reassignSegments(sourceId, targetId);
	if (movedSeg < 0) return Status::error(ErrorCode::StorageError, QStringLiteral("reassign segments failed"));

	if (target.hasName() && !store_.transcripts().renameSpeakersOfProfile(targetId, target.displayName))
		return Status::error(ErrorCode::StorageError, QStringLiteral("rename absorbed speakers failed"));
	if (store_.transcripts().redirectSuggestions(sourceId, targetId) < 0)
		return Status::error(ErrorCode::StorageError, QStringLiteral("redirect suggestions failed"));
	if (!store_.transcripts().reassignRejections(sourceId, targetId))
		return Status::error(ErrorCode::StorageError, QStringLiteral("reassign rejections failed"));
	if (store_.transcripts().settleSpeakersOfProfile(targetId) < 0)
		return Status::error(ErrorCode::StorageError, QStringLiteral("settle speakers failed"));

	if (!store_.insertRedirect(sourceId, targetId))
		return Status::error(ErrorCode::StorageError, QStringLiteral("insert redirect failed"));
	if (!store_.deleteProfileRow(sourceId))
		return Status::error(ErrorCode::StorageError, QString("delete profile %1 failed").arg(sourceId));

	if (!store_.recomputeStats(targetId))
		return Status::error(ErrorCode::StorageError, QStringLiteral("recompute target stats failed"));
	st = store_.bumpVersion(targetId, target.version);
	if (!st.ok()) return st;

	if (!tx.commit()) return Status::error(ErrorCode::StorageError, "commit failed: " + tx.lastError());

	res->movedEmbeddings = movedEmb;
	res->movedSegments = movedSeg;
	qCDebug(LC_MERGE) << "[Merge]" << sourceId << "->" << targetId << "embeddings=" << movedEmb
					  << "segments=" << movedSeg;
	return Status::success();
}
