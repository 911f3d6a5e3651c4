#pragma once
#include <QObject>
#include <vector>

#include "include/types.hpp"
#include "include/recog_params.hpp"
#include "store/ProfileStore.hpp"

// N 개 프로필을 target 하나로 흡수
// 소스마다 독립 트랜잭션 -> 일부 성공 허용 (AllSucceeded / AllFailed / Partial)
class MergeEngine : public QObject {
	Q_OBJECT
public:
	explicit MergeEngine(ProfileStore& store, int maxConflictRetries = recog::MERGE_CONFLICT_RETRIES,
						 QObject* parent = nullptr);

	// target 이 sources 에 있거나 sources 가 비면 InvalidMergeRequest (아무것도 안 바뀜)
	MergeReport merge(const std::vector<qint64>& sources, qint64 targetId);

	void setMaxConflictRetries(int n) { maxConflictRetries_ = n < 0 ? 0 : n; }

signals:
	void sourceMerged(qint64 sourceId, bool ok);
	void mergeFinished(const MergeReport& report);

private:
	MergeSourceResult mergeOne(qint64 sourceId, qint64 targetId);
	Status absorb(qint64 sourceId, qint64 targetId, MergeSourceResult* res);

	ProfileStore& store_;
	int maxConflictRetries_;
};
