#pragma once
#include "include/types.hpp"
#include "include/recog_params.hpp"

// 등급 경계 (필요시 setParams로 변경 가능)
struct TierParams {
	double high   = recog::HIGH_THR;		// 이 이상이면 High (자동 연결)
	double medium = recog::MEDIUM_THR;		// 이 이상이면 Medium (제안)
};

class TierPolicy {
public:
	TierPolicy() = default;
	explicit TierPolicy(const TierParams& p): p_(p) {}

	// 경계 비교는 정확히 (epsilon 없음)
	Tier classify(double score) const;

	// tier + rationale 채움
	void annotate(MatchCandidate* c, qint64 bestMediaItemId) const;
	QString rationale(const MatchCandidate& c, qint64 bestMediaItemId) const;

	const TierParams& params() const { return p_; }
	void setParams(const TierParams& p) { p_ = p; }

private:
	TierParams p_;
};
