#pragma once
#include <unordered_set>
#include <vector>
#include <opencv2/core.hpp>

#include "include/types.hpp"
#include "include/recog_params.hpp"
#include "match/TierPolicy.hpp"

// 스캔 시간 예산: base + perEmbedding * (갤러리 임베딩 수)
struct MatchBudget {
	int baseMs          = recog::MATCH_BASE_BUDGET_MS;
	int perEmbeddingUs  = recog::MATCH_PER_EMB_BUDGET_US;
};

// 코사인 기반 전수 스캔 매칭기. 갤러리는 호출 시점에 받아온다(소유권 없음)
// 프로필 점수 = 소유 임베딩 중 최고 점수 (삽입 순서와 무관)
class SpeakerMatcher {
	public:
		SpeakerMatcher() = default;
		SpeakerMatcher(const TierPolicy& policy, const MatchBudget& budget)
			: m_policy(policy), m_budget(budget) {}

		// 점수 내림차순 (동점은 profile id 오름차순). cutoff 없음
		// 빈 갤러리 -> 빈 결과. 예산 초과 -> 부분 결과 + timedOut
		// queryMediaItemId >= 0 이면 같은 미디어의 임베딩은 비교하지 않는다
		Status rank(const std::vector<float>& query,
					const std::vector<GalleryEntry>& gallery,
					MatchRanking* out,
					const std::unordered_set<qint64>& exclude = {},
					qint64 queryMediaItemId = -1) const;

		// 프로필 1개에 대한 점수 (RetroactiveLabeler)
		Status scoreAgainstProfile(const std::vector<float>& query,
								   const GalleryEntry& profile,
								   MatchCandidate* out,
								   qint64 queryMediaItemId = -1) const;

		// (cos + 1) / 2, 두 입력 모두 L2 정규화된 1xD CV_32F
		static float similarity(const cv::Mat& q, const cv::Mat& proto);
		static Status normalizedQuery(const std::vector<float>& query, cv::Mat* out);

		const TierPolicy& policy() const { return m_policy; }
		void setPolicy(const TierPolicy& p) { m_policy = p; }
		void setBudget(const MatchBudget& b) { m_budget = b; }

	private:
		bool scoreEntry(const cv::Mat& q, const GalleryEntry& g, qint64 skipMediaItemId, MatchCandidate* out) const;

		TierPolicy m_policy;
		MatchBudget m_budget;
};
