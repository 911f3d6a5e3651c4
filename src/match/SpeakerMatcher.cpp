#include "match/SpeakerMatcher.hpp"
#include "logger.hpp"

#include <QElapsedTimer>
#include <algorithm>
#include <cmath>

Status SpeakerMatcher::normalizedQuery(const std::vector<float>& query, cv::Mat* out)
{
	if (query.empty())
		return Status::error(ErrorCode::InvalidEmbedding, QStringLiteral("zero-length query embedding"));
	for (float x : query) {
		if (!std::isfinite(x))
			return Status::error(ErrorCode::InvalidEmbedding, QStringLiteral("query embedding contains NaN/Inf"));
	}

	const int dim = (int)query.size();
	cv::Mat q(1, dim, CV_32F, const_cast<float*>(query.data()));
	q = q.clone();
	const double nq = cv::norm(q, cv::NORM_L2);
	if (!(nq > 0.0))
		return Status::error(ErrorCode::InvalidEmbedding, QStringLiteral("zero-norm query embedding"));
	q /= nq;
	if (out) *out = q;
	return Status::success();
}

float SpeakerMatcher::similarity(const cv::Mat& q, const cv::Mat& proto)
{
	double cosv = q.dot(proto);
	cosv = std::max(-1.0, std::min(1.0, cosv));
	return static_cast<float>((cosv + 1.0) / 2.0);
}

bool SpeakerMatcher::scoreEntry(const cv::Mat& q, const GalleryEntry& g, qint64 skipMediaItemId,
								MatchCandidate* out) const
{
	const int dim = q.cols;
	float best = -1.0f;
	int bestIdx = -1;

	for (int i = 0; i < (int)g.protos.size(); ++i) {
		// 한 파일 안의 다른 라벨은 diarization 이 이미 구분한 화자
		if (skipMediaItemId >= 0 && i < (int)g.mediaItemIds.size() && g.mediaItemIds[i] == skipMediaItemId)
			continue;
		const cv::Mat& p = g.protos[i];
		if (p.empty() || p.type() != CV_32F || p.total() != (size_t)dim) {
			qCWarning(LC_MATCH) << "[SpeakerMatcher] dim mismatch profile=" << g.profileId
								<< "embedding=" << (i < (int)g.embeddingIds.size() ? g.embeddingIds[i] : -1);
			continue;
		}
		const float s = similarity(q, p);
		// 동점이면 먼저 들어온(작은 id) 임베딩 유지
		if (s > best) {
			best = s;
			bestIdx = i;
		}
	}
	if (bestIdx < 0) return false;

	out->profileId = g.profileId;
	out->profileName = g.name;
	out->score = best;
	out->embeddingCount = (int)g.protos.size();
	out->bestEmbeddingId = bestIdx < (int)g.embeddingIds.size() ? g.embeddingIds[bestIdx] : -1;
	const qint64 bestMedia = bestIdx < (int)g.mediaItemIds.size() ? g.mediaItemIds[bestIdx] : -1;
	m_policy.annotate(out, bestMedia);
	return true;
}

Status SpeakerMatcher::rank(const std::vector<float>& query,
							const std::vector<GalleryEntry>& gallery,
							MatchRanking* out,
							const std::unordered_set<qint64>& exclude,
							qint64 queryMediaItemId) const
{
	if (!out) return Status::error(ErrorCode::InvalidArgument, QStringLiteral("null output"));
	*out = MatchRanking{};

	cv::Mat q;
	Status st = normalizedQuery(query, &q);
	if (!st.ok()) {
		qCWarning(LC_MATCH) << "[SpeakerMatcher]" << st.toString();
		return st;
	}
	if (gallery.empty()) {
		qCDebug(LC_MATCH) << "[SpeakerMatcher] gallery is empty";
		return Status::success();
	}

	qint64 total = 0;
	for (const auto& g : gallery) total += (qint64)g.protos.size();
	const qint64 budgetUs = (qint64)m_budget.baseMs * 1000 + (qint64)m_budget.perEmbeddingUs * total;

	QElapsedTimer timer;
	timer.start();

	for (size_t i = 0; i < gallery.size(); ++i) {
		const auto& g = gallery[i];
		if (exclude.count(g.profileId)) continue;

		MatchCandidate c;
		if (scoreEntry(q, g, queryMediaItemId, &c)) out->candidates.push_back(c);
		++out->scannedProfiles;

		// 프로필 1개 끝날 때마다 예산 확인. 남은 게 있을 때만 timedOut
		if (i + 1 < gallery.size() && timer.nsecsElapsed() / 1000 >= budgetUs) {
			out->timedOut = true;
			qCWarning(LC_MATCH) << "[SpeakerMatcher] budget" << budgetUs << "us exceeded after"
								<< out->scannedProfiles << "/" << gallery.size() << "profiles";
			break;
		}
	}

	std::sort(out->candidates.begin(), out->candidates.end(),
			  [](const MatchCandidate& a, const MatchCandidate& b) {
				  if (a.score != b.score) return a.score > b.score;
				  return a.profileId < b.profileId;
			  });

	if (!out->candidates.empty()) {
		qCDebug(LC_MATCH) << "[SpeakerMatcher] best:" << out->candidates.front().profileId
						  << "score=" << out->candidates.front().score
						  << "candidates=" << out->candidates.size();
	}
	return Status::success();
}

Status SpeakerMatcher::scoreAgainstProfile(const std::vector<float>& query,
										   const GalleryEntry& profile,
										   MatchCandidate* out,
										   qint64 queryMediaItemId) const
{
	cv::Mat q;
	Status st = normalizedQuery(query, &q);
	if (!st.ok()) return st;

	MatchCandidate c;
	if (!scoreEntry(q, profile, queryMediaItemId, &c))
		return Status::error(ErrorCode::NotFound,
							 QString("profile %1 has no comparable embedding").arg(profile.profileId));
	if (out) *out = c;
	return Status::success();
}
