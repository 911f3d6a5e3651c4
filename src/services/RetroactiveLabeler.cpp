#include "services/RetroactiveLabeler.hpp"
#include "logger.hpp"

#include <algorithm>
#include <unordered_set>

namespace {

bool hasOtherMedia(const GalleryEntry& g, qint64 mediaItemId)
{
	return std::any_of(g.mediaItemIds.begin(), g.mediaItemIds.end(),
					   [mediaItemId](qint64 m) { return m != mediaItemId; });
}

} // namespace

RetroactiveLabeler::RetroactiveLabeler(ProfileStore& store, const SpeakerMatcher& matcher)
	: store_(store), matcher_(matcher)
{
}

RetroReport RetroactiveLabeler::run(qint64 profileId)
{
	RetroReport report;
	report.profileId = profileId;

	GalleryEntry target;
	Status st = store_.galleryEntry(profileId, &target);
	if (!st.ok()) {
		report.failures.push_back({-1, st});
		qCWarning(LC_RETRO) << "[Retro] profile" << profileId << st.toString();
		return report;
	}
	report.name = target.name;
	if (target.protos.empty()) return report;

	std::vector<PerFileSpeaker> pending;
	if (!store_.outstandingSpeakers(&pending)) {
		report.failures.push_back({-1, Status::error(ErrorCode::StorageError,
													 QStringLiteral("list outstanding speakers failed"))});
		return report;
	}

	for (const auto& s : pending) {
		if (s.profileId == target.profileId) continue;

		std::unordered_set<qint64> rejected;
		if (!store_.rejectedProfiles(s.id, &rejected)) {
			report.failures.push_back({s.id, Status::error(ErrorCode::StorageError,
														   QStringLiteral("select rejections failed"))});
			continue;
		}
		if (rejected.count(target.profileId)) {
			++report.skipped;
			continue;
		}

		Embedding e;
		st = store_.embeddings().getEmbedding(s.embeddingId, &e);
		if (!st.ok()) {
			// 미디어가 그새 삭제됨
			report.failures.push_back({s.id, st});
			continue;
		}

		// 같은 파일의 다른 라벨과만 겹치는 프로필은 비교 대상이 아님
		if (!hasOtherMedia(target, s.mediaItemId)) {
			++report.skipped;
			continue;
		}

		++report.scanned;
		MatchCandidate c;
		st = matcher_.scoreAgainstProfile(e.vector, target, &c, s.mediaItemId);
		if (!st.ok()) {
			report.failures.push_back({s.id, st});
			continue;
		}

		if (c.tier == Tier::High) {
			bool skipped = false;
			st = autoAttach(s.id, c.score, &target, &skipped);
			if (!st.ok()) report.failures.push_back({s.id, st});
			else if (skipped) ++report.skipped;
			else report.autoAttached.push_back(s.id);
		} else if (c.tier == Tier::Medium) {
			bool skipped = false;
			st = store_.setPendingSuggestion(s.id, target.profileId, c.score, c.rationale, true, &skipped);
			if (!st.ok()) report.failures.push_back({s.id, st});
			else if (skipped) ++report.skipped;
			else report.suggested.push_back(s.id);
		}
	}

	qCInfo(LC_RETRO) << "[Retro] profile" << profileId << report.name << "scanned=" << report.scanned
					 << "auto=" << report.autoAttached.size() << "suggested=" << report.suggested.size()
					 << "skipped=" << report.skipped << "failed=" << report.failures.size();
	return report;
}

Status RetroactiveLabeler::autoAttach(qint64 speakerId, double score, GalleryEntry* target, bool* skipped)
{
	AttachOptions opt;
	opt.assignment = SpeakerAssignment::AutoAttached;
	opt.verified = false;
	opt.confidence = score;
	opt.onlyIfOutstanding = true;

	Status st = store_.attachSpeaker(speakerId, target->profileId, opt, nullptr, skipped);
	if (st.code == ErrorCode::ProfileGone) {
		// 후속 프로필은 흡수된 임베딩을 모두 가지므로 최고 점수는 줄지 않는다
		qCInfo(LC_RETRO) << "[Retro] profile" << target->profileId << "merged into" << st.redirectTo;
		GalleryEntry successor;
		Status rd = store_.galleryEntry(st.redirectTo, &successor);
		if (!rd.ok()) return rd;
		*target = std::move(successor);
		st = store_.attachSpeaker(speakerId, target->profileId, opt, nullptr, skipped);
	}
	if (!st.ok() || (skipped && *skipped)) return st;

	// 새로 붙은 임베딩도 이후 비교에 포함
	GalleryEntry refreshed;
	if (store_.galleryEntry(target->profileId, &refreshed).ok()) *target = std::move(refreshed);
	return st;
}
