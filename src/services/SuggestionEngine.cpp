#include "services/SuggestionEngine.hpp"
#include "logger.hpp"

#include <unordered_set>

SuggestionEngine::SuggestionEngine(ProfileStore& store, const SpeakerMatcher& matcher)
	: store_(store), matcher_(matcher)
{
}

ClassificationOutcome SuggestionEngine::processSpeaker(qint64 mediaItemId, const DiarizedSpeaker& speaker)
{
	ClassificationOutcome out;
	out.label = speaker.label;

	out.status = EmbeddingStore::validateVector(speaker.embedding);
	if (!out.status.ok()) {
		qCWarning(LC_SUGG) << "[Suggest] reject" << speaker.label << out.status.toString();
		return out;
	}

	// 재시도된 job: 이미 소유자가 있으면 재분류하지 않음
	Embedding existing;
	if (store_.embeddings().findEmbedding(mediaItemId, speaker.label, &existing).ok()) {
		PerFileSpeaker s;
		out.status = store_.transcripts().findSpeaker(mediaItemId, speaker.label, &s);
		out.alreadyProcessed = true;
		out.speakerId = s.id;
		out.profileId = s.profileId;
		out.assignment = s.assignment;
		out.tier = policy().classify(s.confidence);
		qCDebug(LC_SUGG) << "[Suggest]" << mediaItemId << speaker.label << "already processed";
		return out;
	}

	// 매처 실패/타임아웃 -> 제안 없이 seed 로 진행
	MatchRanking ranking;
	std::vector<GalleryEntry> gallery;
	if (!store_.galleryEntries(&gallery)) {
		out.degraded = true;
		qCWarning(LC_SUGG) << "[Suggest] gallery unavailable, seeding" << speaker.label;
	} else {
		Status st = matcher_.rank(speaker.embedding, gallery, &ranking, {}, mediaItemId);
		if (!st.ok()) {
			out.degraded = true;
			qCWarning(LC_SUGG) << "[Suggest] matcher failed:" << st.toString();
		} else if (ranking.timedOut) {
			out.degraded = true;
		}
	}

	for (const auto& c : ranking.candidates) {
		if (c.tier != Tier::Low) out.alternatives.push_back(c);
	}

	SpeakerRegistration req;
	req.mediaItemId = mediaItemId;
	req.label = speaker.label;
	req.vector = speaker.embedding;

	if (!out.degraded && !ranking.candidates.empty()) {
		const MatchCandidate& top = ranking.candidates.front();
		out.tier = top.tier;
		if (top.tier == Tier::High) {
			req.attachProfileId = top.profileId;
			req.confidence = top.score;
		} else if (top.tier == Tier::Medium) {
			req.suggestedProfileId = top.profileId;
			req.suggestedScore = top.score;
			req.suggestedRationale = top.rationale;
			out.suggestion = top;
		}
	}

	PerFileSpeaker s;
	bool already = false;
	Status st = store_.registerSpeaker(req, &s, &already);
	if (st.code == ErrorCode::ProfileGone && req.attachProfileId >= 0) {
		// 병합으로 흡수된 프로필 -> 1회 재해석 후 재시도
		qCInfo(LC_SUGG) << "[Suggest] target" << req.attachProfileId << "gone, retry on" << st.redirectTo;
		req.attachProfileId = st.redirectTo;
		st = store_.registerSpeaker(req, &s, &already);
	}
	if ((st.code == ErrorCode::ProfileGone || st.code == ErrorCode::NotFound) && req.attachProfileId >= 0) {
		qCWarning(LC_SUGG) << "[Suggest] attach target vanished, seeding" << speaker.label << st.toString();
		req.attachProfileId = -1;
		req.confidence = 1.0;
		out.degraded = true;
		out.tier = Tier::Low;
		st = store_.registerSpeaker(req, &s, &already);
	}

	out.status = st;
	if (!st.ok()) {
		qCWarning(LC_SUGG) << "[Suggest] register failed" << mediaItemId << speaker.label << st.toString();
		return out;
	}

	out.alreadyProcessed = already;
	out.speakerId = s.id;
	out.profileId = s.profileId;
	out.assignment = s.assignment;
	if (s.assignment != SpeakerAssignment::Pending) out.suggestion.reset();

	qCInfo(LC_SUGG) << "[Suggest]" << mediaItemId << speaker.label << "->" << assignmentName(s.assignment)
					<< "profile=" << s.profileId << "tier=" << tierName(out.tier);
	return out;
}

DiarizationReport SuggestionEngine::processDiarization(qint64 mediaItemId,
													   const std::vector<DiarizedSpeaker>& speakers)
{
	DiarizationReport report;
	report.mediaItemId = mediaItemId;
	for (const auto& sp : speakers) {
		ClassificationOutcome o = processSpeaker(mediaItemId, sp);
		if (!o.status.ok()) ++report.failedCount;
		report.outcomes.push_back(std::move(o));
	}
	return report;
}

Status SuggestionEngine::listSuggestions(qint64 mediaItemId, std::vector<SpeakerSuggestion>* out) const
{
	if (!out) return Status::error(ErrorCode::InvalidArgument, QStringLiteral("null output"));
	Status st = store_.mediaItem(mediaItemId, nullptr);
	if (!st.ok()) return st;

	std::vector<PerFileSpeaker> speakers;
	if (!store_.speakersOfMedia(mediaItemId, &speakers))
		return Status::error(ErrorCode::StorageError, QStringLiteral("list speakers failed"));

	out->clear();
	std::vector<GalleryEntry> gallery;
	bool galleryLoaded = false;

	for (const auto& s : speakers) {
		if (!s.outstanding()) {
			Profile p;
			if (!store_.getProfile(s.profileId, &p).ok()) continue;

			SpeakerSuggestion row;
			row.speakerId = s.id;
			row.perFileLabel = s.label;
			row.profileId = p.id;
			row.profileName = p.displayName;
			row.score = s.confidence;
			row.tier = policy().classify(s.confidence);
			row.autoAccepted = s.assignment == SpeakerAssignment::AutoAttached;
			row.verified = s.verified;
			if (s.verified) {
				row.rationale = QStringLiteral("Verified by user");
			} else {
				MatchCandidate c;
				c.profileId = p.id;
				c.profileName = p.displayName;
				c.score = static_cast<float>(s.confidence);
				c.embeddingCount = (int)p.embeddingIds.size();
				row.rationale = policy().rationale(c, -1);
			}
			out->push_back(row);
			continue;
		}

		if (!galleryLoaded) {
			if (!store_.galleryEntries(&gallery))
				return Status::error(ErrorCode::StorageError, QStringLiteral("gallery unavailable"));
			galleryLoaded = true;
		}

		Embedding e;
		st = store_.embeddings().getEmbedding(s.embeddingId, &e);
		if (!st.ok()) return st;

		std::unordered_set<qint64> exclude;
		if (!store_.rejectedProfiles(s.id, &exclude))
			return Status::error(ErrorCode::StorageError, QStringLiteral("select rejections failed"));
		exclude.insert(s.profileId);

		MatchRanking ranking;
		st = matcher_.rank(e.vector, gallery, &ranking, exclude, s.mediaItemId);
		if (!st.ok()) {
			qCWarning(LC_SUGG) << "[Suggest] ranking failed for speaker" << s.id << st.toString();
			continue;
		}
		for (const auto& c : ranking.candidates) {
			if (c.tier == Tier::Low) break;
			SpeakerSuggestion row;
			row.speakerId = s.id;
			row.perFileLabel = s.label;
			row.profileId = c.profileId;
			row.profileName = c.profileName;
			row.score = c.score;
			row.tier = c.tier;
			row.rationale = c.rationale;
			out->push_back(row);
		}
	}
	return Status::success();
}

bool SuggestionEngine::scoreSpeakerAgainst(const PerFileSpeaker& s, qint64 profileId, double* out) const
{
	Embedding e;
	GalleryEntry g;
	MatchCandidate c;
	if (!store_.embeddings().getEmbedding(s.embeddingId, &e).ok()) return false;
	if (!store_.galleryEntry(profileId, &g).ok()) return false;
	if (!matcher_.scoreAgainstProfile(e.vector, g, &c).ok()) return false;
	*out = c.score;
	return true;
}

Status SuggestionEngine::acceptInto(qint64 speakerId, qint64 profileId, PerFileSpeaker* out)
{
	PerFileSpeaker s;
	Status st = store_.speaker(speakerId, &s);
	if (!st.ok()) return st;

	qint64 live = -1;
	st = store_.resolveProfile(profileId, &live);
	if (!st.ok()) return st;

	AttachOptions opt;
	opt.assignment = SpeakerAssignment::Verified;
	opt.verified = true;
	opt.confidence = s.confidence;		// 점수 계산 실패 시 기존 값 유지
	opt.promoteTarget = ProfileState::Verified;
	double score = 0.0;
	if (scoreSpeakerAgainst(s, live, &score)) opt.confidence = score;

	st = store_.attachSpeaker(speakerId, live, opt, out);
	if (st.code == ErrorCode::ProfileGone) {
		qCInfo(LC_SUGG) << "[Suggest] accept target" << live << "gone, retry on" << st.redirectTo;
		if (scoreSpeakerAgainst(s, st.redirectTo, &score)) opt.confidence = score;
		st = store_.attachSpeaker(speakerId, st.redirectTo, opt, out);
	}
	return st;
}

Status SuggestionEngine::verifySpeaker(qint64 speakerId, const VerifyAction& action, Profile* out)
{
	switch (action.kind) {
		case VerifyAction::Kind::Accept: {
			PerFileSpeaker s;
			Status st = acceptInto(speakerId, action.profileId, &s);
			if (!st.ok()) return st;
			qCInfo(LC_SUGG) << "[Suggest] speaker" << speakerId << "accepted into" << s.profileId;
			return store_.getProfile(s.profileId, out);
		}
		case VerifyAction::Kind::Reject: {
			Status st = store_.rejectSuggestion(speakerId, out);
			if (st.ok()) qCInfo(LC_SUGG) << "[Suggest] speaker" << speakerId << "suggestion rejected";
			return st;
		}
		case VerifyAction::Kind::CreateProfile:
			return store_.nameSpeakerProfile(speakerId, action.name, out);
	}
	return Status::error(ErrorCode::InvalidArgument, QStringLiteral("unknown verify action"));
}
