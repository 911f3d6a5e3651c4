#include "test_support.hpp"

using namespace testsupport;

namespace {

AttachOptions verifiedAttach()
{
	AttachOptions opt;
	opt.promoteTarget = ProfileState::Verified;
	return opt;
}

} // namespace

int main(int argc, char** argv)
{
	return runAll(argc, argv, {
		{"new speaker owns a private seed profile", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m = newMedia(store, "ep1");
			REQUIRE(m >= 0);

			const PerFileSpeaker s = seedSpeaker(store, m, "SPEAKER_00", {1.0f, 0.0f});
			REQUIRE(s.id >= 0);
			REQUIRE(s.assignment == SpeakerAssignment::Seeded);
			REQUIRE(!s.verified);

			Profile p;
			REQUIRE(store.getProfile(s.profileId, &p).ok());
			REQUIRE(p.state == ProfileState::Unverified);
			REQUIRE(!p.hasName());
			REQUIRE(p.embeddingIds.size() == 1);
			REQUIRE(p.embeddingIds[0] == s.embeddingId);
			REQUIRE(profileCount(store) == 1);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"re-registering the same speaker is a no-op", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m = newMedia(store, "ep1");
			const PerFileSpeaker first = seedSpeaker(store, m, "SPEAKER_00", {1.0f, 0.0f});

			SpeakerRegistration again;
			again.mediaItemId = m;
			again.label = "SPEAKER_00";
			again.vector = {0.0f, 1.0f};
			PerFileSpeaker second;
			bool already = false;
			REQUIRE(store.registerSpeaker(again, &second, &already).ok());
			REQUIRE(already);
			REQUIRE(second.id == first.id);
			REQUIRE(second.profileId == first.profileId);
			REQUIRE(profileCount(store) == 1);
		}},
		{"malformed embeddings are rejected", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m = newMedia(store, "ep1");

			SpeakerRegistration req;
			req.mediaItemId = m;
			req.label = "SPEAKER_00";
			bool already = false;
			REQUIRE(store.registerSpeaker(req, nullptr, &already).code == ErrorCode::InvalidEmbedding);
			req.vector = {0.0f, 0.0f, 0.0f};
			REQUIRE(store.registerSpeaker(req, nullptr, &already).code == ErrorCode::InvalidEmbedding);
			REQUIRE(profileCount(store) == 0);
		}},
		{"unknown media item", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			SpeakerRegistration req;
			req.mediaItemId = 42;
			req.label = "SPEAKER_00";
			req.vector = {1.0f};
			bool already = false;
			REQUIRE(store.registerSpeaker(req, nullptr, &already).code == ErrorCode::NotFound);
			REQUIRE(profileCount(store) == 0);
		}},
		{"attaching the last speaker releases the seed with a redirect", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, m2, "SPEAKER_01", {0.9f, 0.1f});
			const qint64 oldSeed = b.profileId;

			PerFileSpeaker moved;
			REQUIRE(store.attachSpeaker(b.id, a.profileId, verifiedAttach(), &moved).ok());
			REQUIRE(moved.profileId == a.profileId);
			REQUIRE(moved.verified);
			REQUIRE(moved.assignment == SpeakerAssignment::Verified);
			REQUIRE(embeddingCount(store, a.profileId) == 2);
			REQUIRE(profileCount(store) == 1);

			Profile target;
			REQUIRE(store.getProfile(a.profileId, &target).ok());
			REQUIRE(target.state == ProfileState::Verified);

			const Status read = store.getProfile(oldSeed, nullptr);
			REQUIRE(read.code == ErrorCode::NotFound);
			REQUIRE(read.message.contains("merged into"));

			const Status gone = store.missingProfileStatus(oldSeed);
			REQUIRE(gone.code == ErrorCode::ProfileGone);
			REQUIRE(gone.redirectTo == a.profileId);

			qint64 live = -1;
			REQUIRE(store.resolveProfile(oldSeed, &live).ok());
			REQUIRE(live == a.profileId);
			REQUIRE(store.missingProfileStatus(9999).code == ErrorCode::NotFound);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"attach into a missing profile", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m = newMedia(store, "ep1");
			const PerFileSpeaker a = seedSpeaker(store, m, "SPEAKER_00", {1.0f, 0.0f});
			REQUIRE(store.attachSpeaker(a.id, 777, verifiedAttach()).code == ErrorCode::NotFound);
			REQUIRE(embeddingCount(store, a.profileId) == 1);
		}},
		{"segments stored before the speaker are bound on registration", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m = newMedia(store, "ep1");
			REQUIRE(store.addTranscriptSegment(m, "SPEAKER_00", 0.0, 2.5, "hello").ok());
			REQUIRE(store.addTranscriptSegment(m, "SPEAKER_00", 3.0, 4.0, "again").ok());
			REQUIRE(store.addTranscriptSegment(m, "SPEAKER_00", 5.0, 4.0, "bad").code == ErrorCode::InvalidArgument);
			REQUIRE(store.addTranscriptSegment(99, "SPEAKER_00", 0.0, 1.0, "x").code == ErrorCode::NotFound);

			const PerFileSpeaker s = seedSpeaker(store, m, "SPEAKER_00", {1.0f, 0.0f});
			std::vector<TranscriptSegment> segs;
			REQUIRE(store.segmentsOfProfile(s.profileId, &segs));
			REQUIRE(segs.size() == 2);
			for (const auto& seg : segs) REQUIRE(seg.speakerId == s.id);

			// 등록 후 들어온 세그먼트는 바로 소유자에 반영
			REQUIRE(store.addTranscriptSegment(m, "SPEAKER_00", 10.0, 11.5, "late").ok());
			Profile p;
			REQUIRE(store.getProfile(s.profileId, &p).ok());
			REQUIRE(p.segmentCount == 3);
			REQUIRE(near(p.talkTime, 4.0));
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"rename trims and verifies", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m = newMedia(store, "ep1");
			const PerFileSpeaker s = seedSpeaker(store, m, "SPEAKER_00", {1.0f, 0.0f});

			Profile p;
			REQUIRE(store.renameProfile(s.profileId, "   ", &p).code == ErrorCode::InvalidArgument);
			REQUIRE(store.renameProfile(s.profileId, "  Bob ", &p).ok());
			REQUIRE(p.displayName == "Bob");
			REQUIRE(p.state == ProfileState::Verified);

			PerFileSpeaker after;
			REQUIRE(store.speaker(s.id, &after).ok());
			REQUIRE(after.displayName == "Bob");
			REQUIRE(after.assignment == SpeakerAssignment::Verified);
			REQUIRE(after.verified);
			REQUIRE(store.renameProfile(555, "Nobody", &p).code == ErrorCode::NotFound);
		}},
		{"version check rejects stale writers", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m = newMedia(store, "ep1");
			const PerFileSpeaker s = seedSpeaker(store, m, "SPEAKER_00", {1.0f, 0.0f});
			Profile p;
			REQUIRE(store.getProfile(s.profileId, &p).ok());
			REQUIRE(store.bumpVersion(s.profileId, p.version + 5).code == ErrorCode::ConcurrentModificationConflict);
			REQUIRE(store.bumpVersion(s.profileId, p.version).ok());
			Profile q;
			REQUIRE(store.getProfile(s.profileId, &q).ok());
			REQUIRE(q.version == p.version + 1);
		}},
		{"deleting a profile reseeds its speakers", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, m2, "SPEAKER_00", {0.9f, 0.1f});
			REQUIRE(store.attachSpeaker(b.id, a.profileId, verifiedAttach()).ok());
			REQUIRE(store.addTranscriptSegment(m2, "SPEAKER_00", 0.0, 1.0, "x").ok());

			REQUIRE(store.deleteProfile(a.profileId).ok());
			REQUIRE(store.getProfile(a.profileId, nullptr).code == ErrorCode::NotFound);

			PerFileSpeaker a2, b2;
			REQUIRE(store.speaker(a.id, &a2).ok());
			REQUIRE(store.speaker(b.id, &b2).ok());
			REQUIRE(a2.profileId != b2.profileId);
			REQUIRE(a2.assignment == SpeakerAssignment::Seeded);
			REQUIRE(!b2.verified);
			REQUIRE(embeddingCount(store, a2.profileId) == 1);
			REQUIRE(embeddingCount(store, b2.profileId) == 1);
			REQUIRE(profileCount(store) == 2);

			Profile bp;
			REQUIRE(store.getProfile(b2.profileId, &bp).ok());
			REQUIRE(bp.segmentCount == 1);
			REQUIRE(store.verifyOwnershipInvariant());
			REQUIRE(store.deleteProfile(a.profileId).code == ErrorCode::NotFound);
		}},
		{"deleting media drops its embeddings and empty profiles", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, m2, "SPEAKER_00", {0.9f, 0.1f});
			seedSpeaker(store, m2, "SPEAKER_01", {0.0f, 1.0f});
			REQUIRE(store.attachSpeaker(b.id, a.profileId, verifiedAttach()).ok());
			REQUIRE(profileCount(store) == 2);

			REQUIRE(store.deleteMediaItem(m2).ok());
			REQUIRE(embeddingCount(store, a.profileId) == 1);
			REQUIRE(profileCount(store) == 1);
			REQUIRE(store.speaker(b.id, nullptr).code == ErrorCode::NotFound);
			REQUIRE(store.verifyOwnershipInvariant());

			REQUIRE(store.deleteMediaItem(m1).ok());
			REQUIRE(profileCount(store) == 0);
			REQUIRE(store.deleteMediaItem(m1).code == ErrorCode::NotFound);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"occurrences list owned speakers and pending suggestions", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const qint64 m3 = newMedia(store, "ep3");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, m2, "SPEAKER_02", {0.9f, 0.1f});
			const PerFileSpeaker c = seedSpeaker(store, m3, "SPEAKER_01", {0.3f, 0.7f});
			REQUIRE(store.attachSpeaker(b.id, a.profileId, verifiedAttach()).ok());
			REQUIRE(store.setPendingSuggestion(c.id, a.profileId, 0.6, "maybe", false).ok());

			std::vector<CrossMediaOccurrence> occ;
			REQUIRE(store.occurrencesOf(a.profileId, &occ).ok());
			REQUIRE(occ.size() == 3);
			int pending = 0;
			for (const auto& o : occ) {
				if (o.pending) {
					++pending;
					REQUIRE(o.speakerId == c.id);
					REQUIRE(o.mediaTitle == "ep3");
					REQUIRE(near(o.score, 0.6));
				}
			}
			REQUIRE(pending == 1);
			REQUIRE(store.occurrencesOf(4242, &occ).code == ErrorCode::NotFound);
		}},
		{"naming a speaker", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, m2, "SPEAKER_00", {0.9f, 0.1f});

			// 단독 seed -> 같은 프로필 이름 변경
			Profile named;
			REQUIRE(store.nameSpeakerProfile(a.id, "Carol", &named).ok());
			REQUIRE(named.id == a.profileId);
			REQUIRE(named.state == ProfileState::Verified);

			// 공유 프로필 -> 새 프로필로 분리
			AttachOptions auto_;
			auto_.assignment = SpeakerAssignment::AutoAttached;
			auto_.verified = false;
			REQUIRE(store.attachSpeaker(b.id, a.profileId, auto_).ok());
			Profile split;
			REQUIRE(store.nameSpeakerProfile(b.id, "Dave", &split).ok());
			REQUIRE(split.id != a.profileId);
			REQUIRE(split.displayName == "Dave");
			REQUIRE(embeddingCount(store, a.profileId) == 1);
			REQUIRE(store.nameSpeakerProfile(b.id, "", &split).code == ErrorCode::InvalidArgument);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"rejected suggestions are remembered", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker c = seedSpeaker(store, m2, "SPEAKER_00", {0.3f, 0.7f});

			REQUIRE(store.setPendingSuggestion(c.id, a.profileId, 0.6, "maybe", false).ok());
			PerFileSpeaker pend;
			REQUIRE(store.speaker(c.id, &pend).ok());
			REQUIRE(pend.assignment == SpeakerAssignment::Pending);
			REQUIRE(pend.suggestedProfileId == a.profileId);

			Profile own;
			REQUIRE(store.rejectSuggestion(c.id, &own).ok());
			REQUIRE(own.id == c.profileId);
			PerFileSpeaker after;
			REQUIRE(store.speaker(c.id, &after).ok());
			REQUIRE(after.assignment == SpeakerAssignment::Seeded);
			REQUIRE(after.suggestedProfileId == -1);

			std::unordered_set<qint64> rejected;
			REQUIRE(store.rejectedProfiles(c.id, &rejected));
			REQUIRE(rejected.count(a.profileId) == 1);

			bool skipped = false;
			REQUIRE(store.setPendingSuggestion(c.id, a.profileId, 0.7, "again", false, &skipped).ok());
			REQUIRE(skipped);
		}},
		{"rejecting an automatic attach splits the speaker off", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, m2, "SPEAKER_00", {0.9f, 0.1f});
			AttachOptions auto_;
			auto_.assignment = SpeakerAssignment::AutoAttached;
			auto_.verified = false;
			auto_.confidence = 0.9;
			REQUIRE(store.attachSpeaker(b.id, a.profileId, auto_).ok());

			Profile own;
			REQUIRE(store.rejectSuggestion(b.id, &own).ok());
			REQUIRE(own.id != a.profileId);
			REQUIRE(own.embeddingIds.size() == 1);
			REQUIRE(embeddingCount(store, a.profileId) == 1);

			std::unordered_set<qint64> rejected;
			REQUIRE(store.rejectedProfiles(b.id, &rejected));
			REQUIRE(rejected.count(a.profileId) == 1);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"pending suggestion follows a released profile", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const qint64 m1 = newMedia(store, "ep1");
			const qint64 m2 = newMedia(store, "ep2");
			const qint64 m3 = newMedia(store, "ep3");
			const PerFileSpeaker a = seedSpeaker(store, m1, "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, m2, "SPEAKER_00", {0.9f, 0.1f});
			const PerFileSpeaker c = seedSpeaker(store, m3, "SPEAKER_00", {0.3f, 0.7f});
			REQUIRE(store.setPendingSuggestion(c.id, b.profileId, 0.55, "maybe", false).ok());

			REQUIRE(store.attachSpeaker(b.id, a.profileId, verifiedAttach()).ok());
			PerFileSpeaker after;
			REQUIRE(store.speaker(c.id, &after).ok());
			REQUIRE(after.suggestedProfileId == a.profileId);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"profile created ahead of its speakers", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			qint64 host = -1;
			REQUIRE(store.createProfile("  Host ", ProfileState::Verified, &host).ok());

			Profile p;
			REQUIRE(store.getProfile(host, &p).ok());
			REQUIRE(p.displayName == "Host");
			REQUIRE(p.state == ProfileState::Verified);
			REQUIRE(p.embeddingIds.empty());
			REQUIRE(store.verifyOwnershipInvariant());

			std::vector<GalleryEntry> gallery;
			REQUIRE(store.galleryEntries(&gallery));
			REQUIRE(gallery.empty());

			const qint64 m = newMedia(store, "ep1");
			const PerFileSpeaker s = seedSpeaker(store, m, "SPEAKER_00", {1.0f, 0.0f});
			REQUIRE(store.attachSpeaker(s.id, host, verifiedAttach()).ok());

			std::vector<Embedding> owned;
			REQUIRE(store.embeddings().embeddingsOfProfile(host, &owned));
			REQUIRE(owned.size() == 1);
			REQUIRE(owned[0].mediaItemId == m);
			REQUIRE(owned[0].label == "SPEAKER_00");
			REQUIRE(store.getProfile(s.profileId, nullptr).code == ErrorCode::NotFound);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"state change bumps the version", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const PerFileSpeaker s = seedSpeaker(store, newMedia(store, "ep1"), "SPEAKER_00", {1.0f, 0.0f});
			Profile before;
			REQUIRE(store.getProfile(s.profileId, &before).ok());

			REQUIRE(store.setState(s.profileId, ProfileState::Suggested).ok());
			Profile after;
			REQUIRE(store.getProfile(s.profileId, &after).ok());
			REQUIRE(after.state == ProfileState::Suggested);
			REQUIRE(after.version == before.version + 1);
			REQUIRE(store.setState(999, ProfileState::Verified).code == ErrorCode::NotFound);
		}},
		{"embeddings are listed by owner", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			const PerFileSpeaker a = seedSpeaker(store, newMedia(store, "ep1"), "SPEAKER_00", {1.0f, 0.0f});
			const PerFileSpeaker b = seedSpeaker(store, newMedia(store, "ep2"), "SPEAKER_00", {0.0f, 1.0f});
			REQUIRE(store.attachSpeaker(b.id, a.profileId, verifiedAttach()).ok());

			std::vector<Embedding> owned;
			REQUIRE(store.embeddings().embeddingsOfProfile(a.profileId, &owned));
			REQUIRE(owned.size() == 2);
			REQUIRE(owned[0].id < owned[1].id);
			REQUIRE(owned[0].vector == std::vector<float>({1.0f, 0.0f}));
			REQUIRE(owned[1].vector == std::vector<float>({0.0f, 1.0f}));

			std::vector<Embedding> all;
			REQUIRE(store.embeddings().allEmbeddings(&all));
			REQUIRE(all.size() == 2);
			for (const auto& e : all) REQUIRE(e.profileId == a.profileId);
		}},
	});
}
