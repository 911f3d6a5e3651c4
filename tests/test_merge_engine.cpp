#include "test_support.hpp"
#include "services/MergeEngine.hpp"

using namespace testsupport;

namespace {

// 서로 다른 미디어에 seed 화자 하나씩
struct Corpus {
	TempDb db;
	ProfileStore store;
	std::vector<qint64> media;
	std::vector<PerFileSpeaker> speakers;

	PerFileSpeaker add(const QString& title, const std::vector<float>& v, double talk = 0.0)
	{
		const qint64 m = newMedia(store, title);
		media.push_back(m);
		if (talk > 0.0 && !store.addTranscriptSegment(m, "SPEAKER_00", 0.0, talk, title).ok())
			return PerFileSpeaker{};
		const PerFileSpeaker s = seedSpeaker(store, m, "SPEAKER_00", v);
		speakers.push_back(s);
		return s;
	}
};

} // namespace

int main(int argc, char** argv)
{
	return runAll(argc, argv, {
		{"malformed requests change nothing", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker t = c.add("ep2", {0.0f, 1.0f});
			MergeEngine merge(c.store);

			int finished = 0;
			QObject::connect(&merge, &MergeEngine::mergeFinished, [&](const MergeReport&) { ++finished; });

			MergeReport r = merge.merge({}, t.profileId);
			REQUIRE(r.requestStatus.code == ErrorCode::InvalidMergeRequest);
			REQUIRE(r.outcome() == MergeOutcome::AllFailed);

			r = merge.merge({a.profileId, t.profileId}, t.profileId);
			REQUIRE(r.requestStatus.code == ErrorCode::InvalidMergeRequest);
			REQUIRE(r.succeeded.empty());
			REQUIRE(finished == 2);
			REQUIRE(profileCount(c.store) == 2);
			REQUIRE(embeddingCount(c.store, a.profileId) == 1);
		}},
		{"all embeddings and segments end up in the target", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f}, 2.0);
			const PerFileSpeaker a2 = c.add("ep2", {0.9f, 0.1f}, 1.0);
			const PerFileSpeaker b = c.add("ep3", {0.0f, 1.0f}, 3.0);
			const PerFileSpeaker t = c.add("ep4", {0.5f, 0.5f}, 0.5);

			AttachOptions opt;
			REQUIRE(c.store.attachSpeaker(a2.id, a.profileId, opt).ok());

			MergeEngine merge(c.store);
			const MergeReport r = merge.merge({a.profileId, b.profileId}, t.profileId);
			REQUIRE(r.outcome() == MergeOutcome::AllSucceeded);
			REQUIRE(r.succeeded.size() == 2);
			REQUIRE(r.succeeded[0].movedEmbeddings == 2);
			REQUIRE(r.succeeded[0].movedSegments == 2);
			REQUIRE(r.succeeded[1].movedEmbeddings == 1);

			Profile tp;
			REQUIRE(c.store.getProfile(t.profileId, &tp).ok());
			REQUIRE(tp.embeddingIds.size() == 4);
			REQUIRE(tp.segmentCount == 4);
			REQUIRE(near(tp.talkTime, 6.5));
			REQUIRE(profileCount(c.store) == 1);

			qint64 live = -1;
			REQUIRE(c.store.resolveProfile(a.profileId, &live).ok());
			REQUIRE(live == t.profileId);
			REQUIRE(c.store.missingProfileStatus(b.profileId).redirectTo == t.profileId);

			std::vector<CrossMediaOccurrence> occ;
			REQUIRE(c.store.occurrencesOf(t.profileId, &occ).ok());
			REQUIRE(occ.size() == 4);
			REQUIRE(c.store.verifyOwnershipInvariant());
		}},
		{"merging an absorbed source again reports it", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker t = c.add("ep2", {0.0f, 1.0f});
			MergeEngine merge(c.store);
			REQUIRE(merge.merge({a.profileId}, t.profileId).outcome() == MergeOutcome::AllSucceeded);

			Profile before;
			REQUIRE(c.store.getProfile(t.profileId, &before).ok());
			const MergeReport again = merge.merge({a.profileId}, t.profileId);
			REQUIRE(again.outcome() == MergeOutcome::AllFailed);
			REQUIRE(again.failed.size() == 1);
			REQUIRE(again.failed[0].status.code == ErrorCode::NotFound);
			REQUIRE(again.failed[0].status.message.contains("already merged"));

			Profile after;
			REQUIRE(c.store.getProfile(t.profileId, &after).ok());
			REQUIRE(after.version == before.version);
			REQUIRE(after.embeddingIds == before.embeddingIds);
		}},
		{"missing target fails every source", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker b = c.add("ep2", {0.0f, 1.0f});
			MergeEngine merge(c.store);
			const MergeReport r = merge.merge({a.profileId, b.profileId}, 9999);
			REQUIRE(r.outcome() == MergeOutcome::AllFailed);
			REQUIRE(r.failed.size() == 2);
			REQUIRE(profileCount(c.store) == 2);
		}},
		{"unknown source gives a partial merge", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker t = c.add("ep2", {0.0f, 1.0f});
			MergeEngine merge(c.store);
			const MergeReport r = merge.merge({a.profileId, 9999}, t.profileId);
			REQUIRE(r.outcome() == MergeOutcome::Partial);
			REQUIRE(r.succeeded.size() == 1);
			REQUIRE(r.failed.size() == 1);
			REQUIRE(r.failed[0].profileId == 9999);
			REQUIRE(embeddingCount(c.store, t.profileId) == 2);
		}},
		{"source deleted mid-merge fails alone", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker b = c.add("ep2", {0.0f, 1.0f});
			const PerFileSpeaker t = c.add("ep3", {0.5f, 0.5f});
			MergeEngine merge(c.store);

			std::vector<std::pair<qint64, bool>> seen;
			QObject::connect(&merge, &MergeEngine::sourceMerged, &merge,
							 [&](qint64 id, bool ok) {
								 seen.emplace_back(id, ok);
								 if (id == a.profileId && ok) REQUIRE(c.store.deleteProfile(b.profileId).ok());
							 }, Qt::DirectConnection);

			const MergeReport r = merge.merge({a.profileId, b.profileId}, t.profileId);
			REQUIRE(r.outcome() == MergeOutcome::Partial);
			REQUIRE(seen.size() == 2);
			REQUIRE(seen[0].second);
			REQUIRE(!seen[1].second);
			REQUIRE(r.failed[0].status.code == ErrorCode::NotFound);
			REQUIRE(embeddingCount(c.store, t.profileId) == 2);
			REQUIRE(profileCount(c.store) == 2);
			REQUIRE(c.store.verifyOwnershipInvariant());
		}},
		{"pending suggestions and rejections follow the source", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker t = c.add("ep2", {0.0f, 1.0f});
			const PerFileSpeaker pend = c.add("ep3", {0.7f, 0.7f});
			const PerFileSpeaker rej = c.add("ep4", {0.6f, 0.8f});

			REQUIRE(c.store.setPendingSuggestion(pend.id, a.profileId, 0.6, "maybe", false).ok());
			REQUIRE(c.store.setPendingSuggestion(rej.id, a.profileId, 0.55, "maybe", false).ok());
			REQUIRE(c.store.rejectSuggestion(rej.id, nullptr).ok());

			MergeEngine merge(c.store);
			REQUIRE(merge.merge({a.profileId}, t.profileId).outcome() == MergeOutcome::AllSucceeded);

			PerFileSpeaker s;
			REQUIRE(c.store.speaker(pend.id, &s).ok());
			REQUIRE(s.assignment == SpeakerAssignment::Pending);
			REQUIRE(s.suggestedProfileId == t.profileId);

			std::unordered_set<qint64> rejected;
			REQUIRE(c.store.rejectedProfiles(rej.id, &rejected));
			REQUIRE(rejected.count(t.profileId) == 1);
			REQUIRE(c.store.verifyOwnershipInvariant());
		}},
		{"suggestion pointing into the target is dropped", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker t = c.add("ep2", {0.0f, 1.0f});
			REQUIRE(c.store.setPendingSuggestion(t.id, a.profileId, 0.6, "maybe", false).ok());

			MergeEngine merge(c.store);
			REQUIRE(merge.merge({a.profileId}, t.profileId).outcome() == MergeOutcome::AllSucceeded);

			PerFileSpeaker s;
			REQUIRE(c.store.speaker(t.id, &s).ok());
			REQUIRE(s.suggestedProfileId == -1);
			REQUIRE(s.profileId == t.profileId);
			REQUIRE(c.store.verifyOwnershipInvariant());
		}},
		{"named target renames absorbed speakers", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker t = c.add("ep2", {0.0f, 1.0f});
			REQUIRE(c.store.renameProfile(a.profileId, "Sam", nullptr).ok());
			REQUIRE(c.store.renameProfile(t.profileId, "Tom", nullptr).ok());

			MergeEngine merge(c.store);
			const MergeReport r = merge.merge({a.profileId}, t.profileId);
			REQUIRE(r.outcome() == MergeOutcome::AllSucceeded);
			REQUIRE(r.targetName == "Tom");
			REQUIRE(r.succeeded[0].name == "Sam");

			Profile tp;
			REQUIRE(c.store.getProfile(t.profileId, &tp).ok());
			REQUIRE(tp.displayName == "Tom");
			REQUIRE(tp.state == ProfileState::Verified);

			PerFileSpeaker s;
			REQUIRE(c.store.speaker(a.id, &s).ok());
			REQUIRE(s.displayName == "Tom");
		}},
		{"unnamed target keeps absorbed speaker names", [] {
			Corpus c;
			REQUIRE(c.db.ok());
			const PerFileSpeaker a = c.add("ep1", {1.0f, 0.0f});
			const PerFileSpeaker t = c.add("ep2", {0.0f, 1.0f});
			REQUIRE(c.store.renameProfile(a.profileId, "Sam", nullptr).ok());

			MergeEngine merge(c.store);
			REQUIRE(merge.merge({a.profileId}, t.profileId).outcome() == MergeOutcome::AllSucceeded);

			Profile tp;
			REQUIRE(c.store.getProfile(t.profileId, &tp).ok());
			REQUIRE(!tp.hasName());

			// 사용자가 이름 붙인 화자는 확정 상태 유지, target 의 seed 화자만 정리
			PerFileSpeaker s;
			REQUIRE(c.store.speaker(a.id, &s).ok());
			REQUIRE(s.displayName == "Sam");
			REQUIRE(s.assignment == SpeakerAssignment::Verified);
			REQUIRE(s.verified);

			PerFileSpeaker ts;
			REQUIRE(c.store.speaker(t.id, &ts).ok());
			REQUIRE(ts.assignment == SpeakerAssignment::AutoAttached);
		}},
	});
}
