#include "test_support.hpp"
#include "services/MergeEngine.hpp"
#include "services/SpeakerIdentityService.hpp"

#include <algorithm>
#include <cmath>

using namespace testsupport;

namespace {

const std::vector<float> P{1.0f, 0.0f};
const std::vector<float> X{0.8f, 0.6f};									// P 와 0.9
const std::vector<float> Y{0.2f, static_cast<float>(std::sqrt(0.96))};	// P 와 0.6, X 와 0.87
const std::vector<float> M{0.2f, 0.98f};								// P 와 ~0.6

ServiceConfig configFor(const TempDb& db)
{
	ServiceConfig cfg = ServiceConfig::defaults();
	cfg.dbPath = db.path();
	cfg.budget.baseMs = 60000;
	cfg.persistLogs = false;
	return cfg;
}

ClassificationOutcome ingest(SpeakerIdentityService& svc, const QString& title, const std::vector<float>& v)
{
	qint64 m = -1;
	if (!svc.addMediaItem(title, &m).ok()) return ClassificationOutcome{};
	DiarizedSpeaker d;
	d.label = "SPEAKER_00";
	d.embedding = v;
	const DiarizationReport r = svc.onDiarizationComplete(m, {d});
	return r.outcomes.empty() ? ClassificationOutcome{} : r.outcomes.front();
}

bool contains(const std::vector<qint64>& ids, qint64 id)
{
	return std::find(ids.begin(), ids.end(), id) != ids.end();
}

QString statusOf(SpeakerIdentityService& svc, qint64 speakerId)
{
	QString text;
	return svc.profileStatus(speakerId, &text).ok() ? text : QString();
}

} // namespace

int main(int argc, char** argv)
{
	return runAll(argc, argv, {
		{"naming a profile attaches strong matches elsewhere", [] {
			TempDb db;
			REQUIRE(db.ok());
			SpeakerIdentityService svc(configFor(db));
			REQUIRE(svc.initialize());

			const ClassificationOutcome p = ingest(svc, "ep1", P);
			const ClassificationOutcome y = ingest(svc, "ep2", Y);
			const ClassificationOutcome x = ingest(svc, "ep3", X);
			REQUIRE(y.assignment == SpeakerAssignment::Pending);
			REQUIRE(x.assignment == SpeakerAssignment::AutoAttached);
			REQUIRE(x.profileId == p.profileId);

			qint64 renamedId = -1;
			QString renamedTo;
			QObject::connect(&svc, &SpeakerIdentityService::profileRenamed,
							 [&](qint64 id, const QString& name) { renamedId = id; renamedTo = name; });

			Profile alice;
			RetroReport retro;
			REQUIRE(svc.renameProfile(p.profileId, "Alice", &alice, &retro).ok());
			REQUIRE(renamedId == p.profileId);
			REQUIRE(renamedTo == "Alice");
			REQUIRE(retro.name == "Alice");
			REQUIRE(contains(retro.autoAttached, y.speakerId));
			REQUIRE(retro.failures.empty());
			REQUIRE(alice.embeddingIds.size() == 3);

			PerFileSpeaker ys;
			REQUIRE(svc.store().speaker(y.speakerId, &ys).ok());
			REQUIRE(ys.profileId == p.profileId);
			REQUIRE(ys.displayName == "Alice");
			REQUIRE(ys.assignment == SpeakerAssignment::AutoAttached);
			REQUIRE(!ys.verified);
			REQUIRE(statusOf(svc, y.speakerId) == "High confidence match - click to verify");
			REQUIRE(profileCount(svc.store()) == 1);

			std::vector<CrossMediaOccurrence> occ;
			REQUIRE(svc.listCrossMediaOccurrences(p.profileId, &occ).ok());
			REQUIRE(occ.size() == 3);

			QString report;
			REQUIRE(svc.checkInvariants(&report));
		}},
		{"verified speakers are never moved", [] {
			TempDb db;
			REQUIRE(db.ok());
			SpeakerIdentityService svc(configFor(db));
			REQUIRE(svc.initialize());

			const ClassificationOutcome p = ingest(svc, "ep1", P);
			const ClassificationOutcome y = ingest(svc, "ep2", Y);

			Profile yolanda;
			RetroReport first;
			REQUIRE(svc.verifySpeaker(y.speakerId, VerifyAction::createProfile("Yolanda"), &yolanda, &first).ok());
			REQUIRE(first.profileId == yolanda.id);
			REQUIRE(statusOf(svc, y.speakerId) == "Verified as Yolanda");

			RetroReport retro;
			REQUIRE(svc.renameProfile(p.profileId, "Alice", nullptr, &retro).ok());
			REQUIRE(!contains(retro.autoAttached, y.speakerId));
			REQUIRE(!contains(retro.suggested, y.speakerId));

			PerFileSpeaker ys;
			REQUIRE(svc.store().speaker(y.speakerId, &ys).ok());
			REQUIRE(ys.profileId == yolanda.id);
			REQUIRE(ys.verified);
		}},
		{"rejected profiles are not offered again", [] {
			TempDb db;
			REQUIRE(db.ok());
			SpeakerIdentityService svc(configFor(db));
			REQUIRE(svc.initialize());

			const ClassificationOutcome p = ingest(svc, "ep1", P);
			const ClassificationOutcome y = ingest(svc, "ep2", Y);
			REQUIRE(svc.verifySpeaker(y.speakerId, VerifyAction::reject(), nullptr).ok());

			RetroReport retro;
			REQUIRE(svc.renameProfile(p.profileId, "Alice", nullptr, &retro).ok());
			REQUIRE(retro.skipped == 1);
			REQUIRE(retro.suggested.empty());

			PerFileSpeaker ys;
			REQUIRE(svc.store().speaker(y.speakerId, &ys).ok());
			REQUIRE(ys.assignment == SpeakerAssignment::Seeded);
			REQUIRE(ys.suggestedProfileId == -1);
			REQUIRE(statusOf(svc, y.speakerId) == "Needs identification");
		}},
		{"medium matches get a pending suggestion", [] {
			TempDb db;
			REQUIRE(db.ok());
			SpeakerIdentityService svc(configFor(db));
			REQUIRE(svc.initialize());

			const ClassificationOutcome m = ingest(svc, "ep1", M);
			const ClassificationOutcome p = ingest(svc, "ep2", P);
			REQUIRE(m.assignment == SpeakerAssignment::Seeded);
			REQUIRE(p.assignment == SpeakerAssignment::Pending);

			RetroReport retro;
			REQUIRE(svc.renameProfile(p.profileId, "Alice", nullptr, &retro).ok());
			REQUIRE(contains(retro.suggested, m.speakerId));
			REQUIRE(retro.autoAttached.empty());

			PerFileSpeaker ms;
			REQUIRE(svc.store().speaker(m.speakerId, &ms).ok());
			REQUIRE(ms.profileId == m.profileId);
			REQUIRE(ms.suggestedProfileId == p.profileId);
			REQUIRE(ms.suggestedRationale.contains("Alice"));
			REQUIRE(statusOf(svc, m.speakerId) == "Medium confidence match - review needed");
		}},
		{"renaming a merged profile renames its successor", [] {
			TempDb db;
			REQUIRE(db.ok());
			SpeakerIdentityService svc(configFor(db));
			REQUIRE(svc.initialize());

			const ClassificationOutcome p = ingest(svc, "ep1", P);
			const ClassificationOutcome q = ingest(svc, "ep2", {-1.0f, 0.0f});
			REQUIRE(svc.mergeSpeakers({q.profileId}, p.profileId).outcome() == MergeOutcome::AllSucceeded);

			Profile out;
			REQUIRE(svc.renameProfile(q.profileId, "Alice", &out).ok());
			REQUIRE(out.id == p.profileId);
			REQUIRE(out.displayName == "Alice");
			REQUIRE(svc.renameProfile(p.profileId, " ", &out).code == ErrorCode::InvalidArgument);
		}},
		{"a profile named by the user keeps its speakers", [] {
			TempDb db;
			REQUIRE(db.ok());
			SpeakerIdentityService svc(configFor(db));
			REQUIRE(svc.initialize());

			const ClassificationOutcome p = ingest(svc, "ep1", P);
			const ClassificationOutcome y = ingest(svc, "ep2", Y);
			const ClassificationOutcome x = ingest(svc, "ep3", X);
			REQUIRE(y.assignment == SpeakerAssignment::Pending);
			REQUIRE(x.profileId == p.profileId);

			Profile yolanda;
			REQUIRE(svc.renameProfile(y.profileId, "Yolanda", &yolanda).ok());
			REQUIRE(statusOf(svc, y.speakerId) == "Verified as Yolanda");

			// Y 는 {P,X} 와 high 이지만 이름 붙인 프로필에서 떼어내지 않는다
			RetroReport retro;
			REQUIRE(svc.renameProfile(p.profileId, "Alice", nullptr, &retro).ok());
			REQUIRE(!contains(retro.autoAttached, y.speakerId));

			PerFileSpeaker ys;
			REQUIRE(svc.store().speaker(y.speakerId, &ys).ok());
			REQUIRE(ys.profileId == yolanda.id);
			REQUIRE(ys.verified);
			REQUIRE(ys.suggestedProfileId == -1);
			REQUIRE(svc.store().getProfile(yolanda.id, nullptr).ok());
			REQUIRE(profileCount(svc.store()) == 2);

			QString report;
			REQUIRE(svc.checkInvariants(&report));
		}},
		{"labels of the same file are not merged by naming", [] {
			TempDb db;
			REQUIRE(db.ok());
			SpeakerIdentityService svc(configFor(db));
			REQUIRE(svc.initialize());

			qint64 m = -1;
			REQUIRE(svc.addMediaItem("panel", &m).ok());
			DiarizedSpeaker a;
			a.label = "SPEAKER_00";
			a.embedding = P;
			DiarizedSpeaker b;
			b.label = "SPEAKER_01";
			b.embedding = X;
			const DiarizationReport r = svc.onDiarizationComplete(m, {a, b});
			REQUIRE(r.failedCount == 0);
			REQUIRE(r.outcomes.size() == 2);
			REQUIRE(r.outcomes[1].assignment == SpeakerAssignment::Seeded);

			RetroReport retro;
			REQUIRE(svc.renameProfile(r.outcomes[0].profileId, "Alice", nullptr, &retro).ok());
			REQUIRE(retro.autoAttached.empty());
			REQUIRE(retro.suggested.empty());
			REQUIRE(retro.failures.empty());
			REQUIRE(profileCount(svc.store()) == 2);
		}},
		{"auto attach follows a merged target", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			SpeakerMatcher matcher;
			RetroactiveLabeler labeler(store, matcher);

			const PerFileSpeaker a = seedSpeaker(store, newMedia(store, "ep1"), "SPEAKER_00", P);
			const PerFileSpeaker b = seedSpeaker(store, newMedia(store, "ep2"), "SPEAKER_00", X);
			const PerFileSpeaker s = seedSpeaker(store, newMedia(store, "ep3"), "SPEAKER_00", X);
			REQUIRE(store.renameProfile(b.profileId, "Bea", nullptr).ok());

			GalleryEntry target;
			REQUIRE(store.galleryEntry(a.profileId, &target).ok());
			MergeEngine merge(store);
			REQUIRE(merge.merge({a.profileId}, b.profileId).outcome() == MergeOutcome::AllSucceeded);

			bool skipped = true;
			REQUIRE(labeler.autoAttach(s.id, 0.9, &target, &skipped).ok());
			REQUIRE(!skipped);
			REQUIRE(target.profileId == b.profileId);
			REQUIRE(target.name == "Bea");
			REQUIRE(target.protos.size() == 3);

			PerFileSpeaker after;
			REQUIRE(store.speaker(s.id, &after).ok());
			REQUIRE(after.profileId == b.profileId);
			REQUIRE(after.displayName == "Bea");
			REQUIRE(after.assignment == SpeakerAssignment::AutoAttached);
			REQUIRE(store.verifyOwnershipInvariant());
		}},
		{"unknown profile", [] {
			TempDb db;
			REQUIRE(db.ok());
			ProfileStore store;
			SpeakerMatcher matcher;
			RetroactiveLabeler retro(store, matcher);
			const RetroReport r = retro.run(404);
			REQUIRE(r.failures.size() == 1);
			REQUIRE(r.failures[0].status.code == ErrorCode::NotFound);
		}},
	});
}
