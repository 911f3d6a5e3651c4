#include "match/TierPolicy.hpp"
#include "logger.hpp"
#include <cmath>

namespace {
inline bool validScore(double s) {
	return std::isfinite(s) && s >= 0.0 && s <= 1.0;
}
} // namespace

Tier TierPolicy::classify(double score) const {
	if (!validScore(score)) {
		qCDebug(LC_SUGG) << "[Tier] Low: invalid score" << score;
		return Tier::Low;
	}
	if (score >= p_.high)   return Tier::High;
	if (score >= p_.medium) return Tier::Medium;
	return Tier::Low;
}

QString TierPolicy::rationale(const MatchCandidate& c, qint64 bestMediaItemId) const {
	const int pct = static_cast<int>(std::lround(c.score * 100.0));
	QString who = c.profileName.isEmpty() ? QString("unnamed profile #%1").arg(c.profileId)
										  : QString("\"%1\"").arg(c.profileName);

	QString head;
	switch (classify(c.score)) {
		case Tier::High:	head = QString("High confidence match with %1 (%2%)").arg(who).arg(pct); break;
		case Tier::Medium:	head = QString("Possible match with %1 (%2%), review needed").arg(who).arg(pct); break;
		case Tier::Low:		head = QString("Weak similarity to %1 (%2%)").arg(who).arg(pct); break;
	}

	QString detail = c.embeddingCount == 1
		? QStringLiteral("1 voiceprint")
		: QString("best of %1 voiceprints").arg(c.embeddingCount);
	if (bestMediaItemId >= 0) detail += QString(", closest in media #%1").arg(bestMediaItemId);
	return head + " - " + detail;
}

void TierPolicy::annotate(MatchCandidate* c, qint64 bestMediaItemId) const {
	if (!c) return;
	c->tier = classify(c->score);
	c->rationale = rationale(*c, bestMediaItemId);
}
