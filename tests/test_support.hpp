#pragma once
#include <QCoreApplication>
#include <QString>
#include <QTemporaryDir>
#include <cmath>
#include <cstdio>
#include <functional>
#include <vector>

#include "services/QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include "store/ProfileStore.hpp"

namespace testsupport {

inline int& failures()
{
	static int n = 0;
	return n;
}

inline void require(bool cond, const char* expr, const char* file, int line)
{
	if (cond) return;
	++failures();
	std::fprintf(stderr, "  FAIL %s:%d: %s\n", file, line, expr);
}

inline bool near(double a, double b, double eps = 1e-4)
{
	return std::fabs(a - b) <= eps;
}

// 케이스마다 새 DB 파일
class TempDb {
public:
	TempDb()
	{
		SqlCommon::setDbFilePath(dir_.filePath("speakers.db"));
		ok_ = dir_.isValid() && QSqliteService().initializeDatabase();
	}
	bool ok() const { return ok_; }
	QString path() const { return dir_.filePath("speakers.db"); }

private:
	QTemporaryDir dir_;
	bool ok_ = false;
};

struct Case {
	const char* name;
	std::function<void()> fn;
};

inline int runAll(int argc, char** argv, const std::vector<Case>& cases)
{
	QCoreApplication app(argc, argv);
	for (const auto& c : cases) {
		const int before = failures();
		c.fn();
		std::printf("%s %s\n", failures() == before ? "PASS" : "FAIL", c.name);
	}
	std::printf("%d failure(s)\n", failures());
	return failures() == 0 ? 0 : 1;
}

inline qint64 newMedia(ProfileStore& s, const QString& title)
{
	qint64 id = -1;
	const Status st = s.addMediaItem(title, &id);
	return st.ok() ? id : -1;
}

// 매처를 거치지 않고 seed 화자 등록
inline PerFileSpeaker seedSpeaker(ProfileStore& s, qint64 mediaId, const QString& label,
								  const std::vector<float>& v)
{
	SpeakerRegistration req;
	req.mediaItemId = mediaId;
	req.label = label;
	req.vector = v;
	PerFileSpeaker out;
	bool already = false;
	if (!s.registerSpeaker(req, &out, &already).ok()) return PerFileSpeaker{};
	return out;
}

inline int embeddingCount(ProfileStore& s, qint64 profileId)
{
	Profile p;
	if (!s.getProfile(profileId, &p).ok()) return -1;
	return static_cast<int>(p.embeddingIds.size());
}

inline int profileCount(ProfileStore& s)
{
	std::vector<Profile> all;
	return s.listProfiles(&all) ? static_cast<int>(all.size()) : -1;
}

} // namespace testsupport

#define REQUIRE(cond) testsupport::require((cond), #cond, __FILE__, __LINE__)
