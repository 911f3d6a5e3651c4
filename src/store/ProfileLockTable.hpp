#pragma once
#include <QMutex>
#include <memory>
#include <unordered_map>
#include <vector>

// 프로필별 mutex. 전역 락 없음 -> 서로 다른 프로필 작업은 병렬로 진행
// 여러 프로필을 잡을 때는 항상 id 오름차순
class ProfileLockTable {
public:
	class Guard {
	public:
		Guard() = default;
		explicit Guard(std::vector<std::shared_ptr<QMutex>> mutexes);
		~Guard();

		Guard(Guard&& other) noexcept;
		Guard& operator=(Guard&& other) noexcept;
		Guard(const Guard&) = delete;
		Guard& operator=(const Guard&) = delete;

		void unlock();

	private:
		std::vector<std::shared_ptr<QMutex>> held_;
	};

	Guard lock(qint64 profileId);
	Guard lockMany(std::vector<qint64> profileIds);	// 중복/음수 id 는 무시

	// 아무도 잡고/기다리고 있지 않은 항목 제거. 제거한 수
	int prune();
	size_t size();

private:
	static constexpr size_t kMinSweep = 256;

	std::shared_ptr<QMutex> mutexFor(qint64 profileId);
	int pruneLocked();

	QMutex tableMu_;
	std::unordered_map<qint64, std::shared_ptr<QMutex>> mutexes_;
	size_t sweepAt_ = kMinSweep;
};
