#include "store/ProfileLockTable.hpp"
#include <QMutexLocker>
#include <algorithm>

ProfileLockTable::Guard::Guard(std::vector<std::shared_ptr<QMutex>> mutexes)
	: held_(std::move(mutexes))
{
	for (auto& m : held_) m->lock();
}

ProfileLockTable::Guard::~Guard()
{
	unlock();
}

ProfileLockTable::Guard::Guard(Guard&& other) noexcept
	: held_(std::move(other.held_))
{
	other.held_.clear();
}

ProfileLockTable::Guard& ProfileLockTable::Guard::operator=(Guard&& other) noexcept
{
	if (this != &other) {
		unlock();
		held_ = std::move(other.held_);
		other.held_.clear();
	}
	return *this;
}

void ProfileLockTable::Guard::unlock()
{
	// 역순 해제
	for (auto it = held_.rbegin(); it != held_.rend(); ++it) (*it)->unlock();
	held_.clear();
}

int ProfileLockTable::pruneLocked()
{
	// use_count 1 = 테이블만 보유. 복사는 tableMu_ 아래에서만 생기므로 안전
	int removed = 0;
	for (auto it = mutexes_.begin(); it != mutexes_.end();) {
		if (it->second.use_count() == 1) {
			it = mutexes_.erase(it);
			++removed;
		} else {
			++it;
		}
	}
	return removed;
}

int ProfileLockTable::prune()
{
	QMutexLocker lk(&tableMu_);
	return pruneLocked();
}

size_t ProfileLockTable::size()
{
	QMutexLocker lk(&tableMu_);
	return mutexes_.size();
}

std::shared_ptr<QMutex> ProfileLockTable::mutexFor(qint64 profileId)
{
	QMutexLocker lk(&tableMu_);
	// seed/흡수된 프로필 id 가 계속 쌓이지 않도록 커질 때마다 정리
	if (mutexes_.size() >= sweepAt_) {
		pruneLocked();
		sweepAt_ = std::max(kMinSweep, mutexes_.size() * 2);
	}
	auto& slot = mutexes_[profileId];
	if (!slot) slot = std::make_shared<QMutex>();
	return slot;
}

ProfileLockTable::Guard ProfileLockTable::lock(qint64 profileId)
{
	return lockMany({profileId});
}

ProfileLockTable::Guard ProfileLockTable::lockMany(std::vector<qint64> profileIds)
{
	profileIds.erase(std::remove_if(profileIds.begin(), profileIds.end(),
									[](qint64 id) { return id < 0; }),
					 profileIds.end());
	std::sort(profileIds.begin(), profileIds.end());
	profileIds.erase(std::unique(profileIds.begin(), profileIds.end()), profileIds.end());

	std::vector<std::shared_ptr<QMutex>> mutexes;
	mutexes.reserve(profileIds.size());
	for (qint64 id : profileIds) mutexes.push_back(mutexFor(id));
	return Guard(std::move(mutexes));
}
