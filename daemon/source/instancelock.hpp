#pragma once

#include <string>

/// @brief Keeps a second daemon from running against the same runtime directory. Holds an exclusive flock on <directory>/daemon.lock, which also carries the owner's pid.
class InstanceLock
{
private:
	std::string Directory;
	int LockDescriptor{-1};

public:
	explicit InstanceLock(std::string Directory) : Directory{std::move(Directory)} {}
	~InstanceLock();
	InstanceLock(const InstanceLock &) = delete;
	InstanceLock &operator=(const InstanceLock &) = delete;
	InstanceLock(InstanceLock &&) = delete;
	InstanceLock &operator=(InstanceLock &&) = delete;

	bool operator()();
	bool Held() const { return LockDescriptor >= 0; }
	std::string GetLockPath() const;
	void Unlock();
};
