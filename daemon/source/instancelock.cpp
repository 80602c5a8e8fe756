#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include "config_constants.hpp"
#include "instancelock.hpp"

std::string InstanceLock::GetLockPath() const
{
	std::filesystem::path LockPath{Directory};
	LockPath /= ConfigConstants::DaemonLockFileName;
	return LockPath.string();
}

bool InstanceLock::operator()()
{
	if (Held())
	{
		return true;
	}

	std::error_code ErrorCode{};
	std::filesystem::create_directories(Directory, ErrorCode);
	if (ErrorCode.value() != 0)
	{
		std::fprintf(stderr, "Failed to create lock directory \"%s\": %s\n", Directory.c_str(), ErrorCode.message().c_str());
		return false;
	}

	const std::string LockPath{GetLockPath()};
	int Descriptor{::open(LockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};
	if (Descriptor < 0)
	{
		std::fprintf(stderr, "Failed to open lock file \"%s\": %s\n", LockPath.c_str(), std::strerror(errno));
		return false;
	}
	if (::flock(Descriptor, LOCK_EX | LOCK_NB) != 0)
	{
		std::fprintf(stderr, "Failed to lock file \"%s\": %s\n", LockPath.c_str(), errno == EWOULDBLOCK ? "another instance is running" : std::strerror(errno));
		::close(Descriptor);
		return false;
	}

	std::string OwnerPid{std::to_string(::getpid())};
	OwnerPid.push_back('\n');
	if (::ftruncate(Descriptor, 0) != 0 || ::write(Descriptor, OwnerPid.data(), OwnerPid.size()) != static_cast<ssize_t>(OwnerPid.size()))
	{
		std::fprintf(stderr, "Failed to record pid in \"%s\": %s\n", LockPath.c_str(), std::strerror(errno)); // the lock itself is still valid
	}
	LockDescriptor = Descriptor;
	return true;
}

void InstanceLock::Unlock()
{
	if (LockDescriptor >= 0)
	{
		::close(LockDescriptor);
		LockDescriptor = -1;
	}
}

InstanceLock::~InstanceLock()
{
	Unlock();
}
