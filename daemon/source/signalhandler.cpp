#include <atomic>
#include <cerrno>
#include <csignal>
#include <ctime>
#include <mutex>
#include <pthread.h>
#include <thread>
#include "signalhandler.hpp"

// sigtimedwait wakes at this interval to notice a stop request
constexpr const long SignalPollNanoseconds{200'000'000};

void SystemSignalHandler::BlockAllSignals()
{
	::sigset_t SignalSet;
	::sigfillset(&SignalSet);
	::pthread_sigmask(SIG_BLOCK, &SignalSet, nullptr);
}

void SystemSignalHandler::RequestAttention(std::atomic_bool &Flag)
{
	{
		std::scoped_lock AttentionLock{AttentionMutex}; // a waiter between its predicate check and its wait cannot miss this
		Flag = true;
	}
	AttentionCondition.notify_all();
}

void SystemSignalHandler::HandleSignals(std::stop_token StopToken)
{
	::sigset_t SignalSet;
	::sigemptyset(&SignalSet);
	::sigaddset(&SignalSet, SIGHUP);
	::sigaddset(&SignalSet, SIGINT);
	::sigaddset(&SignalSet, SIGQUIT);
	::sigaddset(&SignalSet, SIGTERM);
	::pthread_sigmask(SIG_BLOCK, &SignalSet, nullptr);

	const ::timespec PollInterval{0, SignalPollNanoseconds};
	while (!StopToken.stop_requested() && !StopRequested)
	{
		int Signal{::sigtimedwait(&SignalSet, nullptr, &PollInterval)};
		switch (Signal)
		{
		case SIGQUIT:
			[[fallthrough]];
		case SIGINT:
			[[fallthrough]];
		case SIGTERM:
			RequestAttention(StopRequested);
			break;
		case SIGHUP:
			if (!ReloadRequested)
			{ // a second SIGHUP before the daemon reloads is folded into the first
				RequestAttention(ReloadRequested);
			}
			break;
		default: // EAGAIN or EINTR
			break;
		}
	}
}

void SystemSignalHandler::Start()
{
	if (!Running())
	{
		SignalThread = std::jthread([this](std::stop_token StopToken)
											 { HandleSignals(StopToken); });
	}
}

void SystemSignalHandler::Stop()
{
	if (Running())
	{
		SignalThread.request_stop();
		SignalThread.join();
	}
}

bool SystemSignalHandler::WaitForAttention(std::chrono::milliseconds Timeout)
{
	std::unique_lock AttentionLock{AttentionMutex};
	return AttentionCondition.wait_for(AttentionLock, Timeout, [this]
												  { return ReloadRequested || StopRequested; });
}
