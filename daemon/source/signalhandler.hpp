#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

/// @brief Turns SIGHUP into a reload request and SIGINT, SIGQUIT and SIGTERM into a stop request.
/// Signals must be blocked in every thread (BlockAllSignals before any thread starts) so only this handler consumes them.
class SystemSignalHandler
{
private:
	std::mutex AttentionMutex;
	std::condition_variable AttentionCondition;

	void HandleSignals(std::stop_token StopToken);
	void RequestAttention(std::atomic_bool &Flag);

public:
	SystemSignalHandler() = default;
	~SystemSignalHandler() = default; // SignalThread stops and joins itself
	SystemSignalHandler(const SystemSignalHandler &) = delete;
	SystemSignalHandler &operator=(const SystemSignalHandler &) = delete;

	/// @brief Blocks all signals in the calling thread
	static void BlockAllSignals();

	std::atomic_bool ReloadRequested{false};
	std::atomic_bool StopRequested{false};

	void Start();
	void Stop();
	bool Running() const { return SignalThread.joinable(); }

	/// @brief Sleeps for up to Timeout, returning early when a reload or stop is requested.
	/// @return true if a request is pending
	bool WaitForAttention(std::chrono::milliseconds Timeout);

	/// @brief Raises a request without a signal. Used by tests and by shutdown paths.
	void RequestStop() { RequestAttention(StopRequested); }
	void RequestReload() { RequestAttention(ReloadRequested); }

private:
	std::jthread SignalThread{}; // declared last so it stops before the flags it sets are destroyed
};
