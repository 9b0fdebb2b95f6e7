#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "Debug/Log.hpp"
#include "Global/Misc/Singleton.hpp"
#include "Global/pch.hpp"
#include "Pool/VisitorPool.hpp"

// Periodic ReclaimExpired driver. Backs off while the store is unreachable.
class ReclaimerService : public Singleton<ReclaimerService>
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("Reclaimer");

	std::shared_ptr<VisitorPool> Pool;
	std::chrono::seconds Interval;
	std::atomic_bool ShouldShutdown = false;

	static inline std::atomic_bool SignalledShutdown = false;

   public:
	static constexpr std::chrono::seconds kInitialBackoff{1};
	static constexpr std::chrono::seconds kMaxBackoff{60};

	ReclaimerService(std::shared_ptr<VisitorPool> pool, std::chrono::seconds interval);

	void Shutdown() { ShouldShutdown = true; }
	void Run();

	/**
	 * @brief One sweep. Failures are logged and reported as false.
	 */
	bool RunCycle();

	static void InstallSignalHandlers();

   private:
	[[nodiscard]] bool ShutdownRequested() const { return ShouldShutdown || SignalledShutdown; }
	/// Sleeps in short slices so shutdown is noticed promptly.
	void SleepFor(std::chrono::milliseconds duration) const;
	static void handleSignal(int32_t signum);
};
