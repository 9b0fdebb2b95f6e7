#include "ReclaimerService.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

#include "Pool/PoolErrors.hpp"

ReclaimerService::ReclaimerService(std::shared_ptr<VisitorPool> pool, std::chrono::seconds interval)
	: Pool(std::move(pool)), Interval(interval)
{
}

void ReclaimerService::InstallSignalHandlers()
{
	std::signal(SIGINT, &ReclaimerService::handleSignal);
	std::signal(SIGTERM, &ReclaimerService::handleSignal);
}

void ReclaimerService::handleSignal(int32_t)
{
	SignalledShutdown = true;
}

bool ReclaimerService::RunCycle()
{
	try
	{
		const uint32_t freed = Pool->ReclaimExpired();
		if (freed > 0)
		{
			const PoolStatus status = Pool->Status();
			logger->DebugFormatted("Reclaimed {} slot(s), {}/{} allocated", freed, status.Allocated,
								   status.Total);
		}
		return true;
	}
	catch (const PoolStorageError& e)
	{
		logger->ErrorFormatted("Reclaim cycle failed: {}", e.what());
		return false;
	}
	catch (const std::exception& e)
	{
		logger->ErrorFormatted("Reclaim cycle aborted: {}", e.what());
		return false;
	}
}

void ReclaimerService::SleepFor(std::chrono::milliseconds duration) const
{
	const auto until = std::chrono::steady_clock::now() + duration;
	while (!ShutdownRequested() && std::chrono::steady_clock::now() < until)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
	}
}

void ReclaimerService::Run()
{
	logger->DebugFormatted("Running every {}s over {} slot(s)", Interval.count(), Pool->GetPoolSize());

	std::chrono::seconds backoff = kInitialBackoff;
	while (!ShutdownRequested())
	{
		if (RunCycle())
		{
			backoff = kInitialBackoff;
			SleepFor(Interval);
		}
		else
		{
			logger->WarningFormatted("Retrying in {}s", backoff.count());
			SleepFor(backoff);
			backoff = std::min(backoff * 2, kMaxBackoff);
		}
	}
	logger->Debug("Shutting down");
}
