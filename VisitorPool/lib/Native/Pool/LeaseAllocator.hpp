#pragma once
#include <memory>

#include "Debug/Log.hpp"
#include "Pool/Database/IPoolStore.hpp"
#include "Pool/LeaseReclaimer.hpp"
#include "Pool/Session/ISession.hpp"

/**
 * @brief Hands visitor identities to sessions.
 * @details A session keeps its slot while its lease is live. Otherwise the
 * lowest free slot is claimed; when none is free, expired leases are
 * reclaimed once and the claim retried. Exhaustion is an outcome, not an error.
 */
class LeaseAllocator
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("LeaseAllocator");
	std::shared_ptr<IPoolStore> Store;
	std::shared_ptr<LeaseReclaimer> Reclaimer;
	uint32_t PoolSize;
	std::chrono::microseconds Lifetime;

   public:
	LeaseAllocator(std::shared_ptr<IPoolStore> store, std::shared_ptr<LeaseReclaimer> reclaimer,
				   uint32_t poolSize, std::chrono::microseconds lifetime);

	AllocationResult Allocate(ISession& session);

	/// Gives the session's slot back and forgets it. False when there was no active lease.
	bool Release(ISession& session);

	[[nodiscard]] uint32_t GetPoolSize() const { return PoolSize; }

   private:
	std::optional<LeasedSlot> TryClaim(const ISession& session, TimeUs now);
};
