#pragma once
#include <memory>

#include "Debug/Log.hpp"
#include "Pool/Database/IPoolStore.hpp"
#include "Pool/IdentityRegistry.hpp"
#include "Pool/LeaseAllocator.hpp"
#include "Pool/LeaseReclaimer.hpp"
#include "Pool/OwnershipTransfer.hpp"
#include "Pool/PoolConfig.hpp"
#include "Pool/PoolObserver.hpp"
#include "Pool/Session/ISession.hpp"
#include "Pool/Workspace/IWorkspaceHooks.hpp"

/**
 * @brief The visitor pool as one object: registry, allocator, reclaimer,
 * transfer and observer over a single store.
 */
class VisitorPool
{
	std::shared_ptr<IPoolStore> Store;
	std::shared_ptr<IWorkspaceHooks> Hooks;
	uint32_t PoolSize;

	std::shared_ptr<IdentityRegistry> Registry;
	std::shared_ptr<LeaseReclaimer> Reclaimer;
	std::shared_ptr<LeaseAllocator> Allocator;
	std::shared_ptr<OwnershipTransfer> Transfer;
	std::shared_ptr<PoolObserver> Observer;

   public:
	VisitorPool(std::shared_ptr<IPoolStore> store, std::shared_ptr<IWorkspaceHooks> hooks,
				const PoolConfig& config);

	AllocationResult Allocate(ISession& session) { return Allocator->Allocate(session); }
	bool Release(ISession& session) { return Allocator->Release(session); }
	std::optional<Workspace> ClaimOnSignup(ISession& session, const std::string& newAccount)
	{
		return Transfer->ClaimOnSignup(session, newAccount);
	}
	uint32_t ReclaimExpired() { return Reclaimer->ReclaimExpired(); }

	[[nodiscard]] PoolStatus Status() { return Observer->Status(); }
	[[nodiscard]] std::vector<SlotReport> DescribeSlots(
		const std::optional<std::string>& currentToken = std::nullopt)
	{
		return Observer->DescribeSlots(currentToken);
	}
	[[nodiscard]] std::optional<LeaseInfo> LookupLease(const std::string& token)
	{
		return Observer->LookupLease(token);
	}

	/// Provisions slots 1..n (the configured size when empty).
	uint32_t InitializePool(std::optional<uint32_t> n = std::nullopt);

	[[nodiscard]] uint32_t GetPoolSize() const { return PoolSize; }
};
