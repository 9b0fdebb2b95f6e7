#pragma once
#include <memory>

#include "Debug/Log.hpp"
#include "Pool/Database/IPoolStore.hpp"
#include "Pool/Workspace/IWorkspaceHooks.hpp"

// Returns slots whose lease ran out, or whose holder gave them up.
class LeaseReclaimer
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("LeaseReclaimer");
	std::shared_ptr<IPoolStore> Store;
	std::shared_ptr<IWorkspaceHooks> Hooks;

   public:
	LeaseReclaimer(std::shared_ptr<IPoolStore> store, std::shared_ptr<IWorkspaceHooks> hooks);

	/// Deactivates every expired active lease. Returns how many slots were freed.
	uint32_t ReclaimExpired();

	/// Same as ReclaimExpired but frees at most @p limit slots.
	uint32_t ReclaimScoped(uint32_t limit);

	/// Ends the lease behind @p token whatever its expiry. False if it was not active.
	bool ReleaseLease(const std::string& token);

   private:
	uint32_t Reclaim(uint32_t limit);
	void NotifyReclaimed(const Lease& lease);
};
