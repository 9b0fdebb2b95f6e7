#include "LeaseReclaimer.hpp"

#include "Pool/PoolErrors.hpp"

LeaseReclaimer::LeaseReclaimer(std::shared_ptr<IPoolStore> store,
							   std::shared_ptr<IWorkspaceHooks> hooks)
	: Store(std::move(store)), Hooks(std::move(hooks))
{
	if (!Store)
	{
		throw std::invalid_argument("LeaseReclaimer needs a store");
	}
}

uint32_t LeaseReclaimer::ReclaimExpired()
{
	return Reclaim(0);
}

uint32_t LeaseReclaimer::ReclaimScoped(uint32_t limit)
{
	if (limit == 0)
		return 0;
	return Reclaim(limit);
}

uint32_t LeaseReclaimer::Reclaim(uint32_t limit)
{
	const TimeUs now = Store->NowUs();
	const std::vector<Lease> freed = Store->ReclaimExpired(now, limit);
	for (const Lease& lease : freed)
	{
		logger->DebugFormatted("Freed expired slot {}", VisitorIdentity::AccountName(lease.Identity));
		NotifyReclaimed(lease);
	}
	return static_cast<uint32_t>(freed.size());
}

bool LeaseReclaimer::ReleaseLease(const std::string& token)
{
	const auto lease = Store->DeactivateLease(token);
	if (!lease)
	{
		logger->WarningFormatted("Lease not found for token: {}...", token.substr(0, 8));
		return false;
	}
	logger->DebugFormatted("Released {}", VisitorIdentity::AccountName(lease->Identity));
	NotifyReclaimed(*lease);
	return true;
}

void LeaseReclaimer::NotifyReclaimed(const Lease& lease)
{
	if (!Hooks)
		return;
	const auto identity = Store->GetIdentity(lease.Identity);
	if (!identity)
		return;
	const auto ws = Store->GetWorkspace(identity->Workspace);
	if (!ws)
		return;

	try
	{
		Hooks->OnReclaim(*identity, *ws);
	}
	catch (const PoolStorageError&)
	{
		throw;
	}
	catch (const std::exception& e)
	{
		logger->WarningFormatted("Reclaim hook failed for {}: {}", identity->Account, e.what());
	}
}
