#include "MemoryPoolStore.hpp"

TimeUs MemoryPoolStore::SystemNowUs()
{
	return static_cast<TimeUs>(std::chrono::duration_cast<std::chrono::microseconds>(
								   std::chrono::system_clock::now().time_since_epoch())
								   .count());
}

MemoryPoolStore::MemoryPoolStore(Clock clock) : clock(std::move(clock)) {}

TimeUs MemoryPoolStore::NowUs()
{
	return clock();
}

std::optional<VisitorIdentity> MemoryPoolStore::GetIdentity(IdentityNumber number)
{
	std::scoped_lock lock(mutex);
	auto it = identities.find(number);
	if (it == identities.end())
		return std::nullopt;
	return it->second;
}

std::vector<VisitorIdentity> MemoryPoolStore::GetIdentities()
{
	std::scoped_lock lock(mutex);
	std::vector<VisitorIdentity> out;
	out.reserve(identities.size());
	for (const auto& [number, identity] : identities)
		out.push_back(identity);
	return out;
}

bool MemoryPoolStore::PairIdentity(const VisitorIdentity& identity,
								   std::optional<WorkspaceID> expectedWorkspace)
{
	std::scoped_lock lock(mutex);
	auto it = identities.find(identity.Number);
	const std::optional<WorkspaceID> current =
		it == identities.end() ? std::nullopt : std::optional<WorkspaceID>(it->second.Workspace);
	if (current != expectedWorkspace)
		return false;
	identities[identity.Number] = identity;
	return true;
}

std::optional<Workspace> MemoryPoolStore::GetWorkspace(WorkspaceID id)
{
	std::scoped_lock lock(mutex);
	auto it = workspaces.find(id);
	if (it == workspaces.end())
		return std::nullopt;
	return it->second;
}

Workspace MemoryPoolStore::CreateWorkspace(const std::string& owner, const std::string& name,
										   const std::string& location)
{
	std::scoped_lock lock(mutex);
	Workspace ws;
	ws.ID = ++workspaceSeq;
	ws.Owner = owner;
	ws.Name = name;
	ws.Location = location;
	workspaces[ws.ID] = ws;
	return ws;
}

std::optional<LeasedSlot> MemoryPoolStore::PairedSlot(const Lease& lease) const
{
	auto idIt = identities.find(lease.Identity);
	if (idIt == identities.end())
		return std::nullopt;
	auto wsIt = workspaces.find(idIt->second.Workspace);
	if (wsIt == workspaces.end() || wsIt->second.Owner != idIt->second.Account)
		return std::nullopt;
	return LeasedSlot{lease, idIt->second, wsIt->second};
}

bool MemoryPoolStore::IsEligible(const VisitorIdentity& identity) const
{
	auto wsIt = workspaces.find(identity.Workspace);
	return wsIt != workspaces.end() && wsIt->second.Owner == identity.Account;
}

void MemoryPoolStore::Deactivate(Lease& lease)
{
	lease.Active = false;
	auto slotIt = slotLease.find(lease.Identity);
	if (slotIt != slotLease.end() && slotIt->second == lease.ID)
		slotLease.erase(slotIt);
}

std::optional<LeasedSlot> MemoryPoolStore::FindLiveSlot(const std::string& token, TimeUs now)
{
	std::scoped_lock lock(mutex);
	auto tokIt = tokenLease.find(token);
	if (tokIt == tokenLease.end())
		return std::nullopt;
	const Lease& lease = leases.at(tokIt->second);
	if (!lease.IsLive(now))
		return std::nullopt;
	return PairedSlot(lease);
}

std::optional<Lease> MemoryPoolStore::FindLeaseByToken(const std::string& token)
{
	std::scoped_lock lock(mutex);
	auto tokIt = tokenLease.find(token);
	if (tokIt == tokenLease.end())
		return std::nullopt;
	return leases.at(tokIt->second);
}

std::unordered_map<IdentityNumber, Lease> MemoryPoolStore::GetSlotLeases()
{
	std::scoped_lock lock(mutex);
	std::unordered_map<IdentityNumber, Lease> out;
	for (const auto& [number, leaseID] : slotLease)
		out.emplace(number, leases.at(leaseID));
	return out;
}

std::optional<LeasedSlot> MemoryPoolStore::ClaimFreeSlot(uint32_t poolSize,
														  const LeaseRequest& request)
{
	std::scoped_lock lock(mutex);
	for (IdentityNumber number = 1; number <= poolSize; ++number)
	{
		auto idIt = identities.find(number);
		if (idIt == identities.end() || !IsEligible(idIt->second))
			continue;

		auto slotIt = slotLease.find(number);
		if (slotIt != slotLease.end())
		{
			Lease& held = leases.at(slotIt->second);
			if (held.IsLive(request.NowUs))
				continue;
			Deactivate(held);
		}

		Lease lease;
		lease.ID = ++leaseSeq;
		lease.Identity = number;
		lease.Token = request.Token;
		lease.SessionKey = request.SessionKey;
		lease.CreatedAtUs = request.NowUs;
		lease.ExpiresAtUs = request.NowUs + request.LifetimeUs;
		lease.Active = true;

		leases[lease.ID] = lease;
		slotLease[number] = lease.ID;
		tokenLease[lease.Token] = lease.ID;
		return LeasedSlot{lease, idIt->second, workspaces.at(idIt->second.Workspace)};
	}
	return std::nullopt;
}

std::vector<Lease> MemoryPoolStore::ReclaimExpired(TimeUs now, uint32_t limit)
{
	std::scoped_lock lock(mutex);
	std::vector<LeaseID> stale;
	for (const auto& [number, leaseID] : slotLease)
	{
		if (limit != 0 && stale.size() >= limit)
			break;
		if (leases.at(leaseID).IsStale(now))
			stale.push_back(leaseID);
	}

	std::vector<Lease> freed;
	freed.reserve(stale.size());
	for (const LeaseID id : stale)
	{
		Lease& lease = leases.at(id);
		Deactivate(lease);
		freed.push_back(lease);
	}
	return freed;
}

std::optional<Lease> MemoryPoolStore::DeactivateLease(const std::string& token)
{
	std::scoped_lock lock(mutex);
	auto tokIt = tokenLease.find(token);
	if (tokIt == tokenLease.end())
		return std::nullopt;
	Lease& lease = leases.at(tokIt->second);
	if (!lease.Active)
		return std::nullopt;
	Deactivate(lease);
	return lease;
}

TransferOutcome MemoryPoolStore::TransferWorkspace(const std::string& token,
												   const std::string& newOwner, TimeUs now,
												   const TransferStep& step)
{
	std::scoped_lock lock(mutex);
	auto tokIt = tokenLease.find(token);
	if (tokIt == tokenLease.end())
		return TransferOutcome::eNoLease;

	Lease& lease = leases.at(tokIt->second);
	if (!lease.IsLive(now))
		return TransferOutcome::eConflict;
	const auto slot = PairedSlot(lease);
	if (!slot)
		return TransferOutcome::eConflict;

	// Nothing is written before the step succeeds.
	const std::string location = step ? step(*slot) : std::string();

	Workspace& ws = workspaces.at(slot->workspace.ID);
	ws.Owner = newOwner;
	if (!location.empty())
		ws.Location = location;
	Deactivate(lease);
	return TransferOutcome::eTransferred;
}

LeaseCounts MemoryPoolStore::CountActiveLeases(TimeUs now)
{
	std::scoped_lock lock(mutex);
	LeaseCounts counts;
	for (const auto& [number, leaseID] : slotLease)
	{
		if (leases.at(leaseID).IsLive(now))
			++counts.Allocated;
		else
			++counts.Expired;
	}
	return counts;
}

bool MemoryPoolStore::AcquireAdminLock(const std::string& owner, std::chrono::milliseconds ttl)
{
	const TimeUs now = clock();
	std::scoped_lock lock(mutex);
	if (lockOwner && lockExpiresUs > now)
		return false;
	lockOwner = owner;
	lockExpiresUs = now + static_cast<TimeUs>(ttl.count()) * 1000ULL;
	return true;
}

void MemoryPoolStore::ReleaseAdminLock(const std::string& owner)
{
	std::scoped_lock lock(mutex);
	if (lockOwner && *lockOwner == owner)
		lockOwner.reset();
}

std::size_t MemoryPoolStore::LeaseCount() const
{
	std::scoped_lock lock(mutex);
	return leases.size();
}
