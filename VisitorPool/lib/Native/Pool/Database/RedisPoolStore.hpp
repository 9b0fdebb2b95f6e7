#pragma once
#include <memory>

#include "Database/Redis/RedisConnection.hpp"
#include "Debug/Log.hpp"
#include "Pool/Database/IPoolStore.hpp"

/**
 * @brief Pool store on Redis.
 * @details Every key carries the {VisitorPool} hash tag so scripts and
 * transactions stay on one cluster slot. Claim, reclaim and release are Lua
 * scripts; transfer is a WATCH/MULTI/EXEC transaction because it runs a
 * client-side step before committing. Lease timestamps use Redis TIME.
 */
class RedisPoolStore : public IPoolStore
{
   public:
	explicit RedisPoolStore(std::shared_ptr<RedisConnection> connection);

	TimeUs NowUs() override;

	std::optional<VisitorIdentity> GetIdentity(IdentityNumber number) override;
	std::vector<VisitorIdentity> GetIdentities() override;
	bool PairIdentity(const VisitorIdentity& identity,
					  std::optional<WorkspaceID> expectedWorkspace) override;

	std::optional<Workspace> GetWorkspace(WorkspaceID id) override;
	Workspace CreateWorkspace(const std::string& owner, const std::string& name,
							  const std::string& location) override;

	std::optional<LeasedSlot> FindLiveSlot(const std::string& token, TimeUs now) override;
	std::optional<Lease> FindLeaseByToken(const std::string& token) override;
	std::unordered_map<IdentityNumber, Lease> GetSlotLeases() override;
	std::optional<LeasedSlot> ClaimFreeSlot(uint32_t poolSize, const LeaseRequest& request) override;
	std::vector<Lease> ReclaimExpired(TimeUs now, uint32_t limit) override;
	std::optional<Lease> DeactivateLease(const std::string& token) override;
	TransferOutcome TransferWorkspace(const std::string& token, const std::string& newOwner,
									  TimeUs now, const TransferStep& step) override;
	LeaseCounts CountActiveLeases(TimeUs now) override;

	bool AcquireAdminLock(const std::string& owner, std::chrono::milliseconds ttl) override;
	void ReleaseAdminLock(const std::string& owner) override;

   private:
	std::shared_ptr<RedisConnection> Connection;
	std::shared_ptr<Log> logger = std::make_shared<Log>("RedisPoolStore");

	const std::string Prefix = "{VisitorPool}:";
	const std::string IdentitiesKey = Prefix + "Identities";
	const std::string WorkspaceSeqKey = Prefix + "WorkspaceSeq";
	const std::string LeaseSeqKey = Prefix + "LeaseSeq";
	const std::string SlotLeaseKey = Prefix + "SlotLease";
	const std::string TokenLeaseKey = Prefix + "TokenLease";
	const std::string AdminLockKey = Prefix + "AdminLock";

	[[nodiscard]] std::string IdentityKey(IdentityNumber number) const
	{
		return std::format("{}Identity:{}", Prefix, number);
	}
	[[nodiscard]] std::string WorkspaceKey(WorkspaceID id) const
	{
		return std::format("{}Workspace:{}", Prefix, id);
	}
	[[nodiscard]] std::string LeaseKey(LeaseID id) const
	{
		return std::format("{}Lease:{}", Prefix, id);
	}

	[[nodiscard]] std::optional<Lease> ReadLease(LeaseID id) const;

	template <class Handle>
	TransferOutcome TransferWith(Handle& handle, LeaseID leaseID, const std::string& newOwner,
								 TimeUs now, const TransferStep& step);

	// Runs f, rethrowing redis++ failures as PoolStorageError.
	template <class F>
	decltype(auto) Guarded(std::string_view what, F&& f) const;
};
