#pragma once
#include <map>
#include <mutex>

#include "Pool/Database/IPoolStore.hpp"

/**
 * @brief In-process pool store. Every call runs under one mutex, which gives
 * the same atomicity the Redis scripts give across processes.
 */
class MemoryPoolStore : public IPoolStore
{
   public:
	using Clock = std::function<TimeUs()>;

	/// Wall clock in microseconds.
	static TimeUs SystemNowUs();

	explicit MemoryPoolStore(Clock clock = &MemoryPoolStore::SystemNowUs);

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

	/// Total leases ever written, active or not.
	[[nodiscard]] std::size_t LeaseCount() const;

   private:
	Clock clock;
	mutable std::mutex mutex;

	std::map<IdentityNumber, VisitorIdentity> identities;
	std::map<WorkspaceID, Workspace> workspaces;
	std::map<LeaseID, Lease> leases;
	std::map<IdentityNumber, LeaseID> slotLease;
	std::unordered_map<std::string, LeaseID> tokenLease;
	WorkspaceID workspaceSeq = 0;
	LeaseID leaseSeq = 0;

	std::optional<std::string> lockOwner;
	TimeUs lockExpiresUs = 0;

	// Callers hold mutex.
	std::optional<LeasedSlot> PairedSlot(const Lease& lease) const;
	bool IsEligible(const VisitorIdentity& identity) const;
	void Deactivate(Lease& lease);
};
