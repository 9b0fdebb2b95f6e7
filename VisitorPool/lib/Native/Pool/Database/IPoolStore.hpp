#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "Pool/PoolTypes.hpp"

/**
 * @brief Persistent state of the visitor pool: identities, workspaces and leases.
 * @details Every mutating call is one atomic primitive of the backing store.
 * Implementations throw PoolStorageError when the store cannot answer.
 */
class IPoolStore
{
   public:
	virtual ~IPoolStore() = default;

	/// Authoritative clock for lease timestamps.
	[[nodiscard]] virtual TimeUs NowUs() = 0;

	// =========================================================================
	// Identities & workspaces
	// =========================================================================
	[[nodiscard]] virtual std::optional<VisitorIdentity> GetIdentity(IdentityNumber number) = 0;
	/// Registered identities, ascending by number.
	[[nodiscard]] virtual std::vector<VisitorIdentity> GetIdentities() = 0;

	/**
	 * @brief Write @p identity only if the stored record still points at
	 * @p expectedWorkspace (or does not exist yet when it is empty).
	 * @return false when another writer re-paired the identity first.
	 */
	[[nodiscard]] virtual bool PairIdentity(const VisitorIdentity& identity,
											std::optional<WorkspaceID> expectedWorkspace) = 0;

	[[nodiscard]] virtual std::optional<Workspace> GetWorkspace(WorkspaceID id) = 0;
	/// Allocates the next workspace id and stores the record.
	[[nodiscard]] virtual Workspace CreateWorkspace(const std::string& owner,
													const std::string& name,
													const std::string& location) = 0;

	// =========================================================================
	// Leases
	// =========================================================================

	/// Active, unexpired lease for @p token whose identity still owns its workspace.
	[[nodiscard]] virtual std::optional<LeasedSlot> FindLiveSlot(const std::string& token,
																 TimeUs now) = 0;

	/// Lease for @p token in any state.
	[[nodiscard]] virtual std::optional<Lease> FindLeaseByToken(const std::string& token) = 0;

	/// Active lease (expired or not) currently held on each slot.
	[[nodiscard]] virtual std::unordered_map<IdentityNumber, Lease> GetSlotLeases() = 0;

	/**
	 * @brief Claim the lowest-numbered eligible free identity in 1..poolSize.
	 * @details A stale lease on the chosen identity is deactivated in the same
	 * atomic step. Empty when every slot is taken.
	 */
	[[nodiscard]] virtual std::optional<LeasedSlot> ClaimFreeSlot(uint32_t poolSize,
																  const LeaseRequest& request) = 0;

	/// Deactivates up to @p limit active leases with expiry <= @p now (0 means all).
	[[nodiscard]] virtual std::vector<Lease> ReclaimExpired(TimeUs now, uint32_t limit) = 0;

	/// Deactivates the lease for @p token. Returns it if it was active.
	[[nodiscard]] virtual std::optional<Lease> DeactivateLease(const std::string& token) = 0;

	/// Runs inside the transfer transaction, before commit. Throwing aborts it.
	/// Returns the workspace's new location, or an empty string to keep it.
	using TransferStep = std::function<std::string(const LeasedSlot& slot)>;

	/**
	 * @brief Hand the workspace of a live lease to @p newOwner and end the lease.
	 * @details Validation, owner and location change, @p step and deactivation
	 * commit together or not at all. An exception from @p step is rethrown
	 * after rollback. In-process stores run @p step under their lock, so it
	 * must not call back into the store.
	 */
	[[nodiscard]] virtual TransferOutcome TransferWorkspace(const std::string& token,
															const std::string& newOwner,
															TimeUs now,
															const TransferStep& step) = 0;

	[[nodiscard]] virtual LeaseCounts CountActiveLeases(TimeUs now) = 0;

	// =========================================================================
	// Bootstrap lock
	// =========================================================================
	[[nodiscard]] virtual bool AcquireAdminLock(const std::string& owner,
												std::chrono::milliseconds ttl) = 0;
	virtual void ReleaseAdminLock(const std::string& owner) = 0;
};
