#pragma once
#include <memory>

#include "Pool/Database/IPoolStore.hpp"

// Read-only views of the pool for the status page and the admin CLI.
class PoolObserver
{
	std::shared_ptr<IPoolStore> Store;
	uint32_t PoolSize;

   public:
	static constexpr TimeUs kMicrosPerMinute = 60ULL * 1000000ULL;

	PoolObserver(std::shared_ptr<IPoolStore> store, uint32_t poolSize);

	/// Total is always the configured size; Expired counts leases not yet reclaimed.
	[[nodiscard]] PoolStatus Status();

	/// One report per slot 1..N. @p currentToken marks the caller's own slot.
	[[nodiscard]] std::vector<SlotReport> DescribeSlots(const std::optional<std::string>& currentToken);

	/// Lease for @p token in any state, with how long ago it ran out.
	[[nodiscard]] std::optional<LeaseInfo> LookupLease(const std::string& token);
};
