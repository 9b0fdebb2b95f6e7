#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "Global/pch.hpp"

using IdentityNumber = uint32_t;
using WorkspaceID = uint64_t;
using LeaseID = uint64_t;
/// Microseconds since the Unix epoch, on the store clock.
using TimeUs = uint64_t;

namespace SessionKeys
{
inline constexpr std::string_view kToken = "visitor_allocation_token";
inline constexpr std::string_view kUserID = "visitor_user_id";
inline constexpr std::string_view kProjectID = "visitor_project_id";
}  // namespace SessionKeys

struct VisitorIdentity
{
	IdentityNumber Number = 0;
	std::string Account;
	WorkspaceID Workspace = 0;

	/// visitor-001 .. visitor-999
	static std::string AccountName(IdentityNumber number)
	{
		return std::format("visitor-{:03}", number);
	}
};

struct Workspace
{
	WorkspaceID ID = 0;
	std::string Owner;
	std::string Name;
	std::string Location;
};

struct Lease
{
	LeaseID ID = 0;
	IdentityNumber Identity = 0;
	std::string Token;
	std::string SessionKey;
	TimeUs CreatedAtUs = 0;
	TimeUs ExpiresAtUs = 0;
	bool Active = false;

	[[nodiscard]] bool IsLive(TimeUs now) const { return Active && ExpiresAtUs > now; }
	[[nodiscard]] bool IsStale(TimeUs now) const { return Active && ExpiresAtUs <= now; }
};

/// A live lease together with the identity and workspace it hands out.
struct LeasedSlot
{
	Lease lease;
	VisitorIdentity identity;
	Workspace workspace;
};

struct LeaseRequest
{
	std::string Token;
	std::string SessionKey;
	TimeUs NowUs = 0;
	TimeUs LifetimeUs = 0;
};

struct LeaseCounts
{
	uint32_t Allocated = 0;
	uint32_t Expired = 0;
};

enum class AllocateOutcome
{
	eReused,
	eAllocated,
	eExhausted
};
BOOST_DESCRIBE_ENUM(AllocateOutcome, eReused, eAllocated, eExhausted)

enum class TransferOutcome
{
	eTransferred,
	eNoLease,	/// token was never issued
	eConflict	/// lease no longer live, or changed underneath the transaction
};
BOOST_DESCRIBE_ENUM(TransferOutcome, eTransferred, eNoLease, eConflict)

struct AllocationResult
{
	AllocateOutcome Outcome = AllocateOutcome::eExhausted;
	std::optional<LeasedSlot> Slot;

	[[nodiscard]] bool Ok() const { return Outcome != AllocateOutcome::eExhausted; }
};

struct PoolStatus
{
	uint32_t Total = 0;
	uint32_t Allocated = 0;
	uint32_t Free = 0;
	uint32_t Expired = 0;

	[[nodiscard]] Json ToJson() const
	{
		Json j;
		j["total"] = Total;
		j["allocated"] = Allocated;
		j["free"] = Free;
		j["expired"] = Expired;
		return j;
	}
};

struct SlotReport
{
	IdentityNumber Number = 0;
	std::string Status;	 // "allocated" | "free"
	std::optional<TimeUs> ExpiresAtUs;
	std::optional<int64_t> MinutesRemaining;
	std::string VisitorAccount;
	bool IsCurrentSession = false;

	[[nodiscard]] Json ToJson() const
	{
		Json j;
		j["slot"] = Number;
		j["status"] = Status;
		j["expires_at_us"] = ExpiresAtUs ? Json(*ExpiresAtUs) : Json(nullptr);
		j["minutes_remaining"] = MinutesRemaining ? Json(*MinutesRemaining) : Json(nullptr);
		j["visitor"] = VisitorAccount;
		j["current"] = IsCurrentSession;
		return j;
	}
};

struct LeaseInfo
{
	Lease lease;
	std::string VisitorAccount;
	bool Expired = false;
	/// Minutes since expiry, at least 1. Empty while the lease is still running.
	std::optional<int64_t> ExpiredMinutesAgo;
};
