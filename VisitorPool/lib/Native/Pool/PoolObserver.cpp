#include "PoolObserver.hpp"

#include <algorithm>

PoolObserver::PoolObserver(std::shared_ptr<IPoolStore> store, uint32_t poolSize)
	: Store(std::move(store)), PoolSize(poolSize)
{
	if (!Store)
	{
		throw std::invalid_argument("PoolObserver needs a store");
	}
}

PoolStatus PoolObserver::Status()
{
	const LeaseCounts counts = Store->CountActiveLeases(Store->NowUs());
	PoolStatus status;
	status.Total = PoolSize;
	status.Allocated = std::min(counts.Allocated, PoolSize);
	status.Free = PoolSize - status.Allocated;
	status.Expired = counts.Expired;
	return status;
}

std::vector<SlotReport> PoolObserver::DescribeSlots(const std::optional<std::string>& currentToken)
{
	const TimeUs now = Store->NowUs();
	const auto held = Store->GetSlotLeases();

	std::vector<SlotReport> out;
	out.reserve(PoolSize);
	for (IdentityNumber n = 1; n <= PoolSize; ++n)
	{
		SlotReport report;
		report.Number = n;
		report.VisitorAccount = VisitorIdentity::AccountName(n);

		auto it = held.find(n);
		if (it != held.end() && it->second.IsLive(now))
		{
			const Lease& lease = it->second;
			report.Status = "allocated";
			report.ExpiresAtUs = lease.ExpiresAtUs;
			report.MinutesRemaining = static_cast<int64_t>((lease.ExpiresAtUs - now) / kMicrosPerMinute);
			report.IsCurrentSession = currentToken && *currentToken == lease.Token;
		}
		else
		{
			report.Status = "free";
		}
		out.push_back(std::move(report));
	}
	return out;
}

std::optional<LeaseInfo> PoolObserver::LookupLease(const std::string& token)
{
	auto lease = Store->FindLeaseByToken(token);
	if (!lease)
		return std::nullopt;

	const TimeUs now = Store->NowUs();
	LeaseInfo info;
	info.VisitorAccount = VisitorIdentity::AccountName(lease->Identity);
	info.Expired = lease->ExpiresAtUs <= now;
	if (info.Expired)
	{
		const int64_t minutes = static_cast<int64_t>((now - lease->ExpiresAtUs) / kMicrosPerMinute);
		info.ExpiredMinutesAgo = std::max<int64_t>(minutes, 1);
	}
	info.lease = std::move(*lease);
	return info;
}
