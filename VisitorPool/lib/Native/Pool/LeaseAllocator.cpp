#include "LeaseAllocator.hpp"

#include "Pool/LeaseToken.hpp"

LeaseAllocator::LeaseAllocator(std::shared_ptr<IPoolStore> store,
							   std::shared_ptr<LeaseReclaimer> reclaimer, uint32_t poolSize,
							   std::chrono::microseconds lifetime)
	: Store(std::move(store)), Reclaimer(std::move(reclaimer)), PoolSize(poolSize), Lifetime(lifetime)
{
	if (!Store || !Reclaimer)
	{
		throw std::invalid_argument("LeaseAllocator needs a store and a reclaimer");
	}
	if (Lifetime.count() <= 0)
	{
		throw std::invalid_argument("Lease lifetime must be positive");
	}
}

std::optional<LeasedSlot> LeaseAllocator::TryClaim(const ISession& session, TimeUs now)
{
	LeaseRequest request;
	request.Token = LeaseToken::Generate();
	request.SessionKey = session.SessionKey();
	request.NowUs = now;
	request.LifetimeUs = static_cast<TimeUs>(Lifetime.count());
	return Store->ClaimFreeSlot(PoolSize, request);
}

AllocationResult LeaseAllocator::Allocate(ISession& session)
{
	TimeUs now = Store->NowUs();

	if (const auto token = session.Get(SessionKeys::kToken))
	{
		if (auto slot = Store->FindLiveSlot(*token, now))
		{
			return AllocationResult{AllocateOutcome::eReused, std::move(slot)};
		}
		logger->WarningFormatted("Invalid or expired allocation token: {}...", token->substr(0, 8));
		session.ClearVisitor();
	}

	auto slot = TryClaim(session, now);
	if (!slot)
	{
		const uint32_t freed = Reclaimer->ReclaimScoped(PoolSize);
		logger->DebugFormatted("No free slot, reclaimed {} expired lease(s) before retrying", freed);
		now = Store->NowUs();
		slot = TryClaim(session, now);
	}
	if (!slot)
	{
		logger->WarningFormatted("Pool exhausted - all {} slots in use", PoolSize);
		return AllocationResult{AllocateOutcome::eExhausted, std::nullopt};
	}

	session.BindVisitor(*slot);
	logger->DebugFormatted("Allocated {} to session {}...", slot->identity.Account,
						   session.SessionKey().substr(0, 8));
	return AllocationResult{AllocateOutcome::eAllocated, std::move(slot)};
}

bool LeaseAllocator::Release(ISession& session)
{
	const auto token = session.Get(SessionKeys::kToken);
	if (!token)
		return false;
	const bool released = Reclaimer->ReleaseLease(*token);
	session.ClearVisitor();
	return released;
}
