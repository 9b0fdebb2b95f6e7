#include <set>
#include <thread>

#include "../common/pool_fixture.hpp"
#include "../common/test_check.hpp"
#include "Pool/LeaseToken.hpp"
#include "Pool/Session/MemorySession.hpp"

using namespace std::chrono_literals;

void test_first_allocation_binds_lowest_slot()
{
	std::cout << "[TEST] First allocation binds the lowest slot" << std::endl;
	test::PoolFixture f;
	MemorySession session;

	const AllocationResult r = f.pool->Allocate(session);
	TEST_CHECK(r.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(r.Slot.has_value());
	TEST_CHECK(r.Slot->identity.Number == 1);
	TEST_CHECK(r.Slot->identity.Account == "visitor-001");
	TEST_CHECK(r.Slot->workspace.Owner == "visitor-001");
	TEST_CHECK(r.Slot->workspace.Name == "default-project");
	TEST_CHECK(r.Slot->lease.Active);
	TEST_CHECK(r.Slot->lease.ExpiresAtUs - r.Slot->lease.CreatedAtUs == 3600ULL * 1000000ULL);
	TEST_CHECK(r.Slot->lease.CreatedAtUs == f.clock->Now());
	TEST_CHECK(LeaseToken::LooksValid(r.Slot->lease.Token));
	TEST_CHECK(r.Slot->lease.SessionKey == session.SessionKey());

	TEST_CHECK(session.Get(SessionKeys::kToken) == r.Slot->lease.Token);
	TEST_CHECK(session.Get(SessionKeys::kUserID) == "1");
	TEST_CHECK(session.Get(SessionKeys::kProjectID) == std::to_string(r.Slot->workspace.ID));
}

void test_reentry_reuses_lease()
{
	std::cout << "[TEST] Same session gets the same slot back" << std::endl;
	test::PoolFixture f;
	MemorySession session;

	const AllocationResult first = f.pool->Allocate(session);
	f.clock->Advance(10min);
	const AllocationResult second = f.pool->Allocate(session);

	TEST_CHECK(first.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(second.Outcome == AllocateOutcome::eReused);
	TEST_CHECK(second.Slot->identity.Number == first.Slot->identity.Number);
	TEST_CHECK(second.Slot->lease.Token == first.Slot->lease.Token);
	TEST_CHECK(second.Slot->lease.ExpiresAtUs == first.Slot->lease.ExpiresAtUs);
	TEST_CHECK(f.store->LeaseCount() == 1);
}

void test_expired_token_gets_fresh_lease()
{
	std::cout << "[TEST] Expired token is dropped and a new lease issued" << std::endl;
	test::PoolFixture f;
	test::LogCapture logs;
	MemorySession session;

	const AllocationResult first = f.pool->Allocate(session);
	f.clock->Advance(61min);
	const AllocationResult second = f.pool->Allocate(session);

	TEST_CHECK(second.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(second.Slot->lease.Token != first.Slot->lease.Token);
	TEST_CHECK(session.Get(SessionKeys::kToken) == second.Slot->lease.Token);
	TEST_CHECK(logs.Contains(Log::Level::Warning, "Invalid or expired allocation token"));
	// Slot 1 was stale, so the claim took it over and retired the old lease.
	TEST_CHECK(second.Slot->identity.Number == 1);
	const auto old = f.store->FindLeaseByToken(first.Slot->lease.Token);
	TEST_CHECK(old.has_value());
	TEST_CHECK(!old->Active);
	TEST_CHECK(f.pool->Status().Allocated == 1);
}

void test_unknown_token_gets_fresh_lease()
{
	std::cout << "[TEST] Unknown token is cleared before allocating" << std::endl;
	test::PoolFixture f;
	MemorySession session;
	session.Set(SessionKeys::kToken, "not-a-token");
	session.Set(SessionKeys::kUserID, "3");

	const AllocationResult r = f.pool->Allocate(session);
	TEST_CHECK(r.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(session.Get(SessionKeys::kToken) == r.Slot->lease.Token);
	TEST_CHECK(session.Get(SessionKeys::kUserID) == "1");
}

void test_exhaustion_and_recovery()
{
	std::cout << "[TEST] N+1th session is turned away until a lease expires" << std::endl;
	test::PoolFixture f(4, 1h);
	std::vector<MemorySession> sessions(5);

	TEST_CHECK(f.pool->Allocate(sessions[0]).Outcome == AllocateOutcome::eAllocated);
	f.clock->Advance(30min);
	for (int i = 1; i < 4; ++i)
		TEST_CHECK(f.pool->Allocate(sessions[i]).Outcome == AllocateOutcome::eAllocated);

	const AllocationResult turnedAway = f.pool->Allocate(sessions[4]);
	TEST_CHECK(turnedAway.Outcome == AllocateOutcome::eExhausted);
	TEST_CHECK(!turnedAway.Slot.has_value());
	TEST_CHECK(!turnedAway.Ok());
	TEST_CHECK(sessions[4].Empty());

	// Only the first lease has run out.
	f.clock->Advance(31min);
	TEST_CHECK(f.pool->ReclaimExpired() == 1);
	const AllocationResult r = f.pool->Allocate(sessions[4]);
	TEST_CHECK(r.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(r.Slot->identity.Number == 1);
}

void test_stale_lease_is_taken_over()
{
	std::cout << "[TEST] A slot whose lease ran out is claimable before any sweep" << std::endl;
	test::PoolFixture f(2, 1h);
	MemorySession a, b, c;
	TEST_CHECK(f.pool->Allocate(a).Ok());
	TEST_CHECK(f.pool->Allocate(b).Ok());

	f.clock->Advance(2h);
	const AllocationResult r = f.pool->Allocate(c);
	TEST_CHECK(r.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(r.Slot->identity.Number == 1);
	const PoolStatus status = f.pool->Status();
	TEST_CHECK(status.Allocated == 1);
	TEST_CHECK(status.Expired == 1);
	const auto old = f.store->FindLeaseByToken(*a.Get(SessionKeys::kToken));
	TEST_CHECK(old.has_value() && !old->Active);
}

void test_skips_transferred_identity()
{
	std::cout << "[TEST] Identity without its own workspace is not handed out" << std::endl;
	test::PoolFixture f(2, 1h);
	auto identity = f.store->GetIdentity(1);
	TEST_CHECK(identity.has_value());
	// Point identity 1 at a workspace somebody else owns.
	const Workspace foreign = f.store->CreateWorkspace("alice", "default-project", "mem://alice");
	const WorkspaceID previous = identity->Workspace;
	identity->Workspace = foreign.ID;
	TEST_CHECK(f.store->PairIdentity(*identity, previous));

	MemorySession session;
	const AllocationResult r = f.pool->Allocate(session);
	TEST_CHECK(r.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(r.Slot->identity.Number == 2);

	MemorySession other;
	TEST_CHECK(f.pool->Allocate(other).Outcome == AllocateOutcome::eExhausted);
}

void test_concurrent_allocation_is_exclusive()
{
	std::cout << "[TEST] Concurrent allocations never share a slot" << std::endl;
	Log::SetMuted(true);
	test::PoolFixture f(4, 1h);

	constexpr int kThreads = 32;
	std::vector<MemorySession> sessions(kThreads);
	std::vector<AllocationResult> results(kThreads);
	std::atomic_bool go = false;
	{
		std::vector<std::jthread> threads;
		for (int i = 0; i < kThreads; ++i)
		{
			threads.emplace_back(
				[&, i]
				{
					while (!go)
						std::this_thread::yield();
					results[i] = f.pool->Allocate(sessions[i]);
				});
		}
		go = true;
	}
	Log::SetMuted(false);

	std::set<IdentityNumber> numbers;
	std::set<std::string> tokens;
	int allocated = 0;
	int exhausted = 0;
	for (const auto& r : results)
	{
		if (r.Outcome == AllocateOutcome::eAllocated)
		{
			++allocated;
			numbers.insert(r.Slot->identity.Number);
			tokens.insert(r.Slot->lease.Token);
		}
		else
		{
			TEST_CHECK(r.Outcome == AllocateOutcome::eExhausted);
			++exhausted;
		}
	}
	TEST_CHECK(allocated == 4);
	TEST_CHECK(exhausted == kThreads - 4);
	TEST_CHECK(numbers == std::set<IdentityNumber>({1, 2, 3, 4}));
	TEST_CHECK(tokens.size() == 4);
	TEST_CHECK(f.store->LeaseCount() == 4);
	TEST_CHECK(f.pool->Status().Allocated == 4);
}

void test_concurrent_churn_keeps_one_lease_per_slot()
{
	std::cout << "[TEST] Allocate/release churn keeps one active lease per slot" << std::endl;
	Log::SetMuted(true);
	test::PoolFixture f(3, 1h);

	constexpr int kThreads = 8;
	constexpr int kRounds = 200;
	std::atomic_bool violated = false;
	{
		std::vector<std::jthread> threads;
		for (int t = 0; t < kThreads; ++t)
		{
			threads.emplace_back(
				[&]
				{
					for (int i = 0; i < kRounds; ++i)
					{
						MemorySession session;
						const AllocationResult r = f.pool->Allocate(session);
						if (f.store->CountActiveLeases(f.clock->Now()).Allocated > 3)
							violated = true;
						if (r.Ok())
							f.pool->Release(session);
					}
				});
		}
	}
	Log::SetMuted(false);

	TEST_CHECK(!violated);
	TEST_CHECK(f.store->GetSlotLeases().empty());
	TEST_CHECK(f.pool->Status().Allocated == 0);
}

void test_release_frees_slot()
{
	std::cout << "[TEST] Release ends the lease and clears the session" << std::endl;
	test::PoolFixture f(1, 1h);
	test::LogCapture logs;
	MemorySession a, b;

	TEST_CHECK(f.pool->Allocate(a).Ok());
	TEST_CHECK(f.pool->Allocate(b).Outcome == AllocateOutcome::eExhausted);
	TEST_CHECK(f.pool->Release(a));
	TEST_CHECK(a.Empty());
	TEST_CHECK(f.hooks->Reclaims() == std::vector<std::string>({"visitor-001"}));
	TEST_CHECK(f.pool->Allocate(b).Outcome == AllocateOutcome::eAllocated);

	// Second release of a dead token only warns.
	MemorySession stale;
	stale.Set(SessionKeys::kToken, std::string(64, 'a'));
	stale.Set(SessionKeys::kProjectID, "1");
	TEST_CHECK(!f.pool->Release(stale));
	TEST_CHECK(stale.Empty());
	TEST_CHECK(logs.Contains(Log::Level::Warning, "Lease not found for token: aaaaaaaa"));
}

void test_example_scenario()
{
	std::cout << "[TEST] Four slots, one hour leases, fifth visitor waits" << std::endl;
	test::PoolFixture f(4, 1h);
	std::vector<MemorySession> s(5);

	std::set<IdentityNumber> numbers;
	for (int i = 0; i < 4; ++i)
	{
		const AllocationResult r = f.pool->Allocate(s[i]);
		TEST_CHECK(r.Outcome == AllocateOutcome::eAllocated);
		numbers.insert(r.Slot->identity.Number);
	}
	TEST_CHECK(numbers == std::set<IdentityNumber>({1, 2, 3, 4}));
	TEST_CHECK(f.pool->Allocate(s[4]).Outcome == AllocateOutcome::eExhausted);

	f.clock->Advance(2h);
	TEST_CHECK(f.pool->ReclaimExpired() == 4);

	const AllocationResult r = f.pool->Allocate(s[4]);
	TEST_CHECK(r.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(numbers.count(r.Slot->identity.Number) == 1);
}

int main()
{
	test_first_allocation_binds_lowest_slot();
	test_reentry_reuses_lease();
	test_expired_token_gets_fresh_lease();
	test_unknown_token_gets_fresh_lease();
	test_exhaustion_and_recovery();
	test_stale_lease_is_taken_over();
	test_skips_transferred_identity();
	test_concurrent_allocation_is_exclusive();
	test_concurrent_churn_keeps_one_lease_per_slot();
	test_release_frees_slot();
	test_example_scenario();
	std::cout << "[TEST] All lease allocator tests passed" << std::endl;
	return 0;
}
