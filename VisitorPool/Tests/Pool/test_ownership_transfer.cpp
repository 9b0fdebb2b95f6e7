#include "../common/pool_fixture.hpp"
#include "../common/test_check.hpp"
#include "Pool/PoolErrors.hpp"
#include "Pool/Session/MemorySession.hpp"

using namespace std::chrono_literals;

void test_claim_transfers_and_ends_lease()
{
	std::cout << "[TEST] Sign-up takes the workspace and frees the slot" << std::endl;
	test::PoolFixture f(2, 1h);
	MemorySession session;
	const AllocationResult r = f.pool->Allocate(session);
	const std::string token = r.Slot->lease.Token;

	const auto claimed = f.pool->ClaimOnSignup(session, "alice");
	TEST_CHECK(claimed.has_value());
	TEST_CHECK(claimed->ID == r.Slot->workspace.ID);
	TEST_CHECK(claimed->Owner == "alice");
	TEST_CHECK(f.store->GetWorkspace(claimed->ID)->Owner == "alice");
	TEST_CHECK(claimed->Location == "mem://alice/default-project");
	TEST_CHECK(f.store->GetWorkspace(claimed->ID)->Location == "mem://alice/default-project");
	TEST_CHECK(f.hooks->Reverts().empty());

	const auto lease = f.store->FindLeaseByToken(token);
	TEST_CHECK(lease.has_value() && !lease->Active);
	TEST_CHECK(session.Empty());
	TEST_CHECK(f.hooks->Transfers() ==
			   std::vector<std::string>({std::to_string(claimed->ID) + ":visitor-001->alice"}));
	TEST_CHECK(f.pool->Status().Allocated == 0);
}

void test_identity_is_repaired_after_claim()
{
	std::cout << "[TEST] The visitor identity gets a fresh workspace after sign-up" << std::endl;
	test::PoolFixture f(1, 1h);
	MemorySession visitor;
	const AllocationResult r = f.pool->Allocate(visitor);
	TEST_CHECK(f.pool->ClaimOnSignup(visitor, "alice").has_value());

	const auto identity = f.store->GetIdentity(1);
	TEST_CHECK(identity.has_value());
	TEST_CHECK(identity->Workspace != r.Slot->workspace.ID);
	const auto fresh = f.store->GetWorkspace(identity->Workspace);
	TEST_CHECK(fresh.has_value());
	TEST_CHECK(fresh->Owner == "visitor-001");
	TEST_CHECK(fresh->Name == "default-project");

	MemorySession next;
	const AllocationResult n = f.pool->Allocate(next);
	TEST_CHECK(n.Outcome == AllocateOutcome::eAllocated);
	TEST_CHECK(n.Slot->workspace.ID == fresh->ID);
}

void test_failed_repair_leaves_slot_out_of_rotation()
{
	std::cout << "[TEST] Failed re-pairing is logged and fixed by the next init" << std::endl;
	test::PoolFixture f(1, 1h);
	test::LogCapture logs;
	MemorySession visitor;
	TEST_CHECK(f.pool->Allocate(visitor).Ok());

	f.hooks->FailProvision = true;
	TEST_CHECK(f.pool->ClaimOnSignup(visitor, "alice").has_value());
	TEST_CHECK(logs.Contains(Log::Level::Warning, "Re-pairing visitor-001 failed"));

	MemorySession next;
	TEST_CHECK(f.pool->Allocate(next).Outcome == AllocateOutcome::eExhausted);

	f.hooks->FailProvision = false;
	TEST_CHECK(f.pool->InitializePool() == 1);
	TEST_CHECK(f.pool->Allocate(next).Outcome == AllocateOutcome::eAllocated);
}

void test_failing_hook_changes_nothing()
{
	std::cout << "[TEST] A failing transfer step leaves ownership and lease untouched" << std::endl;
	test::PoolFixture f(2, 1h);
	test::LogCapture logs;
	MemorySession session;
	const AllocationResult r = f.pool->Allocate(session);

	f.hooks->FailTransfer = true;
	TEST_CHECK(!f.pool->ClaimOnSignup(session, "mallory").has_value());
	TEST_CHECK(logs.Contains(Log::Level::Error, "disk full while moving workspace"));

	TEST_CHECK(f.store->GetWorkspace(r.Slot->workspace.ID)->Owner == "visitor-001");
	TEST_CHECK(f.store->GetWorkspace(r.Slot->workspace.ID)->Location == r.Slot->workspace.Location);
	TEST_CHECK(f.hooks->Reverts().empty());
	const auto lease = f.store->FindLeaseByToken(r.Slot->lease.Token);
	TEST_CHECK(lease.has_value() && lease->Active);
	TEST_CHECK(f.store->GetIdentity(1)->Workspace == r.Slot->workspace.ID);
	TEST_CHECK(session.Get(SessionKeys::kToken) == r.Slot->lease.Token);

	// Still the same live slot for this visitor.
	TEST_CHECK(f.pool->Allocate(session).Outcome == AllocateOutcome::eReused);

	f.hooks->FailTransfer = false;
	TEST_CHECK(f.pool->ClaimOnSignup(session, "mallory").has_value());
}

void test_claim_without_lease()
{
	std::cout << "[TEST] Sign-up without a visitor lease claims nothing" << std::endl;
	test::PoolFixture f(2, 1h);

	MemorySession fresh;
	TEST_CHECK(!f.pool->ClaimOnSignup(fresh, "bob").has_value());

	MemorySession expired;
	const AllocationResult r = f.pool->Allocate(expired);
	f.clock->Advance(2h);
	TEST_CHECK(!f.pool->ClaimOnSignup(expired, "bob").has_value());
	TEST_CHECK(f.store->GetWorkspace(r.Slot->workspace.ID)->Owner == "visitor-001");
	TEST_CHECK(f.hooks->Transfers().empty());
}

void test_store_reports_conflict()
{
	std::cout << "[TEST] Transfer of a dead lease is a conflict, unknown token is no lease" << std::endl;
	test::PoolFixture f(2, 1h);
	MemorySession session;
	const AllocationResult r = f.pool->Allocate(session);
	const TimeUs now = f.clock->Now();

	bool stepRan = false;
	auto step = [&](const LeasedSlot&)
	{
		stepRan = true;
		return std::string();
	};

	TEST_CHECK(f.store->TransferWorkspace(std::string(64, 'f'), "bob", now, step) ==
			   TransferOutcome::eNoLease);
	TEST_CHECK(f.pool->Release(session));
	TEST_CHECK(f.store->TransferWorkspace(r.Slot->lease.Token, "bob", now, step) ==
			   TransferOutcome::eConflict);
	TEST_CHECK(!stepRan);
	TEST_CHECK(f.store->GetWorkspace(r.Slot->workspace.ID)->Owner == "visitor-001");
}

class StorageFailingStore : public MemoryPoolStore
{
   public:
	using MemoryPoolStore::MemoryPoolStore;
	TransferOutcome TransferWorkspace(const std::string&, const std::string&, TimeUs,
									  const TransferStep&) override
	{
		throw PoolStorageError("connection reset");
	}
};

void test_storage_error_propagates()
{
	std::cout << "[TEST] Storage failures escape ClaimOnSignup" << std::endl;
	test::ManualClock clock;
	auto store = std::make_shared<StorageFailingStore>([&clock] { return clock.Now(); });
	auto hooks = std::make_shared<test::RecordingHooks>();
	VisitorPool pool(store, hooks, test::MakeConfig(1, 1h));
	pool.InitializePool();

	MemorySession session;
	TEST_CHECK(pool.Allocate(session).Ok());
	bool threw = false;
	try
	{
		[[maybe_unused]] const auto claimed = pool.ClaimOnSignup(session, "carol");
	}
	catch (const PoolStorageError&)
	{
		threw = true;
	}
	TEST_CHECK(threw);
}

// Runs the step like a real transaction would, then loses the commit.
class CommitLosingStore : public MemoryPoolStore
{
   public:
	using MemoryPoolStore::MemoryPoolStore;
	bool ThrowOnCommit = false;

	TransferOutcome TransferWorkspace(const std::string& token, const std::string&, TimeUs now,
									  const TransferStep& step) override
	{
		const auto slot = FindLiveSlot(token, now);
		if (!slot)
			return TransferOutcome::eNoLease;
		[[maybe_unused]] const std::string location = step(*slot);
		if (ThrowOnCommit)
			throw PoolStorageError("connection reset during EXEC");
		return TransferOutcome::eConflict;
	}
};

void test_lost_commit_moves_workspace_back()
{
	std::cout << "[TEST] A transfer that does not commit moves the workspace back" << std::endl;
	test::ManualClock clock;
	auto store = std::make_shared<CommitLosingStore>([&clock] { return clock.Now(); });
	auto hooks = std::make_shared<test::RecordingHooks>();
	VisitorPool pool(store, hooks, test::MakeConfig(1, 1h));
	pool.InitializePool();

	MemorySession session;
	const AllocationResult r = pool.Allocate(session);
	const Workspace ws = r.Slot->workspace;
	const std::string expected =
		std::to_string(ws.ID) + ":mem://erin/default-project->" + ws.Location;

	TEST_CHECK(!pool.ClaimOnSignup(session, "erin").has_value());
	TEST_CHECK(hooks->Reverts() == std::vector<std::string>({expected}));
	TEST_CHECK(store->GetWorkspace(ws.ID)->Owner == "visitor-001");
	TEST_CHECK(store->GetWorkspace(ws.ID)->Location == ws.Location);
	TEST_CHECK(session.Get(SessionKeys::kToken) == r.Slot->lease.Token);

	store->ThrowOnCommit = true;
	bool threw = false;
	try
	{
		[[maybe_unused]] const auto claimed = pool.ClaimOnSignup(session, "erin");
	}
	catch (const PoolStorageError&)
	{
		threw = true;
	}
	TEST_CHECK(threw);
	TEST_CHECK(hooks->Reverts().size() == 2);
}

int main()
{
	test_claim_transfers_and_ends_lease();
	test_identity_is_repaired_after_claim();
	test_failed_repair_leaves_slot_out_of_rotation();
	test_failing_hook_changes_nothing();
	test_claim_without_lease();
	test_store_reports_conflict();
	test_storage_error_propagates();
	test_lost_commit_moves_workspace_back();
	std::cout << "[TEST] All ownership transfer tests passed" << std::endl;
	return 0;
}
