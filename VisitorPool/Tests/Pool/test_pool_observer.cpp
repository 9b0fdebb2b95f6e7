#include "../common/pool_fixture.hpp"
#include "../common/test_check.hpp"
#include "Pool/Session/MemorySession.hpp"

using namespace std::chrono_literals;

void test_status_counts()
{
	std::cout << "[TEST] Status splits allocated, free and expired" << std::endl;
	test::PoolFixture f(4, 1h);

	PoolStatus status = f.pool->Status();
	TEST_CHECK(status.Total == 4);
	TEST_CHECK(status.Allocated == 0);
	TEST_CHECK(status.Free == 4);
	TEST_CHECK(status.Expired == 0);

	MemorySession a, b, c;
	TEST_CHECK(f.pool->Allocate(a).Ok());
	TEST_CHECK(f.pool->Allocate(b).Ok());
	f.clock->Advance(50min);
	TEST_CHECK(f.pool->Allocate(c).Ok());
	f.clock->Advance(20min);

	status = f.pool->Status();
	TEST_CHECK(status.Total == 4);
	TEST_CHECK(status.Allocated == 1);
	TEST_CHECK(status.Free == 3);
	TEST_CHECK(status.Expired == 2);

	const Json j = status.ToJson();
	TEST_CHECK(j["total"] == 4);
	TEST_CHECK(j["allocated"] == 1);
	TEST_CHECK(j["free"] == 3);
	TEST_CHECK(j["expired"] == 2);
}

void test_describe_slots()
{
	std::cout << "[TEST] Slot report marks the caller's own slot" << std::endl;
	test::PoolFixture f(3, 1h);
	MemorySession a, b;
	TEST_CHECK(f.pool->Allocate(a).Ok());
	TEST_CHECK(f.pool->Allocate(b).Ok());
	f.clock->Advance(15min);

	const auto slots = f.pool->DescribeSlots(b.Get(SessionKeys::kToken));
	TEST_CHECK(slots.size() == 3);

	TEST_CHECK(slots[0].Number == 1);
	TEST_CHECK(slots[0].Status == "allocated");
	TEST_CHECK(slots[0].VisitorAccount == "visitor-001");
	TEST_CHECK(slots[0].MinutesRemaining == 45);
	TEST_CHECK(!slots[0].IsCurrentSession);

	TEST_CHECK(slots[1].Status == "allocated");
	TEST_CHECK(slots[1].IsCurrentSession);
	TEST_CHECK(slots[1].ExpiresAtUs.has_value());

	TEST_CHECK(slots[2].Status == "free");
	TEST_CHECK(slots[2].VisitorAccount == "visitor-003");
	TEST_CHECK(!slots[2].ExpiresAtUs.has_value());
	TEST_CHECK(!slots[2].MinutesRemaining.has_value());

	// A lease past its expiry shows as free even before the sweep.
	f.clock->Advance(1h);
	for (const auto& slot : f.pool->DescribeSlots())
		TEST_CHECK(slot.Status == "free");

	const Json j = slots[2].ToJson();
	TEST_CHECK(j["status"] == "free");
	TEST_CHECK(j["expires_at_us"].is_null());
}

void test_lookup_lease()
{
	std::cout << "[TEST] Lookup reports how long ago a lease expired" << std::endl;
	test::PoolFixture f(2, 1h);
	MemorySession session;
	const AllocationResult r = f.pool->Allocate(session);
	const std::string token = r.Slot->lease.Token;

	auto info = f.pool->LookupLease(token);
	TEST_CHECK(info.has_value());
	TEST_CHECK(!info->Expired);
	TEST_CHECK(!info->ExpiredMinutesAgo.has_value());
	TEST_CHECK(info->VisitorAccount == "visitor-001");

	// Just expired still reads as one minute ago.
	f.clock->Advance(1h + 10s);
	info = f.pool->LookupLease(token);
	TEST_CHECK(info->Expired);
	TEST_CHECK(info->ExpiredMinutesAgo == 1);

	f.clock->Advance(25min);
	TEST_CHECK(f.pool->ReclaimExpired() == 1);
	info = f.pool->LookupLease(token);
	TEST_CHECK(info.has_value());
	TEST_CHECK(!info->lease.Active);
	TEST_CHECK(info->ExpiredMinutesAgo == 25);

	TEST_CHECK(!f.pool->LookupLease(std::string(64, '0')).has_value());
}

int main()
{
	test_status_counts();
	test_describe_slots();
	test_lookup_lease();
	std::cout << "[TEST] All pool observer tests passed" << std::endl;
	return 0;
}
