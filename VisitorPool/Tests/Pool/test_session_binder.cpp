#include "../common/pool_fixture.hpp"
#include "../common/test_check.hpp"
#include "Pool/Session/MemorySession.hpp"
#include "Pool/Session/VisitorSessionBinder.hpp"

using namespace std::chrono_literals;

namespace
{
constexpr std::string_view kFirefox =
	"Mozilla/5.0 (X11; Linux x86_64; rv:128.0) Gecko/20100101 Firefox/128.0";
constexpr std::string_view kChrome =
	"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
	"Chrome/126.0.0.0 Safari/537.36";
}  // namespace

void test_browser_check()
{
	std::cout << "[TEST] Browser check lets browsers through and stops bots" << std::endl;
	TEST_CHECK(VisitorSessionBinder::LooksLikeBrowser(kFirefox));
	TEST_CHECK(VisitorSessionBinder::LooksLikeBrowser(kChrome));

	TEST_CHECK(!VisitorSessionBinder::LooksLikeBrowser(""));
	TEST_CHECK(!VisitorSessionBinder::LooksLikeBrowser("curl/8.5.0"));
	TEST_CHECK(!VisitorSessionBinder::LooksLikeBrowser("python-requests/2.31.0"));
	TEST_CHECK(!VisitorSessionBinder::LooksLikeBrowser(
		"Mozilla/5.0 (compatible; Googlebot/2.1; +http://www.google.com/bot.html)"));
	TEST_CHECK(!VisitorSessionBinder::LooksLikeBrowser(
		"Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
		"HeadlessChrome/120.0.0.0 Safari/537.36"));
	TEST_CHECK(!VisitorSessionBinder::LooksLikeBrowser(
		"facebookexternalhit/1.1 (+http://www.facebook.com/externalhit_uatext.php)"));
}

void test_anonymous_request_allocates_for_browsers_only()
{
	std::cout << "[TEST] Only browser requests take a slot" << std::endl;
	test::PoolFixture f(2, 1h);
	VisitorSessionBinder binder(f.pool);

	MemorySession crawler;
	TEST_CHECK(!binder.OnAnonymousRequest(crawler, "Googlebot/2.1").has_value());
	TEST_CHECK(crawler.Empty());
	TEST_CHECK(f.pool->Status().Allocated == 0);

	MemorySession visitor;
	const auto slot = binder.OnAnonymousRequest(visitor, kFirefox);
	TEST_CHECK(slot.has_value());
	TEST_CHECK(slot->identity.Number == 1);
	TEST_CHECK(visitor.Get(SessionKeys::kUserID) == "1");

	const auto again = binder.OnAnonymousRequest(visitor, kFirefox);
	TEST_CHECK(again.has_value());
	TEST_CHECK(again->lease.Token == slot->lease.Token);
}

void test_exhaustion_leaves_request_anonymous()
{
	std::cout << "[TEST] Exhausted pool lets the request continue anonymously" << std::endl;
	test::PoolFixture f(1, 1h);
	test::LogCapture logs;
	VisitorSessionBinder binder(f.pool);

	MemorySession first, second;
	TEST_CHECK(binder.OnAnonymousRequest(first, kChrome).has_value());
	TEST_CHECK(!binder.OnAnonymousRequest(second, kChrome).has_value());
	TEST_CHECK(second.Empty());
	TEST_CHECK(logs.Contains(Log::Level::Warning, "continuing anonymously"));
}

void test_signup_and_restart()
{
	std::cout << "[TEST] Sign-up claims the workspace, restart gives the slot back" << std::endl;
	test::PoolFixture f(2, 1h);
	VisitorSessionBinder binder(f.pool);

	MemorySession visitor;
	const auto slot = binder.OnAnonymousRequest(visitor, kFirefox);
	const auto claimed = binder.OnSignup(visitor, "erin");
	TEST_CHECK(claimed.has_value());
	TEST_CHECK(claimed->ID == slot->workspace.ID);
	TEST_CHECK(claimed->Owner == "erin");
	TEST_CHECK(visitor.Empty());

	MemorySession restarting;
	TEST_CHECK(binder.OnAnonymousRequest(restarting, kFirefox).has_value());
	TEST_CHECK(f.pool->Status().Allocated == 1);
	TEST_CHECK(binder.OnRestartSession(restarting));
	TEST_CHECK(restarting.Empty());
	TEST_CHECK(f.pool->Status().Allocated == 0);
	TEST_CHECK(!binder.OnRestartSession(restarting));
}

int main()
{
	test_browser_check();
	test_anonymous_request_allocates_for_browsers_only();
	test_exhaustion_leaves_request_anonymous();
	test_signup_and_restart();
	std::cout << "[TEST] All session binder tests passed" << std::endl;
	return 0;
}
