#pragma once
#include <memory>

#include "Debug/Log.hpp"
#include "Pool/Session/ISession.hpp"
#include "Pool/VisitorPool.hpp"

/**
 * @brief Request-side glue between a web session and the pool.
 * @details Anonymous browser requests get a visitor slot; sign-up claims the
 * workspace; restart gives the slot back. Exhaustion leaves the request
 * anonymous.
 */
class VisitorSessionBinder
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("VisitorSession");
	std::shared_ptr<VisitorPool> Pool;

   public:
	explicit VisitorSessionBinder(std::shared_ptr<VisitorPool> pool);

	/// Crawlers, link previews and scripted clients never get a slot.
	[[nodiscard]] static bool LooksLikeBrowser(std::string_view userAgent);

	std::optional<LeasedSlot> OnAnonymousRequest(ISession& session, std::string_view userAgent);
	std::optional<Workspace> OnSignup(ISession& session, const std::string& account);
	bool OnRestartSession(ISession& session);
};
