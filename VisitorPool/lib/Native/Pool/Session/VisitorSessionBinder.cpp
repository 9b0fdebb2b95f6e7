#include "VisitorSessionBinder.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace
{
constexpr std::array<std::string_view, 12> kBotMarkers = {
	"bot", "crawl", "spider", "slurp", "curl", "wget",
	"python", "java/", "headless", "facebookexternalhit", "preview", "monitor"};
}

VisitorSessionBinder::VisitorSessionBinder(std::shared_ptr<VisitorPool> pool) : Pool(std::move(pool))
{
	if (!Pool)
	{
		throw std::invalid_argument("VisitorSessionBinder needs a pool");
	}
}

bool VisitorSessionBinder::LooksLikeBrowser(std::string_view userAgent)
{
	if (!userAgent.starts_with("Mozilla/"))
		return false;

	std::string lowered(userAgent);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
				   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return std::none_of(kBotMarkers.begin(), kBotMarkers.end(), [&](std::string_view marker)
						{ return lowered.find(marker) != std::string::npos; });
}

std::optional<LeasedSlot> VisitorSessionBinder::OnAnonymousRequest(ISession& session,
																	std::string_view userAgent)
{
	if (!LooksLikeBrowser(userAgent))
	{
		logger->DebugFormatted("Not allocating for non-browser client '{}'", userAgent);
		return std::nullopt;
	}

	AllocationResult result = Pool->Allocate(session);
	if (!result.Ok())
	{
		logger->Warning("Visitor pool exhausted, continuing anonymously");
		return std::nullopt;
	}
	return std::move(result.Slot);
}

std::optional<Workspace> VisitorSessionBinder::OnSignup(ISession& session, const std::string& account)
{
	return Pool->ClaimOnSignup(session, account);
}

bool VisitorSessionBinder::OnRestartSession(ISession& session)
{
	return Pool->Release(session);
}
