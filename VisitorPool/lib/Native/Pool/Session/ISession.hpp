#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "Pool/PoolTypes.hpp"

/// Per-visitor key/value state carried between requests.
class ISession
{
   public:
	virtual ~ISession() = default;

	[[nodiscard]] virtual std::string SessionKey() const = 0;
	[[nodiscard]] virtual std::optional<std::string> Get(std::string_view key) const = 0;
	virtual void Set(std::string_view key, std::string value) = 0;
	virtual void Erase(std::string_view key) = 0;

	void BindVisitor(const LeasedSlot& slot)
	{
		Set(SessionKeys::kToken, slot.lease.Token);
		Set(SessionKeys::kUserID, std::to_string(slot.identity.Number));
		Set(SessionKeys::kProjectID, std::to_string(slot.workspace.ID));
	}
	void ClearVisitor()
	{
		Erase(SessionKeys::kToken);
		Erase(SessionKeys::kUserID);
		Erase(SessionKeys::kProjectID);
	}
};
