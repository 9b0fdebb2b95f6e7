#pragma once
#include <map>

#include "Pool/LeaseToken.hpp"
#include "Pool/Session/ISession.hpp"

class MemorySession : public ISession
{
	std::string Key;
	std::map<std::string, std::string, std::less<>> Values;

   public:
	MemorySession() : Key(LeaseToken::Generate().substr(0, 32)) {}
	explicit MemorySession(std::string key) : Key(std::move(key)) {}

	std::string SessionKey() const override { return Key; }

	std::optional<std::string> Get(std::string_view key) const override
	{
		auto it = Values.find(key);
		if (it == Values.end())
			return std::nullopt;
		return it->second;
	}
	void Set(std::string_view key, std::string value) override
	{
		Values.insert_or_assign(std::string(key), std::move(value));
	}
	void Erase(std::string_view key) override
	{
		auto it = Values.find(key);
		if (it != Values.end())
			Values.erase(it);
	}

	[[nodiscard]] bool Empty() const { return Values.empty(); }
};
