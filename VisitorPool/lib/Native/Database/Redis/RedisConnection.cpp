#include "RedisConnection.hpp"

#include <hiredis/read.h>

#include <array>
#include <charconv>
#include <iterator>
#include <stdexcept>
#include <string_view>
#include <type_traits>

bool RedisConnection::Exists(std::string_view key) const
{
	return WithSync([&](auto& r) -> long long { return r.exists(key); }) != 0;
}
long long RedisConnection::Del(std::string_view key) const
{
	return WithSync([&](auto& r) -> long long { return r.del(key); });
}
std::optional<std::string> RedisConnection::Get(std::string_view key) const
{
	return WithSync([&](auto& r) -> std::optional<std::string> { return r.get(key); });
}
bool RedisConnection::SetIfAbsent(std::string_view key, std::string_view value,
								  std::chrono::milliseconds ttl) const
{
	return WithSync([&](auto& r) -> bool
					{ return r.set(key, value, ttl, sw::redis::UpdateType::NOT_EXIST); });
}
long long RedisConnection::Incr(std::string_view key) const
{
	return WithSync([&](auto& r) -> long long { return r.incr(key); });
}

// =====================
// Hashes
// =====================

long long RedisConnection::HSet(std::string_view key, std::string_view field,
								std::string_view value) const
{
	return WithSync([&](auto& r) -> long long { return r.hset(key, field, value); });
}

void RedisConnection::HSetMany(std::string_view key,
							   const std::vector<std::pair<std::string, std::string>>& fields) const
{
	if (fields.empty())
		return;
	[[maybe_unused]] const long long added =
		WithSync([&](auto& r) -> long long { return r.hset(key, fields.begin(), fields.end()); });
}

std::optional<std::string> RedisConnection::HGet(std::string_view key,
												 std::string_view field) const
{
	return WithSync([&](auto& r) -> std::optional<std::string> { return r.hget(key, field); });
}

std::unordered_map<std::string, std::string> RedisConnection::HGetAll(std::string_view key) const
{
	std::unordered_map<std::string, std::string> out;
	WithSync([&](auto& r) { r.hgetall(key, std::inserter(out, out.end())); });
	return out;
}

// =====================
// Sets
// =====================

long long RedisConnection::SAdd(std::string_view key,
								const std::vector<std::string_view>& members) const
{
	return WithSync(
		[&](auto& r) -> long long
		{
			if (members.empty())
				return 0LL;
			return r.sadd(key, members.begin(), members.end());
		});
}

std::vector<std::string> RedisConnection::SMembers(std::string_view key) const
{
	return WithSync(
		[&](auto& r) -> std::vector<std::string>
		{
			std::vector<std::string> out;
			r.smembers(key, std::back_inserter(out));
			return out;
		});
}

// =====================
// Scripting
// =====================

std::vector<std::string> RedisConnection::EvalStrings(std::string_view script,
													  const std::vector<std::string>& keys,
													  const std::vector<std::string>& args) const
{
	return WithSync(
		[&](auto& r) -> std::vector<std::string>
		{
			std::vector<std::string> out;
			r.eval(script, keys.begin(), keys.end(), args.begin(), args.end(),
				   std::back_inserter(out));
			return out;
		});
}

RedisConnection::RedisTime RedisConnection::GetTimeNow() const
{
	// Redis TIME command returns: [seconds, microseconds]
	const std::array<std::string, 1> args = {"TIME"};
	auto res = WithSync(
		[&](auto& r) -> sw::redis::ReplyUPtr
		{
			if constexpr (std::is_same_v<std::decay_t<decltype(r)>, sw::redis::RedisCluster>)
			{
				// TIME carries no key; ask the node that owns the pool's hash slot.
				auto node = r.redis("{VisitorPool}", false);
				return node.command(args.begin(), args.end());
			}
			else
			{
				return r.command(args.begin(), args.end());
			}
		});
	if (!res || res->type != REDIS_REPLY_ARRAY || res->elements < 1)
	{
		throw sw::redis::ProtoError("unexpected reply to TIME");
	}
	const redisReply* secReply = res->element[0];
	RedisTime out{0, 0};
	std::from_chars(secReply->str, secReply->str + secReply->len, out.seconds);
	if (res->elements >= 2)
	{
		const redisReply* usecReply = res->element[1];
		std::from_chars(usecReply->str, usecReply->str + usecReply->len, out.microseconds);
	}
	return out;
}

uint64_t RedisConnection::GetTimeNowUs() const
{
	const auto t = GetTimeNow();
	return static_cast<uint64_t>(t.seconds) * 1000000ULL + static_cast<uint64_t>(t.microseconds);
}
