#pragma once
#include <sw/redis++/redis++.h>
#include <sw/redis++/redis.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

class RedisConnection
{
	bool IsCluster = false;

	std::unique_ptr<sw::redis::Redis> Handle;
	std::unique_ptr<sw::redis::RedisCluster> HandleCluster;

   public:
	template <class F>
	[[nodiscard]] decltype(auto) WithSync(F&& f) const
	{
		if (IsCluster)
			return std::forward<F>(f)(*HandleCluster);
		return std::forward<F>(f)(*Handle);
	}

	explicit RedisConnection(std::unique_ptr<sw::redis::Redis> redis)
		: IsCluster(false), Handle(std::move(redis))
	{
	}

	explicit RedisConnection(std::unique_ptr<sw::redis::RedisCluster> cluster)
		: IsCluster(true), HandleCluster(std::move(cluster))
	{
	}

	[[nodiscard]] bool Cluster() const { return IsCluster; }

	// -------------------------
	// Keys / strings
	// -------------------------
	/**
	 * @brief Test whether a key exists.
	 */
	[[nodiscard]] bool Exists(std::string_view key) const;

	/**
	 * @brief Delete a key.
	 * @details Maps to Redis DEL. Returns number of keys removed (0 or 1 here).
	 */
	[[nodiscard]] long long Del(std::string_view key) const;

	/**
	 * @brief Get the string value of a key.
	 * @return std::optional<std::string> with a value if the key exists,
	 * otherwise empty.
	 */
	[[nodiscard]] std::optional<std::string> Get(std::string_view key) const;

	/**
	 * @brief SET key value NX PX ttl.
	 * @return true if the key was created by this call.
	 */
	[[nodiscard]] bool SetIfAbsent(std::string_view key, std::string_view value,
								   std::chrono::milliseconds ttl) const;

	/**
	 * @brief Atomically increment an integer key (INCR).
	 * @return The value after the increment.
	 */
	[[nodiscard]] long long Incr(std::string_view key) const;

	// =========================================================================
	// Hashes
	// =========================================================================

	/**
	 * @brief Set a single field in a hash (HSET).
	 * @return 1 if the field is new, 0 if it was overwritten.
	 */
	[[nodiscard]] long long HSet(std::string_view key, std::string_view field,
								 std::string_view value) const;

	/**
	 * @brief Set several fields of a hash in one round trip.
	 */
	void HSetMany(std::string_view key,
				  const std::vector<std::pair<std::string, std::string>>& fields) const;

	/**
	 * @brief Get a single field from a hash (HGET).
	 * @return empty if the field does not exist.
	 */
	[[nodiscard]] std::optional<std::string> HGet(std::string_view key,
												  std::string_view field) const;

	// Returns all fields + values.
	[[nodiscard]] std::unordered_map<std::string, std::string> HGetAll(std::string_view key) const;

	// =========================================================================
	// Sets
	// =========================================================================

	/**
	 * @brief Add one or more members to a set (SADD).
	 * @return Number of elements actually added (excluding existing ones).
	 */
	[[nodiscard]] long long SAdd(std::string_view key,
								 const std::vector<std::string_view>& members) const;

	/**
	 * @brief Get all members of a set (SMEMBERS).
	 */
	[[nodiscard]] std::vector<std::string> SMembers(std::string_view key) const;

	// =========================================================================
	// Scripting
	// =========================================================================

	/**
	 * @brief Run a Lua script (EVAL) whose reply is a flat array of strings.
	 * @details Scripts must always reply with an array (possibly empty); a nil
	 * reply is a protocol error here. In Cluster, every key must share one
	 * hash slot.
	 */
	[[nodiscard]] std::vector<std::string> EvalStrings(std::string_view script,
													   const std::vector<std::string>& keys,
													   const std::vector<std::string>& args) const;

	struct RedisTime
	{
		int64_t seconds;
		int64_t microseconds;
	};
	/// @brief Get current Redis server time (authoritative).
	[[nodiscard]] RedisTime GetTimeNow() const;

	/// @brief Server time as microseconds since the Unix epoch.
	[[nodiscard]] uint64_t GetTimeNowUs() const;
};
