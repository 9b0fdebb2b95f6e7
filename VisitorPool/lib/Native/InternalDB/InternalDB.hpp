#pragma once
#include "Database/Redis/RedisConnection.hpp"
#include "Global/Misc/Singleton.hpp"
#include "Pool/PoolConfig.hpp"

// Shared connection to the pool's Redis. Only the runtimes create it; pool
// components receive a store built on top of Connection().
class InternalDB : public Singleton<InternalDB>
{
	std::shared_ptr<RedisConnection> redis;

   public:
	explicit InternalDB(const PoolConfig::RedisSettings& settings);

	[[nodiscard]] std::shared_ptr<RedisConnection> Connection() const { return redis; }
};
