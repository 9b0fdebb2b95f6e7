#include "Redis.hpp"

#include <sw/redis++/connection.h>
#include <sw/redis++/redis.h>
#include <sw/redis++/redis_cluster.h>

#include <format>
#include <iostream>
#include <memory>
#include <thread>

std::shared_ptr<RedisConnection> Redis::Connect(const Options& in_options, uint32_t max_retries,
												uint32_t retry_interval_ms)
{
	std::lock_guard<std::mutex> lock(connections_mutex);
	{
		auto it = redis_connections.find(in_options);
		if (it != redis_connections.end())
		{
			if (auto cached = it->second.lock())
				return cached;
		}
	}

	sw::redis::ConnectionOptions options;
	options.host = in_options.host;
	options.port = in_options.port;
	options.connect_timeout = in_options.ConnectTimeout;
	options.socket_timeout = in_options.SocketTimeout;

	sw::redis::ConnectionPoolOptions pool;
	pool.size = in_options.PoolSize;
	pool.wait_timeout = in_options.SocketTimeout;

	uint32_t attempt = 0;

	for (;;)
	{
		try
		{
			std::shared_ptr<RedisConnection> redisC;

			if (in_options.IsCluster)
			{
				auto handle = std::make_unique<sw::redis::RedisCluster>(options, pool);
				handle->redis("{VisitorPool}", false).ping();
				redisC = std::make_shared<RedisConnection>(std::move(handle));
			}
			else
			{
				auto handle = std::make_unique<sw::redis::Redis>(options, pool);
				handle->ping();
				redisC = std::make_shared<RedisConnection>(std::move(handle));
			}
			redis_connections[in_options] = redisC;

			std::cerr << std::format("Connected to Redis at {}:{}\n", in_options.host, in_options.port);
			return redisC;
		}
		catch (const sw::redis::Error& e)
		{
			if (attempt >= max_retries)
				throw;

			++attempt;

			std::cerr << std::format("Redis connect failed (attempt {}/{}): {}", attempt,
									 max_retries + 1, e.what())
					  << std::endl;

			if (retry_interval_ms > 0)
			{
				std::this_thread::sleep_for(std::chrono::milliseconds(retry_interval_ms));
			}
		}
	}
}
