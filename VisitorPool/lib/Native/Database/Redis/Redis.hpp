#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "Global/Misc/Singleton.hpp"
#include "RedisConnection.hpp"

class Redis : public Singleton<Redis>
{
   public:
	struct Options
	{
		std::string host;
		int32_t port = 6379;
		bool IsCluster = false;

		bool operator<(const Options& o) const
		{
			if (host != o.host)
				return host < o.host;
			if (port != o.port)
				return port < o.port;
			return IsCluster < o.IsCluster;
		}

		std::chrono::milliseconds ConnectTimeout{2000};
		std::chrono::milliseconds SocketTimeout{2000};
		std::size_t PoolSize = 5;
	};

   private:
	std::map<Options, std::weak_ptr<RedisConnection>> redis_connections;
	std::mutex connections_mutex;

   public:
	std::shared_ptr<RedisConnection> Connect(const Options& options, uint32_t max_retries = 0,
											 uint32_t retry_interval_ms = 0);
};
