#include "InternalDB.hpp"

#include "Database/Redis/Redis.hpp"
#include "Pool/PoolErrors.hpp"

InternalDB::InternalDB(const PoolConfig::RedisSettings& settings)
{
	Redis::Options options;
	options.host = settings.Host;
	options.port = settings.Port;
	options.IsCluster = settings.Cluster;
	options.ConnectTimeout = settings.ConnectTimeout;
	options.SocketTimeout = settings.SocketTimeout;

	try
	{
		redis = Redis::Get().Connect(options, settings.ConnectRetries, settings.RetryIntervalMs);
	}
	catch (const sw::redis::Error& e)
	{
		throw PoolStorageError(
			std::format("Unable to reach Redis at {}:{}: {}", settings.Host, settings.Port, e.what()));
	}
}
