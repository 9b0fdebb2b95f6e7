#include "PoolConfig.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

#include "Pool/PoolErrors.hpp"

namespace
{
bool IsEntryValid(const Json& json, const std::string& str)
{
	return json.is_object() && json.contains(str) && !json[str].is_null();
}

uint64_t ParseUnsigned(std::string_view name, std::string_view text)
{
	uint64_t value = 0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc() || ptr != text.data() + text.size())
	{
		throw PoolConfigError(std::format("{} must be a non-negative integer, got '{}'", name, text));
	}
	return value;
}

template <class T>
T Narrow(std::string_view name, uint64_t value)
{
	if (value > static_cast<uint64_t>(std::numeric_limits<T>::max()))
	{
		throw PoolConfigError(std::format("{} out of range: {}", name, value));
	}
	return static_cast<T>(value);
}

template <class T>
T JsonUnsigned(const Json& json, std::string_view name)
{
	if (!json.is_number_integer())
	{
		throw PoolConfigError(std::format("{} must be an integer", name));
	}
	if (json.is_number_unsigned())
		return Narrow<T>(name, json.get<uint64_t>());
	const int64_t value = json.get<int64_t>();
	if (value < 0)
	{
		throw PoolConfigError(std::format("{} must be a non-negative integer, got {}", name, value));
	}
	return Narrow<T>(name, static_cast<uint64_t>(value));
}

std::optional<std::string> Env(const char* name)
{
	if (const char* value = std::getenv(name); value && *value)
	{
		return std::string(value);
	}
	return std::nullopt;
}
}  // namespace

PoolConfig PoolConfig::Load(const std::optional<std::filesystem::path>& file)
{
	PoolConfig config = file ? ParseSettingsFile(*file) : PoolConfig{};
	config.ApplyEnvironment();
	config.Validate();
	return config;
}

PoolConfig PoolConfig::ParseSettingsFile(const std::filesystem::path& file)
{
	std::ifstream settingsFile(file);
	if (!settingsFile.is_open())
	{
		throw PoolConfigError(std::format("Unable to open settings file {}", file.string()));
	}

	Json parsedJson;
	try
	{
		std::string contents((std::istreambuf_iterator<char>(settingsFile)),
							 std::istreambuf_iterator<char>());
		parsedJson = Json::parse(contents);
	}
	catch (const Json::exception& e)
	{
		throw PoolConfigError(std::format("Failed to parse settings file {}: {}", file.string(), e.what()));
	}
	return FromJson(parsedJson);
}

PoolConfig PoolConfig::FromJson(const Json& json)
{
	PoolConfig config;
	try
	{
		if (IsEntryValid(json, "PoolSize"))
			config.PoolSize = JsonUnsigned<uint32_t>(json["PoolSize"], "PoolSize");
		if (IsEntryValid(json, "LeaseLifetimeS"))
			config.LeaseLifetime =
				std::chrono::seconds(JsonUnsigned<int64_t>(json["LeaseLifetimeS"], "LeaseLifetimeS"));
		if (IsEntryValid(json, "ReclaimIntervalS"))
			config.ReclaimInterval =
				std::chrono::seconds(JsonUnsigned<int64_t>(json["ReclaimIntervalS"], "ReclaimIntervalS"));

		if (IsEntryValid(json, "Redis"))
		{
			const Json& redisJ = json["Redis"];
			if (IsEntryValid(redisJ, "Host"))
				config.redis.Host = redisJ["Host"].get<std::string>();
			if (IsEntryValid(redisJ, "Port"))
				config.redis.Port = JsonUnsigned<int32_t>(redisJ["Port"], "Redis.Port");
			if (IsEntryValid(redisJ, "Cluster"))
				config.redis.Cluster = redisJ["Cluster"].get<bool>();
			if (IsEntryValid(redisJ, "ConnectRetries"))
				config.redis.ConnectRetries =
					JsonUnsigned<uint32_t>(redisJ["ConnectRetries"], "Redis.ConnectRetries");
			if (IsEntryValid(redisJ, "RetryIntervalMs"))
				config.redis.RetryIntervalMs =
					JsonUnsigned<uint32_t>(redisJ["RetryIntervalMs"], "Redis.RetryIntervalMs");
			if (IsEntryValid(redisJ, "ConnectTimeoutMs"))
				config.redis.ConnectTimeout =
					std::chrono::milliseconds(JsonUnsigned<int64_t>(redisJ["ConnectTimeoutMs"], "Redis.ConnectTimeoutMs"));
			if (IsEntryValid(redisJ, "SocketTimeoutMs"))
				config.redis.SocketTimeout =
					std::chrono::milliseconds(JsonUnsigned<int64_t>(redisJ["SocketTimeoutMs"], "Redis.SocketTimeoutMs"));
		}

		if (IsEntryValid(json, "Workspace"))
		{
			const Json& wsJ = json["Workspace"];
			if (IsEntryValid(wsJ, "Root"))
				config.workspace.Root = wsJ["Root"].get<std::string>();
			if (IsEntryValid(wsJ, "Template"))
				config.workspace.Template = wsJ["Template"].get<std::string>();
		}
	}
	catch (const Json::exception& e)
	{
		throw PoolConfigError(std::format("Invalid settings: {}", e.what()));
	}
	return config;
}

void PoolConfig::ApplyEnvironment()
{
	if (const auto v = Env("VISITORPOOL_POOL_SIZE"))
		PoolSize = Narrow<uint32_t>("VISITORPOOL_POOL_SIZE", ParseUnsigned("VISITORPOOL_POOL_SIZE", *v));
	if (const auto v = Env("VISITORPOOL_LEASE_LIFETIME_S"))
		LeaseLifetime = std::chrono::seconds(Narrow<int64_t>(
			"VISITORPOOL_LEASE_LIFETIME_S", ParseUnsigned("VISITORPOOL_LEASE_LIFETIME_S", *v)));
	if (const auto v = Env("VISITORPOOL_RECLAIM_INTERVAL_S"))
		ReclaimInterval = std::chrono::seconds(Narrow<int64_t>(
			"VISITORPOOL_RECLAIM_INTERVAL_S", ParseUnsigned("VISITORPOOL_RECLAIM_INTERVAL_S", *v)));
	if (const auto v = Env("VISITORPOOL_REDIS_HOST"))
		redis.Host = *v;
	if (const auto v = Env("VISITORPOOL_REDIS_PORT"))
		redis.Port = Narrow<int32_t>("VISITORPOOL_REDIS_PORT", ParseUnsigned("VISITORPOOL_REDIS_PORT", *v));
}

void PoolConfig::Validate() const
{
	if (PoolSize == 0 || PoolSize > kMaxPoolSize)
	{
		throw PoolConfigError(std::format("PoolSize must be within 1..{}, got {}", kMaxPoolSize, PoolSize));
	}
	if (LeaseLifetime.count() <= 0 || LeaseLifetime > kMaxDuration)
	{
		throw PoolConfigError(std::format("LeaseLifetime must be within 1..{}s, got {}s",
										  kMaxDuration.count(), LeaseLifetime.count()));
	}
	if (ReclaimInterval.count() <= 0 || ReclaimInterval > kMaxDuration)
	{
		throw PoolConfigError(std::format("ReclaimInterval must be within 1..{}s, got {}s",
										  kMaxDuration.count(), ReclaimInterval.count()));
	}
	if (redis.Port <= 0 || redis.Port > 65535)
	{
		throw PoolConfigError(std::format("Redis port out of range: {}", redis.Port));
	}
}

Json PoolConfig::ToJson() const
{
	Json j;
	j["PoolSize"] = PoolSize;
	j["LeaseLifetimeS"] = LeaseLifetime.count();
	j["ReclaimIntervalS"] = ReclaimInterval.count();
	j["Redis"] = {{"Host", redis.Host},
				  {"Port", redis.Port},
				  {"Cluster", redis.Cluster},
				  {"ConnectRetries", redis.ConnectRetries},
				  {"RetryIntervalMs", redis.RetryIntervalMs},
				  {"ConnectTimeoutMs", redis.ConnectTimeout.count()},
				  {"SocketTimeoutMs", redis.SocketTimeout.count()}};
	j["Workspace"] = {{"Root", workspace.Root.string()}, {"Template", workspace.Template.string()}};
	return j;
}
