#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "Global/pch.hpp"

struct PoolConfig
{
	static inline constexpr uint32_t kMaxPoolSize = 999;
	/// Upper bound for LeaseLifetime and ReclaimInterval (one year).
	static inline constexpr std::chrono::seconds kMaxDuration{365LL * 24 * 3600};

	/// Number of visitor identities handed out concurrently (N).
	uint32_t PoolSize = 4;
	std::chrono::seconds LeaseLifetime{3600};
	/// Sweep period of the reclaimer runtime.
	std::chrono::seconds ReclaimInterval{300};

	struct RedisSettings
	{
		std::string Host = "127.0.0.1";
		int32_t Port = 6379;
		bool Cluster = false;
		uint32_t ConnectRetries = 20;
		uint32_t RetryIntervalMs = 500;
		std::chrono::milliseconds ConnectTimeout{2000};
		std::chrono::milliseconds SocketTimeout{2000};
	} redis;

	struct WorkspaceSettings
	{
		std::filesystem::path Root = "/var/lib/visitorpool/workspaces";
		std::filesystem::path Template = "/app/templates/research-master";
	} workspace;

	/// Defaults, overlaid by @p file (when given), then by VISITORPOOL_* env vars.
	static PoolConfig Load(const std::optional<std::filesystem::path>& file);

	static PoolConfig ParseSettingsFile(const std::filesystem::path& file);
	static PoolConfig FromJson(const Json& json);
	void ApplyEnvironment();
	void Validate() const;

	[[nodiscard]] Json ToJson() const;
};
