#include <algorithm>
#include <span>
#include <string>

#include "Debug/Crash/CrashHandler.hpp"
#include "Debug/Log.hpp"
#include "Global/pch.hpp"
#include "InternalDB/InternalDB.hpp"
#include "Pool/Database/RedisPoolStore.hpp"
#include "Pool/PoolConfig.hpp"
#include "Pool/PoolErrors.hpp"
#include "Pool/VisitorPool.hpp"
#include "Pool/Workspace/DirectoryWorkspaceHooks.hpp"
#include "ReclaimerService.hpp"

#define RECLAIMER_SETTINGS_FILE_FLAG "--config"

int main(int argc, char **argv)
{
	CrashHandler::Get().Init("visitorpool-reclaimer");
	Log::InitFromEnv();
	Log logger("ReclaimerMain");

	std::span<char *> args(argv, argc);
	const auto arg = std::find_if(args.begin(), args.end(), [](char *arg)
								  { return std::string(RECLAIMER_SETTINGS_FILE_FLAG) == arg; });

	std::optional<std::filesystem::path> settingsPath;
	if (arg != args.end())
	{
		if (std::next(arg) == args.end())
		{
			logger.Error(RECLAIMER_SETTINGS_FILE_FLAG " needs a file path");
			return 2;
		}
		settingsPath = *std::next(arg);
	}

	try
	{
		const PoolConfig config = PoolConfig::Load(settingsPath);
		InternalDB::Make(config.redis);

		auto store = std::make_shared<RedisPoolStore>(InternalDB::Get().Connection());
		auto hooks = std::make_shared<DirectoryWorkspaceHooks>(config.workspace.Root,
															   config.workspace.Template);
		auto pool = std::make_shared<VisitorPool>(store, hooks, config);

		ReclaimerService::InstallSignalHandlers();
		ReclaimerService::Make(pool, config.ReclaimInterval).Run();
	}
	catch (const PoolConfigError &e)
	{
		logger.ErrorFormatted("Invalid configuration: {}", e.what());
		return 2;
	}
	catch (const PoolStorageError &e)
	{
		logger.ErrorFormatted("Storage unavailable: {}", e.what());
		return 1;
	}
	catch (const std::exception &e)
	{
		logger.ErrorFormatted("Fatal: {}", e.what());
		return 1;
	}
	return 0;
}
