#include <iostream>
#include <span>

#include "AdminCommands.hpp"
#include "Debug/Crash/CrashHandler.hpp"
#include "Debug/Log.hpp"
#include "InternalDB/InternalDB.hpp"
#include "Pool/Database/RedisPoolStore.hpp"
#include "Pool/PoolConfig.hpp"
#include "Pool/PoolErrors.hpp"
#include "Pool/Workspace/DirectoryWorkspaceHooks.hpp"

int main(int argc, char **argv)
{
	CrashHandler::Get().Init("visitorpool-admin");
	Log::InitFromEnv();
	Log logger("AdminMain");

	AdminArgs args;
	try
	{
		args = AdminArgs::Parse(std::span<char *>(argv, argc));
	}
	catch (const std::invalid_argument &e)
	{
		logger.Error(e.what());
		AdminCommands::PrintUsage(std::cerr);
		return 2;
	}

	try
	{
		const PoolConfig config = PoolConfig::Load(args.ConfigPath);
		InternalDB::Make(config.redis);

		auto store = std::make_shared<RedisPoolStore>(InternalDB::Get().Connection());
		auto hooks = std::make_shared<DirectoryWorkspaceHooks>(config.workspace.Root,
															   config.workspace.Template);
		auto pool = std::make_shared<VisitorPool>(store, hooks, config);
		return AdminCommands(pool, std::cout).Dispatch(args);
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
}
