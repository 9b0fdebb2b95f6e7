#pragma once
#include <filesystem>
#include <memory>
#include <ostream>
#include <span>

#include "Debug/Log.hpp"
#include "Global/pch.hpp"
#include "Pool/VisitorPool.hpp"

struct AdminArgs
{
	std::optional<std::filesystem::path> ConfigPath;
	std::string Command;
	std::vector<std::string> Operands;
	bool Json = false;

	/// Throws std::invalid_argument on a malformed command line.
	static AdminArgs Parse(std::span<char *> args);
};

// visitorpool-admin subcommands. Each returns the process exit code.
class AdminCommands
{
	std::shared_ptr<Log> logger = std::make_shared<Log>("Admin");
	std::shared_ptr<VisitorPool> Pool;
	std::ostream &Out;

   public:
	AdminCommands(std::shared_ptr<VisitorPool> pool, std::ostream &out);

	int Dispatch(const AdminArgs &args);

	int Init(std::optional<uint32_t> n);
	int Status(bool asJson);
	int Slots();
	int Reclaim();
	int Lookup(const std::string &token);

	static void PrintUsage(std::ostream &out);
};
