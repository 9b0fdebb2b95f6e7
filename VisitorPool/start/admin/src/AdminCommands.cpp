#include "AdminCommands.hpp"

#include <charconv>

#include "Pool/PoolErrors.hpp"

namespace
{
std::string FormatTimeUs(TimeUs us)
{
	const std::chrono::sys_time<std::chrono::seconds> t{
		std::chrono::seconds(static_cast<int64_t>(us / 1000000ULL))};
	return std::format("{:%F %T} UTC", t);
}
}  // namespace

AdminArgs AdminArgs::Parse(std::span<char *> args)
{
	AdminArgs out;
	for (std::size_t i = 1; i < args.size(); ++i)
	{
		const std::string arg = args[i];
		if (arg == "--config")
		{
			if (i + 1 >= args.size())
				throw std::invalid_argument("--config needs a file path");
			out.ConfigPath = args[++i];
		}
		else if (arg == "--json")
		{
			out.Json = true;
		}
		else if (out.Command.empty())
		{
			out.Command = arg;
		}
		else
		{
			out.Operands.push_back(arg);
		}
	}
	if (out.Command.empty())
		throw std::invalid_argument("missing command");
	return out;
}

AdminCommands::AdminCommands(std::shared_ptr<VisitorPool> pool, std::ostream &out)
	: Pool(std::move(pool)), Out(out)
{
}

void AdminCommands::PrintUsage(std::ostream &out)
{
	out << "usage: visitorpool-admin [--config <file>] <command>\n"
		   "  init [n]          provision visitor slots 1..n (default: configured size)\n"
		   "  status [--json]   allocated/free/expired counts\n"
		   "  slots             per-slot allocation table\n"
		   "  reclaim           free every expired lease now\n"
		   "  lookup <token>    show the lease behind a token\n";
}

int AdminCommands::Dispatch(const AdminArgs &args)
{
	if (args.Command == "init")
	{
		std::optional<uint32_t> n;
		if (!args.Operands.empty())
		{
			uint32_t value = 0;
			const std::string &text = args.Operands.front();
			const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
			if (ec != std::errc() || ptr != text.data() + text.size())
			{
				logger->ErrorFormatted("init: '{}' is not a slot count", text);
				return 2;
			}
			n = value;
		}
		return Init(n);
	}
	if (args.Command == "status")
		return Status(args.Json);
	if (args.Command == "slots")
		return Slots();
	if (args.Command == "reclaim")
		return Reclaim();
	if (args.Command == "lookup")
	{
		if (args.Operands.empty())
		{
			logger->Error("lookup needs a token");
			return 2;
		}
		return Lookup(args.Operands.front());
	}

	logger->ErrorFormatted("Unknown command '{}'", args.Command);
	PrintUsage(Out);
	return 2;
}

int AdminCommands::Init(std::optional<uint32_t> n)
{
	try
	{
		const uint32_t created = Pool->InitializePool(n);
		Out << std::format("Provisioned {} visitor slot(s)\n", created);
		return 0;
	}
	catch (const PoolBootstrapError &e)
	{
		logger->ErrorFormatted("init failed: {}", e.what());
		return 1;
	}
}

int AdminCommands::Status(bool asJson)
{
	const PoolStatus status = Pool->Status();
	if (asJson)
	{
		Out << status.ToJson().dump(4) << "\n";
		return 0;
	}
	Out << std::format("total {}  allocated {}  free {}  expired {}\n", status.Total, status.Allocated,
					   status.Free, status.Expired);
	return 0;
}

int AdminCommands::Slots()
{
	for (const SlotReport &slot : Pool->DescribeSlots())
	{
		if (slot.Status == "allocated")
		{
			Out << std::format("{:>3}  {}  allocated  expires {} ({} min left)\n", slot.Number,
							   slot.VisitorAccount, FormatTimeUs(*slot.ExpiresAtUs),
							   *slot.MinutesRemaining);
		}
		else
		{
			Out << std::format("{:>3}  {}  free\n", slot.Number, slot.VisitorAccount);
		}
	}
	return 0;
}

int AdminCommands::Reclaim()
{
	const uint32_t freed = Pool->ReclaimExpired();
	Out << std::format("Freed {} expired slot(s)\n", freed);
	return 0;
}

int AdminCommands::Lookup(const std::string &token)
{
	const auto info = Pool->LookupLease(token);
	if (!info)
	{
		Out << "No lease for that token\n";
		return 1;
	}
	const Lease &lease = info->lease;
	Out << std::format("lease {}  {}  {}\n", lease.ID, info->VisitorAccount,
					   lease.Active ? "active" : "inactive");
	Out << std::format("created {}  expires {}\n", FormatTimeUs(lease.CreatedAtUs),
					   FormatTimeUs(lease.ExpiresAtUs));
	if (info->ExpiredMinutesAgo)
		Out << std::format("expired {} minute(s) ago\n", *info->ExpiredMinutesAgo);
	return 0;
}
