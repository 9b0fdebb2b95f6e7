#include "Log.hpp"

#include <cctype>
#include <cstdlib>
#include <random>

Log::Log(const std::string &Who) : WhoIsTalking(Who)
{
	IdentifierColor = GetRandomTerminalColor();
}

void Log::InitFromEnv()
{
	const char *env = std::getenv("VISITORPOOL_LOG_LEVEL");
	if (!env)
		return;
	std::string v = env;
	for (auto &ch : v) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
	if (v == "ERROR")
		SetLevel(Level::Error);
	else if (v == "WARNING" || v == "WARN")
		SetLevel(Level::Warning);
	else if (v == "DEBUG")
		SetLevel(Level::Debug);
}

void Log::Emit(Level level, TerminalColor color, std::string_view str) const
{
	if (IsMuted())
		return;
	if (GetLevel() < level)
		return;
	{
		std::scoped_lock lock(sink_mutex);
		if (sink_fn)
		{
			sink_fn(level, std::vformat("{} | {}", std::make_format_args(WhoIsTalking, str)));
			return;
		}
	}
	std::scoped_lock lock(stream_mutex);
	std::cerr << Timestamp() << ' ' << GetTerminalColorCode(IdentifierColor, true) << WhoIsTalking << "> "
			  << ResetColor() << GetTerminalColorCode(color) << str << ResetColor() << std::endl;
}

std::string Log::Timestamp()
{
	const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
	return std::format("{:%F %T}", now);
}

std::string Log::GetTerminalColorCode(TerminalColor color, bool foreground)
{
	int base = foreground ? 30 : 40;		// Foreground: 30–37, Background: 40–47
	int brightBase = foreground ? 90 : 100; // Bright Foreground: 90–97, Bright Background: 100–107

	switch (color)
	{
	case TerminalColor::Black:
		return "\033[" + std::to_string(base + 0) + "m";
	case TerminalColor::Red:
		return "\033[" + std::to_string(base + 1) + "m";
	case TerminalColor::Green:
		return "\033[" + std::to_string(base + 2) + "m";
	case TerminalColor::Yellow:
		return "\033[" + std::to_string(base + 3) + "m";
	case TerminalColor::Blue:
		return "\033[" + std::to_string(base + 4) + "m";
	case TerminalColor::Magenta:
		return "\033[" + std::to_string(base + 5) + "m";
	case TerminalColor::Cyan:
		return "\033[" + std::to_string(base + 6) + "m";
	case TerminalColor::White:
		return "\033[" + std::to_string(base + 7) + "m";
	case TerminalColor::BrightBlack:
		return "\033[" + std::to_string(brightBase + 0) + "m";
	case TerminalColor::BrightRed:
		return "\033[" + std::to_string(brightBase + 1) + "m";
	case TerminalColor::BrightGreen:
		return "\033[" + std::to_string(brightBase + 2) + "m";
	case TerminalColor::BrightYellow:
		return "\033[" + std::to_string(brightBase + 3) + "m";
	case TerminalColor::BrightBlue:
		return "\033[" + std::to_string(brightBase + 4) + "m";
	case TerminalColor::BrightMagenta:
		return "\033[" + std::to_string(brightBase + 5) + "m";
	case TerminalColor::BrightCyan:
		return "\033[" + std::to_string(brightBase + 6) + "m";
	case TerminalColor::BrightWhite:
		return "\033[" + std::to_string(brightBase + 7) + "m";
	default:
		return "\033[0m"; // Reset
	}
}

Log::TerminalColor Log::GetRandomTerminalColor()
{
	// Identifier colours skip black and the red/yellow used for message levels.
	static const TerminalColor palette[] = {
		TerminalColor::Green,		TerminalColor::Blue,		TerminalColor::Magenta,
		TerminalColor::Cyan,		TerminalColor::BrightGreen, TerminalColor::BrightBlue,
		TerminalColor::BrightMagenta, TerminalColor::BrightCyan,
	};
	static std::mutex gen_mutex;
	static std::random_device rd;
	static std::mt19937 gen(rd());
	static std::uniform_int_distribution<int> dist(0, static_cast<int>(std::size(palette)) - 1);

	std::scoped_lock lock(gen_mutex);
	return palette[dist(gen)];
}
