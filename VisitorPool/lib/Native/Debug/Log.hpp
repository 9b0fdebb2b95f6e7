#pragma once
#include "Global/pch.hpp"
class Log
{
public:
	Log() = default;
	Log(const std::string &Who);

	enum class Level
	{
		Error = 0,
		Warning = 1,
		Debug = 2,
	};

	std::string WhoIsTalking;

	template <typename... Args>
	void ErrorFormatted(std::string_view fmt, Args &&...args) const
	{
		std::string message = std::vformat(fmt, std::make_format_args(args...));
		Error(message);
	}
	void Error(std::string_view str) const
	{
		Emit(Level::Error, TerminalColor::Red, str);
	}
	template <typename... Args>
	void WarningFormatted(std::string_view fmt, Args &&...args) const
	{
		std::string message = std::vformat(fmt, std::make_format_args(args...));
		Warning(message);
	}
	void Warning(std::string_view str) const
	{
		Emit(Level::Warning, TerminalColor::Yellow, str);
	}
	template <typename... Args>
	void DebugFormatted(std::string_view fmt, Args &&...args) const
	{
		std::string message = std::vformat(fmt, std::make_format_args(args...));
		Debug(message);
	}
	void Debug(std::string_view str) const
	{
		Emit(Level::Debug, TerminalColor::White, str);
	}

	enum class TerminalColor
	{
		Black,
		Red,
		Green,
		Yellow,
		Blue,
		Magenta,
		Cyan,
		White,
		BrightBlack,
		BrightRed,
		BrightGreen,
		BrightYellow,
		BrightBlue,
		BrightMagenta,
		BrightCyan,
		BrightWhite,
	};
	static std::string GetTerminalColorCode(TerminalColor color, bool foreground = true);

	static TerminalColor GetRandomTerminalColor();

	// --- Optional sink ---
	// When installed, lines are forwarded to the sink instead of std::cerr.
	// Tests use it to observe what a component reported.
	using Sink = std::function<void(Level, const std::string &)>;
	static void SetSink(Sink sink)
	{
		std::scoped_lock lock(sink_mutex);
		sink_fn = std::move(sink);
	}
	static bool HasSink()
	{
		std::scoped_lock lock(sink_mutex);
		return static_cast<bool>(sink_fn);
	}
	static void SetMuted(bool value)
	{
		muted.store(value, std::memory_order_relaxed);
	}
	static bool IsMuted()
	{
		return muted.load(std::memory_order_relaxed);
	}
	static void SetLevel(Level new_level)
	{
		log_level.store(static_cast<int>(new_level), std::memory_order_relaxed);
	}
	static Level GetLevel()
	{
		return static_cast<Level>(log_level.load(std::memory_order_relaxed));
	}
	static void InitFromEnv();

private:
	TerminalColor IdentifierColor = TerminalColor::White;
	inline static Sink sink_fn{};
	inline static std::mutex sink_mutex;
	inline static std::mutex stream_mutex;
	inline static std::atomic_bool muted{false};
	inline static std::atomic<int> log_level{static_cast<int>(Level::Debug)};

	void Emit(Level level, TerminalColor color, std::string_view str) const;
	static std::string Timestamp();

	static inline std::string ResetColor() { return "\033[0m"; }
};
