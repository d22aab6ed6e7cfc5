// Copyright (c) DarkMatter Projects 2023-2025
// Licensed under the GNU General Public License 2.0.

#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace modevote {
	enum class LogLevel {
	Trace = 0,
	Debug,
	Info,
	Warn,
	Error,
	Fatal
	};

	using LogSink = std::function<void(std::string_view)>;

	/*
	=============
	ParseLogLevel

	Parse the provided environment value into a LogLevel.
	=============
	*/
	LogLevel ParseLogLevel(std::string_view value);

	/*
	=============
	FormatMessage

	Build a structured log message for output.
	=============
	*/
	std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message);

	/*
	=============
	InitLogger

	Initialize the logger with module metadata and output sinks.
	=============
	*/
	void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink);

	/*
	=============
	SetLogLevel

	Override the current logging level programmatically.
	=============
	*/
	void SetLogLevel(LogLevel level);

	/*
	=============
	GetLogLevel

	Fetch the currently active log level.
	=============
	*/
	LogLevel GetLogLevel();

	/*
	=============
	IsLogLevelEnabled

	Return whether the provided log level should emit output.
	=============
	*/
	bool IsLogLevelEnabled(LogLevel level);

	/*
	=============
	Log

	Log a pre-formatted message if the level is enabled. Error and Fatal
	messages are mirrored to the error sink.
	=============
	*/
	void Log(LogLevel level, std::string_view message);

	/*
	=============
	Logf

	Format a message and log it if the level is enabled.
	=============
	*/
	template<typename... Args>
	inline void Logf(LogLevel level, std::format_string<Args...> format_str, Args &&... args)
	{
		if (!IsLogLevelEnabled(level))
			return;

		Log(level, std::format(format_str, std::forward<Args>(args)...));
	}

	/*
	=============
	LogLevelLabel

	Provide a short string label for the supplied log level.
	=============
	*/
	const char* LogLevelLabel(LogLevel level);

} // namespace modevote
