#pragma once
#ifndef canoclass_logger_h
#define canoclass_logger_h

#include"canoclass_pch.hpp"

namespace canoclass {

	enum class LogLevel {
		Error = 0,
		Warn = 1,
		Info = 2,
		Debug = 3
	};

	//throws std::invalid_argument for anything but error, warn, info or debug
	LogLevel parseLogLevel(const std::string& s);

	//Line-oriented logging to the console. Info and debug lines go to std::cout, warnings and errors to std::cerr.
	//Lines from different threads are never interleaved.
	class Logger {
	public:
		static void setLevel(LogLevel level);
		static LogLevel level();
		static bool enabled(LogLevel level);

		static void error(const std::string& msg);
		static void warn(const std::string& msg);
		static void info(const std::string& msg);
		static void debug(const std::string& msg);

	private:
		inline static std::mutex _mut;
		inline static std::atomic<LogLevel> _level = LogLevel::Info;

		static void _write(LogLevel level, const std::string& msg);
	};
}

#endif
