#include"Logger.hpp"

namespace canoclass {

	LogLevel parseLogLevel(const std::string& s)
	{
		std::string lower = s;
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
		if (lower == "error") {
			return LogLevel::Error;
		}
		if (lower == "warn" || lower == "warning") {
			return LogLevel::Warn;
		}
		if (lower == "info") {
			return LogLevel::Info;
		}
		if (lower == "debug") {
			return LogLevel::Debug;
		}
		throw std::invalid_argument("Unknown log level: " + s);
	}

	void Logger::setLevel(LogLevel level)
	{
		_level = level;
	}
	LogLevel Logger::level()
	{
		return _level;
	}
	bool Logger::enabled(LogLevel level)
	{
		return (int)level <= (int)_level.load();
	}
	void Logger::error(const std::string& msg)
	{
		_write(LogLevel::Error, msg);
	}
	void Logger::warn(const std::string& msg)
	{
		_write(LogLevel::Warn, msg);
	}
	void Logger::info(const std::string& msg)
	{
		_write(LogLevel::Info, msg);
	}
	void Logger::debug(const std::string& msg)
	{
		_write(LogLevel::Debug, msg);
	}
	void Logger::_write(LogLevel level, const std::string& msg)
	{
		if (!enabled(level)) {
			return;
		}
		std::scoped_lock<std::mutex> lock{ _mut };
		switch (level) {
		case LogLevel::Error:
			std::cerr << "Error: " << msg << std::endl;
			break;
		case LogLevel::Warn:
			std::cerr << "Warning: " << msg << std::endl;
			break;
		default:
			std::cout << msg << std::endl;
			break;
		}
	}
}
