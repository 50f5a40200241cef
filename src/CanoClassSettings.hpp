#pragma once
#ifndef canoclass_settings_h
#define canoclass_settings_h

#include"canoclass_pch.hpp"
#include"Logger.hpp"
#include"Smoother.hpp"

namespace canoclass {

	enum class ErrorPolicy {
		//record the failed file and keep going
		Continue,
		//stop starting new files after the first failure
		Stop
	};

	//std::thread::hardware_concurrency, or 1 if that's unknown
	int defaultThreadCount();

	//Everything a run needs to know that isn't a per-command input or output.
	//Built once at startup and passed around by const reference.
	struct CanoClassSettings {
		int threads = defaultThreadCount();
		uint64_t seed = 0;
		bool force = false;
		ErrorPolicy errorPolicy = ErrorPolicy::Continue;

		bool smoothing = true;
		int smoothWindow = 5;
		SmoothFilter smoothFilter = SmoothFilter::Median;

		//if set, every input tile must be in this crs
		std::optional<std::string> projection;

		//relative paths below resolve against this, if it's set
		std::filesystem::path workspace;
		std::filesystem::path trainingRaster;
		std::filesystem::path trainingFitRaster;
		std::string vectorField = "id";

		LogLevel logLevel = LogLevel::Info;

		//throws std::invalid_argument if any value is out of range
		void validate() const;

		std::filesystem::path resolve(const std::filesystem::path& p) const;
	};
}

#endif
