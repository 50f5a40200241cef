#pragma once
#ifndef canoclass_batchorchestrator_h
#define canoclass_batchorchestrator_h

#include"canoclass_pch.hpp"
#include"CanoClassSettings.hpp"
#include"GisExceptions.hpp"
#include"TileOperations.hpp"

namespace canoclass {

	enum class FileStatus {
		Written,
		Skipped,
		Failed
	};
	std::string fileStatusName(FileStatus status);

	struct FileResult {
		std::filesystem::path input;
		std::filesystem::path output;
		FileStatus status = FileStatus::Failed;
		//set only for failures that came from a CanoClassException
		std::optional<ErrorKind> errorKind;
		std::string message;
	};

	struct TileListing {
		//sorted
		std::vector<std::filesystem::path> files;
		//directories the walk couldn't open and accepted names that aren't readable files, as IOFailure results
		std::vector<FileResult> unreadable;
	};

	struct BatchReport {
		//sorted by input path; files never started because of the stop policy are left out
		std::vector<FileResult> files;
		//true if the stop policy kept some files from being started
		bool stopped = false;

		size_t nWritten() const;
		size_t nSkipped() const;
		size_t nFailed() const;
	};

	//Runs a TileOperation over every file it accepts below an input directory, mirroring the
	//directory structure below the output directory.
	class BatchOrchestrator {
	public:
		explicit BatchOrchestrator(const CanoClassSettings& settings);

		//Throws InputNotFoundException if inDir isn't an existing directory.
		//Errors in individual files don't throw; they're recorded in the report.
		BatchReport run(const TileOperation& op, const std::filesystem::path& inDir, const std::filesystem::path& outDir) const;

		//the files below inDir that op accepts, leaving out anything inside outDir
		//only throws if inDir itself can't be read
		static TileListing listTiles(const TileOperation& op, const std::filesystem::path& inDir,
			const std::filesystem::path& outDir);

		//outDir / (input's directory relative to inDir) / (prefix + input's file name)
		static std::filesystem::path outputPath(const TileOperation& op, const std::filesystem::path& inDir,
			const std::filesystem::path& outDir, const std::filesystem::path& input);

	private:
		const CanoClassSettings& _settings;
	};
}

#endif
