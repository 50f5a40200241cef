#include"canoclass_pch.hpp"
#include"BatchOrchestrator.hpp"
#include"CommandLine.hpp"
#include"Logger.hpp"
#include"Rasterizer.hpp"
#include"TileOperations.hpp"

using namespace canoclass;
namespace fs = std::filesystem;

namespace {
	constexpr int EXIT_FAILED = 1;
	constexpr int EXIT_USAGE = 2;

	//runs op on a single file, or on every tile below it if it's a directory
	int runTileCommand(const TileOperation& op, const CommandLine& cl) {
		if (fs::is_directory(cl.input)) {
			BatchOrchestrator orchestrator{ cl.settings };
			BatchReport report = orchestrator.run(op, cl.input, cl.output);
			return report.nFailed() > 0 ? EXIT_FAILED : EXIT_SUCCESS;
		}
		if (!fs::exists(cl.input)) {
			throw InputNotFoundException(cl.input.string() + " does not exist");
		}
		if (!cl.settings.force && fs::exists(cl.output)) {
			Logger::info("skipped " + cl.output.string());
			return EXIT_SUCCESS;
		}
		if (cl.output.has_parent_path()) {
			fs::create_directories(cl.output.parent_path());
		}
		op.run(cl.input, cl.output);
		Logger::info("written " + cl.output.string());
		return EXIT_SUCCESS;
	}

	int runCommand(const CommandLine& cl) {
		if (cl.command == "index") {
			IndexOperation op{ cl.settings, *cl.index };
			return runTileCommand(op, cl);
		}
		if (cl.command == "classify") {
			bool batch = fs::is_directory(cl.input);
			//a batch spreads its threads over the tiles instead
			ClassifyOperation op{ cl.settings, cl.method, batch ? 1 : cl.settings.threads };
			return runTileCommand(op, cl);
		}

		if (!cl.settings.force && fs::exists(cl.output)) {
			Logger::info("skipped " + cl.output.string());
			return EXIT_SUCCESS;
		}
		if (cl.output.has_parent_path()) {
			fs::create_directories(cl.output.parent_path());
		}
		prepareTrainingData(cl.vector.string(), cl.reference.string(), cl.output.string(), cl.settings.vectorField);
		Logger::info("written " + cl.output.string());
		return EXIT_SUCCESS;
	}
}

int main(int argc, char* argv[])
{
	CommandLine cl;
	try {
		cl = parseCommandLine(argc, argv);
	}
	catch (const std::invalid_argument& e) {
		std::cerr << "Error: " << e.what() << "\n";
		std::cerr << "Run canoclass --help for usage\n";
		return EXIT_USAGE;
	}
	if (cl.help) {
		std::cout << cl.usage << std::endl;
		return EXIT_SUCCESS;
	}

	Logger::setLevel(cl.settings.logLevel);
	try {
		return runCommand(cl);
	}
	catch (const CanoClassException& e) {
		Logger::error(errorKindName(e.kind()) + ": " + e.what());
	}
	catch (const fs::filesystem_error& e) {
		Logger::error(errorKindName(ErrorKind::IOFailure) + ": " + e.what());
	}
	catch (const std::exception& e) {
		Logger::error(e.what());
	}
	return EXIT_FAILED;
}
