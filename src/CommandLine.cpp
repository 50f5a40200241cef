#include"CommandLine.hpp"

#include<boost/program_options.hpp>

namespace po = boost::program_options;

namespace canoclass {

	namespace {
		const std::vector<std::string> COMMANDS = { "index", "rasterize", "classify" };

		void requireOption(const po::variables_map& vm, const std::string& command, const std::string& name) {
			if (!vm.count(name)) {
				throw std::invalid_argument("canoclass " + command + " requires --" + name);
			}
		}

		std::filesystem::path pathOption(const po::variables_map& vm, const std::string& name) {
			if (!vm.count(name)) {
				return {};
			}
			return std::filesystem::path(vm[name].as<std::string>());
		}
	}

	CommandLine parseCommandLine(int argc, const char* const argv[])
	{
		//everything that may also come from a config file
		po::options_description general("General options");
		general.add_options()
			("threads", po::value<int>(), "number of worker threads (default: all cores)")
			("seed", po::value<uint64_t>()->default_value(0), "random seed for the classifier")
			("force", po::value<bool>()->default_value(false)->implicit_value(true), "recompute outputs that already exist")
			("stop-on-error", po::value<bool>()->default_value(false)->implicit_value(true), "stop starting new files after the first failure")
			("projection", po::value<std::string>(), "require every input tile to be in this crs, e.g. EPSG:5070")
			("workspace", po::value<std::string>(), "directory that relative training raster paths are relative to")
			("log-level", po::value<std::string>()->default_value("info"), "error, warn, info or debug")
			;
		po::options_description indexOpts("index options");
		indexOpts.add_options()
			("index", po::value<std::string>(), "arvi, vari or vdvi")
			("input,i", po::value<std::string>(), "input raster, or a directory of .tif tiles")
			("output,o", po::value<std::string>(), "output raster, or the directory to write tiles to")
			;
		po::options_description rasterizeOpts("rasterize options");
		rasterizeOpts.add_options()
			("vector", po::value<std::string>(), "polygon layer of training areas")
			("reference", po::value<std::string>(), "raster whose grid the labels are burned onto")
			("field", po::value<std::string>()->default_value("id"), "attribute holding each polygon's class")
			;
		po::options_description classifyOpts("classify options");
		classifyOpts.add_options()
			("training", po::value<std::string>(), "label raster produced by rasterize")
			("fit", po::value<std::string>(), "index raster aligned with the label raster")
			("method", po::value<std::string>()->default_value("rf"), "rf (random forest) or et (extra trees)")
			("smooth", po::value<bool>()->default_value(true)->implicit_value(true), "smooth the classified output")
			("window", po::value<int>()->default_value(5), "smoothing window size; odd")
			("filter", po::value<std::string>()->default_value("median"), "median or majority")
			;
		po::options_description configurable;
		configurable.add(general).add(indexOpts).add(rasterizeOpts).add(classifyOpts);

		po::options_description cmdOnly("Command line only");
		cmdOnly.add_options()
			("help,h", "show this message")
			("config", po::value<std::string>(), "INI-style file of option=value lines")
			("quiet,q", po::bool_switch(), "only show warnings and errors")
			("verbose,v", po::bool_switch(), "show debug messages")
			("no-smooth", po::bool_switch(), "write the raw classification")
			("burn-one", po::bool_switch(), "burn 1 for every polygon instead of a field value")
			;
		po::options_description hidden;
		hidden.add_options()
			("command", po::value<std::string>(), "")
			;
		po::positional_options_description positional;
		positional.add("command", 1);

		po::options_description cmdline;
		cmdline.add(cmdOnly).add(configurable).add(hidden);

		po::options_description visible("Usage: canoclass <index|rasterize|classify> [options]");
		visible.add(cmdOnly).add(configurable);

		CommandLine out;
		std::stringstream usage;
		usage << visible;
		out.usage = usage.str();

		po::variables_map vm;
		try {
			po::store(po::command_line_parser(argc, argv).options(cmdline).positional(positional).run(), vm);
			if (vm.count("config")) {
				std::string configFile = vm["config"].as<std::string>();
				std::ifstream ifs{ configFile };
				if (!ifs) {
					throw std::invalid_argument("Unable to read config file " + configFile);
				}
				po::store(po::parse_config_file(ifs, configurable), vm);
			}
			po::notify(vm);
		}
		catch (const po::error& e) {
			throw std::invalid_argument(e.what());
		}

		if (vm.count("help") || !vm.count("command")) {
			out.help = true;
			return out;
		}
		out.command = vm["command"].as<std::string>();
		if (std::find(COMMANDS.begin(), COMMANDS.end(), out.command) == COMMANDS.end()) {
			throw std::invalid_argument("Unknown command: " + out.command);
		}

		CanoClassSettings& s = out.settings;
		if (vm.count("threads")) {
			s.threads = vm["threads"].as<int>();
		}
		s.seed = vm["seed"].as<uint64_t>();
		s.force = vm["force"].as<bool>();
		s.errorPolicy = vm["stop-on-error"].as<bool>() ? ErrorPolicy::Stop : ErrorPolicy::Continue;
		if (vm.count("projection")) {
			s.projection = vm["projection"].as<std::string>();
		}
		s.workspace = pathOption(vm, "workspace");
		s.trainingRaster = s.resolve(pathOption(vm, "training"));
		s.trainingFitRaster = s.resolve(pathOption(vm, "fit"));
		s.vectorField = vm["burn-one"].as<bool>() ? "" : vm["field"].as<std::string>();
		s.smoothing = vm["smooth"].as<bool>() && !vm["no-smooth"].as<bool>();
		s.smoothWindow = vm["window"].as<int>();
		s.smoothFilter = parseSmoothFilter(vm["filter"].as<std::string>());
		s.logLevel = parseLogLevel(vm["log-level"].as<std::string>());
		if (vm["quiet"].as<bool>()) {
			s.logLevel = LogLevel::Warn;
		}
		if (vm["verbose"].as<bool>()) {
			s.logLevel = LogLevel::Debug;
		}
		s.validate();

		out.method = parseClassifierStrategy(vm["method"].as<std::string>());
		if (vm.count("index")) {
			out.index = parseVegetationIndex(vm["index"].as<std::string>());
		}
		out.input = pathOption(vm, "input");
		out.output = pathOption(vm, "output");
		out.vector = pathOption(vm, "vector");
		out.reference = pathOption(vm, "reference");

		if (out.command == "index") {
			requireOption(vm, out.command, "index");
			requireOption(vm, out.command, "input");
			requireOption(vm, out.command, "output");
		}
		else if (out.command == "rasterize") {
			requireOption(vm, out.command, "vector");
			requireOption(vm, out.command, "reference");
			requireOption(vm, out.command, "output");
		}
		else {
			requireOption(vm, out.command, "training");
			requireOption(vm, out.command, "fit");
			requireOption(vm, out.command, "input");
			requireOption(vm, out.command, "output");
		}
		return out;
	}
}
