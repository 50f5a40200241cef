#pragma once
#ifndef canoclass_commandline_h
#define canoclass_commandline_h

#include"canoclass_pch.hpp"
#include"CanoClassSettings.hpp"
#include"Classifier.hpp"
#include"IndexCalculator.hpp"

namespace canoclass {

	//the parsed form of: canoclass <index|rasterize|classify> [options]
	struct CommandLine {
		std::string command;
		CanoClassSettings settings;

		std::optional<VegetationIndex> index;
		ClassifierStrategy method = ClassifierStrategy::RandomForest;

		std::filesystem::path input;
		std::filesystem::path output;
		std::filesystem::path vector;
		std::filesystem::path reference;

		//true if the user asked for help or gave no command; usage holds the text to show
		bool help = false;
		std::string usage;
	};

	//Reads the command line, merged with the config file named by --config if there is one.
	//Values on the command line win over values in the config file.
	//Throws std::invalid_argument for unknown options, bad values, or missing required options.
	CommandLine parseCommandLine(int argc, const char* const argv[]);
}

#endif
