#pragma once
#ifndef canoclass_tileoperations_h
#define canoclass_tileoperations_h

#include"canoclass_pch.hpp"
#include"CanoClassSettings.hpp"
#include"CoordRef.hpp"
#include"Classifier.hpp"
#include"IndexCalculator.hpp"

namespace canoclass {

	//true for .tif files, ignoring case
	bool isTifFile(const std::filesystem::path& p);

	//One per-file step that the batch orchestrator can drive over a directory of tiles.
	class TileOperation {
	public:
		virtual ~TileOperation() = default;

		//prepended to the input file name to name the output
		virtual std::string prefix() const = 0;

		//identifies the operation in the job ledger
		virtual std::string operationKey() const = 0;

		//Everything besides the input file that determines the output.
		//If this changes between runs, existing outputs are recomputed.
		virtual std::string parameters() const = 0;

		virtual bool accepts(const std::filesystem::path& p) const;

		//Computes the output for one input file and writes it, replacing any file already at output.
		virtual void run(const std::filesystem::path& input, const std::filesystem::path& output) const = 0;

	protected:
		explicit TileOperation(const CanoClassSettings& settings);

		const CanoClassSettings& _settings;

		//throws AlignmentMismatchException if the settings name a projection and the input isn't in it
		void checkProjection(const std::filesystem::path& input) const;

	private:
		std::optional<CoordRef> _projection;
	};

	class IndexOperation : public TileOperation {
	public:
		IndexOperation(const CanoClassSettings& settings, VegetationIndex index);

		std::string prefix() const override;
		std::string operationKey() const override;
		std::string parameters() const override;
		void run(const std::filesystem::path& input, const std::filesystem::path& output) const override;

	private:
		VegetationIndex _index;
	};

	//Classifies index tiles with a model trained on the settings' training rasters.
	//A fresh model is fit for every tile.
	class ClassifyOperation : public TileOperation {
	public:
		//Throws InputNotFoundException if either training raster doesn't exist.
		//nThread is the number of threads each fit and predict uses.
		ClassifyOperation(const CanoClassSettings& settings, ClassifierStrategy strategy, int nThread = 1);

		std::string prefix() const override;
		std::string operationKey() const override;
		std::string parameters() const override;
		void run(const std::filesystem::path& input, const std::filesystem::path& output) const override;

	private:
		ClassifyOptions _options;
		uint64_t _trainingFingerprint;
		uint64_t _fitFingerprint;
	};
}

#endif
