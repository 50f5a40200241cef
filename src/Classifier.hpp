#pragma once
#ifndef canoclass_classifier_h
#define canoclass_classifier_h

#include"canoclass_pch.hpp"
#include"Raster.hpp"
#include"Smoother.hpp"
#include"TreeEnsemble.hpp"

namespace canoclass {

	enum class ClassifierStrategy {
		RandomForest,
		ExtraTrees
	};

	//accepts rf or randomforest and et, erf or extratrees, case-insensitively; throws std::invalid_argument otherwise
	ClassifierStrategy parseClassifierStrategy(const std::string& name);
	std::string classifierStrategyName(ClassifierStrategy strategy);
	//rf_ for random forest and erf_ for extra trees
	std::string classifierPrefix(ClassifierStrategy strategy);

	//the fixed hyperparameters, shared by both strategies
	TreeEnsembleParams classifierParams();

	//Pixel classifier over a single index feature. Each fit produces an independent model; nothing is kept between calls.
	class Classifier {
	public:
		Classifier(ClassifierStrategy strategy, uint64_t seed = 0, int nThread = 1);

		//Trains on every cell where labels > 0 and the feature is present and finite.
		//Throws AlignmentMismatchException if the rasters don't share an alignment,
		//and InsufficientClassesException if fewer than 2 distinct labels remain.
		//nThread only applies to extra trees; cv::ml trains a random forest on the calling thread.
		std::unique_ptr<TreeEnsembleModel> fit(const Raster<class_t>& labels, const Raster<index_t>& feature) const;

		//Predicts a class for every cell of feature, including cells whose feature is missing or NaN.
		//The output has the alignment of feature.
		Raster<class_t> predict(const TreeEnsembleModel& model, const Raster<index_t>& feature) const;

		ClassifierStrategy strategy() const;
		std::string prefix() const;

	private:
		ClassifierStrategy _strategy;
		uint64_t _seed;
		int _nThread;
	};

	struct ClassifyOptions {
		ClassifierStrategy strategy = ClassifierStrategy::RandomForest;
		uint64_t seed = 0;
		int nThread = 1;
		bool smoothing = true;
		int smoothWindow = 5;
		SmoothFilter smoothFilter = SmoothFilter::Median;
	};

	//Fits a model on the label raster trainingRaster and the index raster fitRaster, predicts over the index raster inputRaster,
	//optionally smooths the result, and writes it to outputRaster as a byte GeoTIFF.
	void classifyTile(const std::string& trainingRaster, const std::string& fitRaster, const std::string& inputRaster,
		const std::string& outputRaster, const ClassifyOptions& options);
}

#endif
