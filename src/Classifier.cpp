#include"Classifier.hpp"
#include"Logger.hpp"

namespace canoclass {

	ClassifierStrategy parseClassifierStrategy(const std::string& name)
	{
		std::string lower = name;
		std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
		if (lower == "rf" || lower == "randomforest") {
			return ClassifierStrategy::RandomForest;
		}
		if (lower == "et" || lower == "erf" || lower == "extratrees") {
			return ClassifierStrategy::ExtraTrees;
		}
		throw std::invalid_argument("Unknown classification method: " + name + " (expected rf or et)");
	}

	std::string classifierStrategyName(ClassifierStrategy strategy)
	{
		return strategy == ClassifierStrategy::RandomForest ? "RandomForest" : "ExtraTrees";
	}

	std::string classifierPrefix(ClassifierStrategy strategy)
	{
		return strategy == ClassifierStrategy::RandomForest ? "rf_" : "erf_";
	}

	TreeEnsembleParams classifierParams()
	{
		TreeEnsembleParams params;
		params.nTrees = 50;
		params.minSamplesLeaf = 10;
		return params;
	}

	Classifier::Classifier(ClassifierStrategy strategy, uint64_t seed, int nThread)
		: _strategy(strategy), _seed(seed), _nThread(std::max(nThread, 1))
	{
	}

	std::unique_ptr<TreeEnsembleModel> Classifier::fit(const Raster<class_t>& labels, const Raster<index_t>& feature) const
	{
		checkSameAlignment(labels, feature, "classifier training");

		std::vector<TrainingSample> samples;
		std::array<bool, 256> seen{};
		int nClasses = 0;
		for (cell_t cell = 0; cell < labels.ncell(); ++cell) {
			auto label = labels.atCellUnsafe(cell);
			auto x = feature.atCellUnsafe(cell);
			if (!label.has_value() || label.value() == 0) {
				continue;
			}
			if (!x.has_value() || !std::isfinite(x.value())) {
				continue;
			}
			class_t y = label.value();
			samples.push_back({ x.value(), y });
			if (!seen[y]) {
				seen[y] = true;
				++nClasses;
			}
		}
		if (nClasses < 2) {
			throw InsufficientClassesException("Training data has " + std::to_string(nClasses)
				+ " distinct class(es) with valid index values; at least 2 are needed");
		}
		Logger::debug("Fitting " + classifierStrategyName(_strategy) + " on " + std::to_string(samples.size())
			+ " pixels in " + std::to_string(nClasses) + " classes");

		cv::Ptr<cv::ml::TrainData> data = makeTrainData(samples);
		if (_strategy == ClassifierStrategy::RandomForest) {
			return fitRandomForest(data, classifierParams());
		}
		return fitExtraTrees(data, classifierParams(), _seed, _nThread);
	}

	Raster<class_t> Classifier::predict(const TreeEnsembleModel& model, const Raster<index_t>& feature) const
	{
		cv::Mat features((int)feature.ncell(), 1, CV_32F);
		for (cell_t cell = 0; cell < feature.ncell(); ++cell) {
			auto x = feature.atCellUnsafe(cell);
			features.at<float>((int)cell, 0) = x.has_value() ? (index_t)x.value() : std::numeric_limits<index_t>::quiet_NaN();
		}
		std::vector<class_t> classes = model.predict(features);

		Raster<class_t> out{ (const Alignment&)feature };
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			out[cell].has_value() = true;
			out[cell].value() = classes[cell];
		}
		return out;
	}

	ClassifierStrategy Classifier::strategy() const
	{
		return _strategy;
	}

	std::string Classifier::prefix() const
	{
		return classifierPrefix(_strategy);
	}

	void classifyTile(const std::string& trainingRaster, const std::string& fitRaster, const std::string& inputRaster,
		const std::string& outputRaster, const ClassifyOptions& options)
	{
		Raster<class_t> labels{ trainingRaster };
		Raster<index_t> fitFeature{ fitRaster };
		Raster<index_t> input{ inputRaster };

		Classifier classifier{ options.strategy, options.seed, options.nThread };
		std::unique_ptr<TreeEnsembleModel> model = classifier.fit(labels, fitFeature);
		Raster<class_t> predicted = classifier.predict(*model, input);
		if (options.smoothing) {
			predicted = smoothClasses(predicted, options.smoothWindow, options.smoothFilter);
		}
		predicted.writeRaster(outputRaster);
	}
}
