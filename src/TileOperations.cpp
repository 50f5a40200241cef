#include"TileOperations.hpp"
#include"JobLedger.hpp"

namespace canoclass {

	bool isTifFile(const std::filesystem::path& p)
	{
		std::string ext = p.extension().string();
		std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });
		return ext == ".tif";
	}

	TileOperation::TileOperation(const CanoClassSettings& settings)
		: _settings(settings)
	{
		if (settings.projection) {
			_projection = CoordRef(*settings.projection);
		}
	}

	bool TileOperation::accepts(const std::filesystem::path& p) const
	{
		return isTifFile(p);
	}

	void TileOperation::checkProjection(const std::filesystem::path& input) const
	{
		if (!_projection) {
			return;
		}
		Alignment a{ input.string() };
		if (!a.crs().isConsistent(*_projection)) {
			throw AlignmentMismatchException(input.string() + " is in " + a.crs().getShortName()
				+ " rather than " + _projection->getShortName());
		}
	}

	IndexOperation::IndexOperation(const CanoClassSettings& settings, VegetationIndex index)
		: TileOperation(settings), _index(index)
	{
	}

	std::string IndexOperation::prefix() const
	{
		return indexFormula(_index).prefix;
	}

	std::string IndexOperation::operationKey() const
	{
		return "index:" + indexFormula(_index).name;
	}

	std::string IndexOperation::parameters() const
	{
		return indexFormula(_index).name;
	}

	void IndexOperation::run(const std::filesystem::path& input, const std::filesystem::path& output) const
	{
		checkProjection(input);
		calculateIndexFile(input.string(), output.string(), _index, true);
	}

	ClassifyOperation::ClassifyOperation(const CanoClassSettings& settings, ClassifierStrategy strategy, int nThread)
		: TileOperation(settings)
	{
		_options.strategy = strategy;
		_options.seed = settings.seed;
		_options.nThread = nThread;
		_options.smoothing = settings.smoothing;
		_options.smoothWindow = settings.smoothWindow;
		_options.smoothFilter = settings.smoothFilter;

		_trainingFingerprint = fingerprintFile(settings.trainingRaster);
		_fitFingerprint = fingerprintFile(settings.trainingFitRaster);
	}

	std::string ClassifyOperation::prefix() const
	{
		return classifierPrefix(_options.strategy);
	}

	std::string ClassifyOperation::operationKey() const
	{
		return "classify:" + classifierStrategyName(_options.strategy);
	}

	std::string ClassifyOperation::parameters() const
	{
		std::stringstream ss;
		ss << classifierStrategyName(_options.strategy)
			<< ";smooth=" << (_options.smoothing ? 1 : 0)
			<< ";window=" << _options.smoothWindow
			<< ";filter=" << smoothFilterName(_options.smoothFilter)
			<< ";seed=" << _options.seed
			<< ";training=" << fingerprintToString(_trainingFingerprint)
			<< ";fit=" << fingerprintToString(_fitFingerprint);
		return ss.str();
	}

	void ClassifyOperation::run(const std::filesystem::path& input, const std::filesystem::path& output) const
	{
		checkProjection(input);
		classifyTile(_settings.trainingRaster.string(), _settings.trainingFitRaster.string(), input.string(), output.string(), _options);
	}
}
