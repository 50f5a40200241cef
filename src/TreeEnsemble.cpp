#include"TreeEnsemble.hpp"

namespace canoclass {

	namespace {
		//deep enough that the minimum split size, not the depth, ends growth on any tile
		constexpr int MAX_TREE_DEPTH = 25;

		std::vector<class_t> classLabels(const cv::Ptr<cv::ml::TrainData>& data) {
			cv::Mat labels = data->getClassLabels();
			std::vector<class_t> out;
			for (int i = 0; i < (int)labels.total(); ++i) {
				out.push_back((class_t)labels.at<int>(i));
			}
			return out;
		}

		std::vector<double> classCounts(const IndexedSample* begin, const IndexedSample* end, int nClasses) {
			std::vector<double> counts(nClasses, 0.);
			for (const IndexedSample* p = begin; p < end; ++p) {
				counts[p->classIndex] += 1;
			}
			return counts;
		}

		//the first sample that goes right of threshold
		const IndexedSample* partitionPoint(const IndexedSample* begin, const IndexedSample* end, index_t threshold) {
			return std::upper_bound(begin, end, threshold,
				[](index_t t, const IndexedSample& s) { return t < s.x; });
		}

		//one threshold drawn uniformly between the smallest and largest value in the node; nothing if either side would be too small
		std::optional<index_t> randomSplit(const IndexedSample* begin, const IndexedSample* end, int minSamplesLeaf, std::mt19937_64& rng) {
			index_t lo = begin->x;
			index_t hi = (end - 1)->x;
			if (!(lo < hi)) {
				return std::nullopt;
			}
			std::uniform_real_distribution<double> dist(lo, hi);
			index_t threshold = (index_t)dist(rng);

			const IndexedSample* mid = partitionPoint(begin, end, threshold);
			if (mid - begin < minSamplesLeaf || end - mid < minSamplesLeaf) {
				return std::nullopt;
			}
			return threshold;
		}
	}

	cv::Ptr<cv::ml::TrainData> makeTrainData(const std::vector<TrainingSample>& samples)
	{
		if (samples.empty()) {
			throw std::invalid_argument("Cannot fit a tree ensemble without samples");
		}
		cv::Mat x((int)samples.size(), 1, CV_32F);
		cv::Mat y((int)samples.size(), 1, CV_32S);
		for (int i = 0; i < (int)samples.size(); ++i) {
			x.at<float>(i, 0) = samples[i].x;
			y.at<int>(i, 0) = samples[i].y;
		}
		return cv::ml::TrainData::create(x, cv::ml::ROW_SAMPLE, y);
	}

	TreeEnsembleModel::TreeEnsembleModel(std::vector<class_t> classes)
		: _classes(std::move(classes))
	{
	}

	std::vector<class_t> TreeEnsembleModel::predict(const cv::Mat& features) const
	{
		if (features.type() != CV_32F || features.cols != 1) {
			throw std::invalid_argument("Features must be a single CV_32F column");
		}
		if (features.rows == 0) {
			return {};
		}
		cv::Mat finite = features.clone();
		cv::patchNaNs(finite, std::numeric_limits<double>::infinity());
		return _predictFinite(finite);
	}

	class_t TreeEnsembleModel::predict(index_t x) const
	{
		cv::Mat feature(1, 1, CV_32F);
		feature.at<float>(0, 0) = x;
		return predict(feature)[0];
	}

	const std::vector<class_t>& TreeEnsembleModel::classes() const
	{
		return _classes;
	}

	RandomForestModel::RandomForestModel(cv::Ptr<cv::ml::RTrees> forest, std::vector<class_t> classes)
		: TreeEnsembleModel(std::move(classes)), _forest(std::move(forest))
	{
	}

	size_t RandomForestModel::nTrees() const
	{
		return _forest->getRoots().size();
	}

	std::vector<class_t> RandomForestModel::_predictFinite(const cv::Mat& features) const
	{
		cv::Mat results;
		_forest->predict(features, results);
		std::vector<class_t> out(results.rows);
		for (int i = 0; i < results.rows; ++i) {
			out[i] = (class_t)cvRound(results.at<float>(i, 0));
		}
		return out;
	}

	std::unique_ptr<RandomForestModel> fitRandomForest(const cv::Ptr<cv::ml::TrainData>& data, const TreeEnsembleParams& params)
	{
		if (params.nTrees < 1) {
			throw std::invalid_argument("A tree ensemble needs at least one tree");
		}
		cv::Ptr<cv::ml::RTrees> forest = cv::ml::RTrees::create();
		forest->setMaxDepth(MAX_TREE_DEPTH);
		forest->setMinSampleCount(minSamplesSplit(params));
		forest->setUseSurrogates(false);
		forest->setActiveVarCount(1);
		forest->setCalculateVarImportance(false);
		forest->setTermCriteria(cv::TermCriteria(cv::TermCriteria::MAX_ITER, params.nTrees, 0));
		if (!forest->train(data)) {
			throw std::runtime_error("Unable to train a random forest on " + std::to_string(data->getNSamples()) + " samples");
		}
		return std::make_unique<RandomForestModel>(std::move(forest), classLabels(data));
	}

	DecisionTree::DecisionTree(std::vector<IndexedSample> samples, int nClasses, int minSamplesLeaf, std::mt19937_64& rng)
		: _nClasses(nClasses)
	{
		struct Pending {
			int32_t node;
			size_t begin, end;
		};
		std::vector<Pending> stack;
		_nodes.emplace_back();
		stack.push_back({ 0, 0, samples.size() });

		const IndexedSample* data = samples.data();
		while (stack.size()) {
			Pending current = stack.back();
			stack.pop_back();
			const IndexedSample* begin = data + current.begin;
			const IndexedSample* end = data + current.end;

			std::vector<double> counts = classCounts(begin, end, nClasses);
			double total = (double)(end - begin);
			int nPresent = (int)std::count_if(counts.begin(), counts.end(), [](double c) { return c > 0; });

			if (total >= 2. * minSamplesLeaf && nPresent > 1) {
				std::optional<index_t> threshold = randomSplit(begin, end, minSamplesLeaf, rng);
				if (threshold) {
					const IndexedSample* mid = partitionPoint(begin, end, *threshold);
					int32_t left = (int32_t)_nodes.size();
					int32_t right = left + 1;
					_nodes.emplace_back();
					_nodes.emplace_back();
					_nodes[current.node].threshold = *threshold;
					_nodes[current.node].left = left;
					_nodes[current.node].right = right;
					size_t midIndex = current.begin + (mid - begin);
					stack.push_back({ right, midIndex, current.end });
					stack.push_back({ left, current.begin, midIndex });
					continue;
				}
			}

			_nodes[current.node].leafOffset = _leafDistributions.size();
			for (double c : counts) {
				_leafDistributions.push_back(total > 0 ? c / total : 0.);
			}
		}
	}

	const double* DecisionTree::leafDistribution(index_t x) const
	{
		int32_t node = 0;
		while (_nodes[node].left >= 0) {
			node = x <= _nodes[node].threshold ? _nodes[node].left : _nodes[node].right;
		}
		return _leafDistributions.data() + _nodes[node].leafOffset;
	}

	void DecisionTree::collectThresholds(std::vector<index_t>& out) const
	{
		for (const Node& n : _nodes) {
			if (n.left >= 0) {
				out.push_back(n.threshold);
			}
		}
	}

	size_t DecisionTree::nLeaves() const
	{
		return _leafDistributions.size() / _nClasses;
	}

	ExtraTreesModel::ExtraTreesModel(std::vector<class_t> classes, std::vector<DecisionTree> trees)
		: TreeEnsembleModel(std::move(classes)), _trees(std::move(trees))
	{
		for (const DecisionTree& tree : _trees) {
			tree.collectThresholds(_steps);
		}
		std::sort(_steps.begin(), _steps.end());
		_steps.erase(std::unique(_steps.begin(), _steps.end()), _steps.end());

		//each threshold is itself inside the interval it closes, so evaluating there gives that interval's class
		_stepClasses.reserve(_steps.size() + 1);
		for (index_t t : _steps) {
			_stepClasses.push_back(_predictByTrees(t));
		}
		_stepClasses.push_back(_predictByTrees(std::numeric_limits<index_t>::infinity()));
	}

	std::vector<double> ExtraTreesModel::classProbabilities(index_t x) const
	{
		std::vector<double> probs(_classes.size(), 0.);
		for (const DecisionTree& tree : _trees) {
			const double* dist = tree.leafDistribution(x);
			for (size_t c = 0; c < probs.size(); ++c) {
				probs[c] += dist[c];
			}
		}
		for (double& p : probs) {
			p /= (double)_trees.size();
		}
		return probs;
	}

	size_t ExtraTreesModel::nTrees() const
	{
		return _trees.size();
	}

	std::vector<class_t> ExtraTreesModel::_predictFinite(const cv::Mat& features) const
	{
		std::vector<class_t> out(features.rows);
		cv::parallel_for_(cv::Range(0, features.rows), [&](const cv::Range& range) {
			for (int i = range.start; i < range.end; ++i) {
				index_t x = features.at<float>(i, 0);
				size_t interval = std::lower_bound(_steps.begin(), _steps.end(), x) - _steps.begin();
				out[i] = _stepClasses[interval];
			}
			});
		return out;
	}

	class_t ExtraTreesModel::_predictByTrees(index_t x) const
	{
		std::vector<double> probs = classProbabilities(x);
		size_t best = 0;
		for (size_t c = 1; c < probs.size(); ++c) {
			if (probs[c] > probs[best]) {
				best = c;
			}
		}
		return _classes[best];
	}

	std::unique_ptr<ExtraTreesModel> fitExtraTrees(const cv::Ptr<cv::ml::TrainData>& data, const TreeEnsembleParams& params,
		uint64_t seed, int nThread)
	{
		if (params.nTrees < 1) {
			throw std::invalid_argument("A tree ensemble needs at least one tree");
		}
		std::vector<class_t> classes = classLabels(data);
		cv::Mat x = data->getTrainSamples();
		cv::Mat classIndex = data->getTrainNormCatResponses();

		std::vector<IndexedSample> sorted;
		sorted.reserve(x.rows);
		for (int i = 0; i < x.rows; ++i) {
			sorted.push_back({ x.at<float>(i, 0), classIndex.at<int>(i) });
		}
		std::sort(sorted.begin(), sorted.end(), [](const IndexedSample& a, const IndexedSample& b) {
			return a.x < b.x || (a.x == b.x && a.classIndex < b.classIndex);
			});

		const int nClasses = (int)classes.size();
		std::vector<std::optional<DecisionTree>> trees(params.nTrees);

		auto growTree = [&](int treeIndex) {
			std::seed_seq seq{ (uint32_t)(seed & 0xffffffff), (uint32_t)(seed >> 32), (uint32_t)treeIndex };
			std::mt19937_64 rng{ seq };
			trees[treeIndex].emplace(sorted, nClasses, params.minSamplesLeaf, rng);
			};

		nThread = std::clamp(nThread, 1, params.nTrees);
		std::atomic<int> nextTree = 0;
		std::mutex errMut;
		std::exception_ptr firstError;
		auto worker = [&]() {
			int i;
			while ((i = nextTree++) < params.nTrees) {
				try {
					growTree(i);
				}
				catch (const std::exception&) {
					std::scoped_lock<std::mutex> lock{ errMut };
					if (!firstError) {
						firstError = std::current_exception();
					}
					nextTree = params.nTrees;
				}
			}
			};
		std::vector<std::thread> threads;
		for (int t = 0; t < nThread; ++t) {
			threads.emplace_back(worker);
		}
		for (std::thread& t : threads) {
			t.join();
		}
		if (firstError) {
			std::rethrow_exception(firstError);
		}

		std::vector<DecisionTree> grown;
		grown.reserve(trees.size());
		for (std::optional<DecisionTree>& t : trees) {
			grown.push_back(std::move(*t));
		}
		return std::make_unique<ExtraTreesModel>(std::move(classes), std::move(grown));
	}
}
