#pragma once
#ifndef canoclass_treeensemble_h
#define canoclass_treeensemble_h

#include"canoclass_pch.hpp"
#include"CanoClassTypeDefs.hpp"

namespace canoclass {

	struct TrainingSample {
		index_t x;
		class_t y;
	};

	//fixed policy values shared by both ensemble variants
	struct TreeEnsembleParams {
		int nTrees = 50;
		int minSamplesLeaf = 10;
	};

	//a node is only split if it holds at least this many samples
	inline int minSamplesSplit(const TreeEnsembleParams& params) {
		return 2 * params.minSamplesLeaf;
	}

	//One row per sample: the feature in a CV_32F column, the class in a CV_32S column, so the response is categorical.
	//samples must have finite x; throws std::invalid_argument if there are no samples
	cv::Ptr<cv::ml::TrainData> makeTrainData(const std::vector<TrainingSample>& samples);

	//A trained ensemble over a single feature. Only ever predicts classes it was trained on.
	class TreeEnsembleModel {
	public:
		virtual ~TreeEnsembleModel() = default;

		//features is a single CV_32F column. NaN fails every x <= threshold test, so it's predicted like +infinity.
		std::vector<class_t> predict(const cv::Mat& features) const;
		class_t predict(index_t x) const;

		//ascending
		const std::vector<class_t>& classes() const;
		virtual size_t nTrees() const = 0;

	protected:
		TreeEnsembleModel(std::vector<class_t> classes);

		std::vector<class_t> _classes;

		//features has no NaN
		virtual std::vector<class_t> _predictFinite(const cv::Mat& features) const = 0;
	};

	//cv::ml::RTrees: bootstrap samples and the best Gini threshold at each node.
	//The trees vote and ties go to the smaller class.
	class RandomForestModel : public TreeEnsembleModel {
	public:
		RandomForestModel(cv::Ptr<cv::ml::RTrees> forest, std::vector<class_t> classes);
		size_t nTrees() const override;

	protected:
		std::vector<class_t> _predictFinite(const cv::Mat& features) const override;

	private:
		cv::Ptr<cv::ml::RTrees> _forest;
	};

	//Trains cv::ml::RTrees with params.nTrees trees. The forest's random stream is reset by every training call,
	//so the same data always gives the same model.
	std::unique_ptr<RandomForestModel> fitRandomForest(const cv::Ptr<cv::ml::TrainData>& data, const TreeEnsembleParams& params);

	//A training sample in an extra tree's working set, by index into the sorted class labels.
	struct IndexedSample {
		index_t x;
		int classIndex;
	};

	//One extremely randomized tree: each node draws a single threshold uniformly between its smallest and largest value.
	//A node with fewer than 2 * minSamplesLeaf samples, a single class, or a drawn threshold that leaves fewer than
	//minSamplesLeaf samples on either side becomes a leaf.
	class DecisionTree {
	public:
		//samples must be sorted by x
		DecisionTree(std::vector<IndexedSample> samples, int nClasses, int minSamplesLeaf, std::mt19937_64& rng);

		//the class distribution of the leaf x falls in; a sample goes left if x <= threshold
		const double* leafDistribution(index_t x) const;

		void collectThresholds(std::vector<index_t>& out) const;
		size_t nLeaves() const;

	private:
		struct Node {
			index_t threshold = 0;
			//-1 for leaves
			int32_t left = -1, right = -1;
			//offset into _leafDistributions for leaves
			size_t leafOffset = 0;
		};
		std::vector<Node> _nodes;
		std::vector<double> _leafDistributions;
		int _nClasses;
	};

	//cv::ml has no extremely randomized trees, so they're grown here from the same TrainData.
	class ExtraTreesModel : public TreeEnsembleModel {
	public:
		ExtraTreesModel(std::vector<class_t> classes, std::vector<DecisionTree> trees);

		//the mean of the trees' leaf distributions, in the order of classes()
		std::vector<double> classProbabilities(index_t x) const;

		size_t nTrees() const override;

	protected:
		std::vector<class_t> _predictFinite(const cv::Mat& features) const override;

	private:
		std::vector<DecisionTree> _trees;

		//With one feature the ensemble is a step function of x. _steps holds every tree's thresholds in order,
		//and _stepClasses[i] is the prediction for x in (_steps[i-1], _steps[i]]; the last entry covers x above every threshold.
		std::vector<index_t> _steps;
		std::vector<class_t> _stepClasses;

		//the class with the greatest mean probability; ties go to the smaller class
		class_t _predictByTrees(index_t x) const;
	};

	//Grows params.nTrees trees on nThread threads, each on the whole training set. Tree i draws its random numbers
	//from a stream seeded by (seed, i), so the model doesn't depend on the number of threads.
	std::unique_ptr<ExtraTreesModel> fitExtraTrees(const cv::Ptr<cv::ml::TrainData>& data, const TreeEnsembleParams& params,
		uint64_t seed, int nThread);
}

#endif
