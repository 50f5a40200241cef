#include"test_pch.hpp"
#include"../TreeEnsemble.hpp"

namespace canoclass {

	namespace {
		//the first class with the greatest probability
		class_t argmaxClass(const ExtraTreesModel& model, index_t x) {
			std::vector<double> probs = model.classProbabilities(x);
			size_t best = 0;
			for (size_t i = 1; i < probs.size(); ++i) {
				if (probs[i] > probs[best]) {
					best = i;
				}
			}
			return model.classes()[best];
		}

		std::vector<TrainingSample> noisySamples(size_t n, uint64_t seed) {
			std::mt19937_64 rng{ seed };
			std::uniform_real_distribution<double> xdist(-1, 1);
			std::uniform_real_distribution<double> noise(0, 1);
			std::vector<TrainingSample> out;
			for (size_t i = 0; i < n; ++i) {
				index_t x = (index_t)xdist(rng);
				//mostly class 2 above 0.2, with some label noise
				bool high = x > 0.2;
				if (noise(rng) < 0.2) {
					high = !high;
				}
				out.push_back({ x, (class_t)(high ? 2 : 1) });
			}
			return out;
		}

		std::vector<TrainingSample> separableSamples() {
			std::vector<TrainingSample> samples;
			for (int i = 0; i < 100; ++i) {
				samples.push_back({ (index_t)(i / 100.), 1 });
				samples.push_back({ (index_t)(2 + i / 100.), 2 });
			}
			return samples;
		}

		std::vector<IndexedSample> sortedIndexed(const std::vector<std::pair<index_t, int>>& xs) {
			std::vector<IndexedSample> out;
			for (const auto& [x, c] : xs) {
				out.push_back({ x, c });
			}
			std::sort(out.begin(), out.end(), [](const IndexedSample& a, const IndexedSample& b) { return a.x < b.x; });
			return out;
		}

		std::vector<index_t> gridPoints() {
			std::vector<index_t> out = { -std::numeric_limits<index_t>::infinity(), std::numeric_limits<index_t>::infinity(),
				std::numeric_limits<index_t>::quiet_NaN(), -5, 5 };
			for (int i = -100; i <= 100; ++i) {
				out.push_back((index_t)(i / 100.));
			}
			return out;
		}
	}

	TEST(TreeEnsembleTest, trainData) {
		cv::Ptr<cv::ml::TrainData> data = makeTrainData({ { 0.5f, 7 }, { 0.25f, 3 }, { 1.f, 7 } });
		EXPECT_EQ(data->getNSamples(), 3);
		EXPECT_EQ(data->getNVars(), 1);
		cv::Mat labels = data->getClassLabels();
		ASSERT_EQ(labels.total(), 2);
		EXPECT_EQ(labels.at<int>(0), 3);
		EXPECT_EQ(labels.at<int>(1), 7);

		EXPECT_THROW(makeTrainData({}), std::invalid_argument);
	}

	TEST(TreeEnsembleTest, separableData) {
		cv::Ptr<cv::ml::TrainData> data = makeTrainData(separableSamples());
		TreeEnsembleParams params;

		std::unique_ptr<RandomForestModel> rf = fitRandomForest(data, params);
		EXPECT_EQ(rf->nTrees(), 50);
		EXPECT_EQ(rf->classes(), std::vector<class_t>({ 1, 2 }));
		EXPECT_EQ(rf->predict(0.5f), 1);
		EXPECT_EQ(rf->predict(2.5f), 2);
		EXPECT_EQ(rf->predict(-100.f), 1);
		EXPECT_EQ(rf->predict(100.f), 2);

		std::unique_ptr<ExtraTreesModel> et = fitExtraTrees(data, params, 0, 2);
		EXPECT_EQ(et->nTrees(), 50);
		EXPECT_EQ(et->classes(), std::vector<class_t>({ 1, 2 }));
		EXPECT_EQ(et->predict(0.5f), 1);
		EXPECT_EQ(et->predict(2.5f), 2);
	}

	TEST(TreeEnsembleTest, predictColumn) {
		cv::Ptr<cv::ml::TrainData> data = makeTrainData(separableSamples());
		std::unique_ptr<TreeEnsembleModel> rf = fitRandomForest(data, TreeEnsembleParams());

		cv::Mat features = (cv::Mat_<float>(4, 1) << 0.1f, 2.9f, std::numeric_limits<float>::quiet_NaN(), 0.9f);
		std::vector<class_t> predicted = rf->predict(features);
		EXPECT_EQ(predicted, std::vector<class_t>({ 1, 2, 2, 1 }));
		//the input is left alone
		EXPECT_TRUE(std::isnan(features.at<float>(2, 0)));

		EXPECT_TRUE(rf->predict(cv::Mat(0, 1, CV_32F)).empty());
		EXPECT_THROW(rf->predict(cv::Mat(3, 2, CV_32F)), std::invalid_argument);
		EXPECT_THROW(rf->predict(cv::Mat(3, 1, CV_64F)), std::invalid_argument);
	}

	TEST(TreeEnsembleTest, onlyPredictsTrainedClasses) {
		cv::Ptr<cv::ml::TrainData> data = makeTrainData(noisySamples(500, 3));
		TreeEnsembleParams params;
		std::vector<std::unique_ptr<TreeEnsembleModel>> models;
		models.push_back(fitRandomForest(data, params));
		models.push_back(fitExtraTrees(data, params, 11, 3));
		for (const std::unique_ptr<TreeEnsembleModel>& model : models) {
			for (index_t x : gridPoints()) {
				class_t c = model->predict(x);
				EXPECT_TRUE(c == 1 || c == 2) << "x = " << x;
			}
		}
	}

	TEST(TreeEnsembleTest, extraTreesPredictMatchesMeanProbabilities) {
		std::vector<TrainingSample> samples = noisySamples(400, 5);
		std::unique_ptr<ExtraTreesModel> model = fitExtraTrees(makeTrainData(samples), TreeEnsembleParams(), 7, 4);
		for (const TrainingSample& s : samples) {
			EXPECT_EQ(model->predict(s.x), argmaxClass(*model, s.x)) << "x = " << s.x;
		}
		for (int i = -150; i <= 150; ++i) {
			index_t x = (index_t)(i / 100.);
			EXPECT_EQ(model->predict(x), argmaxClass(*model, x)) << "x = " << x;
		}
		//NaN fails every x <= threshold test, like +infinity
		EXPECT_EQ(model->predict(std::numeric_limits<index_t>::quiet_NaN()), model->predict(std::numeric_limits<index_t>::infinity()));
	}

	TEST(TreeEnsembleTest, nanIsPredictedLikeInfinity) {
		cv::Ptr<cv::ml::TrainData> data = makeTrainData(noisySamples(300, 13));
		std::unique_ptr<RandomForestModel> rf = fitRandomForest(data, TreeEnsembleParams());
		EXPECT_EQ(rf->predict(std::numeric_limits<index_t>::quiet_NaN()), rf->predict(std::numeric_limits<index_t>::infinity()));
	}

	TEST(TreeEnsembleTest, repeatable) {
		cv::Ptr<cv::ml::TrainData> data = makeTrainData(noisySamples(300, 9));
		TreeEnsembleParams params;

		std::unique_ptr<ExtraTreesModel> one = fitExtraTrees(data, params, 123, 1);
		std::unique_ptr<ExtraTreesModel> many = fitExtraTrees(data, params, 123, 8);
		std::unique_ptr<RandomForestModel> rfA = fitRandomForest(data, params);
		std::unique_ptr<RandomForestModel> rfB = fitRandomForest(data, params);
		for (int i = -100; i <= 100; ++i) {
			index_t x = (index_t)(i / 100.);
			EXPECT_EQ(one->classProbabilities(x), many->classProbabilities(x));
			EXPECT_EQ(one->predict(x), many->predict(x));
			EXPECT_EQ(rfA->predict(x), rfB->predict(x));
		}
	}

	TEST(TreeEnsembleTest, extraTreesTiesGoToSmallerClass) {
		std::vector<TrainingSample> samples;
		for (int i = 0; i < 10; ++i) {
			samples.push_back({ 1.f, 7 });
			samples.push_back({ 1.f, 3 });
		}
		std::unique_ptr<ExtraTreesModel> model = fitExtraTrees(makeTrainData(samples), TreeEnsembleParams(), 0, 1);
		std::vector<double> probs = model->classProbabilities(1.f);
		ASSERT_EQ(probs.size(), 2);
		EXPECT_DOUBLE_EQ(probs[0], 0.5);
		EXPECT_DOUBLE_EQ(probs[1], 0.5);
		EXPECT_EQ(model->predict(1.f), 3);
	}

	TEST(TreeEnsembleTest, minSamplesLeaf) {
		std::mt19937_64 rng{ 0 };

		//15 samples can't be split into two leaves of 10
		std::vector<std::pair<index_t, int>> small;
		for (int i = 0; i < 15; ++i) {
			small.push_back({ (index_t)i, i < 7 ? 0 : 1 });
		}
		DecisionTree stump{ sortedIndexed(small), 2, 10, rng };
		EXPECT_EQ(stump.nLeaves(), 1);

		//a pure node is never split
		std::vector<std::pair<index_t, int>> pure;
		for (int i = 0; i < 40; ++i) {
			pure.push_back({ (index_t)i, 1 });
		}
		DecisionTree leaf{ sortedIndexed(pure), 2, 10, rng };
		EXPECT_EQ(leaf.nLeaves(), 1);

		//every split that is made leaves at least 10 samples on each side
		std::vector<std::pair<index_t, int>> mixed;
		for (int i = 0; i < 60; ++i) {
			mixed.push_back({ (index_t)i, i % 3 == 0 ? 0 : 1 });
		}
		for (int t = 0; t < 20; ++t) {
			DecisionTree tree{ sortedIndexed(mixed), 2, 10, rng };
			std::vector<index_t> thresholds;
			tree.collectThresholds(thresholds);
			EXPECT_EQ(tree.nLeaves(), thresholds.size() + 1);
			for (index_t threshold : thresholds) {
				int nLeft = (int)std::floor(threshold) + 1;
				EXPECT_GE(nLeft, 10) << threshold;
				EXPECT_GE(60 - nLeft, 10) << threshold;
			}
		}
	}

	TEST(TreeEnsembleTest, badArguments) {
		cv::Ptr<cv::ml::TrainData> data = makeTrainData({ { 1.f, 1 }, { 2.f, 2 } });
		TreeEnsembleParams params;
		params.nTrees = 0;
		EXPECT_THROW(fitRandomForest(data, params), std::invalid_argument);
		EXPECT_THROW(fitExtraTrees(data, params, 0, 1), std::invalid_argument);
	}
}
