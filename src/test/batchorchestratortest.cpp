#include"test_pch.hpp"
#include"../BatchOrchestrator.hpp"
#include"../JobLedger.hpp"
#include<unistd.h>

namespace canoclass {

	class BatchOrchestratorTest : public TempDirTest {
	public:
		Alignment a{ 0, 6, 6, 6, 1, 1 };
		CanoClassSettings settings;
		std::filesystem::path in, out;

		void SetUp() override {
			TempDirTest::SetUp();
			settings.threads = 2;
			in = dir / "in";
			out = dir / "out";
			std::filesystem::create_directories(in / "sub");
			writeUniformTile(in / "tile_01.tif", a, 10, 20, 5, 50);
			writeUniformTile(in / "tile_02.TIF", a, 20, 30, 10, 60);
			writeUniformTile(in / "sub" / "tile_03.tif", a, 5, 20, 5, 80);
			std::ofstream notes{ in / "readme.txt" };
			notes << "not a tile\n";
		}

		void writeBroken(const std::filesystem::path& file) {
			std::ofstream broken{ file };
			broken << "this is not a GeoTIFF\n";
		}

		std::vector<std::filesystem::path> expectedOutputs() {
			return { out / "sub" / "arvi_tile_03.tif", out / "arvi_tile_01.tif", out / "arvi_tile_02.TIF" };
		}
	};

	TEST_F(BatchOrchestratorTest, listTilesAndOutputPaths) {
		IndexOperation op{ settings, VegetationIndex::ARVI };
		TileListing listing = BatchOrchestrator::listTiles(op, in, out);
		EXPECT_TRUE(listing.unreadable.empty());
		const std::vector<std::filesystem::path>& files = listing.files;
		ASSERT_EQ(files.size(), 3);
		EXPECT_EQ(files[0], in / "sub" / "tile_03.tif");
		EXPECT_EQ(files[1], in / "tile_01.tif");
		EXPECT_EQ(files[2], in / "tile_02.TIF");

		EXPECT_EQ(BatchOrchestrator::outputPath(op, in, out, files[0]), out / "sub" / "arvi_tile_03.tif");
		EXPECT_EQ(BatchOrchestrator::outputPath(op, in, out, files[1]), out / "arvi_tile_01.tif");
	}

	TEST_F(BatchOrchestratorTest, secondRunDoesNothing) {
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchOrchestrator orchestrator{ settings };

		BatchReport first = orchestrator.run(op, in, out);
		EXPECT_EQ(first.nWritten(), 3);
		EXPECT_EQ(first.nSkipped(), 0);
		EXPECT_EQ(first.nFailed(), 0);
		EXPECT_FALSE(first.stopped);

		std::vector<std::string> bytes;
		std::vector<std::filesystem::file_time_type> times;
		for (const std::filesystem::path& p : expectedOutputs()) {
			ASSERT_TRUE(std::filesystem::exists(p)) << p;
			EXPECT_FALSE(std::filesystem::exists(p.string() + ".tmp"));
			bytes.push_back(readBytes(p));
			times.push_back(std::filesystem::last_write_time(p));
		}
		Raster<index_t> arvi{ (out / "arvi_tile_01.tif").string() };
		EXPECT_NEAR(arvi.atCell(0).value(), 35. / 75., 1e-6);

		BatchReport second = orchestrator.run(op, in, out);
		EXPECT_EQ(second.nWritten(), 0);
		EXPECT_EQ(second.nSkipped(), 3);
		std::vector<std::filesystem::path> outputs = expectedOutputs();
		for (size_t i = 0; i < outputs.size(); ++i) {
			EXPECT_EQ(readBytes(outputs[i]), bytes[i]);
			EXPECT_EQ(std::filesystem::last_write_time(outputs[i]), times[i]);
		}
	}

	TEST_F(BatchOrchestratorTest, forceRecomputes) {
		IndexOperation op{ settings, VegetationIndex::VDVI };
		EXPECT_EQ(BatchOrchestrator(settings).run(op, in, out).nWritten(), 3);

		settings.force = true;
		BatchReport forced = BatchOrchestrator(settings).run(op, in, out);
		EXPECT_EQ(forced.nWritten(), 3);
		EXPECT_EQ(forced.nSkipped(), 0);
	}

	TEST_F(BatchOrchestratorTest, changedInputIsRecomputed) {
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchOrchestrator orchestrator{ settings };
		orchestrator.run(op, in, out);

		writeUniformTile(in / "tile_01.tif", a, 0, 20, 0, 50);
		BatchReport report = orchestrator.run(op, in, out);
		EXPECT_EQ(report.nWritten(), 1);
		EXPECT_EQ(report.nSkipped(), 2);
		ASSERT_EQ(report.files.size(), 3);
		EXPECT_EQ(report.files[1].status, FileStatus::Written);
		EXPECT_EQ(report.files[1].output, out / "arvi_tile_01.tif");

		Raster<index_t> arvi{ (out / "arvi_tile_01.tif").string() };
		EXPECT_NEAR(arvi.atCell(0).value(), 1, 1e-6);
	}

	TEST_F(BatchOrchestratorTest, existingOutputWithoutRecordIsSkipped) {
		std::filesystem::create_directories(out);
		writeUniformTile(out / "arvi_tile_01.tif", a, 1, 1, 1, 1);
		std::string before = readBytes(out / "arvi_tile_01.tif");

		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchReport report = BatchOrchestrator(settings).run(op, in, out);
		EXPECT_EQ(report.nWritten(), 2);
		EXPECT_EQ(report.nSkipped(), 1);
		EXPECT_EQ(readBytes(out / "arvi_tile_01.tif"), before);
	}

	TEST_F(BatchOrchestratorTest, brokenTileIsReported) {
		writeBroken(in / "broken.tif");
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchReport report = BatchOrchestrator(settings).run(op, in, out);

		EXPECT_EQ(report.nWritten(), 3);
		EXPECT_EQ(report.nFailed(), 1);
		EXPECT_FALSE(report.stopped);
		ASSERT_EQ(report.files.size(), 4);
		const FileResult& broken = report.files[0];
		EXPECT_EQ(broken.input, in / "broken.tif");
		EXPECT_EQ(broken.status, FileStatus::Failed);
		ASSERT_TRUE(broken.errorKind.has_value());
		EXPECT_EQ(*broken.errorKind, ErrorKind::UnsupportedFormat);
		EXPECT_FALSE(broken.message.empty());
		EXPECT_FALSE(std::filesystem::exists(out / "arvi_broken.tif"));
		EXPECT_FALSE(std::filesystem::exists(out / "arvi_broken.tif.tmp"));
	}

	TEST_F(BatchOrchestratorTest, stopPolicy) {
		writeBroken(in / "a_broken.tif");
		settings.threads = 1;
		settings.errorPolicy = ErrorPolicy::Stop;
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchReport report = BatchOrchestrator(settings).run(op, in, out);

		EXPECT_TRUE(report.stopped);
		ASSERT_EQ(report.files.size(), 1);
		EXPECT_EQ(report.nFailed(), 1);
		EXPECT_EQ(report.nWritten(), 0);
		for (const std::filesystem::path& p : expectedOutputs()) {
			EXPECT_FALSE(std::filesystem::exists(p));
		}
	}

	TEST_F(BatchOrchestratorTest, unreadableDirectoryIsReported) {
		if (::geteuid() == 0) {
			GTEST_SKIP() << "permissions don't apply to root";
		}
		std::filesystem::permissions(in / "sub", std::filesystem::perms::none);
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchReport report;
		EXPECT_NO_THROW(report = BatchOrchestrator(settings).run(op, in, out));
		//so TearDown can remove it
		std::filesystem::permissions(in / "sub", std::filesystem::perms::owner_all);

		EXPECT_EQ(report.nWritten(), 2);
		EXPECT_EQ(report.nFailed(), 1);
		EXPECT_FALSE(report.stopped);
		ASSERT_EQ(report.files.size(), 3);
		const FileResult& sub = report.files[0];
		EXPECT_EQ(sub.input, in / "sub");
		EXPECT_EQ(sub.status, FileStatus::Failed);
		ASSERT_TRUE(sub.errorKind.has_value());
		EXPECT_EQ(*sub.errorKind, ErrorKind::IOFailure);
		EXPECT_FALSE(sub.message.empty());
	}

	TEST_F(BatchOrchestratorTest, unreadableDirectoryStopsBatch) {
		if (::geteuid() == 0) {
			GTEST_SKIP() << "permissions don't apply to root";
		}
		std::filesystem::permissions(in / "sub", std::filesystem::perms::none);
		settings.errorPolicy = ErrorPolicy::Stop;
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchReport report;
		EXPECT_NO_THROW(report = BatchOrchestrator(settings).run(op, in, out));
		std::filesystem::permissions(in / "sub", std::filesystem::perms::owner_all);

		EXPECT_TRUE(report.stopped);
		EXPECT_EQ(report.nWritten(), 0);
		EXPECT_EQ(report.nFailed(), 1);
	}

	TEST_F(BatchOrchestratorTest, danglingLinkIsReported) {
		std::filesystem::create_symlink(in / "nothere.tif", in / "dangling.tif");
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchReport report = BatchOrchestrator(settings).run(op, in, out);

		EXPECT_EQ(report.nWritten(), 3);
		EXPECT_EQ(report.nFailed(), 1);
		ASSERT_EQ(report.files.size(), 4);
		const FileResult& dangling = report.files[0];
		EXPECT_EQ(dangling.input, in / "dangling.tif");
		EXPECT_EQ(dangling.status, FileStatus::Failed);
		ASSERT_TRUE(dangling.errorKind.has_value());
		EXPECT_EQ(*dangling.errorKind, ErrorKind::IOFailure);
	}

	TEST_F(BatchOrchestratorTest, missingInputDirectory) {
		IndexOperation op{ settings, VegetationIndex::ARVI };
		EXPECT_THROW(BatchOrchestrator(settings).run(op, dir / "nothere", out), InputNotFoundException);
		EXPECT_THROW(BatchOrchestrator(settings).run(op, in / "tile_01.tif", out), InputNotFoundException);
	}

	TEST_F(BatchOrchestratorTest, outputInsideInput) {
		std::filesystem::path nested = in / "out";
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchOrchestrator orchestrator{ settings };
		EXPECT_EQ(orchestrator.run(op, in, nested).nWritten(), 3);

		BatchReport second = orchestrator.run(op, in, nested);
		EXPECT_EQ(second.files.size(), 3);
		EXPECT_EQ(second.nSkipped(), 3);
		EXPECT_FALSE(std::filesystem::exists(nested / "out"));
	}

	TEST_F(BatchOrchestratorTest, projectionSetting) {
		settings.projection = "EPSG:5070";
		IndexOperation op{ settings, VegetationIndex::ARVI };
		BatchReport report = BatchOrchestrator(settings).run(op, in, out);
		EXPECT_EQ(report.nFailed(), 3);
		for (const FileResult& r : report.files) {
			ASSERT_TRUE(r.errorKind.has_value());
			EXPECT_EQ(*r.errorKind, ErrorKind::AlignmentMismatch);
		}
	}

	TEST_F(BatchOrchestratorTest, classifyBatch) {
		//train on a grid whose left half is class 1 and right half class 2, with the column index as the feature
		Alignment train{ 0, 20, 20, 20, 1, 1 };
		Raster<class_t> labels{ train };
		for (cell_t cell = 0; cell < labels.ncell(); ++cell) {
			labels[cell].has_value() = true;
			labels[cell].value() = labels.colFromCellUnsafe(cell) < 10 ? 1 : 2;
		}
		settings.trainingRaster = dir / "labels.tif";
		settings.trainingFitRaster = dir / "fit.tif";
		labels.writeRaster(settings.trainingRaster.string());
		columnGradient(train).writeRaster(settings.trainingFitRaster.string());

		std::filesystem::path indexDir = dir / "index";
		std::filesystem::create_directories(indexDir);
		columnGradient(a).writeRaster((indexDir / "arvi_tile_01.tif").string());
		columnGradient(Alignment(100, 100, 20, 4, 1, 1)).writeRaster((indexDir / "arvi_tile_02.tif").string());

		ClassifyOperation op{ settings, ClassifierStrategy::ExtraTrees };
		EXPECT_EQ(op.prefix(), "erf_");
		BatchOrchestrator orchestrator{ settings };
		BatchReport report = orchestrator.run(op, indexDir, out);
		EXPECT_EQ(report.nWritten(), 2);

		Raster<class_t> classified{ (out / "erf_arvi_tile_02.tif").string() };
		EXPECT_EQ(classified.ncol(), 20);
		EXPECT_EQ(classified.atRC(1, 0).value(), 1);
		EXPECT_EQ(classified.atRC(1, 7).value(), 1);
		EXPECT_EQ(classified.atRC(1, 12).value(), 2);
		EXPECT_EQ(classified.atRC(1, 19).value(), 2);

		EXPECT_EQ(orchestrator.run(op, indexDir, out).nSkipped(), 2);

		//a different smoothing window is a different result
		settings.smoothWindow = 3;
		ClassifyOperation op3{ settings, ClassifierStrategy::ExtraTrees };
		EXPECT_NE(op3.parameters(), op.parameters());
		EXPECT_EQ(orchestrator.run(op3, indexDir, out).nWritten(), 2);
	}

	TEST_F(BatchOrchestratorTest, classifyNeedsTrainingRasters) {
		settings.trainingRaster = dir / "nothere.tif";
		settings.trainingFitRaster = dir / "nothere.tif";
		EXPECT_THROW(ClassifyOperation(settings, ClassifierStrategy::RandomForest), InputNotFoundException);
	}

	TEST(TileOperationTest, tifExtension) {
		EXPECT_TRUE(isTifFile("a/b/tile.tif"));
		EXPECT_TRUE(isTifFile("tile.TIF"));
		EXPECT_TRUE(isTifFile("tile.Tif"));
		EXPECT_FALSE(isTifFile("tile.tiff"));
		EXPECT_FALSE(isTifFile("tile.tif.tmp"));
		EXPECT_FALSE(isTifFile("tif"));
	}
}
