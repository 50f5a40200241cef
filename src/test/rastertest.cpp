#include"test_pch.hpp"
#include"../MultiBandRaster.hpp"

namespace canoclass {

	class RasterTest : public TempDirTest {
	public:
		Alignment a{ 1000, 2000, 4, 3, 2, 2, CoordRef("EPSG:5070") };
	};

	TEST_F(RasterTest, writeAndReadFloat) {
		Raster<index_t> r{ a };
		for (cell_t cell = 0; cell < r.ncell(); ++cell) {
			r[cell].has_value() = true;
			r[cell].value() = (index_t)cell / 4;
		}
		r[5].has_value() = false;

		std::filesystem::path file = dir / "float.tif";
		r.writeRaster(file.string());
		EXPECT_TRUE(std::filesystem::exists(file));
		EXPECT_FALSE(std::filesystem::exists(dir / "float.tif.tmp"));

		Raster<index_t> back{ file.string() };
		EXPECT_EQ((Alignment)back, a);
		EXPECT_TRUE(back.crs().isConsistent(CoordRef("EPSG:5070")));
		for (cell_t cell = 0; cell < r.ncell(); ++cell) {
			if (cell == 5) {
				EXPECT_FALSE(back[cell].has_value());
				continue;
			}
			ASSERT_TRUE(back[cell].has_value());
			EXPECT_FLOAT_EQ(back[cell].value(), (index_t)cell / 4);
		}
	}

	TEST_F(RasterTest, nanIsMissingOnRead) {
		Raster<index_t> r{ a };
		for (cell_t cell = 0; cell < r.ncell(); ++cell) {
			r[cell].has_value() = true;
			r[cell].value() = 1;
		}
		r[0].value() = std::numeric_limits<index_t>::quiet_NaN();
		std::filesystem::path file = dir / "nan.tif";
		r.writeRaster(file.string());

		Raster<index_t> back{ file.string() };
		EXPECT_FALSE(back[0].has_value());
		EXPECT_TRUE(back[1].has_value());
	}

	TEST_F(RasterTest, writeAndReadByte) {
		Raster<class_t> r{ a };
		for (cell_t cell = 0; cell < r.ncell(); ++cell) {
			r[cell].has_value() = true;
			r[cell].value() = (class_t)(cell % 3);
		}
		std::filesystem::path file = dir / "byte.tif";
		r.writeRaster(file.string());

		Raster<class_t> back{ file.string() };
		EXPECT_EQ(back, r);
	}

	TEST_F(RasterTest, replacesExistingFile) {
		std::filesystem::path file = dir / "replaced.tif";
		Raster<class_t> r{ a };
		for (cell_t cell = 0; cell < r.ncell(); ++cell) {
			r[cell].has_value() = true;
			r[cell].value() = 1;
		}
		r.writeRaster(file.string());
		for (cell_t cell = 0; cell < r.ncell(); ++cell) {
			r[cell].value() = 2;
		}
		r.writeRaster(file.string());

		Raster<class_t> back{ file.string() };
		EXPECT_EQ(back.atCell(0).value(), 2);
	}

	TEST_F(RasterTest, multiBand) {
		std::filesystem::path file = dir / "tile.tif";
		writeUniformTile(file, a, 10, 20, 5, 50);

		MultiBandRaster<index_t> tile{ file.string() };
		EXPECT_EQ(tile.nBands(), 4);
		EXPECT_EQ((Alignment)tile, a);
		EXPECT_FLOAT_EQ(tile.atCell(0, 1).value(), 10);
		EXPECT_FLOAT_EQ(tile.atCell(3, 2).value(), 20);
		EXPECT_FLOAT_EQ(tile.atRC(2, 3, 3).value(), 5);
		EXPECT_FLOAT_EQ(tile.atRC(1, 1, 4).value(), 50);
		EXPECT_THROW(tile.bandAt(5), std::out_of_range);
		EXPECT_THROW(tile.bandAt(0), std::out_of_range);

		Raster<index_t> nir{ file.string(), 4 };
		EXPECT_FLOAT_EQ(nir.atCell(11).value(), 50);
		EXPECT_THROW(Raster<index_t>(file.string(), 5), UnsupportedFormatException);
	}

	TEST_F(RasterTest, bounds) {
		Raster<index_t> r{ a };
		EXPECT_THROW(r.atCell(12), std::out_of_range);
		EXPECT_THROW(r.atCell(-1), std::out_of_range);
		EXPECT_THROW(r.atRC(3, 0), std::out_of_range);
		EXPECT_FALSE(r.hasAnyValue());
	}

	TEST_F(RasterTest, readErrors) {
		EXPECT_THROW(Raster<index_t>((dir / "nothere.tif").string()), InputNotFoundException);

		std::filesystem::path notRaster = dir / "text.tif";
		{
			std::ofstream out{ notRaster };
			out << "this is not a raster\n";
		}
		EXPECT_THROW(Raster<index_t>(notRaster.string()), UnsupportedFormatException);
		EXPECT_THROW(MultiBandRaster<index_t>(notRaster.string()), UnsupportedFormatException);
	}

	TEST_F(RasterTest, failedWriteLeavesNothing) {
		Raster<index_t> r{ a };
		std::filesystem::path file = dir / "no_such_dir" / "out.tif";
		EXPECT_THROW(r.writeRaster(file.string()), IOFailureException);
		EXPECT_FALSE(std::filesystem::exists(file));
		EXPECT_FALSE(std::filesystem::exists(dir / "no_such_dir" / "out.tif.tmp"));
	}
}
