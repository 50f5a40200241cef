#include"test_pch.hpp"
#include"../Alignment.hpp"

namespace canoclass {

	TEST(AlignmentTest, cellCenters) {
		Alignment a{ 0, 10, 10, 10, 1, 1 };
		EXPECT_EQ(a.ncell(), 100);
		EXPECT_DOUBLE_EQ(a.xres(), 1);
		EXPECT_DOUBLE_EQ(a.yres(), 1);

		CoordXY ul = a.xyFromRowColUnsafe(0, 0);
		EXPECT_DOUBLE_EQ(ul.x, 0.5);
		EXPECT_DOUBLE_EQ(ul.y, 9.5);
		CoordXY lr = a.xyFromCellUnsafe(99);
		EXPECT_DOUBLE_EQ(lr.x, 9.5);
		EXPECT_DOUBLE_EQ(lr.y, 0.5);

		CoordXY cr = a.colRowFromXY(0.5, 9.5);
		EXPECT_NEAR(cr.x, 0.5, 1e-9);
		EXPECT_NEAR(cr.y, 0.5, 1e-9);
		cr = a.colRowFromXY(3, 3);
		EXPECT_NEAR(cr.x, 3, 1e-9);
		EXPECT_NEAR(cr.y, 7, 1e-9);

		Extent e = a.extent();
		EXPECT_DOUBLE_EQ(e.xmin(), 0);
		EXPECT_DOUBLE_EQ(e.xmax(), 10);
		EXPECT_DOUBLE_EQ(e.ymin(), 0);
		EXPECT_DOUBLE_EQ(e.ymax(), 10);
	}

	TEST(AlignmentTest, cellFromRowCol) {
		Alignment a{ 0, 10, 5, 4, 2, 2.5 };
		EXPECT_EQ(a.cellFromRowCol(1, 2), 7);
		EXPECT_EQ(a.rowFromCellUnsafe(7), 1);
		EXPECT_EQ(a.colFromCellUnsafe(7), 2);
		EXPECT_THROW(a.cellFromRowCol(4, 0), std::out_of_range);
		EXPECT_THROW(a.cellFromRowCol(0, -1), std::out_of_range);
	}

	TEST(AlignmentTest, differentSizesMismatch) {
		Alignment labels{ 0, 100, 100, 100, 1, 1 };
		Alignment feature{ 0, 100, 50, 50, 2, 2 };
		EXPECT_FALSE(labels.isSameAlignment(feature));
		EXPECT_NE(labels, feature);
		EXPECT_THROW(checkSameAlignment(labels, feature, "test"), AlignmentMismatchException);
	}

	TEST(AlignmentTest, geotransformTolerance) {
		Alignment a{ 500000, 4000000, 10, 10, 0.6, 0.6 };
		Alignment tiny{ 500000 + 1e-7, 4000000, 10, 10, 0.6, 0.6 };
		Alignment shifted{ 500000.3, 4000000, 10, 10, 0.6, 0.6 };
		EXPECT_EQ(a, tiny);
		EXPECT_NE(a, shifted);
		EXPECT_NO_THROW(checkSameAlignment(a, tiny, "test"));
	}

	TEST(AlignmentTest, crsMustMatch) {
		Alignment none{ 0, 10, 10, 10, 1, 1 };
		Alignment albers{ 0, 10, 10, 10, 1, 1, CoordRef("EPSG:5070") };
		Alignment albers2{ 0, 10, 10, 10, 1, 1, CoordRef("EPSG:5070") };
		Alignment utm{ 0, 10, 10, 10, 1, 1, CoordRef("EPSG:32610") };

		EXPECT_NE(none, albers);
		EXPECT_EQ(albers, albers2);
		EXPECT_NE(albers, utm);
		EXPECT_THROW(checkSameAlignment(albers, utm, "test"), AlignmentMismatchException);
	}

	TEST(AlignmentTest, validGrid) {
		EXPECT_FALSE(Alignment().hasValidGrid());
		EXPECT_THROW(Alignment().checkValidAlignment(), AlignmentMismatchException);
		Alignment zeroPixel{ 0, 10, 10, 10, 0, 1 };
		EXPECT_FALSE(zeroPixel.hasValidGrid());
		EXPECT_TRUE(Alignment(0, 10, 10, 10, 1, 1).hasValidGrid());
	}

	TEST(AlignmentTest, unparseableCrs) {
		EXPECT_THROW(CoordRef("not a projection"), UnsupportedFormatException);
		EXPECT_TRUE(CoordRef("").isEmpty());
	}
}
