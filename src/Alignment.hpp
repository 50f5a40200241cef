#pragma once
#ifndef canoclass_alignment_h
#define canoclass_alignment_h

#include"canoclass_pch.hpp"
#include"Extent.hpp"
#include"Coordinate.hpp"
#include"GDALWrappers.hpp"

namespace canoclass {

	//The grid geometry of a raster: its size, its affine geotransform (GDAL order) and its crs.
	//Cells are numbered row-major from the upper left, starting at 0.
	class Alignment {
	public:
		Alignment() = default;
		Alignment(const std::array<double, 6>& geotrans, rowcol_t ncol, rowcol_t nrow, const CoordRef& crs);
		//a north-up grid whose upper-left corner is at (xmin, ymax)
		Alignment(coord_t xmin, coord_t ymax, rowcol_t ncol, rowcol_t nrow, coord_t xres, coord_t yres, const CoordRef& crs = CoordRef());

		//reads the alignment of a GDAL-readable raster without reading any of its data
		Alignment(const std::string& filename);

		virtual ~Alignment() = default;

		rowcol_t ncol() const { return _ncol; }
		rowcol_t nrow() const { return _nrow; }
		cell_t ncell() const { return (cell_t)_ncol * (cell_t)_nrow; }
		const CoordRef& crs() const { return _crs; }
		const std::array<double, 6>& geoTransform() const { return _geotrans; }

		//pixel width and height as positive numbers
		coord_t xres() const { return std::abs(_geotrans[1]); }
		coord_t yres() const { return std::abs(_geotrans[5]); }

		//the bounding box of the four corners
		Extent extent() const;

		cell_t cellFromRowCol(rowcol_t row, rowcol_t col) const;
		cell_t cellFromRowColUnsafe(rowcol_t row, rowcol_t col) const {
			return (cell_t)row * _ncol + col;
		}
		rowcol_t rowFromCellUnsafe(cell_t cell) const {
			return (rowcol_t)(cell / _ncol);
		}
		rowcol_t colFromCellUnsafe(cell_t cell) const {
			return (rowcol_t)(cell % _ncol);
		}

		//the coordinates of the center of the cell
		CoordXY xyFromRowColUnsafe(rowcol_t row, rowcol_t col) const;
		CoordXY xyFromCellUnsafe(cell_t cell) const {
			return xyFromRowColUnsafe(rowFromCellUnsafe(cell), colFromCellUnsafe(cell));
		}

		//the fractional (col, row) position of a point; the center of the upper-left cell is (0.5, 0.5)
		CoordXY colRowFromXY(coord_t x, coord_t y) const;

		//same size, same geotransform to within a relative tolerance of 1e-9, and consistent crs
		bool isSameAlignment(const Alignment& other) const;

		//false if the grid has no cells or a zero-sized pixel
		bool hasValidGrid() const;
		void checkValidAlignment() const;

	protected:
		std::array<double, 6> _geotrans = { 0,1,0,0,0,-1 };
		rowcol_t _ncol = 0, _nrow = 0;
		CoordRef _crs;

		void alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans);
	};

	//throws AlignmentMismatchException naming the context if the two alignments differ
	void checkSameAlignment(const Alignment& a, const Alignment& b, const std::string& context);

	bool operator==(const Alignment& lhs, const Alignment& rhs);
	bool operator!=(const Alignment& lhs, const Alignment& rhs);
	std::ostream& operator<<(std::ostream& os, const Alignment& a);
}

#endif
