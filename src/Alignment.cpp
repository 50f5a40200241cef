#include"Alignment.hpp"
#include"GisExceptions.hpp"

namespace canoclass {

	Alignment::Alignment(const std::array<double, 6>& geotrans, rowcol_t ncol, rowcol_t nrow, const CoordRef& crs)
		: _geotrans(geotrans), _ncol(ncol), _nrow(nrow), _crs(crs)
	{
	}
	Alignment::Alignment(coord_t xmin, coord_t ymax, rowcol_t ncol, rowcol_t nrow, coord_t xres, coord_t yres, const CoordRef& crs)
		: _geotrans{ xmin, std::abs(xres), 0, ymax, 0, -std::abs(yres) }, _ncol(ncol), _nrow(nrow), _crs(crs)
	{
	}
	Alignment::Alignment(const std::string& filename)
	{
		UniqueGdalDataset wgd = openRasterOrThrow(filename);
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
	}

	Extent Alignment::extent() const
	{
		const std::array<CoordXY, 4> corners = {
			CoordXY(_geotrans[0], _geotrans[3]),
			CoordXY(_geotrans[0] + _ncol * _geotrans[1], _geotrans[3] + _ncol * _geotrans[4]),
			CoordXY(_geotrans[0] + _nrow * _geotrans[2], _geotrans[3] + _nrow * _geotrans[5]),
			CoordXY(_geotrans[0] + _ncol * _geotrans[1] + _nrow * _geotrans[2], _geotrans[3] + _ncol * _geotrans[4] + _nrow * _geotrans[5])
		};
		coord_t xmin = corners[0].x, xmax = corners[0].x, ymin = corners[0].y, ymax = corners[0].y;
		for (const CoordXY& c : corners) {
			xmin = std::min(xmin, c.x);
			xmax = std::max(xmax, c.x);
			ymin = std::min(ymin, c.y);
			ymax = std::max(ymax, c.y);
		}
		return Extent(xmin, xmax, ymin, ymax, _crs);
	}

	cell_t Alignment::cellFromRowCol(rowcol_t row, rowcol_t col) const
	{
		if (row < 0 || col < 0 || row >= _nrow || col >= _ncol) {
			throw std::out_of_range("Row " + std::to_string(row) + ", col " + std::to_string(col) + " is outside the grid");
		}
		return cellFromRowColUnsafe(row, col);
	}

	CoordXY Alignment::xyFromRowColUnsafe(rowcol_t row, rowcol_t col) const
	{
		coord_t c = col + 0.5;
		coord_t r = row + 0.5;
		return CoordXY(_geotrans[0] + c * _geotrans[1] + r * _geotrans[2],
			_geotrans[3] + c * _geotrans[4] + r * _geotrans[5]);
	}

	CoordXY Alignment::colRowFromXY(coord_t x, coord_t y) const
	{
		std::array<double, 6> inv{};
		if (!GDALInvGeoTransform(const_cast<double*>(_geotrans.data()), inv.data())) {
			throw AlignmentMismatchException("Geotransform cannot be inverted");
		}
		return CoordXY(inv[0] + x * inv[1] + y * inv[2], inv[3] + x * inv[4] + y * inv[5]);
	}

	bool Alignment::isSameAlignment(const Alignment& other) const
	{
		if (_ncol != other._ncol || _nrow != other._nrow) {
			return false;
		}
		//pixel sizes give the scale for the origin and rotation terms
		coord_t scale = std::max({ std::abs(_geotrans[1]), std::abs(_geotrans[5]), 1e-300 });
		for (size_t i = 0; i < 6; ++i) {
			coord_t a = _geotrans[i];
			coord_t b = other._geotrans[i];
			coord_t tolerance = 1e-9 * std::max({ std::abs(a), std::abs(b), scale });
			if (std::abs(a - b) > tolerance) {
				return false;
			}
		}
		return _crs.isConsistent(other._crs);
	}

	bool Alignment::hasValidGrid() const
	{
		if (_ncol <= 0 || _nrow <= 0) {
			return false;
		}
		//a zero determinant means every cell collapses onto a line
		coord_t det = _geotrans[1] * _geotrans[5] - _geotrans[2] * _geotrans[4];
		return std::isfinite(det) && det != 0;
	}
	void Alignment::checkValidAlignment() const
	{
		if (!hasValidGrid()) {
			throw AlignmentMismatchException("Invalid raster grid: " + std::to_string(_ncol) + " columns, "
				+ std::to_string(_nrow) + " rows, pixel size " + std::to_string(xres()) + " x " + std::to_string(yres()));
		}
	}

	void Alignment::alignmentInitFromGDALRaster(const UniqueGdalDataset& wgd, const std::array<double, 6>& geotrans)
	{
		_geotrans = geotrans;
		_ncol = wgd->GetRasterXSize();
		_nrow = wgd->GetRasterYSize();
		const OGRSpatialReference* osr = wgd->GetSpatialRef();
		_crs = CoordRef(osr);
	}

	void checkSameAlignment(const Alignment& a, const Alignment& b, const std::string& context)
	{
		if (!a.isSameAlignment(b)) {
			std::stringstream ss;
			ss << "Alignment mismatch in " << context << ": " << a << " vs " << b;
			throw AlignmentMismatchException(ss.str());
		}
	}

	bool operator==(const Alignment& lhs, const Alignment& rhs)
	{
		return lhs.isSameAlignment(rhs);
	}
	bool operator!=(const Alignment& lhs, const Alignment& rhs)
	{
		return !(lhs == rhs);
	}
	std::ostream& operator<<(std::ostream& os, const Alignment& a)
	{
		const std::array<double, 6>& gt = a.geoTransform();
		os << a.ncol() << "x" << a.nrow() << " [" << gt[0] << ", " << gt[1] << ", " << gt[2] << ", "
			<< gt[3] << ", " << gt[4] << ", " << gt[5] << "] crs: " << a.crs();
		return os;
	}
}
