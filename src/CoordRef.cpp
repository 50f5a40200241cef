#include"CoordRef.hpp"
#include"GDALWrappers.hpp"
#include"GisExceptions.hpp"

namespace canoclass {

	CoordRef::CoordRef(const std::string& s)
	{
		_initFromString(s);
	}
	CoordRef::CoordRef(const char* s)
	{
		_initFromString(s ? std::string(s) : std::string());
	}
	CoordRef::CoordRef(const OGRSpatialReference* osr)
	{
		if (!osr) {
			return;
		}
		UniqueGdalString wkt = exportToWktWrapper(*osr);
		if (!wkt) {
			throw UnsupportedFormatException("Unable to export spatial reference as WKT");
		}
		_initFromString(wkt.get());
	}
	bool CoordRef::isEmpty() const
	{
		return !_pj;
	}
	bool CoordRef::isConsistent(const CoordRef& other) const
	{
		if (isEmpty() || other.isEmpty()) {
			return isEmpty() && other.isEmpty();
		}
		if (_wkt == other._wkt) {
			return true;
		}
		return projIsEquivalentWrapper(_pj, other._pj);
	}
	const std::string& CoordRef::getCompleteWKT() const
	{
		return _wkt;
	}
	std::string CoordRef::getShortName() const
	{
		if (isEmpty()) {
			return "(none)";
		}
		return projNameWrapper(_pj);
	}
	OGRSpatialReference CoordRef::gdalSpatialRef() const
	{
		OGRSpatialReference osr;
		if (isEmpty()) {
			return osr;
		}
		osr.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
		if (osr.importFromWkt(_wkt.c_str()) != OGRERR_NONE) {
			throw UnsupportedFormatException("Unable to convert " + getShortName() + " to an OGR spatial reference");
		}
		return osr;
	}
	void CoordRef::_initFromString(const std::string& s)
	{
		if (s.empty()) {
			return;
		}
		_pj = projCreateWrapper(s);
		if (!_pj) {
			throw UnsupportedFormatException("Unable to interpret '" + s + "' as a coordinate reference system");
		}
		//GDAL already gave us WKT; keep it verbatim so rewriting a raster doesn't perturb its projection
		if (s.find('[') != std::string::npos) {
			_wkt = s;
		}
		else {
			_wkt = projAsWktWrapper(_pj);
		}
	}

	std::ostream& operator<<(std::ostream& os, const CoordRef& crs)
	{
		os << crs.getShortName();
		return os;
	}
}
