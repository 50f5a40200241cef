#pragma once
#ifndef canoclass_coordref_h
#define canoclass_coordref_h

#include"canoclass_pch.hpp"
#include"projwrappers.hpp"

namespace canoclass {

	//The projection identity of a raster or vector layer.
	//An empty CoordRef means the source declared no CRS at all.
	class CoordRef {
	public:
		CoordRef() = default;

		//accepts anything proj_create does: WKT, "EPSG:5070", PROJ strings
		//throws UnsupportedFormatException if the string is non-empty but can't be interpreted
		CoordRef(const std::string& s);
		CoordRef(const char* s);

		//a null pointer produces an empty CoordRef
		CoordRef(const OGRSpatialReference* osr);

		bool isEmpty() const;

		//two empty CoordRefs are consistent; an empty and a non-empty one are not
		bool isConsistent(const CoordRef& other) const;

		//the WKT suitable for GDALDataset::SetProjection; empty if isEmpty()
		const std::string& getCompleteWKT() const;
		std::string getShortName() const;

		//for attaching to OGR layers and geometries; an empty CoordRef gives an empty reference
		OGRSpatialReference gdalSpatialRef() const;
	private:
		std::string _wkt;
		SharedPJ _pj;

		void _initFromString(const std::string& s);
	};

	std::ostream& operator<<(std::ostream& os, const CoordRef& crs);
}

#endif
