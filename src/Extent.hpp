#pragma once
#ifndef canoclass_extent_h
#define canoclass_extent_h

#include"canoclass_pch.hpp"
#include"CoordRef.hpp"

namespace canoclass {

	//an axis-aligned bounding box in the coordinates of its crs
	class Extent {
	public:
		Extent() = default;
		Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax)
			: _xmin(xmin), _xmax(xmax), _ymin(ymin), _ymax(ymax) {}
		Extent(coord_t xmin, coord_t xmax, coord_t ymin, coord_t ymax, const CoordRef& crs)
			: _xmin(xmin), _xmax(xmax), _ymin(ymin), _ymax(ymax), _crs(crs) {}

		coord_t xmin() const { return _xmin; }
		coord_t xmax() const { return _xmax; }
		coord_t ymin() const { return _ymin; }
		coord_t ymax() const { return _ymax; }
		const CoordRef& crs() const { return _crs; }


	protected:
		coord_t _xmin = 0, _xmax = 0, _ymin = 0, _ymax = 0;
		CoordRef _crs;
	};

	//the smallest extent containing both; the crs is taken from the first
	inline Extent extendExtent(const Extent& a, const Extent& b) {
		return Extent(std::min(a.xmin(), b.xmin()), std::max(a.xmax(), b.xmax()),
			std::min(a.ymin(), b.ymin()), std::max(a.ymax(), b.ymax()), a.crs());
	}

	inline std::ostream& operator<<(std::ostream& os, const Extent& e) {
		os << "xmin: " << e.xmin() << " xmax: " << e.xmax() << " ymin: " << e.ymin() << " ymax: " << e.ymax() << " crs: " << e.crs();
		return os;
	}
}

#endif
