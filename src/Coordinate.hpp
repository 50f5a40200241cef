#pragma once
#ifndef canoclass_coordinate_h
#define canoclass_coordinate_h

#include"CanoClassTypeDefs.hpp"

namespace canoclass {
	struct CoordXY {
		coord_t x, y;
		CoordXY() : x(0), y(0) {}
		CoordXY(coord_t x, coord_t y) : x(x), y(y) {}
		bool operator==(const CoordXY& other) const = default;
	};
}

#endif
