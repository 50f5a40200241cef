#pragma once
#ifndef canoclass_typedefs_h
#define canoclass_typedefs_h

#include<cstdint>

namespace canoclass {

	using coord_t = double;
	using cell_t = int64_t;
	using rowcol_t = int32_t;
	using band_t = int32_t;

	//the value type of vegetation index rasters and of the classifier's feature
	using index_t = float;
	//training labels and predicted classes; 0 is reserved for unlabeled background
	using class_t = uint8_t;
}

#endif
