#pragma once
#ifndef canoclass_rasterizer_h
#define canoclass_rasterizer_h

#include"canoclass_pch.hpp"
#include"Raster.hpp"
#include"Vector.hpp"

namespace canoclass {

	//the attribute field training vectors carry their class in by default
	inline const std::string DEFAULT_LABEL_FIELD = "id";

	//Burns the polygons of vect onto the grid of a as a label raster.
	//A cell is covered by a polygon when its center is inside it; where polygons overlap, the last one in the layer wins.
	//Uncovered cells are 0. If field is empty, covered cells are 1; otherwise they take the integer part of the field's value.
	//Throws AlignmentMismatchException if a isn't a valid grid or its crs differs from the layer's,
	//and UnsupportedFormatException if the field is missing, isn't numeric, or has a value outside 0-255.
	Raster<class_t> rasterizeLabels(const VectorDataset<MultiPolygon>& vect, const Alignment& a, const std::string& field);

	//reads the vector layer and the grid of referenceRaster, and writes the result of rasterizeLabels to outputRaster as a byte GeoTIFF
	void prepareTrainingData(const std::string& vectorFile, const std::string& referenceRaster, const std::string& outputRaster,
		const std::string& field = DEFAULT_LABEL_FIELD);
}

#endif
