#pragma once
#ifndef canoclass_smoother_h
#define canoclass_smoother_h

#include"canoclass_pch.hpp"
#include"Raster.hpp"

namespace canoclass {

	enum class SmoothFilter {
		Median,
		Majority
	};

	//case-insensitive; throws std::invalid_argument for anything but median or majority
	SmoothFilter parseSmoothFilter(const std::string& name);
	std::string smoothFilterName(SmoothFilter filter);

	//the index a focal window reads for position i of an axis of length n: the axis is mirrored at its edges
	//with the edge cell repeated (d c b a | a b c d | d c b a), as many times as needed
	rowcol_t reflectIndex(rowcol_t i, rowcol_t n);

	//Replaces each cell with the median or the most common class in the windowSize x windowSize square around it.
	//The output has the same alignment as the input. Cells without a value don't take part in any window.
	//For the majority filter, ties keep the center value if it is among the most common, and otherwise take the smallest class.
	//Throws std::invalid_argument if windowSize isn't odd and positive.
	Raster<class_t> smoothClasses(const Raster<class_t>& r, int windowSize = 5, SmoothFilter filter = SmoothFilter::Median);
}

#endif
