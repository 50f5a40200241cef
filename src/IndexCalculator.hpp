#pragma once
#ifndef canoclass_indexcalculator_h
#define canoclass_indexcalculator_h

#include"canoclass_pch.hpp"
#include"MultiBandRaster.hpp"

namespace canoclass {

	//band order of the imagery tiles
	constexpr band_t RED_BAND = 1;
	constexpr band_t GREEN_BAND = 2;
	constexpr band_t BLUE_BAND = 3;
	constexpr band_t NIR_BAND = 4;

	enum class VegetationIndex {
		ARVI,
		VARI,
		VDVI
	};

	struct BandValues {
		index_t red, green, blue, nir;
	};

	struct IndexFormula {
		VegetationIndex index;
		std::string name;
		//prepended to the input file name to name the output
		std::string prefix;
		//if true, each band is rescaled to [1,2] over the tile before the formula is applied
		//the range is per tile, so values are not comparable between tiles with different band ranges
		bool normalizeBands;
		index_t(*compute)(const BandValues&);
	};

	const IndexFormula& indexFormula(VegetationIndex index);

	//case-insensitive; throws std::invalid_argument for an unknown name
	VegetationIndex parseVegetationIndex(const std::string& name);

	//Computes the index for every cell of a tile whose bands are in the order red, green, blue, near infrared.
	//Division by zero gives NaN or infinity rather than an error. A cell missing in any band is missing in the output.
	//Throws UnsupportedFormatException if the tile has fewer than 4 bands.
	Raster<index_t> calculateIndex(const MultiBandRaster<index_t>& tile, VegetationIndex index);
	//throws AlignmentMismatchException if the four bands don't share an alignment
	Raster<index_t> calculateIndex(const Raster<index_t>& red, const Raster<index_t>& green, const Raster<index_t>& blue,
		const Raster<index_t>& nir, VegetationIndex index);

	enum class IndexFileResult {
		written,
		skipped
	};

	//Reads the tile at input and writes the index to output as a float32 GeoTIFF with NaN as nodata.
	//If output already exists and force is false, nothing is read or written and the result is skipped.
	IndexFileResult calculateIndexFile(const std::string& input, const std::string& output, VegetationIndex index, bool force = false);
}

#endif
