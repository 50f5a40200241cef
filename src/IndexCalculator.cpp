#include"IndexCalculator.hpp"
#include"Logger.hpp"

namespace canoclass {

	namespace {
		index_t arvi(const BandValues& b) {
			return (b.nir - 2 * b.red + b.blue) / (b.nir + 2 * b.red + b.blue);
		}
		index_t vari(const BandValues& b) {
			return (b.green - b.red) / (b.green + b.red - b.blue);
		}
		index_t vdvi(const BandValues& b) {
			return (2 * b.green - (b.red + b.blue)) / (2 * b.green + (b.red + b.blue));
		}

		const std::array<IndexFormula, 3> FORMULAS = { {
			{ VegetationIndex::ARVI, "ARVI", "arvi_", false, &arvi },
			{ VegetationIndex::VARI, "VARI", "vari_", true, &vari },
			{ VegetationIndex::VDVI, "VDVI", "vdvi_", false, &vdvi }
		} };

		//rescales the band to [1,2] using the range of the cells with values; a constant band becomes NaN
		Raster<index_t> normalizeBand(const Raster<index_t>& band) {
			index_t minv = std::numeric_limits<index_t>::max();
			index_t maxv = std::numeric_limits<index_t>::lowest();
			for (cell_t cell = 0; cell < band.ncell(); ++cell) {
				auto v = band.atCellUnsafe(cell);
				if (v.has_value()) {
					minv = std::min(minv, (index_t)v.value());
					maxv = std::max(maxv, (index_t)v.value());
				}
			}
			Raster<index_t> out = band;
			for (cell_t cell = 0; cell < out.ncell(); ++cell) {
				auto v = out.atCellUnsafe(cell);
				if (v.has_value()) {
					v.value() = 1 + (v.value() - minv) / (maxv - minv);
				}
			}
			return out;
		}
	}

	const IndexFormula& indexFormula(VegetationIndex index)
	{
		for (const IndexFormula& f : FORMULAS) {
			if (f.index == index) {
				return f;
			}
		}
		throw std::invalid_argument("Unknown vegetation index");
	}

	VegetationIndex parseVegetationIndex(const std::string& name)
	{
		std::string upper = name;
		std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return (char)std::toupper(c); });
		for (const IndexFormula& f : FORMULAS) {
			if (f.name == upper) {
				return f.index;
			}
		}
		throw std::invalid_argument("Unknown vegetation index: " + name + " (expected arvi, vari or vdvi)");
	}

	Raster<index_t> calculateIndex(const MultiBandRaster<index_t>& tile, VegetationIndex index)
	{
		if (tile.nBands() < NIR_BAND) {
			throw UnsupportedFormatException("Imagery tiles need red, green, blue and near infrared bands; this one has "
				+ std::to_string(tile.nBands()));
		}
		return calculateIndex(tile.bandAt(RED_BAND), tile.bandAt(GREEN_BAND), tile.bandAt(BLUE_BAND), tile.bandAt(NIR_BAND), index);
	}

	Raster<index_t> calculateIndex(const Raster<index_t>& red, const Raster<index_t>& green, const Raster<index_t>& blue,
		const Raster<index_t>& nir, VegetationIndex index)
	{
		checkSameAlignment(red, green, "index calculation");
		checkSameAlignment(red, blue, "index calculation");
		checkSameAlignment(red, nir, "index calculation");

		const IndexFormula& formula = indexFormula(index);

		//only the visible bands are normalized; no normalized formula reads nir
		std::optional<Raster<index_t>> nred, ngreen, nblue;
		if (formula.normalizeBands) {
			nred = normalizeBand(red);
			ngreen = normalizeBand(green);
			nblue = normalizeBand(blue);
		}
		const Raster<index_t>& r = nred ? *nred : red;
		const Raster<index_t>& g = ngreen ? *ngreen : green;
		const Raster<index_t>& b = nblue ? *nblue : blue;
		const Raster<index_t>& n = nir;

		Raster<index_t> out{ (const Alignment&)red };
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			auto rv = r.atCellUnsafe(cell);
			auto gv = g.atCellUnsafe(cell);
			auto bv = b.atCellUnsafe(cell);
			auto nv = n.atCellUnsafe(cell);
			if (!rv.has_value() || !gv.has_value() || !bv.has_value() || !nv.has_value()) {
				continue;
			}
			BandValues values{ rv.value(), gv.value(), bv.value(), nv.value() };
			index_t result = formula.compute(values);
			out[cell].value() = result;
			//NaN is the nodata value of index files, so it reads back as missing either way
			out[cell].has_value() = !std::isnan(result);
		}
		return out;
	}

	IndexFileResult calculateIndexFile(const std::string& input, const std::string& output, VegetationIndex index, bool force)
	{
		if (!force && std::filesystem::exists(output)) {
			Logger::debug(output + " already exists");
			return IndexFileResult::skipped;
		}
		MultiBandRaster<index_t> tile{ input };
		Raster<index_t> result = calculateIndex(tile, index);
		result.writeRaster(output);
		return IndexFileResult::written;
	}
}
