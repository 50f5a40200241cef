#pragma once
#ifndef canoclass_multibandraster_h
#define canoclass_multibandraster_h

#include"Raster.hpp"

namespace canoclass {

	template<typename T>
	class MultiBandRaster : public Alignment {
	public:
		//reads every band of the file; throws InputNotFoundException or UnsupportedFormatException like Raster does
		MultiBandRaster(const std::string& filename);
		MultiBandRaster(const Alignment& a, band_t nBands);

		band_t nBands() const;

		Raster<T>& bandAt(band_t band);
		Raster<T>& bandAtUnsafe(band_t band);

		const Raster<T>& bandAt(band_t band) const;
		const Raster<T>& bandAtUnsafe(band_t band) const;

		auto atCell(cell_t cell, band_t band);
		auto atCellUnsafe(cell_t cell, band_t band);
		auto atRC(rowcol_t row, rowcol_t col, band_t band);
		auto atRCUnsafe(rowcol_t row, rowcol_t col, band_t band);

		const auto atCell(cell_t cell, band_t band) const;
		const auto atCellUnsafe(cell_t cell, band_t band) const;
		const auto atRC(rowcol_t row, rowcol_t col, band_t band) const;
		const auto atRCUnsafe(rowcol_t row, rowcol_t col, band_t band) const;

		void writeRaster(const std::string& fileName, std::optional<T> navalue = std::nullopt, const std::string& driver = "GTiff") const;
	private:
		std::vector<Raster<T>> _bands;

		void _checkBand(band_t band) const;
	};
	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const std::string& filename) {
		UniqueGdalDataset wgd = openRasterOrThrow(filename);
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();

		band_t nBand = wgd->GetRasterCount();
		_bands.reserve(nBand);
		for (band_t i = 1; i <= nBand; ++i) {
			Raster<T> r{ (const Alignment&)*this };
			r._readBand(wgd, i, filename);
			_bands.push_back(std::move(r));
		}
	}
	template<typename T>
	inline MultiBandRaster<T>::MultiBandRaster(const Alignment& a, band_t nBands)
		: Alignment(a)
	{
		for (band_t band = 0; band < nBands; ++band) {
			_bands.emplace_back(a);
		}
	}
	template<typename T>
	inline band_t MultiBandRaster<T>::nBands() const {
		return (band_t)_bands.size();
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAt(band_t band) {
		_checkBand(band);
		return bandAtUnsafe(band);
	}
	template<typename T>
	inline Raster<T>& MultiBandRaster<T>::bandAtUnsafe(band_t band) {
		return _bands[band - 1];
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAt(band_t band) const {
		_checkBand(band);
		return bandAtUnsafe(band);
	}
	template<typename T>
	inline const Raster<T>& MultiBandRaster<T>::bandAtUnsafe(band_t band) const {
		return _bands[band - 1];
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atCell(cell_t cell, band_t band) {
		return bandAt(band).atCell(cell);
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atCellUnsafe(cell_t cell, band_t band) {
		return bandAtUnsafe(band).atCellUnsafe(cell);
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atRC(rowcol_t row, rowcol_t col, band_t band) {
		return bandAt(band).atRC(row, col);
	}
	template<typename T>
	inline auto MultiBandRaster<T>::atRCUnsafe(rowcol_t row, rowcol_t col, band_t band) {
		return bandAtUnsafe(band).atRCUnsafe(row, col);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atCell(cell_t cell, band_t band) const {
		return bandAt(band).atCell(cell);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atCellUnsafe(cell_t cell, band_t band) const {
		return bandAtUnsafe(band).atCellUnsafe(cell);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atRC(rowcol_t row, rowcol_t col, band_t band) const {
		return bandAt(band).atRC(row, col);
	}
	template<typename T>
	inline const auto MultiBandRaster<T>::atRCUnsafe(rowcol_t row, rowcol_t col, band_t band) const {
		return bandAtUnsafe(band).atRCUnsafe(row, col);
	}
	template<typename T>
	inline void MultiBandRaster<T>::writeRaster(const std::string& fileName, std::optional<T> navalue, const std::string& driver) const
	{
		std::vector<const RastData<T>*> data;
		for (const Raster<T>& band : _bands) {
			data.push_back(&band._data);
		}
		writeRasterBands<T>(fileName, driver, (const Alignment&)*this, data, navalue);
	}
	template<typename T>
	inline void MultiBandRaster<T>::_checkBand(band_t band) const {
		if (band < 1 || band > nBands()) {
			throw std::out_of_range("Band out of range");
		}
	}

}

#endif
