#pragma once
#ifndef canoclass_raster_h
#define canoclass_raster_h

#include"canoclass_pch.hpp"
#include"Alignment.hpp"
#include"GisExceptions.hpp"

namespace canoclass {

	template<class T>
	class MultiBandRaster;

	template<class T>
	using RastData = xtl::xoptional_vector<T>;

	//Writes the given bands to file as a new raster with alignment a.
	//The data goes to file + ".tmp" first and is renamed over file only once GDAL has flushed it,
	//so a failure never leaves a half-written output behind. Throws IOFailureException on failure.
	//Missing values are written as navalue, which becomes the band's nodata value; if navalue is empty,
	//floating point rasters use NaN and integer rasters write 0 with no nodata value.
	template<class T>
	void writeRasterBands(const std::string& file, const std::string& driver, const Alignment& a,
		const std::vector<const RastData<T>*>& bands, std::optional<T> navalue);

	template<class T>
	class Raster : public Alignment {
	public:

		friend class MultiBandRaster<T>;

		Raster() : Alignment(), _data() {}
		virtual ~Raster() noexcept = default;

		//creates a raster from the given alignment, and fills it with missing values
		explicit Raster(const Alignment& a) : Alignment(a) {
			_data.resize(ncell());
		}

		//Constructs a raster from a GDAL-readable file.
		//Cells equal to the band's nodata value, or NaN, are read as missing.
		Raster(const std::string& filename, const int band = 1);

		//disallow copy and move constructors from rasters with different templates. This will call the Raster(const Alignment& a) signature, which is very confusing
		//by deleting them, that just won't even compile--do an explicit cast to Alignment if you want that behavior
		template<class S>
		Raster(const Raster<S>& r) = delete;
		template<class S>
		Raster(Raster<S>&& r) = delete;
		template<class S>
		Raster<T>& operator=(const Raster<S>& r) = delete;
		template<class S>
		Raster<T>& operator=(Raster<S>&& r) = delete;

		Raster(const Raster<T>& r) = default;
		Raster(Raster<T>&& r) noexcept {
			*this = std::move(r);
		}
		Raster<T>& operator=(const Raster<T>& r) = default;
		Raster<T>& operator=(Raster<T>&& r) noexcept {
			_data = std::move(r._data);
			_crs = std::move(r._crs);
			_geotrans = r._geotrans; r._geotrans = { 0,1,0,0,0,-1 };
			_ncol = r._ncol; r._ncol = 0;
			_nrow = r._nrow; r._nrow = 0;
			return *this;
		}

		//Methods to access values. As usual, operator[] does no bounds checking. The others do check.
		auto atCell(const cell_t cell) {
			_checkCell(cell);
			return (*this)[cell];
		}
		auto atRC(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowCol(row, col)];
		}
		const auto atCell(const cell_t cell) const {
			_checkCell(cell);
			return (*this)[cell];
		}
		const auto atRC(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowCol(row, col)];
		}

		//Versions of atRC that don't bother with bounds checking, and thus have minimal overhead
		//only use if you're completely confident that you don't need bounds checking
		auto atRCUnsafe(const rowcol_t row, const rowcol_t col) {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto atRCUnsafe(const rowcol_t row, const rowcol_t col) const {
			return (*this)[cellFromRowColUnsafe(row, col)];
		}
		const auto operator[](const cell_t cell) const {
			return _data[cell];
		}
		auto operator[](const cell_t cell) {
			return _data[cell];
		}
		auto atCellUnsafe(const cell_t cell) {
			return _data[cell];
		}
		const auto atCellUnsafe(const cell_t cell) const {
			return _data[cell];
		}

		//Writes the Raster object to the harddrive. It's up to the user to make sure the driver and the file extension correspond.
		//See writeRasterBands for the handling of missing values and of failures.
		void writeRaster(const std::string& file, std::optional<T> navalue = std::nullopt, const std::string& driver = "GTiff") const;

		//returns true if has_value is true for any cell; false otherwise
		bool hasAnyValue() const;

		auto begin() { return _data.begin(); }
		auto end() { return _data.end(); }
		auto begin() const { return _data.begin(); }
		auto end() const { return _data.end(); }

		static GDALDataType GDT() {
			if (std::is_same<T, double>::value) {
				return GDT_Float64;
			}
			if (std::is_same<T, float>::value) {
				return GDT_Float32;
			}
			if (std::is_same<T, std::uint8_t>::value) {
				return GDT_Byte;
			}
			if (std::is_same<T, std::int16_t>::value) {
				return GDT_Int16;
			}
			if (std::is_same<T, std::int32_t>::value) {
				return GDT_Int32;
			}
			if (std::is_same<T, std::uint16_t>::value) {
				return GDT_UInt16;
			}
			if (std::is_same<T, std::uint32_t>::value) {
				return GDT_UInt32;
			}
			return GDT_Unknown;
		}

	private:
		RastData<T> _data;

		void _checkCell(cell_t cell) const {
			if (cell < 0 || cell >= ncell()) {
				throw std::out_of_range("Cell " + std::to_string(cell) + " is outside the raster");
			}
		}

		//reads one band of an already-open dataset into _data, whose alignment must already be set
		void _readBand(const UniqueGdalDataset& wgd, int band, const std::string& filename);
	};

	template<class T>
	inline bool operator==(const Raster<T>& lhs, const Raster<T>& rhs) {
		bool equal = true;
		equal = equal && ((Alignment)lhs == (Alignment)rhs);
		if (!equal) {
			return false;
		}
		for (cell_t cell = 0; cell < lhs.ncell(); ++cell) {
			equal = equal && (lhs[cell].has_value() == rhs[cell].has_value());
			if (lhs[cell].has_value() && rhs[cell].has_value()) {
				equal = equal && (lhs[cell].value() == rhs[cell].value());
			}
			if (!equal) {
				return false;
			}
		}
		return true;
	}
	template<class T>
	inline bool operator!=(const Raster<T>& lhs, const Raster<T>& rhs) {
		return !(lhs == rhs);
	}

	template<class T>
	inline std::ostream& operator<<(std::ostream& os, const Raster<T>& r) {
		os << "RASTER: " << typeid(T).name() << " ";
		os << (Alignment)r;
		return os;
	}

	template<class T>
	Raster<T>::Raster(const std::string& filename, const int band) {
		UniqueGdalDataset wgd = openRasterOrThrow(filename);
		alignmentInitFromGDALRaster(wgd, getGeoTrans(wgd, filename));
		checkValidAlignment();
		_readBand(wgd, band, filename);
	}

	template<class T>
	void Raster<T>::_readBand(const UniqueGdalDataset& wgd, int band, const std::string& filename) {
		if (band < 1 || band > wgd->GetRasterCount()) {
			throw UnsupportedFormatException(filename + " has " + std::to_string(wgd->GetRasterCount())
				+ " bands; band " + std::to_string(band) + " requested");
		}
		_data.resize(ncell());

		GDALRasterBand* rBand = wgd->GetRasterBand(band);
		int hasNoData = 0;
		double naValue = rBand->GetNoDataValue(&hasNoData);
		CPLErr err = rBand->RasterIO(GF_Read, 0, 0, _ncol, _nrow, _data.value().data(), _ncol, _nrow, GDT(), 0, 0);
		if (err != CE_None) {
			throw UnsupportedFormatException("Unable to read band " + std::to_string(band) + " of " + filename + ": " + lastGdalErrorMessage());
		}

		for (cell_t cell = 0; cell < ncell(); ++cell) {
			double asDouble = (double)_data.value()[cell];
			bool isNoData = hasNoData && asDouble == naValue;
			_data.has_value()[cell] = !isNoData && !std::isnan(asDouble);
		}
	}

	template<class T>
	void Raster<T>::writeRaster(const std::string& file, std::optional<T> navalue, const std::string& driver) const {
		writeRasterBands<T>(file, driver, (const Alignment&)*this, { &_data }, navalue);
	}

	template<class T>
	bool Raster<T>::hasAnyValue() const {
		for (cell_t cell = 0; cell < ncell(); ++cell) {
			if (atCellUnsafe(cell).has_value()) {
				return true;
			}
		}
		return false;
	}

	template<class T>
	void writeRasterBands(const std::string& file, const std::string& driver, const Alignment& a,
		const std::vector<const RastData<T>*>& bands, std::optional<T> navalue)
	{
		a.checkValidAlignment();
		if (!navalue && std::is_floating_point<T>::value) {
			navalue = std::numeric_limits<T>::quiet_NaN();
		}
		const std::string tempFile = file + ".tmp";
		auto fail = [&](const std::string& what) {
			std::error_code ec;
			std::filesystem::remove(tempFile, ec);
			throw IOFailureException("Unable to write " + file + ": " + what);
			};

		CPLErrorReset();
		{
			UniqueGdalDataset wgd = gdalCreateWrapper(driver, tempFile, a.ncol(), a.nrow(), Raster<T>::GDT(), (int)bands.size());
			if (!wgd) {
				fail(lastGdalErrorMessage());
			}
			std::array<double, 6> gt = a.geoTransform();
			if (wgd->SetGeoTransform(gt.data()) != CE_None) {
				fail(lastGdalErrorMessage());
			}
			if (!a.crs().isEmpty() && wgd->SetProjection(a.crs().getCompleteWKT().c_str()) != CE_None) {
				fail(lastGdalErrorMessage());
			}

			std::vector<T> buffer;
			for (size_t i = 0; i < bands.size(); ++i) {
				const RastData<T>& data = *bands[i];
				buffer.assign(data.value().begin(), data.value().end());
				T fill = navalue ? *navalue : T(0);
				for (cell_t cell = 0; cell < a.ncell(); ++cell) {
					if (!data.has_value()[cell]) {
						buffer[cell] = fill;
					}
				}
				GDALRasterBand* band = wgd->GetRasterBand((int)i + 1);
				if (navalue) {
					band->SetNoDataValue((double)*navalue);
				}
				if (band->RasterIO(GF_Write, 0, 0, a.ncol(), a.nrow(), buffer.data(), a.ncol(), a.nrow(), Raster<T>::GDT(), 0, 0) != CE_None) {
					fail(lastGdalErrorMessage());
				}
			}
			wgd->FlushCache();
		}
		//closing the dataset is when GDAL finishes the file; any failure there shows up as the last error
		if (CPLGetLastErrorType() == CE_Failure || CPLGetLastErrorType() == CE_Fatal) {
			fail(lastGdalErrorMessage());
		}

		std::error_code ec;
		std::filesystem::rename(tempFile, file, ec);
		if (ec) {
			fail(ec.message());
		}
	}
}

#endif
