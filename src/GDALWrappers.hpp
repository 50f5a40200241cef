#pragma once
#ifndef canoclass_gdalwrappers_h
#define canoclass_gdalwrappers_h

#include"canoclass_pch.hpp"

namespace canoclass {

	struct GDALDatasetDeleter {
		void operator()(GDALDataset* p) const;
	};
	using UniqueGdalDataset = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;
	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* p);

	struct CPLStringDeleter {
		void operator()(char* p) const;
	};
	using UniqueGdalString = std::unique_ptr<char, CPLStringDeleter>;
	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr);

	using UniqueOGRFeature = OGRFeatureUniquePtr;
	UniqueOGRFeature createFeatureWrapper(OGRLayer* layer);

	//GDALAllRegister isn't safe to call from several threads at once; this is
	//also where GDAL's own error printing is silenced, since failures are turned into exceptions
	void gdalAllRegisterThreadSafe();

	//these return a null pointer if GDAL can't open the file
	UniqueGdalDataset rasterGDALWrapper(const std::string& filename);
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename);
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, GDALDataType gdt, int nBands = 1);

	//like rasterGDALWrapper, but throws InputNotFoundException if the file doesn't exist
	//and UnsupportedFormatException if it exists but isn't a readable raster
	UniqueGdalDataset openRasterOrThrow(const std::string& filename);
	UniqueGdalDataset openVectorOrThrow(const std::string& filename);

	//throws UnsupportedFormatException if the dataset has no geotransform
	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& filename);

	//the most recent GDAL error message on this thread, or "unknown GDAL error"
	std::string lastGdalErrorMessage();
}

#endif
