#include"GDALWrappers.hpp"
#include"GisExceptions.hpp"

namespace canoclass {

	void GDALDatasetDeleter::operator()(GDALDataset* p) const
	{
		if (p) {
			GDALClose(GDALDataset::ToHandle(p));
		}
	}
	UniqueGdalDataset makeUniqueGdalDataset(GDALDataset* p)
	{
		return UniqueGdalDataset(p);
	}

	void CPLStringDeleter::operator()(char* p) const
	{
		CPLFree(p);
	}
	UniqueGdalString exportToWktWrapper(const OGRSpatialReference& osr)
	{
		char* wkt = nullptr;
		if (osr.exportToWkt(&wkt) != OGRERR_NONE) {
			CPLFree(wkt);
			return UniqueGdalString();
		}
		return UniqueGdalString(wkt);
	}

	UniqueOGRFeature createFeatureWrapper(OGRLayer* layer)
	{
		return UniqueOGRFeature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
	}

	void gdalAllRegisterThreadSafe()
	{
		static std::once_flag flag;
		std::call_once(flag, []() {
			GDALAllRegister();
			CPLSetErrorHandler(CPLQuietErrorHandler);
			});
	}

	UniqueGdalDataset rasterGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALDataset::FromHandle(
			GDALOpenEx(filename.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
	}
	UniqueGdalDataset vectorGDALWrapper(const std::string& filename)
	{
		gdalAllRegisterThreadSafe();
		return makeUniqueGdalDataset(GDALDataset::FromHandle(
			GDALOpenEx(filename.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
	}
	UniqueGdalDataset gdalCreateWrapper(const std::string& driver, const std::string& file, int ncol, int nrow, GDALDataType gdt, int nBands)
	{
		gdalAllRegisterThreadSafe();
		GDALDriver* d = GetGDALDriverManager()->GetDriverByName(driver.c_str());
		if (!d) {
			return UniqueGdalDataset();
		}
		return makeUniqueGdalDataset(d->Create(file.c_str(), ncol, nrow, nBands, gdt, nullptr));
	}

	UniqueGdalDataset openRasterOrThrow(const std::string& filename)
	{
		if (!std::filesystem::exists(filename)) {
			throw InputNotFoundException("Raster not found: " + filename);
		}
		UniqueGdalDataset wgd = rasterGDALWrapper(filename);
		if (!wgd) {
			throw UnsupportedFormatException("Unable to open " + filename + " as a raster");
		}
		return wgd;
	}
	UniqueGdalDataset openVectorOrThrow(const std::string& filename)
	{
		if (!std::filesystem::exists(filename)) {
			throw InputNotFoundException("Vector file not found: " + filename);
		}
		UniqueGdalDataset wgd = vectorGDALWrapper(filename);
		if (!wgd || wgd->GetLayerCount() < 1) {
			throw UnsupportedFormatException("Unable to open " + filename + " as a vector layer");
		}
		return wgd;
	}

	std::array<double, 6> getGeoTrans(const UniqueGdalDataset& wgd, const std::string& filename)
	{
		std::array<double, 6> gt{};
		if (wgd->GetGeoTransform(gt.data()) != CE_None) {
			throw UnsupportedFormatException(filename + " has no georeferencing");
		}
		return gt;
	}

	std::string lastGdalErrorMessage()
	{
		const char* msg = CPLGetLastErrorMsg();
		if (!msg || !*msg) {
			return "unknown GDAL error";
		}
		return msg;
	}
}
