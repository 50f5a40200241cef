#include"Rasterizer.hpp"
#include"Logger.hpp"

namespace canoclass {

	namespace {
		class_t burnValue(const VectorDataset<MultiPolygon>& vect, size_t index, const std::string& field) {
			if (field.empty()) {
				return 1;
			}
			double v = vect.getNumericField<double>(index, field);
			v = std::trunc(v);
			if (!(v >= 0 && v <= std::numeric_limits<class_t>::max())) {
				throw UnsupportedFormatException("Feature " + std::to_string(index) + " has " + field + " = "
					+ std::to_string(v) + ", which is not a valid class between 0 and 255");
			}
			return (class_t)v;
		}
	}

	Raster<class_t> rasterizeLabels(const VectorDataset<MultiPolygon>& vect, const Alignment& a, const std::string& field)
	{
		a.checkValidAlignment();
		if (!a.crs().isEmpty() && !vect.crs().isEmpty() && !a.crs().isConsistent(vect.crs())) {
			throw AlignmentMismatchException("Training polygons are in " + vect.crs().getShortName()
				+ " but the reference raster is in " + a.crs().getShortName());
		}
		if (!field.empty() && !vect.fieldExists(field)) {
			throw UnsupportedFormatException("Training polygons have no field named " + field);
		}
		if (!field.empty() && vect.getFieldType(field) == FieldType::String) {
			throw WrongFieldTypeException("Field " + field + " is not numeric");
		}

		Raster<class_t> out{ a };
		for (cell_t cell = 0; cell < out.ncell(); ++cell) {
			out[cell].has_value() = true;
			out[cell].value() = 0;
		}

		for (size_t i = 0; i < vect.nFeature(); ++i) {
			const MultiPolygon& geom = vect.getGeometry(i);
			class_t value = burnValue(vect, i, field);

			//only the cells whose centers can fall in the bounding box need the point-in-polygon test
			Extent bbox = geom.boundingBox();
			std::array<CoordXY, 4> corners = {
				a.colRowFromXY(bbox.xmin(), bbox.ymin()), a.colRowFromXY(bbox.xmin(), bbox.ymax()),
				a.colRowFromXY(bbox.xmax(), bbox.ymin()), a.colRowFromXY(bbox.xmax(), bbox.ymax())
			};
			coord_t minCol = corners[0].x, maxCol = corners[0].x, minRow = corners[0].y, maxRow = corners[0].y;
			for (const CoordXY& c : corners) {
				minCol = std::min(minCol, c.x);
				maxCol = std::max(maxCol, c.x);
				minRow = std::min(minRow, c.y);
				maxRow = std::max(maxRow, c.y);
			}
			auto clampIndex = [](coord_t v, rowcol_t n) {
				return (rowcol_t)std::clamp<coord_t>(v, -1, n);
				};
			rowcol_t firstCol = clampIndex(std::floor(minCol - 0.5), a.ncol());
			rowcol_t lastCol = clampIndex(std::ceil(maxCol - 0.5), a.ncol() - 1);
			rowcol_t firstRow = clampIndex(std::floor(minRow - 0.5), a.nrow());
			rowcol_t lastRow = clampIndex(std::ceil(maxRow - 0.5), a.nrow() - 1);
			firstCol = std::max(firstCol, 0);
			firstRow = std::max(firstRow, 0);

			for (rowcol_t row = firstRow; row <= lastRow; ++row) {
				for (rowcol_t col = firstCol; col <= lastCol; ++col) {
					CoordXY center = a.xyFromRowColUnsafe(row, col);
					if (geom.containsPoint(center)) {
						out.atRCUnsafe(row, col).value() = value;
					}
				}
			}
		}
		return out;
	}

	void prepareTrainingData(const std::string& vectorFile, const std::string& referenceRaster, const std::string& outputRaster,
		const std::string& field)
	{
		Alignment a{ referenceRaster };
		VectorDataset<MultiPolygon> vect{ vectorFile };
		Logger::debug("Rasterizing " + std::to_string(vect.nFeature()) + " polygons from " + vectorFile);
		Raster<class_t> labels = rasterizeLabels(vect, a, field);
		labels.writeRaster(outputRaster);
	}
}
