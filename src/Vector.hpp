#pragma once
#ifndef canoclass_vector_h
#define canoclass_vector_h

#include"canoclass_pch.hpp"
#include"CoordRef.hpp"
#include"Geometry.hpp"
#include"GDALWrappers.hpp"
#include"GisExceptions.hpp"

namespace canoclass {

	enum class FieldType {
		Integer,
		Real,
		String
	};

	class AttributeTable {
	public:
		AttributeTable() = default;
		virtual ~AttributeTable() = default;

		void addStringField(const std::string& name, size_t width);
		void addIntegerField(const std::string& name);
		void addRealField(const std::string& name);
		template<class T>
		void addNumericField(const std::string& name);

		void resize(size_t nrow);
		void addRow();

		size_t nFeature() const;

		bool fieldExists(const std::string& name) const;
		const std::vector<std::string>& getAllFieldNames() const;
		//throws UnsupportedFormatException if the field doesn't exist
		FieldType getFieldType(const std::string& name) const;
		size_t getStringFieldWidth(const std::string& name) const;

		//the getters and setters throw WrongFieldTypeException if the field is of a different type
		const std::string& getStringField(size_t index, const std::string& name) const;
		int64_t getIntegerField(size_t index, const std::string& name) const;
		double getRealField(size_t index, const std::string& name) const;
		template<class T>
		T getNumericField(size_t index, const std::string& name) const;

		void setStringField(size_t index, const std::string& name, const std::string& value);
		void setIntegerField(size_t index, const std::string& name, int64_t value);
		void setRealField(size_t index, const std::string& name, double value);
		template<class T>
		void setNumericField(size_t index, const std::string& name, T value);
	private:

		class FixedWidthString {
		public:
			const std::string& get() const;
			void set(const std::string& value, size_t width);
		private:
			std::string _data;
		};

		using Variant = std::variant<int64_t, double, FixedWidthString>;
		struct Field {
			FieldType type;
			size_t width; //only used if the type is String
			std::vector<Variant> values;
		};

		size_t _nrow = 0;
		std::unordered_map<std::string, Field> _fields;
		std::vector<std::string> _fieldNamesInOrder;

		const Field& _getField(const std::string& name) const;
		Field& _getField(const std::string& name);
	};

	//A layer of features of a single geometry type, read fully into memory, with their attributes.
	//Features keep the order they had in the source layer.
	template<class GEOMETRY>
	class VectorDataset : public AttributeTable {
	public:
		VectorDataset() = default;
		explicit VectorDataset(const CoordRef& crs);

		//reads the first layer of the file
		//throws InputNotFoundException if the file doesn't exist, UnsupportedFormatException if it isn't a readable vector layer,
		//and WrongGeometryTypeException if it has geometries other than GEOMETRY
		VectorDataset(const std::string& filename);
		VectorDataset(const std::filesystem::path& filename);

		//throws IOFailureException if the file can't be written
		void writeShapefile(const std::filesystem::path& filename) const;

		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		const GEOMETRY& getGeometry(size_t index) const;
		void addGeometry(const GEOMETRY& g);
	private:
		CoordRef _crs;
		std::vector<GEOMETRY> _geometries;

		void _constructFromFilename(const std::string& filename);
	};

	template<class T>
	inline void AttributeTable::addNumericField(const std::string& name)
	{
		if constexpr (std::is_integral<T>()) {
			addIntegerField(name);
		}
		else if constexpr (std::is_floating_point<T>()) {
			addRealField(name);
		}
		else {
			[] <bool flag = false>()
			{
				static_assert(flag, "incorrect type in addNumericField");
			}();
		}
	}
	template<class T>
	inline T AttributeTable::getNumericField(size_t index, const std::string& name) const
	{
		switch (getFieldType(name)) {
		case FieldType::Integer:
			return (T)getIntegerField(index, name);
		case FieldType::Real:
			return (T)getRealField(index, name);
		default:
			throw WrongFieldTypeException("Field " + name + " is not numeric");
		}
	}
	template<class T>
	inline void AttributeTable::setNumericField(size_t index, const std::string& name, T value)
	{
		if constexpr (std::is_integral<T>()) {
			setIntegerField(index, name, value);
		}
		else if constexpr (std::is_floating_point<T>()) {
			setRealField(index, name, value);
		}
		else {
			[] <bool flag = false>()
			{
				static_assert(flag, "incorrect type in setNumericField");
			}();
		}
	}
	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const CoordRef& crs)
	{
		_crs = crs;
	}
	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const std::string& filename)
	{
		_constructFromFilename(filename);
	}
	template<class GEOMETRY>
	inline VectorDataset<GEOMETRY>::VectorDataset(const std::filesystem::path& filename)
	{
		_constructFromFilename(filename.string());
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::writeShapefile(const std::filesystem::path& filename) const
	{
		UniqueGdalDataset outshp = gdalCreateWrapper("ESRI Shapefile", filename.string(), 0, 0, GDT_Unknown);
		if (!outshp) {
			throw IOFailureException("Unable to create " + filename.string() + ": " + lastGdalErrorMessage());
		}
		OGRSpatialReference osr = _crs.gdalSpatialRef();
		OGRLayer* layer = outshp->CreateLayer(filename.stem().string().c_str(), _crs.isEmpty() ? nullptr : &osr,
			GEOMETRY::gdalGeometryTypeStatic, nullptr);
		if (!layer) {
			throw IOFailureException("Unable to create a layer in " + filename.string() + ": " + lastGdalErrorMessage());
		}

		for (const auto& fieldName : getAllFieldNames()) {
			OGRFieldDefn newField = OGRFieldDefn(fieldName.c_str(), OFTString);
			switch (getFieldType(fieldName)) {
			case FieldType::String:
				newField.SetType(OFTString);
				newField.SetWidth((int)getStringFieldWidth(fieldName));
				break;
			case FieldType::Real:
				newField.SetType(OFTReal);
				break;
			case FieldType::Integer:
				newField.SetType(OFTInteger64);
				break;
			}
			if (layer->CreateField(&newField) != OGRERR_NONE) {
				throw IOFailureException("Unable to create field " + fieldName + " in " + filename.string());
			}
		}
		for (size_t i = 0; i < nFeature(); ++i) {
			UniqueOGRFeature gdalFeature = createFeatureWrapper(layer);
			for (const auto& fieldName : getAllFieldNames()) {
				switch (getFieldType(fieldName)) {
				case FieldType::String:
					gdalFeature->SetField(fieldName.c_str(), getStringField(i, fieldName).c_str());
					break;
				case FieldType::Real:
					gdalFeature->SetField(fieldName.c_str(), getRealField(i, fieldName));
					break;
				case FieldType::Integer:
					gdalFeature->SetField(fieldName.c_str(), (GIntBig)getIntegerField(i, fieldName));
					break;
				}
			}
			gdalFeature->SetGeometryDirectly(getGeometry(i).gdalGeometryGeneric().release());
			if (layer->CreateFeature(gdalFeature.get()) != OGRERR_NONE) {
				throw IOFailureException("Unable to write feature " + std::to_string(i) + " to " + filename.string());
			}
		}
	}
	template<class GEOMETRY>
	inline const CoordRef& VectorDataset<GEOMETRY>::crs() const
	{
		return _crs;
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::setCrs(const CoordRef& crs)
	{
		_crs = crs;
	}
	template<class GEOMETRY>
	inline const GEOMETRY& VectorDataset<GEOMETRY>::getGeometry(size_t index) const
	{
		return _geometries.at(index);
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::addGeometry(const GEOMETRY& g)
	{
		_geometries.push_back(g);
		addRow();
	}
	template<class GEOMETRY>
	inline void VectorDataset<GEOMETRY>::_constructFromFilename(const std::string& filename)
	{
		UniqueGdalDataset shp = openVectorOrThrow(filename);
		OGRLayer* layer = shp->GetLayer(0);

		OGRwkbGeometryType layerType = wkbFlatten(layer->GetGeomType());
		bool acceptable = layerType == wkbUnknown || layerType == GEOMETRY::gdalGeometryTypeStatic;
		if constexpr (std::is_same<GEOMETRY, MultiPolygon>()) {
			acceptable = acceptable || layerType == wkbPolygon;
		}
		if (!acceptable) {
			throw WrongGeometryTypeException(filename + " is not the expected geometry type");
		}

		_crs = CoordRef(layer->GetSpatialRef());

		OGRFeatureDefn* defn = layer->GetLayerDefn();
		std::vector<int> keptFields;
		for (int i = 0; i < defn->GetFieldCount(); ++i) {
			OGRFieldDefn* field = defn->GetFieldDefn(i);
			switch (field->GetType()) {
			case OFTInteger:
			case OFTInteger64:
				addIntegerField(field->GetNameRef());
				break;
			case OFTReal:
				addRealField(field->GetNameRef());
				break;
			case OFTString:
				addStringField(field->GetNameRef(), field->GetWidth() > 0 ? field->GetWidth() : 254);
				break;
			default:
				continue; //dates, lists and binary fields are never burn values
			}
			keptFields.push_back(i);
		}

		layer->ResetReading();
		for (const OGRFeatureUniquePtr& feature : layer) {
			const OGRGeometry* gdalGeometry = feature->GetGeometryRef();
			if (!gdalGeometry || gdalGeometry->IsEmpty()) {
				continue;
			}
			addGeometry(GEOMETRY{ *gdalGeometry, _crs });
			size_t index = nFeature() - 1;
			for (int i : keptFields) {
				OGRFieldDefn* field = defn->GetFieldDefn(i);
				switch (field->GetType()) {
				case OFTInteger:
				case OFTInteger64:
					setIntegerField(index, field->GetNameRef(), feature->GetFieldAsInteger64(i));
					break;
				case OFTReal:
					setRealField(index, field->GetNameRef(), feature->GetFieldAsDouble(i));
					break;
				default:
					setStringField(index, field->GetNameRef(), feature->GetFieldAsString(i));
					break;
				}
			}
		}
	}
}

#endif
