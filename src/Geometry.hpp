#pragma once
#ifndef canoclass_geometry_h
#define canoclass_geometry_h

#include"canoclass_pch.hpp"
#include"CoordRef.hpp"
#include"Coordinate.hpp"
#include"Extent.hpp"

namespace canoclass {

	class Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbUnknown;
		using GdalEquivalent = OGRGeometry;

		virtual OGRwkbGeometryType gdalGeometryType() const;

		virtual std::unique_ptr<OGRGeometry> gdalGeometryGeneric() const = 0;

		virtual Extent boundingBox() const = 0;

		const CoordRef& crs() const;
		void setCrs(const CoordRef& crs);

		virtual ~Geometry() = default;

	protected:
		CoordRef _crs;
		Geometry() = default;
		Geometry(const Geometry&) = default;
		Geometry& operator=(const Geometry&) = default;
	};
	class Polygon : public Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbPolygon;
		using GdalEquivalent = OGRPolygon;

		Polygon() = default;
		Polygon(const OGRGeometry& geom);
		Polygon(const OGRGeometry& geom, const CoordRef& crs);
		Polygon(const std::vector<CoordXY>& outerRing);
		Polygon(const std::vector<CoordXY>& outerRing, const CoordRef& crs);
		Polygon(const Extent& e);

		OGRwkbGeometryType gdalGeometryType() const override;
		std::unique_ptr<OGRPolygon> gdalGeometry() const;
		std::unique_ptr<OGRGeometry> gdalGeometryGeneric() const override;

		void addInnerRing(const std::vector<CoordXY>& innerRing);

		const std::vector<CoordXY>& getOuterRing() const;
		int nInnerRings() const;
		const std::vector<CoordXY>& getInnerRing(int index) const;

		Extent boundingBox() const override;

		//true if the point is inside the outer ring and outside every inner ring
		bool containsPoint(coord_t x, coord_t y) const;
		bool containsPoint(CoordXY xy) const;
	private:
		std::vector<CoordXY> _outerRing;
		std::vector<std::vector<CoordXY>> _innerRings;

		static void _closeRing(std::vector<CoordXY>& ring);
		void _sharedConstructorFromGdal(const OGRGeometry& geom);
	};
	class MultiPolygon : public Geometry {
	public:
		constexpr static OGRwkbGeometryType gdalGeometryTypeStatic = wkbMultiPolygon;
		using GdalEquivalent = OGRMultiPolygon;

		MultiPolygon() = default;
		//accepts both polygons and multipolygons
		MultiPolygon(const OGRGeometry& geom);
		MultiPolygon(const OGRGeometry& geom, const CoordRef& crs);

		size_t nPolygon() const;

		OGRwkbGeometryType gdalGeometryType() const override;
		std::unique_ptr<OGRMultiPolygon> gdalGeometry() const;
		std::unique_ptr<OGRGeometry> gdalGeometryGeneric() const override;

		std::vector<Polygon>::const_iterator begin() const;
		std::vector<Polygon>::const_iterator end() const;

		void addPolygon(const Polygon& polygon);

		Extent boundingBox() const override;
		bool containsPoint(coord_t x, coord_t y) const;
		bool containsPoint(CoordXY xy) const;
	private:
		std::vector<Polygon> _polygons;
		void _sharedConstructorFromGdal(const OGRGeometry& geom, const CoordRef& crs);
	};
}

#endif
