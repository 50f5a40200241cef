#include"Geometry.hpp"
#include"GisExceptions.hpp"

namespace canoclass {

    OGRwkbGeometryType Geometry::gdalGeometryType() const
    {
        return OGRwkbGeometryType::wkbUnknown;
    }
    const CoordRef& Geometry::crs() const
    {
        return _crs;
    }
    void Geometry::setCrs(const CoordRef& crs)
    {
        _crs = crs;
    }

    Polygon::Polygon(const OGRGeometry& geom)
    {
        _sharedConstructorFromGdal(geom);
        setCrs(CoordRef(geom.getSpatialReference()));
    }
    Polygon::Polygon(const OGRGeometry& geom, const CoordRef& crs)
    {
        _sharedConstructorFromGdal(geom);
        setCrs(crs);
    }
    Polygon::Polygon(const std::vector<CoordXY>& outerRing)
    {
        _outerRing = outerRing;
        _closeRing(_outerRing);
    }
    Polygon::Polygon(const std::vector<CoordXY>& outerRing, const CoordRef& crs)
        : Polygon(outerRing)
    {
        setCrs(crs);
    }
    Polygon::Polygon(const Extent& e)
    {
        setCrs(e.crs());

        _outerRing.reserve(5);
        _outerRing.emplace_back(e.xmin(), e.ymax());
        _outerRing.emplace_back(e.xmin(), e.ymin());
        _outerRing.emplace_back(e.xmax(), e.ymin());
        _outerRing.emplace_back(e.xmax(), e.ymax());
        _outerRing.push_back(_outerRing.front());
    }
    OGRwkbGeometryType Polygon::gdalGeometryType() const
    {
        return OGRwkbGeometryType::wkbPolygon;
    }
    std::unique_ptr<OGRPolygon> Polygon::gdalGeometry() const
    {
        std::unique_ptr<OGRPolygon> gdalPolygon = std::make_unique<OGRPolygon>();
        OGRLinearRing* gdalOuterRing = new OGRLinearRing();
        for (const CoordXY& xy : _outerRing) {
            gdalOuterRing->addPoint(xy.x, xy.y);
        }
        gdalOuterRing->closeRings();
        gdalPolygon->addRingDirectly(gdalOuterRing);

        for (const std::vector<CoordXY>& innerRing : _innerRings) {
            OGRLinearRing* gdalInnerRing = new OGRLinearRing();
            for (const CoordXY& xy : innerRing) {
                gdalInnerRing->addPoint(xy.x, xy.y);
            }
            gdalInnerRing->closeRings();
            gdalPolygon->addRingDirectly(gdalInnerRing);
        }
        return gdalPolygon;
    }
    std::unique_ptr<OGRGeometry> Polygon::gdalGeometryGeneric() const
    {
        return std::unique_ptr<OGRGeometry>(gdalGeometry().release());
    }
    void Polygon::addInnerRing(const std::vector<CoordXY>& innerRing)
    {
        std::vector<CoordXY> ring = innerRing;
        _closeRing(ring);
        _innerRings.push_back(std::move(ring));
    }
    const std::vector<CoordXY>& Polygon::getOuterRing() const {
        return _outerRing;
    }
    int Polygon::nInnerRings() const
    {
        return (int)_innerRings.size();
    }
    const std::vector<CoordXY>& Polygon::getInnerRing(int index) const
    {
        return _innerRings.at(index);
    }
    Extent Polygon::boundingBox() const
    {
        if (_outerRing.empty()) {
            return Extent{ 0, 0, 0, 0, _crs };
        }
        coord_t xmin = std::numeric_limits<coord_t>::max();
        coord_t xmax = std::numeric_limits<coord_t>::lowest();
        coord_t ymin = std::numeric_limits<coord_t>::max();
        coord_t ymax = std::numeric_limits<coord_t>::lowest();
        for (const CoordXY& xy : _outerRing) {
            if (xy.x < xmin) xmin = xy.x;
            if (xy.x > xmax) xmax = xy.x;
            if (xy.y < ymin) ymin = xy.y;
            if (xy.y > ymax) ymax = xy.y;
        }
        return Extent{ xmin, xmax, ymin, ymax, _crs };
    }
    bool Polygon::containsPoint(coord_t x, coord_t y) const
    {
        //even-odd ray casting; rings are stored closed, so the last point repeats the first
        auto pointInRing = [](const std::vector<CoordXY>& ring, coord_t x, coord_t y) {
            int nvert = (int)ring.size() - 1;
            bool within = false;
            for (int i = 0, j = nvert - 1; i < nvert; j = i++) {
                coord_t ix = ring[i].x;
                coord_t iy = ring[i].y;
                coord_t jx = ring[j].x;
                coord_t jy = ring[j].y;
                if (((iy > y) != (jy > y)) &&
                    (x < (jx - ix) * (y - iy) / (jy - iy) + ix)) {
                    within = !within;
                }
            }
            return within;
            };

        if (_outerRing.size() < 4 || !pointInRing(_outerRing, x, y)) {
            return false;
        }
        for (const std::vector<CoordXY>& innerRing : _innerRings) {
            if (innerRing.size() >= 4 && pointInRing(innerRing, x, y)) {
                return false;
            }
        }
        return true;
    }
    bool Polygon::containsPoint(CoordXY xy) const
    {
        return containsPoint(xy.x, xy.y);
    }
    void Polygon::_sharedConstructorFromGdal(const OGRGeometry& geom) {
        if (wkbFlatten(geom.getGeometryType()) != wkbPolygon) {
            throw WrongGeometryTypeException("Wrong geometry; expected Polygon");
        }
        const OGRPolygon* gdalPolygon = geom.toPolygon();

        const OGRLinearRing* exteriorRing = gdalPolygon->getExteriorRing();
        if (!exteriorRing) {
            return; //an empty polygon contains nothing
        }
        for (const OGRPoint& point : *exteriorRing) {
            _outerRing.emplace_back(point.getX(), point.getY());
        }
        _closeRing(_outerRing);
        for (int i = 0; i < gdalPolygon->getNumInteriorRings(); i++) {
            const OGRLinearRing* innerRing = gdalPolygon->getInteriorRing(i);
            std::vector<CoordXY> innerCoords;
            for (const OGRPoint& point : *innerRing) {
                innerCoords.emplace_back(point.getX(), point.getY());
            }
            _closeRing(innerCoords);
            _innerRings.emplace_back(std::move(innerCoords));
        }
    }

    void Polygon::_closeRing(std::vector<CoordXY>& ring)
    {
        if (ring.size() && ring.back() != ring.front()) {
            ring.push_back(ring.front());
        }
    }

    MultiPolygon::MultiPolygon(const OGRGeometry& geom)
    {
        CoordRef crs{ geom.getSpatialReference() };
        _sharedConstructorFromGdal(geom, crs);
        setCrs(crs);
    }
    MultiPolygon::MultiPolygon(const OGRGeometry& geom, const CoordRef& crs)
    {
        _sharedConstructorFromGdal(geom, crs);
        setCrs(crs);
    }
    OGRwkbGeometryType MultiPolygon::gdalGeometryType() const
    {
        return OGRwkbGeometryType::wkbMultiPolygon;
    }
    std::unique_ptr<OGRMultiPolygon> MultiPolygon::gdalGeometry() const
    {
        std::unique_ptr<OGRMultiPolygon> gdalMultiPolygon = std::make_unique<OGRMultiPolygon>();
        for (const Polygon& poly : _polygons) {
            gdalMultiPolygon->addGeometryDirectly(poly.gdalGeometry().release());
        }
        return gdalMultiPolygon;
    }
    std::unique_ptr<OGRGeometry> MultiPolygon::gdalGeometryGeneric() const
    {
        return std::unique_ptr<OGRGeometry>(gdalGeometry().release());
    }
    void MultiPolygon::addPolygon(const Polygon& polygon)
    {
        if (!polygon.crs().isConsistent(_crs)) {
            throw AlignmentMismatchException("Polygon CRS does not match MultiPolygon CRS");
        }
        _polygons.push_back(polygon);
    }
    std::vector<Polygon>::const_iterator MultiPolygon::begin() const
    {
        return _polygons.begin();
    }
    std::vector<Polygon>::const_iterator MultiPolygon::end() const
    {
        return _polygons.end();
    }
    Extent MultiPolygon::boundingBox() const
    {
        if (!_polygons.size()) {
            return Extent{ 0, 0, 0, 0, _crs };
        }
        Extent out = _polygons[0].boundingBox();
        for (size_t i = 1; i < _polygons.size(); i++) {
            out = extendExtent(out, _polygons[i].boundingBox());
        }
        return out;
    }
    bool MultiPolygon::containsPoint(coord_t x, coord_t y) const
    {
        for (const Polygon& poly : _polygons) {
            if (poly.containsPoint(x, y)) {
                return true;
            }
        }
        return false;
    }
    bool MultiPolygon::containsPoint(CoordXY xy) const
    {
        return containsPoint(xy.x, xy.y);
    }
    void MultiPolygon::_sharedConstructorFromGdal(const OGRGeometry& geom, const CoordRef& crs)
    {
        if (wkbFlatten(geom.getGeometryType()) != wkbMultiPolygon
            && wkbFlatten(geom.getGeometryType()) != wkbPolygon) {
            throw WrongGeometryTypeException("Wrong geometry; expected Polygon or MultiPolygon");
        }
        if (wkbFlatten(geom.getGeometryType()) == wkbPolygon) {
            _polygons.emplace_back(geom, crs);
            return;
        }
        const OGRMultiPolygon* gdalMultiPolygon = geom.toMultiPolygon();
        for (int i = 0; i < gdalMultiPolygon->getNumGeometries(); i++) {
            _polygons.emplace_back(*gdalMultiPolygon->getGeometryRef(i), crs);
        }
    }
    size_t MultiPolygon::nPolygon() const
    {
        return _polygons.size();
    }
}
