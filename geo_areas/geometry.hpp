// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef GEO_AREAS_GEOMETRY_HPP_
#define GEO_AREAS_GEOMETRY_HPP_

#include <boost/geometry.hpp>                         // for model, correct, envelope
#include <boost/geometry/geometries/point_xy.hpp>     // for point_xy
#include <nlohmann/json_fwd.hpp>                      // for json
#include <cstddef>                                    // for size_t
#include <vector>                                     // for vector

using std::vector;
using json = nlohmann::json;

namespace geometry {
// -------------------------------------
// raw ring data, as stored for an area
// -------------------------------------

// lon/lat position in degrees, altitude dropped
struct Position { double lon{}, lat{}; };

// polygon ring
struct Ring {
    // Closed or open ring of lon/lat positions, as given by the source
    vector<Position> points;
};

// polygon shape
struct Polygon {
    // rings[0] = shell; rings[1..] = holes
    vector<Ring> rings;
};

// -------------------------------------
// compiled geometry
// -------------------------------------

// planar lon/lat: x = longitude, y = latitude
using PlanarPoint = boost::geometry::model::d2::point_xy<double>;
using PlanarPolygon = boost::geometry::model::polygon<PlanarPoint>;
using PlanarMultiPolygon = boost::geometry::model::multi_polygon<PlanarPolygon>;
using PlanarBox = boost::geometry::model::box<PlanarPoint>;

// Union of an area's polygons, closed and correctly oriented, plus its
// bounding box for fast reject. Immutable once built.
struct CompiledGeometry {
    PlanarMultiPolygon shape;
    PlanarBox bounds;
};

// counted after closing: a triangle plus its repeated first position
const size_t MIN_RING_POSITIONS = 4;

Polygon extractRings(const json& rawPolygon);
json polygonToJson(const Polygon& poly);
size_t countPositions(const Polygon& poly);
void validatePosition(const Position& position);
CompiledGeometry buildGeometry(const vector<Polygon>& polygons);

}  // namespace geometry

#endif  // GEO_AREAS_GEOMETRY_HPP_
