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
#include "geometry.hpp"
#include <boost/geometry.hpp>                       // for correct, envelope
#include <nlohmann/json.hpp>                        // for basic_json, opera...
#include <sstream>                                  // for ostringstream
#include <string>                                   // for string
#include <utility>                                  // for move
#include <vector>                                   // for vector
#include "errors.hpp"

using std::string;
using std::vector;
using std::ostringstream;
using json = nlohmann::json;

using errors::InvalidGeometry;

namespace bg = boost::geometry;

namespace geometry {
    // Reads one [first, second, alt?] pair out of a json position array
    //
    // Args:
    //    raw: the json position
    //    first: first component, written here
    //    second: second component, written here
    static void readPair(const json& raw, double* first, double* second) {
        if (!raw.is_array() || raw.size() < 2 ||
            !raw[0].is_number() || !raw[1].is_number()) {
            throw InvalidGeometry("Invalid position: expected a numeric pair, got " + raw.dump());
        }
        *first = raw[0].get<double>();
        *second = raw[1].get<double>();
    }

    // Converts raw polygon json into a Polygon. Accepts the GeoJSON form
    // ("coordinates", rings of [lng, lat, alt?]) and the legacy form
    // ("points", a single ring of [lat, lng]).
    //
    // Args:
    //    rawPolygon: json object for one polygon
    // Returns:
    //    the polygon, shell first then holes
    Polygon extractRings(const json& rawPolygon) {
        if (!rawPolygon.is_object())
            throw InvalidGeometry("Invalid polygon: expected an object.");

        Polygon poly;
        if (rawPolygon.contains("coordinates")) {
            const auto& coords = rawPolygon["coordinates"];
            if (!coords.is_array())
                throw InvalidGeometry("Invalid polygon: 'coordinates' must be an array of rings.");
            for (const auto& ringCoords : coords) {
                if (!ringCoords.is_array())
                    throw InvalidGeometry("Invalid polygon: each ring must be an array of positions.");
                Ring ring;
                ring.points.reserve(ringCoords.size());
                for (const auto& p : ringCoords) {
                    Position pos;
                    readPair(p, &pos.lon, &pos.lat);
                    ring.points.push_back(pos);
                }
                poly.rings.push_back(std::move(ring));
            }
            return poly;
        }

        // legacy schema: points are [lat, lng]
        if (rawPolygon.contains("points")) {
            const auto& points = rawPolygon["points"];
            if (!points.is_array())
                throw InvalidGeometry("Invalid polygon: 'points' must be an array.");
            Ring ring;
            ring.points.reserve(points.size());
            for (const auto& p : points) {
                Position pos;
                readPair(p, &pos.lat, &pos.lon);
                ring.points.push_back(pos);
            }
            poly.rings.push_back(std::move(ring));
            return poly;
        }

        throw InvalidGeometry("Invalid polygon: expected GeoJSON 'coordinates'.");
    }

    // Canonical GeoJSON form of a polygon
    json polygonToJson(const Polygon& poly) {
        json coords = json::array();
        for (const auto& ring : poly.rings) {
            json ringCoords = json::array();
            for (const auto& p : ring.points) ringCoords.push_back(json::array({p.lon, p.lat}));
            coords.push_back(std::move(ringCoords));
        }
        return json{{"type", "Polygon"}, {"coordinates", std::move(coords)}};
    }

    size_t countPositions(const Polygon& poly) {
        size_t total = 0;
        for (const auto& ring : poly.rings) total += ring.points.size();
        return total;
    }

    // Throws InvalidGeometry when position is off the globe (NaN included)
    void validatePosition(const Position& position) {
        const bool lonOk = position.lon >= -180.0 && position.lon <= 180.0;
        const bool latOk = position.lat >= -90.0 && position.lat <= 90.0;
        if (!lonOk || !latOk) {
            ostringstream oss;
            oss << "Invalid position: (" << position.lon << ", " << position.lat
                << ") is outside longitude [-180,180] / latitude [-90,90].";
            throw InvalidGeometry(oss.str());
        }
    }

    // Copies a validated ring into a boost ring, closing it if the source didn't.
    // The minimum size applies to the closed ring.
    template <typename BgRing>
    static void fillRing(const Ring& ring, BgRing* out) {
        if (ring.points.empty()) throw InvalidGeometry("Invalid ring: no positions.");
        out->clear();
        out->reserve(ring.points.size() + 1);
        for (const auto& p : ring.points) {
            validatePosition(p);
            out->push_back(PlanarPoint(p.lon, p.lat));
        }
        // ensure closed ring
        const auto& first = ring.points.front();
        const auto& last = ring.points.back();
        if (first.lon != last.lon || first.lat != last.lat) {
            out->push_back(PlanarPoint(first.lon, first.lat));
        }
        if (out->size() < MIN_RING_POSITIONS) {
            ostringstream oss;
            oss << "Invalid ring: expected at least " << MIN_RING_POSITIONS
                << " positions once closed, got " << out->size() << ".";
            throw InvalidGeometry(oss.str());
        }
    }

    // Builds the compiled geometry for an area's polygon list
    //
    // Args:
    //    polygons: the area's polygons, each shell first then holes
    // Returns:
    //    multi-polygon with its bounding box
    // Throws:
    //    InvalidGeometry on an empty list, a short ring or an off-globe position
    CompiledGeometry buildGeometry(const vector<Polygon>& polygons) {
        if (polygons.empty()) throw InvalidGeometry("Invalid area: at least one polygon is required.");

        CompiledGeometry compiled;
        compiled.shape.reserve(polygons.size());
        for (const auto& poly : polygons) {
            if (poly.rings.empty()) throw InvalidGeometry("Invalid polygon: missing shell ring.");
            PlanarPolygon planar;
            fillRing(poly.rings.front(), &planar.outer());
            planar.inners().resize(poly.rings.size() - 1);
            for (size_t i = 1; i < poly.rings.size(); ++i) {
                fillRing(poly.rings[i], &planar.inners()[i - 1]);
            }
            // source rings may be wound either way
            bg::correct(planar);
            compiled.shape.push_back(std::move(planar));
        }
        bg::envelope(compiled.shape, compiled.bounds);
        return compiled;
    }
}  // namespace geometry
