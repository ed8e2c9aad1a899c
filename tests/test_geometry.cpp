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
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <vector>
#include "../geo_areas/containment.hpp"
#include "../geo_areas/errors.hpp"
#include "../geo_areas/geometry.hpp"

using std::vector;
using json = nlohmann::json;

using geometry::Position;
using geometry::Ring;
using geometry::Polygon;
using geometry::CompiledGeometry;

using geometry::extractRings;
using geometry::polygonToJson;
using geometry::countPositions;
using geometry::buildGeometry;
using containment::containsPoint;

using errors::InvalidGeometry;

static Polygon square(double minLon, double minLat, double maxLon, double maxLat) {
    return Polygon{ { Ring{ {
        {minLon, minLat}, {maxLon, minLat}, {maxLon, maxLat}, {minLon, maxLat}
    } } } };
}

// -----------------------------------------------------------------------------
// Tests for extractRings
// -----------------------------------------------------------------------------

TEST_CASE("extractRings reads GeoJSON coordinates as lng/lat") {
    const json raw = json::parse(R"({
        "type": "Polygon",
        "coordinates": [[[-46.64, -23.55], [-46.62, -23.55], [-46.62, -23.56], [-46.64, -23.56]]]
    })");

    Polygon poly = extractRings(raw);

    REQUIRE(poly.rings.size() == 1);
    REQUIRE(poly.rings[0].points.size() == 4);
    CHECK(poly.rings[0].points[0].lon == doctest::Approx(-46.64));
    CHECK(poly.rings[0].points[0].lat == doctest::Approx(-23.55));
}

TEST_CASE("extractRings drops altitude") {
    const json raw = json::parse(R"({
        "type": "Polygon",
        "coordinates": [[[1, 2, 300], [3, 2, 300], [3, 4, 300], [1, 4, 300]]]
    })");

    Polygon poly = extractRings(raw);

    CHECK(poly.rings[0].points[2].lon == doctest::Approx(3.0));
    CHECK(poly.rings[0].points[2].lat == doctest::Approx(4.0));
}

TEST_CASE("extractRings keeps holes after the shell") {
    const json raw = json::parse(R"({
        "type": "Polygon",
        "coordinates": [
            [[0, 0], [10, 0], [10, 10], [0, 10]],
            [[3, 3], [7, 3], [7, 7], [3, 7]]
        ]
    })");

    Polygon poly = extractRings(raw);

    REQUIRE(poly.rings.size() == 2);
    CHECK(poly.rings[1].points[0].lon == doctest::Approx(3.0));
}

TEST_CASE("extractRings swaps legacy [lat, lng] points") {
    const json raw = json::parse(R"({
        "points": [[-23.55, -46.64], [-23.55, -46.62], [-23.56, -46.62], [-23.56, -46.64]]
    })");

    Polygon poly = extractRings(raw);

    REQUIRE(poly.rings.size() == 1);
    CHECK(poly.rings[0].points[1].lon == doctest::Approx(-46.62));
    CHECK(poly.rings[0].points[1].lat == doctest::Approx(-23.55));
}

TEST_CASE("extractRings: legacy and GeoJSON forms give the same polygon") {
    const json legacy = json::parse(R"({
        "points": [[-23.55, -46.64], [-23.55, -46.62], [-23.56, -46.62], [-23.56, -46.64]]
    })");
    const json current = json::parse(R"({
        "type": "Polygon",
        "coordinates": [[[-46.64, -23.55], [-46.62, -23.55], [-46.62, -23.56], [-46.64, -23.56]]]
    })");

    CHECK(polygonToJson(extractRings(legacy)) == polygonToJson(extractRings(current)));
}

TEST_CASE("extractRings rejects unknown or malformed polygons") {
    CHECK_THROWS_AS(extractRings(json::parse(R"({"type": "Polygon"})")), InvalidGeometry);
    CHECK_THROWS_AS(extractRings(json::parse(R"([1, 2])")), InvalidGeometry);
    CHECK_THROWS_AS(extractRings(json::parse(R"({"coordinates": 5})")), InvalidGeometry);
    CHECK_THROWS_AS(extractRings(json::parse(R"({"coordinates": [[[1]]]})")), InvalidGeometry);
    CHECK_THROWS_AS(extractRings(json::parse(R"({"coordinates": [[["a", "b"]]]})")), InvalidGeometry);
}

TEST_CASE("polygonToJson writes canonical GeoJSON") {
    const json out = polygonToJson(square(0, 0, 1, 1));

    CHECK(out["type"] == "Polygon");
    CHECK(out["coordinates"].size() == 1);
    CHECK(out["coordinates"][0][1][0].get<double>() == doctest::Approx(1.0));
    CHECK(out["coordinates"][0][1][1].get<double>() == doctest::Approx(0.0));
}

TEST_CASE("countPositions sums every ring") {
    Polygon poly = square(0, 0, 10, 10);
    poly.rings.push_back(square(3, 3, 7, 7).rings[0]);

    CHECK(countPositions(poly) == 8);
}

// -----------------------------------------------------------------------------
// Tests for buildGeometry
// -----------------------------------------------------------------------------

TEST_CASE("buildGeometry closes open rings and computes bounds") {
    CompiledGeometry compiled = buildGeometry({ square(0, 0, 10, 5) });

    REQUIRE(compiled.shape.size() == 1);
    CHECK(compiled.shape[0].outer().size() == 5);
    CHECK(compiled.bounds.min_corner().x() == doctest::Approx(0.0));
    CHECK(compiled.bounds.max_corner().x() == doctest::Approx(10.0));
    CHECK(compiled.bounds.max_corner().y() == doctest::Approx(5.0));
}

TEST_CASE("buildGeometry leaves already closed rings alone") {
    Polygon poly{ { Ring{ { {0, 0}, {1, 0}, {1, 1}, {0, 1}, {0, 0} } } } };

    CompiledGeometry compiled = buildGeometry({ poly });

    CHECK(compiled.shape[0].outer().size() == 5);
}

TEST_CASE("buildGeometry accepts either winding order") {
    Polygon ccw = square(0, 0, 10, 10);
    Polygon cw{ { Ring{ { {0, 0}, {0, 10}, {10, 10}, {10, 0} } } } };

    CHECK(containsPoint(buildGeometry({ ccw }), {5, 5}));
    CHECK(containsPoint(buildGeometry({ cw }), {5, 5}));
}

TEST_CASE("buildGeometry rejects an empty polygon list") {
    CHECK_THROWS_AS(buildGeometry({}), InvalidGeometry);
}

TEST_CASE("buildGeometry rejects a polygon without rings") {
    CHECK_THROWS_AS(buildGeometry({ Polygon{} }), InvalidGeometry);
}

TEST_CASE("buildGeometry accepts an open triangle, closing it to 4 positions") {
    Polygon triangle{ { Ring{ { {0, 0}, {1, 0}, {0, 1} } } } };
    CompiledGeometry compiled = buildGeometry({ triangle });

    CHECK(compiled.shape.front().outer().size() == 4);
    CHECK(containsPoint(compiled, {0.2, 0.2}));
    CHECK_FALSE(containsPoint(compiled, {0.8, 0.8}));

    Polygon triangleHole = square(0, 0, 10, 10);
    triangleHole.rings.push_back(Ring{ { {3, 3}, {4, 3}, {3, 4} } });
    CHECK_FALSE(containsPoint(buildGeometry({ triangleHole }), {3.2, 3.2}));
}

TEST_CASE("buildGeometry rejects rings with fewer than 4 positions once closed") {
    Polygon segment{ { Ring{ { {0, 0}, {1, 0} } } } };
    CHECK_THROWS_AS(buildGeometry({ segment }), InvalidGeometry);

    Polygon closedSegment{ { Ring{ { {0, 0}, {1, 0}, {0, 0} } } } };
    CHECK_THROWS_AS(buildGeometry({ closedSegment }), InvalidGeometry);

    Polygon empty{ { Ring{} } };
    CHECK_THROWS_AS(buildGeometry({ empty }), InvalidGeometry);

    Polygon shortHole = square(0, 0, 10, 10);
    shortHole.rings.push_back(Ring{ { {3, 3}, {4, 3} } });
    CHECK_THROWS_AS(buildGeometry({ shortHole }), InvalidGeometry);
}

TEST_CASE("buildGeometry rejects positions off the globe") {
    CHECK_THROWS_AS(buildGeometry({ square(170, 0, 181, 1) }), InvalidGeometry);
    CHECK_THROWS_AS(buildGeometry({ square(0, -91, 1, 1) }), InvalidGeometry);
    CHECK_NOTHROW(buildGeometry({ square(-180, -90, 180, 90) }));
}

TEST_CASE("buildGeometry keeps disjoint islands as separate polygons") {
    CompiledGeometry compiled = buildGeometry({ square(0, 0, 1, 1), square(5, 5, 6, 6) });

    CHECK(compiled.shape.size() == 2);
    CHECK(containsPoint(compiled, {0.5, 0.5}));
    CHECK(containsPoint(compiled, {5.5, 5.5}));
    CHECK_FALSE(containsPoint(compiled, {3, 3}));
}

TEST_CASE("buildGeometry round-trips through json") {
    Polygon poly = square(-46.64, -23.56, -46.62, -23.55);
    poly.rings.push_back(square(-46.635, -23.558, -46.625, -23.552).rings[0]);

    CompiledGeometry direct = buildGeometry({ poly });
    CompiledGeometry viaJson = buildGeometry({ extractRings(polygonToJson(poly)) });

    for (const Position& p : vector<Position>{
             {-46.63, -23.555}, {-46.638, -23.559}, {-46.60, -23.555}, {-46.64, -23.55}}) {
        CHECK(containsPoint(direct, p) == containsPoint(viaJson, p));
    }
}
