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
#include "containment.hpp"
#include <boost/geometry.hpp>  // for covered_by, for_each_segment, comparable_distance
#include <algorithm>           // for min, max
#include <limits>              // for numeric_limits
#include "geodesy.hpp"
#include "geometry.hpp"

using std::min;
using std::max;

using geometry::CompiledGeometry;
using geometry::PlanarPoint;
using geometry::Position;

namespace bg = boost::geometry;

namespace containment {
    // Returns true if point lies inside, or exactly on the boundary of,
    // any polygon of the compiled geometry. Holes are excluded.
    //
    // Args:
    //     compiled: the area geometry
    //     point: lon/lat to test
    bool containsPoint(const CompiledGeometry& compiled, const Position& point) {
        const PlanarPoint p(point.lon, point.lat);
        // Fast bounding box reject
        if (!bg::covered_by(p, compiled.bounds)) return false;
        return bg::covered_by(p, compiled.shape);
    }

    // Orthogonal projection of point onto the closest boundary segment, in
    // planar lon/lat degrees. Shells and holes of every polygon count as
    // boundary.
    //
    // Args:
    //     compiled: the area geometry
    //     point: lon/lat to project
    // Returns:
    //     the closest boundary position
    Position nearestBoundaryPoint(const CompiledGeometry& compiled, const Position& point) {
        const PlanarPoint target(point.lon, point.lat);

        double best = std::numeric_limits<double>::infinity();
        PlanarPoint segStart(point.lon, point.lat);
        PlanarPoint segEnd(point.lon, point.lat);
        bg::for_each_segment(compiled.shape, [&](const auto& segment) {
            const double d = bg::comparable_distance(target, segment);
            if (d < best) {
                best = d;
                segStart = PlanarPoint(bg::get<0, 0>(segment), bg::get<0, 1>(segment));
                segEnd = PlanarPoint(bg::get<1, 0>(segment), bg::get<1, 1>(segment));
            }
        });

        // foot of the perpendicular, clamped to the segment
        PlanarPoint direction = segEnd;
        bg::subtract_point(direction, segStart);
        PlanarPoint offset = target;
        bg::subtract_point(offset, segStart);
        const double lengthSquared = bg::dot_product(direction, direction);
        double t = 0.0;
        if (lengthSquared > 0.0) {
            t = bg::dot_product(offset, direction) / lengthSquared;
            t = max(0.0, min(1.0, t));
        }
        PlanarPoint foot = direction;
        bg::multiply_value(foot, t);
        bg::add_point(foot, segStart);
        return Position{foot.x(), foot.y()};
    }

    // Ground distance in meters from point to the nearest boundary point,
    // rounded to centimeters. Only meaningful when containsPoint is false.
    double nearestBoundaryDistanceMeters(const CompiledGeometry& compiled, const Position& point) {
        const Position nearest = nearestBoundaryPoint(compiled, point);
        return geodesy::roundCentimeters(
            geodesy::haversineMeters(point.lat, point.lon, nearest.lat, nearest.lon));
    }
}  // namespace containment
