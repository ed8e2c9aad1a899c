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
#include "geodesy.hpp"
#include <cmath>  // for sin, cos, asin, sqrt, round

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geodesy {
    static double toRadians(double degrees) {
        return degrees * M_PI / 180.0;
    }

    // Great-circle distance between two lat/lng points on a spherical earth
    //
    // Args:
    //    lat1, lng1: first point in degrees
    //    lat2, lng2: second point in degrees
    // Returns:
    //    distance in meters
    double haversineMeters(double lat1, double lng1, double lat2, double lng2) {
        const double phi1 = toRadians(lat1);
        const double phi2 = toRadians(lat2);
        const double dPhi = toRadians(lat2 - lat1);
        const double dLambda = toRadians(lng2 - lng1);
        const double sinPhi = std::sin(dPhi / 2);
        const double sinLambda = std::sin(dLambda / 2);
        double a = sinPhi * sinPhi + std::cos(phi1) * std::cos(phi2) * sinLambda * sinLambda;
        // rounding can push a just past 1 for antipodal points
        if (a > 1.0) a = 1.0;
        return 2 * EARTH_RADIUS_M * std::asin(std::sqrt(a));
    }

    double roundCentimeters(double meters) {
        return std::round(meters * 100.0) / 100.0;
    }
}  // namespace geodesy
