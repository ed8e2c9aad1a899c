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
#ifndef GEO_AREAS_GEODESY_HPP_
#define GEO_AREAS_GEODESY_HPP_

namespace geodesy {

const double EARTH_RADIUS_M = 6371000.0;  // spherical mean radius

double haversineMeters(double lat1, double lng1, double lat2, double lng2);
double roundCentimeters(double meters);

}  // namespace geodesy

#endif  // GEO_AREAS_GEODESY_HPP_
