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
#ifndef GEO_AREAS_CONTAINMENT_HPP_
#define GEO_AREAS_CONTAINMENT_HPP_

#include "geometry.hpp"  // for CompiledGeometry, Position

namespace containment {

bool containsPoint(const geometry::CompiledGeometry& compiled, const geometry::Position& point);
geometry::Position nearestBoundaryPoint(
    const geometry::CompiledGeometry& compiled, const geometry::Position& point);
double nearestBoundaryDistanceMeters(
    const geometry::CompiledGeometry& compiled, const geometry::Position& point);

}  // namespace containment

#endif  // GEO_AREAS_CONTAINMENT_HPP_
