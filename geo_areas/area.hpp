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
#ifndef GEO_AREAS_AREA_HPP_
#define GEO_AREAS_AREA_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <cstddef>                // for size_t
#include <string>                 // for string
#include <vector>                 // for vector
#include "geometry.hpp"           // for Polygon

using std::optional;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace area {

const int MIN_RELEVANCE = 1;
const int MAX_RELEVANCE = 10;

// Named geographic region, authoritative raw record.
// Wire names: name, slug, agencia, relevancia, polygons.
struct Area {
    string slug;
    string name;
    string agency;
    int relevance{MIN_RELEVANCE};
    vector<geometry::Polygon> polygons;
};

// Partial update; an empty field leaves the current value unchanged
struct AreaPatch {
    optional<string> name;
    optional<string> slug;
    optional<string> agency;
    optional<int> relevance;
    optional<vector<geometry::Polygon>> polygons;
};

// Listing row
struct AreaSummary {
    string name;
    string slug;
    size_t polygonCount{};
    size_t totalPoints{};
};

void to_json(json& j, const Area& area);
void from_json(const json& j, Area& area);
void from_json(const json& j, AreaPatch& patch);
void to_json(json& j, const AreaSummary& summary);

Area applyPatch(const Area& current, const AreaPatch& patch);
bool isValidSlug(const string& slug);
void validateArea(const Area& area);
AreaSummary summarize(const Area& area);
string agencyKey(const string& agency);

}  // namespace area

#endif  // GEO_AREAS_AREA_HPP_
