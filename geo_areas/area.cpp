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
#include "area.hpp"
#include <algorithm>                                // for all_of, transform
#include <cctype>                                   // for isspace, tolower
#include <cstdint>                                  // for int64_t, uint64_t
#include <limits>                                   // for numeric_limits
#include <nlohmann/json.hpp>                        // for basic_json, opera...
#include <sstream>                                  // for ostringstream
#include <string>                                   // for string
#include <utility>                                  // for move
#include <vector>                                   // for vector
#include "errors.hpp"
#include "geometry.hpp"

using std::string;
using std::vector;
using std::ostringstream;
using json = nlohmann::json;

using errors::InvalidRequest;
using geometry::Polygon;

namespace area {
    // field present and not null
    static bool has(const json& j, const char* key) {
        return j.contains(key) && !j[key].is_null();
    }

    static string readString(const json& j, const char* key) {
        if (!j[key].is_string())
            throw InvalidRequest(string("Invalid area: '") + key + "' must be a string.");
        return j[key].get<string>();
    }

    static int readInt(const json& j, const char* key) {
        if (!j[key].is_number_integer())
            throw InvalidRequest(string("Invalid area: '") + key + "' must be an integer.");
        // reject values that would wrap when narrowed to int
        const bool fits = j[key].is_number_unsigned()
            ? j[key].get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : j[key].get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              j[key].get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits) throw InvalidRequest(string("Invalid area: '") + key + "' is out of range.");
        return static_cast<int>(j[key].get<std::int64_t>());
    }

    static vector<Polygon> readPolygons(const json& j) {
        const auto& raw = j["polygons"];
        if (!raw.is_array()) throw InvalidRequest("Invalid area: 'polygons' must be an array.");
        vector<Polygon> polygons;
        polygons.reserve(raw.size());
        for (const auto& rawPolygon : raw) polygons.push_back(geometry::extractRings(rawPolygon));
        return polygons;
    }

    void to_json(json& j, const Area& area) {
        json polygons = json::array();
        for (const auto& poly : area.polygons) polygons.push_back(geometry::polygonToJson(poly));
        j = json{
            {"name", area.name},
            {"slug", area.slug},
            {"agencia", area.agency},
            {"relevancia", area.relevance},
            {"polygons", std::move(polygons)},
        };
    }

    // Parses an area record. Records written before agencia/relevancia
    // existed default to "" and 1.
    void from_json(const json& j, Area& area) {
        if (!j.is_object()) throw InvalidRequest("Invalid area: expected an object.");
        for (const char* key : {"name", "slug", "polygons"}) {
            if (!has(j, key)) throw InvalidRequest(string("Invalid area: missing '") + key + "'.");
        }
        Area parsed;
        parsed.name = readString(j, "name");
        parsed.slug = readString(j, "slug");
        if (has(j, "agencia")) parsed.agency = readString(j, "agencia");
        if (has(j, "relevancia")) parsed.relevance = readInt(j, "relevancia");
        parsed.polygons = readPolygons(j);
        area = std::move(parsed);
    }

    void from_json(const json& j, AreaPatch& patch) {
        if (!j.is_object()) throw InvalidRequest("Invalid patch: expected an object.");
        AreaPatch parsed;
        if (has(j, "name")) parsed.name = readString(j, "name");
        if (has(j, "slug")) parsed.slug = readString(j, "slug");
        if (has(j, "agencia")) parsed.agency = readString(j, "agencia");
        if (has(j, "relevancia")) parsed.relevance = readInt(j, "relevancia");
        if (has(j, "polygons")) parsed.polygons = readPolygons(j);
        patch = std::move(parsed);
    }

    void to_json(json& j, const AreaSummary& summary) {
        j = json{
            {"name", summary.name},
            {"slug", summary.slug},
            {"polygon_count", summary.polygonCount},
            {"total_points", summary.totalPoints},
        };
    }

    // Merges the fields set in patch over current
    //
    // Args:
    //    current: the stored record
    //    patch: fields to change
    // Returns:
    //    the merged record
    Area applyPatch(const Area& current, const AreaPatch& patch) {
        Area merged = current;
        if (patch.name) merged.name = *patch.name;
        if (patch.slug) merged.slug = *patch.slug;
        if (patch.agency) merged.agency = *patch.agency;
        if (patch.relevance) merged.relevance = *patch.relevance;
        if (patch.polygons) merged.polygons = *patch.polygons;
        return merged;
    }

    // slug pattern ^[a-z0-9_]+$
    bool isValidSlug(const string& slug) {
        return !slug.empty() && std::all_of(slug.begin(), slug.end(), [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        });
    }

    // Field-level checks for records coming from callers.
    // Geometry is checked separately by geometry::buildGeometry.
    void validateArea(const Area& area) {
        if (!isValidSlug(area.slug))
            throw InvalidRequest("Invalid slug '" + area.slug + "': expected ^[a-z0-9_]+$.");
        if (area.name.empty()) throw InvalidRequest("Invalid area: 'name' must not be empty.");
        if (area.relevance < MIN_RELEVANCE || area.relevance > MAX_RELEVANCE) {
            ostringstream oss;
            oss << "Invalid area: 'relevancia' must be between " << MIN_RELEVANCE
                << " and " << MAX_RELEVANCE << ", got " << area.relevance << ".";
            throw InvalidRequest(oss.str());
        }
        if (area.polygons.empty()) throw InvalidRequest("Invalid area: at least one polygon is required.");
    }

    AreaSummary summarize(const Area& area) {
        AreaSummary summary;
        summary.name = area.name;
        summary.slug = area.slug;
        summary.polygonCount = area.polygons.size();
        for (const auto& poly : area.polygons) summary.totalPoints += geometry::countPositions(poly);
        return summary;
    }

    // Agency comparison key: surrounding whitespace trimmed, ASCII lower-cased
    string agencyKey(const string& agency) {
        auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
        auto begin = std::find_if_not(agency.begin(), agency.end(), isSpace);
        auto end = std::find_if_not(agency.rbegin(), agency.rend(), isSpace).base();
        if (begin >= end) return {};
        string key(begin, end);
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return key;
    }
}  // namespace area
