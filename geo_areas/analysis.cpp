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
#include "analysis.hpp"
#include <nlohmann/json.hpp>                        // for basic_json
#include <set>                                      // for set
#include <sstream>                                  // for ostringstream
#include <string>                                   // for string
#include <utility>                                  // for move
#include <vector>                                   // for vector
#include "containment.hpp"
#include "errors.hpp"
#include "geometry.hpp"

using std::set;
using std::string;
using std::vector;
using std::ostringstream;
using json = nlohmann::json;

using errors::InvalidRequest;
using geometry::Position;

namespace analysis {
    static vector<string> readStrings(const json& j, const char* key) {
        vector<string> out;
        if (!j.contains(key) || j[key].is_null()) return out;
        if (!j[key].is_array())
            throw InvalidRequest(string("Invalid request: '") + key + "' must be an array of strings.");
        for (const auto& item : j[key]) {
            if (!item.is_string())
                throw InvalidRequest(string("Invalid request: '") + key + "' must be an array of strings.");
            out.push_back(item.get<string>());
        }
        return out;
    }

    void from_json(const json& j, AnalysisRequest& request) {
        if (!j.is_object()) throw InvalidRequest("Invalid request: expected an object.");
        if (!j.contains("target") || !j["target"].is_object())
            throw InvalidRequest("Invalid request: missing 'target'.");
        const auto& target = j["target"];
        for (const char* key : {"lat", "lng"}) {
            if (!target.contains(key) || !target[key].is_number())
                throw InvalidRequest(string("Invalid request: 'target.") + key + "' must be a number.");
        }
        AnalysisRequest parsed;
        parsed.target.lat = target["lat"].get<double>();
        parsed.target.lng = target["lng"].get<double>();
        parsed.areas = readStrings(j, "areas");
        parsed.agencies = readStrings(j, "agencias");
        request = std::move(parsed);
    }

    void to_json(json& j, const AreaResult& result) {
        j = json{
            {"slug", result.slug},
            {"name", result.name},
            {"is_in", result.isIn},
            {"nearest_border_distance_meters", result.nearestBorderDistanceMeters},
            {"agencia", result.agency},
            {"relevancia", result.relevance},
        };
    }

    // errors is null when there are none
    void to_json(json& j, const AnalysisResponse& response) {
        j = json{
            {"results", response.results},
            {"errors", nullptr},
        };
        if (!response.errors.empty()) j["errors"] = response.errors;
    }

    // Requested slugs followed by agency matches, first occurrence wins
    vector<string> candidateSlugs(repository::AreaRepository& repo, const AnalysisRequest& request) {
        vector<string> ordered;
        set<string> seen;
        auto add = [&](const string& slug) {
            if (seen.insert(slug).second) ordered.push_back(slug);
        };
        for (const auto& slug : request.areas) add(slug);
        if (!request.agencies.empty()) {
            for (const auto& slug : repo.findByAgency(request.agencies)) add(slug);
        }
        return ordered;
    }

    // Containment and nearest-border distance of the target for every
    // requested area. Unknown slugs are reported in errors, not thrown.
    //
    // Args:
    //    repo: the area repository
    //    request: target point plus slugs and/or agency names
    // Returns:
    //    per-area results in candidate order and the not-found errors
    // Throws:
    //    InvalidRequest when no slugs or agencies are given, or the target
    //    is off the globe
    AnalysisResponse analyze(repository::AreaRepository& repo, const AnalysisRequest& request) {
        if (request.areas.empty() && request.agencies.empty())
            throw InvalidRequest("Invalid request: provide 'areas' and/or 'agencias'.");

        const Position point{request.target.lng, request.target.lat};
        if (!(point.lat >= -90.0 && point.lat <= 90.0) || !(point.lon >= -180.0 && point.lon <= 180.0)) {
            ostringstream oss;
            oss << "Invalid request: target (" << point.lat << ", " << point.lon
                << ") is outside latitude [-90,90] / longitude [-180,180].";
            throw InvalidRequest(oss.str());
        }

        AnalysisResponse response;
        for (const auto& slug : candidateSlugs(repo, request)) {
            const auto entry = repo.getEntry(slug);
            if (!entry) {
                response.errors.push_back("Area '" + slug + "' not found.");
                continue;
            }

            AreaResult result;
            result.slug = slug;
            result.name = entry->raw.name;
            result.agency = entry->raw.agency;
            result.relevance = entry->raw.relevance;
            result.isIn = containment::containsPoint(*entry->geometry, point);
            result.nearestBorderDistanceMeters =
                result.isIn ? 0.0 : containment::nearestBoundaryDistanceMeters(*entry->geometry, point);
            response.results.push_back(std::move(result));
        }
        return response;
    }
}  // namespace analysis
