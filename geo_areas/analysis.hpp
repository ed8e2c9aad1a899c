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
#ifndef GEO_AREAS_ANALYSIS_HPP_
#define GEO_AREAS_ANALYSIS_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <string>                 // for string
#include <vector>                 // for vector
#include "repository.hpp"         // for AreaRepository

using std::string;
using std::vector;
using json = nlohmann::json;

namespace analysis {

// query point in degrees
struct Target { double lat{}, lng{}; };

struct AnalysisRequest {
    Target target;
    vector<string> areas;     // slugs, in caller order
    vector<string> agencies;  // agency names, matched loosely
};

// Outcome for one area
struct AreaResult {
    string slug;
    string name;
    bool isIn{};
    double nearestBorderDistanceMeters{};  // 0 when isIn
    string agency;
    int relevance{1};
};

struct AnalysisResponse {
    vector<AreaResult> results;  // candidate order
    vector<string> errors;       // per-area lookup failures
};

void from_json(const json& j, AnalysisRequest& request);
void to_json(json& j, const AreaResult& result);
void to_json(json& j, const AnalysisResponse& response);

vector<string> candidateSlugs(repository::AreaRepository& repo, const AnalysisRequest& request);
AnalysisResponse analyze(repository::AreaRepository& repo, const AnalysisRequest& request);

}  // namespace analysis

#endif  // GEO_AREAS_ANALYSIS_HPP_
