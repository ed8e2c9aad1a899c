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
#ifndef GEO_AREAS_REPOSITORY_HPP_
#define GEO_AREAS_REPOSITORY_HPP_

#include <map>                    // for map
#include <memory>                 // for shared_ptr
#include <mutex>                  // for recursive_mutex
#include <functional>             // for function
#include <optional>               // for optional
#include <cstddef>                // for size_t
#include <string>                 // for string
#include <vector>                 // for vector
#include "area.hpp"               // for Area, AreaPatch, AreaSummary
#include "geometry.hpp"           // for CompiledGeometry
#include "storage.hpp"            // for AreaStore

using std::map;
using std::optional;
using std::shared_ptr;
using std::string;
using std::vector;

namespace repository {

using GeometryPtr = shared_ptr<const geometry::CompiledGeometry>;

// Raw record and its compiled geometry, read together
struct AreaEntry {
    area::Area raw;
    GeometryPtr geometry;
};

// Owns slug -> (raw record, compiled geometry). Every raw record has exactly
// one compiled geometry and vice versa; both are replaced together under one
// lock. Hydrates from the store on first use.
class AreaRepository {
 public:
    explicit AreaRepository(storage::AreaStore& store);

    AreaRepository(const AreaRepository&) = delete;
    AreaRepository& operator=(const AreaRepository&) = delete;

    void ensureHydrated();
    bool hydrated();

    void upsert(const area::Area& area);
    // Merges changes into slug's record. validate, when given, sees the
    // merged record under the lock and throws to reject it.
    area::Area patch(const string& slug, const area::AreaPatch& changes,
                     const std::function<void(const area::Area&)>& validate = nullptr);
    bool remove(const string& slug);

    GeometryPtr getGeometry(const string& slug);
    optional<area::Area> getRaw(const string& slug);
    optional<AreaEntry> getEntry(const string& slug);
    vector<string> findByAgency(const vector<string>& names);
    vector<area::AreaSummary> listAll();
    bool exists(const string& slug);
    size_t size();

 private:
    void persist();

    storage::AreaStore& store_;
    std::recursive_mutex mutex_;
    map<string, area::Area> raw_;
    map<string, GeometryPtr> geometries_;
    bool hydrated_ = false;
};

}  // namespace repository

#endif  // GEO_AREAS_REPOSITORY_HPP_
