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
#include "repository.hpp"
#include <functional>                               // for function
#include <iostream>                                 // for cerr
#include <map>                                      // for map
#include <memory>                                   // for make_shared
#include <mutex>                                    // for lock_guard
#include <nlohmann/json.hpp>                        // for basic_json
#include <set>                                      // for set
#include <string>                                   // for string
#include <utility>                                  // for move
#include <vector>                                   // for vector
#include "errors.hpp"

using std::cerr;
using std::lock_guard;
using std::make_shared;
using std::map;
using std::optional;
using std::recursive_mutex;
using std::set;
using std::string;
using std::vector;
using json = nlohmann::json;

using area::Area;
using area::AreaPatch;
using area::AreaSummary;
using geometry::CompiledGeometry;

namespace repository {
    static GeometryPtr compile(const Area& area) {
        return make_shared<const CompiledGeometry>(geometry::buildGeometry(area.polygons));
    }

    AreaRepository::AreaRepository(storage::AreaStore& store) : store_(store) {}

    // Loads raw records from the store and compiles every geometry, once.
    // State is installed only if every record compiles, so a failed
    // hydration leaves the repository empty and it is retried on next use.
    //
    // Throws:
    //    HydrationFailure when the store can't be read or a record is bad
    void AreaRepository::ensureHydrated() {
        lock_guard<recursive_mutex> lock(mutex_);
        if (hydrated_) return;

        const json stored = store_.load();

        map<string, Area> raw;
        map<string, GeometryPtr> geometries;
        for (const auto& item : stored.items()) {
            const string slug = item.key();
            try {
                Area record = item.value().get<Area>();
                // the mapping key is the identity
                record.slug = slug;
                geometries.emplace(slug, compile(record));
                raw.emplace(slug, std::move(record));
            } catch (const errors::AreaError& e) {
                throw errors::HydrationFailure("Area '" + slug + "' could not be hydrated: " + e.what());
            }
        }

        raw_.swap(raw);
        geometries_.swap(geometries);
        hydrated_ = true;
        cerr << "[info] Areas hydrated: " << raw_.size() << "\n";
    }

    bool AreaRepository::hydrated() {
        lock_guard<recursive_mutex> lock(mutex_);
        return hydrated_;
    }

    // Creates or overwrites an area. Geometry is compiled before any state
    // changes, so an InvalidGeometry leaves the repository untouched.
    void AreaRepository::upsert(const Area& area) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();

        GeometryPtr compiled = compile(area);
        raw_[area.slug] = area;
        geometries_[area.slug] = std::move(compiled);
        persist();
    }

    // Merges changes over the stored record, renaming it when the slug changes
    //
    // Args:
    //    slug: the area to change
    //    changes: fields to overwrite
    // Returns:
    //    the merged record
    // Throws:
    //    NotFound, Conflict, InvalidGeometry
    Area AreaRepository::patch(const string& slug, const AreaPatch& changes,
                               const std::function<void(const Area&)>& validate) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();

        const string oldSlug = slug;
        auto it = raw_.find(oldSlug);
        if (it == raw_.end()) throw errors::NotFound("Area '" + oldSlug + "' not found.");
        if (changes.slug && *changes.slug != oldSlug && raw_.count(*changes.slug) > 0)
            throw errors::Conflict("Area '" + *changes.slug + "' already exists.");

        Area merged = area::applyPatch(it->second, changes);
        if (validate) validate(merged);
        GeometryPtr compiled = compile(merged);

        if (merged.slug != oldSlug) {
            raw_.erase(it);
            geometries_.erase(oldSlug);
        }
        raw_[merged.slug] = merged;
        geometries_[merged.slug] = std::move(compiled);
        persist();
        return merged;
    }

    // Returns true if slug existed and was removed
    bool AreaRepository::remove(const string& slug) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();

        if (raw_.erase(slug) == 0) return false;
        geometries_.erase(slug);
        persist();
        return true;
    }

    GeometryPtr AreaRepository::getGeometry(const string& slug) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();
        auto it = geometries_.find(slug);
        if (it == geometries_.end()) return nullptr;
        return it->second;
    }

    optional<Area> AreaRepository::getRaw(const string& slug) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();
        auto it = raw_.find(slug);
        if (it == raw_.end()) return std::nullopt;
        return it->second;
    }

    optional<AreaEntry> AreaRepository::getEntry(const string& slug) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();
        auto rawIt = raw_.find(slug);
        auto geomIt = geometries_.find(slug);
        if (rawIt == raw_.end() || geomIt == geometries_.end()) return std::nullopt;
        return AreaEntry{rawIt->second, geomIt->second};
    }

    // Slugs whose agency matches any of names, ignoring case and
    // surrounding whitespace. Order is unspecified.
    vector<string> AreaRepository::findByAgency(const vector<string>& names) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();

        set<string> keys;
        for (const auto& name : names) {
            string key = area::agencyKey(name);
            if (!key.empty()) keys.insert(std::move(key));
        }

        vector<string> slugs;
        if (keys.empty()) return slugs;
        for (const auto& kv : raw_) {
            if (keys.count(area::agencyKey(kv.second.agency)) > 0) slugs.push_back(kv.first);
        }
        return slugs;
    }

    vector<AreaSummary> AreaRepository::listAll() {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();
        vector<AreaSummary> summaries;
        summaries.reserve(raw_.size());
        for (const auto& kv : raw_) summaries.push_back(area::summarize(kv.second));
        return summaries;
    }

    bool AreaRepository::exists(const string& slug) {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();
        return raw_.count(slug) > 0;
    }

    size_t AreaRepository::size() {
        lock_guard<recursive_mutex> lock(mutex_);
        ensureHydrated();
        return raw_.size();
    }

    // Writes the full raw mapping. A failed write is logged and the
    // in-memory state stays authoritative. Caller holds the lock.
    void AreaRepository::persist() {
        json mapping = json::object();
        for (const auto& kv : raw_) mapping[kv.first] = kv.second;
        try {
            store_.save(mapping);
        } catch (const errors::PersistenceFailure& e) {
            cerr << "[warn] Areas not persisted, keeping in-memory state: " << e.what() << "\n";
        }
    }
}  // namespace repository
