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
#ifndef GEO_AREAS_STORAGE_HPP_
#define GEO_AREAS_STORAGE_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <string>                 // for string
#include "utils.hpp"              // for IHttpClient

using std::string;
using json = nlohmann::json;

namespace storage {

// Durable home of the raw area mapping (slug -> area record json)
class AreaStore {
 public:
    virtual ~AreaStore() = default;
    // Returns the stored mapping, or an empty object if nothing is stored yet.
    // Throws errors::HydrationFailure when storage is unreadable or corrupt.
    virtual json load() = 0;
    // Overwrites the stored mapping.
    // Throws errors::PersistenceFailure when storage is unwritable.
    virtual void save(const json& areas) = 0;
};

// Mapping kept as a JSON file on the local file system
class FileAreaStore : public AreaStore {
 public:
    explicit FileAreaStore(string path);
    json load() override;
    void save(const json& areas) override;

 private:
    string path_;
};

// Mapping kept as a single JSON object in a remote object store
class HttpAreaStore : public AreaStore {
 public:
    HttpAreaStore(utils::IHttpClient& client, string url);
    json load() override;
    void save(const json& areas) override;

 private:
    utils::IHttpClient& client_;
    string url_;
};

string stripBom(const string& text);
json parseMapping(const string& text, const string& source);

}  // namespace storage

#endif  // GEO_AREAS_STORAGE_HPP_
