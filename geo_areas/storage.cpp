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
#include "storage.hpp"
#include <filesystem>                               // for path, exists, create_directories, rename
#include <fstream>                                  // for ifstream, ofstream
#include <nlohmann/json.hpp>                        // for basic_json, parse_error
#include <sstream>                                  // for ostringstream
#include <stdexcept>                                // for runtime_error
#include <string>                                   // for string
#include <system_error>                             // for error_code
#include <utility>                                  // for move
#include "errors.hpp"

using std::string;
using std::ifstream;
using std::ofstream;
using std::ostringstream;
using std::error_code;
using json = nlohmann::json;

using errors::HydrationFailure;
using errors::PersistenceFailure;

namespace fs = std::filesystem;

namespace storage {
    const char UTF8_BOM[] = "\xEF\xBB\xBF";
    const char JSON_CONTENT_TYPE[] = "application/json; charset=utf-8";

    // Drops a leading UTF-8 byte-order mark (common when edited on Windows)
    string stripBom(const string& text) {
        const string bom(UTF8_BOM);
        if (text.compare(0, bom.size(), bom) == 0) return text.substr(bom.size());
        return text;
    }

    // Parses stored text into the slug -> record mapping
    //
    // Args:
    //    text: stored json text, BOM allowed
    //    source: where the text came from, for error messages
    // Returns:
    //    json object (empty when text is blank)
    json parseMapping(const string& text, const string& source) {
        const string body = stripBom(text);
        if (body.find_first_not_of(" \t\r\n") == string::npos) return json::object();
        json mapping;
        try {
            mapping = json::parse(body);
        } catch (const json::parse_error& e) {
            throw HydrationFailure("Corrupt areas data in " + source + ": " + e.what());
        }
        if (!mapping.is_object())
            throw HydrationFailure("Corrupt areas data in " + source + ": expected an object keyed by slug.");
        return mapping;
    }

    FileAreaStore::FileAreaStore(string path) : path_(std::move(path)) {}

    json FileAreaStore::load() {
        error_code ec;
        if (!fs::exists(path_, ec)) {
            if (ec) throw HydrationFailure("Cannot access areas file " + path_ + ": " + ec.message());
            return json::object();
        }
        ifstream in(path_, std::ios::binary);
        if (!in) throw HydrationFailure("Failed to open areas file: " + path_);
        ostringstream contents;
        contents << in.rdbuf();
        if (in.bad()) throw HydrationFailure("Failed to read areas file: " + path_);
        return parseMapping(contents.str(), path_);
    }

    void FileAreaStore::save(const json& areas) {
        string text;
        try {
            text = areas.dump(2);
        } catch (const json::type_error& e) {
            throw PersistenceFailure(string("Cannot serialize areas: ") + e.what());
        }

        const fs::path target(path_);
        if (target.has_parent_path()) {
            error_code ec;
            fs::create_directories(target.parent_path(), ec);
            if (ec) throw PersistenceFailure("Cannot create directory for " + path_ + ": " + ec.message());
        }
        // write beside the target, then swap it in so readers never see a partial file
        const string tmp = path_ + ".tmp";
        {
            ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) throw PersistenceFailure("Failed to open areas file for writing: " + tmp);
            out << text << "\n";
            out.flush();
            if (!out) {
                out.close();
                error_code ignored;
                fs::remove(tmp, ignored);
                throw PersistenceFailure("Failed to write areas file: " + tmp);
            }
        }
        error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            error_code ignored;
            fs::remove(tmp, ignored);
            throw PersistenceFailure("Failed to replace areas file " + path_ + ": " + ec.message());
        }
    }

    HttpAreaStore::HttpAreaStore(utils::IHttpClient& client, string url)
        : client_(client), url_(std::move(url)) {}

    json HttpAreaStore::load() {
        utils::HttpResponse resp;
        try {
            resp = client_.get(url_);
        } catch (const std::runtime_error& e) {
            throw HydrationFailure("Failed to fetch areas from " + url_ + ": " + e.what());
        }
        // nothing stored yet
        if (resp.status == 404) return json::object();
        if (resp.status < 200 || resp.status >= 300) {
            ostringstream oss;
            oss << "HTTP " << resp.status << " fetching areas from " << url_;
            throw HydrationFailure(oss.str());
        }
        return parseMapping(resp.body, url_);
    }

    void HttpAreaStore::save(const json& areas) {
        string text;
        try {
            text = areas.dump();
        } catch (const json::type_error& e) {
            throw PersistenceFailure(string("Cannot serialize areas: ") + e.what());
        }

        utils::HttpResponse resp;
        try {
            resp = client_.put(url_, text, JSON_CONTENT_TYPE);
        } catch (const std::runtime_error& e) {
            throw PersistenceFailure("Failed to store areas at " + url_ + ": " + e.what());
        }
        if (resp.status < 200 || resp.status >= 300) {
            ostringstream oss;
            oss << "HTTP " << resp.status << " storing areas at " << url_;
            throw PersistenceFailure(oss.str());
        }
    }
}  // namespace storage
