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
#include "cli.hpp"
#include <fstream>                                  // for ifstream
#include <iostream>                                 // for istream, ostream
#include <nlohmann/json.hpp>                        // for basic_json
#include <sstream>                                  // for ostringstream
#include <string>                                   // for string
#include "analysis.hpp"
#include "area.hpp"
#include "errors.hpp"
#include "storage.hpp"

using std::ifstream;
using std::istream;
using std::ostream;
using std::ostringstream;
using std::string;
using json = nlohmann::json;

using area::Area;
using area::AreaPatch;
using errors::InvalidRequest;

namespace cli {
    // Reads a json document from a file path, or from in when source is "-"
    json readInput(const string& source, istream& in) {
        ostringstream contents;
        if (source == "-") {
            contents << in.rdbuf();
        } else {
            ifstream file(source, std::ios::binary);
            if (!file) throw InvalidRequest("Failed to open input: " + source);
            contents << file.rdbuf();
        }
        try {
            return json::parse(storage::stripBom(contents.str()));
        } catch (const json::parse_error& e) {
            throw InvalidRequest("Invalid JSON in " + source + ": " + e.what());
        }
    }

    static json message(const string& text) {
        return json{{"message", text}};
    }

    static json dispatch(const config::Args& args, repository::AreaRepository& repo, istream& in) {
        const string& command = args.command;
        const auto& params = args.params;

        if (command == "health") return json{{"status", "ok"}};

        if (command == "analyze") {
            const auto request = readInput(params[0], in).get<analysis::AnalysisRequest>();
            return analysis::analyze(repo, request);
        }

        if (command == "list") return repo.listAll();

        if (command == "get") {
            const auto raw = repo.getRaw(params[0]);
            if (!raw) throw errors::NotFound("Area '" + params[0] + "' not found.");
            return *raw;
        }

        if (command == "upsert") {
            const Area record = readInput(params[0], in).get<Area>();
            area::validateArea(record);
            repo.upsert(record);
            return message("Area '" + record.slug + "' saved.");
        }

        if (command == "patch") {
            const string& slug = params[0];
            const AreaPatch changes = readInput(params[1], in).get<AreaPatch>();
            const Area updated = repo.patch(slug, changes, area::validateArea);
            json reply = message("Area '" + slug + "' updated.");
            reply["area"] = updated;
            return reply;
        }

        if (command == "delete") {
            if (!repo.remove(params[0])) throw errors::NotFound("Area '" + params[0] + "' not found.");
            return message("Area '" + params[0] + "' removed.");
        }

        throw InvalidRequest("Unknown command: " + command);
    }

    // Runs one command against repo, printing json to out and failures to err
    //
    // Args:
    //    args: parsed command line
    //    repo: the area repository
    //    in: stdin, for "-" inputs
    //    out: where the json reply goes
    //    err: where diagnostics go
    // Returns:
    //    process exit code
    int runCommand(const config::Args& args, repository::AreaRepository& repo,
                   istream& in, ostream& out, ostream& err) {
        try {
            out << dispatch(args, repo, in).dump(2) << "\n";
            return EXIT_OK;
        } catch (const errors::NotFound& e) {
            err << "[error] " << e.what() << "\n";
            return EXIT_NOT_FOUND;
        } catch (const errors::Conflict& e) {
            err << "[error] " << e.what() << "\n";
            return EXIT_CONFLICT;
        } catch (const errors::InvalidGeometry& e) {
            err << "[error] " << e.what() << "\n";
            return EXIT_INVALID;
        } catch (const errors::InvalidRequest& e) {
            err << "[error] " << e.what() << "\n";
            return EXIT_INVALID;
        } catch (const errors::HydrationFailure& e) {
            err << "[error] " << e.what() << "\n";
            return EXIT_HYDRATION;
        } catch (const errors::AreaError& e) {
            err << "[error] " << e.what() << "\n";
            return EXIT_FAILURE_GENERIC;
        }
    }
}  // namespace cli
