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
#include "config.hpp"
#include <cstdlib>   // for getenv
#include <iostream>  // for cerr
#include <map>       // for map
#include <string>    // for string
#include "main.h"

using std::cerr;
using std::map;
using std::string;

namespace config {
    // Defaults from AREAS_FILE / AREAS_URL
    Args argsFromEnvironment() {
        Args args;
        const char* file = std::getenv(AREAS_FILE_ENV);
        args.areasFile = (file && *file) ? file : DEFAULT_AREAS_FILE;
        const char* url = std::getenv(AREAS_URL_ENV);
        if (url && *url) args.areasUrl = string(url);
        return args;
    }

    // Number of positional parameters a command takes, -1 if unknown
    int expectedParams(const string& command) {
        static const map<string, int> commands = {
            {"health", 0}, {"list", 0},
            {"get", 1}, {"upsert", 1}, {"delete", 1}, {"analyze", 1},
            {"patch", 2},
        };
        auto it = commands.find(command);
        return it == commands.end() ? -1 : it->second;
    }

    // Fills out from argv; flags override environment defaults
    //
    // Args:
    //    argc, argv: the process arguments
    //    out: args to fill, preloaded with defaults
    // Returns:
    //    false when usage should be printed
    bool parseArgs(int argc, char** argv, Args* out) {
        for (int i = 1; i < argc; ++i) {
            string a(argv[i]);
            if (a == "--areas-file" && i + 1 < argc) {
                (*out).areasFile = argv[++i];
                (*out).areasUrl.reset();
            } else if (a == "--areas-url" && i + 1 < argc) {
                (*out).areasUrl = string(argv[++i]);
            } else if (a == "--help" || a == "-h") {
                return false;
            } else if ((*out).command.empty() && a.rfind("--", 0) != 0) {
                (*out).command = a;
            } else if (!(*out).command.empty()) {
                (*out).params.push_back(a);
            } else {
                cerr << "[error] Unknown option: " << a << "\n";
                return false;
            }
        }
        const int expected = expectedParams((*out).command);
        if (expected < 0) return false;
        return static_cast<int>((*out).params.size()) == expected;
    }

    void usage(const char* exe) {
        cerr << "Usage:\n"
        << "  " << exe << " [--areas-file PATH | --areas-url URL] <command>\n"
        << "Commands:\n"
        << "  analyze <request.json|->     point-in-area and border distance\n"
        << "  list                         area summaries\n"
        << "  get <slug>                   raw area record\n"
        << "  upsert <area.json|->         create or replace an area\n"
        << "  patch <slug> <patch.json|->  change some fields of an area\n"
        << "  delete <slug>                remove an area\n"
        << "  health\n"
        << "Environment: " << AREAS_FILE_ENV << " (default " << DEFAULT_AREAS_FILE << "), "
        << AREAS_URL_ENV << "\n";
    }
}  // namespace config
