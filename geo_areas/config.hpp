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
#ifndef GEO_AREAS_CONFIG_HPP_
#define GEO_AREAS_CONFIG_HPP_

#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

using std::optional;
using std::string;
using std::vector;

namespace config {

// Command line, after environment defaults
struct Args {
    string areasFile;
    optional<string> areasUrl;  // remote store; wins over areasFile
    string command;
    vector<string> params;
};

Args argsFromEnvironment();
int expectedParams(const string& command);
bool parseArgs(int argc, char** argv, Args* out);
void usage(const char* exe);

}  // namespace config

#endif  // GEO_AREAS_CONFIG_HPP_
