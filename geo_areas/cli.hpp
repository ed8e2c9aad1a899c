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
#ifndef GEO_AREAS_CLI_HPP_
#define GEO_AREAS_CLI_HPP_

#include <iosfwd>                 // for istream, ostream
#include <nlohmann/json_fwd.hpp>  // for json
#include <string>                 // for string
#include "config.hpp"             // for Args
#include "repository.hpp"         // for AreaRepository

using std::string;
using json = nlohmann::json;

namespace cli {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILURE_GENERIC = 1,
    EXIT_INVALID = 2,
    EXIT_NOT_FOUND = 3,
    EXIT_CONFLICT = 4,
    EXIT_HYDRATION = 5,
};

json readInput(const string& source, std::istream& in);
int runCommand(const config::Args& args, repository::AreaRepository& repo,
               std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace cli

#endif  // GEO_AREAS_CLI_HPP_
