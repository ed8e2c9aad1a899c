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

// main.cpp

// 1. Project headers
#include "main.h"

// 2. C++ system headers
#include <exception>
#include <iostream>
#include <memory>

// 3. Other library headers
#include "cli.hpp"
#include "config.hpp"
#include "repository.hpp"
#include "storage.hpp"
#include "utils.hpp"

using std::cerr;
using std::exception;
using std::make_unique;
using std::unique_ptr;

int main(int argc, char** argv) {
    config::Args args = config::argsFromEnvironment();
    if (!config::parseArgs(argc, argv, &args)) {
        config::usage(argv[0]);
        return 1;
    }

    try {
        // 1) Pick durable storage
        unique_ptr<utils::CurlHttpClient> http;
        unique_ptr<storage::AreaStore> store;
        if (args.areasUrl) {
            http = make_unique<utils::CurlHttpClient>();
            store = make_unique<storage::HttpAreaStore>(*http, *args.areasUrl);
            cerr << "[info] Area store: " << *args.areasUrl << "\n";
        } else {
            store = make_unique<storage::FileAreaStore>(args.areasFile);
            cerr << "[info] Area store: " << args.areasFile << "\n";
        }

        // 2) Repository hydrates lazily on first use
        repository::AreaRepository repo(*store);

        // 3) Run the command
        return cli::runCommand(args, repo, std::cin, std::cout, cerr);
    } catch (const exception& e) {
        cerr << "[error] Fatal: " << e.what() << "\n";
        return 1;
    }
}
