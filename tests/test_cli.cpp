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
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>
#include "../geo_areas/cli.hpp"
#include "../geo_areas/config.hpp"
#include "../geo_areas/repository.hpp"
#include "memory_store.hpp"

using std::string;
using std::vector;
using std::istringstream;
using std::ostringstream;
using json = nlohmann::json;

using config::Args;
using config::parseArgs;
using repository::AreaRepository;

// Runs one command with stdin text, returning exit code and stdout json
struct CliRun {
    int code;
    json out;
    string err;
};

static CliRun run(AreaRepository& repo, const string& command,
                  vector<string> params = {}, const string& stdinText = "") {
    Args args;
    args.command = command;
    args.params = std::move(params);
    istringstream in(stdinText);
    ostringstream out, err;
    const int code = cli::runCommand(args, repo, in, out, err);
    CliRun result{code, nullptr, err.str()};
    if (!out.str().empty()) result.out = json::parse(out.str());
    return result;
}

// argv helper; strings must outlive the returned pointers
static vector<char*> argvOf(vector<string>& words) {
    vector<char*> argv;
    for (auto& w : words) argv.push_back(&w[0]);
    return argv;
}

// -----------------------------------------------------------------------------
// Tests for parseArgs
// -----------------------------------------------------------------------------

TEST_CASE("parseArgs reads flags, command and params") {
    vector<string> words{"geo_areas", "--areas-file", "/tmp/a.json", "patch", "centro", "-"};
    auto argv = argvOf(words);
    Args args;

    REQUIRE(parseArgs(static_cast<int>(argv.size()), argv.data(), &args));
    CHECK(args.areasFile == "/tmp/a.json");
    CHECK_FALSE(args.areasUrl.has_value());
    CHECK(args.command == "patch");
    CHECK(args.params == vector<string>{"centro", "-"});
}

TEST_CASE("parseArgs: --areas-url selects the remote store") {
    vector<string> words{"geo_areas", "--areas-url", "https://bucket.local/areas.json", "list"};
    auto argv = argvOf(words);
    Args args;

    REQUIRE(parseArgs(static_cast<int>(argv.size()), argv.data(), &args));
    CHECK(args.areasUrl == string("https://bucket.local/areas.json"));
}

TEST_CASE("parseArgs rejects unknown commands, wrong arity and --help") {
    vector<string> unknown{"geo_areas", "explode"};
    vector<string> missing{"geo_areas", "get"};
    vector<string> extra{"geo_areas", "list", "x"};
    vector<string> help{"geo_areas", "--help"};
    vector<string> none{"geo_areas"};

    for (auto* words : {&unknown, &missing, &extra, &help, &none}) {
        auto argv = argvOf(*words);
        Args args;
        CHECK_FALSE(parseArgs(static_cast<int>(argv.size()), argv.data(), &args));
    }
}

// -----------------------------------------------------------------------------
// Tests for runCommand
// -----------------------------------------------------------------------------

TEST_CASE("runCommand: health") {
    MemoryAreaStore store;
    AreaRepository repo(store);

    CliRun r = run(repo, "health");

    CHECK(r.code == cli::EXIT_OK);
    CHECK(r.out["status"] == "ok");
    CHECK(store.loads == 0);
}

TEST_CASE("runCommand: upsert, get and list") {
    MemoryAreaStore store;
    AreaRepository repo(store);

    CliRun saved = run(repo, "upsert", {"-"}, squareAreaJson("centro").dump());
    CHECK(saved.code == cli::EXIT_OK);
    CHECK(saved.out["message"] == "Area 'centro' saved.");

    CliRun got = run(repo, "get", {"centro"});
    CHECK(got.code == cli::EXIT_OK);
    CHECK(got.out["slug"] == "centro");
    CHECK(got.out["polygons"][0]["type"] == "Polygon");

    CliRun listed = run(repo, "list");
    REQUIRE(listed.out.size() == 1);
    CHECK(listed.out[0]["polygon_count"] == 1);
    CHECK(listed.out[0]["total_points"] == 4);
}

TEST_CASE("runCommand: upsert validates slug and relevance") {
    MemoryAreaStore store;
    AreaRepository repo(store);

    CHECK(run(repo, "upsert", {"-"}, squareAreaJson("Bad-Slug").dump()).code == cli::EXIT_INVALID);
    CHECK(run(repo, "upsert", {"-"}, squareAreaJson("ok", "X", 42).dump()).code == cli::EXIT_INVALID);
    CHECK(run(repo, "upsert", {"-"}, "{broken").code == cli::EXIT_INVALID);
    CHECK(repo.size() == 0);
}

TEST_CASE("runCommand: upsert with a short ring is invalid geometry") {
    MemoryAreaStore store;
    AreaRepository repo(store);
    json area = squareAreaJson("curta");
    area["polygons"][0]["coordinates"][0].erase(0);
    area["polygons"][0]["coordinates"][0].erase(0);

    CliRun r = run(repo, "upsert", {"-"}, area.dump());

    CHECK(r.code == cli::EXIT_INVALID);
    CHECK(r.err.find("[error]") == 0);
}

TEST_CASE("runCommand: patch renames and reports the merged area") {
    MemoryAreaStore store;
    store.data["a"] = squareAreaJson("a");
    AreaRepository repo(store);

    CliRun r = run(repo, "patch", {"a", "-"}, R"({"slug": "b", "relevancia": 9})");

    CHECK(r.code == cli::EXIT_OK);
    CHECK(r.out["area"]["slug"] == "b");
    CHECK(r.out["area"]["relevancia"] == 9);
    CHECK(run(repo, "get", {"a"}).code == cli::EXIT_NOT_FOUND);
    CHECK(run(repo, "get", {"b"}).code == cli::EXIT_OK);
}

TEST_CASE("runCommand: patch errors map to exit codes") {
    MemoryAreaStore store;
    store.data["a"] = squareAreaJson("a");
    store.data["b"] = squareAreaJson("b");
    AreaRepository repo(store);

    CHECK(run(repo, "patch", {"zzz", "-"}, "{}").code == cli::EXIT_NOT_FOUND);
    CHECK(run(repo, "patch", {"a", "-"}, R"({"slug": "b"})").code == cli::EXIT_CONFLICT);
    CHECK(run(repo, "patch", {"a", "-"}, R"({"slug": "B!"})").code == cli::EXIT_INVALID);
}

TEST_CASE("runCommand: delete") {
    MemoryAreaStore store;
    store.data["a"] = squareAreaJson("a");
    AreaRepository repo(store);

    CHECK(run(repo, "delete", {"missing_slug"}).code == cli::EXIT_NOT_FOUND);
    CHECK(run(repo, "delete", {"a"}).code == cli::EXIT_OK);
    CHECK(repo.size() == 0);
}

TEST_CASE("runCommand: analyze prints results and errors") {
    MemoryAreaStore store;
    store.data["centro"] = squareAreaJson("centro");
    AreaRepository repo(store);

    CliRun r = run(repo, "analyze", {"-"},
                   R"({"target": {"lat": -23.555, "lng": -46.630}, "areas": ["centro", "missing"]})");

    CHECK(r.code == cli::EXIT_OK);
    REQUIRE(r.out["results"].size() == 1);
    CHECK(r.out["results"][0]["is_in"] == true);
    CHECK(r.out["errors"][0] == "Area 'missing' not found.");
}

TEST_CASE("runCommand: analyze without areas or agencias is invalid") {
    MemoryAreaStore store;
    AreaRepository repo(store);

    CliRun r = run(repo, "analyze", {"-"}, R"({"target": {"lat": 0, "lng": 0}})");

    CHECK(r.code == cli::EXIT_INVALID);
}

TEST_CASE("runCommand: unreadable storage is a hydration exit") {
    MemoryAreaStore store;
    store.failLoad = true;
    AreaRepository repo(store);

    CHECK(run(repo, "list").code == cli::EXIT_HYDRATION);
}
