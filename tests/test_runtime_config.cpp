#include "app/runtime_config.hpp"

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace {

namespace fs = std::filesystem;

void Assert(bool condition, const std::string& message, int& failures) {
    if (!condition) {
        std::cerr << "test failure: " << message << '\n';
        ++failures;
    }
}

template <typename Fn>
void ExpectThrow(Fn&& fn, const std::string& message, int& failures) {
    try {
        fn();
    } catch (const std::runtime_error& ex) {
        std::cout << "expected error: " << ex.what() << '\n';
        return;
    }
    Assert(false, message, failures);
}

void WriteText(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot write fixture " + path.string());
    }
    out << text;
}

class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / "pointsprite_runtime_config_test") {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

void TestLoadsRelativeScript(const fs::path& root, int& failures) {
    WriteText(root / "scripts" / "particle_logic.lua", "-- fixture\n");
    WriteText(root / "runtime.json",
              R"({"lua_script": "scripts/particle_logic.lua", "window_width": 640,
                  "window_height": 480, "particle_count": 500})");

    auto config = pointsprite::app::LoadRuntimeConfigFromJson(root / "runtime.json", false);
    Assert(config.scriptPath == fs::weakly_canonical(root / "scripts" / "particle_logic.lua"),
           "lua_script resolves against the config directory", failures);
    Assert(config.width == 640 && config.height == 480, "window size is read", failures);
    Assert(config.particleCount && *config.particleCount == 500, "particle_count is read", failures);
}

void TestDefaultsAndProjectRoot(const fs::path& root, int& failures) {
    WriteText(root / "project" / "scripts" / "particle_logic.lua", "-- fixture\n");
    WriteText(root / "configs" / "runtime.json",
              R"({"lua_script": "scripts/particle_logic.lua", "project_root": "../project"})");

    auto config = pointsprite::app::LoadRuntimeConfigFromJson(root / "configs" / "runtime.json", false);
    Assert(config.scriptPath == fs::weakly_canonical(root / "project" / "scripts" / "particle_logic.lua"),
           "project_root anchors relative script paths", failures);
    Assert(config.width == pointsprite::app::kWidth && config.height == pointsprite::app::kHeight,
           "window size falls back to defaults", failures);
    Assert(!config.particleCount, "particle_count is optional", failures);
}

void TestRejectsBadInput(const fs::path& root, int& failures) {
    WriteText(root / "bad" / "scripts" / "particle_logic.lua", "-- fixture\n");
    WriteText(root / "bad" / "no_script.json", R"({"window_width": 10})");
    WriteText(root / "bad" / "negative.json",
              R"({"lua_script": "scripts/particle_logic.lua", "window_width": -3})");
    WriteText(root / "bad" / "zero_particles.json",
              R"({"lua_script": "scripts/particle_logic.lua", "particle_count": 0})");
    WriteText(root / "bad" / "broken.json", R"({"lua_script": )");
    WriteText(root / "bad" / "array.json", R"([1, 2, 3])");
    WriteText(root / "bad" / "missing_script.json", R"({"lua_script": "scripts/nope.lua"})");
    WriteText(root / "bad" / "too_wide.json",
              R"({"lua_script": "scripts/particle_logic.lua", "window_width": 3000000000})");
    WriteText(root / "bad" / "fractional.json",
              R"({"lua_script": "scripts/particle_logic.lua", "window_height": 480.5})");
    WriteText(root / "bad" / "numeric_root.json",
              R"({"lua_script": "scripts/particle_logic.lua", "project_root": 3})");

    auto load = [&](const char* name) {
        return pointsprite::app::LoadRuntimeConfigFromJson(root / "bad" / name, false);
    };
    ExpectThrow([&] { load("no_script.json"); }, "lua_script is required", failures);
    ExpectThrow([&] { load("negative.json"); }, "negative window size is rejected", failures);
    ExpectThrow([&] { load("zero_particles.json"); }, "zero particle_count is rejected", failures);
    ExpectThrow([&] { load("broken.json"); }, "malformed JSON is rejected", failures);
    ExpectThrow([&] { load("array.json"); }, "non-object root is rejected", failures);
    ExpectThrow([&] { load("missing_script.json"); }, "missing Lua script is rejected", failures);
    ExpectThrow([&] { load("absent.json"); }, "missing config file is rejected", failures);
    ExpectThrow([&] { load("too_wide.json"); }, "width beyond int range is rejected", failures);
    ExpectThrow([&] { load("fractional.json"); }, "fractional height is rejected", failures);
    ExpectThrow([&] { load("numeric_root.json"); }, "non-string project_root is rejected", failures);

    WriteText(root / "bad" / "widest.json",
              R"({"lua_script": "scripts/particle_logic.lua", "window_width": 2147483647})");
    auto widest = load("widest.json");
    Assert(widest.width == pointsprite::app::kMaxWindowDimension, "int max width is accepted", failures);
}

void TestSeedJsonRoundTrip(const fs::path& root, int& failures) {
    WriteText(root / "seed" / "scripts" / "particle_logic.lua", "-- fixture\n");
    pointsprite::app::RuntimeConfig config;
    config.width = 800;
    config.height = 600;
    config.particleCount = 2048;
    config.scriptPath = fs::weakly_canonical(root / "seed" / "scripts" / "particle_logic.lua");

    auto seedPath = root / "seed" / "out" / "seed.json";
    pointsprite::app::WriteRuntimeConfigJson(config, seedPath);
    Assert(fs::exists(seedPath), "seed JSON is written, creating directories", failures);

    std::ifstream seedStream(seedPath);
    rapidjson::IStreamWrapper seedWrapper(seedStream);
    rapidjson::Document seed;
    seed.ParseStream(seedWrapper);
    Assert(!seed.HasParseError() && seed.IsObject(), "seed JSON parses", failures);
    if (!seed.HasParseError() && seed.IsObject()) {
        const std::set<std::string> documented = {"lua_script", "project_root", "window_width", "window_height",
                                                  "particle_count"};
        for (auto member = seed.MemberBegin(); member != seed.MemberEnd(); ++member) {
            Assert(documented.count(member->name.GetString()) == 1,
                   std::string("seed JSON writes only loader keys, found ") + member->name.GetString(), failures);
        }
        Assert(seed.HasMember("lua_script") && seed["lua_script"].IsString() &&
                   std::string(seed["lua_script"].GetString()) == "scripts/particle_logic.lua",
               "lua_script is written relative to project_root", failures);
    }

    auto loaded = pointsprite::app::LoadRuntimeConfigFromJson(seedPath, false);
    Assert(loaded.scriptPath == config.scriptPath, "seed JSON keeps the script path", failures);
    Assert(loaded.width == 800 && loaded.height == 600, "seed JSON keeps the window size", failures);
    Assert(loaded.particleCount && *loaded.particleCount == 2048, "seed JSON keeps particle_count", failures);
}

void TestDefaultConfigPath(const fs::path& root, int& failures) {
#ifndef _WIN32
    setenv("XDG_CONFIG_HOME", root.string().c_str(), 1);
    auto path = pointsprite::app::GetDefaultConfigPath();
    Assert(path && *path == root / "pointsprite" / "default_runtime.json",
           "default config lives under XDG_CONFIG_HOME", failures);
#else
    (void)root;
    (void)failures;
#endif
}

} // namespace

int main() {
    int failures = 0;
    try {
        TempDir temp;
        TestLoadsRelativeScript(temp.path(), failures);
        TestDefaultsAndProjectRoot(temp.path(), failures);
        TestRejectsBadInput(temp.path(), failures);
        TestSeedJsonRoundTrip(temp.path(), failures);
        TestDefaultConfigPath(temp.path(), failures);
    } catch (const std::exception& ex) {
        std::cerr << "exception during tests: " << ex.what() << '\n';
        return 1;
    }

    if (failures == 0) {
        std::cout << "runtime_config_tests: PASSED\n";
    } else {
        std::cerr << "runtime_config_tests: FAILED (" << failures << " errors)\n";
    }
    return failures;
}
