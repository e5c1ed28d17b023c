#include "app/runtime_config.hpp"
#include "app/trace.hpp"

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace pointsprite::app {

namespace {

namespace fs = std::filesystem;

constexpr const char* kScriptKey = "lua_script";
constexpr const char* kProjectRootKey = "project_root";
constexpr const char* kWidthKey = "window_width";
constexpr const char* kHeightKey = "window_height";
constexpr const char* kParticleCountKey = "particle_count";

rapidjson::Document ParseConfigDocument(const fs::path& configPath) {
    std::ifstream configStream(configPath);
    if (!configStream) {
        throw std::runtime_error("Failed to open config file: " + configPath.string());
    }
    rapidjson::IStreamWrapper inputWrapper(configStream);
    rapidjson::Document document;
    document.ParseStream(inputWrapper);
    if (document.HasParseError()) {
        throw std::runtime_error("Failed to parse JSON config at " + configPath.string() + " (offset " +
                                 std::to_string(document.GetErrorOffset()) + ")");
    }
    if (!document.IsObject()) {
        throw std::runtime_error("JSON config must contain an object at the root: " + configPath.string());
    }
    return document;
}

// Absent members yield nullopt; present ones must be integers in [minValue, maxValue].
std::optional<uint32_t> ReadBoundedUint(const rapidjson::Value& object, const char* key, uint32_t minValue,
                                        uint32_t maxValue) {
    auto member = object.FindMember(key);
    if (member == object.MemberEnd()) {
        return std::nullopt;
    }
    const rapidjson::Value& value = member->value;
    if (value.IsUint() && value.GetUint() >= minValue && value.GetUint() <= maxValue) {
        return value.GetUint();
    }
    throw std::runtime_error(std::string("JSON member '") + key + "' must be an integer in [" +
                             std::to_string(minValue) + ", " + std::to_string(maxValue) + "]");
}

fs::path ResolveScriptPath(const rapidjson::Value& object, const fs::path& configPath) {
    auto script = object.FindMember(kScriptKey);
    if (script == object.MemberEnd() || !script->value.IsString()) {
        throw std::runtime_error(std::string("JSON config requires a string member '") + kScriptKey + "'");
    }

    fs::path base = configPath.parent_path();
    auto root = object.FindMember(kProjectRootKey);
    if (root != object.MemberEnd()) {
        if (!root->value.IsString()) {
            throw std::runtime_error(std::string("JSON member '") + kProjectRootKey + "' must be a string");
        }
        base /= fs::path(root->value.GetString());
    }

    fs::path scriptPath = fs::weakly_canonical(base / fs::path(script->value.GetString()));
    if (!fs::exists(scriptPath)) {
        throw std::runtime_error("Lua script not found at " + scriptPath.string());
    }
    return scriptPath;
}

} // namespace

std::filesystem::path FindScriptPath(const char* argv0) {
    fs::path executableDir = fs::current_path();
    if (argv0 && *argv0 != '\0') {
        executableDir = fs::weakly_canonical(fs::absolute(argv0)).parent_path();
    }
    fs::path scriptPath = executableDir / "scripts" / "particle_logic.lua";
    if (!fs::exists(scriptPath)) {
        throw std::runtime_error("Could not find Lua script at " + scriptPath.string());
    }
    return scriptPath;
}

RuntimeConfig GenerateDefaultRuntimeConfig(const char* argv0) {
    TRACE_FUNCTION();
    RuntimeConfig config;
    config.scriptPath = FindScriptPath(argv0);
    return config;
}

RuntimeConfig LoadRuntimeConfigFromJson(const std::filesystem::path& configPath, bool dumpConfig) {
    TRACE_FUNCTION();
    TRACE_VAR(configPath);
    rapidjson::Document document = ParseConfigDocument(configPath);

    if (dumpConfig) {
        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        document.Accept(writer);
        std::cout << "Loaded runtime config (" << configPath << "):\n" << buffer.GetString() << '\n';
    }

    RuntimeConfig config;
    config.scriptPath = ResolveScriptPath(document, configPath);
    config.width = ReadBoundedUint(document, kWidthKey, 0, kMaxWindowDimension).value_or(kWidth);
    config.height = ReadBoundedUint(document, kHeightKey, 0, kMaxWindowDimension).value_or(kHeight);
    config.particleCount =
        ReadBoundedUint(document, kParticleCountKey, 1, std::numeric_limits<uint32_t>::max());
    TRACE_VAR(config.scriptPath);
    return config;
}

void WriteRuntimeConfigJson(const RuntimeConfig& runtimeConfig, const std::filesystem::path& configPath) {
    TRACE_FUNCTION();
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();
    auto text = [&](const fs::path& path) { return rapidjson::Value(path.generic_string().c_str(), allocator); };

    // scripts/<name>.lua under the project root when the layout allows it.
    fs::path projectRoot = runtimeConfig.scriptPath.parent_path().parent_path();
    if (!projectRoot.empty() && runtimeConfig.scriptPath.is_absolute()) {
        document.AddMember(rapidjson::StringRef(kProjectRootKey), text(projectRoot), allocator);
        document.AddMember(rapidjson::StringRef(kScriptKey),
                           text(runtimeConfig.scriptPath.lexically_relative(projectRoot)), allocator);
    } else {
        document.AddMember(rapidjson::StringRef(kScriptKey), text(runtimeConfig.scriptPath), allocator);
    }
    document.AddMember(rapidjson::StringRef(kWidthKey), runtimeConfig.width, allocator);
    document.AddMember(rapidjson::StringRef(kHeightKey), runtimeConfig.height, allocator);
    if (runtimeConfig.particleCount) {
        document.AddMember(rapidjson::StringRef(kParticleCountKey), *runtimeConfig.particleCount, allocator);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    document.Accept(writer);

    if (auto parentDir = configPath.parent_path(); !parentDir.empty()) {
        fs::create_directories(parentDir);
    }
    std::ofstream outFile(configPath);
    if (!outFile) {
        throw std::runtime_error("Failed to open config output file: " + configPath.string());
    }
    outFile << buffer.GetString() << '\n';
    std::cout << "Wrote runtime config to " << configPath << '\n';
}

std::optional<std::filesystem::path> GetUserConfigDirectory() {
#ifdef _WIN32
    const char* appData = std::getenv("APPDATA");
    if (appData && *appData != '\0') {
        return fs::path(appData) / "pointsprite";
    }
#else
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig != '\0') {
        return fs::path(xdgConfig) / "pointsprite";
    }
    const char* home = std::getenv("HOME");
    if (home && *home != '\0') {
        return fs::path(home) / ".config" / "pointsprite";
    }
#endif
    return std::nullopt;
}

std::optional<std::filesystem::path> GetDefaultConfigPath() {
    auto directory = GetUserConfigDirectory();
    if (!directory) {
        return std::nullopt;
    }
    return *directory / "default_runtime.json";
}

} // namespace pointsprite::app
