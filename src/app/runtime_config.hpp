#ifndef POINTSPRITE_APP_RUNTIME_CONFIG_HPP
#define POINTSPRITE_APP_RUNTIME_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>

namespace pointsprite::app {

constexpr uint32_t kWidth = 1024;
constexpr uint32_t kHeight = 768;
// SDL takes window sizes as int.
constexpr uint32_t kMaxWindowDimension = static_cast<uint32_t>(std::numeric_limits<int>::max());

struct RuntimeConfig {
    uint32_t width = kWidth;
    uint32_t height = kHeight;
    std::filesystem::path scriptPath;
    std::optional<uint32_t> particleCount;
};

std::filesystem::path FindScriptPath(const char* argv0);
RuntimeConfig GenerateDefaultRuntimeConfig(const char* argv0);
// Keys: lua_script (required), project_root, window_width, window_height,
// particle_count. Relative paths resolve against project_root when given,
// otherwise against the config file's directory.
RuntimeConfig LoadRuntimeConfigFromJson(const std::filesystem::path& configPath, bool dumpConfig);
// Writes the same keys, with lua_script relative to project_root.
void WriteRuntimeConfigJson(const RuntimeConfig& runtimeConfig, const std::filesystem::path& configPath);

std::optional<std::filesystem::path> GetUserConfigDirectory();
std::optional<std::filesystem::path> GetDefaultConfigPath();

} // namespace pointsprite::app

#endif // POINTSPRITE_APP_RUNTIME_CONFIG_HPP
