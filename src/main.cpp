#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "app/particle_app.hpp"
#include "app/runtime_config.hpp"
#include "app/trace.hpp"
#include "core/vertex_stage.hpp"
#include "script/particle_script.hpp"

namespace {

using pointsprite::app::RuntimeConfig;

struct AppOptions {
    RuntimeConfig runtimeConfig;
    std::optional<std::filesystem::path> seedOutput;
    std::optional<uint32_t> dumpVertexCount;
    bool saveDefaultJson = false;
    bool dumpRuntimeJson = false;
    bool traceEnabled = false;
    bool luaDebug = false;
};

AppOptions ParseCommandLine(int argc, char** argv) {
    std::string jsonInputText;
    std::string seedOutputText;
    std::string setDefaultJsonPath;
    uint32_t dumpVertexCount = 0;
    bool dumpRuntimeJson = false;
    bool traceRuntime = false;
    bool luaDebug = false;

    CLI::App app("SDL3 + Vulkan point-sprite particle renderer");
    app.add_option("-j,--json-file-in", jsonInputText, "Path to a runtime JSON config")
        ->check(CLI::ExistingFile);
    app.add_option("-s,--create-seed-json", seedOutputText,
                   "Write a template runtime JSON file");
    auto* setDefaultJsonOption = app.add_option(
        "-d,--set-default-json", setDefaultJsonPath,
        "Persist the runtime JSON to the platform default location (XDG/APPDATA); "
        "provide PATH to copy that JSON instead of using the default contents");
    setDefaultJsonOption->type_name("PATH");
    setDefaultJsonOption->type_size(1, 1);
    setDefaultJsonOption->expected(0, 1);
    auto* dumpVerticesOption = app.add_option(
        "--dump-vertices", dumpVertexCount,
        "Run the vertex stage on the CPU for the first N particles, print the results and exit");
    dumpVerticesOption->check(CLI::PositiveNumber);
    app.add_flag("--dump-json", dumpRuntimeJson, "Print the runtime JSON that was loaded");
    app.add_flag("--trace", traceRuntime, "Emit a log line when key functions/methods run");
    app.add_flag("--lua-debug", luaDebug, "Expose lua_debug = true to the particle script");

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp& e) {
        std::exit(app.exit(e));
    } catch (const CLI::CallForVersion& e) {
        std::exit(app.exit(e));
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        throw;
    }

    // Config loading is traced too.
    pointsprite::app::TraceLogger::SetEnabled(traceRuntime);

    bool shouldSaveDefault = setDefaultJsonOption->count() > 0;
    std::optional<std::filesystem::path> providedDefaultPath;
    if (shouldSaveDefault && !setDefaultJsonPath.empty()) {
        providedDefaultPath = std::filesystem::absolute(setDefaultJsonPath);
    }

    RuntimeConfig runtimeConfig;
    if (!jsonInputText.empty()) {
        runtimeConfig = pointsprite::app::LoadRuntimeConfigFromJson(std::filesystem::absolute(jsonInputText),
                                                                    dumpRuntimeJson);
    } else if (providedDefaultPath) {
        runtimeConfig = pointsprite::app::LoadRuntimeConfigFromJson(*providedDefaultPath, dumpRuntimeJson);
    } else if (auto defaultPath = pointsprite::app::GetDefaultConfigPath();
               defaultPath && std::filesystem::exists(*defaultPath)) {
        runtimeConfig = pointsprite::app::LoadRuntimeConfigFromJson(*defaultPath, dumpRuntimeJson);
    } else {
        runtimeConfig = pointsprite::app::GenerateDefaultRuntimeConfig(argc > 0 ? argv[0] : nullptr);
    }

    AppOptions options;
    options.runtimeConfig = std::move(runtimeConfig);
    if (!seedOutputText.empty()) {
        options.seedOutput = std::filesystem::absolute(seedOutputText);
    }
    if (dumpVerticesOption->count() > 0) {
        options.dumpVertexCount = dumpVertexCount;
    }
    options.saveDefaultJson = shouldSaveDefault;
    options.dumpRuntimeJson = dumpRuntimeJson;
    options.traceEnabled = traceRuntime;
    options.luaDebug = luaDebug;
    return options;
}

void DumpVertices(const AppOptions& options) {
    pointsprite::script::ParticleScript script(options.runtimeConfig.scriptPath, options.luaDebug);
    uint32_t count = pointsprite::core::kDefaultParticleCount;
    if (options.runtimeConfig.particleCount) {
        count = *options.runtimeConfig.particleCount;
    } else if (auto scriptCount = script.GetParticleCount()) {
        count = *scriptCount;
    }

    auto particles = script.LoadParticles(count);
    if (*options.dumpVertexCount < particles.size()) {
        particles.resize(*options.dumpVertexCount);
    }

    auto outputs = pointsprite::core::TransformParticles(particles);
    std::cout << std::fixed << std::setprecision(6);
    for (size_t i = 0; i < outputs.size(); ++i) {
        const auto& out = outputs[i];
        std::cout << i << ": clip=(" << out.clipPosition[0] << ", " << out.clipPosition[1] << ", "
                  << out.clipPosition[2] << ", " << out.clipPosition[3] << ") size=" << out.pointSize
                  << " color=(" << out.color[0] << ", " << out.color[1] << ", " << out.color[2] << ")\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        AppOptions options = ParseCommandLine(argc, argv);
        if (options.seedOutput) {
            pointsprite::app::WriteRuntimeConfigJson(options.runtimeConfig, *options.seedOutput);
        }
        if (options.saveDefaultJson) {
            if (auto defaultPath = pointsprite::app::GetDefaultConfigPath()) {
                pointsprite::app::WriteRuntimeConfigJson(options.runtimeConfig, *defaultPath);
            } else {
                throw std::runtime_error("Unable to determine platform config directory");
            }
        }
        if (options.dumpVertexCount) {
            DumpVertices(options);
            return EXIT_SUCCESS;
        }
        pointsprite::app::ParticleApp app(options.runtimeConfig, options.luaDebug);
        app.Run();
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
