#ifndef POINTSPRITE_SCRIPT_PARTICLE_SCRIPT_HPP
#define POINTSPRITE_SCRIPT_PARTICLE_SCRIPT_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <lua.hpp>

#include "core/particle.hpp"

namespace pointsprite::script {

class ParticleScript {
public:
    explicit ParticleScript(const std::filesystem::path& scriptPath, bool debugEnabled = false);
    ~ParticleScript();

    ParticleScript(const ParticleScript&) = delete;
    ParticleScript& operator=(const ParticleScript&) = delete;

    struct ShaderPaths {
        std::string vertex;
        std::string fragment;
        std::string compute;
    };

    ShaderPaths LoadShaderPaths();
    std::optional<uint32_t> GetParticleCount();
    uint32_t GetParticleSeed();
    bool HasSpawnFunction() const;
    // Calls spawn_particle(i) for i in 1..count, or seeds randomly when the
    // script does not define it.
    std::vector<core::Particle> LoadParticles(uint32_t count);
    std::array<float, 4> GetClearColor();
    std::filesystem::path GetScriptDirectory() const;

private:
    static core::Particle ReadParticleTable(lua_State* L, int index);
    static std::string LuaErrorMessage(lua_State* L);
    std::string ResolvePath(const std::string& path) const;
    std::optional<lua_Integer> ReadIntegerGlobal(const char* name);

    lua_State* L_ = nullptr;
    int spawnFnRef_ = LUA_REFNIL;
    std::filesystem::path scriptDirectory_;
    bool debugEnabled_ = false;
};

} // namespace pointsprite::script

#endif // POINTSPRITE_SCRIPT_PARTICLE_SCRIPT_HPP
