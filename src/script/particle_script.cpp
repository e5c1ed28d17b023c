#include "script/particle_script.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace pointsprite::script {

namespace detail {

template <size_t N>
std::array<float, N> ReadVector(lua_State* L, int index, const char* what) {
    std::array<float, N> result{};
    int absIndex = lua_absindex(L, index);
    if (!lua_istable(L, absIndex)) {
        throw std::runtime_error(std::string("Expected table for ") + what);
    }
    size_t len = lua_rawlen(L, absIndex);
    if (len != N) {
        throw std::runtime_error(std::string("Expected ") + what + " with " + std::to_string(N) +
                                 " components");
    }
    for (size_t i = 1; i <= N; ++i) {
        lua_rawgeti(L, absIndex, static_cast<int>(i));
        if (!lua_isnumber(L, -1)) {
            lua_pop(L, 1);
            throw std::runtime_error(std::string(what) + " component is not a number");
        }
        result[i - 1] = static_cast<float>(lua_tonumber(L, -1));
        lua_pop(L, 1);
    }
    return result;
}

} // namespace detail

ParticleScript::ParticleScript(const std::filesystem::path& scriptPath, bool debugEnabled)
    : L_(luaL_newstate()),
      scriptDirectory_(scriptPath.parent_path()),
      debugEnabled_(debugEnabled) {
    if (!L_) {
        throw std::runtime_error("Failed to create Lua state");
    }
    luaL_openlibs(L_);
    lua_pushboolean(L_, debugEnabled_);
    lua_setglobal(L_, "lua_debug");
    if (!scriptDirectory_.empty()) {
        lua_getglobal(L_, "package");
        if (lua_istable(L_, -1)) {
            lua_getfield(L_, -1, "path");
            const char* currentPath = lua_tostring(L_, -1);
            std::string newPath = scriptDirectory_.string() + "/?.lua;";
            if (currentPath) {
                newPath += currentPath;
            }
            lua_pop(L_, 1);
            lua_pushstring(L_, newPath.c_str());
            lua_setfield(L_, -2, "path");
        }
        lua_pop(L_, 1);
    }
    if (luaL_dofile(L_, scriptPath.string().c_str()) != LUA_OK) {
        std::string message = LuaErrorMessage(L_);
        lua_pop(L_, 1);
        lua_close(L_);
        L_ = nullptr;
        throw std::runtime_error("Failed to load Lua script: " + message);
    }

    lua_getglobal(L_, "spawn_particle");
    if (lua_isfunction(L_, -1)) {
        spawnFnRef_ = luaL_ref(L_, LUA_REGISTRYINDEX);
    } else {
        lua_pop(L_, 1);
    }
}

ParticleScript::~ParticleScript() {
    if (L_) {
        if (spawnFnRef_ != LUA_REFNIL) {
            luaL_unref(L_, LUA_REGISTRYINDEX, spawnFnRef_);
        }
        lua_close(L_);
    }
}

ParticleScript::ShaderPaths ParticleScript::LoadShaderPaths() {
    lua_getglobal(L_, "get_shader_paths");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error("Lua function 'get_shader_paths' is missing");
    }
    if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
        std::string message = LuaErrorMessage(L_);
        lua_pop(L_, 1);
        throw std::runtime_error("Lua get_shader_paths failed: " + message);
    }
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error("'get_shader_paths' did not return a table");
    }

    ShaderPaths paths;
    const std::pair<const char*, std::string*> fields[] = {
        {"vertex", &paths.vertex},
        {"fragment", &paths.fragment},
        {"compute", &paths.compute},
    };
    for (const auto& [name, target] : fields) {
        lua_getfield(L_, -1, name);
        if (!lua_isstring(L_, -1)) {
            lua_pop(L_, 2);
            throw std::runtime_error(std::string("Shader path '") + name + "' must be a string");
        }
        *target = ResolvePath(lua_tostring(L_, -1));
        lua_pop(L_, 1);
    }

    lua_pop(L_, 1);
    return paths;
}

std::optional<uint32_t> ParticleScript::GetParticleCount() {
    auto value = ReadIntegerGlobal("particle_count");
    if (!value) {
        return std::nullopt;
    }
    if (*value < 1 || *value > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("'particle_count' must be a positive 32-bit integer");
    }
    return static_cast<uint32_t>(*value);
}

uint32_t ParticleScript::GetParticleSeed() {
    auto value = ReadIntegerGlobal("particle_seed");
    if (!value) {
        return core::kDefaultParticleSeed;
    }
    if (*value < 0 || *value > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("'particle_seed' must be a non-negative 32-bit integer");
    }
    return static_cast<uint32_t>(*value);
}

bool ParticleScript::HasSpawnFunction() const {
    return spawnFnRef_ != LUA_REFNIL;
}

std::vector<core::Particle> ParticleScript::LoadParticles(uint32_t count) {
    if (!HasSpawnFunction()) {
        return core::SeedParticles(count, GetParticleSeed());
    }

    std::vector<core::Particle> particles;
    particles.reserve(count);
    for (uint32_t i = 1; i <= count; ++i) {
        lua_rawgeti(L_, LUA_REGISTRYINDEX, spawnFnRef_);
        lua_pushinteger(L_, static_cast<lua_Integer>(i));
        if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
            std::string message = LuaErrorMessage(L_);
            lua_pop(L_, 1);
            throw std::runtime_error("Lua spawn_particle failed: " + message);
        }
        if (!lua_istable(L_, -1)) {
            lua_pop(L_, 1);
            throw std::runtime_error("'spawn_particle' did not return a table for particle " +
                                     std::to_string(i));
        }
        try {
            particles.push_back(ReadParticleTable(L_, -1));
        } catch (const std::runtime_error& ex) {
            lua_pop(L_, 1);
            throw std::runtime_error("Particle " + std::to_string(i) + ": " + ex.what());
        }
        lua_pop(L_, 1);
    }
    return particles;
}

std::array<float, 4> ParticleScript::GetClearColor() {
    lua_getglobal(L_, "get_clear_color");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return {0.0f, 0.0f, 0.0f, 1.0f};
    }
    if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
        std::string message = LuaErrorMessage(L_);
        lua_pop(L_, 1);
        throw std::runtime_error("Lua get_clear_color failed: " + message);
    }
    std::array<float, 4> color{};
    try {
        color = detail::ReadVector<4>(L_, -1, "clear color");
    } catch (const std::runtime_error&) {
        lua_pop(L_, 1);
        throw;
    }
    lua_pop(L_, 1);
    return color;
}

std::filesystem::path ParticleScript::GetScriptDirectory() const {
    return scriptDirectory_;
}

core::Particle ParticleScript::ReadParticleTable(lua_State* L, int index) {
    int absIndex = lua_absindex(L, index);
    core::Particle particle{};

    lua_getfield(L, absIndex, "position");
    try {
        particle.position = detail::ReadVector<2>(L, -1, "position");
    } catch (const std::runtime_error&) {
        lua_pop(L, 1);
        throw;
    }
    lua_pop(L, 1);

    lua_getfield(L, absIndex, "velocity");
    if (!lua_isnil(L, -1)) {
        try {
            particle.velocity = detail::ReadVector<2>(L, -1, "velocity");
        } catch (const std::runtime_error&) {
            lua_pop(L, 1);
            throw;
        }
    }
    lua_pop(L, 1);

    return particle;
}

std::string ParticleScript::LuaErrorMessage(lua_State* L) {
    const char* message = lua_tostring(L, -1);
    return message ? message : "unknown lua error";
}

std::string ParticleScript::ResolvePath(const std::string& path) const {
    std::filesystem::path resolved(path);
    if (!resolved.is_absolute() && !scriptDirectory_.empty()) {
        resolved = scriptDirectory_ / resolved;
    }
    return resolved.lexically_normal().string();
}

std::optional<lua_Integer> ParticleScript::ReadIntegerGlobal(const char* name) {
    lua_getglobal(L_, name);
    if (lua_isnil(L_, -1)) {
        lua_pop(L_, 1);
        return std::nullopt;
    }
    if (!lua_isinteger(L_, -1)) {
        lua_pop(L_, 1);
        throw std::runtime_error(std::string("'") + name + "' must be an integer");
    }
    lua_Integer value = lua_tointeger(L_, -1);
    lua_pop(L_, 1);
    return value;
}

} // namespace pointsprite::script
