#ifndef POINTSPRITE_CORE_PARTICLE_HPP
#define POINTSPRITE_CORE_PARTICLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pointsprite::core {

constexpr uint32_t kDefaultParticleCount = 10000;
constexpr uint32_t kDefaultParticleSeed = 1337;
constexpr float kVelocityScale = 0.1f;
constexpr uint32_t kComputeWorkgroupSize = 256;

struct Particle {
    std::array<float, 2> position;
    std::array<float, 2> velocity;
};

static_assert(sizeof(Particle) == sizeof(float) * 4, "particle layout must match the storage buffer");
static_assert(offsetof(Particle, position) == 0, "position must lead the vertex record");

struct ComputePushConstants {
    float deltaTime;
};

// Positions uniform in [-1, 1]; velocities uniform in [-1, 1] scaled by kVelocityScale.
std::vector<Particle> SeedParticles(uint32_t count, uint32_t seed);

// CPU mirror of shaders/particle.comp.
Particle StepParticle(Particle particle, float deltaTime);
void StepParticles(std::vector<Particle>& particles, float deltaTime);

uint32_t DispatchGroupCount(uint32_t particleCount);

} // namespace pointsprite::core

#endif // POINTSPRITE_CORE_PARTICLE_HPP
