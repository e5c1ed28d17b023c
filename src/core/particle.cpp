#include "core/particle.hpp"

#include <random>

namespace pointsprite::core {

namespace {

void ReflectAxis(float& position, float& velocity) {
    if (position > 1.0f) {
        position = 1.0f;
        velocity = -velocity;
    } else if (position < -1.0f) {
        position = -1.0f;
        velocity = -velocity;
    }
}

} // namespace

std::vector<Particle> SeedParticles(uint32_t count, uint32_t seed) {
    std::mt19937 engine(seed);
    std::uniform_real_distribution<float> unit(-1.0f, 1.0f);

    std::vector<Particle> particles;
    particles.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Particle particle{};
        particle.position[0] = unit(engine);
        particle.position[1] = unit(engine);
        particle.velocity[0] = unit(engine) * kVelocityScale;
        particle.velocity[1] = unit(engine) * kVelocityScale;
        particles.push_back(particle);
    }
    return particles;
}

Particle StepParticle(Particle particle, float deltaTime) {
    for (size_t axis = 0; axis < 2; ++axis) {
        particle.position[axis] += particle.velocity[axis] * deltaTime;
        ReflectAxis(particle.position[axis], particle.velocity[axis]);
    }
    return particle;
}

void StepParticles(std::vector<Particle>& particles, float deltaTime) {
    for (auto& particle : particles) {
        particle = StepParticle(particle, deltaTime);
    }
}

uint32_t DispatchGroupCount(uint32_t particleCount) {
    return particleCount / kComputeWorkgroupSize + (particleCount % kComputeWorkgroupSize != 0 ? 1 : 0);
}

} // namespace pointsprite::core
