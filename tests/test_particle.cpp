#include "core/particle.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

using pointsprite::core::Particle;

bool ApproximatelyEqual(float a, float b, float eps = 1e-6f) {
    return std::fabs(a - b) <= eps;
}

void Assert(bool condition, const std::string& message, int& failures) {
    if (!condition) {
        std::cerr << "test failure: " << message << '\n';
        ++failures;
    }
}

void TestSeeding(int& failures) {
    auto first = pointsprite::core::SeedParticles(1000, 7);
    auto second = pointsprite::core::SeedParticles(1000, 7);
    auto other = pointsprite::core::SeedParticles(1000, 8);

    Assert(first.size() == 1000, "seeding yields the requested count", failures);
    Assert(pointsprite::core::SeedParticles(0, 7).empty(), "zero particles yields empty buffer", failures);

    bool identical = first.size() == second.size();
    bool differs = false;
    bool inRange = true;
    for (size_t i = 0; i < first.size() && i < second.size(); ++i) {
        const auto& p = first[i];
        identical = identical && p.position == second[i].position && p.velocity == second[i].velocity;
        differs = differs || p.position != other[i].position;
        for (size_t axis = 0; axis < 2; ++axis) {
            inRange = inRange && p.position[axis] >= -1.0f && p.position[axis] <= 1.0f;
            inRange = inRange && std::fabs(p.velocity[axis]) <= pointsprite::core::kVelocityScale;
        }
    }
    Assert(identical, "same seed reproduces the same particles", failures);
    Assert(differs, "different seeds produce different particles", failures);
    Assert(inRange, "positions lie in [-1, 1] and speeds within the velocity scale", failures);
}

void TestStepIntegrates(int& failures) {
    Particle particle{{0.0f, 0.5f}, {0.1f, -0.2f}};
    auto stepped = pointsprite::core::StepParticle(particle, 0.5f);
    Assert(ApproximatelyEqual(stepped.position[0], 0.05f), "x advances by vx * dt", failures);
    Assert(ApproximatelyEqual(stepped.position[1], 0.4f), "y advances by vy * dt", failures);
    Assert(stepped.velocity == particle.velocity, "velocity unchanged inside the box", failures);

    auto still = pointsprite::core::StepParticle(particle, 0.0f);
    Assert(still.position == particle.position, "zero delta leaves position untouched", failures);
}

void TestStepReflects(int& failures) {
    Particle right{{0.99f, 0.0f}, {0.1f, 0.0f}};
    auto stepped = pointsprite::core::StepParticle(right, 1.0f);
    Assert(stepped.position[0] == 1.0f, "crossing +1 clamps to the edge", failures);
    Assert(ApproximatelyEqual(stepped.velocity[0], -0.1f), "crossing +1 reflects vx", failures);

    Particle bottom{{0.0f, -0.95f}, {0.0f, -0.1f}};
    stepped = pointsprite::core::StepParticle(bottom, 1.0f);
    Assert(stepped.position[1] == -1.0f, "crossing -1 clamps to the edge", failures);
    Assert(ApproximatelyEqual(stepped.velocity[1], 0.1f), "crossing -1 reflects vy", failures);
    Assert(stepped.velocity[0] == 0.0f, "other axis untouched", failures);
}

void TestStepKeepsParticlesInside(int& failures) {
    auto particles = pointsprite::core::SeedParticles(256, 3);
    for (int frame = 0; frame < 600; ++frame) {
        pointsprite::core::StepParticles(particles, 1.0f / 60.0f);
    }
    bool inside = true;
    for (const auto& p : particles) {
        inside = inside && std::fabs(p.position[0]) <= 1.0f && std::fabs(p.position[1]) <= 1.0f;
    }
    Assert(inside, "ten simulated seconds keep every particle inside the clip square", failures);
}

void TestDispatchGroups(int& failures) {
    Assert(pointsprite::core::DispatchGroupCount(0) == 0, "no particles, no groups", failures);
    Assert(pointsprite::core::DispatchGroupCount(1) == 1, "one particle needs one group", failures);
    Assert(pointsprite::core::DispatchGroupCount(256) == 1, "exact workgroup fits one group", failures);
    Assert(pointsprite::core::DispatchGroupCount(257) == 2, "tail needs an extra group", failures);
    Assert(pointsprite::core::DispatchGroupCount(10000) == 40, "default count needs 40 groups", failures);

    constexpr uint32_t kMax = std::numeric_limits<uint32_t>::max();
    Assert(pointsprite::core::DispatchGroupCount(kMax) == 16777216u, "largest count does not wrap to zero",
           failures);
    Assert(pointsprite::core::DispatchGroupCount(kMax - 255u) == 16777215u, "whole groups near the top",
           failures);
}

void TestComputeShaderWorkgroup(int& failures) {
    auto shaderPath = std::filesystem::path(__FILE__).parent_path().parent_path() / "shaders" / "particle.comp";
    std::ifstream in(shaderPath);
    std::ostringstream source;
    source << in.rdbuf();
    const std::string expected =
        "layout(local_size_x = " + std::to_string(pointsprite::core::kComputeWorkgroupSize) + ") in;";
    Assert(source.str().find(expected) != std::string::npos,
           "particle.comp workgroup size matches kComputeWorkgroupSize", failures);
}

} // namespace

int main() {
    int failures = 0;
    TestSeeding(failures);
    TestStepIntegrates(failures);
    TestStepReflects(failures);
    TestStepKeepsParticlesInside(failures);
    TestDispatchGroups(failures);
    TestComputeShaderWorkgroup(failures);

    if (failures == 0) {
        std::cout << "particle_tests: PASSED\n";
    } else {
        std::cerr << "particle_tests: FAILED (" << failures << " errors)\n";
    }
    return failures;
}
