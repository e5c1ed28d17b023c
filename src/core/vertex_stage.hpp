#ifndef POINTSPRITE_CORE_VERTEX_STAGE_HPP
#define POINTSPRITE_CORE_VERTEX_STAGE_HPP

#include <array>
#include <cstdint>
#include <vector>

#include "core/particle.hpp"

namespace pointsprite::core {

// Must match the layout qualifiers in shaders/particle.vert.
constexpr uint32_t kPositionLocation = 0;
constexpr uint32_t kColorLocation = 0;

// Also literal in shaders/particle.vert; vertex_stage_tests compares the two.
constexpr float kPointSize = 2.0f;
constexpr std::array<float, 3> kPointColor = {1.0f, 1.0f, 1.0f};
constexpr float kClipDepth = 0.0f;
constexpr float kClipW = 1.0f;

struct VertexInput {
    std::array<float, 2> position;
};

struct VertexOutput {
    std::array<float, 4> clipPosition;
    float pointSize;
    std::array<float, 3> color;
};

// One invocation of the point-sprite vertex stage. The position is placed in
// clip space unprojected; size and color are constant.
VertexOutput TransformVertex(const VertexInput& input);

std::vector<VertexOutput> TransformVertices(const std::vector<VertexInput>& inputs);

// Feeds each particle's position attribute through the stage, the same way
// the graphics pipeline's vertex binding does.
std::vector<VertexOutput> TransformParticles(const std::vector<Particle>& particles);

} // namespace pointsprite::core

#endif // POINTSPRITE_CORE_VERTEX_STAGE_HPP
