#include "core/vertex_stage.hpp"

namespace pointsprite::core {

VertexOutput TransformVertex(const VertexInput& input) {
    VertexOutput output{};
    output.clipPosition = {input.position[0], input.position[1], kClipDepth, kClipW};
    output.pointSize = kPointSize;
    output.color = kPointColor;
    return output;
}

std::vector<VertexOutput> TransformVertices(const std::vector<VertexInput>& inputs) {
    std::vector<VertexOutput> outputs;
    outputs.reserve(inputs.size());
    for (const auto& input : inputs) {
        outputs.push_back(TransformVertex(input));
    }
    return outputs;
}

std::vector<VertexOutput> TransformParticles(const std::vector<Particle>& particles) {
    std::vector<VertexOutput> outputs;
    outputs.reserve(particles.size());
    for (const auto& particle : particles) {
        outputs.push_back(TransformVertex(VertexInput{particle.position}));
    }
    return outputs;
}

} // namespace pointsprite::core
