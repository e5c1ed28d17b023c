#include "core/vertex_stage.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

using pointsprite::core::VertexInput;
using pointsprite::core::VertexOutput;

void Assert(bool condition, const std::string& message, int& failures) {
    if (!condition) {
        std::cerr << "test failure: " << message << '\n';
        ++failures;
    }
}

bool BitwiseEqual(float a, float b) {
    return std::memcmp(&a, &b, sizeof(float)) == 0;
}

bool SameOutput(const VertexOutput& a, const VertexOutput& b) {
    for (size_t i = 0; i < 4; ++i) {
        if (!BitwiseEqual(a.clipPosition[i], b.clipPosition[i])) {
            return false;
        }
    }
    for (size_t i = 0; i < 3; ++i) {
        if (!BitwiseEqual(a.color[i], b.color[i])) {
            return false;
        }
    }
    return BitwiseEqual(a.pointSize, b.pointSize);
}

void ExpectOutput(const VertexOutput& out, float x, float y, const std::string& label, int& failures) {
    Assert(BitwiseEqual(out.clipPosition[0], x), label + ": clip x passes through", failures);
    Assert(BitwiseEqual(out.clipPosition[1], y), label + ": clip y passes through", failures);
    Assert(out.clipPosition[2] == 0.0f, label + ": clip depth is 0", failures);
    Assert(out.clipPosition[3] == 1.0f, label + ": clip w is 1", failures);
    Assert(out.pointSize == 2.0f, label + ": point size is 2", failures);
    Assert(out.color[0] == 1.0f && out.color[1] == 1.0f && out.color[2] == 1.0f,
           label + ": color is white", failures);
}

void TestScenarios(int& failures) {
    ExpectOutput(pointsprite::core::TransformVertex(VertexInput{{0.5f, -0.5f}}), 0.5f, -0.5f,
                 "scenario A", failures);
    ExpectOutput(pointsprite::core::TransformVertex(VertexInput{{0.0f, 0.0f}}), 0.0f, 0.0f,
                 "scenario B", failures);

    const std::vector<VertexInput> batch{{{0.0f, 0.0f}}, {{1.0f, 0.0f}}, {{0.0f, 1.0f}}};
    auto outputs = pointsprite::core::TransformVertices(batch);
    Assert(outputs.size() == 3, "scenario C yields one output per vertex", failures);
    if (outputs.size() == 3) {
        ExpectOutput(outputs[0], 0.0f, 0.0f, "scenario C[0]", failures);
        ExpectOutput(outputs[1], 1.0f, 0.0f, "scenario C[1]", failures);
        ExpectOutput(outputs[2], 0.0f, 1.0f, "scenario C[2]", failures);
    }
}

void TestPassThroughAcrossRange(int& failures) {
    const std::array<float, 10> samples = {
        0.0f,
        -0.0f,
        1.0f,
        -1.0f,
        3.5f,
        -1234.5f,
        1.0e30f,
        -1.0e30f,
        std::numeric_limits<float>::min(),
        std::numeric_limits<float>::denorm_min(),
    };
    for (float x : samples) {
        for (float y : samples) {
            auto out = pointsprite::core::TransformVertex(VertexInput{{x, y}});
            ExpectOutput(out, x, y, "pass-through (" + std::to_string(x) + ", " + std::to_string(y) + ")",
                         failures);
        }
    }
    auto largest = std::numeric_limits<float>::max();
    ExpectOutput(pointsprite::core::TransformVertex(VertexInput{{largest, -largest}}), largest, -largest,
                 "largest finite", failures);
}

void TestPurity(int& failures) {
    const VertexInput input{{0.125f, -0.75f}};
    auto first = pointsprite::core::TransformVertex(input);
    auto second = pointsprite::core::TransformVertex(input);
    Assert(SameOutput(first, second), "repeated invocation is bit-identical", failures);
}

void TestBatchOrderIndependence(int& failures) {
    std::vector<VertexInput> batch;
    for (int i = 0; i < 32; ++i) {
        float t = static_cast<float>(i) / 31.0f;
        batch.push_back(VertexInput{{t * 2.0f - 1.0f, 1.0f - t}});
    }
    auto forward = pointsprite::core::TransformVertices(batch);

    std::vector<VertexInput> reversed(batch.rbegin(), batch.rend());
    auto backward = pointsprite::core::TransformVertices(reversed);
    std::reverse(backward.begin(), backward.end());

    Assert(forward.size() == batch.size(), "batch output count matches input", failures);
    Assert(backward.size() == forward.size(), "reversed batch output count matches", failures);
    for (size_t i = 0; i < forward.size() && i < backward.size(); ++i) {
        Assert(SameOutput(forward[i], backward[i]), "batch order changes vertex " + std::to_string(i), failures);
        Assert(SameOutput(forward[i], pointsprite::core::TransformVertex(batch[i])),
               "batch result differs from single invocation at " + std::to_string(i), failures);
    }

    Assert(pointsprite::core::TransformVertices({}).empty(), "empty batch yields nothing", failures);
}

void TestParticleAttribute(int& failures) {
    std::vector<pointsprite::core::Particle> particles{
        {{0.25f, 0.5f}, {9.0f, -9.0f}},
        {{-0.75f, 0.0f}, {0.0f, 0.0f}},
    };
    auto outputs = pointsprite::core::TransformParticles(particles);
    Assert(outputs.size() == particles.size(), "one output per particle", failures);
    if (outputs.size() == 2) {
        ExpectOutput(outputs[0], 0.25f, 0.5f, "particle 0 ignores velocity", failures);
        ExpectOutput(outputs[1], -0.75f, 0.0f, "particle 1", failures);
    }
}

std::string ReadShaderSource(const char* name) {
    auto shaderPath = std::filesystem::path(__FILE__).parent_path().parent_path() / "shaders" / name;
    std::ifstream in(shaderPath);
    std::ostringstream source;
    source << in.rdbuf();
    return source.str();
}

std::string GlslFloat(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

// The GPU runs shaders/particle.vert; its literals must agree with the C++ stage.
void TestShaderMatchesConstants(int& failures) {
    std::string source = ReadShaderSource("particle.vert");
    Assert(!source.empty(), "particle.vert is readable", failures);

    using namespace pointsprite::core;
    const std::string positionInput =
        "layout(location = " + std::to_string(kPositionLocation) + ") in vec2 inPosition;";
    const std::string colorOutput = "layout(location = " + std::to_string(kColorLocation) + ") out vec3 fragColor;";
    const std::string clip =
        "gl_Position = vec4(inPosition, " + GlslFloat(kClipDepth) + ", " + GlslFloat(kClipW) + ");";
    const std::string size = "gl_PointSize = " + GlslFloat(kPointSize) + ";";
    const std::string color = "fragColor = vec3(" + GlslFloat(kPointColor[0]) + ", " + GlslFloat(kPointColor[1]) +
                              ", " + GlslFloat(kPointColor[2]) + ");";

    Assert(source.find(positionInput) != std::string::npos, "shader reads position at kPositionLocation", failures);
    Assert(source.find(colorOutput) != std::string::npos, "shader writes color at kColorLocation", failures);
    Assert(source.find(clip) != std::string::npos, "shader clip depth and w match", failures);
    Assert(source.find(size) != std::string::npos, "shader point size matches kPointSize", failures);
    Assert(source.find(color) != std::string::npos, "shader color matches kPointColor", failures);
}

} // namespace

int main() {
    int failures = 0;
    TestScenarios(failures);
    TestPassThroughAcrossRange(failures);
    TestPurity(failures);
    TestBatchOrderIndependence(failures);
    TestParticleAttribute(failures);
    TestShaderMatchesConstants(failures);

    if (failures == 0) {
        std::cout << "vertex_stage_tests: PASSED\n";
    } else {
        std::cerr << "vertex_stage_tests: FAILED (" << failures << " errors)\n";
    }
    return failures;
}
