#include "app/particle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace pointsprite::app {

namespace {

// Owns a shader module for the duration of one pipeline build.
class ShaderStage {
public:
    ShaderStage(VkDevice device, const std::string& spirvPath, VkShaderStageFlagBits stage)
        : device_(device), stage_(stage) {
        TRACE_VAR(spirvPath);
        module_ = vulkan::CreateShaderModule(device_, vulkan::ReadFile(spirvPath));
    }
    ~ShaderStage() { vkDestroyShaderModule(device_, module_, nullptr); }
    ShaderStage(const ShaderStage&) = delete;
    ShaderStage& operator=(const ShaderStage&) = delete;

    VkPipelineShaderStageCreateInfo Info() const {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = stage_;
        info.module = module_;
        info.pName = "main";
        return info;
    }

private:
    VkDevice device_;
    VkShaderStageFlagBits stage_;
    VkShaderModule module_ = VK_NULL_HANDLE;
};

} // namespace

void ParticleApp::CreateRenderPass() {
    TRACE_FUNCTION();
    VkAttachmentDescription target{};
    target.format = surfaceFormat_.format;
    target.samples = VK_SAMPLE_COUNT_1_BIT;
    target.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    target.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    target.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    target.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    target.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    target.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference targetRef{0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL};

    VkSubpassDescription pointsPass{};
    pointsPass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    pointsPass.colorAttachmentCount = 1;
    pointsPass.pColorAttachments = &targetRef;

    // The clear waits for the presentation engine to release the image.
    VkSubpassDependency imageAcquired{};
    imageAcquired.srcSubpass = VK_SUBPASS_EXTERNAL;
    imageAcquired.dstSubpass = 0;
    imageAcquired.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    imageAcquired.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    imageAcquired.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo passInfo{};
    passInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    passInfo.attachmentCount = 1;
    passInfo.pAttachments = &target;
    passInfo.subpassCount = 1;
    passInfo.pSubpasses = &pointsPass;
    passInfo.dependencyCount = 1;
    passInfo.pDependencies = &imageAcquired;

    vulkan::CheckResult(vkCreateRenderPass(device_, &passInfo, nullptr, &renderPass_), "vkCreateRenderPass");
}

void ParticleApp::CreateGraphicsPipeline() {
    TRACE_FUNCTION();
    ShaderStage vertexStage(device_, shaderPaths_.vertex, VK_SHADER_STAGE_VERTEX_BIT);
    ShaderStage fragmentStage(device_, shaderPaths_.fragment, VK_SHADER_STAGE_FRAGMENT_BIT);
    std::array<VkPipelineShaderStageCreateInfo, 2> stages = {vertexStage.Info(), fragmentStage.Info()};

    auto binding = vulkan::ParticleBindingDescription();
    auto attributes = vulkan::ParticleAttributeDescriptions();
    VkPipelineVertexInputStateCreateInfo vertexInput{};
    vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInput.vertexBindingDescriptionCount = 1;
    vertexInput.pVertexBindingDescriptions = &binding;
    vertexInput.vertexAttributeDescriptionCount = static_cast<uint32_t>(attributes.size());
    vertexInput.pVertexAttributeDescriptions = attributes.data();

    // gl_PointSize only takes effect with point topology.
    VkPipelineInputAssemblyStateCreateInfo assembly{};
    assembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    assembly.topology = VK_PRIMITIVE_TOPOLOGY_POINT_LIST;

    // Viewport and scissor follow the swapchain and are set per frame.
    std::array<VkDynamicState, 2> dynamicStates = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dynamic{};
    dynamic.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamic.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
    dynamic.pDynamicStates = dynamicStates.data();

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount = 1;

    VkPipelineRasterizationStateCreateInfo raster{};
    raster.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    raster.polygonMode = VK_POLYGON_MODE_FILL;
    raster.cullMode = VK_CULL_MODE_NONE;
    raster.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    raster.lineWidth = 1.0f;

    VkPipelineMultisampleStateCreateInfo multisample{};
    multisample.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisample.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineColorBlendAttachmentState opaque{};
    opaque.blendEnable = VK_FALSE;
    opaque.colorWriteMask =
        VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    VkPipelineColorBlendStateCreateInfo blend{};
    blend.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    blend.attachmentCount = 1;
    blend.pAttachments = &opaque;

    VkPipelineLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    vulkan::CheckResult(vkCreatePipelineLayout(device_, &layoutInfo, nullptr, &graphicsPipelineLayout_),
                        "vkCreatePipelineLayout (graphics)");

    VkGraphicsPipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineInfo.stageCount = static_cast<uint32_t>(stages.size());
    pipelineInfo.pStages = stages.data();
    pipelineInfo.pVertexInputState = &vertexInput;
    pipelineInfo.pInputAssemblyState = &assembly;
    pipelineInfo.pViewportState = &viewportState;
    pipelineInfo.pRasterizationState = &raster;
    pipelineInfo.pMultisampleState = &multisample;
    pipelineInfo.pColorBlendState = &blend;
    pipelineInfo.pDynamicState = &dynamic;
    pipelineInfo.layout = graphicsPipelineLayout_;
    pipelineInfo.renderPass = renderPass_;
    pipelineInfo.subpass = 0;

    vulkan::CheckResult(
        vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &graphicsPipeline_),
        "vkCreateGraphicsPipelines");
}

void ParticleApp::CreateComputePipeline() {
    TRACE_FUNCTION();
    ShaderStage computeStage(device_, shaderPaths_.compute, VK_SHADER_STAGE_COMPUTE_BIT);

    VkPushConstantRange deltaTimeRange{VK_SHADER_STAGE_COMPUTE_BIT, 0, sizeof(core::ComputePushConstants)};

    VkPipelineLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutInfo.setLayoutCount = 1;
    layoutInfo.pSetLayouts = &computeDescriptorSetLayout_;
    layoutInfo.pushConstantRangeCount = 1;
    layoutInfo.pPushConstantRanges = &deltaTimeRange;
    vulkan::CheckResult(vkCreatePipelineLayout(device_, &layoutInfo, nullptr, &computePipelineLayout_),
                        "vkCreatePipelineLayout (compute)");

    VkComputePipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
    pipelineInfo.stage = computeStage.Info();
    pipelineInfo.layout = computePipelineLayout_;

    vulkan::CheckResult(
        vkCreateComputePipelines(device_, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &computePipeline_),
        "vkCreateComputePipelines");
}

} // namespace pointsprite::app
