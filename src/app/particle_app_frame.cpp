#include "app/particle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <limits>
#include <stdexcept>

namespace pointsprite::app {

void ParticleApp::CreateFrameResources() {
    TRACE_FUNCTION();
    VkCommandPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    poolInfo.queueFamilyIndex = graphicsComputeFamily_;
    vulkan::CheckResult(vkCreateCommandPool(device_, &poolInfo, nullptr, &commandPool_), "vkCreateCommandPool");

    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool = commandPool_;
    allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = 1;
    vulkan::CheckResult(vkAllocateCommandBuffers(device_, &allocInfo, &commandBuffer_), "vkAllocateCommandBuffers");

    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    vulkan::CheckResult(vkCreateSemaphore(device_, &semaphoreInfo, nullptr, &imageAvailableSemaphore_),
                        "vkCreateSemaphore");
    vulkan::CheckResult(vkCreateSemaphore(device_, &semaphoreInfo, nullptr, &renderFinishedSemaphore_),
                        "vkCreateSemaphore");

    // Created signaled so the first DrawFrame does not block.
    VkFenceCreateInfo fenceInfo{};
    fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    vulkan::CheckResult(vkCreateFence(device_, &fenceInfo, nullptr, &inFlightFence_), "vkCreateFence");
}

void ParticleApp::RecordFrame(uint32_t imageIndex, float deltaTime) {
    TRACE_FUNCTION();
    TRACE_VAR(imageIndex);
    vulkan::CheckResult(vkResetCommandBuffer(commandBuffer_, 0), "vkResetCommandBuffer");

    VkCommandBufferBeginInfo beginInfo{};
    beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vulkan::CheckResult(vkBeginCommandBuffer(commandBuffer_, &beginInfo), "vkBeginCommandBuffer");

    const auto particleCount = static_cast<uint32_t>(particles_.size());

    // Simulation step.
    core::ComputePushConstants pushConstants{deltaTime};
    vkCmdBindPipeline(commandBuffer_, VK_PIPELINE_BIND_POINT_COMPUTE, computePipeline_);
    vkCmdBindDescriptorSets(commandBuffer_, VK_PIPELINE_BIND_POINT_COMPUTE, computePipelineLayout_, 0, 1,
                            &computeDescriptorSet_, 0, nullptr);
    vkCmdPushConstants(commandBuffer_, computePipelineLayout_, VK_SHADER_STAGE_COMPUTE_BIT, 0,
                       sizeof(pushConstants), &pushConstants);
    vkCmdDispatch(commandBuffer_, core::DispatchGroupCount(particleCount), 1, 1);

    // Compute writes must land before the vertex stage fetches positions.
    VkBufferMemoryBarrier particlesReady{};
    particlesReady.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER;
    particlesReady.srcAccessMask = VK_ACCESS_SHADER_WRITE_BIT;
    particlesReady.dstAccessMask = VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT;
    particlesReady.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    particlesReady.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    particlesReady.buffer = particleBuffer_;
    particlesReady.offset = 0;
    particlesReady.size = VK_WHOLE_SIZE;
    vkCmdPipelineBarrier(commandBuffer_, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT, VK_PIPELINE_STAGE_VERTEX_INPUT_BIT,
                         0, 0, nullptr, 1, &particlesReady, 0, nullptr);

    // Point sprites, one per particle.
    VkClearValue clearValue{};
    clearValue.color = {{clearColor_[0], clearColor_[1], clearColor_[2], clearColor_[3]}};

    VkRenderPassBeginInfo passInfo{};
    passInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    passInfo.renderPass = renderPass_;
    passInfo.framebuffer = swapChainFramebuffers_[imageIndex];
    passInfo.renderArea = {{0, 0}, swapChainExtent_};
    passInfo.clearValueCount = 1;
    passInfo.pClearValues = &clearValue;

    VkViewport viewport{0.0f, 0.0f, static_cast<float>(swapChainExtent_.width),
                        static_cast<float>(swapChainExtent_.height), 0.0f, 1.0f};
    VkRect2D scissor{{0, 0}, swapChainExtent_};
    VkDeviceSize vertexOffset = 0;

    vkCmdBeginRenderPass(commandBuffer_, &passInfo, VK_SUBPASS_CONTENTS_INLINE);
    vkCmdBindPipeline(commandBuffer_, VK_PIPELINE_BIND_POINT_GRAPHICS, graphicsPipeline_);
    vkCmdSetViewport(commandBuffer_, 0, 1, &viewport);
    vkCmdSetScissor(commandBuffer_, 0, 1, &scissor);
    vkCmdBindVertexBuffers(commandBuffer_, 0, 1, &particleBuffer_, &vertexOffset);
    vkCmdDraw(commandBuffer_, particleCount, 1, 0, 0);
    vkCmdEndRenderPass(commandBuffer_);

    vulkan::CheckResult(vkEndCommandBuffer(commandBuffer_), "vkEndCommandBuffer");
}

void ParticleApp::DrawFrame(float deltaTime) {
    TRACE_FUNCTION();
    constexpr uint64_t kNoTimeout = std::numeric_limits<uint64_t>::max();
    vulkan::CheckResult(vkWaitForFences(device_, 1, &inFlightFence_, VK_TRUE, kNoTimeout), "vkWaitForFences");

    uint32_t imageIndex = 0;
    VkResult acquired = vkAcquireNextImageKHR(device_, swapChain_, kNoTimeout, imageAvailableSemaphore_,
                                              VK_NULL_HANDLE, &imageIndex);
    if (acquired == VK_ERROR_OUT_OF_DATE_KHR) {
        RecreateRenderTargets();
        return;
    }
    if (acquired != VK_SUBOPTIMAL_KHR) {
        vulkan::CheckResult(acquired, "vkAcquireNextImageKHR");
    }

    // Only reset once work is certain to be submitted; the early return
    // above must leave the fence signaled.
    vulkan::CheckResult(vkResetFences(device_, 1, &inFlightFence_), "vkResetFences");
    RecordFrame(imageIndex, deltaTime);

    VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.waitSemaphoreCount = 1;
    submitInfo.pWaitSemaphores = &imageAvailableSemaphore_;
    submitInfo.pWaitDstStageMask = &waitStage;
    submitInfo.commandBufferCount = 1;
    submitInfo.pCommandBuffers = &commandBuffer_;
    submitInfo.signalSemaphoreCount = 1;
    submitInfo.pSignalSemaphores = &renderFinishedSemaphore_;
    vulkan::CheckResult(vkQueueSubmit(graphicsQueue_, 1, &submitInfo, inFlightFence_), "vkQueueSubmit");

    VkPresentInfoKHR presentInfo{};
    presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    presentInfo.waitSemaphoreCount = 1;
    presentInfo.pWaitSemaphores = &renderFinishedSemaphore_;
    presentInfo.swapchainCount = 1;
    presentInfo.pSwapchains = &swapChain_;
    presentInfo.pImageIndices = &imageIndex;

    VkResult presented = vkQueuePresentKHR(presentQueue_, &presentInfo);
    if (presented == VK_ERROR_OUT_OF_DATE_KHR || presented == VK_SUBOPTIMAL_KHR || framebufferResized_) {
        RecreateRenderTargets();
        return;
    }
    vulkan::CheckResult(presented, "vkQueuePresentKHR");
}

} // namespace pointsprite::app
