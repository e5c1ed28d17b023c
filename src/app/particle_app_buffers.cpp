#include "app/particle_app.hpp"
#include "app/trace.hpp"
#include "app/vulkan_api.hpp"

#include <cstring>
#include <stdexcept>

namespace pointsprite::app {

void ParticleApp::LoadSceneData() {
    TRACE_FUNCTION();
    shaderPaths_ = particleScript_.LoadShaderPaths();

    uint32_t count = core::kDefaultParticleCount;
    if (config_.particleCount) {
        count = *config_.particleCount;
    } else if (auto scriptCount = particleScript_.GetParticleCount()) {
        count = *scriptCount;
    }
    TRACE_VAR(count);

    particles_ = particleScript_.LoadParticles(count);
    if (particles_.empty()) {
        throw std::runtime_error("Particle script produced no particles");
    }
    clearColor_ = particleScript_.GetClearColor();
}

void ParticleApp::CreateParticleBuffer() {
    TRACE_FUNCTION();
    VkDeviceSize bufferSize = sizeof(particles_[0]) * particles_.size();
    vulkan::CreateBuffer(device_, physicalDevice_, bufferSize,
                         VK_BUFFER_USAGE_STORAGE_BUFFER_BIT | VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                         VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                         particleBuffer_, particleBufferMemory_);

    void* data = nullptr;
    vulkan::CheckResult(vkMapMemory(device_, particleBufferMemory_, 0, bufferSize, 0, &data), "vkMapMemory");
    std::memcpy(data, particles_.data(), static_cast<size_t>(bufferSize));
    vkUnmapMemory(device_, particleBufferMemory_);
}

void ParticleApp::CreateDescriptorSet() {
    TRACE_FUNCTION();
    VkDescriptorSetLayoutBinding layoutBinding{};
    layoutBinding.binding = 0;
    layoutBinding.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    layoutBinding.descriptorCount = 1;
    layoutBinding.stageFlags = VK_SHADER_STAGE_COMPUTE_BIT;

    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = 1;
    layoutInfo.pBindings = &layoutBinding;

    vulkan::CheckResult(vkCreateDescriptorSetLayout(device_, &layoutInfo, nullptr, &computeDescriptorSetLayout_),
                        "vkCreateDescriptorSetLayout");

    VkDescriptorPoolSize poolSize{};
    poolSize.type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    poolSize.descriptorCount = 1;

    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.poolSizeCount = 1;
    poolInfo.pPoolSizes = &poolSize;
    poolInfo.maxSets = 1;

    vulkan::CheckResult(vkCreateDescriptorPool(device_, &poolInfo, nullptr, &descriptorPool_),
                        "vkCreateDescriptorPool");

    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = descriptorPool_;
    allocInfo.descriptorSetCount = 1;
    allocInfo.pSetLayouts = &computeDescriptorSetLayout_;

    vulkan::CheckResult(vkAllocateDescriptorSets(device_, &allocInfo, &computeDescriptorSet_),
                        "vkAllocateDescriptorSets");

    VkDescriptorBufferInfo bufferInfo{};
    bufferInfo.buffer = particleBuffer_;
    bufferInfo.offset = 0;
    bufferInfo.range = sizeof(particles_[0]) * particles_.size();

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = computeDescriptorSet_;
    write.dstBinding = 0;
    write.descriptorType = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    write.descriptorCount = 1;
    write.pBufferInfo = &bufferInfo;

    vkUpdateDescriptorSets(device_, 1, &write, 0, nullptr);
}

} // namespace pointsprite::app
