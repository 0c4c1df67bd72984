/**
 * Vulkan definitions of the frame pass handles
 *
 * Include this from a frame callback that records Vulkan commands.
 *
 * Layout contract for a callback:
 * - msaaView's image arrives cleared to transparent, in
 *   VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, and must be left in that
 *   layout; the renderer loads its contents.
 * - frame's image is owned by the renderer until presentation; the callback
 *   must not transition it.
 */

#ifndef TESSERA_VULKAN_FRAME_H
#define TESSERA_VULKAN_FRAME_H

#include <cstdint>
#include <vulkan/vulkan.h>

#include "frame_pass.h"

namespace tessera {

struct CommandEncoder {
    VkDevice device = VK_NULL_HANDLE;
    VkCommandBuffer commandBuffer = VK_NULL_HANDLE;  // in the recording state
};

struct SurfaceFrame {
    VkImage image = VK_NULL_HANDLE;
    uint32_t imageIndex = 0;
    VkExtent2D extent = {0, 0};
    VkFormat format = VK_FORMAT_UNDEFINED;
};

struct TextureView {
    VkImage image = VK_NULL_HANDLE;
    VkImageView view = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_UNDEFINED;
    VkSampleCountFlagBits samples = VK_SAMPLE_COUNT_1_BIT;
    VkExtent2D extent = {0, 0};
};

/**
 * 4x multisampled color image the primitives are drawn into before being
 * resolved into the swapchain image. Destroys its Vulkan objects on release.
 */
struct MultisampledTarget {
    VkDevice device = VK_NULL_HANDLE;
    VkImage image = VK_NULL_HANDLE;
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkImageView view = VK_NULL_HANDLE;
    VkFormat format = VK_FORMAT_UNDEFINED;
    uint32_t width = 0;
    uint32_t height = 0;
    VkImageLayout layout = VK_IMAGE_LAYOUT_UNDEFINED;

    MultisampledTarget() = default;
    MultisampledTarget(const MultisampledTarget&) = delete;
    MultisampledTarget& operator=(const MultisampledTarget&) = delete;

    ~MultisampledTarget() {
        if (device == VK_NULL_HANDLE) return;
        vkDeviceWaitIdle(device);
        if (view != VK_NULL_HANDLE) vkDestroyImageView(device, view, nullptr);
        if (image != VK_NULL_HANDLE) vkDestroyImage(device, image, nullptr);
        if (memory != VK_NULL_HANDLE) vkFreeMemory(device, memory, nullptr);
    }
};

} // namespace tessera

#endif // TESSERA_VULKAN_FRAME_H
