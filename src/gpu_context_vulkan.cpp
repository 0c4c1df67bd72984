/**
 * Vulkan GPU Context for the Tessera hardware backend (Linux/Windows)
 *
 * Vulkan device, swapchain and multisampled target management, with Skia
 * Graphite recording the primitives into the multisampled target.
 *
 * Requires:
 * - Vulkan SDK with vulkan-1.lib (Windows) or libvulkan.so (Linux)
 * - A hardware GPU with Vulkan 1.1+ support (CPU implementations are rejected)
 */

#ifdef TESSERA_VULKAN_AVAILABLE

#include <SDL.h>
#include <SDL_vulkan.h>
#include <vulkan/vulkan.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <vector>

// Skia Graphite headers
#include "include/gpu/graphite/BackendTexture.h"
#include "include/gpu/graphite/Context.h"
#include "include/gpu/graphite/ContextOptions.h"
#include "include/gpu/graphite/Image.h"
#include "include/gpu/graphite/Recorder.h"
#include "include/gpu/graphite/Recording.h"
#include "include/gpu/graphite/Surface.h"
#include "include/gpu/graphite/vk/VulkanGraphiteUtils.h"
#include "include/gpu/vk/VulkanBackendContext.h"
#include "include/gpu/vk/VulkanExtensions.h"
#include "include/gpu/vk/VulkanMutableTextureState.h"
#include "include/core/SkColorSpace.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPixmap.h"
#include "include/core/SkSurface.h"

#include "gpu_context.h"
#include "vulkan_frame.h"

namespace tessera {

namespace {

// Swapchain and multisampled target storage format. Skia encodes sRGB
// through the surface color space.
constexpr VkFormat kPresentationFormat = VK_FORMAT_B8G8R8A8_UNORM;

// Vulkan debug callback for validation layers (debug builds only)
#ifndef NDEBUG
VKAPI_ATTR VkBool32 VKAPI_CALL vulkanDebugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT messageSeverity,
    VkDebugUtilsMessageTypeFlagsEXT /*messageType*/,
    const VkDebugUtilsMessengerCallbackDataEXT* pCallbackData,
    void* /*pUserData*/) {

    const char* severity = "INFO";
    if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        severity = "ERROR";
    } else if (messageSeverity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        severity = "WARNING";
    }

    fprintf(stderr, "[Vulkan %s] %s\n", severity, pCallbackData->pMessage);
    return VK_FALSE;
}
#endif

void transitionImage(VkCommandBuffer cmd, VkImage image, VkImageLayout oldLayout, VkImageLayout newLayout) {
    VkImageMemoryBarrier barrier = {};
    barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
    barrier.srcAccessMask = VK_ACCESS_MEMORY_WRITE_BIT;
    barrier.dstAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
    barrier.oldLayout = oldLayout;
    barrier.newLayout = newLayout;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = image;
    barrier.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

    vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
                         0, 0, nullptr, 0, nullptr, 1, &barrier);
}

SkImageInfo surfaceInfo(TargetFormat format, uint32_t width, uint32_t height) {
    const SkColorType colorType =
        format == TargetFormat::Capture ? kRGBA_8888_SkColorType : kBGRA_8888_SkColorType;
    return SkImageInfo::Make(static_cast<int>(width), static_cast<int>(height), colorType, kPremul_SkAlphaType,
                             SkColorSpace::MakeSRGB());
}

} // namespace

/**
 * Graphite recorder for one frame recorder of the hardware backend.
 */
class VulkanGpuRecorder : public GpuRecorder {
public:
    VulkanGpuRecorder(skgpu::graphite::Context* context,
                      std::unique_ptr<skgpu::graphite::Recorder> recorder,
                      TargetFormat format,
                      uint32_t queueFamily)
        : context_(context), recorder_(std::move(recorder)), format_(format), queueFamily_(queueFamily) {}

    sk_sp<SkSurface> wrapTarget(MultisampledTarget& target) override {
        skgpu::graphite::VulkanTextureInfo textureInfo;
        textureInfo.fSampleCount = MSAA_SAMPLE_COUNT;
        textureInfo.fMipmapped = skgpu::Mipmapped::kNo;
        textureInfo.fFormat = target.format;
        textureInfo.fImageTiling = VK_IMAGE_TILING_OPTIMAL;
        textureInfo.fImageUsageFlags = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT |
                                       VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
                                       VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        textureInfo.fSharingMode = VK_SHARING_MODE_EXCLUSIVE;
        textureInfo.fAspectMask = VK_IMAGE_ASPECT_COLOR_BIT;

        skgpu::graphite::BackendTexture backendTexture(
            {static_cast<int>(target.width), static_cast<int>(target.height)},
            textureInfo,
            target.layout,
            VK_QUEUE_FAMILY_IGNORED,
            target.image,
            {}  // memory owned by MultisampledTarget
        );

        SkImageInfo imageInfo = surfaceInfo(TargetFormat::Presentation, target.width, target.height);
        wrapped_ = SkSurfaces::WrapBackendTexture(
            recorder_.get(),
            backendTexture,
            imageInfo.colorType(),
            imageInfo.refColorSpace(),
            nullptr  // surfaceProps
        );

        if (!wrapped_) {
            fprintf(stderr, "[Vulkan Context] Error: failed to wrap %ux%u multisampled target\n",
                    target.width, target.height);
        }
        return wrapped_;
    }

    sk_sp<SkSurface> makeOffscreen(uint32_t width, uint32_t height) override {
        sk_sp<SkSurface> surface = SkSurfaces::RenderTarget(recorder_.get(), surfaceInfo(format_, width, height));
        if (!surface) {
            fprintf(stderr, "[Vulkan Context] Error: failed to create %ux%u offscreen surface\n", width, height);
        }
        return surface;
    }

    sk_sp<SkImage> uploadImage(const sk_sp<SkImage>& image) override {
        if (!image) return nullptr;
        return SkImages::TextureFromImage(recorder_.get(), image.get(), {});
    }

    bool submit(MultisampledTarget* resolveSource) override {
        std::unique_ptr<skgpu::graphite::Recording> recording = recorder_->snap();
        if (!recording) {
            fprintf(stderr, "[Vulkan Context] submit: Failed to snap recording\n");
            return false;
        }

        skgpu::graphite::InsertRecordingInfo insertInfo;
        insertInfo.fRecording = recording.get();

        // The resolve pass reads the target as a transfer source
        skgpu::MutableTextureState resolveState =
            skgpu::MutableTextureStates::MakeVulkan(VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, queueFamily_);
        if (resolveSource && wrapped_) {
            insertInfo.fTargetSurface = wrapped_.get();
            insertInfo.fTargetTextureState = &resolveState;
        }

        if (!context_->insertRecording(insertInfo)) {
            fprintf(stderr, "[Vulkan Context] submit: Failed to insert recording\n");
            return false;
        }

        context_->submit(skgpu::graphite::SyncToCpu::kNo);

        if (resolveSource) {
            resolveSource->layout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
        }
        wrapped_.reset();
        return true;
    }

    std::optional<RasterImage> readPixels(SkSurface* surface) override {
        if (!surface) return std::nullopt;

        struct ReadContext {
            bool done = false;
            std::unique_ptr<const SkImage::AsyncReadResult> result;
        } read;

        const int width = surface->width();
        const int height = surface->height();
        SkImageInfo dstInfo = SkImageInfo::Make(width, height, kRGBA_8888_SkColorType, kUnpremul_SkAlphaType,
                                                SkColorSpace::MakeSRGB());

        context_->asyncRescaleAndReadPixels(
            surface, dstInfo, SkIRect::MakeWH(width, height),
            SkImage::RescaleGamma::kSrc, SkImage::RescaleMode::kNearest,
            [](SkImage::ReadPixelsContext ctx, std::unique_ptr<const SkImage::AsyncReadResult> result) {
                auto* r = static_cast<ReadContext*>(ctx);
                r->result = std::move(result);
                r->done = true;
            },
            &read);

        context_->submit(skgpu::graphite::SyncToCpu::kYes);

        // No timeout: a GPU that never finishes the copy blocks here
        while (!read.done) {
            context_->checkAsyncWorkCompletion();
        }

        if (!read.result || read.result->count() < 1) {
            fprintf(stderr, "[Vulkan Context] Error: pixel readback failed (%dx%d)\n", width, height);
            return std::nullopt;
        }

        return RasterImage::fromPadded(static_cast<const uint8_t*>(read.result->data(0)),
                                       read.result->rowBytes(0),
                                       static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    }

private:
    skgpu::graphite::Context* context_;
    std::unique_ptr<skgpu::graphite::Recorder> recorder_;
    TargetFormat format_;
    uint32_t queueFamily_;
    sk_sp<SkSurface> wrapped_;
};

/**
 * Vulkan context implementation.
 * Uses a Vulkan swapchain for presentation and Skia Graphite for rendering.
 */
class VulkanGpuContext : public GpuContext {
public:
    VulkanGpuContext() = default;
    ~VulkanGpuContext() override { destroy(); }

    bool initialize(SDL_Window* window, bool vsync) override {
        window_ = window;
        headless_ = (window == nullptr);
        vsyncEnabled_ = vsync;

        if (!headless_) {
            if (SDL_Vulkan_LoadLibrary(nullptr) != 0) {
                return fail(std::string("failed to load Vulkan library: ") + SDL_GetError());
            }
            libraryLoaded_ = true;
        }

        if (!createInstance()) return false;

        if (!headless_ && !SDL_Vulkan_CreateSurface(window_, instance_, &surface_)) {
            return fail(std::string("failed to create Vulkan surface: ") + SDL_GetError());
        }

        if (!pickPhysicalDevice()) return false;
        if (!createLogicalDevice()) return false;
        if (!createCommandObjects()) return false;

        if (!headless_) {
            int width = 0;
            int height = 0;
            SDL_Vulkan_GetDrawableSize(window_, &width, &height);
            swapchainExtent_.width = static_cast<uint32_t>(std::max(width, 1));
            swapchainExtent_.height = static_cast<uint32_t>(std::max(height, 1));
            if (!createSwapchain()) return false;
        }

        if (!createGraphiteContext()) return false;

        initialized_ = true;
        printf("[Vulkan Context] Initialized Vulkan Graphite backend%s\n", headless_ ? " (headless)" : "");
        return true;
    }

    void destroy() override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (context_) {
            context_->submit(skgpu::graphite::SyncToCpu::kYes);
            context_.reset();
        }

        if (device_ != VK_NULL_HANDLE) {
            vkDeviceWaitIdle(device_);
        }

        destroySwapchain();
        destroyCommandObjects();

        if (device_ != VK_NULL_HANDLE) {
            vkDestroyDevice(device_, nullptr);
            device_ = VK_NULL_HANDLE;
        }

        if (surface_ != VK_NULL_HANDLE) {
            vkDestroySurfaceKHR(instance_, surface_, nullptr);
            surface_ = VK_NULL_HANDLE;
        }

#ifndef NDEBUG
        if (debugMessenger_ != VK_NULL_HANDLE) {
            auto destroyFunc = (PFN_vkDestroyDebugUtilsMessengerEXT)
                vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT");
            if (destroyFunc) {
                destroyFunc(instance_, debugMessenger_, nullptr);
            }
            debugMessenger_ = VK_NULL_HANDLE;
        }
#endif

        if (instance_ != VK_NULL_HANDLE) {
            vkDestroyInstance(instance_, nullptr);
            instance_ = VK_NULL_HANDLE;
        }

        if (libraryLoaded_) {
            SDL_Vulkan_UnloadLibrary();
            libraryLoaded_ = false;
        }

        if (initialized_) {
            printf("[Vulkan Context] Destroyed Vulkan Graphite context\n");
        }
        initialized_ = false;
    }

    bool isHeadless() const override { return headless_; }
    const std::string& lastError() const override { return error_; }

    bool configureSurface(uint32_t width, uint32_t height) override {
        if (!initialized_ || headless_) return true;
        if (width == 0 || height == 0) return false;

        std::lock_guard<std::mutex> lock(mutex_);

        if (width == swapchainExtent_.width && height == swapchainExtent_.height && swapchain_ != VK_NULL_HANDLE) {
            return true;
        }

        // Targets may still be in flight
        vkDeviceWaitIdle(device_);

        destroySwapchain();
        swapchainExtent_.width = width;
        swapchainExtent_.height = height;
        return createSwapchain();
    }

    std::shared_ptr<MultisampledTarget> createMultisampledTarget(uint32_t width, uint32_t height) override {
        if (device_ == VK_NULL_HANDLE || width == 0 || height == 0) {
            return nullptr;
        }

        auto target = std::make_shared<MultisampledTarget>();
        target->format = kPresentationFormat;
        target->width = width;
        target->height = height;

        VkImageCreateInfo imageInfo = {};
        imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        imageInfo.imageType = VK_IMAGE_TYPE_2D;
        imageInfo.format = kPresentationFormat;
        imageInfo.extent = {width, height, 1};
        imageInfo.mipLevels = 1;
        imageInfo.arrayLayers = 1;
        imageInfo.samples = VK_SAMPLE_COUNT_4_BIT;
        imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.usage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
                          VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

        if (vkCreateImage(device_, &imageInfo, nullptr, &target->image) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to create multisampled image %ux%u\n", width, height);
            return nullptr;
        }
        target->device = device_;

        VkMemoryRequirements requirements;
        vkGetImageMemoryRequirements(device_, target->image, &requirements);

        uint32_t memoryType = 0;
        if (!findMemoryType(requirements.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, &memoryType)) {
            fprintf(stderr, "[Vulkan Context] Error: No device-local memory for multisampled target\n");
            return nullptr;
        }

        VkMemoryAllocateInfo allocInfo = {};
        allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        allocInfo.allocationSize = requirements.size;
        allocInfo.memoryTypeIndex = memoryType;

        if (vkAllocateMemory(device_, &allocInfo, nullptr, &target->memory) != VK_SUCCESS ||
            vkBindImageMemory(device_, target->image, target->memory, 0) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to allocate multisampled target memory\n");
            return nullptr;
        }

        VkImageViewCreateInfo viewInfo = {};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = target->image;
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = kPresentationFormat;
        viewInfo.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

        if (vkCreateImageView(device_, &viewInfo, nullptr, &target->view) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to create multisampled target view\n");
            return nullptr;
        }

        return target;
    }

    std::unique_ptr<GpuRecorder> makeRecorder(TargetFormat format) override {
        if (!context_) return nullptr;

        std::unique_ptr<skgpu::graphite::Recorder> recorder = context_->makeRecorder();
        if (!recorder) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to create Skia Graphite recorder\n");
            return nullptr;
        }
        return std::make_unique<VulkanGpuRecorder>(context_.get(), std::move(recorder), format,
                                                   graphicsQueueFamily_);
    }

    std::optional<FramePass> beginFrame(MultisampledTarget& target) override {
        if (!initialized_ || headless_) {
            fprintf(stderr, "[Vulkan Context] beginFrame: no presentation surface\n");
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        if (swapchain_ == VK_NULL_HANDLE && !createSwapchain()) {
            return std::nullopt;
        }

        VkFence fences[] = {passFence_, resolveFence_};
        vkWaitForFences(device_, 2, fences, VK_TRUE, UINT64_MAX);

        VkResult result = vkAcquireNextImageKHR(
            device_, swapchain_, UINT64_MAX,
            imageAvailableSemaphore_, VK_NULL_HANDLE,
            &currentImageIndex_);

        if (result == VK_ERROR_OUT_OF_DATE_KHR) {
            // Out of date after a resize: rebuild once and retry
            vkDeviceWaitIdle(device_);
            destroySwapchain();
            if (!createSwapchain()) {
                return std::nullopt;
            }
            result = vkAcquireNextImageKHR(
                device_, swapchain_, UINT64_MAX,
                imageAvailableSemaphore_, VK_NULL_HANDLE,
                &currentImageIndex_);
        }

        if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR) {
            fprintf(stderr, "[Vulkan Context] beginFrame: Failed to acquire swapchain image (VkResult: %d)\n", result);
            return std::nullopt;
        }

        vkResetCommandBuffer(passCommandBuffer_, 0);
        VkCommandBufferBeginInfo beginInfo = {};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        vkBeginCommandBuffer(passCommandBuffer_, &beginInfo);

        // Every frame starts from a transparent target. target.layout is only
        // updated once this command buffer has been submitted.
        VkClearColorValue transparent = {};
        VkImageSubresourceRange range = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
        transitionImage(passCommandBuffer_, target.image, VK_IMAGE_LAYOUT_UNDEFINED,
                        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        vkCmdClearColorImage(passCommandBuffer_, target.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                             &transparent, 1, &range);
        transitionImage(passCommandBuffer_, target.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                        VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);

        FramePass pass;

        auto encoder = std::make_shared<CommandEncoder>();
        encoder->device = device_;
        encoder->commandBuffer = passCommandBuffer_;
        pass.encoder = encoder;

        auto frame = std::make_shared<SurfaceFrame>();
        frame->image = swapchainImages_[currentImageIndex_];
        frame->imageIndex = currentImageIndex_;
        frame->extent = swapchainExtent_;
        frame->format = kPresentationFormat;
        pass.frame = frame;

        auto msaaView = std::make_shared<TextureView>();
        msaaView->image = target.image;
        msaaView->view = target.view;
        msaaView->format = target.format;
        msaaView->samples = VK_SAMPLE_COUNT_4_BIT;
        msaaView->extent = {target.width, target.height};
        pass.msaaView = msaaView;

        auto resolveView = std::make_shared<TextureView>();
        resolveView->image = swapchainImages_[currentImageIndex_];
        resolveView->view = swapchainViews_[currentImageIndex_];
        resolveView->format = kPresentationFormat;
        resolveView->extent = swapchainExtent_;
        pass.resolveView = resolveView;

        return pass;
    }

    bool submitPass(const FramePass& pass, MultisampledTarget& target) override {
        if (!pass.encoder) return false;

        std::lock_guard<std::mutex> lock(mutex_);

        VkCommandBuffer cmd = pass.encoder->commandBuffer;
        if (vkEndCommandBuffer(cmd) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] submitPass: Failed to end command encoder\n");
            return false;
        }

        VkSubmitInfo submitInfo = {};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;

        vkResetFences(device_, 1, &passFence_);
        if (vkQueueSubmit(graphicsQueue_, 1, &submitInfo, passFence_) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] submitPass: Failed to submit command encoder\n");
            rearmFence(&passFence_);
            return false;
        }
        target.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        return true;
    }

    bool resolveAndPresent(const FramePass& pass, MultisampledTarget& target) override {
        if (!pass.complete()) return false;

        std::lock_guard<std::mutex> lock(mutex_);

        VkImage dst = pass.resolveView->image;
        VkCommandBuffer cmd = beginResolveCommands();

        transitionImage(cmd, dst, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        if (target.layout != VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL) {
            transitionImage(cmd, target.image, target.layout, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        }

        VkImageResolve region = {};
        region.srcSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        region.dstSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        region.extent = {std::min(target.width, pass.resolveView->extent.width),
                         std::min(target.height, pass.resolveView->extent.height), 1};
        vkCmdResolveImage(cmd, target.image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                          dst, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

        transitionImage(cmd, dst, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
        transitionImage(cmd, target.image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                        VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        target.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

        if (!submitResolveCommands(cmd)) return false;
        return present(pass.frame->imageIndex);
    }

    void discardFrame(const FramePass& pass) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (pass.encoder) {
            vkEndCommandBuffer(pass.encoder->commandBuffer);
        }

        // The acquired image still has to go back to the presentation engine
        VkImage image = swapchainImages_[currentImageIndex_];
        VkCommandBuffer cmd = beginResolveCommands();
        transitionImage(cmd, image, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
        VkClearColorValue clear = {};
        VkImageSubresourceRange range = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};
        vkCmdClearColorImage(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, &clear, 1, &range);
        transitionImage(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);

        if (submitResolveCommands(cmd)) {
            present(currentImageIndex_);
        }
    }

    std::optional<RasterImage> readTarget(MultisampledTarget& target) override {
        if (!initialized_ || target.image == VK_NULL_HANDLE) return std::nullopt;
        if (target.layout == VK_IMAGE_LAYOUT_UNDEFINED) {
            fprintf(stderr, "[Vulkan Context] readTarget: target has not been rendered\n");
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        vkDeviceWaitIdle(device_);

        struct Staging {
            VkDevice device;
            VkImage image = VK_NULL_HANDLE;
            VkDeviceMemory imageMemory = VK_NULL_HANDLE;
            VkBuffer buffer = VK_NULL_HANDLE;
            VkDeviceMemory bufferMemory = VK_NULL_HANDLE;

            explicit Staging(VkDevice d) : device(d) {}
            ~Staging() {
                if (buffer != VK_NULL_HANDLE) vkDestroyBuffer(device, buffer, nullptr);
                if (bufferMemory != VK_NULL_HANDLE) vkFreeMemory(device, bufferMemory, nullptr);
                if (image != VK_NULL_HANDLE) vkDestroyImage(device, image, nullptr);
                if (imageMemory != VK_NULL_HANDLE) vkFreeMemory(device, imageMemory, nullptr);
            }
        } staging(device_);

        // Single-sample image the target is resolved into
        VkImageCreateInfo imageInfo = {};
        imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
        imageInfo.imageType = VK_IMAGE_TYPE_2D;
        imageInfo.format = target.format;
        imageInfo.extent = {target.width, target.height, 1};
        imageInfo.mipLevels = 1;
        imageInfo.arrayLayers = 1;
        imageInfo.samples = VK_SAMPLE_COUNT_1_BIT;
        imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
        imageInfo.usage = VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

        if (vkCreateImage(device_, &imageInfo, nullptr, &staging.image) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] readTarget: Failed to create staging image\n");
            return std::nullopt;
        }

        VkMemoryRequirements requirements;
        vkGetImageMemoryRequirements(device_, staging.image, &requirements);
        VkMemoryAllocateInfo allocInfo = {};
        allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        allocInfo.allocationSize = requirements.size;
        if (!findMemoryType(requirements.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
                            &allocInfo.memoryTypeIndex) ||
            vkAllocateMemory(device_, &allocInfo, nullptr, &staging.imageMemory) != VK_SUCCESS ||
            vkBindImageMemory(device_, staging.image, staging.imageMemory, 0) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] readTarget: Failed to allocate staging image memory\n");
            return std::nullopt;
        }

        const VkDeviceSize rowBytes = VkDeviceSize(target.width) * 4;
        VkBufferCreateInfo bufferInfo = {};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = rowBytes * target.height;
        bufferInfo.usage = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        if (vkCreateBuffer(device_, &bufferInfo, nullptr, &staging.buffer) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] readTarget: Failed to create readback buffer\n");
            return std::nullopt;
        }

        vkGetBufferMemoryRequirements(device_, staging.buffer, &requirements);
        allocInfo.allocationSize = requirements.size;
        if (!findMemoryType(requirements.memoryTypeBits,
                            VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                            &allocInfo.memoryTypeIndex) ||
            vkAllocateMemory(device_, &allocInfo, nullptr, &staging.bufferMemory) != VK_SUCCESS ||
            vkBindBufferMemory(device_, staging.buffer, staging.bufferMemory, 0) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] readTarget: Failed to allocate readback buffer memory\n");
            return std::nullopt;
        }

        VkCommandBuffer cmd = beginResolveCommands();
        transitionImage(cmd, target.image, target.layout, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
        transitionImage(cmd, staging.image, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

        VkImageResolve resolve = {};
        resolve.srcSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        resolve.dstSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        resolve.extent = {target.width, target.height, 1};
        vkCmdResolveImage(cmd, target.image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                          staging.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &resolve);

        transitionImage(cmd, staging.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                        VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);

        VkBufferImageCopy copy = {};
        copy.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        copy.imageExtent = {target.width, target.height, 1};
        vkCmdCopyImageToBuffer(cmd, staging.image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, staging.buffer, 1, &copy);

        VkMemoryBarrier hostRead = {};
        hostRead.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
        hostRead.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        hostRead.dstAccessMask = VK_ACCESS_HOST_READ_BIT;
        vkCmdPipelineBarrier(cmd, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_HOST_BIT,
                             0, 1, &hostRead, 0, nullptr, 0, nullptr);

        transitionImage(cmd, target.image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, target.layout);

        if (!submitAndWait(cmd)) return std::nullopt;

        void* mapped = nullptr;
        if (vkMapMemory(device_, staging.bufferMemory, 0, bufferInfo.size, 0, &mapped) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] readTarget: Failed to map readback buffer\n");
            return std::nullopt;
        }

        // BGRA premultiplied storage to the RGBA straight-alpha image
        SkPixmap source(surfaceInfo(TargetFormat::Presentation, target.width, target.height), mapped,
                        static_cast<size_t>(rowBytes));
        RasterImage image(target.width, target.height);
        SkImageInfo dstInfo = SkImageInfo::Make(static_cast<int>(target.width), static_cast<int>(target.height),
                                                kRGBA_8888_SkColorType, kUnpremul_SkAlphaType,
                                                SkColorSpace::MakeSRGB());
        const bool converted = source.readPixels(dstInfo, image.pixels.data(), image.rowBytes(), 0, 0);
        vkUnmapMemory(device_, staging.bufferMemory);

        if (!converted) {
            fprintf(stderr, "[Vulkan Context] readTarget: Failed to convert %ux%u target pixels\n",
                    target.width, target.height);
            return std::nullopt;
        }
        return image;
    }

    void pollDevice() override {
        if (context_) {
            context_->checkAsyncWorkCompletion();
        }
    }

    const char* getBackendName() const override {
        return "Vulkan Graphite";
    }

private:
    bool fail(const std::string& message) {
        error_ = message;
        fprintf(stderr, "[Vulkan Context] Error: %s\n", message.c_str());
        destroy();
        return false;
    }

    bool createInstance() {
        std::vector<const char*> extensions;

        if (!headless_) {
            // Surface extensions for the window system
            unsigned int extensionCount = 0;
            if (!SDL_Vulkan_GetInstanceExtensions(window_, &extensionCount, nullptr)) {
                return fail("failed to get required extension count");
            }
            extensions.resize(extensionCount);
            if (!SDL_Vulkan_GetInstanceExtensions(window_, &extensionCount, extensions.data())) {
                return fail("failed to get required extensions");
            }
        }

#ifndef NDEBUG
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
#endif

        VkApplicationInfo appInfo = {};
        appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
        appInfo.pApplicationName = "Tessera";
        appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.pEngineName = "Skia Graphite";
        appInfo.engineVersion = VK_MAKE_VERSION(1, 0, 0);
        appInfo.apiVersion = VK_API_VERSION_1_1;

        VkInstanceCreateInfo createInfo = {};
        createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
        createInfo.pApplicationInfo = &appInfo;
        createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
        createInfo.ppEnabledExtensionNames = extensions.data();

#ifndef NDEBUG
        const char* validationLayers[] = { "VK_LAYER_KHRONOS_validation" };
        createInfo.enabledLayerCount = 1;
        createInfo.ppEnabledLayerNames = validationLayers;
#endif

        VkResult result = vkCreateInstance(&createInfo, nullptr, &instance_);
#ifndef NDEBUG
        if (result == VK_ERROR_LAYER_NOT_PRESENT || result == VK_ERROR_EXTENSION_NOT_PRESENT) {
            // Validation layers are optional
            extensions.pop_back();
            createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
            createInfo.enabledLayerCount = 0;
            createInfo.ppEnabledLayerNames = nullptr;
            result = vkCreateInstance(&createInfo, nullptr, &instance_);
        } else if (result == VK_SUCCESS) {
            VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo = {};
            debugCreateInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            debugCreateInfo.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                              VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            debugCreateInfo.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                          VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
            debugCreateInfo.pfnUserCallback = vulkanDebugCallback;

            auto createFunc = (PFN_vkCreateDebugUtilsMessengerEXT)
                vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT");
            if (createFunc) {
                createFunc(instance_, &debugCreateInfo, nullptr, &debugMessenger_);
            }
        }
#endif

        if (result != VK_SUCCESS) {
            return fail("failed to create Vulkan instance (VkResult: " + std::to_string(result) + ")");
        }
        return true;
    }

    bool supportsQueue(VkPhysicalDevice device, uint32_t* family) const {
        uint32_t queueFamilyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);
        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        for (uint32_t i = 0; i < queueFamilyCount; i++) {
            if (!(queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)) continue;

            if (!headless_) {
                VkBool32 presentSupport = VK_FALSE;
                vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface_, &presentSupport);
                if (!presentSupport) continue;
            }
            *family = i;
            return true;
        }
        return false;
    }

    bool pickPhysicalDevice() {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance_, &deviceCount, nullptr);
        if (deviceCount == 0) {
            return fail("no GPUs with Vulkan support found");
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance_, &deviceCount, devices.data());

        // Prefer discrete GPUs, never use CPU implementations (lavapipe, swiftshader)
        bool sawCpu = false;
        for (int pass = 0; pass < 2; ++pass) {
            for (VkPhysicalDevice device : devices) {
                VkPhysicalDeviceProperties props;
                vkGetPhysicalDeviceProperties(device, &props);

                if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_CPU) {
                    sawCpu = true;
                    continue;
                }
                if (pass == 0 && props.deviceType != VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
                    continue;
                }

                uint32_t family = 0;
                if (supportsQueue(device, &family)) {
                    physicalDevice_ = device;
                    graphicsQueueFamily_ = family;
                    printf("[Vulkan Context] Using GPU: %s\n", props.deviceName);
                    return true;
                }
            }
        }

        return fail(sawCpu ? "only cpu adapter found" : "no suitable GPU found");
    }

    bool createLogicalDevice() {
        float queuePriority = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo = {};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = graphicsQueueFamily_;
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;

        VkPhysicalDeviceFeatures deviceFeatures = {};

        VkDeviceCreateInfo createInfo = {};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos = &queueCreateInfo;
        createInfo.enabledExtensionCount = static_cast<uint32_t>(deviceExtensions().size());
        createInfo.ppEnabledExtensionNames = deviceExtensions().data();
        createInfo.pEnabledFeatures = &deviceFeatures;

        if (vkCreateDevice(physicalDevice_, &createInfo, nullptr, &device_) != VK_SUCCESS) {
            return fail("failed to create logical device");
        }

        vkGetDeviceQueue(device_, graphicsQueueFamily_, 0, &graphicsQueue_);
        presentQueue_ = graphicsQueue_;
        return true;
    }

    const std::vector<const char*>& deviceExtensions() const {
        static const std::vector<const char*> windowed = { VK_KHR_SWAPCHAIN_EXTENSION_NAME };
        static const std::vector<const char*> none;
        return headless_ ? none : windowed;
    }

    bool createCommandObjects() {
        VkCommandPoolCreateInfo poolInfo = {};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = graphicsQueueFamily_;

        if (vkCreateCommandPool(device_, &poolInfo, nullptr, &commandPool_) != VK_SUCCESS) {
            return fail("failed to create command pool");
        }

        VkCommandBuffer buffers[2] = {VK_NULL_HANDLE, VK_NULL_HANDLE};
        VkCommandBufferAllocateInfo allocInfo = {};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = commandPool_;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = 2;

        if (vkAllocateCommandBuffers(device_, &allocInfo, buffers) != VK_SUCCESS) {
            return fail("failed to allocate command buffers");
        }
        passCommandBuffer_ = buffers[0];
        resolveCommandBuffer_ = buffers[1];

        VkFenceCreateInfo fenceInfo = {};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        if (vkCreateFence(device_, &fenceInfo, nullptr, &passFence_) != VK_SUCCESS ||
            vkCreateFence(device_, &fenceInfo, nullptr, &resolveFence_) != VK_SUCCESS) {
            return fail("failed to create fences");
        }
        return true;
    }

    void destroyCommandObjects() {
        if (device_ == VK_NULL_HANDLE) return;

        if (passFence_ != VK_NULL_HANDLE) {
            vkDestroyFence(device_, passFence_, nullptr);
            passFence_ = VK_NULL_HANDLE;
        }
        if (resolveFence_ != VK_NULL_HANDLE) {
            vkDestroyFence(device_, resolveFence_, nullptr);
            resolveFence_ = VK_NULL_HANDLE;
        }
        if (commandPool_ != VK_NULL_HANDLE) {
            vkDestroyCommandPool(device_, commandPool_, nullptr);
            commandPool_ = VK_NULL_HANDLE;
            passCommandBuffer_ = VK_NULL_HANDLE;
            resolveCommandBuffer_ = VK_NULL_HANDLE;
        }
    }

    bool findMemoryType(uint32_t typeBits, VkMemoryPropertyFlags properties, uint32_t* index) const {
        VkPhysicalDeviceMemoryProperties memoryProps;
        vkGetPhysicalDeviceMemoryProperties(physicalDevice_, &memoryProps);
        for (uint32_t i = 0; i < memoryProps.memoryTypeCount; i++) {
            if ((typeBits & (1u << i)) && (memoryProps.memoryTypes[i].propertyFlags & properties) == properties) {
                *index = i;
                return true;
            }
        }
        return false;
    }

    bool createSwapchain() {
        VkSurfaceCapabilitiesKHR capabilities;
        vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physicalDevice_, surface_, &capabilities);

        if (capabilities.currentExtent.width != UINT32_MAX) {
            swapchainExtent_ = capabilities.currentExtent;
        } else {
            swapchainExtent_.width = std::max(capabilities.minImageExtent.width,
                std::min(capabilities.maxImageExtent.width, swapchainExtent_.width));
            swapchainExtent_.height = std::max(capabilities.minImageExtent.height,
                std::min(capabilities.maxImageExtent.height, swapchainExtent_.height));
        }

        // Minimized windows report a zero extent; try again on the next frame
        if (swapchainExtent_.width == 0 || swapchainExtent_.height == 0) {
            return false;
        }

        uint32_t imageCount = capabilities.minImageCount + 1;
        if (capabilities.maxImageCount > 0 && imageCount > capabilities.maxImageCount) {
            imageCount = capabilities.maxImageCount;
        }

        VkSwapchainCreateInfoKHR createInfo = {};
        createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
        createInfo.surface = surface_;
        createInfo.minImageCount = imageCount;
        createInfo.imageFormat = kPresentationFormat;
        createInfo.imageColorSpace = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
        createInfo.imageExtent = swapchainExtent_;
        createInfo.imageArrayLayers = 1;
        createInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
        createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
        createInfo.preTransform = capabilities.currentTransform;
        createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        createInfo.presentMode = vsyncEnabled_ ? VK_PRESENT_MODE_FIFO_KHR : VK_PRESENT_MODE_IMMEDIATE_KHR;
        createInfo.clipped = VK_TRUE;
        createInfo.oldSwapchain = VK_NULL_HANDLE;

        if (vkCreateSwapchainKHR(device_, &createInfo, nullptr, &swapchain_) != VK_SUCCESS) {
            error_ = "failed to create swapchain";
            fprintf(stderr, "[Vulkan Context] Error: Failed to create swapchain\n");
            return false;
        }

        vkGetSwapchainImagesKHR(device_, swapchain_, &imageCount, nullptr);
        swapchainImages_.resize(imageCount);
        vkGetSwapchainImagesKHR(device_, swapchain_, &imageCount, swapchainImages_.data());

        for (VkImage image : swapchainImages_) {
            VkImageViewCreateInfo viewInfo = {};
            viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            viewInfo.image = image;
            viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
            viewInfo.format = kPresentationFormat;
            viewInfo.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

            VkImageView view = VK_NULL_HANDLE;
            if (vkCreateImageView(device_, &viewInfo, nullptr, &view) != VK_SUCCESS) {
                fprintf(stderr, "[Vulkan Context] Error: Failed to create swapchain image view\n");
                return false;
            }
            swapchainViews_.push_back(view);
        }

        VkSemaphoreCreateInfo semaphoreInfo = {};
        semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

        if (vkCreateSemaphore(device_, &semaphoreInfo, nullptr, &imageAvailableSemaphore_) != VK_SUCCESS ||
            vkCreateSemaphore(device_, &semaphoreInfo, nullptr, &renderFinishedSemaphore_) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to create semaphores\n");
            return false;
        }

        printf("[Vulkan Context] Created swapchain: %ux%u with %zu images (%s)\n",
               swapchainExtent_.width, swapchainExtent_.height, swapchainImages_.size(),
               vsyncEnabled_ ? "fifo" : "immediate");
        return true;
    }

    void destroySwapchain() {
        if (device_ == VK_NULL_HANDLE) return;

        if (imageAvailableSemaphore_ != VK_NULL_HANDLE) {
            vkDestroySemaphore(device_, imageAvailableSemaphore_, nullptr);
            imageAvailableSemaphore_ = VK_NULL_HANDLE;
        }

        if (renderFinishedSemaphore_ != VK_NULL_HANDLE) {
            vkDestroySemaphore(device_, renderFinishedSemaphore_, nullptr);
            renderFinishedSemaphore_ = VK_NULL_HANDLE;
        }

        for (VkImageView view : swapchainViews_) {
            vkDestroyImageView(device_, view, nullptr);
        }
        swapchainViews_.clear();
        swapchainImages_.clear();

        if (swapchain_ != VK_NULL_HANDLE) {
            vkDestroySwapchainKHR(device_, swapchain_, nullptr);
            swapchain_ = VK_NULL_HANDLE;
        }
    }

    VkCommandBuffer beginResolveCommands() {
        vkWaitForFences(device_, 1, &resolveFence_, VK_TRUE, UINT64_MAX);
        vkResetCommandBuffer(resolveCommandBuffer_, 0);

        VkCommandBufferBeginInfo beginInfo = {};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        vkBeginCommandBuffer(resolveCommandBuffer_, &beginInfo);
        return resolveCommandBuffer_;
    }

    bool submitResolveCommands(VkCommandBuffer cmd) {
        if (vkEndCommandBuffer(cmd) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to record resolve commands\n");
            return false;
        }

        VkPipelineStageFlags waitStage = VK_PIPELINE_STAGE_TRANSFER_BIT;
        VkSubmitInfo submitInfo = {};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.waitSemaphoreCount = 1;
        submitInfo.pWaitSemaphores = &imageAvailableSemaphore_;
        submitInfo.pWaitDstStageMask = &waitStage;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;
        submitInfo.signalSemaphoreCount = 1;
        submitInfo.pSignalSemaphores = &renderFinishedSemaphore_;

        vkResetFences(device_, 1, &resolveFence_);
        if (vkQueueSubmit(graphicsQueue_, 1, &submitInfo, resolveFence_) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to submit resolve commands\n");
            rearmFence(&resolveFence_);
            return false;
        }
        return true;
    }

    // Submit without semaphores and block until the queue has run it
    bool submitAndWait(VkCommandBuffer cmd) {
        if (vkEndCommandBuffer(cmd) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to record readback commands\n");
            return false;
        }

        VkSubmitInfo submitInfo = {};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;

        vkResetFences(device_, 1, &resolveFence_);
        if (vkQueueSubmit(graphicsQueue_, 1, &submitInfo, resolveFence_) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to submit readback commands\n");
            rearmFence(&resolveFence_);
            return false;
        }
        vkWaitForFences(device_, 1, &resolveFence_, VK_TRUE, UINT64_MAX);
        return true;
    }

    /**
     * A fence reset for a submit that never reached the queue would block the
     * next wait forever. Replace it with a fresh signaled one.
     */
    void rearmFence(VkFence* fence) {
        vkDestroyFence(device_, *fence, nullptr);
        *fence = VK_NULL_HANDLE;

        VkFenceCreateInfo fenceInfo = {};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;
        if (vkCreateFence(device_, &fenceInfo, nullptr, fence) != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] Error: Failed to recreate fence\n");
        }
    }

    bool present(uint32_t imageIndex) {
        VkPresentInfoKHR presentInfo = {};
        presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
        presentInfo.waitSemaphoreCount = 1;
        presentInfo.pWaitSemaphores = &renderFinishedSemaphore_;
        presentInfo.swapchainCount = 1;
        presentInfo.pSwapchains = &swapchain_;
        presentInfo.pImageIndices = &imageIndex;

        VkResult result = vkQueuePresentKHR(presentQueue_, &presentInfo);
        if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR) {
            // Swapchain is recreated on the next acquire
            return true;
        }
        if (result != VK_SUCCESS) {
            fprintf(stderr, "[Vulkan Context] present: Failed to present swapchain image\n");
            return false;
        }
        return true;
    }

    bool createGraphiteContext() {
        VkPhysicalDeviceFeatures2 features2 = {};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        vkGetPhysicalDeviceFeatures2(physicalDevice_, &features2);

        const std::vector<const char*>& extensions = deviceExtensions();
        skgpu::VulkanExtensions skiaExtensions;
        skiaExtensions.init(
            vkGetInstanceProcAddr,
            instance_,
            physicalDevice_,
            0, nullptr,  // instance extensions (already created)
            static_cast<uint32_t>(extensions.size()), extensions.data()
        );

        skgpu::VulkanBackendContext backendContext;
        backendContext.fInstance = instance_;
        backendContext.fPhysicalDevice = physicalDevice_;
        backendContext.fDevice = device_;
        backendContext.fQueue = graphicsQueue_;
        backendContext.fGraphicsQueueIndex = graphicsQueueFamily_;
        backendContext.fMaxAPIVersion = VK_API_VERSION_1_1;
        backendContext.fVkExtensions = &skiaExtensions;
        backendContext.fDeviceFeatures2 = &features2;
        backendContext.fGetProc = [](const char* name, VkInstance instance, VkDevice device) {
            if (device) {
                return vkGetDeviceProcAddr(device, name);
            }
            return vkGetInstanceProcAddr(instance, name);
        };

        skgpu::graphite::ContextOptions options;

        context_ = skgpu::graphite::ContextFactory::MakeVulkan(backendContext, options);
        if (!context_) {
            return fail("failed to create Skia Graphite context");
        }
        return true;
    }

    SDL_Window* window_ = nullptr;
    bool headless_ = false;
    bool libraryLoaded_ = false;
    std::string error_;

    // Vulkan objects
    VkInstance instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    VkQueue graphicsQueue_ = VK_NULL_HANDLE;
    VkQueue presentQueue_ = VK_NULL_HANDLE;
    uint32_t graphicsQueueFamily_ = 0;

    // Frame commands
    VkCommandPool commandPool_ = VK_NULL_HANDLE;
    VkCommandBuffer passCommandBuffer_ = VK_NULL_HANDLE;
    VkCommandBuffer resolveCommandBuffer_ = VK_NULL_HANDLE;
    VkFence passFence_ = VK_NULL_HANDLE;
    VkFence resolveFence_ = VK_NULL_HANDLE;

    // Swapchain
    VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
    std::vector<VkImage> swapchainImages_;
    std::vector<VkImageView> swapchainViews_;
    VkExtent2D swapchainExtent_ = {0, 0};
    VkSemaphore imageAvailableSemaphore_ = VK_NULL_HANDLE;
    VkSemaphore renderFinishedSemaphore_ = VK_NULL_HANDLE;
    uint32_t currentImageIndex_ = 0;

#ifndef NDEBUG
    VkDebugUtilsMessengerEXT debugMessenger_ = VK_NULL_HANDLE;
#endif

    // Skia Graphite
    std::unique_ptr<skgpu::graphite::Context> context_;

    bool initialized_ = false;
    bool vsyncEnabled_ = true;
    std::mutex mutex_;
};

std::shared_ptr<GpuContext> createGpuContext(SDL_Window* window, bool vsync, std::string* error) {
    auto context = std::make_shared<VulkanGpuContext>();
    if (!context->initialize(window, vsync)) {
        if (error) {
            *error = context->lastError();
        }
        return nullptr;
    }
    return context;
}

} // namespace tessera

#endif // TESSERA_VULKAN_AVAILABLE
