#pragma once

#include <functional>
#include <memory>
#include <cstdint>

#include "webgpu/webgpu_cpp.h"
#include "glm/vec2.hpp"

#include "core.hh"
#include "gpu.hh"

struct GLFWwindow;

namespace cornell {
  class Engine;
  class Glfw;
  class Activity;
}

namespace cornell {
  static const uint32_t ENGINE_REQUIRED_COMPUTE_WORKGROUP_SIZE_X = 256;
  static const uint32_t ENGINE_REQUIRED_COMPUTE_INVOCATIONS_PER_WORKGROUP = 256;
  static const wgpu::TextureFormat ENGINE_SURFACE_FORMAT = wgpu::TextureFormat::BGRA8Unorm;
}

namespace cornell {
  class Activity {
  public:
    using BuildCb = std::function<std::unique_ptr<Activity>(Engine &engine)>;
  private:
    Engine &m_engine;
  protected:
    Activity(Engine &engine);
  public:
    Activity() = delete;
    Activity(Activity const &other) = delete;
    Activity(Activity &&other) = delete;
  public:
    virtual ~Activity() = default;
  public:
    virtual void activate();
    virtual void update(double dt_sec);
    virtual void draw(Frame &frame);
    virtual void onKey(int key);
    virtual void deactivate();
  public:
    Engine &engine();
  };
}

namespace cornell {
  class Glfw {
  private:
    GLFWwindow *m_window;
  public:
    Glfw(glm::ivec2 size, const char *caption);
    ~Glfw();
  public:
    GLFWwindow *window() const;
  };
}

namespace cornell {
  /// Engine owns the window and the WebGPU device, and drives a single activity through the frame loop until the
  /// window closes or `halt()` is called.
  class Engine {
  private:
    Glfw m_glfw;
    wgpu::Instance m_wgpu_instance;
    wgpu::Surface m_wgpu_surface;
    wgpu::Adapter m_wgpu_adapter;
    wgpu::Device m_wgpu_device;
    wgpu::SwapChain m_wgpu_swapchain;
    glm::uvec2 m_framebuffer_size;
    bool m_surface_storage_capable;
    std::unique_ptr<Activity> m_activity;
    double m_prev_update_timestamp_sec;
    double m_curr_update_timestamp_sec;
    double m_curr_update_dt_sec;
    bool m_is_running;
  public:
    Engine(glm::ivec2 size, const char *caption);
    ~Engine();
  public:
    void run(Activity::BuildCb build_cb);
    void halt();
  public:
    wgpu::Device &device();
    glm::uvec2 framebufferSize() const;
    wgpu::TextureFormat surfaceFormat() const;
    bool isSurfaceStorageCapable() const;
  private:
    void beginFrame();
    void dispatchEvents();
    void update();
    void draw();
  private:
    static wgpu::Adapter requestAdapter(wgpu::Instance instance, wgpu::RequestAdapterOptions const *options);
    static wgpu::Device requestDevice(wgpu::Adapter adapter, wgpu::DeviceDescriptor const *descriptor);
    static void logAdapterProperties(wgpu::Adapter &adapter);
    static void checkAdapterLimits(wgpu::Adapter &adapter);
  private:
    static void onUncapturedWgpuError(WGPUErrorType error_type, const char *message, void *p_user_data);
    static void onWgpuLog(WGPULoggingType logging_type, const char *message, void *p_user_data);
    static void onWgpuDeviceLost(WGPUDeviceLostReason reason, const char *message, void *p_user_data);
    static void onGlfwKey(GLFWwindow *window, int key, int scancode, int action, int mods);
    static const char *getErrorTypeStr(WGPUErrorType error_type);
    static const char *getLoggingTypeStr(WGPULoggingType error_type);
    static const char *getBackendTypeStr(wgpu::BackendType backend_type);
  };
}
