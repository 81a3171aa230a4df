#include "cornell/engine/engine.hh"

#include <iostream>
#include <array>

#include "webgpu/webgpu_cpp.h"
#include "webgpu/webgpu_glfw.h"
#include "dawn/dawn_proc.h"
#include "dawn/native/DawnNative.h"
#include "GLFW/glfw3.h"

//
// Activity:
//

namespace cornell {
  Activity::Activity(Engine &engine)
  : m_engine(engine)
  {}
}
namespace cornell {
  void Activity::activate() {}
  void Activity::update(double dt_sec) { (void)dt_sec; }
  void Activity::draw(Frame &frame) { (void)frame; }
  void Activity::onKey(int key) { (void)key; }
  void Activity::deactivate() {}
}
namespace cornell {
  Engine &Activity::engine() {
    return m_engine;
  }
}

//
// GLFW instance:
//

namespace cornell {
  Glfw::Glfw(glm::ivec2 size, const char *caption)
  : m_window(nullptr)
  {
    CHECK(glfwInit(), "Failed to initialize GLFW");

    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_COCOA_RETINA_FRAMEBUFFER, GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
    m_window = glfwCreateWindow(size.x, size.y, caption, nullptr, nullptr);
    CHECK(m_window != nullptr, "Failed to create a window with GLFW");
  }
  Glfw::~Glfw() {
    glfwDestroyWindow(m_window);
    glfwTerminate();
  }
}
namespace cornell {
  GLFWwindow *Glfw::window() const {
    return m_window;
  }
}

//
// Engine
//

namespace cornell {
  Engine::Engine(glm::ivec2 size, const char *caption)
  : m_glfw(size, caption),
    m_wgpu_instance(nullptr),
    m_wgpu_surface(nullptr),
    m_wgpu_adapter(nullptr),
    m_wgpu_device(nullptr),
    m_wgpu_swapchain(nullptr),
    m_framebuffer_size(),
    m_surface_storage_capable(false),
    m_activity(nullptr),
    m_prev_update_timestamp_sec(0.0),
    m_curr_update_timestamp_sec(0.0),
    m_curr_update_dt_sec(0.0),
    m_is_running(false)
  {
    dawnProcSetProcs(&dawn::native::GetProcs());

    int framebuffer_width, framebuffer_height;
    glfwGetFramebufferSize(m_glfw.window(), &framebuffer_width, &framebuffer_height);
    CHECK(framebuffer_width > 0 && framebuffer_height > 0, "Expected a non-empty framebuffer");
    m_framebuffer_size = glm::uvec2{static_cast<uint32_t>(framebuffer_width), static_cast<uint32_t>(framebuffer_height)};

    wgpu::InstanceDescriptor instance_descriptor = {};
    m_wgpu_instance = wgpu::CreateInstance(&instance_descriptor);
    CHECK(m_wgpu_instance != nullptr, "Failed to create a WebGPU instance");

    m_wgpu_surface = wgpu::glfw::CreateSurfaceForWindow(m_wgpu_instance, m_glfw.window());
    CHECK(m_wgpu_surface != nullptr, "Failed to create a WebGPU surface");

    wgpu::RequestAdapterOptions adapter_opts = {
      .compatibleSurface = m_wgpu_surface,
      .powerPreference = wgpu::PowerPreference::HighPerformance,
    };
    m_wgpu_adapter = requestAdapter(m_wgpu_instance, &adapter_opts);
    logAdapterProperties(m_wgpu_adapter);
    checkAdapterLimits(m_wgpu_adapter);

    // Writing the surface from a compute pass needs BGRA8 storage support; without it, the activity presents through an
    // intermediate texture.
    m_surface_storage_capable = m_wgpu_adapter.HasFeature(wgpu::FeatureName::BGRA8UnormStorage);
    std::array<wgpu::FeatureName, 1> required_features = {wgpu::FeatureName::BGRA8UnormStorage};

    wgpu::RequiredLimits required_limits = {};
    required_limits.limits.maxComputeWorkgroupSizeX = ENGINE_REQUIRED_COMPUTE_WORKGROUP_SIZE_X;
    required_limits.limits.maxComputeInvocationsPerWorkgroup = ENGINE_REQUIRED_COMPUTE_INVOCATIONS_PER_WORKGROUP;

    wgpu::DeviceDescriptor device_descriptor = {
      .nextInChain = nullptr,
      .label = "Cornell.Engine.DeviceDescriptor",
      .requiredFeaturesCount = m_surface_storage_capable ? static_cast<uint32_t>(required_features.size()) : 0U,
      .requiredFeatures = m_surface_storage_capable ? required_features.data() : nullptr,
      .requiredLimits = &required_limits,
      .defaultQueue = {
        .nextInChain = nullptr,
        .label = "Cornell.Engine.DefaultQueue",
      },
    };
    m_wgpu_device = requestDevice(m_wgpu_adapter, &device_descriptor);
    m_wgpu_device.SetUncapturedErrorCallback(Engine::onUncapturedWgpuError, nullptr);
    m_wgpu_device.SetLoggingCallback(Engine::onWgpuLog, nullptr);
    m_wgpu_device.SetDeviceLostCallback(Engine::onWgpuDeviceLost, nullptr);

    wgpu::TextureUsage swapchain_usage = wgpu::TextureUsage::RenderAttachment;
    if (m_surface_storage_capable) {
      swapchain_usage = swapchain_usage | wgpu::TextureUsage::StorageBinding;
    }
    wgpu::SwapChainDescriptor swapchain_descriptor = {
      .nextInChain = nullptr,
      .label = "Cornell.Engine.SwapchainDescriptor",
      .usage = swapchain_usage,
      .format = ENGINE_SURFACE_FORMAT,
      .width = m_framebuffer_size.x,
      .height = m_framebuffer_size.y,
      .presentMode = wgpu::PresentMode::Fifo,
    };
    m_wgpu_swapchain = m_wgpu_device.CreateSwapChain(m_wgpu_surface, &swapchain_descriptor);
    CHECK(m_wgpu_swapchain != nullptr, "Failed to create a WebGPU swapchain");

    std::cerr
      << fmt::format(
        "Cornell: presenting {}x{} {}",
        m_framebuffer_size.x,
        m_framebuffer_size.y,
        m_surface_storage_capable ? "directly to the surface" : "through an intermediate texture"
      )
      << std::endl;

    glfwSetWindowUserPointer(m_glfw.window(), this);
    glfwSetKeyCallback(m_glfw.window(), Engine::onGlfwKey);
  }
  Engine::~Engine() {
    if (m_activity) {
      m_activity->deactivate();
      m_activity.reset();
    }
    glfwSetWindowUserPointer(m_glfw.window(), nullptr);
  }
}
namespace cornell {
  void Engine::run(Activity::BuildCb build_cb) {
    CHECK(m_activity == nullptr, "Expected 'run' to be called at most once");
    m_activity = build_cb(*this);
    CHECK(m_activity != nullptr, "Expected activity builder to return an activity");
    m_activity->activate();

    m_prev_update_timestamp_sec = glfwGetTime();
    m_is_running = true;
    glfwShowWindow(m_glfw.window());
    while (m_is_running && !glfwWindowShouldClose(m_glfw.window())) {
      beginFrame();
      dispatchEvents();
      update();
      draw();
    }
    m_is_running = false;

    m_activity->deactivate();
    m_activity.reset();
  }
  void Engine::halt() {
    m_is_running = false;
  }
}
namespace cornell {
  wgpu::Device &Engine::device() {
    return m_wgpu_device;
  }
  glm::uvec2 Engine::framebufferSize() const {
    return m_framebuffer_size;
  }
  wgpu::TextureFormat Engine::surfaceFormat() const {
    return ENGINE_SURFACE_FORMAT;
  }
  bool Engine::isSurfaceStorageCapable() const {
    return m_surface_storage_capable;
  }
}
namespace cornell {
  void Engine::beginFrame() {
    m_curr_update_timestamp_sec = glfwGetTime();
    m_curr_update_dt_sec = m_curr_update_timestamp_sec - m_prev_update_timestamp_sec;
    m_prev_update_timestamp_sec = m_curr_update_timestamp_sec;
  }
  void Engine::dispatchEvents() {
    glfwPollEvents();
  }
  void Engine::update() {
    m_activity->update(m_curr_update_dt_sec);
  }
  void Engine::draw() {
    {
      wgpu::TextureView target_texture_view = m_wgpu_swapchain.GetCurrentTextureView();
      CHECK(target_texture_view != nullptr, "Cannot acquire next swapchain texture view");
      {
        Frame frame{m_wgpu_device, target_texture_view, m_framebuffer_size};
        m_activity->draw(frame);
        // 'frame' goes out of scope here, submitting every pass recorded into it.
      }
    }
    // Completes pending map requests, e.g. lightmap takeouts:
    m_wgpu_instance.ProcessEvents();
    m_wgpu_swapchain.Present();
  }
}
namespace cornell {
  struct AdapterData { WGPUAdapter adapter; bool request_ended; };
  struct DeviceData { WGPUDevice device; bool request_ended; };
  wgpu::Adapter Engine::requestAdapter(wgpu::Instance instance, wgpu::RequestAdapterOptions const *options) {
    AdapterData adapter_data{nullptr, false};
    auto const on_adapter_request_ended = [](WGPURequestAdapterStatus status, WGPUAdapter adapter, char const *message, void *p_user_data) {
      auto &data = *reinterpret_cast<AdapterData*>(p_user_data);
      CHECK(
        status == WGPURequestAdapterStatus_Success,
        [message] () { return fmt::format("Could not get WebGPU adapter: {}", message ? message : "<no message>"); }
      );
      data.adapter = adapter;
      data.request_ended = true;
    };
    instance.RequestAdapter(options, on_adapter_request_ended, reinterpret_cast<void*>(&adapter_data));
    CHECK(adapter_data.request_ended, "expected async call to wgpuInstanceRequestAdapter to actually be sync");
    return wgpu::Adapter::Acquire(adapter_data.adapter);
  }
  wgpu::Device Engine::requestDevice(wgpu::Adapter adapter, wgpu::DeviceDescriptor const *descriptor) {
    DeviceData device_data{nullptr, false};
    auto const on_device_request_ended = [](WGPURequestDeviceStatus status, WGPUDevice device, char const *message, void *p_user_data) {
      DeviceData& data = *reinterpret_cast<DeviceData*>(p_user_data);
      CHECK(
        status == WGPURequestDeviceStatus_Success,
        [message] () { return fmt::format("Could not get WebGPU device: {}", message ? message : "<no message>"); }
      );
      data.device = device;
      data.request_ended = true;
    };
    adapter.RequestDevice(descriptor, on_device_request_ended, reinterpret_cast<void*>(&device_data));
    CHECK(device_data.request_ended, "expected async call to wgpuAdapterRequestDevice to actually be sync");
    return wgpu::Device::Acquire(device_data.device);
  }
  void Engine::logAdapterProperties(wgpu::Adapter &adapter) {
    wgpu::AdapterProperties properties = {};
    adapter.GetProperties(&properties);
    std::cerr
      << fmt::format(
        "Cornell: using adapter '{}' ({})",
        properties.name ? properties.name : "<unnamed>",
        getBackendTypeStr(properties.backendType)
      )
      << std::endl;
  }
  void Engine::checkAdapterLimits(wgpu::Adapter &adapter) {
    wgpu::SupportedLimits supported_limits = {};
    CHECK(adapter.GetLimits(&supported_limits), "Failed to query WebGPU adapter limits");
    auto const &limits = supported_limits.limits;
    CHECK(
      limits.maxComputeWorkgroupSizeX >= ENGINE_REQUIRED_COMPUTE_WORKGROUP_SIZE_X,
      [&limits] () {
        return fmt::format(
          "Adapter supports maxComputeWorkgroupSizeX={}, need at least {}",
          limits.maxComputeWorkgroupSizeX,
          ENGINE_REQUIRED_COMPUTE_WORKGROUP_SIZE_X
        );
      }
    );
    CHECK(
      limits.maxComputeInvocationsPerWorkgroup >= ENGINE_REQUIRED_COMPUTE_INVOCATIONS_PER_WORKGROUP,
      [&limits] () {
        return fmt::format(
          "Adapter supports maxComputeInvocationsPerWorkgroup={}, need at least {}",
          limits.maxComputeInvocationsPerWorkgroup,
          ENGINE_REQUIRED_COMPUTE_INVOCATIONS_PER_WORKGROUP
        );
      }
    );
  }
}
namespace cornell {
  void Engine::onUncapturedWgpuError(WGPUErrorType error_type, const char *message, void *p_user_data) {
    (void)p_user_data;
    std::cerr << fmt::format("WGPU: uncaptured {} error: {}", getErrorTypeStr(error_type), message) << std::endl;
  }
  void Engine::onWgpuLog(WGPULoggingType log_type, const char *message, void* p_user_data) {
    (void)p_user_data;
    std::cerr << "WGPU: " << getLoggingTypeStr(log_type) << ": " << message << std::endl;
  }
  void Engine::onWgpuDeviceLost(WGPUDeviceLostReason reason, const char *message, void *p_user_data) {
    (void)p_user_data;
    if (reason == WGPUDeviceLostReason_Destroyed) {
      return;
    }
    PANIC("WebGPU device lost: {}", message ? message : "<no message>");
  }
  void Engine::onGlfwKey(GLFWwindow *window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    if (action != GLFW_PRESS) {
      return;
    }
    if (key == GLFW_KEY_ESCAPE) {
      glfwSetWindowShouldClose(window, GLFW_TRUE);
      return;
    }
    auto engine = reinterpret_cast<Engine*>(glfwGetWindowUserPointer(window));
    if (engine && engine->m_activity) {
      engine->m_activity->onKey(key);
    }
  }
  const char *Engine::getErrorTypeStr(WGPUErrorType error_type) {
    switch (error_type) {
      case WGPUErrorType_NoError:
        return "NoError";
      case WGPUErrorType_Validation:
        return "Validation";
      case WGPUErrorType_OutOfMemory:
        return "OutOfMemory";
      case WGPUErrorType_Internal:
        return "Internal";
      case WGPUErrorType_Unknown:
        return "Unknown";
      case WGPUErrorType_DeviceLost:
        return "DeviceLost";
      default:
        return "<NotImplemented>";
    }
  }
  const char *Engine::getLoggingTypeStr(WGPULoggingType logging_type) {
    switch (logging_type) {
      case WGPULoggingType_Error:
        return "ERROR";
      case WGPULoggingType_Warning:
        return "WARNING";
      case WGPULoggingType_Info:
        return "INFO";
      case WGPULoggingType_Verbose:
        return "VERBOSE";
      default:
        return "<NotImplemented>";
    }
  }
  const char *Engine::getBackendTypeStr(wgpu::BackendType backend_type) {
    switch (backend_type) {
      case wgpu::BackendType::Null:
        return "Null";
      case wgpu::BackendType::D3D11:
        return "D3D11";
      case wgpu::BackendType::D3D12:
        return "D3D12";
      case wgpu::BackendType::Metal:
        return "Metal";
      case wgpu::BackendType::Vulkan:
        return "Vulkan";
      case wgpu::BackendType::OpenGL:
        return "OpenGL";
      case wgpu::BackendType::OpenGLES:
        return "OpenGLES";
      default:
        return "<NotImplemented>";
    }
  }
}
