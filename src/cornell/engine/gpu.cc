#include "cornell/engine/gpu.hh"

#include <sstream>

#include "cornell/engine/config.hh"

//
// Shader modules:
//

namespace cornell {
  std::string shaderFilePath(const char *filename) {
    return fmt::format("{}/shader/cornell/{}", CORNELL_RESOURCE_DIR, filename);
  }
  std::string readShaderFiles(std::initializer_list<const char *> filenames) {
    std::string shader_text;
    for (auto filename: filenames) {
      shader_text += readTextFile(shaderFilePath(filename).c_str());
      shader_text += "\n";
    }
    return shader_text;
  }
}
namespace cornell {
  wgpu::ShaderModule createShaderModuleVariant(
    wgpu::Device &device,
    const char *label,
    const char *filepath,
    const std::string &raw_shader_text,
    std::unordered_map<std::string, std::string> const &rw_map
  ) {
    std::string shader_text = replaceAll(raw_shader_text, rw_map);
    return createShaderModule(device, label, filepath, shader_text);
  }
  wgpu::ShaderModule createShaderModule(
    wgpu::Device &device,
    const char *label,
    const char *filepath,
    const std::string &shader_text
  ) {
    // Compiling:
    wgpu::ShaderModuleWGSLDescriptor shader_module_wgsl_descriptor;
    shader_module_wgsl_descriptor.nextInChain = nullptr;
    shader_module_wgsl_descriptor.code = shader_text.c_str();
    wgpu::ShaderModuleDescriptor shader_module_descriptor = {
      .nextInChain = &shader_module_wgsl_descriptor,
      .label = label,
    };
    auto shader_module = device.CreateShaderModule(&shader_module_descriptor);

    // Checking:
    struct ShaderCompileResult { const char *filepath; bool completed; };
    ShaderCompileResult result = {filepath, false};
    shader_module.GetCompilationInfo(
      [] (WGPUCompilationInfoRequestStatus status, const WGPUCompilationInfo *info, void *userdata) {
        auto data = reinterpret_cast<ShaderCompileResult*>(userdata);
        bool has_errors = false;
        for (size_t i = 0; info && i < info->messageCount; i++) {
          has_errors = has_errors || info->messages[i].type == WGPUCompilationMessageType_Error;
        }
        auto error_thunk = [data, info] () {
          std::stringstream ss;
          ss << "Shader compilation failed:" << std::endl;
          for (size_t i = 0; info && i < info->messageCount; i++) {
            auto const &message = info->messages[i];
            ss
              << "* " << message.message << std::endl
              << "  see: " << data->filepath << ":" << message.lineNum << ":" << message.linePos << std::endl;
          }
          return ss.str();
        };
        CHECK(status == WGPUCompilationInfoRequestStatus_Success && !has_errors, error_thunk);
        data->completed = true;
      },
      &result
    );
    CHECK(result.completed, "Expected shader compilation check to be sync, not async");

    // All done:
    return shader_module;
  }
}
namespace cornell {
  wgpu::PipelineLayout createPipelineLayout(
    wgpu::Device &device,
    const char *label,
    std::span<const wgpu::BindGroupLayout> bind_group_layouts
  ) {
    wgpu::PipelineLayoutDescriptor descriptor = {
      .label = label,
      .bindGroupLayoutCount = bind_group_layouts.size(),
      .bindGroupLayouts = bind_group_layouts.data(),
    };
    return device.CreatePipelineLayout(&descriptor);
  }
}

//
// RenderTarget:
//

namespace cornell {
  RenderTarget::RenderTarget(wgpu::Texture texture, wgpu::TextureView view, glm::uvec2 size, wgpu::TextureFormat format)
  : m_texture(std::move(texture)),
    m_view(std::move(view)),
    m_size(size),
    m_format(format)
  {}
}
namespace cornell {
  RenderTarget RenderTarget::create(
    wgpu::Device &device,
    const std::string &label,
    glm::uvec2 size,
    wgpu::TextureFormat format,
    wgpu::TextureUsage usage
  ) {
    std::string texture_label = label + ".Texture";
    std::string view_label = label + ".View";
    wgpu::TextureDescriptor texture_descriptor = {
      .label = texture_label.c_str(),
      .usage = usage,
      .dimension = wgpu::TextureDimension::e2D,
      .size = wgpu::Extent3D {
        .width = size.x,
        .height = size.y,
      },
      .format = format,
      .mipLevelCount = 1,
      .sampleCount = 1,
    };
    wgpu::Texture texture = device.CreateTexture(&texture_descriptor);

    wgpu::TextureViewDescriptor view_descriptor = {
      .label = view_label.c_str(),
      .format = format,
      .dimension = wgpu::TextureViewDimension::e2D,
      .baseMipLevel = 0,
      .mipLevelCount = 1,
      .baseArrayLayer = 0,
      .arrayLayerCount = 1,
      .aspect = wgpu::TextureAspect::All,
    };
    wgpu::TextureView view = texture.CreateView(&view_descriptor);

    return {std::move(texture), std::move(view), size, format};
  }
}
namespace cornell {
  wgpu::Texture const &RenderTarget::texture() const {
    return m_texture;
  }
  wgpu::TextureView const &RenderTarget::view() const {
    return m_view;
  }
  glm::uvec2 RenderTarget::size() const {
    return m_size;
  }
  wgpu::TextureFormat RenderTarget::format() const {
    return m_format;
  }
}

//
// Frame:
//

namespace cornell {
  wgpu::CommandEncoderDescriptor Frame::s_command_encoder_descriptor = {
    .label = "Cornell.Frame.CommandEncoder",
  };
}
namespace cornell {
  Frame::Frame(wgpu::Device &device, wgpu::TextureView surface_view, glm::uvec2 surface_size)
  : m_device(device),
    m_encoder(device.CreateCommandEncoder(&s_command_encoder_descriptor)),
    m_surface_view(std::move(surface_view)),
    m_surface_size(surface_size)
  {}
  Frame::~Frame() {
    wgpu::CommandBufferDescriptor command_buffer_descriptor = {
      .label = "Cornell.Frame.CommandBuffer",
    };
    wgpu::CommandBuffer command_buffer = m_encoder.Finish(&command_buffer_descriptor);
    m_device.GetQueue().Submit(1, &command_buffer);
  }
}
namespace cornell {
  wgpu::CommandEncoder &Frame::encoder() {
    return m_encoder;
  }
  wgpu::TextureView const &Frame::surfaceView() const {
    return m_surface_view;
  }
  glm::uvec2 Frame::surfaceSize() const {
    return m_surface_size;
  }
}
