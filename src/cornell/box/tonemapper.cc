#include "cornell/box/tonemapper.hh"

#include <array>
#include <string>

namespace cornell {
  const char *tonemapperOutputFormatName(wgpu::TextureFormat format) {
    switch (format) {
      case wgpu::TextureFormat::BGRA8Unorm:
        return "bgra8unorm";
      case wgpu::TextureFormat::RGBA8Unorm:
        return "rgba8unorm";
      case wgpu::TextureFormat::RGBA16Float:
        return "rgba16float";
      default:
        PANIC("Unsupported tonemapper output format: {}", static_cast<uint32_t>(format));
    }
  }
}

namespace cornell {
  Tonemapper::Tonemapper(wgpu::Device &device, RenderTarget const &input)
  : m_device(device),
    m_input(input),
    m_raw_shader_text(readShaderFiles({"tonemapper.wgsl"})),
    m_variants(),
    m_bound_output(nullptr),
    m_bound_format(wgpu::TextureFormat::Undefined),
    m_bind_group(nullptr)
  {}
}
namespace cornell {
  void Tonemapper::run(wgpu::CommandEncoder &encoder, wgpu::TextureView const &output, wgpu::TextureFormat format, glm::uvec2 size) {
    DEBUG_CHECK(size == m_input.size(), "Expected tonemapper output to match the input size");
    Pipeline const &pipeline = variant(format);
    if (output.Get() != m_bound_output.Get() || format != m_bound_format) {
      bindOutput(pipeline, output, format);
    }

    wgpu::ComputePassDescriptor descriptor = {
      .label = "Cornell.Tonemapper.ComputePass",
    };
    wgpu::ComputePassEncoder pass = encoder.BeginComputePass(&descriptor);
    pass.SetPipeline(pipeline.pipeline);
    pipeline.setBindGroups(pass, std::span<const wgpu::BindGroup, 1>{&m_bind_group, 1});
    pass.DispatchWorkgroups(
      divRoundUp(size.x, TONEMAPPER_WORKGROUP_SIZE_X),
      divRoundUp(size.y, TONEMAPPER_WORKGROUP_SIZE_Y)
    );
    pass.End();
  }
}
namespace cornell {
  Tonemapper::Pipeline const &Tonemapper::variant(wgpu::TextureFormat format) {
    auto it = m_variants.find(format);
    if (it == m_variants.end()) {
      it = m_variants.emplace(format, createVariant(format)).first;
    }
    return it->second;
  }
  Tonemapper::Pipeline Tonemapper::createVariant(wgpu::TextureFormat format) {
    Pipeline out;
    const char *format_name = tonemapperOutputFormatName(format);

    // bind group layout 0:
    {
      auto entries = std::to_array({
        wgpu::BindGroupLayoutEntry {
          .binding = 0,
          .visibility = wgpu::ShaderStage::Compute,
          .texture = {
            .sampleType = wgpu::TextureSampleType::Float,
            .viewDimension = wgpu::TextureViewDimension::e2D,
          },
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 1,
          .visibility = wgpu::ShaderStage::Compute,
          .storageTexture = wgpu::StorageTextureBindingLayout {
            .access = wgpu::StorageTextureAccess::WriteOnly,
            .format = format,
            .viewDimension = wgpu::TextureViewDimension::e2D,
          },
        },
      });
      std::string label = fmt::format("Cornell.Tonemapper.{}.BindGroup0Layout", format_name);
      wgpu::BindGroupLayoutDescriptor descriptor = {
        .label = label.c_str(),
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      out.bind_group_layouts[0] = m_device.CreateBindGroupLayout(&descriptor);
    }

    // pipeline layout:
    {
      std::string label = fmt::format("Cornell.Tonemapper.{}.PipelineLayout", format_name);
      out.pipeline_layout = createPipelineLayout(m_device, label.c_str(), out.bind_group_layouts);
    }

    // compute pipeline:
    {
      std::string filepath = shaderFilePath("tonemapper.wgsl");
      std::string module_label = fmt::format("Cornell.Tonemapper.{}.ShaderModule", format_name);
      wgpu::ShaderModule shader_module = createShaderModuleVariant(
        m_device,
        module_label.c_str(),
        filepath.c_str(),
        m_raw_shader_text,
        std::unordered_map<std::string, std::string> {
          {"p_OUTPUT_FORMAT", format_name},
          {"p_WORKGROUP_SIZE_X", std::to_string(TONEMAPPER_WORKGROUP_SIZE_X)},
          {"p_WORKGROUP_SIZE_Y", std::to_string(TONEMAPPER_WORKGROUP_SIZE_Y)},
        }
      );
      std::string label = fmt::format("Cornell.Tonemapper.{}.ComputePipeline", format_name);
      wgpu::ComputePipelineDescriptor descriptor = {
        .label = label.c_str(),
        .layout = out.pipeline_layout,
        .compute = wgpu::ProgrammableStageDescriptor {
          .module = shader_module,
          .entryPoint = "tonemap",
        },
      };
      out.pipeline = m_device.CreateComputePipeline(&descriptor);
    }

    return out;
  }
  void Tonemapper::bindOutput(Pipeline const &pipeline, wgpu::TextureView const &output, wgpu::TextureFormat format) {
    auto entries = std::to_array({
      wgpu::BindGroupEntry {
        .binding = 0,
        .textureView = m_input.view(),
      },
      wgpu::BindGroupEntry {
        .binding = 1,
        .textureView = output,
      },
    });
    wgpu::BindGroupDescriptor descriptor = {
      .label = "Cornell.Tonemapper.BindGroup0",
      .layout = pipeline.bind_group_layouts[0],
      .entryCount = entries.size(),
      .entries = entries.data(),
    };
    m_bind_group = m_device.CreateBindGroup(&descriptor);
    m_bound_output = output;
    m_bound_format = format;
  }
}
