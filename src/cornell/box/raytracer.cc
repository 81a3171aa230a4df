#include "cornell/box/raytracer.hh"

#include <array>
#include <string>

namespace cornell {
  Raytracer::Raytracer(wgpu::Device &device, Common const &common, LightmapView const &lightmap, RenderTarget const &framebuffer)
  : m_device(device),
    m_framebuffer(framebuffer),
    m_sampler(nullptr),
    m_pipeline()
  {
    // sampler:
    {
      wgpu::SamplerDescriptor descriptor = {
        .label = "Cornell.Raytracer.Sampler",
        .addressModeU = wgpu::AddressMode::ClampToEdge,
        .addressModeV = wgpu::AddressMode::ClampToEdge,
        .addressModeW = wgpu::AddressMode::ClampToEdge,
        .magFilter = wgpu::FilterMode::Linear,
        .minFilter = wgpu::FilterMode::Linear,
      };
      m_sampler = m_device.CreateSampler(&descriptor);
    }

    // bind group layout 1:
    {
      auto entries = std::to_array({
        wgpu::BindGroupLayoutEntry {
          .binding = 0,
          .visibility = wgpu::ShaderStage::Compute,
          .texture = {
            .sampleType = wgpu::TextureSampleType::Float,
            .viewDimension = wgpu::TextureViewDimension::e2DArray,
          },
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 1,
          .visibility = wgpu::ShaderStage::Compute,
          .sampler = {.type = wgpu::SamplerBindingType::Filtering},
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 2,
          .visibility = wgpu::ShaderStage::Compute,
          .storageTexture = wgpu::StorageTextureBindingLayout {
            .access = wgpu::StorageTextureAccess::WriteOnly,
            .format = framebuffer.format(),
            .viewDimension = wgpu::TextureViewDimension::e2D,
          },
        },
      });
      wgpu::BindGroupLayoutDescriptor descriptor = {
        .label = "Cornell.Raytracer.BindGroup1Layout",
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      m_pipeline.bind_group_layouts[0] = common.bindGroupLayout();
      m_pipeline.bind_group_layouts[1] = m_device.CreateBindGroupLayout(&descriptor);
    }

    // pipeline layout:
    m_pipeline.pipeline_layout = createPipelineLayout(
      m_device,
      "Cornell.Raytracer.PipelineLayout",
      m_pipeline.bind_group_layouts
    );

    // compute pipeline:
    {
      std::string filepath = shaderFilePath("raytracer.wgsl");
      wgpu::ShaderModule shader_module = createShaderModuleVariant(
        m_device,
        "Cornell.Raytracer.ShaderModule",
        filepath.c_str(),
        readShaderFiles({"common.wgsl", "raytracer.wgsl"}),
        std::unordered_map<std::string, std::string> {
          {"p_WORKGROUP_SIZE_X", std::to_string(RAYTRACER_WORKGROUP_SIZE_X)},
          {"p_WORKGROUP_SIZE_Y", std::to_string(RAYTRACER_WORKGROUP_SIZE_Y)},
        }
      );
      wgpu::ComputePipelineDescriptor descriptor = {
        .label = "Cornell.Raytracer.ComputePipeline",
        .layout = m_pipeline.pipeline_layout,
        .compute = wgpu::ProgrammableStageDescriptor {
          .module = shader_module,
          .entryPoint = "render",
        },
      };
      m_pipeline.pipeline = m_device.CreateComputePipeline(&descriptor);
    }

    // bind groups:
    {
      auto entries = std::to_array({
        wgpu::BindGroupEntry {
          .binding = 0,
          .textureView = lightmap.view,
        },
        wgpu::BindGroupEntry {
          .binding = 1,
          .sampler = m_sampler,
        },
        wgpu::BindGroupEntry {
          .binding = 2,
          .textureView = framebuffer.view(),
        },
      });
      wgpu::BindGroupDescriptor descriptor = {
        .label = "Cornell.Raytracer.BindGroup1",
        .layout = m_pipeline.bind_group_layouts[1],
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      m_pipeline.bind_groups_prefix[0] = common.bindGroup();
      m_pipeline.bind_groups_prefix[1] = m_device.CreateBindGroup(&descriptor);
    }
  }
}
namespace cornell {
  void Raytracer::run(wgpu::CommandEncoder &encoder) {
    wgpu::ComputePassDescriptor descriptor = {
      .label = "Cornell.Raytracer.ComputePass",
    };
    wgpu::ComputePassEncoder pass = encoder.BeginComputePass(&descriptor);
    pass.SetPipeline(m_pipeline.pipeline);
    m_pipeline.setBindGroups(pass);
    pass.DispatchWorkgroups(
      divRoundUp(m_framebuffer.size().x, RAYTRACER_WORKGROUP_SIZE_X),
      divRoundUp(m_framebuffer.size().y, RAYTRACER_WORKGROUP_SIZE_Y)
    );
    pass.End();
  }
}
