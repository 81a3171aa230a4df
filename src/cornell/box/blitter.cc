#include "cornell/box/blitter.hh"

#include <array>
#include <string>

namespace cornell {
  SurfaceBlitter::SurfaceBlitter(wgpu::Device &device, RenderTarget const &source, wgpu::TextureFormat target_format)
  : m_device(device),
    m_sampler(nullptr),
    m_pipeline()
  {
    // sampler:
    {
      wgpu::SamplerDescriptor descriptor = {
        .label = "Cornell.Blitter.Sampler",
        .addressModeU = wgpu::AddressMode::ClampToEdge,
        .addressModeV = wgpu::AddressMode::ClampToEdge,
        .addressModeW = wgpu::AddressMode::ClampToEdge,
        .magFilter = wgpu::FilterMode::Linear,
        .minFilter = wgpu::FilterMode::Linear,
      };
      m_sampler = m_device.CreateSampler(&descriptor);
    }

    // bind group layout 0:
    {
      auto entries = std::to_array({
        wgpu::BindGroupLayoutEntry {
          .binding = 0,
          .visibility = wgpu::ShaderStage::Fragment,
          .texture = {
            .sampleType = wgpu::TextureSampleType::Float,
            .viewDimension = wgpu::TextureViewDimension::e2D,
          },
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 1,
          .visibility = wgpu::ShaderStage::Fragment,
          .sampler = {.type = wgpu::SamplerBindingType::Filtering},
        },
      });
      wgpu::BindGroupLayoutDescriptor descriptor = {
        .label = "Cornell.Blitter.BindGroup0Layout",
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      m_pipeline.bind_group_layouts[0] = m_device.CreateBindGroupLayout(&descriptor);
    }

    // pipeline layout:
    m_pipeline.pipeline_layout = createPipelineLayout(
      m_device,
      "Cornell.Blitter.PipelineLayout",
      m_pipeline.bind_group_layouts
    );

    // render pipeline:
    {
      std::string filepath = shaderFilePath("blit.wgsl");
      wgpu::ShaderModule shader_module = createShaderModule(
        m_device,
        "Cornell.Blitter.ShaderModule",
        filepath.c_str(),
        readShaderFiles({"blit.wgsl"})
      );
      wgpu::ColorTargetState color_target = {
        .format = target_format,
        .writeMask = wgpu::ColorWriteMask::All,
      };
      wgpu::VertexState vertex_state = {
        .module = shader_module,
        .entryPoint = "vs_main",
        .bufferCount = 0,
        .buffers = nullptr,
      };
      wgpu::PrimitiveState primitive_state = {
        .topology = wgpu::PrimitiveTopology::TriangleList,
        .stripIndexFormat = wgpu::IndexFormat::Undefined,
        .frontFace = wgpu::FrontFace::CCW,
        .cullMode = wgpu::CullMode::None,
      };
      wgpu::MultisampleState multisample_state = {
        .count = 1,
      };
      wgpu::FragmentState fragment_state = {
        .module = shader_module,
        .entryPoint = "fs_main",
        .targetCount = 1,
        .targets = &color_target,
      };
      wgpu::RenderPipelineDescriptor descriptor = {
        .label = "Cornell.Blitter.RenderPipeline",
        .layout = m_pipeline.pipeline_layout,
        .vertex = vertex_state,
        .primitive = primitive_state,
        .depthStencil = nullptr,
        .multisample = multisample_state,
        .fragment = &fragment_state,
      };
      m_pipeline.pipeline = m_device.CreateRenderPipeline(&descriptor);
    }

    // bind group 0:
    {
      auto entries = std::to_array({
        wgpu::BindGroupEntry {
          .binding = 0,
          .textureView = source.view(),
        },
        wgpu::BindGroupEntry {
          .binding = 1,
          .sampler = m_sampler,
        },
      });
      wgpu::BindGroupDescriptor descriptor = {
        .label = "Cornell.Blitter.BindGroup0",
        .layout = m_pipeline.bind_group_layouts[0],
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      m_pipeline.bind_groups_prefix[0] = m_device.CreateBindGroup(&descriptor);
    }
  }
}
namespace cornell {
  void SurfaceBlitter::blit(wgpu::CommandEncoder &encoder, wgpu::TextureView const &target) {
    wgpu::RenderPassColorAttachment color_attachment = {
      .view = target,
      .loadOp = wgpu::LoadOp::Clear,
      .storeOp = wgpu::StoreOp::Store,
      .clearValue = wgpu::Color{.r = 0.0, .g = 0.0, .b = 0.0, .a = 1.0},
    };
    wgpu::RenderPassDescriptor descriptor = {
      .nextInChain = nullptr,
      .label = "Cornell.Blitter.RenderPassEncoder",
      .colorAttachmentCount = 1,
      .colorAttachments = &color_attachment,
    };
    wgpu::RenderPassEncoder pass = encoder.BeginRenderPass(&descriptor);
    pass.SetPipeline(m_pipeline.pipeline);
    m_pipeline.setBindGroups(pass);
    pass.Draw(3);
    pass.End();
  }
}
