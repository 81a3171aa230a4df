#include "cornell/box/rasterizer.hh"

#include <array>
#include <string>

namespace cornell {
  Rasterizer::Rasterizer(
    wgpu::Device &device,
    Common const &common,
    Scene const &scene,
    LightmapView const &lightmap,
    RenderTarget const &framebuffer
  )
  : m_device(device),
    m_scene(scene),
    m_framebuffer(framebuffer),
    m_depth_target(RenderTarget::create(
      device,
      "Cornell.Rasterizer.DepthTarget",
      framebuffer.size(),
      RASTERIZER_DEPTH_FORMAT,
      wgpu::TextureUsage::RenderAttachment
    )),
    m_sampler(nullptr),
    m_pipeline()
  {
    // sampler:
    {
      wgpu::SamplerDescriptor descriptor = {
        .label = "Cornell.Rasterizer.Sampler",
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
          .visibility = wgpu::ShaderStage::Fragment,
          .texture = {
            .sampleType = wgpu::TextureSampleType::Float,
            .viewDimension = wgpu::TextureViewDimension::e2DArray,
          },
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 1,
          .visibility = wgpu::ShaderStage::Fragment,
          .sampler = {.type = wgpu::SamplerBindingType::Filtering},
        },
      });
      wgpu::BindGroupLayoutDescriptor descriptor = {
        .label = "Cornell.Rasterizer.BindGroup1Layout",
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      m_pipeline.bind_group_layouts[0] = common.bindGroupLayout();
      m_pipeline.bind_group_layouts[1] = m_device.CreateBindGroupLayout(&descriptor);
    }

    // pipeline layout:
    m_pipeline.pipeline_layout = createPipelineLayout(
      m_device,
      "Cornell.Rasterizer.PipelineLayout",
      m_pipeline.bind_group_layouts
    );

    // render pipeline:
    {
      std::string filepath = shaderFilePath("rasterizer.wgsl");
      wgpu::ShaderModule shader_module = createShaderModule(
        m_device,
        "Cornell.Rasterizer.ShaderModule",
        filepath.c_str(),
        readShaderFiles({"common.wgsl", "rasterizer.wgsl"})
      );
      wgpu::ColorTargetState color_target = {
        .format = framebuffer.format(),
        .writeMask = wgpu::ColorWriteMask::All,
      };
      wgpu::VertexState vertex_state = {
        .module = shader_module,
        .entryPoint = "vs_main",
        .bufferCount = 1,
        .buffers = &scene.vertexBufferLayout(),
      };
      wgpu::PrimitiveState primitive_state = {
        .topology = wgpu::PrimitiveTopology::TriangleList,
        .stripIndexFormat = wgpu::IndexFormat::Undefined,
        .frontFace = wgpu::FrontFace::CCW,
        .cullMode = wgpu::CullMode::Back,
      };
      wgpu::DepthStencilState depth_stencil_state = {
        .format = RASTERIZER_DEPTH_FORMAT,
        .depthWriteEnabled = true,
        .depthCompare = wgpu::CompareFunction::Less,
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
        .label = "Cornell.Rasterizer.RenderPipeline",
        .layout = m_pipeline.pipeline_layout,
        .vertex = vertex_state,
        .primitive = primitive_state,
        .depthStencil = &depth_stencil_state,
        .multisample = multisample_state,
        .fragment = &fragment_state,
      };
      m_pipeline.pipeline = m_device.CreateRenderPipeline(&descriptor);
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
      });
      wgpu::BindGroupDescriptor descriptor = {
        .label = "Cornell.Rasterizer.BindGroup1",
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
  void Rasterizer::run(wgpu::CommandEncoder &encoder) {
    wgpu::RenderPassColorAttachment color_attachment = {
      .view = m_framebuffer.view(),
      .loadOp = wgpu::LoadOp::Clear,
      .storeOp = wgpu::StoreOp::Store,
      .clearValue = wgpu::Color {
        .r = RASTERIZER_CLEAR_COLOR.r,
        .g = RASTERIZER_CLEAR_COLOR.g,
        .b = RASTERIZER_CLEAR_COLOR.b,
        .a = RASTERIZER_CLEAR_COLOR.a,
      },
    };
    wgpu::RenderPassDepthStencilAttachment depth_attachment = {
      .view = m_depth_target.view(),
      .depthLoadOp = wgpu::LoadOp::Clear,
      .depthStoreOp = wgpu::StoreOp::Store,
      .depthClearValue = 1.0f,
    };
    wgpu::RenderPassDescriptor descriptor = {
      .nextInChain = nullptr,
      .label = "Cornell.Rasterizer.RenderPassEncoder",
      .colorAttachmentCount = 1,
      .colorAttachments = &color_attachment,
      .depthStencilAttachment = &depth_attachment,
    };
    wgpu::RenderPassEncoder pass = encoder.BeginRenderPass(&descriptor);
    pass.SetPipeline(m_pipeline.pipeline);
    m_pipeline.setBindGroups(pass);
    pass.SetVertexBuffer(0, m_scene.vertexBuffer(), 0, m_scene.vertexBufferSize());
    pass.SetIndexBuffer(m_scene.indexBuffer(), wgpu::IndexFormat::Uint16, 0, m_scene.indexBufferSize());
    pass.DrawIndexed(m_scene.indexCount());
    pass.End();
  }
}
