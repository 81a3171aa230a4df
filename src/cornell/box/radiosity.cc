#include "cornell/box/radiosity.hh"

#include <array>
#include <string>
#include <iostream>

namespace cornell {
  Radiosity::Radiosity(wgpu::Device &device, Common const &common, Scene const &scene)
  : m_device(device),
    m_light(scene.lightParams()),
    m_layer_count(scene.quadCount()),
    m_schedule(AccumulationParams::createForLightmap(scene.quadCount())),
    m_lightmap_texture(nullptr),
    m_lightmap_sampled_view(nullptr),
    m_lightmap_storage_view(nullptr),
    m_accumulation_buffer(nullptr),
    m_uniform_buffer(nullptr),
    m_photon_pipeline(),
    m_resolve_pipeline()
#if CORNELL_DEBUG
    , m_debug_takeout_buffer(nullptr)
#endif
  {
    initLightmap();
    initAccumulationBuffer();
    initUniformBuffer();
    initPipelines(common);
  }
}
namespace cornell {
  void Radiosity::initLightmap() {
    wgpu::TextureUsage usage = wgpu::TextureUsage::StorageBinding | wgpu::TextureUsage::TextureBinding;
#if CORNELL_DEBUG
    usage = usage | wgpu::TextureUsage::CopySrc;
#endif
    wgpu::TextureDescriptor texture_descriptor = {
      .label = "Cornell.Radiosity.Lightmap.Texture",
      .usage = usage,
      .dimension = wgpu::TextureDimension::e2D,
      .size = wgpu::Extent3D {
        .width = RADIOSITY_LIGHTMAP_WIDTH,
        .height = RADIOSITY_LIGHTMAP_HEIGHT,
        .depthOrArrayLayers = m_layer_count,
      },
      .format = RADIOSITY_LIGHTMAP_FORMAT,
      .mipLevelCount = 1,
      .sampleCount = 1,
    };
    m_lightmap_texture = m_device.CreateTexture(&texture_descriptor);

    wgpu::TextureViewDescriptor sampled_view_descriptor = {
      .label = "Cornell.Radiosity.Lightmap.SampledView",
      .format = RADIOSITY_LIGHTMAP_FORMAT,
      .dimension = wgpu::TextureViewDimension::e2DArray,
      .baseMipLevel = 0,
      .mipLevelCount = 1,
      .baseArrayLayer = 0,
      .arrayLayerCount = m_layer_count,
      .aspect = wgpu::TextureAspect::All,
    };
    m_lightmap_sampled_view = m_lightmap_texture.CreateView(&sampled_view_descriptor);

    wgpu::TextureViewDescriptor storage_view_descriptor = {
      .label = "Cornell.Radiosity.Lightmap.StorageView",
      .format = RADIOSITY_LIGHTMAP_FORMAT,
      .dimension = wgpu::TextureViewDimension::e2DArray,
      .baseMipLevel = 0,
      .mipLevelCount = 1,
      .baseArrayLayer = 0,
      .arrayLayerCount = m_layer_count,
      .aspect = wgpu::TextureAspect::All,
    };
    m_lightmap_storage_view = m_lightmap_texture.CreateView(&storage_view_descriptor);
  }
  void Radiosity::initAccumulationBuffer() {
    // New buffers are zero-filled, so accumulation starts from black.
    wgpu::BufferDescriptor descriptor = {
      .label = "Cornell.Radiosity.AccumulationBuffer",
      .usage = wgpu::BufferUsage::Storage,
      .size = accumulationBufferSize(m_layer_count),
      .mappedAtCreation = false,
    };
    m_accumulation_buffer = m_device.CreateBuffer(&descriptor);
  }
  void Radiosity::initUniformBuffer() {
    wgpu::BufferDescriptor descriptor = {
      .label = "Cornell.Radiosity.UniformBuffer",
      .usage = wgpu::BufferUsage::Uniform | wgpu::BufferUsage::CopyDst,
      .size = sizeof(RadiosityUniform),
      .mappedAtCreation = false,
    };
    m_uniform_buffer = m_device.CreateBuffer(&descriptor);
  }
  void Radiosity::initPipelines(Common const &common) {
    std::string filepath = shaderFilePath("radiosity.wgsl");
    wgpu::ShaderModule shader_module = createShaderModuleVariant(
      m_device,
      "Cornell.Radiosity.ShaderModule",
      filepath.c_str(),
      readShaderFiles({"common.wgsl", "radiosity.wgsl"}),
      std::unordered_map<std::string, std::string> {
        {"p_PHOTONS_PER_WORKGROUP", std::to_string(RADIOSITY_PHOTONS_PER_WORKGROUP)},
        {"p_PHOTON_ENERGY", std::to_string(RADIOSITY_PHOTON_ENERGY)},
        {"p_WORKGROUP_SIZE_X", std::to_string(RADIOSITY_RESOLVE_WORKGROUP_SIZE_X)},
        {"p_WORKGROUP_SIZE_Y", std::to_string(RADIOSITY_RESOLVE_WORKGROUP_SIZE_Y)},
      }
    );

    // bind group layout 1, shared by both passes:
    wgpu::BindGroupLayout bind_group_layout;
    {
      auto entries = std::to_array({
        wgpu::BindGroupLayoutEntry {
          .binding = 0,
          .visibility = wgpu::ShaderStage::Compute,
          .buffer = wgpu::BufferBindingLayout {
            .type = wgpu::BufferBindingType::Storage,
            .minBindingSize = accumulationBufferSize(m_layer_count),
          },
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 1,
          .visibility = wgpu::ShaderStage::Compute,
          .storageTexture = wgpu::StorageTextureBindingLayout {
            .access = wgpu::StorageTextureAccess::WriteOnly,
            .format = RADIOSITY_LIGHTMAP_FORMAT,
            .viewDimension = wgpu::TextureViewDimension::e2DArray,
          },
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 2,
          .visibility = wgpu::ShaderStage::Compute,
          .buffer = wgpu::BufferBindingLayout {
            .type = wgpu::BufferBindingType::Uniform,
            .minBindingSize = sizeof(RadiosityUniform),
          },
        },
      });
      wgpu::BindGroupLayoutDescriptor descriptor = {
        .label = "Cornell.Radiosity.BindGroup1Layout",
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      bind_group_layout = m_device.CreateBindGroupLayout(&descriptor);
    }

    // bind group 1:
    wgpu::BindGroup bind_group;
    {
      auto entries = std::to_array({
        wgpu::BindGroupEntry {
          .binding = 0,
          .buffer = m_accumulation_buffer,
          .size = accumulationBufferSize(m_layer_count),
        },
        wgpu::BindGroupEntry {
          .binding = 1,
          .textureView = m_lightmap_storage_view,
        },
        wgpu::BindGroupEntry {
          .binding = 2,
          .buffer = m_uniform_buffer,
          .size = sizeof(RadiosityUniform),
        },
      });
      wgpu::BindGroupDescriptor descriptor = {
        .label = "Cornell.Radiosity.BindGroup1",
        .layout = bind_group_layout,
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      bind_group = m_device.CreateBindGroup(&descriptor);
    }

    // pipeline layout:
    auto bind_group_layouts = std::to_array({common.bindGroupLayout(), bind_group_layout});
    wgpu::PipelineLayout pipeline_layout = createPipelineLayout(
      m_device,
      "Cornell.Radiosity.PipelineLayout",
      bind_group_layouts
    );

    // pipelines:
    auto init_pipeline = [&] (ComputePipeline<2, 2> &out, const char *label, const char *entry_point) {
      out.bind_group_layouts = bind_group_layouts;
      out.bind_groups_prefix = {common.bindGroup(), bind_group};
      out.pipeline_layout = pipeline_layout;
      wgpu::ComputePipelineDescriptor descriptor = {
        .label = label,
        .layout = pipeline_layout,
        .compute = wgpu::ProgrammableStageDescriptor {
          .module = shader_module,
          .entryPoint = entry_point,
        },
      };
      out.pipeline = m_device.CreateComputePipeline(&descriptor);
    };
    init_pipeline(m_photon_pipeline, "Cornell.Radiosity.PhotonPipeline", "radiosity");
    init_pipeline(m_resolve_pipeline, "Cornell.Radiosity.ResolvePipeline", "accumulation_to_lightmap");
  }
}
namespace cornell {
  void Radiosity::run(wgpu::CommandEncoder &encoder) {
    AccumulationStep step = m_schedule.advance();
    RadiosityUniform uniform = createRadiosityUniform(step, m_light);
    m_device.GetQueue().WriteBuffer(m_uniform_buffer, 0, &uniform, sizeof(RadiosityUniform));

    wgpu::ComputePassDescriptor pass_descriptor = {
      .label = "Cornell.Radiosity.ComputePass",
    };
    wgpu::ComputePassEncoder pass = encoder.BeginComputePass(&pass_descriptor);
    {
      pass.SetPipeline(m_photon_pipeline.pipeline);
      m_photon_pipeline.setBindGroups(pass);
      pass.DispatchWorkgroups(m_schedule.params().workgroups_per_frame);
    }
    {
      pass.SetPipeline(m_resolve_pipeline.pipeline);
      m_resolve_pipeline.setBindGroups(pass);
      pass.DispatchWorkgroups(
        divRoundUp(RADIOSITY_LIGHTMAP_WIDTH, RADIOSITY_RESOLVE_WORKGROUP_SIZE_X),
        divRoundUp(RADIOSITY_LIGHTMAP_HEIGHT, RADIOSITY_RESOLVE_WORKGROUP_SIZE_Y),
        m_layer_count
      );
    }
    pass.End();
  }
}
namespace cornell {
  LightmapView Radiosity::lightmapView() const {
    return LightmapView {
      .view = m_lightmap_sampled_view,
      .layer_count = m_layer_count,
      .size = glm::uvec2{RADIOSITY_LIGHTMAP_WIDTH, RADIOSITY_LIGHTMAP_HEIGHT},
    };
  }
  AccumulationSchedule const &Radiosity::schedule() const {
    return m_schedule;
  }
}
namespace cornell {
  void Radiosity::debug_takeoutLightmap(uint32_t layer, std::function<void(std::optional<FloatBitmap>)> cb) {
#if !CORNELL_DEBUG
    (void)layer;
    (void)cb;
    PANIC("Cannot take out the lightmap unless in debug mode.");
#else
    CHECK(
      layer < m_layer_count,
      [this, layer] () { return fmt::format("Lightmap layer {} out of range (layer count {})", layer, m_layer_count); }
    );
    const uint32_t bytes_per_row = RADIOSITY_LIGHTMAP_WIDTH * RADIOSITY_LIGHTMAP_BYTES_PER_TEXEL;
    const uint64_t takeout_size = static_cast<uint64_t>(bytes_per_row) * RADIOSITY_LIGHTMAP_HEIGHT;
    static_assert(RADIOSITY_LIGHTMAP_WIDTH * RADIOSITY_LIGHTMAP_BYTES_PER_TEXEL % 256 == 0, "Expected 256-byte row pitch");

    if (!m_debug_takeout_buffer) {
      wgpu::BufferDescriptor desc = {
        .label = "Cornell.Radiosity.Debug.TakeoutBuffer",
        .usage = wgpu::BufferUsage::CopyDst | wgpu::BufferUsage::MapRead,
        .size = takeout_size,
        .mappedAtCreation = false,
      };
      m_debug_takeout_buffer = m_device.CreateBuffer(&desc);
    }
    if (m_debug_takeout_buffer.GetMapState() != wgpu::BufferMapState::Unmapped) {
      std::cerr << fmt::format("Cornell: lightmap takeout still pending, dropping request for layer {}", layer) << std::endl;
      cb(std::nullopt);
      return;
    }

    wgpu::CommandEncoderDescriptor command_encoder_descriptor = {
      .label = "Cornell.Radiosity.Debug.LightmapTakeoutCommandEncoder",
    };
    wgpu::CommandEncoder command_encoder = m_device.CreateCommandEncoder(&command_encoder_descriptor);
    {
      const wgpu::ImageCopyTexture source = {
        .texture = m_lightmap_texture,
        .origin = wgpu::Origin3D {
          .x = 0,
          .y = 0,
          .z = layer,
        },
      };
      const wgpu::ImageCopyBuffer destination = {
        .layout = {
          .bytesPerRow = bytes_per_row,
          .rowsPerImage = RADIOSITY_LIGHTMAP_HEIGHT,
        },
        .buffer = m_debug_takeout_buffer,
      };
      const wgpu::Extent3D copy_size = {
        .width = RADIOSITY_LIGHTMAP_WIDTH,
        .height = RADIOSITY_LIGHTMAP_HEIGHT,
        .depthOrArrayLayers = 1,
      };
      command_encoder.CopyTextureToBuffer(&source, &destination, &copy_size);
    }
    wgpu::CommandBuffer command_buffer = command_encoder.Finish();
    m_device.GetQueue().Submit(1, &command_buffer);

    struct MapUserData {
      uint32_t layer;
      uint64_t size;
      uint32_t bytes_per_row;
      wgpu::Buffer mapped_buffer;
      std::function<void(std::optional<FloatBitmap>)> cb;
    };
    m_debug_takeout_buffer.MapAsync(
      wgpu::MapMode::Read,
      0,
      takeout_size,
      [] (WGPUBufferMapAsyncStatus status, void *userdata) {
        MapUserData *data = reinterpret_cast<MapUserData*>(userdata);
        if (status != WGPUBufferMapAsyncStatus_Success) {
          // Happens when the device goes away with the request in flight.
          std::cerr << fmt::format("Cornell: lightmap takeout of layer {} failed (status {})", data->layer, static_cast<int>(status)) << std::endl;
          data->cb(std::nullopt);
          delete data;
          return;
        }

        CHECK(data->mapped_buffer.GetMapState() == wgpu::BufferMapState::Mapped, "Expected buffer to be mapped.");
        const void *src = data->mapped_buffer.GetConstMappedRange(0, data->size);
        CHECK(src, "Expected mapped buffer range to be valid");
        FloatBitmap output = FloatBitmap::fromHalfTexels(
          glm::i32vec2{RADIOSITY_LIGHTMAP_WIDTH, RADIOSITY_LIGHTMAP_HEIGHT},
          src,
          data->bytes_per_row
        );
        data->mapped_buffer.Unmap();

        data->cb(std::move(output));
        delete data;
      },
      new MapUserData{layer, takeout_size, bytes_per_row, m_debug_takeout_buffer, std::move(cb)}
    );
#endif
  }
}
