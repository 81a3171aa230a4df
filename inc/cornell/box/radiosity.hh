#pragma once

#include <functional>
#include <optional>
#include <cstdint>

#include "webgpu/webgpu_cpp.h"
#include "glm/vec2.hpp"

#include "cornell/engine/core.hh"
#include "cornell/engine/config.hh"
#include "cornell/engine/gpu.hh"
#include "cornell/engine/bitmap.hh"
#include "accumulation.hh"
#include "common.hh"
#include "scene.hh"

namespace cornell {
  static const wgpu::TextureFormat RADIOSITY_LIGHTMAP_FORMAT = wgpu::TextureFormat::RGBA16Float;
  static const uint32_t RADIOSITY_LIGHTMAP_BYTES_PER_TEXEL = 8;
}

namespace cornell {
  /// LightmapView is the read-only face of the lightmap handed to renderers: a sampled `texture_2d_array` view with one
  /// layer per quad.
  struct LightmapView {
    wgpu::TextureView view;
    uint32_t layer_count;
    glm::uvec2 size;
  };
}

namespace cornell {
  /// Radiosity progressively solves the scene's diffuse lighting. Every `run` traces a fixed budget of photons from the
  /// light into a fixed-point accumulation buffer, then resolves the buffer into the lightmap texture array.
  class Radiosity {
  private:
    wgpu::Device m_device;
    LightParams m_light;
    uint32_t m_layer_count;
    AccumulationSchedule m_schedule;
    wgpu::Texture m_lightmap_texture;
    wgpu::TextureView m_lightmap_sampled_view;
    wgpu::TextureView m_lightmap_storage_view;
    wgpu::Buffer m_accumulation_buffer;
    wgpu::Buffer m_uniform_buffer;
    ComputePipeline<2, 2> m_photon_pipeline;
    ComputePipeline<2, 2> m_resolve_pipeline;
#if CORNELL_DEBUG
    wgpu::Buffer m_debug_takeout_buffer;
#endif
  public:
    Radiosity(wgpu::Device &device, Common const &common, Scene const &scene);
    Radiosity(Radiosity const &other) = delete;
    Radiosity(Radiosity &&other) = delete;
    ~Radiosity() = default;
  public:
    void run(wgpu::CommandEncoder &encoder);
  public:
    LightmapView lightmapView() const;
    AccumulationSchedule const &schedule() const;
  public:
    /// debug_takeoutLightmap copies lightmap layer `layer` back to the CPU. `cb` runs exactly once: from
    /// `Instance::ProcessEvents` with the bitmap once the copy is mapped, or with `std::nullopt` when the map fails or
    /// when the request is dropped because a previous one is still pending.
    void debug_takeoutLightmap(uint32_t layer, std::function<void(std::optional<FloatBitmap>)> cb);
  private:
    void initLightmap();
    void initAccumulationBuffer();
    void initUniformBuffer();
    void initPipelines(Common const &common);
  };
}
