#pragma once

#include <cstdint>

#include "webgpu/webgpu_cpp.h"
#include "glm/vec4.hpp"

#include "cornell/engine/core.hh"
#include "cornell/engine/gpu.hh"
#include "common.hh"
#include "scene.hh"
#include "radiosity.hh"

namespace cornell {
  static const wgpu::TextureFormat RASTERIZER_DEPTH_FORMAT = wgpu::TextureFormat::Depth24Plus;
  static const glm::dvec4 RASTERIZER_CLEAR_COLOR{0.1, 0.2, 0.3, 1.0};
}

namespace cornell {
  /// Rasterizer draws the scene's quads into the HDR framebuffer, shading each fragment with its lightmap texel.
  class Rasterizer {
  private:
    wgpu::Device m_device;
    Scene const &m_scene;
    RenderTarget const &m_framebuffer;
    RenderTarget m_depth_target;
    wgpu::Sampler m_sampler;
    RenderPipeline<2, 2> m_pipeline;
  public:
    Rasterizer(
      wgpu::Device &device,
      Common const &common,
      Scene const &scene,
      LightmapView const &lightmap,
      RenderTarget const &framebuffer
    );
    Rasterizer(Rasterizer const &other) = delete;
    Rasterizer(Rasterizer &&other) = delete;
    ~Rasterizer() = default;
  public:
    void run(wgpu::CommandEncoder &encoder);
  };
}
