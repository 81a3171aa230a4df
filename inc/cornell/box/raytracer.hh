#pragma once

#include <cstdint>

#include "webgpu/webgpu_cpp.h"

#include "cornell/engine/core.hh"
#include "cornell/engine/gpu.hh"
#include "common.hh"
#include "radiosity.hh"

namespace cornell {
  static const uint32_t RAYTRACER_WORKGROUP_SIZE_X = 16;
  static const uint32_t RAYTRACER_WORKGROUP_SIZE_Y = 16;
}

namespace cornell {
  /// Raytracer renders the HDR framebuffer in a compute pass, one primary ray per pixel.
  class Raytracer {
  private:
    wgpu::Device m_device;
    RenderTarget const &m_framebuffer;
    wgpu::Sampler m_sampler;
    ComputePipeline<2, 2> m_pipeline;
  public:
    Raytracer(wgpu::Device &device, Common const &common, LightmapView const &lightmap, RenderTarget const &framebuffer);
    Raytracer(Raytracer const &other) = delete;
    Raytracer(Raytracer &&other) = delete;
    ~Raytracer() = default;
  public:
    void run(wgpu::CommandEncoder &encoder);
  };
}
