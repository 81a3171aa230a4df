#pragma once

#include "webgpu/webgpu_cpp.h"

#include "cornell/engine/core.hh"
#include "cornell/engine/gpu.hh"

namespace cornell {
  /// SurfaceBlitter copies a sampled texture onto a render attachment of another format, for surfaces that cannot be
  /// written from a compute pass.
  class SurfaceBlitter {
  private:
    wgpu::Device m_device;
    wgpu::Sampler m_sampler;
    RenderPipeline<1, 1> m_pipeline;
  public:
    SurfaceBlitter(wgpu::Device &device, RenderTarget const &source, wgpu::TextureFormat target_format);
    SurfaceBlitter(SurfaceBlitter const &other) = delete;
    SurfaceBlitter(SurfaceBlitter &&other) = delete;
    ~SurfaceBlitter() = default;
  public:
    void blit(wgpu::CommandEncoder &encoder, wgpu::TextureView const &target);
  };
}
