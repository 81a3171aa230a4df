#pragma once

#include <cstdint>

#include "webgpu/webgpu_cpp.h"
#include "glm/vec2.hpp"
#include "robin_hood.h"

#include "cornell/engine/core.hh"
#include "cornell/engine/gpu.hh"

namespace cornell {
  static const uint32_t TONEMAPPER_WORKGROUP_SIZE_X = 16;
  static const uint32_t TONEMAPPER_WORKGROUP_SIZE_Y = 16;
}

namespace cornell {
  /// tonemapperOutputFormatName returns the WGSL texel format name for a storage-writable output format.
  const char *tonemapperOutputFormatName(wgpu::TextureFormat format);
}

namespace cornell {
  /// Tonemapper maps the linear HDR framebuffer into an 8-bit storage texture. One shader variant is compiled per output
  /// format, on first use.
  class Tonemapper {
  private:
    using Pipeline = ComputePipeline<1, 0>;
  private:
    wgpu::Device m_device;
    RenderTarget const &m_input;
    std::string m_raw_shader_text;
    robin_hood::unordered_map<wgpu::TextureFormat, Pipeline> m_variants;
    wgpu::TextureView m_bound_output;
    wgpu::TextureFormat m_bound_format;
    wgpu::BindGroup m_bind_group;
  public:
    Tonemapper(wgpu::Device &device, RenderTarget const &input);
    Tonemapper(Tonemapper const &other) = delete;
    Tonemapper(Tonemapper &&other) = delete;
    ~Tonemapper() = default;
  public:
    void run(wgpu::CommandEncoder &encoder, wgpu::TextureView const &output, wgpu::TextureFormat format, glm::uvec2 size);
  private:
    Pipeline const &variant(wgpu::TextureFormat format);
    Pipeline createVariant(wgpu::TextureFormat format);
    void bindOutput(Pipeline const &pipeline, wgpu::TextureView const &output, wgpu::TextureFormat format);
  };
}
