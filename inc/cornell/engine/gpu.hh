#pragma once

#include <span>
#include <array>
#include <string>
#include <concepts>
#include <unordered_map>
#include <initializer_list>
#include <cstdint>

#include "webgpu/webgpu_cpp.h"
#include "glm/vec2.hpp"

#include "core.hh"

namespace cornell {
  class RenderTarget;
  class Frame;
}

//
// Pipelines:
//

namespace cornell {
  template <typename T>
  concept PassEncoder =
    std::same_as<T, wgpu::RenderPassEncoder> ||
    std::same_as<T, wgpu::ComputePassEncoder>;
}
namespace cornell {
  /// GpuPipeline bundles a pipeline with its bind group layouts. The first `bind_group_prefix_count` bind groups are
  /// fixed at creation time and owned here; the remaining suffix bind groups are supplied per pass.
  template <typename WgpuPipeline, uint32_t bind_group_count, uint32_t bind_group_prefix_count>
  struct GpuPipeline {
    static_assert(
      bind_group_prefix_count <= bind_group_count,
      "expected bind group prefix count to not exceed bind group count."
    );
  public:
    static constexpr const uint32_t BIND_GROUP_COUNT = bind_group_count;
    static constexpr const uint32_t BIND_GROUP_PREFIX_COUNT = bind_group_prefix_count;
    static constexpr const uint32_t BIND_GROUP_SUFFIX_COUNT = bind_group_count - bind_group_prefix_count;
  public:
    GpuPipeline() = default;
  public:
    std::array<wgpu::BindGroupLayout, bind_group_count> bind_group_layouts = {};
    std::array<wgpu::BindGroup, bind_group_prefix_count> bind_groups_prefix = {};
    wgpu::PipelineLayout pipeline_layout = nullptr;
    WgpuPipeline pipeline = nullptr;
  public:
    template <PassEncoder Encoder>
    inline void setBindGroups(Encoder &encoder, std::span<const wgpu::BindGroup, BIND_GROUP_SUFFIX_COUNT> suffix) const requires IsPositiveU32<BIND_GROUP_SUFFIX_COUNT>;
    template <PassEncoder Encoder>
    inline void setBindGroups(Encoder &encoder) const requires IsZeroU32<BIND_GROUP_SUFFIX_COUNT>;
  private:
    template <PassEncoder Encoder>
    inline void setPrefixBindGroups(Encoder &encoder) const;
  };
  template <uint32_t bind_group_count, uint32_t bind_group_prefix_count>
  using RenderPipeline = GpuPipeline<wgpu::RenderPipeline, bind_group_count, bind_group_prefix_count>;
  template <uint32_t bind_group_count, uint32_t bind_group_prefix_count>
  using ComputePipeline = GpuPipeline<wgpu::ComputePipeline, bind_group_count, bind_group_prefix_count>;
}

//
// Shader modules:
//

namespace cornell {
  std::string shaderFilePath(const char *filename);
  /// readShaderFiles concatenates shader sources in order, so that later files may use declarations from earlier ones.
  std::string readShaderFiles(std::initializer_list<const char *> filenames);
  wgpu::ShaderModule createShaderModule(
    wgpu::Device &device,
    const char *label,
    const char *filepath,
    const std::string &shader_text
  );
  wgpu::ShaderModule createShaderModuleVariant(
    wgpu::Device &device,
    const char *label,
    const char *filepath,
    const std::string &raw_shader_text,
    std::unordered_map<std::string, std::string> const &rw_map
  );
  wgpu::PipelineLayout createPipelineLayout(
    wgpu::Device &device,
    const char *label,
    std::span<const wgpu::BindGroupLayout> bind_group_layouts
  );
}

//
// RenderTarget:
//

namespace cornell {
  class RenderTarget {
  private:
    wgpu::Texture m_texture;
    wgpu::TextureView m_view;
    glm::uvec2 m_size;
    wgpu::TextureFormat m_format;
  private:
    RenderTarget(wgpu::Texture texture, wgpu::TextureView view, glm::uvec2 size, wgpu::TextureFormat format);
  public:
    RenderTarget(RenderTarget const &other) = default;
    RenderTarget(RenderTarget &&other) = default;
    ~RenderTarget() = default;
  public:
    static RenderTarget create(
      wgpu::Device &device,
      const std::string &label,
      glm::uvec2 size,
      wgpu::TextureFormat format,
      wgpu::TextureUsage usage
    );
  public:
    wgpu::Texture const &texture() const;
    wgpu::TextureView const &view() const;
    glm::uvec2 size() const;
    wgpu::TextureFormat format() const;
  };
}

//
// Frame:
//

namespace cornell {
  /// Frame records one frame's commands into a single encoder. Destroying the Frame finishes the encoder and submits
  /// it, so every pass recorded while the Frame is alive executes in recording order.
  class Frame {
  private:
    wgpu::Device &m_device;
    wgpu::CommandEncoder m_encoder;
    wgpu::TextureView m_surface_view;
    glm::uvec2 m_surface_size;
  private:
    static wgpu::CommandEncoderDescriptor s_command_encoder_descriptor;
  public:
    Frame(wgpu::Device &device, wgpu::TextureView surface_view, glm::uvec2 surface_size);
    Frame(Frame const &other) = delete;
    Frame(Frame &&other) = delete;
    ~Frame();
  public:
    wgpu::CommandEncoder &encoder();
    wgpu::TextureView const &surfaceView() const;
    glm::uvec2 surfaceSize() const;
  };
}

//
// Inline method definitions:
//

namespace cornell {
  template <typename WgpuPipeline, uint32_t bg_count, uint32_t prefix_count>
  template <PassEncoder Encoder>
  inline void GpuPipeline<WgpuPipeline, bg_count, prefix_count>::setBindGroups(Encoder &encoder, std::span<const wgpu::BindGroup, BIND_GROUP_SUFFIX_COUNT> suffix) const requires IsPositiveU32<BIND_GROUP_SUFFIX_COUNT> {
    setPrefixBindGroups(encoder);
    for (uint32_t i = 0; i < BIND_GROUP_SUFFIX_COUNT; i++) {
      encoder.SetBindGroup(i + BIND_GROUP_PREFIX_COUNT, suffix[i]);
    }
  }
  template <typename WgpuPipeline, uint32_t bg_count, uint32_t prefix_count>
  template <PassEncoder Encoder>
  inline void GpuPipeline<WgpuPipeline, bg_count, prefix_count>::setBindGroups(Encoder &encoder) const requires IsZeroU32<BIND_GROUP_SUFFIX_COUNT> {
    setPrefixBindGroups(encoder);
  }
  template <typename WgpuPipeline, uint32_t bg_count, uint32_t prefix_count>
  template <PassEncoder Encoder>
  inline void GpuPipeline<WgpuPipeline, bg_count, prefix_count>::setPrefixBindGroups(Encoder &encoder) const {
    for (uint32_t i = 0; i < BIND_GROUP_PREFIX_COUNT; i++) {
      encoder.SetBindGroup(i, this->bind_groups_prefix[i]);
    }
  }
}
