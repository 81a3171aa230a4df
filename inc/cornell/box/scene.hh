#pragma once

#include <array>
#include <cstdint>

#include "webgpu/webgpu_cpp.h"

#include "cornell/engine/core.hh"
#include "geometry.hh"

namespace cornell {
  /// Scene uploads a SceneGeometry into immutable GPU buffers: vertices, 16-bit indices, and the quad records read by
  /// the ray tracing kernels.
  class Scene {
  private:
    SceneGeometry m_geometry;
    wgpu::Buffer m_vertex_buffer;
    wgpu::Buffer m_index_buffer;
    wgpu::Buffer m_quad_buffer;
    uint64_t m_vertex_buffer_size;
    uint64_t m_index_buffer_size;
    uint64_t m_quad_buffer_size;
    std::array<wgpu::VertexAttribute, 3> m_vertex_attributes;
    wgpu::VertexBufferLayout m_vertex_buffer_layout;
  public:
    Scene(wgpu::Device &device, SceneGeometry geometry);
    Scene(Scene const &other) = delete;
    Scene(Scene &&other) = delete;
    ~Scene() = default;
  public:
    wgpu::Buffer const &vertexBuffer() const;
    wgpu::Buffer const &indexBuffer() const;
    wgpu::Buffer const &quadBuffer() const;
    uint64_t vertexBufferSize() const;
    uint64_t indexBufferSize() const;
    uint64_t quadBufferSize() const;
    wgpu::VertexBufferLayout const &vertexBufferLayout() const;
    uint32_t vertexCount() const;
    uint32_t indexCount() const;
    uint32_t quadCount() const;
    LightParams lightParams() const;
  };
}
