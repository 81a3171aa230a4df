#include "cornell/box/scene.hh"

#include <vector>

namespace cornell {
  // Queue writes must be a multiple of 4 bytes:
  static uint64_t alignBufferSize(uint64_t size) {
    return (size + 3) & ~static_cast<uint64_t>(3);
  }
  static wgpu::Buffer createBufferWithData(
    wgpu::Device &device,
    const char *label,
    wgpu::BufferUsage usage,
    void const *data,
    uint64_t size
  ) {
    CHECK(size % 4 == 0, "Expected buffer size to be a multiple of 4 bytes");
    wgpu::BufferDescriptor descriptor = {
      .label = label,
      .usage = usage | wgpu::BufferUsage::CopyDst,
      .size = size,
      .mappedAtCreation = false,
    };
    wgpu::Buffer buffer = device.CreateBuffer(&descriptor);
    device.GetQueue().WriteBuffer(buffer, 0, data, size);
    return buffer;
  }
}

namespace cornell {
  Scene::Scene(wgpu::Device &device, SceneGeometry geometry)
  : m_geometry(std::move(geometry)),
    m_vertex_buffer(nullptr),
    m_index_buffer(nullptr),
    m_quad_buffer(nullptr),
    m_vertex_buffer_size(0),
    m_index_buffer_size(0),
    m_quad_buffer_size(0),
    m_vertex_attributes(),
    m_vertex_buffer_layout()
  {
    auto vertices = m_geometry.vertices();
    m_vertex_buffer_size = sizeof(Vertex) * vertices.size();
    m_vertex_buffer = createBufferWithData(
      device,
      "Cornell.Scene.VertexBuffer",
      wgpu::BufferUsage::Vertex,
      vertices.data(),
      m_vertex_buffer_size
    );

    // An odd index count leaves the last 2 bytes as padding:
    auto indices = m_geometry.indices();
    m_index_buffer_size = alignBufferSize(sizeof(uint16_t) * indices.size());
    indices.resize(m_index_buffer_size / sizeof(uint16_t), 0);
    m_index_buffer = createBufferWithData(
      device,
      "Cornell.Scene.IndexBuffer",
      wgpu::BufferUsage::Index,
      indices.data(),
      m_index_buffer_size
    );

    auto quad_records = m_geometry.quadRecords();
    m_quad_buffer_size = sizeof(QuadRecord) * quad_records.size();
    m_quad_buffer = createBufferWithData(
      device,
      "Cornell.Scene.QuadBuffer",
      wgpu::BufferUsage::Storage,
      quad_records.data(),
      m_quad_buffer_size
    );

    m_vertex_attributes = std::to_array({
      wgpu::VertexAttribute{wgpu::VertexFormat::Float32x4, offsetof(Vertex, position), 0},
      wgpu::VertexAttribute{wgpu::VertexFormat::Float32x3, offsetof(Vertex, uv_quad), 1},
      wgpu::VertexAttribute{wgpu::VertexFormat::Float32x3, offsetof(Vertex, emissive), 2},
    });
    m_vertex_buffer_layout = wgpu::VertexBufferLayout {
      .arrayStride = sizeof(Vertex),
      .stepMode = wgpu::VertexStepMode::Vertex,
      .attributeCount = m_vertex_attributes.size(),
      .attributes = m_vertex_attributes.data(),
    };
  }
}
namespace cornell {
  wgpu::Buffer const &Scene::vertexBuffer() const {
    return m_vertex_buffer;
  }
  wgpu::Buffer const &Scene::indexBuffer() const {
    return m_index_buffer;
  }
  wgpu::Buffer const &Scene::quadBuffer() const {
    return m_quad_buffer;
  }
  uint64_t Scene::vertexBufferSize() const {
    return m_vertex_buffer_size;
  }
  uint64_t Scene::indexBufferSize() const {
    return m_index_buffer_size;
  }
  uint64_t Scene::quadBufferSize() const {
    return m_quad_buffer_size;
  }
  wgpu::VertexBufferLayout const &Scene::vertexBufferLayout() const {
    return m_vertex_buffer_layout;
  }
  uint32_t Scene::vertexCount() const {
    return m_geometry.vertexCount();
  }
  uint32_t Scene::indexCount() const {
    return m_geometry.indexCount();
  }
  uint32_t Scene::quadCount() const {
    return m_geometry.quadCount();
  }
  LightParams Scene::lightParams() const {
    return m_geometry.lightParams();
  }
}
