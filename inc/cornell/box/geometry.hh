#pragma once

#include <array>
#include <span>
#include <vector>
#include <cstdint>

#include "glm/vec3.hpp"
#include "glm/vec4.hpp"

#include "cornell/engine/core.hh"

namespace cornell {
  struct Quad;
  struct Box;
  struct QuadRecord;
  struct Vertex;
  struct LightParams;
  class SceneGeometry;
}

//
// Authoring types:
//

namespace cornell {
  /// Quad is a planar rectangle: `right` and `up` are half-extents, so the corners are `center ± right ± up`. The face
  /// normal is `normalize(cross(right, up))`.
  struct Quad {
    glm::vec3 center;
    glm::vec3 right;
    glm::vec3 up;
    glm::vec3 color;
    float emissive = 0.0f;
  };
  struct Box {
    glm::vec3 center;
    float width;
    float height;
    float depth;
    float rotation;
    std::array<glm::vec3, 6> face_colors;
    bool concave;
  };
}

//
// GPU binary interface (POD):
//

namespace cornell {
  struct QuadRecord {
    glm::vec4 plane;
    glm::vec4 right;
    glm::vec4 up;
    glm::vec3 color;
    float emissive;
  };
  struct Vertex {
    glm::vec4 position;
    glm::vec3 uv_quad;
    glm::vec3 emissive;
  };
  static_assert(sizeof(QuadRecord) == 64, "invalid QuadRecord size");
  static_assert(sizeof(Vertex) == 40, "invalid Vertex size");
  static_assert(offsetof(Vertex, uv_quad) == 16, "invalid Vertex::uv_quad offset");
  static_assert(offsetof(Vertex, emissive) == 28, "invalid Vertex::emissive offset");
}

namespace cornell {
  struct LightParams {
    glm::vec3 center;
    float width;
    float height;
  };
}

//
// Geometry helpers:
//

namespace cornell {
  static const uint32_t SCENE_VERTICES_PER_QUAD = 4;
  static const uint32_t SCENE_INDICES_PER_QUAD = 6;
  static const uint32_t SCENE_QUADS_PER_BOX = 6;
}
namespace cornell {
  /// reciprocal returns `v / dot(v, v)`, so that `dot(reciprocal(v), v) == 1`. A zero vector maps to the zero vector.
  glm::vec3 reciprocal(glm::vec3 v);
  /// quadNormal returns the unit face normal, or the zero vector when `right` or `up` is degenerate.
  glm::vec3 quadNormal(Quad const &quad);
  std::array<Quad, SCENE_QUADS_PER_BOX> expandBox(Box const &box);
  QuadRecord packQuadRecord(Quad const &quad);
}

//
// SceneGeometry:
//

namespace cornell {
  /// SceneGeometry is the immutable, ordered quad list of a scene: box faces first, the light quad last. A quad's index
  /// in this list is its lightmap layer and its index into the quad record array.
  class SceneGeometry {
  private:
    std::vector<Quad> m_quads;
  public:
    SceneGeometry(std::span<const Box> boxes, Quad light);
  public:
    static SceneGeometry createCornellBox();
  public:
    std::span<const Quad> quads() const;
    Quad const &light() const;
    LightParams lightParams() const;
    uint32_t quadCount() const;
    uint32_t lightQuadIndex() const;
    uint32_t vertexCount() const;
    uint32_t indexCount() const;
  public:
    std::vector<QuadRecord> quadRecords() const;
    std::vector<Vertex> vertices() const;
    std::vector<uint16_t> indices() const;
  };
}
