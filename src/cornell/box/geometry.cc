#include "cornell/box/geometry.hh"

#include <cmath>
#include <limits>

#include "glm/geometric.hpp"

//
// Reference scene:
//

namespace cornell {
  static const glm::vec3 CORNELL_GRAY_WALL{0.5f, 0.5f, 0.5f};
  static const glm::vec3 CORNELL_GREEN_WALL{0.0f, 0.5f, 0.0f};
  static const glm::vec3 CORNELL_RED_WALL{0.5f, 0.0f, 0.0f};
  static const glm::vec3 CORNELL_BLOCK{0.8f, 0.8f, 0.8f};
}
namespace cornell {
  static std::array<glm::vec3, SCENE_QUADS_PER_BOX> uniformFaceColors(glm::vec3 color) {
    return {color, color, color, color, color, color};
  }
}

//
// Geometry helpers:
//

namespace cornell {
  glm::vec3 reciprocal(glm::vec3 v) {
    float s = glm::dot(v, v);
    if (s == 0.0f) {
      return glm::vec3{0.0f};
    }
    return v / s;
  }
  glm::vec3 quadNormal(Quad const &quad) {
    glm::vec3 n = glm::cross(quad.right, quad.up);
    float len = glm::length(n);
    if (len == 0.0f) {
      return glm::vec3{0.0f};
    }
    return n / len;
  }
}
namespace cornell {
  std::array<Quad, SCENE_QUADS_PER_BOX> expandBox(Box const &box) {
    float cos_r = std::cos(box.rotation);
    float sin_r = std::sin(box.rotation);
    // Half-extent axes of the box, rotated about +Y. They stay mutually orthogonal for any width and depth.
    glm::vec3 x = glm::vec3{cos_r, 0.0f, sin_r} * (box.width / 2.0f);
    glm::vec3 y{0.0f, box.height / 2.0f, 0.0f};
    glm::vec3 z = glm::vec3{sin_r, 0.0f, -cos_r} * (box.depth / 2.0f);

    // Flipping the sign of `right` flips the face normal: concave boxes face inward, convex boxes face outward.
    auto sign = [&box] (glm::vec3 v) { return box.concave ? v : -v; };

    glm::vec3 c = box.center;
    auto const &colors = box.face_colors;
    return {
      Quad{.center = c + x, .right = sign(-z), .up = y, .color = colors[0]},
      Quad{.center = c + y, .right = sign(x), .up = -z, .color = colors[1]},
      Quad{.center = c + z, .right = sign(x), .up = y, .color = colors[2]},
      Quad{.center = c - x, .right = sign(z), .up = y, .color = colors[3]},
      Quad{.center = c - y, .right = sign(x), .up = z, .color = colors[4]},
      Quad{.center = c - z, .right = sign(-x), .up = y, .color = colors[5]},
    };
  }
}
namespace cornell {
  QuadRecord packQuadRecord(Quad const &quad) {
    glm::vec3 normal = quadNormal(quad);
    glm::vec3 inv_right = reciprocal(quad.right);
    glm::vec3 inv_up = reciprocal(quad.up);
    return QuadRecord {
      .plane = glm::vec4{normal, -glm::dot(normal, quad.center)},
      .right = glm::vec4{inv_right, -glm::dot(inv_right, quad.center)},
      .up = glm::vec4{inv_up, -glm::dot(inv_up, quad.center)},
      .color = quad.color,
      .emissive = quad.emissive,
    };
  }
}

//
// SceneGeometry:
//

namespace cornell {
  SceneGeometry::SceneGeometry(std::span<const Box> boxes, Quad light)
  : m_quads()
  {
    m_quads.reserve(boxes.size() * SCENE_QUADS_PER_BOX + 1);
    for (auto const &box: boxes) {
      auto faces = expandBox(box);
      m_quads.insert(m_quads.end(), faces.begin(), faces.end());
    }
    m_quads.push_back(light);

    CHECK(
      m_quads.size() * SCENE_VERTICES_PER_QUAD <= static_cast<size_t>(std::numeric_limits<uint16_t>::max()) + 1,
      [this] () { return fmt::format("Too many quads for 16-bit indices: {}", m_quads.size()); }
    );
  }
}
namespace cornell {
  SceneGeometry SceneGeometry::createCornellBox() {
    auto boxes = std::to_array({
      Box {
        .center = {0.0f, 5.0f, 0.0f},
        .width = 10.0f,
        .height = 10.0f,
        .depth = 10.0f,
        .rotation = 0.0f,
        .face_colors = {
          CORNELL_GREEN_WALL,
          CORNELL_GRAY_WALL,
          CORNELL_GRAY_WALL,
          CORNELL_RED_WALL,
          CORNELL_GRAY_WALL,
          CORNELL_GRAY_WALL,
        },
        .concave = true,
      },
      Box {
        .center = {1.5f, 1.5f, 1.0f},
        .width = 3.0f,
        .height = 3.0f,
        .depth = 3.0f,
        .rotation = 0.3f,
        .face_colors = uniformFaceColors(CORNELL_BLOCK),
        .concave = false,
      },
      Box {
        .center = {-2.0f, 3.0f, -2.0f},
        .width = 3.0f,
        .height = 6.0f,
        .depth = 3.0f,
        .rotation = -0.4f,
        .face_colors = uniformFaceColors(CORNELL_BLOCK),
        .concave = false,
      },
    });
    Quad light = {
      .center = {0.0f, 9.95f, 0.0f},
      .right = {1.0f, 0.0f, 0.0f},
      .up = {0.0f, 0.0f, 1.0f},
      .color = {5.0f, 5.0f, 5.0f},
      .emissive = 1.0f,
    };
    return SceneGeometry{boxes, light};
  }
}
namespace cornell {
  std::span<const Quad> SceneGeometry::quads() const {
    return m_quads;
  }
  Quad const &SceneGeometry::light() const {
    return m_quads.back();
  }
  LightParams SceneGeometry::lightParams() const {
    auto const &l = light();
    return LightParams {
      .center = l.center,
      .width = 2.0f * glm::length(l.right),
      .height = 2.0f * glm::length(l.up),
    };
  }
  uint32_t SceneGeometry::quadCount() const {
    return static_cast<uint32_t>(m_quads.size());
  }
  uint32_t SceneGeometry::lightQuadIndex() const {
    return quadCount() - 1;
  }
  uint32_t SceneGeometry::vertexCount() const {
    return quadCount() * SCENE_VERTICES_PER_QUAD;
  }
  uint32_t SceneGeometry::indexCount() const {
    return quadCount() * SCENE_INDICES_PER_QUAD;
  }
}
namespace cornell {
  std::vector<QuadRecord> SceneGeometry::quadRecords() const {
    std::vector<QuadRecord> records;
    records.reserve(m_quads.size());
    for (auto const &quad: m_quads) {
      records.push_back(packQuadRecord(quad));
    }
    return records;
  }
  std::vector<Vertex> SceneGeometry::vertices() const {
    std::vector<Vertex> vertices;
    vertices.reserve(vertexCount());
    for (uint32_t quad_idx = 0; quad_idx < quadCount(); quad_idx++) {
      auto const &q = m_quads[quad_idx];
      glm::vec3 emissive = q.color * q.emissive;
      float layer = static_cast<float>(quad_idx);
      vertices.push_back(Vertex{glm::vec4{q.center - q.right + q.up, 1.0f}, glm::vec3{0.0f, 1.0f, layer}, emissive});
      vertices.push_back(Vertex{glm::vec4{q.center + q.right + q.up, 1.0f}, glm::vec3{1.0f, 1.0f, layer}, emissive});
      vertices.push_back(Vertex{glm::vec4{q.center - q.right - q.up, 1.0f}, glm::vec3{0.0f, 0.0f, layer}, emissive});
      vertices.push_back(Vertex{glm::vec4{q.center + q.right - q.up, 1.0f}, glm::vec3{1.0f, 0.0f, layer}, emissive});
    }
    return vertices;
  }
  std::vector<uint16_t> SceneGeometry::indices() const {
    std::vector<uint16_t> indices;
    indices.reserve(indexCount());
    for (uint32_t quad_idx = 0; quad_idx < quadCount(); quad_idx++) {
      auto base = static_cast<uint16_t>(quad_idx * SCENE_VERTICES_PER_QUAD);
      for (uint16_t offset: {0, 2, 1, 1, 2, 3}) {
        indices.push_back(static_cast<uint16_t>(base + offset));
      }
    }
    return indices;
  }
}
