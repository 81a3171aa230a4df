#include <vector>

#include "gtest/gtest.h"
#include "glm/geometric.hpp"

#include "cornell/box/geometry.hh"

namespace cornell {
  static float planeDistance(glm::vec4 plane, glm::vec3 point) {
    return glm::dot(plane, glm::vec4{point, 1.0f});
  }
  static void expectOrthogonalBasis(Quad const &quad, size_t index) {
    glm::vec3 normal = quadNormal(quad);
    EXPECT_NEAR(glm::dot(quad.right, quad.up), 0.0f, 1e-4f) << "quad " << index;
    EXPECT_NEAR(glm::dot(normal, quad.right), 0.0f, 1e-4f) << "quad " << index;
    EXPECT_NEAR(glm::dot(normal, quad.up), 0.0f, 1e-4f) << "quad " << index;
    EXPECT_NEAR(glm::length(normal), 1.0f, 1e-5f) << "quad " << index;
  }
  static void expectVec3Near(glm::vec3 actual, glm::vec3 expected, float tolerance = 1e-5f) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.z, expected.z, tolerance);
  }
}

namespace cornell {
  TEST(ReciprocalTest, InvertsLength) {
    glm::vec3 v{3.0f, 0.0f, 4.0f};
    glm::vec3 r = reciprocal(v);
    EXPECT_NEAR(glm::dot(r, v), 1.0f, 1e-6f);
    expectVec3Near(r, v / 25.0f);
  }
  TEST(ReciprocalTest, ZeroVectorMapsToZero) {
    expectVec3Near(reciprocal(glm::vec3{0.0f}), glm::vec3{0.0f}, 0.0f);
  }
}

namespace cornell {
  TEST(ExpandBoxTest, ConcaveBoxFacesInward) {
    Box box = {
      .center = {0.0f, 5.0f, 0.0f},
      .width = 10.0f,
      .height = 10.0f,
      .depth = 10.0f,
      .rotation = 0.0f,
      .face_colors = {},
      .concave = true,
    };
    for (auto const &quad: expandBox(box)) {
      EXPECT_GT(glm::dot(quadNormal(quad), box.center - quad.center), 0.0f);
    }
  }
  TEST(ExpandBoxTest, ConvexBoxFacesOutward) {
    Box box = {
      .center = {-2.0f, 3.0f, -2.0f},
      .width = 3.0f,
      .height = 6.0f,
      .depth = 3.0f,
      .rotation = -0.4f,
      .face_colors = {},
      .concave = false,
    };
    for (auto const &quad: expandBox(box)) {
      EXPECT_LT(glm::dot(quadNormal(quad), box.center - quad.center), 0.0f);
    }
  }
  TEST(ExpandBoxTest, FacesCoverBoxExtents) {
    Box box = {
      .center = {1.0f, 2.0f, 3.0f},
      .width = 2.0f,
      .height = 4.0f,
      .depth = 6.0f,
      .rotation = 0.0f,
      .face_colors = {},
      .concave = true,
    };
    auto faces = expandBox(box);
    expectVec3Near(faces[0].center, glm::vec3{2.0f, 2.0f, 3.0f});
    expectVec3Near(faces[1].center, glm::vec3{1.0f, 4.0f, 3.0f});
    expectVec3Near(faces[2].center, glm::vec3{1.0f, 2.0f, 0.0f});
    expectVec3Near(faces[3].center, glm::vec3{0.0f, 2.0f, 3.0f});
    expectVec3Near(faces[4].center, glm::vec3{1.0f, 0.0f, 3.0f});
    expectVec3Near(faces[5].center, glm::vec3{1.0f, 2.0f, 6.0f});

    // Half-extents follow the box dimensions:
    EXPECT_NEAR(glm::length(faces[0].right), 3.0f, 1e-5f);
    EXPECT_NEAR(glm::length(faces[0].up), 2.0f, 1e-5f);
    EXPECT_NEAR(glm::length(faces[1].right), 1.0f, 1e-5f);
    EXPECT_NEAR(glm::length(faces[1].up), 3.0f, 1e-5f);
  }
  TEST(ExpandBoxTest, RotatedNonCubicBoxKeepsOrthogonalAxes) {
    Box box = {
      .center = {0.0f, 1.0f, 0.0f},
      .width = 2.0f,
      .height = 4.0f,
      .depth = 6.0f,
      .rotation = 0.3f,
      .face_colors = {},
      .concave = false,
    };
    auto faces = expandBox(box);
    for (size_t i = 0; i < faces.size(); i++) {
      expectOrthogonalBasis(faces[i], i);
    }

    // Half-extents are preserved under rotation:
    EXPECT_NEAR(glm::length(faces[1].right), 1.0f, 1e-5f);
    EXPECT_NEAR(glm::length(faces[1].up), 3.0f, 1e-5f);
    EXPECT_NEAR(glm::length(faces[0].right), 3.0f, 1e-5f);
  }
  TEST(ExpandBoxTest, KeepsFaceColorOrder) {
    Box box = {
      .center = {0.0f, 0.0f, 0.0f},
      .width = 1.0f,
      .height = 1.0f,
      .depth = 1.0f,
      .rotation = 0.0f,
      .face_colors = {
        glm::vec3{0.0f},
        glm::vec3{1.0f},
        glm::vec3{2.0f},
        glm::vec3{3.0f},
        glm::vec3{4.0f},
        glm::vec3{5.0f},
      },
      .concave = false,
    };
    auto faces = expandBox(box);
    for (size_t i = 0; i < faces.size(); i++) {
      EXPECT_EQ(faces[i].color, glm::vec3{static_cast<float>(i)});
      EXPECT_EQ(faces[i].emissive, 0.0f);
    }
  }
}

namespace cornell {
  TEST(PackQuadRecordTest, EncodesPlaneAndAxes) {
    Quad quad = {
      .center = {1.0f, 2.0f, 3.0f},
      .right = {2.0f, 0.0f, 0.0f},
      .up = {0.0f, 0.5f, 0.0f},
      .color = {0.1f, 0.2f, 0.3f},
      .emissive = 0.5f,
    };
    QuadRecord record = packQuadRecord(quad);

    expectVec3Near(glm::vec3{record.plane}, glm::vec3{0.0f, 0.0f, 1.0f});
    EXPECT_NEAR(planeDistance(record.plane, quad.center), 0.0f, 1e-5f);
    EXPECT_NEAR(planeDistance(record.plane, quad.center + glm::vec3{0.0f, 0.0f, 2.0f}), 2.0f, 1e-5f);

    // Corners project to -1 and +1 along each axis:
    EXPECT_NEAR(planeDistance(record.right, quad.center), 0.0f, 1e-5f);
    EXPECT_NEAR(planeDistance(record.right, quad.center + quad.right), 1.0f, 1e-5f);
    EXPECT_NEAR(planeDistance(record.right, quad.center - quad.right), -1.0f, 1e-5f);
    EXPECT_NEAR(planeDistance(record.up, quad.center + quad.up), 1.0f, 1e-5f);
    EXPECT_NEAR(planeDistance(record.up, quad.center - quad.up), -1.0f, 1e-5f);

    expectVec3Near(record.color, quad.color);
    EXPECT_EQ(record.emissive, 0.5f);
  }
  TEST(PackQuadRecordTest, DegenerateAxisPacksZero) {
    Quad quad = {
      .center = {1.0f, 2.0f, 3.0f},
      .right = {0.0f, 0.0f, 0.0f},
      .up = {0.0f, 1.0f, 0.0f},
      .color = {1.0f, 1.0f, 1.0f},
    };
    QuadRecord record = packQuadRecord(quad);
    EXPECT_EQ(record.right, glm::vec4{0.0f});
    expectVec3Near(glm::vec3{record.up}, glm::vec3{0.0f, 1.0f, 0.0f});

    // No NaNs leak into the plane:
    EXPECT_EQ(quadNormal(quad), glm::vec3{0.0f});
    EXPECT_EQ(record.plane, glm::vec4{0.0f});
  }
}

namespace cornell {
  TEST(SceneGeometryTest, CornellBoxLayout) {
    SceneGeometry scene = SceneGeometry::createCornellBox();
    EXPECT_EQ(scene.quadCount(), 19u);
    EXPECT_EQ(scene.lightQuadIndex(), 18u);
    EXPECT_EQ(scene.vertexCount(), 76u);
    EXPECT_EQ(scene.indexCount(), 114u);
    EXPECT_EQ(scene.quads().size(), 19u);

    // Only the light is emissive:
    for (uint32_t i = 0; i < scene.lightQuadIndex(); i++) {
      EXPECT_EQ(scene.quads()[i].emissive, 0.0f) << "quad " << i;
    }
    EXPECT_EQ(scene.light().emissive, 1.0f);
    EXPECT_EQ(scene.light().color, glm::vec3{5.0f});
  }
  TEST(SceneGeometryTest, LightFacesDownFromCeiling) {
    SceneGeometry scene = SceneGeometry::createCornellBox();
    LightParams light = scene.lightParams();
    expectVec3Near(light.center, glm::vec3{0.0f, 9.95f, 0.0f});
    EXPECT_FLOAT_EQ(light.width, 2.0f);
    EXPECT_FLOAT_EQ(light.height, 2.0f);
    expectVec3Near(quadNormal(scene.light()), glm::vec3{0.0f, -1.0f, 0.0f});

    // The room's floor is layer 4, facing up at the light:
    Quad const &floor = scene.quads()[4];
    expectVec3Near(floor.center, glm::vec3{0.0f, 0.0f, 0.0f});
    expectVec3Near(quadNormal(floor), glm::vec3{0.0f, 1.0f, 0.0f});
  }
  TEST(SceneGeometryTest, RoomWallColors) {
    SceneGeometry scene = SceneGeometry::createCornellBox();
    auto quads = scene.quads();
    EXPECT_EQ(quads[0].color, glm::vec3(0.0f, 0.5f, 0.0f));
    EXPECT_EQ(quads[3].color, glm::vec3(0.5f, 0.0f, 0.0f));
    EXPECT_EQ(quads[1].color, glm::vec3(0.5f));
    EXPECT_EQ(quads[6].color, glm::vec3(0.8f));
    EXPECT_EQ(quads[17].color, glm::vec3(0.8f));
  }
  TEST(SceneGeometryTest, QuadAxesAreOrthogonal) {
    SceneGeometry scene = SceneGeometry::createCornellBox();
    auto quads = scene.quads();
    for (size_t i = 0; i < quads.size(); i++) {
      expectOrthogonalBasis(quads[i], i);
    }
  }
  TEST(SceneGeometryTest, VerticesFollowQuadCorners) {
    SceneGeometry scene = SceneGeometry::createCornellBox();
    auto vertices = scene.vertices();
    ASSERT_EQ(vertices.size(), scene.vertexCount());
    for (uint32_t i = 0; i < scene.quadCount(); i++) {
      Quad const &q = scene.quads()[i];
      Vertex const *v = &vertices[i * SCENE_VERTICES_PER_QUAD];
      expectVec3Near(glm::vec3{v[0].position}, q.center - q.right + q.up);
      expectVec3Near(glm::vec3{v[1].position}, q.center + q.right + q.up);
      expectVec3Near(glm::vec3{v[2].position}, q.center - q.right - q.up);
      expectVec3Near(glm::vec3{v[3].position}, q.center + q.right - q.up);
      EXPECT_EQ(v[0].uv_quad, glm::vec3(0.0f, 1.0f, static_cast<float>(i)));
      EXPECT_EQ(v[1].uv_quad, glm::vec3(1.0f, 1.0f, static_cast<float>(i)));
      EXPECT_EQ(v[2].uv_quad, glm::vec3(0.0f, 0.0f, static_cast<float>(i)));
      EXPECT_EQ(v[3].uv_quad, glm::vec3(1.0f, 0.0f, static_cast<float>(i)));
      for (int corner = 0; corner < 4; corner++) {
        EXPECT_EQ(v[corner].position.w, 1.0f);
        EXPECT_EQ(v[corner].emissive, q.color * q.emissive);
      }
    }
  }
  TEST(SceneGeometryTest, TrianglesWindTowardsQuadNormal) {
    SceneGeometry scene = SceneGeometry::createCornellBox();
    auto vertices = scene.vertices();
    auto indices = scene.indices();
    ASSERT_EQ(indices.size(), scene.indexCount());
    EXPECT_EQ(
      std::vector<uint16_t>(indices.begin(), indices.begin() + 12),
      (std::vector<uint16_t>{0, 2, 1, 1, 2, 3, 4, 6, 5, 5, 6, 7})
    );

    // Counter-clockwise when viewed from the front:
    for (size_t t = 0; t < indices.size(); t += 3) {
      glm::vec3 a{vertices[indices[t + 0]].position};
      glm::vec3 b{vertices[indices[t + 1]].position};
      glm::vec3 c{vertices[indices[t + 2]].position};
      auto quad_idx = static_cast<uint32_t>(vertices[indices[t]].uv_quad.z);
      glm::vec3 normal = quadNormal(scene.quads()[quad_idx]);
      EXPECT_GT(glm::dot(glm::cross(b - a, c - a), normal), 0.0f) << "triangle " << t / 3;
    }
  }
  TEST(SceneGeometryTest, QuadRecordsMatchQuads) {
    SceneGeometry scene = SceneGeometry::createCornellBox();
    auto records = scene.quadRecords();
    ASSERT_EQ(records.size(), scene.quadCount());
    for (uint32_t i = 0; i < scene.quadCount(); i++) {
      Quad const &q = scene.quads()[i];
      EXPECT_NEAR(planeDistance(records[i].plane, q.center), 0.0f, 1e-4f);
      EXPECT_NEAR(planeDistance(records[i].right, q.center + q.right), 1.0f, 1e-4f);
      EXPECT_NEAR(planeDistance(records[i].up, q.center + q.up), 1.0f, 1e-4f);
    }
  }
  TEST(SceneGeometryDeathTest, TooManyQuadsForShortIndices) {
    std::vector<Box> boxes(2731, Box {
      .center = {0.0f, 0.0f, 0.0f},
      .width = 1.0f,
      .height = 1.0f,
      .depth = 1.0f,
      .rotation = 0.0f,
      .face_colors = {},
      .concave = false,
    });
    Quad light = {
      .center = {0.0f, 1.0f, 0.0f},
      .right = {1.0f, 0.0f, 0.0f},
      .up = {0.0f, 0.0f, 1.0f},
      .color = {1.0f, 1.0f, 1.0f},
      .emissive = 1.0f,
    };
    EXPECT_DEATH((void)SceneGeometry(boxes, light), "Too many quads for 16-bit indices");
  }
}
