#include "gtest/gtest.h"
#include "glm/geometric.hpp"
#include "glm/gtc/constants.hpp"

#include "cornell/box/camera.hh"

namespace cornell {
  static glm::vec3 projectToNdc(glm::mat4x4 const &mvp, glm::vec3 point) {
    glm::vec4 clip = mvp * glm::vec4{point, 1.0f};
    return glm::vec3{clip} / clip.w;
  }
}

namespace cornell {
  TEST(CameraOrbitTest, StartsInFrontOfBox) {
    CameraOrbit camera;
    EXPECT_EQ(camera.angleRad(), 0.0);
    glm::vec3 eye = camera.eye();
    EXPECT_NEAR(eye.x, 0.0f, 1e-6f);
    EXPECT_NEAR(eye.y, 5.0f, 1e-6f);
    EXPECT_NEAR(eye.z, 15.0f, 1e-6f);
  }
  TEST(CameraOrbitTest, FrozenWithoutRotation) {
    CameraOrbit camera;
    glm::mat4x4 view = camera.viewMatrix();
    camera.update(false, 10.0);
    EXPECT_EQ(camera.angleRad(), 0.0);
    EXPECT_EQ(camera.viewMatrix(), view);
  }
  TEST(CameraOrbitTest, AdvancesWithTime) {
    CameraOrbit camera;
    camera.update(true, 1.0);
    EXPECT_DOUBLE_EQ(camera.angleRad(), 0.06);
    camera.update(true, 0.5);
    EXPECT_DOUBLE_EQ(camera.angleRad(), 0.09);
  }
  TEST(CameraOrbitTest, QuarterTurn) {
    CameraOrbit camera;
    camera.update(true, glm::half_pi<double>() / 0.06);
    glm::vec3 eye = camera.eye();
    EXPECT_NEAR(eye.x, 15.0f, 1e-4f);
    EXPECT_NEAR(eye.y, 5.0f, 1e-6f);
    EXPECT_NEAR(eye.z, 0.0f, 1e-4f);
  }
  TEST(CameraOrbitTest, AngleWrapsAroundFullTurn) {
    CameraOrbit camera;
    camera.update(true, glm::two_pi<double>() / 0.06 + 1.0);
    EXPECT_NEAR(camera.angleRad(), 0.06, 1e-9);
    for (int i = 0; i < 1000; i++) {
      camera.update(true, 1.7);
      ASSERT_GE(camera.angleRad(), 0.0);
      ASSERT_LT(camera.angleRad(), glm::two_pi<double>());
    }
  }
}

namespace cornell {
  TEST(CameraUniformTest, InverseUndoesProjection) {
    CameraOrbit camera;
    camera.update(true, 7.0);
    CommonUniform uniform = camera.uniform(16.0f / 9.0f, glm::vec3{0.0f});
    glm::mat4x4 identity = uniform.inv_mvp * uniform.mvp;
    for (int col = 0; col < 4; col++) {
      for (int row = 0; row < 4; row++) {
        EXPECT_NEAR(identity[col][row], col == row ? 1.0f : 0.0f, 1e-3f);
      }
    }
  }
  TEST(CameraUniformTest, TargetProjectsToScreenCenter) {
    CameraOrbit camera;
    camera.update(true, 3.0);
    CommonUniform uniform = camera.uniform(4.0f / 3.0f, glm::vec3{0.0f});
    glm::vec3 ndc = projectToNdc(uniform.mvp, CAMERA_TARGET);
    EXPECT_NEAR(ndc.x, 0.0f, 1e-5f);
    EXPECT_NEAR(ndc.y, 0.0f, 1e-5f);
    EXPECT_GT(ndc.z, 0.0f);
    EXPECT_LT(ndc.z, 1.0f);
  }
  TEST(CameraUniformTest, DepthRangeIsZeroToOne) {
    CameraOrbit camera;
    CommonUniform uniform = camera.uniform(1.0f, glm::vec3{0.0f});
    glm::vec3 forward = glm::normalize(CAMERA_TARGET - camera.eye());
    glm::vec3 near_point = camera.eye() + forward * CAMERA_Z_NEAR;
    glm::vec3 far_point = camera.eye() + forward * CAMERA_Z_FAR;
    EXPECT_NEAR(projectToNdc(uniform.mvp, near_point).z, 0.0f, 1e-4f);
    EXPECT_NEAR(projectToNdc(uniform.mvp, far_point).z, 1.0f, 1e-4f);
  }
  TEST(CameraUniformTest, UpIsUp) {
    CameraOrbit camera;
    CommonUniform uniform = camera.uniform(1.0f, glm::vec3{0.0f});
    glm::vec3 above = projectToNdc(uniform.mvp, CAMERA_TARGET + glm::vec3{0.0f, 1.0f, 0.0f});
    EXPECT_GT(above.y, 0.0f);
  }
  TEST(CameraUniformTest, CarriesSeed) {
    CameraOrbit camera;
    CommonUniform uniform = camera.uniform(1.0f, glm::vec3{1.0f, 22.0f, 333.0f});
    EXPECT_EQ(uniform.seed, glm::vec3(1.0f, 22.0f, 333.0f));
  }
}
