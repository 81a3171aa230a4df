#pragma once

#include <cstdint>

#include "glm/vec3.hpp"
#include "glm/mat4x4.hpp"

#include "cornell/engine/core.hh"

//
// Constants:
//

namespace cornell {
  static const float CAMERA_FOVY_RAD = 2.0f * 3.14159265358979f / 8.0f;
  static const float CAMERA_Z_NEAR = 0.5f;
  static const float CAMERA_Z_FAR = 100.0f;
  static const float CAMERA_ORBIT_RADIUS = 15.0f;
  static const float CAMERA_ORBIT_HEIGHT = 5.0f;
  static const glm::vec3 CAMERA_TARGET{0.0f, 5.0f, 0.0f};
  static const double CAMERA_ORBIT_SPEED_RAD_PER_SEC = 0.06;
}

//
// GPU binary interface (POD):
//

namespace cornell {
  struct CommonUniform {
    glm::mat4x4 mvp;
    glm::mat4x4 inv_mvp;
    glm::vec3 seed;
    uint32_t rsv00 = 0;
  };
  static_assert(sizeof(CommonUniform) == 144, "invalid CommonUniform size");
}

//
// CameraOrbit:
//

namespace cornell {
  /// CameraOrbit circles the box at a fixed height, always looking at the box center. The angle only advances while
  /// rotation is enabled, so toggling rotation off freezes the view where it is.
  class CameraOrbit {
  private:
    double m_angle_rad;
  public:
    CameraOrbit();
  public:
    void update(bool rotate, double dt_sec);
  public:
    double angleRad() const;
    glm::vec3 eye() const;
    glm::mat4x4 viewMatrix() const;
    glm::mat4x4 projectionMatrix(float aspect) const;
    CommonUniform uniform(float aspect, glm::vec3 seed) const;
  };
}
