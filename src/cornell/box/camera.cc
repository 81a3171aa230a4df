#include "cornell/box/camera.hh"

#include <cmath>

#include "glm/matrix.hpp"
#include "glm/gtc/matrix_transform.hpp"
#include "glm/gtc/constants.hpp"

namespace cornell {
  CameraOrbit::CameraOrbit()
  : m_angle_rad(0.0)
  {}
}
namespace cornell {
  void CameraOrbit::update(bool rotate, double dt_sec) {
    if (rotate) {
      m_angle_rad = std::fmod(m_angle_rad + CAMERA_ORBIT_SPEED_RAD_PER_SEC * dt_sec, glm::two_pi<double>());
    }
  }
}
namespace cornell {
  double CameraOrbit::angleRad() const {
    return m_angle_rad;
  }
  glm::vec3 CameraOrbit::eye() const {
    auto angle = static_cast<float>(m_angle_rad);
    return glm::vec3{std::sin(angle) * CAMERA_ORBIT_RADIUS, CAMERA_ORBIT_HEIGHT, std::cos(angle) * CAMERA_ORBIT_RADIUS};
  }
  glm::mat4x4 CameraOrbit::viewMatrix() const {
    return glm::lookAtRH(eye(), CAMERA_TARGET, glm::vec3{0.0f, 1.0f, 0.0f});
  }
  glm::mat4x4 CameraOrbit::projectionMatrix(float aspect) const {
    // WebGPU clip space has Z in [0, 1]:
    return glm::perspectiveRH_ZO(CAMERA_FOVY_RAD, aspect, CAMERA_Z_NEAR, CAMERA_Z_FAR);
  }
  CommonUniform CameraOrbit::uniform(float aspect, glm::vec3 seed) const {
    glm::mat4x4 mvp = projectionMatrix(aspect) * viewMatrix();
    return CommonUniform {
      .mvp = mvp,
      .inv_mvp = glm::inverse(mvp),
      .seed = seed,
    };
  }
}
