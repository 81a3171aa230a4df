#pragma once

#include <random>
#include <cstdint>

#include "webgpu/webgpu_cpp.h"

#include "cornell/engine/core.hh"
#include "camera.hh"
#include "scene.hh"

namespace cornell {
  /// Common owns the per-frame uniforms every pass reads from bind group 0: the camera matrices, a random seed, and the
  /// scene's quad records.
  class Common {
  private:
    wgpu::Device m_device;
    wgpu::Buffer m_uniform_buffer;
    wgpu::BindGroupLayout m_bind_group_layout;
    wgpu::BindGroup m_bind_group;
    CameraOrbit m_camera;
    std::mt19937 m_rng;
    CommonUniform m_uniform;
  public:
    Common(wgpu::Device &device, Scene const &scene);
    Common(Common const &other) = delete;
    Common(Common &&other) = delete;
    ~Common() = default;
  public:
    void update(bool rotate, float aspect, double dt_sec);
  public:
    wgpu::BindGroupLayout const &bindGroupLayout() const;
    wgpu::BindGroup const &bindGroup() const;
  };
}
