#include "cornell/box/common.hh"

#include <array>

namespace cornell {
  Common::Common(wgpu::Device &device, Scene const &scene)
  : m_device(device),
    m_uniform_buffer(nullptr),
    m_bind_group_layout(nullptr),
    m_bind_group(nullptr),
    m_camera(),
    m_rng(std::random_device{}()),
    m_uniform()
  {
    // uniform buffer:
    {
      wgpu::BufferDescriptor descriptor = {
        .label = "Cornell.Common.UniformBuffer",
        .usage = wgpu::BufferUsage::Uniform | wgpu::BufferUsage::CopyDst,
        .size = sizeof(CommonUniform),
        .mappedAtCreation = false,
      };
      m_uniform_buffer = m_device.CreateBuffer(&descriptor);
    }

    // bind group layout:
    {
      auto entries = std::to_array({
        wgpu::BindGroupLayoutEntry {
          .binding = 0,
          .visibility = wgpu::ShaderStage::Vertex | wgpu::ShaderStage::Compute,
          .buffer = wgpu::BufferBindingLayout {
            .type = wgpu::BufferBindingType::Uniform,
            .minBindingSize = sizeof(CommonUniform),
          },
        },
        wgpu::BindGroupLayoutEntry {
          .binding = 1,
          .visibility = wgpu::ShaderStage::Compute,
          .buffer = wgpu::BufferBindingLayout {
            .type = wgpu::BufferBindingType::ReadOnlyStorage,
            .minBindingSize = sizeof(QuadRecord),
          },
        },
      });
      wgpu::BindGroupLayoutDescriptor descriptor = {
        .label = "Cornell.Common.BindGroupLayout",
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      m_bind_group_layout = m_device.CreateBindGroupLayout(&descriptor);
    }

    // bind group:
    {
      auto entries = std::to_array({
        wgpu::BindGroupEntry {
          .binding = 0,
          .buffer = m_uniform_buffer,
          .size = sizeof(CommonUniform),
        },
        wgpu::BindGroupEntry {
          .binding = 1,
          .buffer = scene.quadBuffer(),
          .size = scene.quadBufferSize(),
        },
      });
      wgpu::BindGroupDescriptor descriptor = {
        .label = "Cornell.Common.BindGroup",
        .layout = m_bind_group_layout,
        .entryCount = entries.size(),
        .entries = entries.data(),
      };
      m_bind_group = m_device.CreateBindGroup(&descriptor);
    }
  }
}
namespace cornell {
  void Common::update(bool rotate, float aspect, double dt_sec) {
    m_camera.update(rotate, dt_sec);
    glm::vec3 seed{
      static_cast<float>(m_rng()),
      static_cast<float>(m_rng()),
      static_cast<float>(m_rng()),
    };
    m_uniform = m_camera.uniform(aspect, seed);
    m_device.GetQueue().WriteBuffer(m_uniform_buffer, 0, &m_uniform, sizeof(CommonUniform));
  }
}
namespace cornell {
  wgpu::BindGroupLayout const &Common::bindGroupLayout() const {
    return m_bind_group_layout;
  }
  wgpu::BindGroup const &Common::bindGroup() const {
    return m_bind_group;
  }
}
