#include "cornell/box/accumulation.hh"

namespace cornell {
  uint64_t AccumulationParams::photonsPerFrame() const {
    return static_cast<uint64_t>(photons_per_workgroup) * workgroups_per_frame;
  }
  AccumulationParams AccumulationParams::createForLightmap(uint32_t layer_count) {
    return AccumulationParams {
      .photons_per_workgroup = RADIOSITY_PHOTONS_PER_WORKGROUP,
      .workgroups_per_frame = RADIOSITY_WORKGROUPS_PER_FRAME,
      .photon_energy = RADIOSITY_PHOTON_ENERGY,
      .total_texels = static_cast<uint64_t>(RADIOSITY_LIGHTMAP_WIDTH) * RADIOSITY_LIGHTMAP_HEIGHT * layer_count,
      .accumulation_mean_max = RADIOSITY_ACCUMULATION_MEAN_MAX,
    };
  }
}
namespace cornell {
  bool AccumulationStep::isRenormalization() const {
    return accumulation_buffer_scale != 1.0;
  }
}

namespace cornell {
  AccumulationSchedule::AccumulationSchedule(AccumulationParams params)
  : m_params(params),
    m_accumulation_mean(0.0),
    m_frame_count(0),
    m_renormalization_count(0)
  {
    CHECK(params.total_texels > 0, "Expected at least one lightmap texel");
    CHECK(params.photonsPerFrame() > 0, "Expected at least one photon per frame");
  }
}
namespace cornell {
  AccumulationStep AccumulationSchedule::advance() {
    m_accumulation_mean += meanIncrementPerFrame();

    double to_lightmap_scale = 1.0 / m_accumulation_mean;
    double buffer_scale = m_accumulation_mean > 2.0 * m_params.accumulation_mean_max ? 0.5 : 1.0;
    m_accumulation_mean *= buffer_scale;

    m_frame_count++;
    if (buffer_scale != 1.0) {
      m_renormalization_count++;
    }
    return AccumulationStep {
      .accumulation_to_lightmap_scale = to_lightmap_scale,
      .accumulation_buffer_scale = buffer_scale,
    };
  }
}
namespace cornell {
  double AccumulationSchedule::meanIncrementPerFrame() const {
    return static_cast<double>(m_params.photonsPerFrame()) * m_params.photon_energy / static_cast<double>(m_params.total_texels);
  }
  double AccumulationSchedule::accumulationMean() const {
    return m_accumulation_mean;
  }
  uint64_t AccumulationSchedule::frameCount() const {
    return m_frame_count;
  }
  uint64_t AccumulationSchedule::renormalizationCount() const {
    return m_renormalization_count;
  }
  AccumulationParams const &AccumulationSchedule::params() const {
    return m_params;
  }
}

namespace cornell {
  uint64_t accumulationBufferSize(uint32_t layer_count) {
    return static_cast<uint64_t>(RADIOSITY_LIGHTMAP_WIDTH) * RADIOSITY_LIGHTMAP_HEIGHT * layer_count * RADIOSITY_ACCUMULATION_BYTES_PER_TEXEL;
  }
  RadiosityUniform createRadiosityUniform(AccumulationStep step, LightParams light) {
    return RadiosityUniform {
      .accumulation_to_lightmap_scale = static_cast<float>(step.accumulation_to_lightmap_scale),
      .accumulation_buffer_scale = static_cast<float>(step.accumulation_buffer_scale),
      .light_width = light.width,
      .light_height = light.height,
      .light_center = light.center,
    };
  }
}
