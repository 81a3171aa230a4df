#pragma once

#include <cstdint>

#include "glm/vec3.hpp"

#include "cornell/engine/core.hh"
#include "geometry.hh"

//
// Constants:
//

namespace cornell {
  static const uint32_t RADIOSITY_LIGHTMAP_WIDTH = 256;
  static const uint32_t RADIOSITY_LIGHTMAP_HEIGHT = 256;

  // One photon per invocation:
  static const uint32_t RADIOSITY_PHOTONS_PER_WORKGROUP = 256;
  static const uint32_t RADIOSITY_WORKGROUPS_PER_FRAME = 1024;

  // Largest value a single photon may add to the accumulation buffer, summed over all texels it touches:
  static const uint32_t RADIOSITY_PHOTON_ENERGY = 100000;

  // Once the running mean exceeds twice this value, all accumulators are halved:
  static const uint32_t RADIOSITY_ACCUMULATION_MEAN_MAX = 0x10000000;

  static const uint32_t RADIOSITY_RESOLVE_WORKGROUP_SIZE_X = 16;
  static const uint32_t RADIOSITY_RESOLVE_WORKGROUP_SIZE_Y = 16;

  // Four u32 fixed-point accumulators per texel: RGB plus one reserved slot.
  static const uint32_t RADIOSITY_ACCUMULATORS_PER_TEXEL = 4;
  static const uint64_t RADIOSITY_ACCUMULATION_BYTES_PER_TEXEL = RADIOSITY_ACCUMULATORS_PER_TEXEL * sizeof(uint32_t);
}

//
// GPU binary interface (POD):
//

namespace cornell {
  struct RadiosityUniform {
    float accumulation_to_lightmap_scale;
    float accumulation_buffer_scale;
    float light_width;
    float light_height;
    glm::vec3 light_center;
    uint32_t rsv00 = 0;
  };
  static_assert(sizeof(RadiosityUniform) == 32, "invalid RadiosityUniform size");
}

//
// AccumulationSchedule:
//

namespace cornell {
  struct AccumulationParams {
    uint32_t photons_per_workgroup;
    uint32_t workgroups_per_frame;
    uint32_t photon_energy;
    uint64_t total_texels;
    uint32_t accumulation_mean_max;
  public:
    uint64_t photonsPerFrame() const;
  public:
    static AccumulationParams createForLightmap(uint32_t layer_count);
  };
  struct AccumulationStep {
    double accumulation_to_lightmap_scale;
    double accumulation_buffer_scale;
  public:
    bool isRenormalization() const;
  };
}
namespace cornell {
  /// AccumulationSchedule tracks the expected per-texel value of the accumulation buffer. The expectation is analytic:
  /// it depends only on the photon budget, never on what the photons actually hit.
  class AccumulationSchedule {
  private:
    AccumulationParams m_params;
    double m_accumulation_mean;
    uint64_t m_frame_count;
    uint64_t m_renormalization_count;
  public:
    explicit AccumulationSchedule(AccumulationParams params);
  public:
    /// advance accounts for one more frame of photons and returns the scales that frame's resolve pass must apply.
    /// `accumulation_to_lightmap_scale` is taken before any halving so that it matches the buffer as the photon pass
    /// leaves it; `accumulation_buffer_scale` is 0.5 on frames where the resolve pass must halve every accumulator.
    AccumulationStep advance();
  public:
    double meanIncrementPerFrame() const;
    double accumulationMean() const;
    uint64_t frameCount() const;
    uint64_t renormalizationCount() const;
    AccumulationParams const &params() const;
  };
}

namespace cornell {
  uint64_t accumulationBufferSize(uint32_t layer_count);
  RadiosityUniform createRadiosityUniform(AccumulationStep step, LightParams light);
}
