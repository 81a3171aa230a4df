#include <random>
#include <vector>
#include <cmath>

#include "gtest/gtest.h"

#include "cornell/box/accumulation.hh"

namespace cornell {
  TEST(AccumulationParamsTest, LightmapBudget) {
    auto params = AccumulationParams::createForLightmap(19);
    EXPECT_EQ(params.photonsPerFrame(), 256u * 1024u);
    EXPECT_EQ(params.total_texels, 256u * 256u * 19u);
    EXPECT_EQ(params.photon_energy, 100000u);
    EXPECT_EQ(params.accumulation_mean_max, 1u << 28);
  }
  TEST(AccumulationParamsTest, BufferSize) {
    EXPECT_EQ(accumulationBufferSize(1), 256u * 256u * 16u);
    EXPECT_EQ(accumulationBufferSize(19), 19922944u);
  }
}

namespace cornell {
  TEST(AccumulationScheduleTest, FirstFrame) {
    AccumulationSchedule schedule{AccumulationParams::createForLightmap(19)};
    EXPECT_EQ(schedule.frameCount(), 0u);
    EXPECT_EQ(schedule.accumulationMean(), 0.0);

    double expected_mean = 256.0 * 1024.0 * 100000.0 / (256.0 * 256.0 * 19.0);
    EXPECT_DOUBLE_EQ(schedule.meanIncrementPerFrame(), expected_mean);

    AccumulationStep step = schedule.advance();
    EXPECT_FALSE(step.isRenormalization());
    EXPECT_EQ(step.accumulation_buffer_scale, 1.0);
    EXPECT_DOUBLE_EQ(step.accumulation_to_lightmap_scale, 1.0 / expected_mean);
    EXPECT_DOUBLE_EQ(schedule.accumulationMean(), expected_mean);
    EXPECT_EQ(schedule.frameCount(), 1u);
    EXPECT_EQ(schedule.renormalizationCount(), 0u);
  }
  TEST(AccumulationScheduleTest, HalvesOncePastTwiceTheMaximum) {
    AccumulationSchedule schedule{AccumulationParams::createForLightmap(19)};
    double increment = schedule.meanIncrementPerFrame();
    double limit = 2.0 * static_cast<double>(1u << 28);

    double expected_mean = 0.0;
    uint64_t expected_renormalizations = 0;
    for (int frame = 0; frame < 60000; frame++) {
      expected_mean += increment;
      AccumulationStep step = schedule.advance();

      // The lightmap scale always refers to the buffer before halving:
      ASSERT_DOUBLE_EQ(step.accumulation_to_lightmap_scale, 1.0 / expected_mean) << "frame " << frame;
      if (expected_mean > limit) {
        ASSERT_TRUE(step.isRenormalization()) << "frame " << frame;
        ASSERT_EQ(step.accumulation_buffer_scale, 0.5);
        expected_mean *= 0.5;
        expected_renormalizations++;
      } else {
        ASSERT_FALSE(step.isRenormalization()) << "frame " << frame;
      }
      ASSERT_DOUBLE_EQ(schedule.accumulationMean(), expected_mean);
      ASSERT_LE(schedule.accumulationMean(), limit);
    }
    EXPECT_EQ(schedule.frameCount(), 60000u);
    EXPECT_GE(expected_renormalizations, 1u);
    EXPECT_EQ(schedule.renormalizationCount(), expected_renormalizations);
  }
  TEST(AccumulationScheduleDeathTest, RejectsEmptyLightmap) {
    AccumulationParams params = AccumulationParams::createForLightmap(19);
    params.total_texels = 0;
    EXPECT_DEATH(AccumulationSchedule{params}, "Expected at least one lightmap texel");
  }
  TEST(AccumulationScheduleDeathTest, RejectsZeroPhotons) {
    AccumulationParams params = AccumulationParams::createForLightmap(19);
    params.workgroups_per_frame = 0;
    EXPECT_DEATH(AccumulationSchedule{params}, "Expected at least one photon per frame");
  }
}

namespace cornell {
  TEST(RadiosityUniformTest, PacksStepAndLight) {
    AccumulationStep step = {
      .accumulation_to_lightmap_scale = 0.25,
      .accumulation_buffer_scale = 0.5,
    };
    LightParams light = {
      .center = {0.0f, 9.95f, 0.0f},
      .width = 2.0f,
      .height = 3.0f,
    };
    RadiosityUniform uniform = createRadiosityUniform(step, light);
    EXPECT_EQ(uniform.accumulation_to_lightmap_scale, 0.25f);
    EXPECT_EQ(uniform.accumulation_buffer_scale, 0.5f);
    EXPECT_EQ(uniform.light_width, 2.0f);
    EXPECT_EQ(uniform.light_height, 3.0f);
    EXPECT_EQ(uniform.light_center, glm::vec3(0.0f, 9.95f, 0.0f));
  }
}

//
// CPU model of the photon and resolve passes:
//

namespace cornell {
  class AccumulationModel {
  private:
    AccumulationSchedule m_schedule;
    std::vector<uint32_t> m_accumulators;
    std::vector<double> m_lightmap;
    std::mt19937 m_rng;
  public:
    explicit AccumulationModel(AccumulationParams params)
    : m_schedule(params),
      m_accumulators(params.total_texels, 0),
      m_lightmap(params.total_texels, 0.0),
      m_rng(1234)
    {}
  public:
    // Every photon deposits its full energy into one uniformly chosen texel.
    void runFrame() {
      auto const &params = m_schedule.params();
      std::uniform_int_distribution<size_t> texel_dist{0, m_accumulators.size() - 1};
      for (uint64_t i = 0; i < params.photonsPerFrame(); i++) {
        m_accumulators[texel_dist(m_rng)] += params.photon_energy;
      }

      AccumulationStep step = m_schedule.advance();
      std::uniform_int_distribution<uint32_t> bit_dist{0, 1};
      for (size_t i = 0; i < m_accumulators.size(); i++) {
        m_lightmap[i] = static_cast<double>(m_accumulators[i]) * step.accumulation_to_lightmap_scale;
        if (step.isRenormalization()) {
          uint32_t v = m_accumulators[i];
          m_accumulators[i] = v / 2 + ((v & 1) ? bit_dist(m_rng) : 0);
        }
      }
    }
    double lightmapMean() const {
      double sum = 0.0;
      for (double v: m_lightmap) {
        sum += v;
      }
      return sum / static_cast<double>(m_lightmap.size());
    }
    double lightmapRmsError() const {
      double sum = 0.0;
      for (double v: m_lightmap) {
        sum += (v - 1.0) * (v - 1.0);
      }
      return std::sqrt(sum / static_cast<double>(m_lightmap.size()));
    }
    AccumulationSchedule const &schedule() const {
      return m_schedule;
    }
  };
}
namespace cornell {
  static AccumulationParams createModelParams() {
    return AccumulationParams {
      .photons_per_workgroup = 1,
      .workgroups_per_frame = 256,
      .photon_energy = 1000,
      .total_texels = 256,
      .accumulation_mean_max = 1 << 14,
    };
  }
}
namespace cornell {
  TEST(AccumulationModelTest, LightmapMeanStaysNormalized) {
    AccumulationModel model{createModelParams()};
    for (int frame = 0; frame < 300; frame++) {
      model.runFrame();
      ASSERT_NEAR(model.lightmapMean(), 1.0, 1e-3) << "frame " << frame;
    }
    EXPECT_GE(model.schedule().renormalizationCount(), 5u);
  }
  TEST(AccumulationModelTest, ErrorShrinksWithMoreFrames) {
    AccumulationModel model{createModelParams()};
    double early_error = 0.0;
    for (int frame = 1; frame <= 256; frame++) {
      model.runFrame();
      if (frame == 4) {
        early_error = model.lightmapRmsError();
      }
    }
    double late_error = model.lightmapRmsError();
    EXPECT_GT(early_error, 0.0);
    EXPECT_LT(late_error, 0.5 * early_error);
  }
}
