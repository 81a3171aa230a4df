#pragma once

#include <vector>
#include <cstdint>

#include "glm/vec2.hpp"
#include "glm/vec3.hpp"

#include "core.hh"

namespace cornell {
  /// @brief FloatBitmap represents a linear HDR raster image with Y rows, X columns, and Z planes.
  class FloatBitmap {
  private:
    std::vector<float> m_pixels;
    glm::i32vec3 m_dim;
  public:
    explicit FloatBitmap(glm::i32vec3 dim);
    FloatBitmap();
    FloatBitmap(FloatBitmap const &other) = delete;
    FloatBitmap(FloatBitmap &&other) = default;
    ~FloatBitmap() = default;
  public:
    FloatBitmap &operator=(FloatBitmap &&other) = default;
  public:
    inline glm::i32vec3 dim() const;
  public:
    inline float *operator() (int32_t x, int32_t y);
    inline float const *operator() (int32_t x, int32_t y) const;
  public:
    void *data();
    void const *data() const;
    int32_t dataSize() const;
    int32_t pitch() const;
    int32_t rows() const;
  public:
    double channelMean(int32_t channel) const;
  public:
    void save(const char *filepath) const;
  public:
    /// fromHalfTexels unpacks rows of RGBA16Float texels into an RGB bitmap. `row_pitch_bytes` may exceed the packed row
    /// size when the rows were copied out of a GPU buffer with a padded row pitch.
    static FloatBitmap fromHalfTexels(glm::i32vec2 size, void const *texels, size_t row_pitch_bytes);
  };
}

//
// Inline definitions:
//

namespace cornell {
  inline glm::i32vec3 FloatBitmap::dim() const {
    return m_dim;
  }
  inline float *FloatBitmap::operator() (int32_t x, int32_t y) {
    return &m_pixels[(y * m_dim.x * m_dim.z) + (x * m_dim.z)];
  }
  inline float const *FloatBitmap::operator() (int32_t x, int32_t y) const {
    return &m_pixels[(y * m_dim.x * m_dim.z) + (x * m_dim.z)];
  }
}
