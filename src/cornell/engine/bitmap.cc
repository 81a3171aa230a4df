#include "cornell/engine/bitmap.hh"

#include <cstring>

#include "glm/gtc/packing.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb/stb_image_write.h"

namespace cornell {
  FloatBitmap::FloatBitmap(glm::i32vec3 dim)
  : m_pixels(static_cast<size_t>(dim.x) * dim.y * dim.z, 0.0f),
    m_dim(dim)
  {
    CHECK(dim.x >= 0 && dim.y >= 0 && dim.z >= 0, "Expected non-negative bitmap dimensions");
  }
  FloatBitmap::FloatBitmap()
  : m_pixels(),
    m_dim(0)
  {}
}
namespace cornell {
  void *FloatBitmap::data() {
    return m_pixels.data();
  }
  void const *FloatBitmap::data() const {
    return m_pixels.data();
  }
  int32_t FloatBitmap::dataSize() const {
    return pitch() * rows();
  }
  int32_t FloatBitmap::pitch() const {
    return m_dim.x * m_dim.z * static_cast<int32_t>(sizeof(float));
  }
  int32_t FloatBitmap::rows() const {
    return m_dim.y;
  }
}
namespace cornell {
  double FloatBitmap::channelMean(int32_t channel) const {
    CHECK(channel >= 0 && channel < m_dim.z, "Invalid bitmap channel");
    if (m_dim.x == 0 || m_dim.y == 0) {
      return 0.0;
    }
    double sum = 0.0;
    for (int32_t y = 0; y < m_dim.y; y++) {
      for (int32_t x = 0; x < m_dim.x; x++) {
        sum += this->operator()(x, y)[channel];
      }
    }
    return sum / (static_cast<double>(m_dim.x) * m_dim.y);
  }
}
namespace cornell {
  void FloatBitmap::save(const char *filepath) const {
    const char *extension = strrchr(filepath, '.');
    CHECK(
      extension != nullptr && 0 == strcmp(extension, ".hdr"),
      "Expected bitmap save filepath to end with '.hdr' extension."
    );
    int ok = stbi_write_hdr(filepath, m_dim.x, m_dim.y, m_dim.z, m_pixels.data());
    CHECK(ok, [filepath] () { return fmt::format("Something went wrong when saving a bitmap to '{}'.", filepath); });
  }
}
namespace cornell {
  FloatBitmap FloatBitmap::fromHalfTexels(glm::i32vec2 size, void const *texels, size_t row_pitch_bytes) {
    CHECK(row_pitch_bytes >= static_cast<size_t>(size.x) * 4 * sizeof(uint16_t), "Row pitch too small for RGBA16 texels");
    FloatBitmap output{glm::i32vec3{size, 3}};
    auto src = reinterpret_cast<uint8_t const *>(texels);
    for (int32_t y = 0; y < size.y; y++) {
      for (int32_t x = 0; x < size.x; x++) {
        uint16_t texel[4];
        memcpy(texel, src + y * row_pitch_bytes + x * sizeof(texel), sizeof(texel));
        float *dst = output(x, y);
        for (int32_t z = 0; z < 3; z++) {
          dst[z] = glm::unpackHalf1x16(texel[z]);
        }
      }
    }
    return output;
  }
}
