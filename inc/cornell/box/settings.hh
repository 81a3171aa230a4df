#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

#include "glm/vec2.hpp"

#include "cornell/engine/core.hh"

namespace cornell {
  enum class RendererType: uint32_t {
    Rasterizer,
    Raytracer,
    Metadata_Count,
  };
}
namespace cornell {
  const char *rendererTypeName(RendererType renderer);
  std::optional<RendererType> parseRendererType(std::string_view name);
  RendererType nextRendererType(RendererType renderer);
}

namespace cornell {
  static const uint32_t SETTINGS_DEFAULT_DUMP_LAYER = 4;
  static const uint64_t SETTINGS_DEFAULT_DUMP_FRAME = 512;
  static const char *const SETTINGS_DEFAULT_DUMP_PATH = "lightmap.hdr";
}
namespace cornell {
  struct LightmapDumpSettings {
    std::string filepath;
    uint32_t layer;
    uint64_t frame;
  };
  struct Settings {
    RendererType renderer = RendererType::Rasterizer;
    bool rotate_camera = true;
    glm::ivec2 window_size = {1280, 720};
    std::optional<uint64_t> frame_limit = std::nullopt;
    std::optional<LightmapDumpSettings> lightmap_dump = std::nullopt;
    std::optional<std::string> help_text = std::nullopt;
  public:
    /// parseCliArgs reads settings from the command line. Malformed or out-of-range values are fatal. When `--help` is
    /// given, only `help_text` is meaningful.
    static Settings parseCliArgs(int argc, const char *const argv[]);
  };
}
