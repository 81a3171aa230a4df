#include "cornell/box/settings.hh"

#include <exception>
#include <limits>

#include "cxxopts.hpp"

namespace cornell {
  static EnumMap<RendererType, const char *> createRendererTypeNames() {
    EnumMap<RendererType, const char *> names;
    names[RendererType::Rasterizer] = "rasterizer";
    names[RendererType::Raytracer] = "raytracer";
    return names;
  }
  static const EnumMap<RendererType, const char *> RENDERER_TYPE_NAMES = createRendererTypeNames();
}

namespace cornell {
  const char *rendererTypeName(RendererType renderer) {
    return RENDERER_TYPE_NAMES[renderer];
  }
  std::optional<RendererType> parseRendererType(std::string_view name) {
    for (size_t i = 0; i < RENDERER_TYPE_NAMES.size(); i++) {
      if (name == RENDERER_TYPE_NAMES[i]) {
        return static_cast<RendererType>(i);
      }
    }
    return std::nullopt;
  }
  RendererType nextRendererType(RendererType renderer) {
    auto next = (static_cast<size_t>(renderer) + 1) % enum_count<RendererType>();
    return static_cast<RendererType>(next);
  }
}

namespace cornell {
  static cxxopts::Options createCliOptions() {
    cxxopts::Options options{"cornell", "Progressive radiosity in a Cornell box"};
    options.add_options()
      ("r,renderer", "Renderer to start with: 'rasterizer' or 'raytracer'", cxxopts::value<std::string>()->default_value("rasterizer"))
      ("no-rotate", "Start with camera rotation disabled")
      ("w,width", "Window width in pixels", cxxopts::value<int>()->default_value("1280"))
      ("h,height", "Window height in pixels", cxxopts::value<int>()->default_value("720"))
      ("f,frames", "Exit after this many frames", cxxopts::value<int64_t>())
      ("dump-lightmap", "Save one lightmap layer to this '.hdr' file", cxxopts::value<std::string>())
      ("dump-layer", "Lightmap layer (quad index) to save", cxxopts::value<int64_t>()->default_value(std::to_string(SETTINGS_DEFAULT_DUMP_LAYER)))
      ("dump-frame", "Frame after which the lightmap is saved", cxxopts::value<int64_t>()->default_value(std::to_string(SETTINGS_DEFAULT_DUMP_FRAME)))
      ("help", "Print usage");
    return options;
  }
}

namespace cornell {
  Settings Settings::parseCliArgs(int argc, const char *const argv[]) {
    auto options = createCliOptions();
    Settings settings;

    // cxxopts reports malformed arguments by throwing:
    try {
      auto result = options.parse(argc, argv);
      if (result.count("help")) {
        settings.help_text = options.help();
        return settings;
      }

      auto renderer_name = result["renderer"].as<std::string>();
      auto renderer = parseRendererType(renderer_name);
      CHECK(
        renderer.has_value(),
        [&renderer_name] () { return fmt::format("Invalid --renderer: '{}'", renderer_name); }
      );
      settings.renderer = renderer.value();
      settings.rotate_camera = result.count("no-rotate") == 0;

      settings.window_size = {result["width"].as<int>(), result["height"].as<int>()};
      CHECK(
        settings.window_size.x > 0 && settings.window_size.y > 0,
        [&settings] () { return fmt::format("Invalid --width/--height: {}x{}", settings.window_size.x, settings.window_size.y); }
      );

      if (result.count("frames")) {
        auto frames = result["frames"].as<int64_t>();
        CHECK(frames > 0, [frames] () { return fmt::format("Invalid --frames: {}", frames); });
        settings.frame_limit = static_cast<uint64_t>(frames);
      }

      if (result.count("dump-lightmap")) {
        auto filepath = result["dump-lightmap"].as<std::string>();
        auto layer = result["dump-layer"].as<int64_t>();
        auto frame = result["dump-frame"].as<int64_t>();
        CHECK(
          filepath.size() > 4 && filepath.ends_with(".hdr"),
          [&filepath] () { return fmt::format("Invalid --dump-lightmap: '{}' (expected a '.hdr' path)", filepath); }
        );
        CHECK(
          layer >= 0 && layer <= std::numeric_limits<uint32_t>::max(),
          [layer] () { return fmt::format("Invalid --dump-layer: {}", layer); }
        );
        CHECK(frame > 0, [frame] () { return fmt::format("Invalid --dump-frame: {}", frame); });
        settings.lightmap_dump = LightmapDumpSettings {
          .filepath = std::move(filepath),
          .layer = static_cast<uint32_t>(layer),
          .frame = static_cast<uint64_t>(frame),
        };
      }
    } catch (std::exception const &e) {
      PANIC("Invalid command line: {}", e.what());
    }

    return settings;
  }
}
