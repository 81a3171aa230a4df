#include <vector>

#include "gtest/gtest.h"

#include "cornell/box/settings.hh"

namespace cornell {
  static Settings parseArgs(std::vector<const char *> args) {
    args.insert(args.begin(), "cornell");
    return Settings::parseCliArgs(static_cast<int>(args.size()), args.data());
  }
}

namespace cornell {
  TEST(RendererTypeTest, Names) {
    EXPECT_STREQ(rendererTypeName(RendererType::Rasterizer), "rasterizer");
    EXPECT_STREQ(rendererTypeName(RendererType::Raytracer), "raytracer");
    EXPECT_EQ(parseRendererType("rasterizer"), RendererType::Rasterizer);
    EXPECT_EQ(parseRendererType("raytracer"), RendererType::Raytracer);
    EXPECT_FALSE(parseRendererType("pathtracer").has_value());
    EXPECT_FALSE(parseRendererType("").has_value());
  }
  TEST(RendererTypeTest, CyclesThroughRenderers) {
    EXPECT_EQ(nextRendererType(RendererType::Rasterizer), RendererType::Raytracer);
    EXPECT_EQ(nextRendererType(RendererType::Raytracer), RendererType::Rasterizer);
  }
}

namespace cornell {
  TEST(SettingsTest, Defaults) {
    Settings settings = parseArgs({});
    EXPECT_EQ(settings.renderer, RendererType::Rasterizer);
    EXPECT_TRUE(settings.rotate_camera);
    EXPECT_EQ(settings.window_size, glm::ivec2(1280, 720));
    EXPECT_FALSE(settings.frame_limit.has_value());
    EXPECT_FALSE(settings.lightmap_dump.has_value());
    EXPECT_FALSE(settings.help_text.has_value());
  }
  TEST(SettingsTest, ExplicitValues) {
    Settings settings = parseArgs({"-r", "raytracer", "--no-rotate", "-w", "640", "-h", "480", "-f", "10"});
    EXPECT_EQ(settings.renderer, RendererType::Raytracer);
    EXPECT_FALSE(settings.rotate_camera);
    EXPECT_EQ(settings.window_size, glm::ivec2(640, 480));
    ASSERT_TRUE(settings.frame_limit.has_value());
    EXPECT_EQ(settings.frame_limit.value(), 10u);
  }
  TEST(SettingsTest, LongOptionNames) {
    Settings settings = parseArgs({"--renderer=raytracer", "--width=320", "--height=200", "--frames=3"});
    EXPECT_EQ(settings.renderer, RendererType::Raytracer);
    EXPECT_EQ(settings.window_size, glm::ivec2(320, 200));
    EXPECT_EQ(settings.frame_limit, 3u);
  }
  TEST(SettingsTest, LightmapDumpDefaults) {
    Settings settings = parseArgs({"--dump-lightmap", "floor.hdr"});
    ASSERT_TRUE(settings.lightmap_dump.has_value());
    EXPECT_EQ(settings.lightmap_dump->filepath, "floor.hdr");
    EXPECT_EQ(settings.lightmap_dump->layer, SETTINGS_DEFAULT_DUMP_LAYER);
    EXPECT_EQ(settings.lightmap_dump->frame, SETTINGS_DEFAULT_DUMP_FRAME);
  }
  TEST(SettingsTest, LightmapDumpExplicit) {
    Settings settings = parseArgs({"--dump-lightmap", "light.hdr", "--dump-layer", "18", "--dump-frame", "64"});
    ASSERT_TRUE(settings.lightmap_dump.has_value());
    EXPECT_EQ(settings.lightmap_dump->filepath, "light.hdr");
    EXPECT_EQ(settings.lightmap_dump->layer, 18u);
    EXPECT_EQ(settings.lightmap_dump->frame, 64u);
  }
  TEST(SettingsTest, HelpText) {
    Settings settings = parseArgs({"--help"});
    ASSERT_TRUE(settings.help_text.has_value());
    EXPECT_NE(settings.help_text->find("--renderer"), std::string::npos);
    EXPECT_NE(settings.help_text->find("--dump-lightmap"), std::string::npos);
  }
}

namespace cornell {
  TEST(SettingsDeathTest, UnknownRenderer) {
    EXPECT_DEATH(parseArgs({"-r", "pathtracer"}), "Invalid --renderer: 'pathtracer'");
  }
  TEST(SettingsDeathTest, DumpPathMustBeHdr) {
    EXPECT_DEATH(parseArgs({"--dump-lightmap", "floor.png"}), "Invalid --dump-lightmap: 'floor.png'");
  }
  TEST(SettingsDeathTest, DumpLayerMustFitU32) {
    EXPECT_DEATH(parseArgs({"--dump-lightmap", "floor.hdr", "--dump-layer", "4294967300"}), "Invalid --dump-layer: 4294967300");
    EXPECT_DEATH(parseArgs({"--dump-lightmap", "floor.hdr", "--dump-layer=-1"}), "Invalid --dump-layer: -1");
  }
  TEST(SettingsDeathTest, WindowMustNotBeEmpty) {
    EXPECT_DEATH(parseArgs({"-w", "0"}), "Invalid --width/--height: 0x720");
  }
  TEST(SettingsDeathTest, FrameLimitMustBePositive) {
    EXPECT_DEATH(parseArgs({"-f", "0"}), "Invalid --frames: 0");
  }
  TEST(SettingsDeathTest, UnknownOption) {
    EXPECT_DEATH(parseArgs({"--bogus"}), "Invalid command line");
  }
}
