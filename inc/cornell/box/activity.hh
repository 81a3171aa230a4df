#pragma once

#include <memory>
#include <optional>
#include <string>
#include <cstdint>

#include "webgpu/webgpu_cpp.h"

#include "cornell/engine/core.hh"
#include "cornell/engine/gpu.hh"
#include "cornell/engine/engine.hh"
#include "settings.hh"
#include "dump.hh"
#include "scene.hh"
#include "common.hh"
#include "radiosity.hh"
#include "rasterizer.hh"
#include "raytracer.hh"
#include "tonemapper.hh"
#include "blitter.hh"

namespace cornell {
  static const wgpu::TextureFormat CORNELL_FRAMEBUFFER_FORMAT = wgpu::TextureFormat::RGBA16Float;
  static const wgpu::TextureFormat CORNELL_INTERMEDIATE_FORMAT = wgpu::TextureFormat::RGBA8Unorm;
  static const uint64_t CORNELL_STATS_LOG_INTERVAL = 256;
}

namespace cornell {
  /// CornellActivity drives one frame of the Cornell box: the radiosity step, the selected renderer, then tonemapping
  /// into the surface.
  class CornellActivity: public Activity {
  private:
    Settings m_settings;
    RendererType m_renderer;
    bool m_rotate_camera;
    std::shared_ptr<LightmapDumpQueue> m_lightmap_dumps;
    uint64_t m_frames_drawn;
    Scene m_scene;
    Common m_common;
    Radiosity m_radiosity;
    RenderTarget m_framebuffer;
    Rasterizer m_rasterizer;
    Raytracer m_raytracer;
    Tonemapper m_tonemapper;
    std::optional<RenderTarget> m_intermediate;
    std::unique_ptr<SurfaceBlitter> m_blitter;
  public:
    CornellActivity(Engine &engine, Settings settings);
    ~CornellActivity() override = default;
  public:
    void activate() override;
    void update(double dt_sec) override;
    void draw(Frame &frame) override;
    void onKey(int key) override;
    void deactivate() override;
  private:
    void dumpLightmap(LightmapDumpSettings dump);
    void logStats() const;
    bool isFrameLimitReached() const;
  };
}
