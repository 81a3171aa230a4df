#include "cornell/box/activity.hh"

#include <iostream>

#include "GLFW/glfw3.h"

#include "cornell/engine/config.hh"

namespace cornell {
  CornellActivity::CornellActivity(Engine &engine, Settings settings)
  : Activity(engine),
    m_settings(std::move(settings)),
    m_renderer(m_settings.renderer),
    m_rotate_camera(m_settings.rotate_camera),
    m_lightmap_dumps(std::make_shared<LightmapDumpQueue>(m_settings.lightmap_dump)),
    m_frames_drawn(0),
    m_scene(engine.device(), SceneGeometry::createCornellBox()),
    m_common(engine.device(), m_scene),
    m_radiosity(engine.device(), m_common, m_scene),
    m_framebuffer(RenderTarget::create(
      engine.device(),
      "Cornell.Framebuffer",
      engine.framebufferSize(),
      CORNELL_FRAMEBUFFER_FORMAT,
      wgpu::TextureUsage::RenderAttachment | wgpu::TextureUsage::StorageBinding | wgpu::TextureUsage::TextureBinding
    )),
    m_rasterizer(engine.device(), m_common, m_scene, m_radiosity.lightmapView(), m_framebuffer),
    m_raytracer(engine.device(), m_common, m_radiosity.lightmapView(), m_framebuffer),
    m_tonemapper(engine.device(), m_framebuffer),
    m_intermediate(std::nullopt),
    m_blitter(nullptr)
  {
    if (!engine.isSurfaceStorageCapable()) {
      m_intermediate = RenderTarget::create(
        engine.device(),
        "Cornell.Intermediate",
        engine.framebufferSize(),
        CORNELL_INTERMEDIATE_FORMAT,
        wgpu::TextureUsage::StorageBinding | wgpu::TextureUsage::TextureBinding
      );
      m_blitter = std::make_unique<SurfaceBlitter>(engine.device(), m_intermediate.value(), engine.surfaceFormat());
    }
  }
}
namespace cornell {
  void CornellActivity::activate() {
    std::cerr
      << fmt::format(
        "Cornell: {} quads, renderer '{}', camera rotation {}",
        m_scene.quadCount(),
        rendererTypeName(m_renderer),
        m_rotate_camera ? "on" : "off"
      )
      << std::endl;
#if !CORNELL_DEBUG
    if (m_settings.lightmap_dump.has_value()) {
      std::cerr << "Cornell: lightmap dumps need a debug build, ignoring --dump-lightmap" << std::endl;
    }
#endif
  }
  void CornellActivity::update(double dt_sec) {
    auto size = engine().framebufferSize();
    float aspect = static_cast<float>(size.x) / static_cast<float>(size.y);
    m_common.update(m_rotate_camera, aspect, dt_sec);

    // Dumps copy the lightmap as of the last submitted frame:
    auto dump = m_lightmap_dumps->next(m_frames_drawn);
    if (dump.has_value()) {
      dumpLightmap(std::move(dump.value()));
    }
  }
  void CornellActivity::draw(Frame &frame) {
    wgpu::CommandEncoder &encoder = frame.encoder();

    m_radiosity.run(encoder);
    switch (m_renderer) {
      case RendererType::Rasterizer:
        m_rasterizer.run(encoder);
        break;
      case RendererType::Raytracer:
        m_raytracer.run(encoder);
        break;
      default:
        PANIC("Unknown renderer: {}", static_cast<uint32_t>(m_renderer));
    }
    if (m_blitter) {
      m_tonemapper.run(encoder, m_intermediate->view(), m_intermediate->format(), m_intermediate->size());
      m_blitter->blit(encoder, frame.surfaceView());
    } else {
      m_tonemapper.run(encoder, frame.surfaceView(), engine().surfaceFormat(), frame.surfaceSize());
    }

    m_frames_drawn++;
    if (m_frames_drawn % CORNELL_STATS_LOG_INTERVAL == 0) {
      logStats();
    }
    if (isFrameLimitReached() && !m_lightmap_dumps->isPending()) {
      engine().halt();
    }
  }
  void CornellActivity::onKey(int key) {
    switch (key) {
      case GLFW_KEY_R: {
        m_renderer = nextRendererType(m_renderer);
        std::cerr << fmt::format("Cornell: renderer '{}'", rendererTypeName(m_renderer)) << std::endl;
      } break;
      case GLFW_KEY_C: {
        m_rotate_camera = !m_rotate_camera;
        std::cerr << fmt::format("Cornell: camera rotation {}", m_rotate_camera ? "on" : "off") << std::endl;
      } break;
      case GLFW_KEY_L: {
        m_lightmap_dumps->request();
      } break;
      default: {
      } break;
    }
  }
  void CornellActivity::deactivate() {
    logStats();
  }
}
namespace cornell {
  void CornellActivity::dumpLightmap(LightmapDumpSettings dump) {
#if CORNELL_DEBUG
    if (dump.layer >= m_scene.quadCount()) {
      std::cerr << fmt::format("Cornell: no lightmap layer {} (scene has {} quads)", dump.layer, m_scene.quadCount()) << std::endl;
      m_lightmap_dumps->finish();
      return;
    }
    // The map callback may run after this activity is destroyed.
    std::weak_ptr<LightmapDumpQueue> dumps = m_lightmap_dumps;
    uint64_t frame_index = m_frames_drawn;
    uint32_t layer = dump.layer;
    m_radiosity.debug_takeoutLightmap(
      layer,
      [dumps, layer, frame_index, filepath = std::move(dump.filepath)] (std::optional<FloatBitmap> bitmap) {
        if (bitmap.has_value()) {
          bitmap->save(filepath.c_str());
          std::cerr
            << fmt::format(
              "Cornell: saved lightmap layer {} after {} frames to '{}' (mean {:.4f}, {:.4f}, {:.4f})",
              layer,
              frame_index,
              filepath,
              bitmap->channelMean(0),
              bitmap->channelMean(1),
              bitmap->channelMean(2)
            )
            << std::endl;
        } else {
          std::cerr << fmt::format("Cornell: lightmap layer {} was not saved to '{}'", layer, filepath) << std::endl;
        }
        if (auto queue = dumps.lock()) {
          queue->finish();
        }
      }
    );
#else
    std::cerr << fmt::format("Cornell: lightmap dumps need a debug build, skipping '{}'", dump.filepath) << std::endl;
    m_lightmap_dumps->finish();
#endif
  }
  void CornellActivity::logStats() const {
    auto const &schedule = m_radiosity.schedule();
    std::cerr
      << fmt::format(
        "Cornell: frame {}, accumulation mean {:.1f}, renormalizations {}, renderer '{}'",
        schedule.frameCount(),
        schedule.accumulationMean(),
        schedule.renormalizationCount(),
        rendererTypeName(m_renderer)
      )
      << std::endl;
  }
  bool CornellActivity::isFrameLimitReached() const {
    return m_settings.frame_limit.has_value() && m_frames_drawn >= m_settings.frame_limit.value();
  }
}
