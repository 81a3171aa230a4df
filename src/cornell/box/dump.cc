#include "cornell/box/dump.hh"

#include <string>
#include <utility>

namespace cornell {
  LightmapDumpQueue::LightmapDumpQueue(std::optional<LightmapDumpSettings> scheduled)
  : m_scheduled(std::move(scheduled)),
    m_scheduled_started(false),
    m_requested(false),
    m_pending(false)
  {}
}
namespace cornell {
  void LightmapDumpQueue::request() {
    m_requested = true;
  }
  std::optional<LightmapDumpSettings> LightmapDumpQueue::next(uint64_t frames_drawn) {
    if (m_pending) {
      return std::nullopt;
    }
    if (m_scheduled.has_value() && !m_scheduled_started && frames_drawn >= m_scheduled->frame) {
      m_scheduled_started = true;
      m_pending = true;
      return m_scheduled;
    }
    if (m_requested) {
      m_requested = false;
      m_pending = true;
      return LightmapDumpSettings {
        .filepath = m_scheduled.has_value() ? m_scheduled->filepath : std::string{SETTINGS_DEFAULT_DUMP_PATH},
        .layer = m_scheduled.has_value() ? m_scheduled->layer : SETTINGS_DEFAULT_DUMP_LAYER,
        .frame = frames_drawn,
      };
    }
    return std::nullopt;
  }
  void LightmapDumpQueue::finish() {
    DEBUG_CHECK(m_pending, "Expected a pending lightmap dump");
    m_pending = false;
  }
}
namespace cornell {
  bool LightmapDumpQueue::isPending() const {
    return m_pending;
  }
}
