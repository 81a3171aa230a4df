#pragma once

#include <optional>
#include <cstdint>

#include "cornell/engine/core.hh"
#include "settings.hh"

namespace cornell {
  /// LightmapDumpQueue decides when lightmap dumps start: the one scheduled from the command line, and any requested
  /// interactively. At most one dump is in flight; `finish` must be called once per started dump, whether it succeeded
  /// or not.
  class LightmapDumpQueue {
  private:
    std::optional<LightmapDumpSettings> m_scheduled;
    bool m_scheduled_started;
    bool m_requested;
    bool m_pending;
  public:
    explicit LightmapDumpQueue(std::optional<LightmapDumpSettings> scheduled);
  public:
    void request();
    /// next returns the dump to start after `frames_drawn` frames, if any, and marks it pending. Requests made while a
    /// dump is pending wait for it to finish.
    std::optional<LightmapDumpSettings> next(uint64_t frames_drawn);
    void finish();
  public:
    bool isPending() const;
  };
}
