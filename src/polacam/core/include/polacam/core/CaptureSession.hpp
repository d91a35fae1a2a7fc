#pragma once

#include "polacam/core/Pipeline.hpp"
#include "polacam/io/Capture.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace polacam {

/// What happened to one capture.
struct SessionEvent {
    enum class Kind : std::uint8_t {
        Processed = 0,  ///< framed photo saved under the pipeline's output id
        PassedThrough,  ///< not an image; saved unchanged under its own id
        Fallback        ///< encoding failed; raw capture saved under its own id
    };

    Kind        kind{Kind::Processed};
    std::string captureId;
    SaveReceipt receipt{};
    std::string error;  ///< decode/encode diagnostic for PassedThrough / Fallback
};

struct SessionStats {
    std::size_t processed{0};
    std::size_t passedThrough{0};
    std::size_t fallbacks{0};

    [[nodiscard]] std::size_t total() const noexcept { return processed + passedThrough + fallbacks; }
};

/*
  Wires a capture source, the pipeline and a persistence sink together:
  every capture is processed and whatever comes out is saved.

  Policy on failures:
    - decode failure: the pipeline passes the bytes through, they are saved
      under the capture id;
    - encode failure: the raw capture is saved instead (nothing is lost);
    - sink failures (polacam::Error) propagate to the caller.
*/
class CaptureSession {
public:
    CaptureSession(ICaptureSource& source, const Pipeline& pipeline, IPersistenceSink& sink);

    /// Handle one capture. Empty optional when the source is exhausted.
    std::optional<SessionEvent> step();

    /// Handle captures until the source runs dry, or 'limit' captures (0 = no limit).
    SessionStats run(std::size_t limit = 0);

    [[nodiscard]] SessionStats stats() const noexcept { return stats_; }

private:
    ICaptureSource&   source_;
    const Pipeline&   pipeline_;
    IPersistenceSink& sink_;
    SessionStats      stats_{};
};

} // namespace polacam
