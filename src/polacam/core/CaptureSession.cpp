#include "polacam/core/CaptureSession.hpp"
#include "polacam/core/Errors.hpp"

namespace polacam {

CaptureSession::CaptureSession(ICaptureSource& source, const Pipeline& pipeline,
                               IPersistenceSink& sink)
    : source_(source), pipeline_(pipeline), sink_(sink) {}

std::optional<SessionEvent> CaptureSession::step() {
    std::optional<Capture> cap = source_.next();
    if (!cap) return std::nullopt;

    SessionEvent ev{};
    ev.captureId = cap->id;

    try {
        ProcessResult res = pipeline_.process(cap->bytes, cap->id);
        ev.receipt = sink_.save(res.outputId, res.bytes);
        if (res.processed()) {
            ev.kind = SessionEvent::Kind::Processed;
            ++stats_.processed;
        } else {
            ev.kind  = SessionEvent::Kind::PassedThrough;
            ev.error = res.message;
            ++stats_.passedThrough;
        }
    } catch (const EncodeFailure& e) {
        // keep the capture: save it untouched
        ev.kind    = SessionEvent::Kind::Fallback;
        ev.error   = e.what();
        ev.receipt = sink_.save(cap->id, cap->bytes);
        ++stats_.fallbacks;
    }
    return ev;
}

SessionStats CaptureSession::run(std::size_t limit) {
    std::size_t handled = 0;
    while (limit == 0 || handled < limit) {
        if (!step()) break;
        ++handled;
    }
    return stats_;
}

} // namespace polacam
