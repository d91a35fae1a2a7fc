#pragma once
#include "polacam/core/Backend.hpp"
#include "polacam/core/Bitmap.hpp"
#include "polacam/core/Config.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace polacam {

/// Result of one process() call.
struct ProcessResult {
    enum class Outcome : std::uint8_t {
        Processed = 0,   ///< bytes hold the framed JPEG
        DecodeFailure    ///< input was not an image; bytes are the input, untouched
    };

    Outcome outcome{Outcome::Processed};
    std::vector<std::uint8_t> bytes;
    std::string outputId;
    std::string message;     ///< decoder diagnostic when outcome == DecodeFailure
    Size inputSize{};        ///< decoded size, {0,0} on DecodeFailure
    Size outputSize{};       ///< framed canvas size, {0,0} on DecodeFailure

    [[nodiscard]] bool processed() const noexcept { return outcome == Outcome::Processed; }
};

/// "Polarized" instant-film pipeline:
/// - decode;
/// - tone stage, in place (backend);
/// - bilinear downscale (backend);
/// - frame composition;
/// - JPEG encode.
/// Holds no per-call state: concurrent process() calls on different
/// inputs are safe as long as the backend is.
class Pipeline {
public:
    struct Options {
        EffectParameters effect{};
        int         jpegQuality  = 95;
        std::string outputSuffix = "_polarized";
    };

    explicit Pipeline(IBackend& backend);
    Pipeline(IBackend& backend, const Options& opt);

    /// Stages without the codec. Consumes the photo (tone stage mutates it).
    [[nodiscard]] Bitmap render(Bitmap photo) const;

    /// Full pipeline on encoded bytes.
    /// Decode failure: passthrough, never throws DecodeFailure.
    /// Encode failure: throws EncodeFailure.
    [[nodiscard]] ProcessResult process(std::span<const std::uint8_t> bytes,
                                        const std::string& inputId) const;

    const Options& options() const { return opt_; }

private:
    IBackend& backend_;
    Options   opt_;
};

} // namespace polacam
