#pragma once
#include "polacam/core/Bitmap.hpp"
#include "polacam/io/Capture.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace polacam {

/**
 * Stand-in for a camera: produces a fixed number of generated JPEG captures.
 *
 * Patterns: "solid" (one color), "gradient" (color fading to white from
 * left to right), "checker" (color / white squares).
 */
class SyntheticSource final : public ICaptureSource {
public:
    struct Options {
        int         width   = 1000;
        int         height  = 1500;
        Pixel       color   {100, 100, 220};
        std::string pattern = "solid";
        int         count   = 1;     // captures to produce
        int         quality = 100;   // JPEG quality of the generated captures
        int         cell    = 96;    // checker square size
    };

    explicit SyntheticSource(const Options& opt);
    SyntheticSource();

    std::optional<Capture> next() override;

    /// The image every capture encodes.
    [[nodiscard]] const Bitmap& image() const noexcept { return image_; }

private:
    Options opt_;
    Bitmap  image_;
    std::vector<std::uint8_t> encoded_;
    int produced_ = 0;
    std::int64_t epochMs_ = 0;   // id base, fixed at construction

    static Bitmap makePattern(const Options& opt);
};

} // namespace polacam
