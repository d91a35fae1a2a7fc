#pragma once

#include "polacam/core/Bitmap.hpp"

#include <cstddef>
#include <cstdint>

namespace polacam {

/* Backend implementation types. */
enum class BackendType : std::uint8_t {
    CPU = 0
};

/* Fractional downscale applied to the photo before it is framed. */
struct ResizeScale {
    double width  {0.85};
    double height {0.65};
};

/* Instant-film frame geometry. All lengths are in output pixels. */
struct FrameGeometry {
    int topBorder       {70};   // white band above the photo
    int sideBorder      {70};   // white band left and right of the photo
    int bottomBorder    {200};  // the large "caption" band
    int cornerRadius    {35};
    int outerMargin     {50};   // margin color around the whole frame
    int shadowSize      {3};    // inner shadow band, pixels per side
    int borderThickness {2};    // gray outline around the photo

    // Squared corner distance is quantized to multiples of this step,
    // giving a faceted arc. 0 or 1 keeps the arc smooth.
    int cornerStep      {6};

    Pixel marginColor  {0, 0, 0};
    Pixel frameColor   {255, 255, 255};
    Pixel outlineColor {180, 180, 180};
    int   shadowPeak   {150};   // gray level of the innermost shadow line

    // false: shadow is painted before the photo is composited (and is
    // therefore covered by it). true: shadow is painted over the photo.
    bool  shadowOverPhoto {false};
};

/* Tone + framing parameters of one pipeline invocation. */
struct EffectParameters {
    double        intensity {0.7};  // expected [0..1], not enforced
    ResizeScale   resizeScale{};
    FrameGeometry geometry{};
};

/* Process-wide settings: which backend runs the pixel stages. */
struct Config {
    BackendType backend {BackendType::CPU};
    std::size_t workerThreads {0};  // 0 = let the backend decide
};

} // namespace polacam
