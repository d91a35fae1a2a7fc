#pragma once

#include "polacam/core/Bitmap.hpp"
#include "polacam/core/Config.hpp"

namespace polacam {

/// Upper bound for every FrameGeometry length (and cornerStep).
inline constexpr int kMaxFrameLength = 1 << 16;

/** (floor(width*fw), floor(height*fh)), each side at least 1 pixel.
    Throws std::invalid_argument if a factor is not finite and positive
    or the result does not fit an int. */
[[nodiscard]] Size scaledSize(Size src, const ResizeScale& scale);

/** Canvas size for a photo of the given size framed with 'g'.
    Throws std::invalid_argument if it does not fit an int. */
[[nodiscard]] Size framedSize(Size photo, const FrameGeometry& g);

/** Where the photo lands on the canvas. */
[[nodiscard]] Rect photoRect(Size photo, const FrameGeometry& g);

/** Throws std::invalid_argument if any length in 'g' is negative or above
    kMaxFrameLength, or shadowPeak is outside [0..255]. */
void validateGeometry(const FrameGeometry& g);

/** True if the frame-local pixel (fx, fy) is cut away by the rounded corners
    of a frameW x frameH frame. */
[[nodiscard]] bool isCornerCut(int fx, int fy, int frameW, int frameH,
                               const FrameGeometry& g) noexcept;

/** Compose the instant-film frame around an already resized photo. */
[[nodiscard]] Bitmap composeFrame(const Bitmap& photo, const FrameGeometry& g);

} // namespace polacam
