#pragma once

#include "polacam/core/Bitmap.hpp"

namespace polacam {

/**
 * Tone stage of the "polarized" look, for a single pixel.
 *
 * Steps, in this order (every intermediate is truncated to an integer
 * and clamped to [0..255]):
 *   1) contrast around mid-gray:  c' = (c - 128) * (1 + intensity) + 128
 *   2) blue boost:                b'' = b' * (1 + 0.6 * intensity)
 *   3) glare reduction: if (r''+g''+b'')/3 > 200, every channel is
 *      scaled by (1 - 0.4 * intensity).
 *
 * intensity == 0 is the identity.
 */
[[nodiscard]] Pixel adjustPixel(Pixel px, double intensity) noexcept;

/** Apply adjustPixel() to rows [y0, y1) of the bitmap, in place. */
void adjustToneRows(Bitmap& bmp, double intensity, int y0, int y1) noexcept;

/** Apply adjustPixel() to the whole bitmap, in place (serial reference). */
void adjustTone(Bitmap& bmp, double intensity) noexcept;

} // namespace polacam
