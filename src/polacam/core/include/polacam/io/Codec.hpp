#pragma once

#include "polacam/core/Bitmap.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace polacam {

/** Decode JPEG/PNG/... bytes into an RGB bitmap.
    Gray and alpha inputs are converted to RGB.
    Throws DecodeFailure for empty or unrecognized input. */
[[nodiscard]] Bitmap decodeImage(std::span<const std::uint8_t> bytes);

/** Encode as baseline JPEG. quality must be in [0..100].
    Throws EncodeFailure on an empty bitmap, bad quality or encoder error. */
[[nodiscard]] std::vector<std::uint8_t> encodeJpeg(const Bitmap& bmp, int quality = 95);

/** Suggested output name: the suffix goes before the extension and the
    extension becomes ".jpg" ("dir/123.jpg" -> "dir/123_polarized.jpg").
    An empty id (or one without a file name) becomes "capture". */
[[nodiscard]] std::string outputIdFor(const std::string& inputId,
                                      const std::string& suffix = "_polarized");

} // namespace polacam
