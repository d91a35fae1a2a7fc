#include "polacam/tone/ToneAdjust.hpp"

#include <algorithm>

namespace polacam {

namespace {
constexpr double kMidGray         = 128.0;
constexpr double kBlueBoost       = 0.6;
constexpr double kGlareThreshold  = 200.0;
constexpr double kGlareReduction  = 0.4;

/* Clamp to [0..255] and truncate. NaN maps to 0. */
inline int clampChannel(double v) noexcept {
    if (!(v > 0.0)) return 0;
    if (v >= 255.0) return 255;
    return static_cast<int>(v);
}
} // namespace

Pixel adjustPixel(Pixel px, double intensity) noexcept {
    const double gain = 1.0 + intensity;

    // 1) contrast
    int r = clampChannel((px.r - kMidGray) * gain + kMidGray);
    int g = clampChannel((px.g - kMidGray) * gain + kMidGray);
    int b = clampChannel((px.b - kMidGray) * gain + kMidGray);

    // 2) blue
    b = clampChannel(b * (1.0 + intensity * kBlueBoost));

    // 3) glare, judged on the boosted values
    const double brightness = (r + g + b) / 3.0;
    if (brightness > kGlareThreshold) {
        const double k = 1.0 - intensity * kGlareReduction;
        r = clampChannel(r * k);
        g = clampChannel(g * k);
        b = clampChannel(b * k);
    }

    return {static_cast<std::uint8_t>(r),
            static_cast<std::uint8_t>(g),
            static_cast<std::uint8_t>(b)};
}

void adjustToneRows(Bitmap& bmp, double intensity, int y0, int y1) noexcept {
    y0 = std::max(0, y0);
    y1 = std::min(bmp.height(), y1);
    const int w = bmp.width();

    for (int y = y0; y < y1; ++y) {
        std::uint8_t* p = bmp.row(y);
        for (int x = 0; x < w; ++x, p += Bitmap::kChannels) {
            const Pixel out = adjustPixel({p[0], p[1], p[2]}, intensity);
            p[0] = out.r;
            p[1] = out.g;
            p[2] = out.b;
        }
    }
}

void adjustTone(Bitmap& bmp, double intensity) noexcept {
    adjustToneRows(bmp, intensity, 0, bmp.height());
}

} // namespace polacam
