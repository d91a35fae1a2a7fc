#include "polacam/io/SyntheticSource.hpp"
#include "polacam/io/Codec.hpp"

#include "core/MatInterop.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace polacam {

namespace {
inline std::uint8_t lerpU8(int a, int b, double t) {
    return static_cast<std::uint8_t>(std::clamp(static_cast<int>(std::lround(a + (b - a) * t)), 0, 255));
}
} // namespace

SyntheticSource::SyntheticSource()
    : SyntheticSource(Options{}) {}

SyntheticSource::SyntheticSource(const Options& opt)
    : opt_(opt)
{
    if (opt_.width <= 0 || opt_.height <= 0) {
        throw std::invalid_argument("SyntheticSource: width and height must be positive");
    }
    if (opt_.count < 0) {
        throw std::invalid_argument("SyntheticSource: count must not be negative");
    }

    image_   = makePattern(opt_);
    encoded_ = encodeJpeg(image_, opt_.quality);
    epochMs_ = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch()).count();
}

Bitmap SyntheticSource::makePattern(const Options& opt) {
    Bitmap base(opt.width, opt.height, opt.color);
    const Pixel white{255, 255, 255};

    if (opt.pattern == "solid") {
        return base;
    }

    if (opt.pattern == "gradient") {
        const int w = opt.width;
        for (int x = 0; x < w; ++x) {
            const double t = w > 1 ? static_cast<double>(x) / (w - 1) : 0.0;
            const Pixel px{lerpU8(opt.color.r, 255, t),
                           lerpU8(opt.color.g, 255, t),
                           lerpU8(opt.color.b, 255, t)};
            for (int y = 0; y < opt.height; ++y) base.setPixel(x, y, px);
        }
        return base;
    }

    if (opt.pattern == "checker") {
        const int cs = std::max(1, opt.cell);
        cv::Mat m = asMat(base);
        for (int y = 0; y < opt.height; y += cs) {
            for (int x = 0; x < opt.width; x += cs) {
                bool on = ((x/cs) + (y/cs)) & 1;
                if (on) cv::rectangle(m, {x,y}, {std::min(x+cs,opt.width)-1, std::min(y+cs,opt.height)-1},
                                      toScalar(white), cv::FILLED);
            }
        }
        return base;
    }

    throw std::invalid_argument("SyntheticSource: unknown pattern '" + opt.pattern + "'");
}

std::optional<Capture> SyntheticSource::next() {
    if (produced_ >= opt_.count) return std::nullopt;

    ++produced_;
    return Capture{encoded_,
                   std::to_string(epochMs_) + "_" + std::to_string(produced_) + ".jpg"};
}

} // namespace polacam
