#include "CpuBackend.hpp"

#include "core/MatInterop.hpp"
#include "polacam/tone/ToneAdjust.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace polacam {

/* Tone stage over row stripes.
   Every pixel depends only on itself, so stripes can run in any order
   and the result equals the serial adjustTone(). */
void CpuBackend::toneAdjust(Bitmap& bmp, double intensity) {
    if (bmp.empty()) return;

    const double stripes = threads_ > 0 ? static_cast<double>(threads_) : -1.0;
    cv::parallel_for_(cv::Range(0, bmp.height()),
                      [&bmp, intensity](const cv::Range& r) {
                          adjustToneRows(bmp, intensity, r.start, r.end);
                      },
                      stripes);
}

/* Bilinear resampling.
   Preconditions:
     - src is not empty
     - target has positive width and height
   Source coordinates are clamped at the image border (BORDER_REPLICATE,
   the cv::resize default). */
Bitmap CpuBackend::resize(const Bitmap& src, Size target) {
    if (src.empty()) {
        throw std::invalid_argument("CpuBackend::resize: source bitmap is empty");
    }
    if (target.width <= 0 || target.height <= 0) {
        throw std::invalid_argument("CpuBackend::resize: target size must be positive");
    }

    Bitmap out(target.width, target.height);
    cv::Mat dst = asMat(out);
    cv::resize(asMat(src), dst, cv::Size(target.width, target.height), 0.0, 0.0, cv::INTER_LINEAR);

    // resize() keeps the preallocated buffer when size/type match;
    // copy back if it ever reallocated.
    if (dst.data != out.data()) {
        cv::Mat view = asMat(out);
        dst.copyTo(view);
    }
    return out;
}

} // namespace polacam
