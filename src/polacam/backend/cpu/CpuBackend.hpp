#pragma once

#include "polacam/core/Backend.hpp"

namespace polacam {

/*
  CPU-based backend implementation.

  This class runs:
    - the tone stage, split into row stripes with cv::parallel_for_,
    - bilinear resampling with cv::resize (INTER_LINEAR).

  Notes:
    - 'threads' is the requested number of stripes; 0 lets OpenCV decide.
    - No state is kept between calls, so one instance can serve
      concurrent pipeline invocations.
*/
class CpuBackend final : public IBackend {
public:
    explicit CpuBackend(std::size_t threads = 0) : threads_(threads) {}

    // Tone-adjust every pixel in place.
    void toneAdjust(Bitmap& bmp, double intensity) override;

    // Resample 'src' into a new bitmap of exactly 'target' size.
    Bitmap resize(const Bitmap& src, Size target) override;

private:
    std::size_t threads_;
};

} // namespace polacam
