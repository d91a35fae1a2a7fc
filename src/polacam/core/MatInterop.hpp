#pragma once

#include "polacam/core/Bitmap.hpp"

#include <opencv2/core.hpp>

namespace polacam {

/* Wrap a bitmap into a cv::Mat (CV_8UC3, channels stay in R,G,B order).
   No copy: the Mat references the bitmap buffer, which must outlive it. */
inline cv::Mat asMat(Bitmap& bmp) {
    return cv::Mat(bmp.height(), bmp.width(), CV_8UC3, bmp.data());
}

/* Read-only flavour. Callers must not write through the returned Mat. */
inline cv::Mat asMat(const Bitmap& bmp) {
    return cv::Mat(bmp.height(), bmp.width(), CV_8UC3,
                   const_cast<std::uint8_t*>(bmp.data()));
}

inline cv::Rect toCv(const Rect& r) {
    return cv::Rect(r.x, r.y, r.width, r.height);
}

inline cv::Scalar toScalar(Pixel px) {
    return cv::Scalar(px.r, px.g, px.b);
}

} // namespace polacam
