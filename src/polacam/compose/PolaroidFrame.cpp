#include "polacam/compose/PolaroidFrame.hpp"

#include "core/MatInterop.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace polacam {

/* Horizontal run [x0, x1) on row y. cv::line clips to the canvas. */
static void hline(cv::Mat& c, int y, int x0, int x1, Pixel px) {
    if (x1 <= x0) return;
    cv::line(c, {x0, y}, {x1 - 1, y}, toScalar(px), 1, cv::LINE_8);
}

/* Vertical run [y0, y1) on column x. */
static void vline(cv::Mat& c, int x, int y0, int y1, Pixel px) {
    if (y1 <= y0) return;
    cv::line(c, {x, y0}, {x, y1 - 1}, toScalar(px), 1, cv::LINE_8);
}

Size scaledSize(Size src, const ResizeScale& scale) {
    if (!std::isfinite(scale.width) || !std::isfinite(scale.height) ||
        scale.width <= 0.0 || scale.height <= 0.0) {
        throw std::invalid_argument("scaledSize: scale factors must be finite and positive");
    }
    const double w = std::floor(src.width  * scale.width);
    const double h = std::floor(src.height * scale.height);
    if (w > std::numeric_limits<int>::max() || h > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("scaledSize: scaled photo is too large");
    }
    return {w < 1.0 ? 1 : static_cast<int>(w), h < 1.0 ? 1 : static_cast<int>(h)};
}

Size framedSize(Size photo, const FrameGeometry& g) {
    const long long w = static_cast<long long>(photo.width)
                      + 2LL * g.sideBorder + 2LL * g.outerMargin;
    const long long h = static_cast<long long>(photo.height)
                      + g.topBorder + g.bottomBorder + 2LL * g.outerMargin;
    if (w > std::numeric_limits<int>::max() || h > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("framedSize: framed canvas is too large");
    }
    return {static_cast<int>(w), static_cast<int>(h)};
}

Rect photoRect(Size photo, const FrameGeometry& g) {
    return {g.outerMargin + g.sideBorder,
            g.outerMargin + g.topBorder,
            photo.width, photo.height};
}

void validateGeometry(const FrameGeometry& g) {
    if (g.topBorder < 0 || g.sideBorder < 0 || g.bottomBorder < 0 ||
        g.cornerRadius < 0 || g.outerMargin < 0 || g.shadowSize < 0 ||
        g.borderThickness < 0 || g.cornerStep < 0 || g.shadowPeak < 0) {
        throw std::invalid_argument("FrameGeometry: lengths must not be negative");
    }
    if (g.topBorder > kMaxFrameLength || g.sideBorder > kMaxFrameLength ||
        g.bottomBorder > kMaxFrameLength || g.cornerRadius > kMaxFrameLength ||
        g.outerMargin > kMaxFrameLength || g.shadowSize > kMaxFrameLength ||
        g.borderThickness > kMaxFrameLength || g.cornerStep > kMaxFrameLength) {
        throw std::invalid_argument("FrameGeometry: lengths must not exceed "
                                    + std::to_string(kMaxFrameLength));
    }
    if (g.shadowPeak > 255) {
        throw std::invalid_argument("FrameGeometry: shadowPeak must be in [0..255]");
    }
}

/*
  Rounded-corner test for one frame-local pixel.

  Inside a corner square of side R, (dx, dy) is the offset from the arc
  origin: the top-left corner measures R - fx / R - fy, the right and
  bottom corners mirror it with fx - (frameW - R - 1) / fy - (frameH - R - 1).
  The squared distance is optionally floored to a multiple of cornerStep
  (faceted arc) and compared with R^2.
*/
bool isCornerCut(int fx, int fy, int frameW, int frameH, const FrameGeometry& g) noexcept {
    const int R = g.cornerRadius;
    if (R <= 0) return false;

    const bool left   = fx < R;
    const bool right  = fx >= frameW - R;
    const bool top    = fy < R;
    const bool bottom = fy >= frameH - R;

    int dx = 0, dy = 0;
    if (left && top) {
        dx = R - fx;
        dy = R - fy;
    } else if (right && top) {
        dx = fx - (frameW - R - 1);
        dy = R - fy;
    } else if (left && bottom) {
        dx = R - fx;
        dy = fy - (frameH - R - 1);
    } else if (right && bottom) {
        dx = fx - (frameW - R - 1);
        dy = fy - (frameH - R - 1);
    } else {
        return false;
    }

    long long d = static_cast<long long>(dx) * dx + static_cast<long long>(dy) * dy;
    if (g.cornerStep > 1) d = (d / g.cornerStep) * g.cornerStep;
    return d > static_cast<long long>(R) * R;
}

/* Inner shadow: gray lines fading from shadowPeak (innermost, i = 0)
   towards 0 over shadowSize lines, along all four photo edges. */
static void paintShadow(cv::Mat& canvas, const Rect& p, const FrameGeometry& g) {
    for (int i = 0; i < g.shadowSize; ++i) {
        const int v = g.shadowPeak * (g.shadowSize - i) / g.shadowSize;
        const Pixel gray{static_cast<std::uint8_t>(v),
                         static_cast<std::uint8_t>(v),
                         static_cast<std::uint8_t>(v)};

        hline(canvas, p.y + i,                p.x, p.x + p.width,  gray); // top
        vline(canvas, p.x + i,                p.y, p.y + p.height, gray); // left
        vline(canvas, p.x + p.width - 1 - i,  p.y, p.y + p.height, gray); // right
        hline(canvas, p.y + p.height - 1 - i, p.x, p.x + p.width,  gray); // bottom
    }
}

/* Gray outline just outside the photo. Ring i runs one pixel further out
   than ring i-1; ring corners stay open. */
static void paintOutline(cv::Mat& canvas, const Rect& p, const FrameGeometry& g) {
    for (int i = 0; i < g.borderThickness; ++i) {
        hline(canvas, p.y - 1 - i,        p.x - i, p.x + p.width + i,  g.outlineColor); // top
        hline(canvas, p.y + p.height + i, p.x - i, p.x + p.width + i,  g.outlineColor); // bottom
        vline(canvas, p.x - 1 - i,        p.y - i, p.y + p.height + i, g.outlineColor); // left
        vline(canvas, p.x + p.width + i,  p.y - i, p.y + p.height + i, g.outlineColor); // right
    }
}

/*
  Compose the framed photo.

  Method:
    1) canvas = photo + side/top/bottom borders + outer margin on every side,
       filled with marginColor;
    2) frame rectangle (canvas minus margin) filled with frameColor;
    3) rounded corners: cut pixels go back to marginColor;
    4) inner shadow (before the photo unless shadowOverPhoto);
    5) photo copied at (margin + side, margin + top), overwriting;
    6) gray outline around the photo.
*/
Bitmap composeFrame(const Bitmap& photo, const FrameGeometry& g)
{
    if (photo.empty()) {
        throw std::invalid_argument("composeFrame: photo is empty");
    }
    validateGeometry(g);

    const Size total  = framedSize(photo.size(), g);
    const int  frameW = total.width  - 2 * g.outerMargin;
    const int  frameH = total.height - 2 * g.outerMargin;
    const Rect pr     = photoRect(photo.size(), g);

    // --- 1) background
    Bitmap canvas(total.width, total.height, g.marginColor);
    cv::Mat canvasMat = asMat(canvas);

    // --- 2) white frame
    cv::rectangle(canvasMat,
                  cv::Rect(g.outerMargin, g.outerMargin, frameW, frameH),
                  toScalar(g.frameColor), cv::FILLED);

    // --- 3) corner mask, only the four RxR corner squares can be cut
    const int R = std::min({g.cornerRadius, frameW, frameH});
    if (R > 0) {
        const int xs[2] = {0, frameW - R};
        const int ys[2] = {0, frameH - R};
        for (int cy : ys) {
            for (int cx : xs) {
                for (int fy = cy; fy < cy + R; ++fy) {
                    for (int fx = cx; fx < cx + R; ++fx) {
                        if (isCornerCut(fx, fy, frameW, frameH, g)) {
                            canvas.setPixel(g.outerMargin + fx, g.outerMargin + fy, g.marginColor);
                        }
                    }
                }
            }
        }
    }

    // --- 4..5) shadow + photo
    if (!g.shadowOverPhoto) paintShadow(canvasMat, pr, g);

    cv::Mat roi = canvasMat(toCv(pr));
    asMat(photo).copyTo(roi);

    if (g.shadowOverPhoto) paintShadow(canvasMat, pr, g);

    // --- 6) outline
    paintOutline(canvasMat, pr, g);

    return canvas;
}

} // namespace polacam
