#include "polacam/io/Codec.hpp"
#include "polacam/core/Errors.hpp"

#include "core/MatInterop.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <filesystem>

namespace polacam {

Bitmap decodeImage(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty()) {
        throw DecodeFailure("decodeImage: input is empty");
    }

    // No copy: imdecode only reads the buffer
    const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                      const_cast<std::uint8_t*>(bytes.data()));

    cv::Mat bgr;
    try {
        bgr = cv::imdecode(raw, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeFailure(std::string("decodeImage: ") + e.what());
    }
    if (bgr.empty()) {
        throw DecodeFailure("decodeImage: bytes are not a recognized image");
    }
    CV_Assert(bgr.type() == CV_8UC3);

    Bitmap out(bgr.cols, bgr.rows);
    cv::Mat dst = asMat(out);
    cv::cvtColor(bgr, dst, cv::COLOR_BGR2RGB);
    if (dst.data != out.data()) {
        cv::Mat view = asMat(out);
        dst.copyTo(view);
    }
    return out;
}

std::vector<std::uint8_t> encodeJpeg(const Bitmap& bmp, int quality)
{
    if (bmp.empty()) {
        throw EncodeFailure("encodeJpeg: bitmap is empty");
    }
    if (quality < 0 || quality > 100) {
        throw EncodeFailure("encodeJpeg: quality must be in [0..100], got " + std::to_string(quality));
    }

    std::vector<std::uint8_t> buf;
    bool ok = false;
    try {
        cv::Mat bgr;
        cv::cvtColor(asMat(bmp), bgr, cv::COLOR_RGB2BGR);
        ok = cv::imencode(".jpg", bgr, buf, {cv::IMWRITE_JPEG_QUALITY, quality});
    } catch (const cv::Exception& e) {
        throw EncodeFailure(std::string("encodeJpeg: ") + e.what());
    }
    if (!ok || buf.empty()) {
        throw EncodeFailure("encodeJpeg: encoder rejected the image");
    }
    return buf;
}

std::string outputIdFor(const std::string& inputId, const std::string& suffix)
{
    const std::filesystem::path in(inputId);
    std::string stem = in.stem().string();
    if (stem.empty()) stem = "capture";

    return (in.parent_path() / (stem + suffix + ".jpg")).string();
}

} // namespace polacam
