#include "polacam/core/Pipeline.hpp"
#include "polacam/core/Errors.hpp"
#include "polacam/compose/PolaroidFrame.hpp"
#include "polacam/io/Codec.hpp"

#include <utility>

namespace polacam {

Pipeline::Pipeline(IBackend& backend)
    : Pipeline(backend, Options{}) {}

Pipeline::Pipeline(IBackend& backend, const Options& opt)
    : backend_(backend), opt_(opt) {}

Bitmap Pipeline::render(Bitmap photo) const {
    const EffectParameters& fx = opt_.effect;
    validateGeometry(fx.geometry);

    backend_.toneAdjust(photo, fx.intensity);

    const Size target = scaledSize(photo.size(), fx.resizeScale);
    Bitmap resized = backend_.resize(photo, target);

    return composeFrame(resized, fx.geometry);
}

ProcessResult Pipeline::process(std::span<const std::uint8_t> bytes,
                                const std::string& inputId) const
{
    ProcessResult res{};

    Bitmap photo;
    try {
        photo = decodeImage(bytes);
    } catch (const DecodeFailure& e) {
        // not an image: hand the input back as-is
        res.outcome  = ProcessResult::Outcome::DecodeFailure;
        res.bytes.assign(bytes.begin(), bytes.end());
        res.outputId = inputId;
        res.message  = e.what();
        return res;
    }

    res.inputSize = photo.size();
    Bitmap framed = render(std::move(photo));
    res.outputSize = framed.size();

    res.bytes    = encodeJpeg(framed, opt_.jpegQuality); // EncodeFailure propagates
    res.outputId = outputIdFor(inputId, opt_.outputSuffix);
    res.outcome  = ProcessResult::Outcome::Processed;
    return res;
}

} // namespace polacam
