#include "polacam/core/Errors.hpp"
#include "polacam/core/Pipeline.hpp"
#include "polacam/compose/PolaroidFrame.hpp"
#include "polacam/io/Codec.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <thread>
#include <vector>

using namespace polacam;

class PipelineTest : public ::testing::Test {
protected:
    std::unique_ptr<IBackend> backend = makeBackend(BackendType::CPU);
};

/**
 * 1000x1500 solid (100,100,220), intensity 0.7, default geometry.
 * Tone: r,g -> 80, b -> 255 (contrast 284 clamps, blue stays 255),
 * brightness 138 keeps glare reduction off.
 */
TEST_F(PipelineTest, RenderEndToEndExact) {
    Pipeline pipeline(*backend);
    const FrameGeometry& g = pipeline.options().effect.geometry;

    Bitmap out = pipeline.render(Bitmap(1000, 1500, Pixel{100, 100, 220}));

    ASSERT_EQ(out.size(), (Size{850 + 2 * 70 + 2 * 50, 975 + 70 + 200 + 2 * 50}));
    const Rect pr = photoRect({850, 975}, g);

    // photo region: tone-adjusted color, blue at least 220 * 1.42 clamped
    EXPECT_EQ(out.pixel(pr.x + pr.width / 2, pr.y + pr.height / 2), (Pixel{80, 80, 255}));
    EXPECT_EQ(out.pixel(pr.x, pr.y), (Pixel{80, 80, 255}));
    EXPECT_EQ(out.pixel(pr.x + pr.width - 1, pr.y + pr.height - 1), (Pixel{80, 80, 255}));

    // white band under the top margin (rows above the outline)
    const int frameW = out.width() - 2 * g.outerMargin;
    for (int y = g.outerMargin; y < g.outerMargin + g.topBorder - g.borderThickness; ++y) {
        for (int x = g.outerMargin + g.cornerRadius; x < g.outerMargin + frameW - g.cornerRadius; ++x) {
            ASSERT_EQ(out.pixel(x, y), (Pixel{255, 255, 255})) << x << "," << y;
        }
    }
    // margin above it
    EXPECT_EQ(out.pixel(out.width() / 2, g.outerMargin - 1), (Pixel{0, 0, 0}));
}

TEST_F(PipelineTest, ProcessEndToEndJpeg) {
    Pipeline pipeline(*backend);
    const auto input = encodeJpeg(Bitmap(1000, 1500, Pixel{100, 100, 220}), 100);

    ProcessResult res = pipeline.process(input, "1700000000000.jpg");

    ASSERT_TRUE(res.processed());
    EXPECT_EQ(res.outputId, "1700000000000_polarized.jpg");
    EXPECT_EQ(res.inputSize, (Size{1000, 1500}));
    EXPECT_EQ(res.outputSize, (Size{1090, 1345}));

    Bitmap out = decodeImage(res.bytes);
    ASSERT_EQ(out.size(), res.outputSize);
    // the frame grows the (downscaled) photo on every side
    EXPECT_GT(out.width(), 850);
    EXPECT_GT(out.height(), 975);
    EXPECT_GT(out.width(), 1000);

    const FrameGeometry& g = pipeline.options().effect.geometry;
    const Rect pr = photoRect({850, 975}, g);

    // photo centre: blue enhanced to the clamp, red/green pushed down
    const Pixel c = out.pixel(pr.x + pr.width / 2, pr.y + pr.height / 2);
    EXPECT_GE(c.b, 245);
    EXPECT_NEAR(c.r, 80, 8);
    EXPECT_NEAR(c.g, 80, 8);

    // white band, JPEG tolerance, away from the block edges of margin/outline
    for (int y = g.outerMargin + 4; y < g.outerMargin + g.topBorder - 8; ++y) {
        const Pixel p = out.pixel(out.width() / 2, y);
        ASSERT_GE(p.r, 235) << "row " << y;
        ASSERT_GE(p.g, 235) << "row " << y;
        ASSERT_GE(p.b, 235) << "row " << y;
    }
}

TEST_F(PipelineTest, DecodeFailurePassesBytesThrough) {
    Pipeline pipeline(*backend);
    const std::string text = "GIF89a? no, just text";
    const std::vector<std::uint8_t> input(text.begin(), text.end());

    ProcessResult res{};
    EXPECT_NO_THROW(res = pipeline.process(input, "notes.jpg"));

    EXPECT_EQ(res.outcome, ProcessResult::Outcome::DecodeFailure);
    EXPECT_FALSE(res.processed());
    EXPECT_EQ(res.bytes, input);
    EXPECT_EQ(res.outputId, "notes.jpg");
    EXPECT_FALSE(res.message.empty());
    EXPECT_EQ(res.outputSize, (Size{0, 0}));
}

TEST_F(PipelineTest, EmptyInputPassesThrough) {
    Pipeline pipeline(*backend);
    ProcessResult res = pipeline.process(std::vector<std::uint8_t>{}, "empty.jpg");
    EXPECT_EQ(res.outcome, ProcessResult::Outcome::DecodeFailure);
    EXPECT_TRUE(res.bytes.empty());
}

TEST_F(PipelineTest, EncodeFailurePropagates) {
    Pipeline::Options opt{};
    opt.jpegQuality = 150;
    Pipeline pipeline(*backend, opt);

    const auto input = encodeJpeg(Bitmap(40, 40, Pixel{50, 60, 70}), 90);
    EXPECT_THROW((void)pipeline.process(input, "a.jpg"), EncodeFailure);
}

TEST_F(PipelineTest, IdentityConfiguration) {
    Pipeline::Options opt{};
    opt.effect.intensity = 0.0;
    opt.effect.resizeScale = {1.0, 1.0};
    FrameGeometry& g = opt.effect.geometry;
    g.topBorder = g.sideBorder = g.bottomBorder = 0;
    g.cornerRadius = g.outerMargin = g.shadowSize = g.borderThickness = 0;
    Pipeline pipeline(*backend, opt);

    Bitmap in(23, 11);
    for (int y = 0; y < 11; ++y)
        for (int x = 0; x < 23; ++x)
            in.setPixel(x, y, Pixel{static_cast<std::uint8_t>(x * 11),
                                    static_cast<std::uint8_t>(y * 23),
                                    static_cast<std::uint8_t>(x * y)});

    Bitmap out = pipeline.render(in);
    ASSERT_EQ(out.size(), in.size());
    for (int y = 0; y < 11; ++y)
        for (int x = 0; x < 23; ++x)
            ASSERT_EQ(out.pixel(x, y), in.pixel(x, y));
}

TEST_F(PipelineTest, CustomSuffixAndPresetScale) {
    Pipeline::Options opt{};
    opt.effect.resizeScale = {0.65, 0.45};
    opt.outputSuffix = "_film";
    Pipeline pipeline(*backend, opt);

    const auto input = encodeJpeg(Bitmap(200, 100, Pixel{128, 128, 128}), 95);
    ProcessResult res = pipeline.process(input, "dir/raw.jpg");

    ASSERT_TRUE(res.processed());
    EXPECT_EQ(res.outputId, "dir/raw_film.jpg");
    const Size photo = scaledSize({200, 100}, opt.effect.resizeScale);
    EXPECT_EQ(res.outputSize, framedSize(photo, opt.effect.geometry));
}

TEST_F(PipelineTest, InvalidGeometryIsRejected) {
    Pipeline::Options opt{};
    opt.effect.geometry.cornerRadius = -4;
    Pipeline pipeline(*backend, opt);
    EXPECT_THROW((void)pipeline.render(Bitmap(10, 10)), std::invalid_argument);
}

TEST_F(PipelineTest, OversizedGeometryIsRejected) {
    Pipeline::Options opt{};
    opt.effect.geometry.outerMargin = 1500000000;
    Pipeline pipeline(*backend, opt);
    EXPECT_THROW((void)pipeline.render(Bitmap(10, 10)), std::invalid_argument);

    const auto input = encodeJpeg(Bitmap(16, 16, Pixel{1, 2, 3}), 90);
    EXPECT_THROW((void)pipeline.process(input, "a.jpg"), std::invalid_argument);
}

TEST_F(PipelineTest, NonFiniteScaleIsRejected) {
    Pipeline::Options opt{};
    opt.effect.resizeScale.width = std::numeric_limits<double>::quiet_NaN();
    Pipeline pipeline(*backend, opt);
    EXPECT_THROW((void)pipeline.render(Bitmap(10, 10)), std::invalid_argument);
}

/* One pipeline, several threads, different images: results must equal
   the serial ones. */
TEST_F(PipelineTest, ConcurrentInvocationsAreIndependent) {
    Pipeline pipeline(*backend);

    std::vector<std::vector<std::uint8_t>> inputs;
    for (int i = 0; i < 4; ++i) {
        const auto v = static_cast<std::uint8_t>(40 + i * 50);
        inputs.push_back(encodeJpeg(Bitmap(120 + i * 10, 90, Pixel{v, 100, 200}), 95));
    }

    std::vector<ProcessResult> serial;
    for (int i = 0; i < 4; ++i) serial.push_back(pipeline.process(inputs[i], std::to_string(i) + ".jpg"));

    std::vector<ProcessResult> parallel(4);
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&, i] {
            parallel[i] = pipeline.process(inputs[i], std::to_string(i) + ".jpg");
        });
    }
    for (auto& t : workers) t.join();

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(parallel[i].bytes, serial[i].bytes) << i;
        EXPECT_EQ(parallel[i].outputId, serial[i].outputId);
    }
}
