#include "polacam/core/Presets.hpp"

#include <gtest/gtest.h>

using namespace polacam;

TEST(PresetsTest, DefaultIsModern) {
    EXPECT_EQ(defaultPresetName(), "modern");

    auto fx = presetByName(defaultPresetName());
    ASSERT_TRUE(fx.has_value());
    EXPECT_DOUBLE_EQ(fx->intensity, 0.7);
    EXPECT_DOUBLE_EQ(fx->resizeScale.width, 0.85);
    EXPECT_DOUBLE_EQ(fx->resizeScale.height, 0.65);

    const FrameGeometry& g = fx->geometry;
    EXPECT_EQ(g.topBorder, 70);
    EXPECT_EQ(g.sideBorder, 70);
    EXPECT_EQ(g.bottomBorder, 200);
    EXPECT_EQ(g.cornerRadius, 35);
    EXPECT_EQ(g.outerMargin, 50);
    EXPECT_EQ(g.shadowSize, 3);
    EXPECT_EQ(g.borderThickness, 2);
    EXPECT_EQ(g.cornerStep, 6);
}

TEST(PresetsTest, VariantsDifferOnlyInScaleAndCorners) {
    auto compact  = presetByName("compact");
    auto portrait = presetByName("portrait");
    ASSERT_TRUE(compact && portrait);

    EXPECT_DOUBLE_EQ(compact->resizeScale.width, 0.65);
    EXPECT_DOUBLE_EQ(compact->resizeScale.height, 0.45);
    EXPECT_DOUBLE_EQ(portrait->resizeScale.width, 0.65);
    EXPECT_DOUBLE_EQ(portrait->resizeScale.height, 1.0);

    EXPECT_EQ(compact->geometry.cornerStep, 1);
    EXPECT_EQ(compact->geometry.bottomBorder, FrameGeometry{}.bottomBorder);
    EXPECT_DOUBLE_EQ(portrait->intensity, 0.7);
}

TEST(PresetsTest, LookupIsCaseInsensitive) {
    EXPECT_TRUE(presetByName("MODERN").has_value());
    EXPECT_TRUE(presetByName("Compact").has_value());
}

TEST(PresetsTest, UnknownNameIsNotFound) {
    EXPECT_FALSE(presetByName("sepia").has_value());
    EXPECT_FALSE(presetByName("").has_value());
}

TEST(PresetsTest, NamesAreUnique) {
    const auto& all = builtinPresets();
    ASSERT_GE(all.size(), 3u);
    for (std::size_t i = 0; i < all.size(); ++i)
        for (std::size_t j = i + 1; j < all.size(); ++j)
            EXPECT_NE(all[i].name, all[j].name);
}
