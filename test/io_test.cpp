#include "polacam/core/Errors.hpp"
#include "polacam/io/Codec.hpp"
#include "polacam/io/DirectorySink.hpp"
#include "polacam/io/FolderSource.hpp"
#include "polacam/io/SyntheticSource.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace polacam;
namespace fs = std::filesystem;

class IoTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              ("polacam_" + std::string(info->name()) + "_" +
               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(dir);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream(dir / name, std::ios::binary) << content;
    }

    fs::path dir;
};

TEST(Crc32Test, StandardCheckValue) {
    const std::string s = "123456789";
    const std::vector<std::uint8_t> v(s.begin(), s.end());
    EXPECT_EQ(crc32Of(v), 0xCBF43926u);
    EXPECT_EQ(crc32Of(std::vector<std::uint8_t>{}), 0u);
}

TEST_F(IoTest, DirectorySinkWritesFileAndReceipt) {
    DirectorySink sink(dir / "gallery" / "PolarizedCamera");
    const std::vector<std::uint8_t> bytes{1, 2, 3, 4, 5};

    SaveReceipt r = sink.save("123_polarized.jpg", bytes);

    EXPECT_EQ(fs::path(r.path), dir / "gallery" / "PolarizedCamera" / "123_polarized.jpg");
    EXPECT_EQ(r.bytes, 5u);
    EXPECT_EQ(r.crc32, crc32Of(bytes));

    auto back = readFileBytes(r.path);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, bytes);
}

TEST_F(IoTest, DirectorySinkKeepsOnlyFileName) {
    DirectorySink sink(dir);
    SaveReceipt r = sink.save("../../elsewhere/shot.jpg", std::vector<std::uint8_t>{9});
    EXPECT_EQ(fs::path(r.path), dir / "shot.jpg");
    EXPECT_TRUE(fs::exists(dir / "shot.jpg"));
}

TEST_F(IoTest, DirectorySinkRejectsEmptyName) {
    DirectorySink sink(dir);
    EXPECT_THROW(sink.save("", std::vector<std::uint8_t>{1}), Error);
}

TEST_F(IoTest, DirectorySinkFailsOnFileInPlaceOfDirectory) {
    writeFile("blocker", "x");
    EXPECT_THROW(DirectorySink{dir / "blocker"}, Error);
}

TEST_F(IoTest, FolderSourceFiltersAndSorts) {
    writeFile("b.JPG", "bbb");
    writeFile("a.jpg", "aa");
    writeFile("c.png", "c");
    writeFile("notes.txt", "skip me");
    fs::create_directories(dir / "sub.jpg");  // directories are ignored

    FolderSource src(dir, {"jpg", "png"});
    ASSERT_EQ(src.size(), 3u);

    auto c1 = src.next();
    auto c2 = src.next();
    auto c3 = src.next();
    ASSERT_TRUE(c1 && c2 && c3);
    EXPECT_EQ(c1->id, "a.jpg");
    EXPECT_EQ(c2->id, "b.JPG");
    EXPECT_EQ(c3->id, "c.png");
    EXPECT_EQ(c1->bytes, (std::vector<std::uint8_t>{'a', 'a'}));
    EXPECT_FALSE(src.next().has_value());
}

TEST_F(IoTest, FolderSourceOnMissingFolderIsEmpty) {
    FolderSource src(dir / "does-not-exist");
    EXPECT_EQ(src.size(), 0u);
    EXPECT_FALSE(src.next().has_value());
}

TEST(SyntheticSourceTest, ProducesDecodableCaptures) {
    SyntheticSource::Options o{};
    o.width = 64;
    o.height = 96;
    o.count = 2;
    SyntheticSource src(o);

    auto a = src.next();
    auto b = src.next();
    ASSERT_TRUE(a && b);
    EXPECT_FALSE(src.next().has_value());

    EXPECT_NE(a->id, b->id);
    EXPECT_EQ(fs::path(a->id).extension(), ".jpg");

    Bitmap img = decodeImage(a->bytes);
    EXPECT_EQ(img.size(), (Size{64, 96}));
    const Pixel c = img.pixel(32, 48);
    EXPECT_NEAR(c.r, 100, 3);
    EXPECT_NEAR(c.g, 100, 3);
    EXPECT_NEAR(c.b, 220, 3);
}

TEST(SyntheticSourceTest, Patterns) {
    SyntheticSource::Options o{};
    o.width = 40;
    o.height = 20;
    o.color = Pixel{0, 0, 0};

    o.pattern = "gradient";
    SyntheticSource grad(o);
    EXPECT_EQ(grad.image().pixel(0, 0), (Pixel{0, 0, 0}));
    EXPECT_EQ(grad.image().pixel(39, 10), (Pixel{255, 255, 255}));

    o.pattern = "checker";
    o.cell = 10;
    SyntheticSource chk(o);
    EXPECT_EQ(chk.image().pixel(5, 5),  (Pixel{0, 0, 0}));
    EXPECT_EQ(chk.image().pixel(15, 5), (Pixel{255, 255, 255}));
    EXPECT_EQ(chk.image().pixel(15, 15), (Pixel{0, 0, 0}));
}

TEST(SyntheticSourceTest, RejectsBadOptions) {
    SyntheticSource::Options o{};
    o.width = 8;
    o.height = 8;
    o.pattern = "plaid";
    EXPECT_THROW(SyntheticSource{o}, std::invalid_argument);

    o.pattern = "solid";
    o.width = 0;
    EXPECT_THROW(SyntheticSource{o}, std::invalid_argument);
}

TEST(SyntheticSourceTest, ZeroCountIsExhaustedImmediately) {
    SyntheticSource::Options o{};
    o.width = 8;
    o.height = 8;
    o.count = 0;
    SyntheticSource src(o);
    EXPECT_FALSE(src.next().has_value());
}
