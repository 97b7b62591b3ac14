#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "io/medical_loader.hpp"
#include "test_utils.hpp"

using namespace tissueseg;

class MedicalLoaderTest : public tissueseg::testing::TempDirTest {};

namespace {

InputError::Kind load_error_kind(const std::string& path) {
    try {
        load_grayscale(path);
    } catch (const InputError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected InputError for " << path;
    return InputError::Kind::Malformed;
}

} // namespace

TEST_F(MedicalLoaderTest, LoadsGrayPng) {
    const GrayImage src = tissueseg::testing::make_gray(3, 2, {0, 15, 16, 60, 131, 255});
    write_file("slice.png", tissueseg::testing::make_gray_png(src));

    const GrayImage g = load_grayscale(path("slice.png"));
    EXPECT_EQ(g.width, 3);
    EXPECT_EQ(g.height, 2);
    EXPECT_EQ(g.pixels, src.pixels);
}

TEST_F(MedicalLoaderTest, PngDetectedBySignatureNotExtension) {
    const GrayImage src(2, 2, 77);
    write_file("slice.bin", tissueseg::testing::make_gray_png(src));
    EXPECT_EQ(load_grayscale(path("slice.bin")).pixels, src.pixels);
}

TEST_F(MedicalLoaderTest, ColourPngUsesLumaWeights) {
    write_file("colour.png", tissueseg::testing::make_png(3, 1, PNG_COLOR_TYPE_RGB, 8,
                                                          {100, 150, 50, 30, 90, 200, 128, 128, 128}));
    EXPECT_EQ(load_grayscale(path("colour.png")).pixels, (std::vector<uint8_t>{124, 85, 128}));
}

TEST_F(MedicalLoaderTest, SemiTransparentPixelsAreNotComposited) {
    write_file("rgba.png", tissueseg::testing::make_png(2, 1, PNG_COLOR_TYPE_RGB_ALPHA, 8,
                                                        {100, 150, 50, 128, 30, 90, 200, 0}));
    EXPECT_EQ(load_grayscale(path("rgba.png")).pixels, (std::vector<uint8_t>{124, 85}));

    write_file("ga.png", tissueseg::testing::make_png(2, 1, PNG_COLOR_TYPE_GRAY_ALPHA, 8,
                                                      {200, 64, 40, 255}));
    EXPECT_EQ(load_grayscale(path("ga.png")).pixels, (std::vector<uint8_t>{200, 40}));
}

TEST_F(MedicalLoaderTest, SixteenBitPngIsRescaled) {
    write_file("deep.png", tissueseg::testing::make_png(4, 1, PNG_COLOR_TYPE_GRAY, 16,
                                                        {0x1010, 0x3c3c, 0x8282, 0x8383}));
    EXPECT_EQ(load_medical(path("deep.png")).bits_allocated, 16);
    EXPECT_EQ(load_grayscale(path("deep.png")).pixels, (std::vector<uint8_t>{0, 98, 253, 255}));
}

TEST_F(MedicalLoaderTest, LoadsEightBitPgm) {
    write_file("slice.pgm", tissueseg::testing::make_pgm(2, 2, 255, {10, 20, 70, 200}));

    const GrayImage g = load_grayscale(path("slice.pgm"));
    EXPECT_EQ(g.width, 2);
    EXPECT_EQ(g.height, 2);
    EXPECT_EQ(g.pixels, (std::vector<uint8_t>{10, 20, 70, 200}));
}

TEST_F(MedicalLoaderTest, SixteenBitPgmIsRescaled) {
    write_file("deep.pgm", tissueseg::testing::make_pgm(3, 1, 4095, {1000, 2000, 3000}));

    const Image raw = load_medical(path("deep.pgm"));
    EXPECT_EQ(raw.bits_allocated, 16);
    EXPECT_EQ(raw.pixels, (std::vector<int32_t>{1000, 2000, 3000}));

    const GrayImage g = to_gray8(raw);
    EXPECT_EQ(g.pixels, (std::vector<uint8_t>{0, 128, 255}));
}

TEST_F(MedicalLoaderTest, FlatDeepImageMapsToZero) {
    Image im;
    im.width = 2;
    im.height = 1;
    im.bits_stored = 12;
    im.bits_allocated = 16;
    im.type = PixelType::U16;
    im.pixels = {500, 500};
    EXPECT_EQ(to_gray8(im).pixels, (std::vector<uint8_t>{0, 0}));
}

TEST_F(MedicalLoaderTest, MissingFileIsNotFound) {
    EXPECT_EQ(load_error_kind(path("nope.png")), InputError::Kind::NotFound);
}

TEST_F(MedicalLoaderTest, EmptyFileIsEmpty) {
    write_file("empty.png", std::vector<uint8_t>{});
    EXPECT_EQ(load_error_kind(path("empty.png")), InputError::Kind::Empty);
}

TEST_F(MedicalLoaderTest, GarbageIsMalformed) {
    write_file("garbage.dat", std::string("this is not an image at all"));
    EXPECT_EQ(load_error_kind(path("garbage.dat")), InputError::Kind::Malformed);
}

TEST_F(MedicalLoaderTest, CorruptPngIsMalformed) {
    auto png = tissueseg::testing::make_gray_png(GrayImage(4, 4, 50));
    png.resize(20);
    write_file("broken.png", png);
    EXPECT_EQ(load_error_kind(path("broken.png")), InputError::Kind::Malformed);
}

TEST_F(MedicalLoaderTest, TruncatedPgmIsMalformed) {
    auto pgm = tissueseg::testing::make_pgm(4, 4, 255, {1, 2, 3});
    write_file("short.pgm", pgm);
    EXPECT_EQ(load_error_kind(path("short.pgm")), InputError::Kind::Malformed);
}

TEST_F(MedicalLoaderTest, ZeroSizedPgmIsEmpty) {
    write_file("zero.pgm", std::string("P5\n0 0\n255\n"));
    EXPECT_EQ(load_error_kind(path("zero.pgm")), InputError::Kind::Empty);
}
