#include <cstdint>
#include <utility>
#include <vector>

#include "ditherer.h"
#include "frame_encoder.h"
#include "raster_image.h"
#include "status.h"
#include "test_utils.h"

namespace booth_printer {

static constexpr size_t kHeaderEnd = 10;
static constexpr size_t kTrailerSize = 6;

static std::vector<uint8_t> Bytes(const PrintFrame &frame)
{
    return std::vector<uint8_t>(frame.data().begin(), frame.data().end());
}

static MonoRaster SolidMono(uint32_t width, uint32_t height, bool black)
{
    return MonoRaster(std::vector<bool>(static_cast<size_t>(width) * height,
                                        black), width, height);
}

static void TestSingleWhitePixel()
{
    auto frame = Encode(Dither(SolidImage(1, 1, 255, 255, 255)));
    EXPECT_TRUE(frame.has_value());

    const std::vector<uint8_t> golden = {
        0x1b, 0x40,
        0x1d, 0x76, 0x30, 0x00, 0x01, 0x00, 0x01, 0x00,
        0x00,
        0x1b, 0x64, 0x02,
        0x1d, 0x56, 0x01,
    };
    EXPECT_TRUE(Bytes(*frame) == golden);
    EXPECT_EQ(frame->width(), 1u);
    EXPECT_EQ(frame->height(), 1u);
}

static void TestBitPackingAndPadding()
{
    /*
     * 10 dots wide, so 2 bytes per row with 6 padding bits.
     * Row 0: X . . . . . . . | . X
     * Row 1: X X X X X X X X | X X
     */
    std::vector<bool> dots(20, false);
    dots[0] = true;
    dots[9] = true;
    for (size_t i = 10; i < 20; i++) {
        dots[i] = true;
    }
    auto frame = Encode(MonoRaster(std::move(dots), 10, 2), 5);
    EXPECT_TRUE(frame.has_value());

    const std::vector<uint8_t> golden = {
        0x1b, 0x40,
        0x1d, 0x76, 0x30, 0x00, 0x02, 0x00, 0x02, 0x00,
        0x80, 0x40,
        0xff, 0xc0,
        0x1b, 0x64, 0x05,
        0x1d, 0x56, 0x01,
    };
    EXPECT_TRUE(Bytes(*frame) == golden);
}

static void TestHeaderFieldsAreLittleEndian()
{
    /* 385 dots -> 49 bytes, 300 rows -> 0x012c. */
    auto frame = Encode(SolidMono(385, 300, false));
    EXPECT_TRUE(frame.has_value());

    std::vector<uint8_t> bytes = Bytes(*frame);
    EXPECT_EQ(bytes[6], 49);
    EXPECT_EQ(bytes[7], 0);
    EXPECT_EQ(bytes[8], 0x2c);
    EXPECT_EQ(bytes[9], 0x01);
    EXPECT_EQ(bytes.size(), kHeaderEnd + 49u * 300u + kTrailerSize);

    /* Exactly 8 dots must not get a padding byte. */
    auto exact = Encode(SolidMono(16, 1, true));
    EXPECT_TRUE(exact.has_value());
    EXPECT_EQ(Bytes(*exact)[6], 2);
    EXPECT_EQ(exact->size(), kHeaderEnd + 2 + kTrailerSize);
}

static void TestSolidBlackReceipt()
{
    auto frame = Encode(Dither(SolidImage(384, 500, 0, 0, 0)));
    EXPECT_TRUE(frame.has_value());

    std::vector<uint8_t> bytes = Bytes(*frame);
    EXPECT_EQ(bytes.size(), kHeaderEnd + 48u * 500u + kTrailerSize);
    EXPECT_EQ(bytes[6], 48);
    EXPECT_EQ(bytes[7], 0);
    EXPECT_EQ(bytes[8], 0xf4);
    EXPECT_EQ(bytes[9], 0x01);

    bool all_black = true;
    for (size_t i = kHeaderEnd; i < bytes.size() - kTrailerSize; i++) {
        all_black &= bytes[i] == 0xff;
    }
    EXPECT_TRUE(all_black);

    const std::vector<uint8_t> trailer(bytes.end() - kTrailerSize, bytes.end());
    EXPECT_TRUE(trailer == std::vector<uint8_t>({0x1b, 0x64, 0x02,
                                                 0x1d, 0x56, 0x01}));
}

static void TestFrameTooLarge()
{
    auto tall = Encode(SolidMono(1, 65536, false));
    EXPECT_TRUE(!tall.has_value());
    EXPECT_STATUS(tall.error(), StatusCode::kFrameTooLarge);

    auto wide = Encode(SolidMono(8 * 65535 + 1, 1, false));
    EXPECT_TRUE(!wide.has_value());
    EXPECT_STATUS(wide.error(), StatusCode::kFrameTooLarge);

    /* The largest height that still fits. */
    auto limit = Encode(SolidMono(1, 65535, false));
    EXPECT_TRUE(limit.has_value());
    EXPECT_EQ(Bytes(*limit)[8], 0xff);
    EXPECT_EQ(Bytes(*limit)[9], 0xff);
}

static void TestDeterministic()
{
    std::vector<uint8_t> data;
    for (uint32_t i = 0; i < 123u * 45u; i++) {
        uint8_t v = static_cast<uint8_t>(i * 37);
        data.insert(data.end(), {v, static_cast<uint8_t>(255 - v), v, 0xff});
    }
    auto image = RasterImage::Create(std::move(data), 123, 45);
    EXPECT_TRUE(image.has_value());

    auto first = Encode(Dither(*image));
    auto second = Encode(Dither(*image));
    EXPECT_TRUE(first.has_value() && second.has_value());
    EXPECT_TRUE(Bytes(*first) == Bytes(*second));
}

int real_main()
{
    RUN_TEST(TestSingleWhitePixel);
    RUN_TEST(TestBitPackingAndPadding);
    RUN_TEST(TestHeaderFieldsAreLittleEndian);
    RUN_TEST(TestSolidBlackReceipt);
    RUN_TEST(TestFrameTooLarge);
    RUN_TEST(TestDeterministic);
    return TestResult();
}

};

int main()
{
    return booth_printer::real_main();
}
