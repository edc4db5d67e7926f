#include <cstdint>
#include <vector>

#include "raster_image.h"
#include "rasterizer.h"
#include "status.h"
#include "test_utils.h"

namespace booth_printer {

static void TestHeightKeepsAspectRatio()
{
    auto landscape = Resample(SolidImage(800, 600, 10, 20, 30), 384);
    EXPECT_TRUE(landscape.has_value());
    EXPECT_EQ(landscape->width(), 384u);
    EXPECT_EQ(landscape->height(), 288u);

    /* 384 * 333 / 1000 = 127.87, rounded down. */
    auto strip = Resample(SolidImage(1000, 333, 0, 0, 0), 384);
    EXPECT_TRUE(strip.has_value());
    EXPECT_EQ(strip->height(), 127u);

    auto tall = Resample(SolidImage(100, 1000, 0, 0, 0), 384);
    EXPECT_TRUE(tall.has_value());
    EXPECT_EQ(tall->height(), 3840u);
}

static void TestRejectsInvalidImages()
{
    auto empty = RasterImage::Create({}, 0, 0);
    EXPECT_TRUE(!empty.has_value());
    EXPECT_STATUS(empty.error(), StatusCode::kInvalidImage);

    auto zero_height = RasterImage::Create({}, 4, 0);
    EXPECT_TRUE(!zero_height.has_value());

    auto short_buffer = RasterImage::Create(std::vector<uint8_t>(15), 2, 2);
    EXPECT_TRUE(!short_buffer.has_value());
    EXPECT_STATUS(short_buffer.error(), StatusCode::kInvalidImage);

    auto zero_target = Resample(SolidImage(4, 4, 0, 0, 0), 0);
    EXPECT_TRUE(!zero_target.has_value());
    EXPECT_STATUS(zero_target.error(), StatusCode::kInvalidImage);
}

static void TestSameWidthIsIdentity()
{
    std::vector<uint8_t> data = {
        0,   0,   0,   255,  10,  20,  30,  255,
        200, 100, 50,  255,  255, 255, 255, 255,
        1,   2,   3,   255,  4,   5,   6,   255,
    };
    std::vector<uint8_t> copy = data;
    auto image = RasterImage::Create(std::move(data), 2, 3);
    EXPECT_TRUE(image.has_value());

    auto resampled = Resample(*image, 2);
    EXPECT_TRUE(resampled.has_value());
    EXPECT_EQ(resampled->height(), 3u);

    std::vector<uint8_t> out(resampled->data().begin(),
                             resampled->data().end());
    EXPECT_TRUE(out == copy);
}

static void TestDownscaleAveragesArea()
{
    std::vector<uint8_t> data = {
        0,   0,   0,   255,  100, 100, 100, 255,
        200, 200, 200, 255,  40,  40,  40,  255,
    };
    auto image = RasterImage::Create(std::move(data), 2, 2);
    EXPECT_TRUE(image.has_value());

    auto resampled = Resample(*image, 1);
    EXPECT_TRUE(resampled.has_value());
    EXPECT_EQ(resampled->width(), 1u);
    EXPECT_EQ(resampled->height(), 1u);
    EXPECT_EQ(resampled->pixel(0, 0).r, 85);
    EXPECT_EQ(resampled->pixel(0, 0).g, 85);
    EXPECT_EQ(resampled->pixel(0, 0).b, 85);
}

static void TestTransparencyBecomesWhite()
{
    auto clear = RasterImage::Filled(4, 4, {0, 0, 0, 0});
    EXPECT_TRUE(clear.has_value());

    auto resampled = Resample(*clear, 8);
    EXPECT_TRUE(resampled.has_value());
    for (uint32_t y = 0; y < resampled->height(); y++) {
        for (uint32_t x = 0; x < resampled->width(); x++) {
            const RasterImage::Rgba &p = resampled->pixel(x, y);
            EXPECT_TRUE(p.r == 255 && p.g == 255 && p.b == 255 && p.a == 255);
        }
    }

    /* Half-transparent black lands halfway to white. */
    auto half = RasterImage::Filled(2, 2, {0, 0, 0, 128});
    auto half_resampled = Resample(*half, 2);
    EXPECT_TRUE(half_resampled.has_value());
    EXPECT_EQ(half_resampled->pixel(1, 1).r, 127);
    EXPECT_EQ(half_resampled->pixel(1, 1).a, 255);

    /* Rows are composited before they are averaged together. */
    std::vector<uint8_t> data = {
        0, 0, 0, 0,    0, 0, 0, 0,
        0, 0, 0, 255,  0, 0, 0, 255,
    };
    auto split = RasterImage::Create(data, 2, 2);
    EXPECT_TRUE(split.has_value());
    auto merged = Resample(*split, 1);
    EXPECT_TRUE(merged.has_value());
    EXPECT_EQ(merged->height(), 1u);
    EXPECT_EQ(merged->pixel(0, 0).r, 128);
    EXPECT_EQ(merged->pixel(0, 0).a, 255);
}

static void TestAdjustTone()
{
    std::vector<uint8_t> data = {
        0, 0, 0, 255,  64, 128, 192, 7,  255, 255, 255, 255,
    };
    auto image = RasterImage::Create(data, 3, 1);
    EXPECT_TRUE(image.has_value());

    RasterImage same = AdjustTone(*image, 1.0f, 1.0f);
    std::vector<uint8_t> same_data(same.data().begin(), same.data().end());
    EXPECT_TRUE(same_data == data);

    RasterImage punchy = AdjustTone(*image, 1.1f, 1.1f);
    EXPECT_EQ(punchy.pixel(0, 0).r, 0);
    EXPECT_EQ(punchy.pixel(2, 0).r, 255);
    /* Alpha is never touched. */
    EXPECT_EQ(punchy.pixel(1, 0).a, 7);
    EXPECT_TRUE(punchy.pixel(1, 0).b > 192);

    /* Contrast saturates white first; dimming then starts from 255. */
    RasterImage dim = AdjustTone(*image, 1.5f, 0.5f);
    EXPECT_EQ(dim.pixel(2, 0).r, 128);
    EXPECT_EQ(dim.pixel(0, 0).r, 0);
}

int real_main()
{
    RUN_TEST(TestHeightKeepsAspectRatio);
    RUN_TEST(TestRejectsInvalidImages);
    RUN_TEST(TestSameWidthIsIdentity);
    RUN_TEST(TestDownscaleAveragesArea);
    RUN_TEST(TestTransparencyBecomesWhite);
    RUN_TEST(TestAdjustTone);
    return TestResult();
}

};

int main()
{
    return booth_printer::real_main();
}
