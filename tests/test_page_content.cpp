#include <gtest/gtest.h>
#include "page_content.hpp"

using namespace pagecurl;

TEST(PageContentTest, NextPowerOfTwo) {
    EXPECT_EQ(next_power_of_two(0), 1);
    EXPECT_EQ(next_power_of_two(1), 1);
    EXPECT_EQ(next_power_of_two(3), 4);
    EXPECT_EQ(next_power_of_two(64), 64);
    EXPECT_EQ(next_power_of_two(65), 128);
}

TEST(PageContentTest, ResetIsWhite) {
    PageContent content;
    content.set_color(color::BLACK, PageSide::Both);
    content.reset();
    EXPECT_EQ(content.color(PageSide::Front), color::WHITE);
    EXPECT_EQ(content.color(PageSide::Back), color::WHITE);
    EXPECT_FALSE(content.textures_changed());
}

TEST(PageContentTest, SetColorPerSide) {
    PageContent content;
    content.set_color(color::BLACK, PageSide::Back);
    EXPECT_EQ(content.color(PageSide::Front), color::WHITE);
    EXPECT_EQ(content.color(PageSide::Back), color::BLACK);
}

TEST(PageContentTest, BothSidesShareImage) {
    PageContent content;
    auto image = std::make_shared<const Image>(2, 2, color::BLACK);
    content.set_texture(image, PageSide::Both);

    EXPECT_TRUE(content.textures_changed());
    EXPECT_EQ(content.image(PageSide::Front), content.image(PageSide::Back));
    EXPECT_FALSE(content.has_back_texture());
}

TEST(PageContentTest, DistinctBackImage) {
    PageContent content;
    content.set_texture(std::make_shared<const Image>(2, 2, color::BLACK), PageSide::Front);
    content.set_texture(std::make_shared<const Image>(2, 2, color::WHITE), PageSide::Back);
    EXPECT_TRUE(content.has_back_texture());
}

TEST(PageContentTest, NullTextureUsesSideColor) {
    PageContent content;
    content.set_color(color::rgb(0x12, 0x34, 0x56), PageSide::Back);
    content.set_texture(nullptr, PageSide::Back);

    const ImagePtr& image = content.image(PageSide::Back);
    ASSERT_TRUE(image);
    EXPECT_EQ(image->width, 1);
    EXPECT_EQ(image->height, 1);
    EXPECT_EQ(image->at(0, 0), color::rgb(0x12, 0x34, 0x56));
}

TEST(PageContentTest, TexturePadsToPowerOfTwo) {
    auto source = std::make_shared<Image>(3, 5, color::BLACK);
    source->set(2, 4, color::WHITE);

    PageContent content;
    content.set_texture(source, PageSide::Front);

    RectF rect;
    ImagePtr padded = content.texture(rect, PageSide::Front);
    ASSERT_TRUE(padded);
    EXPECT_EQ(padded->width, 4);
    EXPECT_EQ(padded->height, 8);
    EXPECT_EQ(padded->at(2, 4), color::WHITE);
    EXPECT_EQ(padded->at(0, 0), color::BLACK);
    EXPECT_EQ(padded->at(3, 0), color::TRANSPARENT);
    EXPECT_EQ(padded->at(0, 7), color::TRANSPARENT);

    EXPECT_FLOAT_EQ(rect.left, 0.0f);
    EXPECT_FLOAT_EQ(rect.top, 0.0f);
    EXPECT_FLOAT_EQ(rect.right, 0.75f);
    EXPECT_FLOAT_EQ(rect.bottom, 0.625f);
}

TEST(PageContentTest, RecycleDropsImages) {
    PageContent content;
    content.set_texture(std::make_shared<const Image>(8, 8, color::BLACK), PageSide::Both);
    content.recycle();

    EXPECT_FALSE(content.textures_changed());
    EXPECT_EQ(content.image(PageSide::Front)->width, 1);
    EXPECT_EQ(content.image(PageSide::Back)->width, 1);
}
