#include <gtest/gtest.h>
#include "demo_page_provider.hpp"

using namespace pagecurl;

TEST(DemoPageProviderTest, PageCount) {
    EXPECT_EQ(DemoPageProvider(7).page_count(), 7);
    EXPECT_EQ(DemoPageProvider(-2).page_count(), 0);
}

TEST(DemoPageProviderTest, SingleImageOnBothSides) {
    DemoPageProvider provider(3);
    PageContent content;
    provider.update_page(content, 64, 32, 1, std::nullopt);

    EXPECT_TRUE(content.textures_changed());
    EXPECT_FALSE(content.has_back_texture());
    EXPECT_EQ(content.image(PageSide::Front)->width, 64);
    EXPECT_EQ(content.image(PageSide::Front)->height, 32);
    EXPECT_EQ(content.color(PageSide::Back), provider.back_color);
}

TEST(DemoPageProviderTest, SeparateBackPage) {
    DemoPageProvider provider(3);
    PageContent content;
    provider.update_page(content, 64, 32, 1, 2);
    EXPECT_TRUE(content.has_back_texture());
}

TEST(DemoPageProviderTest, ImageSizeIsCapped) {
    DemoPageProvider provider;
    provider.max_image_size = 128;
    ImagePtr image = provider.render_page(1000, 50, 0);
    EXPECT_EQ(image->width, 128);
    EXPECT_EQ(image->height, 50);

    ImagePtr tiny = provider.render_page(0, 0, 0);
    EXPECT_EQ(tiny->width, 1);
    EXPECT_EQ(tiny->height, 1);
}

TEST(DemoPageProviderTest, PagesDiffer) {
    DemoPageProvider provider;
    ImagePtr first = provider.render_page(100, 100, 0);
    ImagePtr second = provider.render_page(100, 100, 1);
    EXPECT_NE(first->pixels, second->pixels);
}
