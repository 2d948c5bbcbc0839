#include <algorithm>
#include <cmath>
#include <limits>

#include <doctest.h>

#include "Cutout.hpp"

ClipBox calcClipBox(const std::array<ImVec2, 4>& drawRect)
{
    float xmin = std::numeric_limits<float>::max();
    float ymin = std::numeric_limits<float>::max();
    float xmax = std::numeric_limits<float>::lowest();
    float ymax = std::numeric_limits<float>::lowest();
    for (const auto& p : drawRect) {
        xmin = std::min(xmin, p.x);
        ymin = std::min(ymin, p.y);
        xmax = std::max(xmax, p.x);
        ymax = std::max(ymax, p.y);
    }
    return ClipBox { (int)std::floor(xmin), (int)std::floor(ymin),
                     (int)std::ceil(xmax), (int)std::ceil(ymax) };
}

static int clampIndex(float v, int n)
{
    if (!(v > 0.f))
        return 0;
    if (v >= n)
        return n;
    return (int)v;
}

MergeClip calcImageMergeClip(const ClipBox& box, float dstX, float dstY,
                             size_t width, size_t height, float scaleX, float scaleY)
{
    MergeClip clip { dstX, dstY, 0, 0, (int)width, (int)height };
    if (!(scaleX > 0.f) || !(scaleY > 0.f) || !std::isfinite(scaleX) || !std::isfinite(scaleY)) {
        clip.a2 = clip.a1;
        return clip;
    }

    // source pixel i covers [dst + i*scale, dst + (i+1)*scale) in data space
    clip.a1 = clampIndex(std::floor((box.xmin - dstX) / scaleX), width);
    clip.b1 = clampIndex(std::floor((box.ymin - dstY) / scaleY), height);
    clip.a2 = clampIndex(std::ceil((box.xmax - dstX) / scaleX), width);
    clip.b2 = clampIndex(std::ceil((box.ymax - dstY) / scaleY), height);

    clip.dstX = dstX + clip.a1 * scaleX;
    clip.dstY = dstY + clip.b1 * scaleY;
    return clip;
}

std::array<int, 2> calcCanvasPosition(float dstX, float dstY, ImVec2 pan, float dataOffset,
                                      ImVec2 viewerScale, size_t bufferWidth, size_t bufferHeight)
{
    float offX = (dstX - (pan.x + dataOffset)) * viewerScale.x;
    float offY = (dstY - (pan.y + dataOffset)) * viewerScale.y;
    return { (int)std::lround(bufferWidth / 2.f + offX),
             (int)std::lround(bufferHeight / 2.f + offY) };
}

TEST_CASE("calcClipBox")
{
    ClipBox box = calcClipBox({ ImVec2(-0.5f, 2.2f), ImVec2(10.1f, 2.2f),
                                ImVec2(10.1f, 7.9f), ImVec2(-0.5f, 7.9f) });
    CHECK(box.xmin == -1);
    CHECK(box.ymin == 2);
    CHECK(box.xmax == 11);
    CHECK(box.ymax == 8);
}

TEST_CASE("calcImageMergeClip")
{
    ClipBox box { 0, 0, 200, 200 };

    SUBCASE("fully inside")
    {
        MergeClip c = calcImageMergeClip(box, 50, 50, 100, 100, 1.f, 1.f);
        CHECK(!c.empty());
        CHECK(c.a1 == 0);
        CHECK(c.b1 == 0);
        CHECK(c.a2 == 100);
        CHECK(c.b2 == 100);
        CHECK(c.dstX == 50.f);
        CHECK(c.dstY == 50.f);
    }

    SUBCASE("partially left and below")
    {
        MergeClip c = calcImageMergeClip(box, -30, 150, 100, 100, 1.f, 1.f);
        CHECK(c.a1 == 30);
        CHECK(c.a2 == 100);
        CHECK(c.b1 == 0);
        CHECK(c.b2 == 50);
        CHECK(c.dstX == 0.f);
        CHECK(c.dstY == 150.f);
    }

    SUBCASE("object scale is taken into account")
    {
        MergeClip c = calcImageMergeClip(box, 100, 100, 100, 100, 4.f, .5f);
        CHECK(c.a1 == 0);
        CHECK(c.a2 == 25);
        CHECK(c.b2 == 100);
        c = calcImageMergeClip(box, -100, 0, 100, 100, 4.f, 1.f);
        CHECK(c.a1 == 25);
        CHECK(c.a2 == 75);
        CHECK(c.dstX == 0.f);
    }

    SUBCASE("off screen")
    {
        CHECK(calcImageMergeClip(box, 300, 0, 100, 100, 1.f, 1.f).empty());
        CHECK(calcImageMergeClip(box, -100, 0, 100, 100, 1.f, 1.f).empty());
        CHECK(calcImageMergeClip(box, 0, 200, 100, 100, 1.f, 1.f).empty());
        CHECK(calcImageMergeClip(box, 0, -500, 100, 100, 1.f, 1.f).empty());
    }

    SUBCASE("degenerate scale is empty")
    {
        CHECK(calcImageMergeClip(box, 0, 0, 100, 100, 0.f, 1.f).empty());
        CHECK(calcImageMergeClip(box, 0, 0, 100, 100, 1.f, -2.f).empty());
        CHECK(calcImageMergeClip(box, 0, 0, 100, 100, NAN, 1.f).empty());
    }
}

TEST_CASE("calcCanvasPosition")
{
    auto pos = calcCanvasPosition(50, 50, ImVec2(100, 100), .5f, ImVec2(1, 1), 200, 200);
    CHECK(pos[0] == 50);
    CHECK(pos[1] == 50);
    pos = calcCanvasPosition(0, 10, ImVec2(0, 0), 0.f, ImVec2(2, 3), 100, 60);
    CHECK(pos[0] == 50);
    CHECK(pos[1] == 60);
}
