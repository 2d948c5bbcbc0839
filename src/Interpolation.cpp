#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include <doctest.h>

#include "Image.hpp"
#include "Interpolation.hpp"

const std::vector<std::string>& getInterpolationMethods()
{
    static const std::vector<std::string> methods = { "basic", "bilinear", "area" };
    return methods;
}

bool isInterpolationMethod(const std::string& name)
{
    const auto& methods = getInterpolationMethods();
    return std::find(methods.begin(), methods.end(), name) != methods.end();
}

std::string resolveInterpolation(const std::string& name)
{
    if (isInterpolationMethod(name))
        return name;
    return DEFAULT_INTERPOLATION;
}

static void resampleBasic(const Image& img, int x1, int y1, int sw, int sh, FloatArray& out)
{
    float rx = (float)sw / out.w;
    float ry = (float)sh / out.h;
    for (size_t y = 0; y < out.h; y++) {
        int sy = y1 + std::min((int)((y + .5f) * ry), sh - 1);
        for (size_t x = 0; x < out.w; x++) {
            int sx = x1 + std::min((int)((x + .5f) * rx), sw - 1);
            for (size_t d = 0; d < out.c; d++) {
                out.at(x, y, d) = img.at(sx, sy, d);
            }
        }
    }
}

static void resampleBilinear(const Image& img, int x1, int y1, int sw, int sh, FloatArray& out)
{
    float rx = (float)sw / out.w;
    float ry = (float)sh / out.h;
    for (size_t y = 0; y < out.h; y++) {
        float fy = std::min(std::max((y + .5f) * ry - .5f, 0.f), (float)(sh - 1));
        int y0 = (int)fy;
        int y1b = std::min(y0 + 1, sh - 1);
        float ty = fy - y0;
        for (size_t x = 0; x < out.w; x++) {
            float fx = std::min(std::max((x + .5f) * rx - .5f, 0.f), (float)(sw - 1));
            int x0 = (int)fx;
            int x1b = std::min(x0 + 1, sw - 1);
            float tx = fx - x0;
            for (size_t d = 0; d < out.c; d++) {
                float a = img.at(x1 + x0, y1 + y0, d);
                float b = img.at(x1 + x1b, y1 + y0, d);
                float c = img.at(x1 + x0, y1 + y1b, d);
                float e = img.at(x1 + x1b, y1 + y1b, d);
                float top = a + (b - a) * tx;
                float bottom = c + (e - c) * tx;
                out.at(x, y, d) = top + (bottom - top) * ty;
            }
        }
    }
}

// box average of the source pixels covered by each output pixel
static void resampleArea(const Image& img, int x1, int y1, int sw, int sh, FloatArray& out)
{
    float rx = (float)sw / out.w;
    float ry = (float)sh / out.h;
    if (rx <= 1.f && ry <= 1.f) {
        resampleBasic(img, x1, y1, sw, sh, out);
        return;
    }
    for (size_t y = 0; y < out.h; y++) {
        int ys = std::min((int)(y * ry), sh - 1);
        int ye = std::max(ys + 1, std::min((int)std::ceil((y + 1) * ry), sh));
        for (size_t x = 0; x < out.w; x++) {
            int xs = std::min((int)(x * rx), sw - 1);
            int xe = std::max(xs + 1, std::min((int)std::ceil((x + 1) * rx), sw));
            float n = (float)(xe - xs) * (ye - ys);
            for (size_t d = 0; d < out.c; d++) {
                float sum = 0.f;
                for (int j = ys; j < ye; j++) {
                    for (int i = xs; i < xe; i++) {
                        sum += img.at(x1 + i, y1 + j, d);
                    }
                }
                out.at(x, y, d) = sum / n;
            }
        }
    }
}

FloatArray resample(const Image& img, int x1, int y1, int x2, int y2,
                    float sx, float sy, const std::string& method)
{
    x1 = std::max(x1, 0);
    y1 = std::max(y1, 0);
    x2 = std::min(x2, (int)img.w);
    y2 = std::min(y2, (int)img.h);
    int sw = x2 - x1;
    int sh = y2 - y1;
    if (sw <= 0 || sh <= 0 || !(sx > 0.f) || !(sy > 0.f))
        return FloatArray();

    long ow = std::lround(sw * sx);
    long oh = std::lround(sh * sy);
    if (ow <= 0 || oh <= 0)
        return FloatArray();

    FloatArray out(ow, oh, img.c);
    std::string m = resolveInterpolation(method);
    if (m == "bilinear") {
        resampleBilinear(img, x1, y1, sw, sh, out);
    } else if (m == "area") {
        resampleArea(img, x1, y1, sw, sh, out);
    } else {
        resampleBasic(img, x1, y1, sw, sh, out);
    }
    return out;
}

TEST_CASE("resolveInterpolation")
{
    CHECK(resolveInterpolation("bilinear") == "bilinear");
    CHECK(resolveInterpolation("area") == "area");
    CHECK(resolveInterpolation("lanczos") == "basic");
    CHECK(resolveInterpolation("") == "basic");
}

TEST_CASE("resample")
{
    std::vector<float> values(4 * 4);
    for (size_t i = 0; i < values.size(); i++)
        values[i] = i;
    Image img(values, 4, 4, "M");

    SUBCASE("identity")
    {
        for (const auto& m : getInterpolationMethods()) {
            FloatArray out = resample(img, 0, 0, 4, 4, 1.f, 1.f, m);
            CHECK(out.w == 4);
            CHECK(out.h == 4);
            CHECK(out.data == values);
        }
    }

    SUBCASE("basic upsampling repeats pixels")
    {
        FloatArray out = resample(img, 1, 1, 3, 3, 2.f, 2.f, "basic");
        REQUIRE(out.w == 4);
        REQUIRE(out.h == 4);
        CHECK(out.at(0, 0, 0) == 5.f);
        CHECK(out.at(1, 1, 0) == 5.f);
        CHECK(out.at(2, 0, 0) == 6.f);
        CHECK(out.at(3, 3, 0) == 10.f);
    }

    SUBCASE("area downsampling averages")
    {
        FloatArray out = resample(img, 0, 0, 4, 4, .5f, .5f, "area");
        REQUIRE(out.w == 2);
        REQUIRE(out.h == 2);
        CHECK(out.at(0, 0, 0) == doctest::Approx((0 + 1 + 4 + 5) / 4.f));
        CHECK(out.at(1, 1, 0) == doctest::Approx((10 + 11 + 14 + 15) / 4.f));
    }

    SUBCASE("bilinear stays within the source range")
    {
        FloatArray out = resample(img, 0, 0, 4, 4, 3.f, 3.f, "bilinear");
        REQUIRE(out.w == 12);
        for (float v : out.data) {
            CHECK(v >= 0.f);
            CHECK(v <= 15.f);
        }
        CHECK(out.at(0, 0, 0) == doctest::Approx(0.f));
        CHECK(out.at(11, 11, 0) == doctest::Approx(15.f));
    }

    SUBCASE("degenerate requests are empty")
    {
        CHECK(resample(img, 2, 0, 2, 4, 1.f, 1.f, "basic").empty());
        CHECK(resample(img, 0, 0, 4, 4, 0.f, 1.f, "basic").empty());
        CHECK(resample(img, 0, 0, 1, 1, .1f, .1f, "basic").empty());
    }

    SUBCASE("unknown method falls back")
    {
        FloatArray a = resample(img, 0, 0, 4, 4, 2.f, 2.f, "nope");
        FloatArray b = resample(img, 0, 0, 4, 4, 2.f, 2.f, "basic");
        CHECK(a == b);
    }
}
