#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

#include <doctest.h>

#include "Compositor.hpp"

// which source channel feeds each destination channel, -1 for none
static std::array<int, 4> matchChannels(const std::string& dstOrder, const std::string& srcOrder)
{
    std::array<int, 4> map = { -1, -1, -1, -1 };
    int mono = orderIndex(srcOrder, 'M');
    for (size_t d = 0; d < dstOrder.size() && d < map.size(); d++) {
        char ch = dstOrder[d];
        if (ch == 'A')
            continue;
        int s = orderIndex(srcOrder, ch);
        if (s < 0 && ch != 'M')
            s = mono;
        if (s < 0 && ch == 'M')
            s = orderIndex(srcOrder, 'R');
        if (s < 0 && srcOrder.size() == 1)
            s = 0;
        map[d] = s;
    }
    return map;
}

template <typename T>
void overlayImage(RGBArray& dst, const std::array<int, 2>& pos, const Array<T>& src, float srcMax,
                  const std::string& dstOrder, const std::string& srcOrder,
                  float alpha, bool fill, bool flipy)
{
    if (src.empty() || dst.empty() || !(srcMax > 0.f))
        return;

    int x0 = std::max(0, pos[0]);
    int y0 = std::max(0, pos[1]);
    int x1 = std::min<long>((long)dst.w, (long)pos[0] + (long)src.w);
    int y1 = std::min<long>((long)dst.h, (long)pos[1] + (long)src.h);
    if (x1 <= x0 || y1 <= y0)
        return;

    std::array<int, 4> map = matchChannels(dstOrder, srcOrder);
    int srcA = orderIndex(srcOrder, 'A');
    int dstA = orderIndex(dstOrder, 'A');
    float norm = 255.f / srcMax;
    alpha = std::min(std::max(alpha, 0.f), 1.f);

    for (int y = y0; y < y1; y++) {
        size_t sy = y - pos[1];
        if (flipy)
            sy = src.h - 1 - sy;
        for (int x = x0; x < x1; x++) {
            size_t sx = x - pos[0];
            const T* s = &src.data[src.index(sx, sy, 0)];
            uint8_t* d = &dst.data[dst.index(x, y, 0)];

            float a = alpha;
            if (srcA >= 0) {
                float sa = (float)s[srcA] / srcMax;
                a *= std::isnan(sa) ? 0.f : std::min(std::max(sa, 0.f), 1.f);
            }

            for (size_t k = 0; k < dstOrder.size() && k < map.size(); k++) {
                if ((int)k == dstA) {
                    if (fill)
                        d[k] = 255;
                    else
                        d[k] = (uint8_t)std::lround(a * 255.f + (1.f - a) * d[k]);
                    continue;
                }
                if (map[k] < 0)
                    continue;
                float v = (float)s[map[k]] * norm;
                v = std::isnan(v) ? 0.f : std::min(std::max(v, 0.f), 255.f);
                d[k] = (uint8_t)std::lround(a * v + (1.f - a) * d[k]);
            }
        }
    }
}

template void overlayImage<float>(RGBArray&, const std::array<int, 2>&, const Array<float>&, float,
                                  const std::string&, const std::string&, float, bool, bool);
template void overlayImage<uint8_t>(RGBArray&, const std::array<int, 2>&, const Array<uint8_t>&, float,
                                    const std::string&, const std::string&, float, bool, bool);

TEST_CASE("overlayImage")
{
    RGBArray dst(4, 4, 4, 10);

    SUBCASE("opaque copy with fill")
    {
        RGBArray src(2, 2, 3, 200);
        overlayImage(dst, { 1, 1 }, src, 255.f, "RGBA", "RGB", 1.f, true);
        CHECK(dst.at(1, 1, 0) == 200);
        CHECK(dst.at(2, 2, 2) == 200);
        CHECK(dst.at(2, 2, 3) == 255);
        CHECK(dst.at(0, 0, 0) == 10);
        CHECK(dst.at(3, 3, 3) == 10);
    }

    SUBCASE("negative offsets trim the source")
    {
        RGBArray src(3, 3, 3, 0);
        src.at(2, 2, 0) = 77;
        overlayImage(dst, { -2, -2 }, src, 255.f, "RGBA", "RGB");
        CHECK(dst.at(0, 0, 0) == 77);
        CHECK(dst.at(1, 0, 0) == 10);
    }

    SUBCASE("fully outside leaves dst untouched")
    {
        RGBArray src(2, 2, 3, 0);
        RGBArray before = dst;
        overlayImage(dst, { 4, 0 }, src, 255.f, "RGBA", "RGB");
        overlayImage(dst, { 0, -2 }, src, 255.f, "RGBA", "RGB");
        CHECK(dst == before);
    }

    SUBCASE("scalar and per pixel alpha")
    {
        RGBArray src(1, 1, 4);
        src.data = { 210, 210, 210, 255 };
        overlayImage(dst, { 0, 0 }, src, 255.f, "RGBA", "RGBA", .5f);
        CHECK(dst.at(0, 0, 0) == 110);

        src.data = { 210, 210, 210, 0 };
        overlayImage(dst, { 1, 0 }, src, 255.f, "RGBA", "RGBA", 1.f);
        CHECK(dst.at(1, 0, 0) == 10);
    }

    SUBCASE("mono float source feeds rgb")
    {
        FloatArray src(1, 1, 1);
        src.data = { .5f };
        overlayImage(dst, { 3, 3 }, src, 1.f, "BGRA", "M", 1.f, true);
        CHECK(dst.at(3, 3, 0) == 128);
        CHECK(dst.at(3, 3, 1) == 128);
        CHECK(dst.at(3, 3, 2) == 128);
        CHECK(dst.at(3, 3, 3) == 255);
    }

    SUBCASE("flipy")
    {
        RGBArray src(1, 2, 1);
        src.data = { 1, 2 };
        overlayImage(dst, { 0, 0 }, src, 255.f, "RGBA", "M", 1.f, false, true);
        CHECK(dst.at(0, 0, 0) == 2);
        CHECK(dst.at(0, 1, 0) == 1);
    }
}
