#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>

#include <doctest.h>

#include "Image.hpp"
#include "Interpolation.hpp"

std::string defaultOrder(size_t channels)
{
    switch (channels) {
    case 1:
        return "M";
    case 2:
        return "MA";
    case 3:
        return "RGB";
    case 4:
        return "RGBA";
    }
    return std::string(channels, 'M');
}

Image::Image(void* pixels, size_t w, size_t h, size_t c, Format format, const std::string& order)
    : w(w)
    , h(h)
    , c(c)
    , format(format)
    , pixels(pixels)
    , order(order.empty() ? defaultOrder(c) : order)
{
    if (this->order.size() != c) {
        free(pixels);
        throw std::invalid_argument("channel order '" + this->order + "' does not match "
                                    + std::to_string(c) + " channels");
    }

    static int id = 0;
    id++;
    ID = "Image " + std::to_string(id);

    computeMinMax();
}

template <typename T>
static void* copyPixels(const std::vector<T>& values, size_t w, size_t h)
{
    if (w == 0 || h == 0 || values.size() % (w * h) != 0)
        throw std::invalid_argument("pixel buffer size does not match image dimensions");
    void* buf = malloc(sizeof(T) * std::max<size_t>(values.size(), 1));
    if (!buf)
        throw std::bad_alloc();
    if (!values.empty())
        std::memcpy(buf, values.data(), sizeof(T) * values.size());
    return buf;
}

static size_t channelsOf(size_t nvalues, size_t w, size_t h)
{
    if (w == 0 || h == 0)
        return 0;
    return nvalues / (w * h);
}

Image::Image(const std::vector<float>& pixels, size_t w, size_t h, const std::string& order)
    : Image(copyPixels(pixels, w, h), w, h, channelsOf(pixels.size(), w, h), F32, order)
{
}

Image::Image(const std::vector<uint8_t>& pixels, size_t w, size_t h, const std::string& order)
    : Image(copyPixels(pixels, w, h), w, h, channelsOf(pixels.size(), w, h), U8, order)
{
}

Image::~Image()
{
    free(pixels);
}

float Image::maxValue(Format format)
{
    switch (format) {
    case U8:
        return std::numeric_limits<uint8_t>::max();
    case I8:
        return std::numeric_limits<int8_t>::max();
    case U16:
        return std::numeric_limits<uint16_t>::max();
    case I16:
        return std::numeric_limits<int16_t>::max();
    case F32:
        return 1.f;
    }
    return 1.f;
}

void Image::computeMinMax()
{
    min = std::numeric_limits<float>::max();
    max = std::numeric_limits<float>::lowest();
    for (size_t i = 0; i < w * h * c; i++) {
        float v = at(i);
        if (std::isfinite(v)) {
            min = std::min(min, v);
            max = std::max(max, v);
        }
    }
    if (min > max) {
        min = max = 0.f;
    }
}

void Image::getPixelValueAt(size_t x, size_t y, float* values, size_t d) const
{
    if (x >= w || y >= h)
        return;

    for (size_t i = 0; i < std::min(d, c); i++) {
        values[i] = at(x, y, i);
    }
}

// quantiles over the color channels, alpha excluded
std::pair<float, float> Image::quantiles(float quantile) const
{
    int alpha = orderIndex(order, 'A');
    std::vector<float> all;
    all.reserve(w * h * c);
    for (size_t i = 0; i < w * h * c; i++) {
        if ((int)(i % c) == alpha)
            continue;
        float v = at(i);
        if (std::isfinite(v))
            all.push_back(v);
    }
    if (all.empty())
        return std::make_pair(0.f, 0.f);

    std::sort(all.begin(), all.end());
    size_t lo = std::min(all.size() - 1, (size_t)(quantile * all.size()));
    size_t hi = std::min(all.size() - 1, (size_t)((1 - quantile) * all.size()));
    return std::make_pair(all[lo], all[hi]);
}

FloatArray Image::getScaledCutout(int x1, int y1, int x2, int y2, float sx, float sy,
                                  const std::string& method) const
{
    return resample(*this, x1, y1, x2, y2, sx, sy, method);
}

TEST_CASE("Image")
{
    SUBCASE("order defaults follow the channel count")
    {
        Image mono(std::vector<float>(6, 1.f), 3, 2, "");
        CHECK(mono.c == 1);
        CHECK(mono.getOrder() == "M");
        Image rgba(std::vector<uint8_t>(4 * 4, 7), 2, 2, "");
        CHECK(rgba.getOrder() == "RGBA");
        CHECK(rgba.format == Image::U8);
        CHECK(rgba.getMaxValue() == 255.f);
    }

    SUBCASE("mismatched order is rejected")
    {
        CHECK_THROWS_AS(Image(std::vector<float>(12), 2, 2, "RGBA"), std::invalid_argument);
        CHECK_THROWS_AS(Image(std::vector<float>(5), 2, 2, "M"), std::invalid_argument);
    }

    SUBCASE("min max ignore non finite values")
    {
        std::vector<float> values = { 1.f, NAN, -3.f, INFINITY };
        Image img(values, 2, 2, "M");
        CHECK(img.min == -3.f);
        CHECK(img.max == 1.f);
    }

    SUBCASE("quantiles skip alpha")
    {
        std::vector<uint8_t> values;
        for (int i = 0; i < 100; i++) {
            values.push_back(i);
            values.push_back(255);
        }
        Image img(values, 10, 10, "MA");
        auto q = img.quantiles(0.f);
        CHECK(q.first == 0.f);
        CHECK(q.second == 99.f);
        q = img.quantiles(.25f);
        CHECK(q.first == 25.f);
        CHECK(q.second == 75.f);
    }
}
