#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <doctest.h>

#include "AutoCuts.hpp"
#include "Image.hpp"
#include "globals.hpp"

IndexArray AutoCuts::cutLevels(const FloatArray& data, float low, float high,
                               uint32_t vmin, uint32_t vmax) const
{
    IndexArray out(data.w, data.h, data.c);
    float delta = high - low;
    float span = (float)vmax - (float)vmin;
    for (size_t i = 0; i < data.data.size(); i++) {
        float v = data.data[i];
        float f;
        if (std::isnan(v)) {
            f = 0.f;
        } else if (delta != 0.f) {
            f = (v - low) / delta;
        } else {
            f = v > low ? 1.f : 0.f;
        }
        f = std::min(std::max(f, 0.f), 1.f);
        out.data[i] = vmin + (uint32_t)std::lround(f * span);
    }
    return out;
}

const std::vector<std::string>& AutoCuts::getMethods()
{
    static const std::vector<std::string> methods = { "minmax", "histogram" };
    return methods;
}

std::shared_ptr<AutoCuts> AutoCuts::create(const std::string& name)
{
    if (name == "minmax")
        return std::make_shared<MinMaxCuts>();
    if (name == "histogram")
        return std::make_shared<HistogramCuts>(gAutoCutsPct);
    return nullptr;
}

const std::string& MinMaxCuts::getName() const
{
    static const std::string name = "minmax";
    return name;
}

std::pair<float, float> MinMaxCuts::calcCutLevels(const Image& image) const
{
    return image.quantiles(0.f);
}

HistogramCuts::HistogramCuts(float pct)
    : pct(pct)
{
    if (!(pct > 0.5f) || pct > 1.f) {
        throw std::invalid_argument("histogram cut percentage must be in (0.5, 1]");
    }
}

const std::string& HistogramCuts::getName() const
{
    static const std::string name = "histogram";
    return name;
}

std::pair<float, float> HistogramCuts::calcCutLevels(const Image& image) const
{
    return image.quantiles(1.f - pct);
}

TEST_CASE("AutoCuts::cutLevels")
{
    MinMaxCuts cuts;
    FloatArray data(5, 1, 1);
    data.data = { -10.f, 0.f, 50.f, 100.f, 1000.f };

    SUBCASE("linear stretch with clipping")
    {
        IndexArray idx = cuts.cutLevels(data, 0.f, 100.f, 0, 255);
        CHECK(idx.data[0] == 0);
        CHECK(idx.data[1] == 0);
        CHECK(idx.data[2] == 128);
        CHECK(idx.data[3] == 255);
        CHECK(idx.data[4] == 255);
    }

    SUBCASE("nan maps to the bottom")
    {
        data.data[2] = NAN;
        IndexArray idx = cuts.cutLevels(data, 0.f, 100.f, 0, 255);
        CHECK(idx.data[2] == 0);
    }

    SUBCASE("equal cut levels")
    {
        IndexArray idx = cuts.cutLevels(data, 50.f, 50.f, 0, 255);
        CHECK(idx.data[1] == 0);
        CHECK(idx.data[2] == 0);
        CHECK(idx.data[3] == 255);
    }

    SUBCASE("inverted cut levels")
    {
        IndexArray idx = cuts.cutLevels(data, 100.f, 0.f, 0, 255);
        CHECK(idx.data[1] == 255);
        CHECK(idx.data[3] == 0);
    }
}

TEST_CASE("AutoCuts::create")
{
    CHECK(AutoCuts::create("minmax")->getName() == "minmax");
    CHECK(AutoCuts::create("histogram")->getName() == "histogram");
    CHECK(AutoCuts::create("zscale") == nullptr);
    CHECK_THROWS_AS(HistogramCuts(0.2f), std::invalid_argument);
}

TEST_CASE("AutoCuts::calcCutLevels")
{
    std::vector<float> values(1000);
    for (size_t i = 0; i < values.size(); i++)
        values[i] = i;
    values[0] = -1e6f;
    values[999] = 1e6f;
    Image img(values, 100, 10, "M");

    auto mm = MinMaxCuts().calcCutLevels(img);
    CHECK(mm.first == -1e6f);
    CHECK(mm.second == 1e6f);

    auto hist = HistogramCuts(0.75f).calcCutLevels(img);
    CHECK(hist.first == 250.f);
    CHECK(hist.second == 750.f);
}
