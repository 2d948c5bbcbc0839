#include <algorithm>
#include <array>
#include <cmath>
#include <string>

#include <doctest.h>

#include "colormaps.hpp"

std::vector<std::shared_ptr<ColorTable>> gColorTables;

std::array<float, 3> ColorTable::sample(float t) const
{
    t = std::min(std::max(t, 0.f), 1.f);
    float pos = t * (stops.size() - 1);
    size_t k = std::min((size_t)pos, stops.size() - 2);
    float frac = pos - k;
    std::array<float, 3> color;
    for (int i = 0; i < 3; i++)
        color[i] = stops[k][i] + (stops[k + 1][i] - stops[k][i]) * frac;
    return color;
}

bool loadColorTable(const std::string& name, const std::vector<std::array<float, 3>>& stops)
{
    if (name.empty() || stops.size() < 2)
        return false;
    for (const auto& s : stops) {
        for (float v : s) {
            if (!(v >= 0.f && v <= 1.f))
                return false;
        }
    }

    auto table = std::make_shared<ColorTable>();
    table->name = name;
    table->stops = stops;

    gColorTables.erase(std::remove_if(gColorTables.begin(), gColorTables.end(),
                           [&name](const std::shared_ptr<ColorTable>& t) { return t->name == name; }),
        gColorTables.end());
    gColorTables.push_back(table);
    std::sort(gColorTables.begin(), gColorTables.end(),
        [](const std::shared_ptr<ColorTable>& lhs, const std::shared_ptr<ColorTable>& rhs) {
            return lhs->name < rhs->name;
        });
    return true;
}

std::shared_ptr<ColorTable> getColorTable(const std::string& name)
{
    for (const auto& t : gColorTables) {
        if (t->name == name)
            return t;
    }
    return nullptr;
}

void loadDefaultColorTables()
{
    loadColorTable("gray", { { 0, 0, 0 }, { 1, 1, 1 } });
    loadColorTable("heat", { { 0, 0, 0 }, { 1, 0, 0 }, { 1, 1, 0 }, { 1, 1, 1 } });
    loadColorTable("cool", { { 0, 1, 1 }, { 1, 0, 1 } });
    loadColorTable("rainbow", { { 0, 0, 1 }, { 0, 1, 1 }, { 0, 1, 0 }, { 1, 1, 0 }, { 1, 0, 0 } });
}

TEST_CASE("ColorTable")
{
    loadDefaultColorTables();

    SUBCASE("defaults are registered in order")
    {
        REQUIRE(getColorTable("gray"));
        REQUIRE(getColorTable("heat"));
        CHECK(getColorTable("viridis") == nullptr);
        for (size_t i = 1; i < gColorTables.size(); i++)
            CHECK(gColorTables[i - 1]->name < gColorTables[i]->name);
    }

    SUBCASE("sampling interpolates between stops")
    {
        auto heat = getColorTable("heat");
        auto c = heat->sample(0.f);
        CHECK(c[0] == 0.f);
        c = heat->sample(1.f / 3.f);
        CHECK(c[0] == doctest::Approx(1.f));
        CHECK(c[1] == doctest::Approx(0.f));
        c = heat->sample(.5f);
        CHECK(c[0] == doctest::Approx(1.f));
        CHECK(c[1] == doctest::Approx(.5f));
        c = heat->sample(2.f);
        CHECK(c[2] == doctest::Approx(1.f));
    }

    SUBCASE("invalid tables are refused")
    {
        CHECK(!loadColorTable("bad", { { 0, 0, 0 } }));
        CHECK(!loadColorTable("bad", { { 0, 0, 0 }, { 2, 0, 0 } }));
        CHECK(!loadColorTable("", { { 0, 0, 0 }, { 1, 1, 1 } }));
        CHECK(getColorTable("bad") == nullptr);
    }

    SUBCASE("reloading replaces")
    {
        size_t n = gColorTables.size();
        CHECK(loadColorTable("gray", { { 1, 1, 1 }, { 0, 0, 0 } }));
        CHECK(gColorTables.size() == n);
        CHECK(getColorTable("gray")->sample(0.f)[0] == 1.f);
        loadDefaultColorTables();
        CHECK(getColorTable("gray")->sample(0.f)[0] == 0.f);
    }
}
