#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <doctest.h>
#include <imgui.h>

#include "Colormap.hpp"
#include "colormaps.hpp"
#include "imgui_custom.hpp"
#include "strutils.hpp"

Colormap::Colormap(const std::string& tableName, size_t hashSize)
    : maxc(255)
    , hashSize(hashSize)
{
    static int id = 0;
    id++;
    ID = "Colormap " + std::to_string(id);

    if (hashSize < 2) {
        throw std::invalid_argument("colormap size must be at least 2");
    }
    table = getColorTable(tableName);
    if (!table && !gColorTables.empty()) {
        fprintf(stderr, "unknown color table '%s', using '%s'\n",
                tableName.c_str(), gColorTables[0]->name.c_str());
        table = gColorTables[0];
    }
    rebuild();
}

bool Colormap::operator==(const Colormap& other)
{
    return other.ID == ID;
}

void Colormap::rebuild()
{
    lut.assign(hashSize, { 0, 0, 0 });
    if (!table)
        return;
    for (size_t i = 0; i < hashSize; i++) {
        auto color = table->sample((float)i / (hashSize - 1));
        for (int k = 0; k < 3; k++)
            lut[i][k] = (uint8_t)std::lround(color[k] * maxc);
    }
}

bool Colormap::setHashSize(size_t size)
{
    if (size < 2)
        return false;
    hashSize = size;
    rebuild();
    return true;
}

void Colormap::nextTable()
{
    if (gColorTables.empty())
        return;
    for (size_t i = 0; i + 1 < gColorTables.size(); i++) {
        if (gColorTables[i] == table) {
            table = gColorTables[i + 1];
            rebuild();
            return;
        }
    }
    table = gColorTables[0];
    rebuild();
}

void Colormap::previousTable()
{
    if (gColorTables.empty())
        return;
    for (size_t i = 1; i < gColorTables.size(); i++) {
        if (gColorTables[i] == table) {
            table = gColorTables[i - 1];
            rebuild();
            return;
        }
    }
    table = gColorTables[gColorTables.size() - 1];
    rebuild();
}

const std::string& Colormap::getTableName() const
{
    if (table) {
        return table->name;
    }
    static std::string null;
    return null;
}

bool Colormap::setTable(const std::string& name)
{
    const auto& t = getColorTable(name);
    if (t) {
        table = t;
        rebuild();
        return true;
    }
    return false;
}

std::array<uint8_t, 3> Colormap::lookup(uint32_t index) const
{
    if (index >= hashSize)
        index = hashSize - 1;
    return lut[index];
}

RGBArray Colormap::getRGBArray(const IndexArray& idx, const std::string& order,
                               const std::string& imageOrder) const
{
    RGBArray out(idx.w, idx.h, order.size());
    if (idx.empty())
        return out;

    std::array<int, 3> src = { 0, 0, 0 };
    bool color = idx.c >= 3;
    if (color) {
        std::string idxOrder = withoutAlpha(imageOrder);
        const char rgb[] = { 'R', 'G', 'B' };
        for (int k = 0; k < 3; k++) {
            int i = orderIndex(idxOrder, rgb[k]);
            src[k] = (i >= 0 && (size_t)i < idx.c) ? i : k;
        }
    }

    for (size_t p = 0; p < idx.w * idx.h; p++) {
        const uint32_t* in = &idx.data[p * idx.c];
        std::array<uint8_t, 3> rgb;
        if (color) {
            for (int k = 0; k < 3; k++)
                rgb[k] = lookup(in[src[k]])[k];
        } else {
            rgb = lookup(in[0]);
        }
        uint8_t* o = &out.data[p * out.c];
        for (size_t d = 0; d < order.size(); d++) {
            switch (order[d]) {
            case 'R':
                o[d] = rgb[0];
                break;
            case 'G':
                o[d] = rgb[1];
                break;
            case 'B':
                o[d] = rgb[2];
                break;
            case 'A':
                o[d] = maxc;
                break;
            default:
                o[d] = (uint8_t)std::lround((rgb[0] + rgb[1] + rgb[2]) / 3.f);
                break;
            }
        }
    }
    return out;
}

bool Colormap::displaySettings()
{
    bool changed = false;

    std::vector<const char*> items(gColorTables.size());
    int index = 0;
    for (size_t i = 0; i < gColorTables.size(); i++) {
        items[i] = gColorTables[i]->name.c_str();
        if (gColorTables[i] == table)
            index = i;
    }
    if (ImGui::Combo("Color table", &index, items.data(), items.size())) {
        table = gColorTables[index];
        changed = true;
    }
    ImGui::SameLine(); ImGui::ShowHelpMarker("Change the color table (c / shift+c)");

    int size = hashSize;
    if (ImGui::SliderInt("Table size", &size, 2, 4096) && size >= 2) {
        hashSize = size;
        changed = true;
    }

    if (changed)
        rebuild();
    return changed;
}

bool Colormap::parseArg(const std::string& arg)
{
    if (startswith(arg, "c:cmap:")) {
        return setTable(arg.substr(7));
    }
    if (startswith(arg, "c:size:")) {
        int size = 0;
        if (sscanf(arg.c_str(), "c:size:%d", &size) != 1 || size < 2)
            return false;
        return setHashSize(size);
    }
    return false;
}

TEST_CASE("Colormap::getRGBArray")
{
    loadDefaultColorTables();
    Colormap cmap("gray", 256);

    SUBCASE("mono index through the table")
    {
        IndexArray idx(3, 1, 1);
        idx.data = { 0, 128, 300 };
        RGBArray out = cmap.getRGBArray(idx, "RGBA", "M");
        REQUIRE(out.c == 4);
        CHECK(out.at(0, 0, 0) == 0);
        CHECK(out.at(1, 0, 1) == 128);
        CHECK(out.at(2, 0, 2) == 255);
        CHECK(out.at(0, 0, 3) == 255);
        CHECK(out.at(1, 0, 3) == 255);
    }

    SUBCASE("color index follows the image order")
    {
        CHECK(cmap.setTable("heat"));
        IndexArray idx(1, 1, 3);
        idx.data = { 0, 255, 255 }; // stored as B, G, R
        RGBArray out = cmap.getRGBArray(idx, "BGR", "BGRA");
        CHECK(out.at(0, 0, 2) == 255); // R from heat's red at the top
        CHECK(out.at(0, 0, 1) == 255);
        CHECK(out.at(0, 0, 0) == 0); // B from heat's blue at the bottom
    }

    SUBCASE("table changes rebuild the lookup")
    {
        CHECK(cmap.lookup(255)[0] == 255);
        CHECK(cmap.setTable("cool"));
        CHECK(cmap.lookup(0)[0] == 0);
        CHECK(cmap.lookup(0)[1] == 255);
        CHECK(!cmap.setTable("does-not-exist"));
        CHECK(cmap.getTableName() == "cool");
    }
}

TEST_CASE("Colormap::parseArg")
{
    loadDefaultColorTables();
    Colormap c;

    SUBCASE("c:cmap")
    {
        CHECK(c.getTableName() == "gray");
        CHECK(c.parseArg("c:cmap:rainbow"));
        CHECK(c.getTableName() == "rainbow");
        CHECK(!c.parseArg("c:cmap:nope"));
        CHECK(c.getTableName() == "rainbow");
    }

    SUBCASE("c:size")
    {
        CHECK(c.parseArg("c:size:16"));
        CHECK(c.getHashSize() == 16);
        CHECK(c.lookup(15)[0] == 255);
        CHECK(!c.parseArg("c:size:1"));
        CHECK(c.getHashSize() == 16);
    }

    SUBCASE("cycling")
    {
        c.setTable(gColorTables.back()->name);
        c.nextTable();
        CHECK(c.table == gColorTables[0]);
        c.previousTable();
        CHECK(c.table == gColorTables.back());
    }
}
