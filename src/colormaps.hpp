#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>

// Named color ramp, evenly spaced RGB stops with components in [0, 1].
struct ColorTable {
    std::string name;
    std::vector<std::array<float, 3>> stops;

    std::array<float, 3> sample(float t) const;
};

extern std::vector<std::shared_ptr<ColorTable>> gColorTables;

bool loadColorTable(const std::string& name, const std::vector<std::array<float, 3>>& stops);
std::shared_ptr<ColorTable> getColorTable(const std::string& name);
void loadDefaultColorTables();
