#pragma once

#include <array>
#include <string>
#include <vector>

// Description of one user-settable property of a canvas object.
struct Param {
    enum Type {
        Float,
        Int,
        Bool,
        String,
        Color,
    };

    std::string name;
    Type type;
    std::string defaultValue;
    bool hasRange;
    float min, max;
    // allowed values for strings, empty for anything
    std::vector<std::string> valid;
    std::string description;

    bool accepts(const std::string& value) const;
};

const Param* findParam(const std::vector<Param>& params, const std::string& name);

bool parseFloat(const std::string& str, float& out);
bool parseInt(const std::string& str, int& out);
bool parseBool(const std::string& str, bool& out);
// named colors and #rrggbb, components in [0, 1]
bool parseColor(const std::string& str, std::array<float, 3>& out);

std::string formatFloat(float value);
std::string formatBool(bool value);
std::string formatColor(const std::array<float, 3>& rgb);
