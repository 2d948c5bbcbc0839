#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>

#include <doctest.h>

#include "Params.hpp"

bool parseFloat(const std::string& str, float& out)
{
    if (str.empty())
        return false;
    char* end = nullptr;
    float v = std::strtof(str.c_str(), &end);
    if (*end != '\0' || !std::isfinite(v))
        return false;
    out = v;
    return true;
}

bool parseInt(const std::string& str, int& out)
{
    if (str.empty())
        return false;
    char* end = nullptr;
    long v = std::strtol(str.c_str(), &end, 10);
    if (*end != '\0')
        return false;
    out = (int)v;
    return true;
}

bool parseBool(const std::string& str, bool& out)
{
    if (str == "true" || str == "1" || str == "yes") {
        out = true;
        return true;
    }
    if (str == "false" || str == "0" || str == "no") {
        out = false;
        return true;
    }
    return false;
}

bool parseColor(const std::string& str, std::array<float, 3>& out)
{
    static const std::map<std::string, std::array<float, 3>> named = {
        { "black", { 0.f, 0.f, 0.f } },
        { "white", { 1.f, 1.f, 1.f } },
        { "red", { 1.f, 0.f, 0.f } },
        { "green", { 0.f, .5f, 0.f } },
        { "blue", { 0.f, 0.f, 1.f } },
        { "yellow", { 1.f, 1.f, 0.f } },
        { "cyan", { 0.f, 1.f, 1.f } },
        { "magenta", { 1.f, 0.f, 1.f } },
        { "gray", { .5f, .5f, .5f } },
        { "lightgreen", { .565f, .933f, .565f } },
    };

    auto it = named.find(str);
    if (it != named.end()) {
        out = it->second;
        return true;
    }

    unsigned r, g, b;
    char trailing;
    if (str.size() == 7 && str[0] == '#'
        && sscanf(str.c_str(), "#%2x%2x%2x%c", &r, &g, &b, &trailing) == 3) {
        out = { r / 255.f, g / 255.f, b / 255.f };
        return true;
    }
    return false;
}

std::string formatFloat(float value)
{
    char buf[64];
    snprintf(buf, sizeof(buf), "%g", value);
    return buf;
}

std::string formatBool(bool value)
{
    return value ? "true" : "false";
}

std::string formatColor(const std::array<float, 3>& rgb)
{
    char buf[8];
    int c[3];
    for (int i = 0; i < 3; i++)
        c[i] = (int)std::lround(std::min(std::max(rgb[i], 0.f), 1.f) * 255.f);
    snprintf(buf, sizeof(buf), "#%02x%02x%02x", c[0], c[1], c[2]);
    return buf;
}

bool Param::accepts(const std::string& value) const
{
    switch (type) {
    case Float: {
        float v;
        if (!parseFloat(value, v))
            return false;
        return !hasRange || (v >= min && v <= max);
    }
    case Int: {
        int v;
        if (!parseInt(value, v))
            return false;
        return !hasRange || (v >= min && v <= max);
    }
    case Bool: {
        bool v;
        return parseBool(value, v);
    }
    case Color: {
        std::array<float, 3> v;
        return parseColor(value, v);
    }
    case String:
        return valid.empty() || std::find(valid.begin(), valid.end(), value) != valid.end();
    }
    return false;
}

const Param* findParam(const std::vector<Param>& params, const std::string& name)
{
    for (const auto& p : params) {
        if (p.name == name)
            return &p;
    }
    return nullptr;
}

TEST_CASE("Param::accepts")
{
    Param linewidth { "linewidth", Param::Int, "0", true, 0, 20, {}, "Width of outline" };
    CHECK(linewidth.accepts("0"));
    CHECK(linewidth.accepts("20"));
    CHECK(!linewidth.accepts("21"));
    CHECK(!linewidth.accepts("-1"));
    CHECK(!linewidth.accepts("2.5"));
    CHECK(!linewidth.accepts(""));

    Param linestyle { "linestyle", Param::String, "solid", false, 0, 0, { "solid", "dash" }, "" };
    CHECK(linestyle.accepts("dash"));
    CHECK(!linestyle.accepts("dotted"));

    Param alpha { "alpha", Param::Float, "1", true, 0, 1, {}, "" };
    CHECK(alpha.accepts(".5"));
    CHECK(!alpha.accepts("1.5"));
    CHECK(!alpha.accepts("nan"));
    CHECK(!alpha.accepts("abc"));

    Param flag { "showcap", Param::Bool, "false", false, 0, 0, {}, "" };
    CHECK(flag.accepts("true"));
    CHECK(!flag.accepts("maybe"));
}

TEST_CASE("parseColor")
{
    std::array<float, 3> c;
    CHECK(parseColor("red", c));
    CHECK(c[0] == 1.f);
    CHECK(parseColor("#00ff80", c));
    CHECK(c[0] == 0.f);
    CHECK(c[1] == 1.f);
    CHECK(c[2] == doctest::Approx(128 / 255.f));
    CHECK(!parseColor("#00ff8", c));
    CHECK(!parseColor("#00ff80x", c));
    CHECK(!parseColor("chartreuse", c));

    CHECK(formatColor({ 0.f, 1.f, 128 / 255.f }) == "#00ff80");
    CHECK(formatColor({ 2.f, -1.f, 0.f }) == "#ff0000");
}
