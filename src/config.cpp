#include <array>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <doctest.h>
#include <kaguya/kaguya.hpp>

#include "AutoCuts.hpp"
#include "Interpolation.hpp"
#include "colormaps.hpp"
#include "config.hpp"
#include "globals.hpp"
#include "lua.hpp"

static std::unique_ptr<lua_State, decltype(lua_close)*> L = { nullptr, lua_close };
static std::unique_ptr<kaguya::State> state = nullptr;

static const char* defaults = R"lua(
SCALE = 1.0
WINDOW_WIDTH = 1024
WINDOW_HEIGHT = 768
INTERPOLATION = 'basic'
AUTOCUTS = 'histogram'
AUTOCUTS_PCT = 0.999
COLORMAP = 'gray'
COLORMAP_SIZE = 256
RGB_ORDER = 'RGBA'
OPTIMIZE = true
VERBOSE = false

-- name = { {r, g, b}, ... } with components in [0, 1]
COLORMAPS = {
    ['gray-inverted'] = { {1, 1, 1}, {0, 0, 0} },
}
)lua";

static std::vector<std::string> colormapNames()
{
    std::vector<std::string> names;
    for (const auto& t : gColorTables)
        names.push_back(t->name);
    return names;
}

static std::string userConfigPath()
{
    if (const char* path = std::getenv("GINGA_CONFIG"))
        return path;
    if (const char* home = std::getenv("HOME"))
        return std::string(home) + "/.gingarc";
    return "";
}

void config::load(bool withUserFile)
{
    L = std::unique_ptr<lua_State, decltype(lua_close)*>({ luaL_newstate(), lua_close });
    if (!L) {
        throw std::runtime_error("cannot create a lua state");
    }
    luaL_openlibs(L.get());

    state = std::make_unique<kaguya::State>(L.get());
    state->setErrorHandler([](int status, const char* msg) {
        fprintf(stderr, "lua error (%d): %s\n", status, msg);
    });

    (*state)["interpolation_methods"] = getInterpolationMethods;
    (*state)["autocuts_methods"] = AutoCuts::getMethods;
    (*state)["colormap_names"] = colormapNames;

    if (!state->dostring(defaults)) {
        throw std::runtime_error("cannot evaluate the default configuration");
    }

    if (!withUserFile)
        return;
    std::string path = userConfigPath();
    if (path.empty())
        return;
    FILE* f = fopen(path.c_str(), "r");
    if (!f)
        return;
    fclose(f);
    if (!state->dofile(path)) {
        fprintf(stderr, "error while loading '%s', using the defaults\n", path.c_str());
        state->dostring(defaults);
    } else if (gVerbose || get_bool("VERBOSE")) {
        fprintf(stderr, "loaded configuration '%s'\n", path.c_str());
    }
}

float config::get_float(const std::string& name)
{
    return (*state)[name.c_str()];
}

bool config::get_bool(const std::string& name)
{
    return (*state)[name.c_str()];
}

int config::get_int(const std::string& name)
{
    return (*state)[name.c_str()];
}

std::string config::get_string(const std::string& name)
{
    return (*state)[name.c_str()];
}

void config::load_colormaps()
{
    std::map<std::string, std::vector<std::vector<float>>> tables = (*state)["COLORMAPS"];
    for (const auto& t : tables) {
        std::vector<std::array<float, 3>> stops;
        bool valid = true;
        for (const auto& s : t.second) {
            if (s.size() != 3) {
                valid = false;
                break;
            }
            stops.push_back({ s[0], s[1], s[2] });
        }
        if (!valid || !loadColorTable(t.first, stops)) {
            fprintf(stderr, "invalid color table '%s' in COLORMAPS\n", t.first.c_str());
        }
    }
}

bool config::apply_globals()
{
    bool ok = true;

    float scale = get_float("SCALE");
    if (scale > 0.f) {
        gDefaultScale = scale;
    } else {
        fprintf(stderr, "SCALE must be positive\n");
        ok = false;
    }

    std::string interpolation = get_string("INTERPOLATION");
    if (isInterpolationMethod(interpolation)) {
        gDefaultInterpolation = interpolation;
    } else {
        fprintf(stderr, "unknown INTERPOLATION '%s'\n", interpolation.c_str());
        ok = false;
    }

    float pct = get_float("AUTOCUTS_PCT");
    if (pct > 0.5f && pct <= 1.f) {
        gAutoCutsPct = pct;
    } else {
        fprintf(stderr, "AUTOCUTS_PCT must be in (0.5, 1]\n");
        ok = false;
    }

    std::string autocuts = get_string("AUTOCUTS");
    if (AutoCuts::create(autocuts)) {
        gDefaultAutoCuts = autocuts;
    } else {
        fprintf(stderr, "unknown AUTOCUTS '%s'\n", autocuts.c_str());
        ok = false;
    }

    int size = get_int("COLORMAP_SIZE");
    if (size >= 2) {
        gColormapSize = size;
    } else {
        fprintf(stderr, "COLORMAP_SIZE must be at least 2\n");
        ok = false;
    }

    gDefaultColormap = get_string("COLORMAP");
    std::string order = get_string("RGB_ORDER");
    if (order == "RGBA" || order == "BGRA" || order == "RGB" || order == "BGR") {
        gRGBOrder = order;
    } else {
        fprintf(stderr, "unsupported RGB_ORDER '%s'\n", order.c_str());
        ok = false;
    }
    gDefaultOptimize = get_bool("OPTIMIZE");
    gVerbose = get_bool("VERBOSE");
    return ok;
}

kaguya::State& config::get_lua()
{
    return *state;
}

TEST_CASE("config")
{
    config::load(false);

    SUBCASE("defaults")
    {
        CHECK(config::get_float("SCALE") == 1.f);
        CHECK(config::get_int("WINDOW_WIDTH") == 1024);
        CHECK(config::get_int("COLORMAP_SIZE") == 256);
        CHECK(config::get_string("INTERPOLATION") == "basic");
        CHECK(config::get_string("AUTOCUTS") == "histogram");
        CHECK(config::get_bool("OPTIMIZE"));
        CHECK(!config::get_bool("VERBOSE"));
        CHECK(config::apply_globals());
        CHECK(gDefaultInterpolation == "basic");
        CHECK(gAutoCutsPct == doctest::Approx(0.999f));
    }

    SUBCASE("lua functions")
    {
        auto& lua = config::get_lua();
        CHECK(lua.dostring("N_INTERP = #interpolation_methods()"));
        CHECK(config::get_int("N_INTERP") == 3);
        CHECK(lua.dostring("N_AUTOCUTS = #autocuts_methods()"));
        CHECK(config::get_int("N_AUTOCUTS") == 2);
    }

    SUBCASE("custom color tables")
    {
        loadDefaultColorTables();
        auto& lua = config::get_lua();
        CHECK(lua.dostring("COLORMAPS.stripes = { {0, 0, 0}, {1, 0, 0}, {0, 0, 0} }"));
        CHECK(lua.dostring("COLORMAPS.broken = { {0, 0} }"));
        config::load_colormaps();
        REQUIRE(getColorTable("stripes"));
        CHECK(getColorTable("stripes")->sample(.5f)[0] == doctest::Approx(1.f));
        CHECK(getColorTable("gray-inverted"));
        CHECK(getColorTable("broken") == nullptr);
        CHECK(lua.dostring("N_CMAPS = #colormap_names()"));
        CHECK(config::get_int("N_CMAPS") == (int)gColorTables.size());
    }

    SUBCASE("invalid settings are reported")
    {
        auto& lua = config::get_lua();
        CHECK(lua.dostring("INTERPOLATION = 'lanczos'; COLORMAP_SIZE = 1"));
        std::string before = gDefaultInterpolation;
        CHECK(!config::apply_globals());
        CHECK(gDefaultInterpolation == before);
        config::load(false);
        CHECK(config::apply_globals());
    }
}
