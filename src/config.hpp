#pragma once

#include <kaguya/kaguya.hpp>
#include <string>

namespace config {

// evaluates the built-in defaults, then $GINGA_CONFIG or ~/.gingarc
void load(bool withUserFile = true);

float get_float(const std::string& name);
bool get_bool(const std::string& name);
int get_int(const std::string& name);
std::string get_string(const std::string& name);
void load_colormaps();
// copies the settings into the globals, returns false if one is invalid
bool apply_globals();

kaguya::State& get_lua();

}
