#include <memory>
#include <string>
#include <vector>

#include "globals.hpp"

std::vector<std::shared_ptr<View>> gViews;
std::shared_ptr<Canvas> gCanvas;

bool gVerbose = false;
bool gDefaultOptimize = true;
float gDefaultScale = 1.f;
float gAutoCutsPct = 0.999f;
size_t gColormapSize = 256;
std::string gDefaultInterpolation = "basic";
std::string gDefaultAutoCuts = "histogram";
std::string gDefaultColormap = "gray";
std::string gRGBOrder = "RGBA";

bool gShowSettings = true;
bool gShowHelp = false;
