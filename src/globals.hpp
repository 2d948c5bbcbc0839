#pragma once

#include <memory>
#include <string>
#include <vector>

struct View;
struct Canvas;

extern std::vector<std::shared_ptr<View>> gViews;
extern std::shared_ptr<Canvas> gCanvas;

extern bool gVerbose;
extern bool gDefaultOptimize;
extern float gDefaultScale;
extern float gAutoCutsPct;
extern size_t gColormapSize;
extern std::string gDefaultInterpolation;
extern std::string gDefaultAutoCuts;
extern std::string gDefaultColormap;
extern std::string gRGBOrder;

extern bool gShowSettings;
extern bool gShowHelp;
