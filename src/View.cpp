#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <doctest.h>
#define IMGUI_DEFINE_MATH_OPERATORS
#include <imgui.h>

#include "AutoCuts.hpp"
#include "Canvas.hpp"
#include "Colormap.hpp"
#include "Image.hpp"
#include "ImageObject.hpp"
#include "Interpolation.hpp"
#include "View.hpp"
#include "globals.hpp"
#include "imgui_custom.hpp"
#include "strutils.hpp"

#define NO_REDRAW (std::numeric_limits<int>::max())

View::View(std::shared_ptr<Canvas> canvas)
    : canvas(std::move(canvas))
{
    static int id = 0;
    id++;
    ID = "View " + std::to_string(id);

    windowSize = ImVec2(0, 0);
    scale = ImVec2(gDefaultScale, gDefaultScale);
    pan = ImVec2(0, 0);
    dataOffset = .5f;
    rgbOrder = gRGBOrder;
    interpolation = gDefaultInterpolation;
    cuts = std::make_pair(0.f, 255.f);
    colormap = std::make_shared<Colormap>(gDefaultColormap, gColormapSize);
    autocuts = AutoCuts::create(gDefaultAutoCuts);
    if (!autocuts) {
        fprintf(stderr, "unknown autocuts method '%s', using 'minmax'\n", gDefaultAutoCuts.c_str());
        autocuts = std::make_shared<MinMaxCuts>();
    }
    background = { 0, 0, 0, 255 };
    needsRedraw = true;
    pendingWhence = 0;

    if (this->canvas)
        this->canvas->attachViewer(this);
}

View::~View()
{
    if (canvas)
        canvas->detachViewer(*this);
}

bool View::operator==(const View& other)
{
    return other.ID == ID;
}

void View::resize(int w, int h)
{
    windowSize = ImVec2(w, h);
    framebuffer = RGBArray(std::max(w, 0), std::max(h, 0), rgbOrder.size());
    redraw(0);
}

void View::changeZoom(float zoom)
{
    if (!std::isfinite(zoom) || zoom <= 0.f)
        return;
    scale = ImVec2(zoom, zoom);
    redraw(0);
}

void View::setPan(ImVec2 p)
{
    pan = p;
    redraw(0);
}

void View::setCuts(float low, float high)
{
    cuts = std::make_pair(low, high);
    redraw(1);
}

void View::setInterpolation(const std::string& method)
{
    interpolation = method;
    redraw(0);
}

void View::setRGBOrder(const std::string& order)
{
    rgbOrder = order;
    framebuffer = RGBArray(framebuffer.w, framebuffer.h, rgbOrder.size());
    redraw(2);
}

void View::autoCuts(const Image& image)
{
    if (!autocuts)
        return;
    cuts = autocuts->calcCutLevels(image);
    redraw(1);
}

void View::redraw(int whence)
{
    needsRedraw = true;
    pendingWhence = std::min(pendingWhence, whence);
}

void View::reorderLayers()
{
    if (canvas)
        canvas->sortByZorder();
}

bool View::render()
{
    if (!needsRedraw)
        return false;

    for (size_t d = 0; d < rgbOrder.size() && d < framebuffer.c; d++) {
        uint8_t value;
        switch (rgbOrder[d]) {
        case 'G':
            value = background[1];
            break;
        case 'B':
            value = background[2];
            break;
        case 'A':
            value = background[3];
            break;
        default:
            value = background[0];
            break;
        }
        for (size_t i = 0; i < framebuffer.w * framebuffer.h; i++)
            framebuffer.data[i * framebuffer.c + d] = value;
    }

    int whence = pendingWhence;
    needsRedraw = false;
    pendingWhence = NO_REDRAW;

    if (canvas)
        canvas->drawImages(*this, framebuffer, whence);
    if (gVerbose)
        fprintf(stderr, "%s: rendered with whence %d\n", ID.c_str(), whence);
    return true;
}

ImVec2 View::canvasToData(ImVec2 pt) const
{
    return (pt - windowSize / 2.f) / scale + pan + ImVec2(dataOffset, dataOffset);
}

ImVec2 View::dataToCanvas(ImVec2 pt) const
{
    return windowSize / 2.f + (pt - (pan + ImVec2(dataOffset, dataOffset))) * scale;
}

std::array<ImVec2, 4> View::getDrawRect() const
{
    return {
        canvasToData(ImVec2(0, 0)),
        canvasToData(ImVec2(windowSize.x, 0)),
        canvasToData(windowSize),
        canvasToData(ImVec2(0, windowSize.y)),
    };
}

void View::displaySettings()
{
    float zoom = scale.x;
    if (ImGui::DragFloat("Zoom", &zoom, .01f, 0.01f, 300.f, "%g"))
        changeZoom(zoom);
    ImGui::SameLine(); ImGui::ShowHelpMarker("Change the zoom (i or o)");

    ImVec2 p = pan;
    if (ImGui::DragFloat2("Pan", &p.x))
        setPan(p);
    ImGui::SameLine(); ImGui::ShowHelpMarker("Data point at the center of the view (arrows)");

    const auto& methods = getInterpolationMethods();
    std::vector<const char*> items(methods.size());
    int index = 0;
    for (size_t i = 0; i < methods.size(); i++) {
        items[i] = methods[i].c_str();
        if (methods[i] == interpolation)
            index = i;
    }
    if (ImGui::Combo("Interpolation", &index, items.data(), items.size()))
        setInterpolation(methods[index]);

    float c[2] = { cuts.first, cuts.second };
    if (ImGui::DragFloat2("Cut levels", c))
        setCuts(c[0], c[1]);
    ImGui::SameLine(); ImGui::ShowHelpMarker("Low and high cut levels (a to compute them)");

    if (colormap) {
        size_t size = colormap->getHashSize();
        if (colormap->displaySettings())
            redraw(colormap->getHashSize() == size ? 2 : 1);
    }
}

bool View::parseArg(const std::string& arg)
{
    if (startswith(arg, "v:zoom:")) {
        float z = 1.f;
        if (sscanf(arg.c_str(), "v:zoom:%f", &z) == 1 && std::isfinite(z) && z > 0.f) {
            changeZoom(z);
            return true;
        }
    } else if (startswith(arg, "v:pan:")) {
        float x = 0.f;
        float y = 0.f;
        if (sscanf(arg.c_str(), "v:pan:%f,%f", &x, &y) == 2) {
            setPan(ImVec2(x, y));
            return true;
        }
    } else if (startswith(arg, "v:cuts:")) {
        float lo = 0.f;
        float hi = 0.f;
        if (sscanf(arg.c_str(), "v:cuts:%f,%f", &lo, &hi) == 2) {
            setCuts(lo, hi);
            return true;
        }
    } else if (startswith(arg, "v:interp:")) {
        std::string method = arg.substr(9);
        if (isInterpolationMethod(method)) {
            setInterpolation(method);
            return true;
        }
    }
    return false;
}

TEST_CASE("View::parseArg") {
    View v;

    SUBCASE("v:zoom") {
        CHECK(v.scale.x == doctest::Approx(1.f));
        CHECK(v.parseArg("v:zoom:20"));
        CHECK(v.scale.x == doctest::Approx(20.f));
        CHECK(v.scale.y == doctest::Approx(20.f));
        SUBCASE("v:zoom invalid") {
            CHECK(!v.parseArg("v:zoom:aa"));
            CHECK(!v.parseArg("v:zoom:0"));
            CHECK(v.scale.x == doctest::Approx(20.f));
        }
    }

    SUBCASE("v:pan") {
        CHECK(v.parseArg("v:pan:2,-3.5"));
        CHECK(v.pan.x == doctest::Approx(2.f));
        CHECK(v.pan.y == doctest::Approx(-3.5f));
        SUBCASE("v:pan invalid") {
            CHECK(!v.parseArg("v:pan:1"));
            CHECK(v.pan.x == doctest::Approx(2.f));
        }
    }

    SUBCASE("v:cuts") {
        CHECK(v.parseArg("v:cuts:10,200"));
        CHECK(v.cuts.first == 10.f);
        CHECK(v.cuts.second == 200.f);
    }

    SUBCASE("v:interp") {
        CHECK(v.parseArg("v:interp:area"));
        CHECK(v.interpolation == "area");
        CHECK(!v.parseArg("v:interp:lanczos"));
        CHECK(v.interpolation == "area");
    }

    CHECK(!v.parseArg("v:unknown"));
}

TEST_CASE("View coordinates")
{
    View v;
    v.resize(200, 100);
    v.pan = ImVec2(10, 20);
    v.scale = ImVec2(2, 4);

    ImVec2 c = v.dataToCanvas(ImVec2(10.5f, 20.5f));
    CHECK(c.x == doctest::Approx(100.f));
    CHECK(c.y == doctest::Approx(50.f));
    ImVec2 d = v.canvasToData(ImVec2(0, 0));
    CHECK(d.x == doctest::Approx(-39.5f));
    CHECK(d.y == doctest::Approx(8.f));

    auto rect = v.getDrawRect();
    CHECK(rect[2].x == doctest::Approx(60.5f));
    CHECK(rect[2].y == doctest::Approx(33.f));
}

TEST_CASE("View redraw coalescing")
{
    View v;
    v.resize(8, 8);
    CHECK(v.needsRender());
    CHECK(v.render());
    CHECK(!v.needsRender());
    CHECK(!v.render());

    v.redraw(2);
    v.redraw(3);
    CHECK(v.getPendingWhence() == 2);
    v.setCuts(0, 1);
    CHECK(v.getPendingWhence() == 1);
    v.redraw(2);
    CHECK(v.getPendingWhence() == 1);
    CHECK(v.render());
    CHECK(!v.needsRender());

    CHECK(v.framebuffer.at(3, 3, 0) == 0);
    CHECK(v.framebuffer.at(3, 3, 3) == 255);
}

TEST_CASE("View::autoCuts")
{
    std::vector<float> px = { -5.f, 0.f, 3.f, 12.f };
    Image img(px, 2, 2, "M");
    View v;
    v.autocuts = std::make_shared<MinMaxCuts>();
    v.render();
    v.autoCuts(img);
    CHECK(v.cuts.first == -5.f);
    CHECK(v.cuts.second == 12.f);
    CHECK(v.getPendingWhence() == 1);
}
