#pragma once

#include <array>
#include <memory>
#include <string>
#include <utility>

#include <imgui.h>

struct Colormap;
class AutoCuts;
class Renderer;

// What an image object needs from the viewer drawing it.
// Data coordinates have their row 0 at the top, like canvas coordinates.
struct Viewer {
    // stable key of the per-viewer render caches
    std::string ID;
    // expires with the viewer, render caches only hold it weakly
    std::shared_ptr<Viewer*> handle;

    Viewer()
        : handle(std::make_shared<Viewer*>(this))
    {
    }
    virtual ~Viewer() = default;

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    // corners of the visible area, in data coordinates
    virtual std::array<ImVec2, 4> getDrawRect() const = 0;
    virtual ImVec2 getScaleXY() const = 0;
    virtual ImVec2 getPan() const = 0;
    virtual float getDataOffset() const = 0;
    virtual const std::string& getRGBOrder() const = 0;
    virtual std::shared_ptr<Colormap> getRGBMap() const = 0;
    virtual const std::string& getInterpolation() const = 0;
    virtual std::shared_ptr<AutoCuts> getAutoCuts() const = 0;
    virtual std::pair<float, float> getCuts() const = 0;
    virtual ImVec2 dataToCanvas(ImVec2 pt) const = 0;
    virtual Renderer* getRenderer() const = 0;

    // whence 0 recomputes everything, 1 starts at the cut levels,
    // 2 at the color mapping, 3 only composites again
    virtual void redraw(int whence) = 0;
    virtual void reorderLayers() = 0;
};
