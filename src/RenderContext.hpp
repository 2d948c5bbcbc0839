#pragma once

#include <memory>
#include <vector>

#include <imgui.h>

struct ImageObject;

// Outline drawing in canvas pixel coordinates.
class RenderContext {
public:
    virtual ~RenderContext() = default;

    virtual void drawPolygon(const std::vector<ImVec2>& cpoints) = 0;
    virtual void drawCap(ImVec2 cpoint, float radius) = 0;
};

class Renderer {
public:
    virtual ~Renderer() = default;

    // the returned context strokes with the object's color, alpha, linewidth and linestyle
    virtual std::unique_ptr<RenderContext> setupCr(const ImageObject& obj) = 0;
};
