#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <imgui.h>

#include "RenderContext.hpp"

// Strokes object outlines into an ImGui draw list, on top of the view texture.
class ImGuiRenderer : public Renderer {
public:
    ImDrawList* drawList;
    // screen position of the canvas pixel (0, 0)
    ImVec2 origin;

    ImGuiRenderer();

    std::unique_ptr<RenderContext> setupCr(const ImageObject& obj) override;
};

// false if the color name is unknown
bool outlineColor(const std::string& name, float alpha, ImU32& out);
// pieces of the segment a-b drawn by a dashed line
std::vector<std::pair<ImVec2, ImVec2>> dashSegments(ImVec2 a, ImVec2 b, float on, float off);
