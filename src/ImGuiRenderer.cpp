#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>

#include <doctest.h>
#define IMGUI_DEFINE_MATH_OPERATORS
#include <imgui.h>

#include "ImGuiRenderer.hpp"
#include "ImageObject.hpp"
#include "Params.hpp"

#define DASH_ON 6.f
#define DASH_OFF 4.f

class ImGuiRenderContext : public RenderContext {
    ImDrawList* drawList;
    ImVec2 origin;
    ImU32 color;
    float thickness;
    bool dashed;

public:
    ImGuiRenderContext(ImDrawList* drawList, ImVec2 origin, ImU32 color, float thickness, bool dashed)
        : drawList(drawList)
        , origin(origin)
        , color(color)
        , thickness(thickness)
        , dashed(dashed)
    {
    }

    void drawPolygon(const std::vector<ImVec2>& cpoints) override
    {
        if (!drawList || cpoints.size() < 2 || thickness <= 0.f)
            return;

        std::vector<ImVec2> pts(cpoints.size());
        for (size_t i = 0; i < cpoints.size(); i++)
            pts[i] = origin + cpoints[i];

        if (!dashed) {
            drawList->AddPolyline(pts.data(), pts.size(), color, ImDrawFlags_Closed, thickness);
            return;
        }
        for (size_t i = 0; i < pts.size(); i++) {
            ImVec2 a = pts[i];
            ImVec2 b = pts[(i + 1) % pts.size()];
            for (const auto& s : dashSegments(a, b, DASH_ON, DASH_OFF))
                drawList->AddLine(s.first, s.second, color, thickness);
        }
    }

    void drawCap(ImVec2 cpoint, float radius) override
    {
        if (!drawList)
            return;
        drawList->AddCircle(origin + cpoint, radius, color, 0, std::max(thickness, 1.f));
    }
};

ImGuiRenderer::ImGuiRenderer()
    : drawList(nullptr)
    , origin(0, 0)
{
}

std::unique_ptr<RenderContext> ImGuiRenderer::setupCr(const ImageObject& obj)
{
    ImU32 color;
    if (!outlineColor(obj.color, obj.alpha, color)) {
        fprintf(stderr, "%s: unknown color '%s'\n", obj.ID.c_str(), obj.color.c_str());
        outlineColor("lightgreen", obj.alpha, color);
    }
    return std::make_unique<ImGuiRenderContext>(drawList, origin, color, (float)obj.linewidth,
                                                obj.linestyle == "dash");
}

bool outlineColor(const std::string& name, float alpha, ImU32& out)
{
    std::array<float, 3> rgb;
    if (!parseColor(name, rgb))
        return false;
    alpha = std::min(std::max(alpha, 0.f), 1.f);
    out = ImGui::ColorConvertFloat4ToU32(ImVec4(rgb[0], rgb[1], rgb[2], alpha));
    return true;
}

std::vector<std::pair<ImVec2, ImVec2>> dashSegments(ImVec2 a, ImVec2 b, float on, float off)
{
    std::vector<std::pair<ImVec2, ImVec2>> segments;
    ImVec2 d = b - a;
    float length = std::sqrt(d.x * d.x + d.y * d.y);
    if (length <= 0.f || on <= 0.f)
        return segments;
    ImVec2 u = d / length;
    for (float t = 0.f; t < length; t += on + off) {
        float end = std::min(t + on, length);
        segments.emplace_back(a + u * t, a + u * end);
    }
    return segments;
}

TEST_CASE("outlineColor")
{
    ImU32 c = 0;
    CHECK(outlineColor("red", 1.f, c));
    CHECK(c == IM_COL32(255, 0, 0, 255));
    CHECK(outlineColor("#0000ff", 0.f, c));
    CHECK(c == IM_COL32(0, 0, 255, 0));
    CHECK(!outlineColor("chartreuse-ish", 1.f, c));
}

TEST_CASE("dashSegments")
{
    auto s = dashSegments(ImVec2(0, 0), ImVec2(25, 0), 6, 4);
    REQUIRE(s.size() == 3);
    CHECK(s[0].second.x == doctest::Approx(6.f));
    CHECK(s[1].first.x == doctest::Approx(10.f));
    CHECK(s[2].second.x == doctest::Approx(25.f));

    CHECK(dashSegments(ImVec2(3, 3), ImVec2(3, 3), 6, 4).empty());
}
