#include <array>
#include <cstdio>
#include <string>
#include <vector>

#include <imgui.h>

#include "ImageObject.hpp"
#include "ParamEditor.hpp"
#include "Params.hpp"
#include "imgui_custom.hpp"

static bool editParam(ImageObject& obj, const Param& param)
{
    std::string value;
    if (!obj.getParam(param.name, value))
        return false;

    const char* label = param.name.c_str();
    std::string newValue;
    bool changed = false;

    switch (param.type) {
    case Param::Float: {
        float f = 0.f;
        parseFloat(value, f);
        if (param.hasRange)
            changed = ImGui::SliderFloat(label, &f, param.min, param.max, "%g");
        else
            changed = ImGui::DragFloat(label, &f, .1f, 0.f, 0.f, "%g");
        newValue = formatFloat(f);
        break;
    }
    case Param::Int: {
        int i = 0;
        parseInt(value, i);
        if (param.hasRange)
            changed = ImGui::SliderInt(label, &i, (int)param.min, (int)param.max);
        else
            changed = ImGui::InputInt(label, &i);
        newValue = std::to_string(i);
        break;
    }
    case Param::Bool: {
        bool b = false;
        parseBool(value, b);
        changed = ImGui::Checkbox(label, &b);
        newValue = formatBool(b);
        break;
    }
    case Param::Color: {
        std::array<float, 3> rgb = { 0.f, 0.f, 0.f };
        parseColor(value, rgb);
        changed = ImGui::ColorEdit3(label, rgb.data(), ImGuiColorEditFlags_NoInputs);
        newValue = formatColor(rgb);
        break;
    }
    case Param::String: {
        if (param.valid.empty()) {
            char buf[256];
            snprintf(buf, sizeof(buf), "%s", value.c_str());
            changed = ImGui::InputText(label, buf, sizeof(buf), ImGuiInputTextFlags_EnterReturnsTrue);
            newValue = buf;
            break;
        }
        int index = 0;
        std::vector<const char*> items(param.valid.size());
        for (size_t i = 0; i < param.valid.size(); i++) {
            // the empty choice means the viewer's value
            items[i] = param.valid[i].empty() ? "(viewer)" : param.valid[i].c_str();
            if (param.valid[i] == value)
                index = i;
        }
        changed = ImGui::Combo(label, &index, items.data(), items.size());
        newValue = param.valid[index];
        break;
    }
    }

    if (!param.description.empty()) {
        ImGui::SameLine(); ImGui::ShowHelpMarker(param.description.c_str());
    }

    if (!changed || newValue == value)
        return false;
    if (!obj.setParam(param.name, newValue)) {
        fprintf(stderr, "%s: invalid value '%s' for '%s'\n", obj.ID.c_str(),
                newValue.c_str(), param.name.c_str());
        return false;
    }
    return true;
}

bool displayParams(ImageObject& obj)
{
    bool changed = false;
    ImGui::PushID(obj.ID.c_str());
    ImGui::Text("%s (%s)", obj.ID.c_str(), obj.getKind().c_str());
    for (const auto& param : obj.getParams()) {
        changed |= editParam(obj, param);
    }
    ImGui::PopID();
    return changed;
}
