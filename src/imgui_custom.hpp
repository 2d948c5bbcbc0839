#pragma once

#include <imgui.h>

namespace ImGui {

    bool BufferingBar(const char* label, float value,
                      const ImVec2& size_arg, const ImU32& bg_col,
                      const ImU32& fg_col);

    void ShowHelpMarker(const char* desc);

}
