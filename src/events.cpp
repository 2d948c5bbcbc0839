#include <imgui.h>

#include <SDL.h>

#include "events.hpp"

bool isKeyDown(ImGuiKey key)
{
    if (ImGui::GetIO().WantCaptureKeyboard)
        return false;
    return ImGui::IsKeyDown(key);
}

bool isKeyPressed(ImGuiKey key, bool repeat)
{
    if (ImGui::GetIO().WantCaptureKeyboard)
        return false;
    return ImGui::IsKeyPressed(key, repeat);
}

double letTimeFlow(uint64_t* t)
{
    uint64_t current = SDL_GetPerformanceCounter();
    if (*t == 0)
        *t = current;
    double dt = (current - *t) * 1000 / (double)SDL_GetPerformanceFrequency();
    *t = current;
    return dt;
}
