#pragma once

#include <cstdint>

#include <imgui.h>

bool isKeyDown(ImGuiKey key);
bool isKeyPressed(ImGuiKey key, bool repeat = true);

double /* in milliseconds */ letTimeFlow(uint64_t* t);
