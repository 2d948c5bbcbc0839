#pragma once

#include <string>

#include <imgui.h>

#include "Array.hpp"

// GPU copy of a view framebuffer
struct Texture {
    unsigned id = 0;
    size_t w = 0;
    size_t h = 0;

    Texture() = default;
    ~Texture();

    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    // order is the channel order of the array, "RGBA" or "BGRA" and their 3 channels versions
    void upload(const RGBArray& array, const std::string& order);
    ImVec2 getSize() const { return ImVec2(w, h); }
    ImTextureID getTextureID() const { return (ImTextureID)(intptr_t)id; }

private:
    void create(size_t w, size_t h);
};
