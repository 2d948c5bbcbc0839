#pragma once

#include <array>
#include <cstddef>

#include <imgui.h>

// Integer bounds of the visible data area, rounded outward.
struct ClipBox {
    int xmin, ymin, xmax, ymax;
};

ClipBox calcClipBox(const std::array<ImVec2, 4>& drawRect);

// Part of an image, anchored at (dstX, dstY) in data space and scaled by the
// object scale, that can show up inside a ClipBox.
struct MergeClip {
    // data position of the source pixel (a1, b1)
    float dstX, dstY;
    // half-open source rectangle [a1,a2) x [b1,b2)
    int a1, b1, a2, b2;

    bool empty() const { return a2 <= a1 || b2 <= b1; }
    int width() const { return a2 - a1; }
    int height() const { return b2 - b1; }
};

MergeClip calcImageMergeClip(const ClipBox& box, float dstX, float dstY,
                             size_t width, size_t height, float scaleX, float scaleY);

// Position of a data point in the pre-transform destination buffer, relative
// to the buffer center and the pan position.
std::array<int, 2> calcCanvasPosition(float dstX, float dstY, ImVec2 pan, float dataOffset,
                                      ImVec2 viewerScale, size_t bufferWidth, size_t bufferHeight);
