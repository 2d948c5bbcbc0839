#pragma once

#include <array>
#include <memory>

#include "Array.hpp"

struct Viewer;

// Intermediate results of drawing one image object in one viewer.
// A null field must be computed again at the next draw.
struct RenderCache {
    // used to notify the viewer of z-order changes, expired once the viewer is gone
    std::weak_ptr<Viewer*> viewer;

    std::shared_ptr<FloatArray> cutout;
    bool drawn;
    // top-left of the cutout in the destination buffer
    std::array<int, 2> cvsPos;

    explicit RenderCache(const std::shared_ptr<Viewer*>& viewer)
        : viewer(viewer)
    {
        reset();
    }
    virtual ~RenderCache() = default;

    virtual void reset()
    {
        cutout = nullptr;
        drawn = false;
        cvsPos = { 0, 0 };
    }
};

struct NormRenderCache : RenderCache {
    // alpha of the cutout normalized to [0, maxc] of the colormap
    std::shared_ptr<RGBArray> alpha;
    // index array produced by the cut levels
    std::shared_ptr<IndexArray> prergb;
    // colormap hash size the indices of prergb were computed for
    size_t prergbSize;
    // colored pixels in the viewer's channel order
    std::shared_ptr<RGBArray> rgbarr;

    explicit NormRenderCache(const std::shared_ptr<Viewer*>& viewer)
        : RenderCache(viewer)
    {
        reset();
    }

    void reset() override
    {
        RenderCache::reset();
        alpha = nullptr;
        prergb = nullptr;
        prergbSize = 0;
        rgbarr = nullptr;
    }
};
