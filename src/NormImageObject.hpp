#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ImageObject.hpp"

struct Colormap;
class AutoCuts;

// An image drawn through cut levels and a colormap.
// Cut levels, colormap and cut policy fall back to the viewer's when unset.
struct NormImageObject : ImageObject {
    NormImageObject(float x, float y, std::shared_ptr<Image> image,
                    float scaleX = 1.f, float scaleY = 1.f);

    void drawImage(Viewer& viewer, RGBArray& dst, int whence) override;

    const std::optional<std::pair<float, float>>& getCuts() const { return cuts; }
    void setCuts(float low, float high);
    void clearCuts();

    std::shared_ptr<Colormap> getRGBMap() const { return rgbmap; }
    void setRGBMap(std::shared_ptr<Colormap> cmap);

    std::shared_ptr<AutoCuts> getAutoCuts() const { return autocuts; }
    void setAutoCuts(std::shared_ptr<AutoCuts> ac);

    // maps data into [vmin, vmax] with the active cut levels
    IndexArray applyVisuals(const Viewer& viewer, const FloatArray& data,
                            uint32_t vmin, uint32_t vmax) const;

    const std::vector<Param>& getParams() const override;
    static const std::vector<Param>& getParamsMetadata();

protected:
    std::unique_ptr<RenderCache> makeCache(Viewer& viewer) const override;

private:
    std::optional<std::pair<float, float>> cuts;
    std::shared_ptr<Colormap> rgbmap;
    std::shared_ptr<AutoCuts> autocuts;
};
