#pragma once

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <imgui.h>

#include "Array.hpp"
#include "Params.hpp"
#include "RenderCache.hpp"

struct Image;
struct Viewer;

// Data-space position of an object.
struct Anchor {
    float x, y;

    void moveDelta(float dx, float dy)
    {
        x += dx;
        y += dy;
    }
    void moveTo(float nx, float ny)
    {
        x = nx;
        y = ny;
    }
};

struct EditPoint {
    ImVec2 pt;
    bool move;
};

// State recorded when an edit starts.
struct EditDetail {
    // where the pointer grabbed the handle
    ImVec2 startPos;
    ImVec2 centerPos;
    float scaleX, scaleY;
};

// An image placed on a canvas, drawn with its own channels.
struct ImageObject {
    using Callback = std::function<void(ImageObject&, const std::shared_ptr<Image>&)>;

    std::string ID;

    float alpha;
    int linewidth;
    std::string linestyle;
    std::string color;
    bool showcap;
    bool editable;
    float capRadius;

    ImageObject(float x, float y, std::shared_ptr<Image> image,
                float scaleX = 1.f, float scaleY = 1.f);
    virtual ~ImageObject() = default;

    ImageObject(const ImageObject&) = delete;
    ImageObject& operator=(const ImageObject&) = delete;

    const std::string& getKind() const { return kind; }

    // composites the object into dst, recomputing what whence asks for
    virtual void drawImage(Viewer& viewer, RGBArray& dst, int whence);
    // outline pass
    void draw(Viewer& viewer);

    int getZorder() const { return zorder; }
    void setZorder(int z);

    std::shared_ptr<Image> getImage() const { return image; }
    void setImage(std::shared_ptr<Image> image);
    void addCallback(const std::string& name, Callback callback);

    bool inCache(const Viewer& viewer) const;
    RenderCache& getCache(Viewer& viewer);
    RenderCache& invalidateCache(Viewer& viewer);
    void removeCache(const Viewer& viewer);
    void resetOptimize();

    const std::string& getInterpolation() const { return interpolation; }
    // empty to use the viewer's method
    void setInterpolation(const std::string& method);
    bool getFlipY() const { return flipy; }
    void setFlipY(bool flip);
    bool getOptimize() const { return optimize; }
    void setOptimize(bool opt);

    // geometry
    float getX() const { return anchor.x; }
    float getY() const { return anchor.y; }
    float getScaleX() const { return scaleX; }
    float getScaleY() const { return scaleY; }
    std::pair<int, int> getScaledWdHt() const;
    std::array<float, 4> getCoords() const;
    std::array<float, 4> getLlur() const;
    ImVec2 getCenterPt() const;
    std::array<ImVec2, 4> getPoints() const;
    bool containsPt(ImVec2 pt) const;
    std::vector<bool> containsPts(const std::vector<ImVec2>& pts) const;
    std::vector<ImVec2> getCpoints(const Viewer& viewer) const;

    void moveDelta(float dx, float dy);
    void moveToPt(ImVec2 pt);
    void setOrigin(float x, float y);
    void setScale(float sx, float sy);
    void scaleByFactors(float fx, float fy);
    void scaleBy(float fx, float fy);
    void rotate(float theta, float xoff = 0.f, float yoff = 0.f);

    // edition, handles are: move, width, height, both
    std::vector<EditPoint> getEditPoints() const;
    void setupEdit(EditDetail& detail) const;
    void setEditPoint(int i, ImVec2 pt, const EditDetail& detail);

    // string access to the properties listed by getParams()
    virtual const std::vector<Param>& getParams() const;
    bool getParam(const std::string& name, std::string& value) const;
    bool setParam(const std::string& name, const std::string& value);
    static const std::vector<Param>& getParamsMetadata();

protected:
    std::string kind;
    std::shared_ptr<Image> image;

    virtual std::unique_ptr<RenderCache> makeCache(Viewer& viewer) const;
    // computes the cutout and its position, returns true when it ran
    bool commonDraw(Viewer& viewer, const RGBArray& dst, RenderCache& cache, int whence);
    void forEachCache(const std::function<void(RenderCache&)>& fn);
    void fireImageSet();

private:
    Anchor anchor;
    float scaleX, scaleY;
    std::string interpolation;
    bool flipy;
    bool optimize;
    int zorder;

    std::map<std::string, std::unique_ptr<RenderCache>> caches;
    mutable std::mutex cacheMutex;
    std::vector<Callback> imageSetCallbacks;
};

bool isValidScale(float s);
