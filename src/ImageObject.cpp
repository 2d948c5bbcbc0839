#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <doctest.h>

#include "Canvas.hpp"
#include "Compositor.hpp"
#include "Cutout.hpp"
#include "Image.hpp"
#include "ImageObject.hpp"
#include "Interpolation.hpp"
#include "RenderContext.hpp"
#include "View.hpp"
#include "Viewer.hpp"
#include "events.hpp"
#include "globals.hpp"

bool isValidScale(float s)
{
    return std::isfinite(s) && s > 0.f;
}

ImageObject::ImageObject(float x, float y, std::shared_ptr<Image> image, float scaleX, float scaleY)
    : alpha(1.f)
    , linewidth(0)
    , linestyle("solid")
    , color("lightgreen")
    , showcap(false)
    , editable(false)
    , capRadius(4.f)
    , kind("image")
    , image(std::move(image))
    , anchor { x, y }
    , scaleX(scaleX)
    , scaleY(scaleY)
    , flipy(false)
    , optimize(gDefaultOptimize)
    , zorder(0)
{
    static int id = 0;
    id++;
    ID = "ImageObject " + std::to_string(id);

    if (!isValidScale(scaleX) || !isValidScale(scaleY)) {
        throw std::invalid_argument("image scale must be positive and finite");
    }
}

std::unique_ptr<RenderCache> ImageObject::makeCache(Viewer& viewer) const
{
    return std::make_unique<RenderCache>(viewer.handle);
}

bool ImageObject::inCache(const Viewer& viewer) const
{
    std::lock_guard<std::mutex> lock(cacheMutex);
    return caches.find(viewer.ID) != caches.end();
}

RenderCache& ImageObject::getCache(Viewer& viewer)
{
    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = caches.find(viewer.ID);
    if (it == caches.end()) {
        it = caches.emplace(viewer.ID, makeCache(viewer)).first;
    }
    return *it->second;
}

RenderCache& ImageObject::invalidateCache(Viewer& viewer)
{
    RenderCache& cache = getCache(viewer);
    cache.reset();
    return cache;
}

void ImageObject::removeCache(const Viewer& viewer)
{
    std::lock_guard<std::mutex> lock(cacheMutex);
    caches.erase(viewer.ID);
}

void ImageObject::resetOptimize()
{
    forEachCache([](RenderCache& cache) { cache.reset(); });
}

void ImageObject::forEachCache(const std::function<void(RenderCache&)>& fn)
{
    std::lock_guard<std::mutex> lock(cacheMutex);
    for (auto& c : caches) {
        fn(*c.second);
    }
}

void ImageObject::setZorder(int z)
{
    zorder = z;

    std::vector<std::shared_ptr<Viewer*>> viewers;
    {
        std::lock_guard<std::mutex> lock(cacheMutex);
        for (auto it = caches.begin(); it != caches.end();) {
            if (auto handle = it->second->viewer.lock()) {
                viewers.push_back(handle);
                ++it;
            } else {
                // the viewer was destroyed without detaching
                it = caches.erase(it);
            }
        }
    }
    for (const auto& handle : viewers) {
        Viewer* viewer = *handle;
        viewer->reorderLayers();
        viewer->redraw(2);
    }
}

void ImageObject::setImage(std::shared_ptr<Image> image)
{
    this->image = std::move(image);
    resetOptimize();
    fireImageSet();
}

void ImageObject::addCallback(const std::string& name, Callback callback)
{
    if (name != "image-set") {
        throw std::invalid_argument("unknown callback '" + name + "'");
    }
    imageSetCallbacks.push_back(std::move(callback));
}

void ImageObject::fireImageSet()
{
    for (const auto& cb : imageSetCallbacks) {
        cb(*this, image);
    }
}

void ImageObject::setInterpolation(const std::string& method)
{
    interpolation = method;
    resetOptimize();
}

void ImageObject::setFlipY(bool flip)
{
    flipy = flip;
    resetOptimize();
}

void ImageObject::setOptimize(bool opt)
{
    optimize = opt;
    resetOptimize();
}

bool ImageObject::commonDraw(Viewer& viewer, const RGBArray& dst, RenderCache& cache, int whence)
{
    if (!image)
        return false;
    if (whence > 0 && cache.cutout && optimize)
        return false;

    cache.cutout = nullptr;

    ClipBox box = calcClipBox(viewer.getDrawRect());
    MergeClip clip = calcImageMergeClip(box, anchor.x, anchor.y, image->w, image->h, scaleX, scaleY);
    if (clip.empty())
        return true;

    ImVec2 viewerScale = viewer.getScaleXY();
    float sx = viewerScale.x * scaleX;
    float sy = viewerScale.y * scaleY;
    if (!isValidScale(sx) || !isValidScale(sy))
        return true;

    std::string method = resolveInterpolation(interpolation.empty() ? viewer.getInterpolation() : interpolation);
    FloatArray data = image->getScaledCutout(clip.a1, clip.b1, clip.a2, clip.b2, sx, sy, method);
    if (data.empty())
        return true;
    if (flipy)
        data.flipY();

    cache.cutout = std::make_shared<FloatArray>(std::move(data));
    cache.cvsPos = calcCanvasPosition(clip.dstX, clip.dstY, viewer.getPan(), viewer.getDataOffset(),
                                      viewerScale, dst.w, dst.h);
    return true;
}

void ImageObject::drawImage(Viewer& viewer, RGBArray& dst, int whence)
{
    if (!image)
        return;

    uint64_t t = 0;
    letTimeFlow(&t);
    RenderCache& cache = getCache(viewer);

    commonDraw(viewer, dst, cache, whence);
    if (!cache.cutout)
        return;
    double tcutout = letTimeFlow(&t);

    overlayImage(dst, cache.cvsPos, *cache.cutout, image->getMaxValue(),
                 viewer.getRGBOrder(), image->getOrder(), alpha, true, false);
    double tcomposite = letTimeFlow(&t);

    if (gVerbose) {
        fprintf(stderr, "%s: draw cutout=%.3fms composite=%.3fms total=%.3fms\n",
                ID.c_str(), tcutout, tcomposite, tcutout + tcomposite);
    }
}

void ImageObject::draw(Viewer& viewer)
{
    RenderCache& cache = getCache(viewer);
    if (!cache.drawn) {
        cache.drawn = true;
        viewer.redraw(2);
    }

    Renderer* renderer = viewer.getRenderer();
    if (!image || !renderer)
        return;

    std::vector<ImVec2> cpoints = getCpoints(viewer);
    std::unique_ptr<RenderContext> cr = renderer->setupCr(*this);

    if (linewidth > 0)
        cr->drawPolygon(cpoints);

    if (showcap) {
        for (const auto& p : cpoints)
            cr->drawCap(p, capRadius);
    }
}

std::pair<int, int> ImageObject::getScaledWdHt() const
{
    if (!image)
        return { 0, 0 };
    return { (int)(image->w * scaleX), (int)(image->h * scaleY) };
}

std::array<float, 4> ImageObject::getCoords() const
{
    auto wdht = getScaledWdHt();
    float x1 = anchor.x;
    float y1 = anchor.y;
    return { x1, y1, x1 + wdht.first - 1, y1 + wdht.second - 1 };
}

std::array<float, 4> ImageObject::getLlur() const
{
    return getCoords();
}

ImVec2 ImageObject::getCenterPt() const
{
    auto c = getCoords();
    return ImVec2((c[0] + c[2]) / 2.f, (c[1] + c[3]) / 2.f);
}

std::array<ImVec2, 4> ImageObject::getPoints() const
{
    auto c = getCoords();
    return { ImVec2(c[0], c[1]), ImVec2(c[2], c[1]), ImVec2(c[2], c[3]), ImVec2(c[0], c[3]) };
}

bool ImageObject::containsPt(ImVec2 pt) const
{
    auto c = getLlur();
    return c[0] <= pt.x && pt.x <= c[2] && c[1] <= pt.y && pt.y <= c[3];
}

std::vector<bool> ImageObject::containsPts(const std::vector<ImVec2>& pts) const
{
    std::vector<bool> contains(pts.size());
    for (size_t i = 0; i < pts.size(); i++)
        contains[i] = containsPt(pts[i]);
    return contains;
}

std::vector<ImVec2> ImageObject::getCpoints(const Viewer& viewer) const
{
    std::vector<ImVec2> cpoints;
    for (const auto& p : getPoints())
        cpoints.push_back(viewer.dataToCanvas(p));
    return cpoints;
}

void ImageObject::moveDelta(float dx, float dy)
{
    anchor.moveDelta(dx, dy);
    resetOptimize();
}

void ImageObject::moveToPt(ImVec2 pt)
{
    anchor.moveTo(pt.x, pt.y);
    resetOptimize();
}

void ImageObject::setOrigin(float x, float y)
{
    anchor.moveTo(x, y);
    resetOptimize();
}

void ImageObject::setScale(float sx, float sy)
{
    if (!isValidScale(sx) || !isValidScale(sy)) {
        throw std::invalid_argument("image scale must be positive and finite");
    }
    scaleX = sx;
    scaleY = sy;
    resetOptimize();
}

void ImageObject::scaleByFactors(float fx, float fy)
{
    setScale(scaleX * fx, scaleY * fy);
}

void ImageObject::scaleBy(float fx, float fy)
{
    scaleByFactors(fx, fy);
}

void ImageObject::rotate(float, float, float)
{
    throw std::invalid_argument("images cannot be rotated");
}

std::vector<EditPoint> ImageObject::getEditPoints() const
{
    auto c = getCoords();
    return {
        { getCenterPt(), true },
        { ImVec2(c[2], (c[1] + c[3]) / 2.f), false },
        { ImVec2((c[0] + c[2]) / 2.f, c[3]), false },
        { ImVec2(c[2], c[3]), false },
    };
}

void ImageObject::setupEdit(EditDetail& detail) const
{
    detail.centerPos = getCenterPt();
    detail.scaleX = scaleX;
    detail.scaleY = scaleY;
}

// ratio of the pointer distance to the grab distance, from the center
static float dragRatio(float pos, float center, float start)
{
    return (pos - center) / (start - center);
}

void ImageObject::setEditPoint(int i, ImVec2 pt, const EditDetail& detail)
{
    float sx = scaleX;
    float sy = scaleY;
    switch (i) {
    case 0: {
        ImVec2 center = getCenterPt();
        anchor.moveDelta(pt.x - center.x, pt.y - center.y);
        break;
    }
    case 1:
        sx = detail.scaleX * dragRatio(pt.x, detail.centerPos.x, detail.startPos.x);
        break;
    case 2:
        sy = detail.scaleY * dragRatio(pt.y, detail.centerPos.y, detail.startPos.y);
        break;
    case 3:
        sx = detail.scaleX * dragRatio(pt.x, detail.centerPos.x, detail.startPos.x);
        sy = detail.scaleY * dragRatio(pt.y, detail.centerPos.y, detail.startPos.y);
        break;
    default:
        throw std::out_of_range("no edit point with index " + std::to_string(i));
    }

    if (i != 0) {
        if (!isValidScale(sx) || !isValidScale(sy)) {
            throw std::invalid_argument("edit would make the image scale degenerate");
        }
        scaleX = sx;
        scaleY = sy;
    }
    resetOptimize();
}

const std::vector<Param>& ImageObject::getParamsMetadata()
{
    static const std::vector<Param> params = {
        { "x", Param::Float, "0", false, 0, 0, {}, "X coordinate of corner of object" },
        { "y", Param::Float, "0", false, 0, 0, {}, "Y coordinate of corner of object" },
        { "scale_x", Param::Float, "1", false, 0, 0, {}, "Scaling factor for X dimension of object" },
        { "scale_y", Param::Float, "1", false, 0, 0, {}, "Scaling factor for Y dimension of object" },
        { "interpolation", Param::String, "", false, 0, 0, { "", "basic", "bilinear", "area" },
          "Interpolation method for scaling pixels" },
        { "linewidth", Param::Int, "0", true, 0, 20, {}, "Width of outline" },
        { "linestyle", Param::String, "solid", false, 0, 0, { "solid", "dash" }, "Style of outline" },
        { "color", Param::Color, "lightgreen", false, 0, 0, {}, "Color of outline" },
        { "alpha", Param::Float, "1", true, 0, 1, {}, "Opacity of the object" },
        { "showcap", Param::Bool, "false", false, 0, 0, {}, "Show caps for this object" },
        { "flipy", Param::Bool, "false", false, 0, 0, {}, "Flip image in Y direction" },
        { "optimize", Param::Bool, "true", false, 0, 0, {}, "Optimize rendering for this object" },
    };
    return params;
}

const std::vector<Param>& ImageObject::getParams() const
{
    return getParamsMetadata();
}

bool ImageObject::getParam(const std::string& name, std::string& value) const
{
    if (!findParam(getParams(), name))
        return false;

    if (name == "x") {
        value = formatFloat(anchor.x);
    } else if (name == "y") {
        value = formatFloat(anchor.y);
    } else if (name == "scale_x") {
        value = formatFloat(scaleX);
    } else if (name == "scale_y") {
        value = formatFloat(scaleY);
    } else if (name == "interpolation") {
        value = interpolation;
    } else if (name == "linewidth") {
        value = std::to_string(linewidth);
    } else if (name == "linestyle") {
        value = linestyle;
    } else if (name == "color") {
        value = color;
    } else if (name == "alpha") {
        value = formatFloat(alpha);
    } else if (name == "showcap") {
        value = formatBool(showcap);
    } else if (name == "flipy") {
        value = formatBool(flipy);
    } else if (name == "optimize") {
        value = formatBool(optimize);
    } else {
        return false;
    }
    return true;
}

bool ImageObject::setParam(const std::string& name, const std::string& value)
{
    const Param* param = findParam(getParams(), name);
    if (!param || !param->accepts(value))
        return false;

    float f = 0.f;
    bool b = false;
    if (name == "x") {
        parseFloat(value, f);
        setOrigin(f, anchor.y);
    } else if (name == "y") {
        parseFloat(value, f);
        setOrigin(anchor.x, f);
    } else if (name == "scale_x" || name == "scale_y") {
        parseFloat(value, f);
        if (!isValidScale(f))
            return false;
        if (name == "scale_x")
            setScale(f, scaleY);
        else
            setScale(scaleX, f);
    } else if (name == "interpolation") {
        setInterpolation(value);
    } else if (name == "linewidth") {
        parseInt(value, linewidth);
    } else if (name == "linestyle") {
        linestyle = value;
    } else if (name == "color") {
        color = value;
    } else if (name == "alpha") {
        parseFloat(value, alpha);
    } else if (name == "showcap") {
        parseBool(value, showcap);
    } else if (name == "flipy") {
        parseBool(value, b);
        setFlipY(b);
    } else if (name == "optimize") {
        parseBool(value, b);
        setOptimize(b);
    } else {
        return false;
    }
    return true;
}

namespace {

struct RecordingRenderer : Renderer {
    std::vector<std::string> calls;

    struct Context : RenderContext {
        std::vector<std::string>& calls;
        explicit Context(std::vector<std::string>& calls)
            : calls(calls)
        {
        }
        void drawPolygon(const std::vector<ImVec2>& cpoints) override
        {
            calls.push_back("polygon " + std::to_string(cpoints.size()));
        }
        void drawCap(ImVec2, float) override
        {
            calls.push_back("cap");
        }
    };

    std::unique_ptr<RenderContext> setupCr(const ImageObject&) override
    {
        return std::make_unique<Context>(calls);
    }
};

std::shared_ptr<Image> makeImage(size_t w, size_t h, uint8_t value)
{
    return std::make_shared<Image>(std::vector<uint8_t>(w * h, value), w, h, "M");
}

} // namespace

TEST_CASE("ImageObject geometry")
{
    ImageObject obj(10, 20, makeImage(100, 50, 0), 2.f, .5f);

    auto wdht = obj.getScaledWdHt();
    CHECK(wdht.first == 200);
    CHECK(wdht.second == 25);

    auto c = obj.getCoords();
    CHECK(c[0] == 10.f);
    CHECK(c[1] == 20.f);
    CHECK(c[2] == 209.f);
    CHECK(c[3] == 44.f);

    ImVec2 center = obj.getCenterPt();
    CHECK(center.x == doctest::Approx(109.5f));
    CHECK(center.y == doctest::Approx(32.f));

    auto pts = obj.getPoints();
    CHECK(pts[1].x == 209.f);
    CHECK(pts[1].y == 20.f);
    CHECK(pts[3].x == 10.f);
    CHECK(pts[3].y == 44.f);

    auto in = obj.containsPts({ ImVec2(10, 20), ImVec2(209, 44), ImVec2(210, 30), ImVec2(50, 19) });
    CHECK(in[0]);
    CHECK(in[1]);
    CHECK(!in[2]);
    CHECK(!in[3]);

    obj.moveDelta(5, -5);
    CHECK(obj.getX() == 15.f);
    CHECK(obj.getY() == 15.f);
    obj.moveToPt(ImVec2(0, 0));
    CHECK(obj.getX() == 0.f);
    obj.scaleByFactors(2.f, 4.f);
    CHECK(obj.getScaleX() == 4.f);
    CHECK(obj.getScaleY() == 2.f);

    CHECK_THROWS_AS(obj.rotate(45.f), std::invalid_argument);
}

TEST_CASE("ImageObject degenerate scales are rejected")
{
    ImageObject obj(0, 0, makeImage(10, 10, 0));
    CHECK_THROWS_AS(obj.setScale(0.f, 1.f), std::invalid_argument);
    CHECK_THROWS_AS(obj.setScale(1.f, -1.f), std::invalid_argument);
    CHECK_THROWS_AS(obj.setScale(NAN, 1.f), std::invalid_argument);
    CHECK_THROWS_AS(obj.scaleBy(0.f, 1.f), std::invalid_argument);
    CHECK(obj.getScaleX() == 1.f);
    CHECK(obj.getScaleY() == 1.f);
    CHECK_THROWS_AS(ImageObject(0, 0, nullptr, 0.f, 1.f), std::invalid_argument);
    CHECK(!obj.setParam("scale_x", "0"));
    CHECK(obj.getScaleX() == 1.f);
}

TEST_CASE("ImageObject drawing")
{
    View view;
    view.resize(200, 200);
    view.pan = ImVec2(100, 100);
    view.rgbOrder = "RGBA";

    auto obj = std::make_shared<ImageObject>(50, 50, makeImage(100, 100, 200));
    RGBArray dst(200, 200, 4, 0);

    SUBCASE("whole image centered in the viewport")
    {
        obj->drawImage(view, dst, 0);
        RenderCache& cache = obj->getCache(view);
        REQUIRE(cache.cutout);
        CHECK(cache.cutout->w == 100);
        CHECK(cache.cutout->h == 100);
        CHECK(cache.cvsPos[0] == 50);
        CHECK(cache.cvsPos[1] == 50);
        CHECK(dst.at(50, 50, 0) == 200);
        CHECK(dst.at(149, 149, 2) == 200);
        CHECK(dst.at(149, 149, 3) == 255);
        CHECK(dst.at(49, 49, 0) == 0);
        CHECK(dst.at(150, 150, 0) == 0);
    }

    SUBCASE("reuse without mutation")
    {
        obj->drawImage(view, dst, 0);
        auto cutout = obj->getCache(view).cutout;
        RGBArray first = dst;
        obj->drawImage(view, dst, 3);
        obj->drawImage(view, dst, 3);
        CHECK(obj->getCache(view).cutout == cutout);
        CHECK(dst == first);
    }

    SUBCASE("full redraw recomputes the cutout")
    {
        obj->drawImage(view, dst, 0);
        auto cutout = obj->getCache(view).cutout;
        obj->drawImage(view, dst, 1);
        CHECK(obj->getCache(view).cutout == cutout);
        obj->drawImage(view, dst, 0);
        CHECK(obj->getCache(view).cutout != cutout);
    }

    SUBCASE("no reuse when optimize is off")
    {
        obj->setOptimize(false);
        obj->drawImage(view, dst, 0);
        auto cutout = obj->getCache(view).cutout;
        obj->drawImage(view, dst, 3);
        CHECK(obj->getCache(view).cutout != cutout);
    }

    SUBCASE("off screen")
    {
        obj->setOrigin(1000, 1000);
        RGBArray before = dst;
        obj->drawImage(view, dst, 0);
        CHECK(!obj->getCache(view).cutout);
        CHECK(dst == before);
    }

    SUBCASE("geometry changes reset the caches")
    {
        obj->drawImage(view, dst, 0);
        CHECK(obj->getCache(view).cutout);
        obj->setOrigin(60, 50);
        CHECK(!obj->getCache(view).cutout);
        obj->drawImage(view, dst, 3);
        CHECK(obj->getCache(view).cvsPos[0] == 60);

        obj->setScale(.5f, .5f);
        CHECK(!obj->getCache(view).cutout);
        obj->drawImage(view, dst, 3);
        CHECK(obj->getCache(view).cutout->w == 50);
    }

    SUBCASE("viewer zoom applies on top of the object scale")
    {
        view.scale = ImVec2(2, 2);
        obj->setScale(.5f, 1.f);
        obj->drawImage(view, dst, 0);
        RenderCache& cache = obj->getCache(view);
        REQUIRE(cache.cutout);
        CHECK(cache.cutout->w == 100);
        CHECK(cache.cutout->h > 0);
    }

    SUBCASE("flipy")
    {
        std::vector<uint8_t> px(100 * 100, 0);
        for (size_t x = 0; x < 100; x++)
            px[x] = 255;
        obj->setImage(std::make_shared<Image>(px, 100, 100, "M"));
        obj->setFlipY(true);
        obj->drawImage(view, dst, 0);
        CHECK(dst.at(60, 50, 0) == 0);
        CHECK(dst.at(60, 149, 0) == 255);
    }

    SUBCASE("scalar alpha")
    {
        obj->alpha = .5f;
        obj->drawImage(view, dst, 0);
        CHECK(dst.at(60, 60, 0) == 100);
    }

    SUBCASE("missing image draws nothing")
    {
        obj->setImage(nullptr);
        RGBArray before = dst;
        obj->drawImage(view, dst, 0);
        CHECK(dst == before);
    }
}

TEST_CASE("ImageObject caches per viewer")
{
    View v1, v2;
    v1.resize(64, 64);
    v2.resize(64, 64);
    ImageObject obj(0, 0, makeImage(8, 8, 1));
    RGBArray dst(64, 64, 4, 0);

    CHECK(!obj.inCache(v1));
    obj.drawImage(v1, dst, 0);
    CHECK(obj.inCache(v1));
    CHECK(!obj.inCache(v2));
    obj.drawImage(v2, dst, 0);
    CHECK(obj.inCache(v2));

    auto cutout = obj.getCache(v2).cutout;
    obj.invalidateCache(v1);
    CHECK(!obj.getCache(v1).cutout);
    CHECK(obj.getCache(v2).cutout == cutout);

    obj.removeCache(v1);
    CHECK(!obj.inCache(v1));
    CHECK(obj.inCache(v2));
}

TEST_CASE("ImageObject outline pass")
{
    auto renderer = std::make_shared<RecordingRenderer>();
    View view;
    view.resize(100, 100);
    view.renderer = renderer;
    ImageObject obj(0, 0, makeImage(10, 10, 0));

    view.render();
    CHECK(!view.needsRender());
    obj.draw(view);
    CHECK(obj.getCache(view).drawn);
    CHECK(view.needsRender());
    CHECK(view.getPendingWhence() == 2);
    CHECK(renderer->calls.empty());

    view.render();
    obj.draw(view);
    CHECK(!view.needsRender());

    obj.linewidth = 2;
    obj.showcap = true;
    obj.draw(view);
    REQUIRE(renderer->calls.size() == 5);
    CHECK(renderer->calls[0] == "polygon 4");
    CHECK(renderer->calls[4] == "cap");
}

TEST_CASE("ImageObject z-order notifies viewers")
{
    auto canvas = std::make_shared<Canvas>();
    View view(canvas);
    view.resize(50, 50);
    auto a = std::make_shared<ImageObject>(0, 0, makeImage(4, 4, 0));
    auto b = std::make_shared<ImageObject>(0, 0, makeImage(4, 4, 0));
    canvas->add(a);
    canvas->add(b);
    view.render();
    CHECK(!view.needsRender());

    a->setZorder(5);
    CHECK(view.needsRender());
    CHECK(view.getPendingWhence() == 2);
    CHECK(canvas->getObjects().back() == a);
    CHECK(a->getCache(view).cutout);
}

TEST_CASE("ImageObject z-order after a viewer is gone")
{
    ImageObject obj(0, 0, makeImage(4, 4, 0));
    RGBArray dst(16, 16, 4, 0);
    {
        View gone;
        gone.resize(16, 16);
        obj.drawImage(gone, dst, 0);
        CHECK(obj.inCache(gone));
    }

    View view;
    view.resize(16, 16);
    obj.drawImage(view, dst, 0);
    view.render();
    CHECK(!view.needsRender());

    obj.setZorder(3);
    CHECK(obj.getZorder() == 3);
    CHECK(view.getPendingWhence() == 2);
    CHECK(obj.inCache(view));
}

TEST_CASE("ImageObject edit points")
{
    ImageObject obj(0, 0, makeImage(11, 21, 0));
    obj.editable = true;

    auto pts = obj.getEditPoints();
    REQUIRE(pts.size() == 4);
    CHECK(pts[0].move);
    CHECK(pts[0].pt.x == 5.f);
    CHECK(pts[0].pt.y == 10.f);
    CHECK(pts[1].pt.x == 10.f);
    CHECK(pts[1].pt.y == 10.f);
    CHECK(pts[2].pt.x == 5.f);
    CHECK(pts[2].pt.y == 20.f);
    CHECK(pts[3].pt.x == 10.f);
    CHECK(pts[3].pt.y == 20.f);

    EditDetail detail;
    detail.startPos = pts[3].pt;
    obj.setupEdit(detail);
    CHECK(detail.centerPos.x == 5.f);
    CHECK(detail.scaleX == 1.f);

    SUBCASE("move")
    {
        obj.setEditPoint(0, ImVec2(105, 110), detail);
        CHECK(obj.getX() == 100.f);
        CHECK(obj.getY() == 100.f);
        CHECK(obj.getScaleX() == 1.f);
        CHECK(obj.getScaleY() == 1.f);
    }

    SUBCASE("width")
    {
        obj.setEditPoint(1, ImVec2(15, 40), detail);
        CHECK(obj.getScaleX() == doctest::Approx(2.f));
        CHECK(obj.getScaleY() == 1.f);
        CHECK(obj.getX() == 0.f);
    }

    SUBCASE("height")
    {
        obj.setEditPoint(2, ImVec2(40, 30), detail);
        CHECK(obj.getScaleY() == doctest::Approx(2.f));
        CHECK(obj.getScaleX() == 1.f);
    }

    SUBCASE("both")
    {
        obj.setEditPoint(3, ImVec2(7.5f, 15), detail);
        CHECK(obj.getScaleX() == doctest::Approx(.5f));
        CHECK(obj.getScaleY() == doctest::Approx(.5f));
    }

    SUBCASE("out of range")
    {
        CHECK_THROWS_AS(obj.setEditPoint(4, ImVec2(0, 0), detail), std::out_of_range);
        CHECK_THROWS_AS(obj.setEditPoint(-1, ImVec2(0, 0), detail), std::out_of_range);
        CHECK(obj.getScaleX() == 1.f);
        CHECK(obj.getX() == 0.f);
    }

    SUBCASE("collapsing edit")
    {
        CHECK_THROWS_AS(obj.setEditPoint(1, ImVec2(5, 10), detail), std::invalid_argument);
        CHECK(obj.getScaleX() == 1.f);
    }
}

TEST_CASE("ImageObject image-set callback")
{
    ImageObject obj(0, 0, makeImage(4, 4, 0));
    int calls = 0;
    std::shared_ptr<Image> seen;
    obj.addCallback("image-set", [&](ImageObject&, const std::shared_ptr<Image>& img) {
        calls++;
        seen = img;
    });
    CHECK_THROWS_AS(obj.addCallback("image-changed", nullptr), std::invalid_argument);

    auto img = makeImage(2, 2, 1);
    obj.setImage(img);
    CHECK(calls == 1);
    CHECK(seen == img);
    CHECK(obj.getImage() == img);
}

TEST_CASE("ImageObject params")
{
    ImageObject obj(0, 0, makeImage(4, 4, 0));
    std::string value;

    CHECK(obj.getKind() == "image");
    CHECK(obj.getParams().size() == 12);
    CHECK(obj.getParam("color", value));
    CHECK(value == "lightgreen");
    CHECK(obj.getParam("optimize", value));
    CHECK(value == "true");

    CHECK(obj.setParam("x", "12.5"));
    CHECK(obj.getX() == 12.5f);
    CHECK(obj.setParam("linewidth", "3"));
    CHECK(obj.linewidth == 3);
    CHECK(!obj.setParam("linewidth", "30"));
    CHECK(obj.linewidth == 3);
    CHECK(obj.setParam("linestyle", "dash"));
    CHECK(!obj.setParam("linestyle", "dotted"));
    CHECK(obj.setParam("interpolation", "bilinear"));
    CHECK(obj.getInterpolation() == "bilinear");
    CHECK(!obj.setParam("interpolation", "lanczos"));
    CHECK(obj.setParam("flipy", "true"));
    CHECK(obj.getFlipY());
    CHECK(!obj.setParam("alpha", "2"));
    CHECK(!obj.setParam("rotation", "1"));
    CHECK(!obj.getParam("rotation", value));
}
