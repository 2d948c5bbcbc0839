#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <doctest.h>

#include "AutoCuts.hpp"
#include "Colormap.hpp"
#include "Compositor.hpp"
#include "Image.hpp"
#include "NormImageObject.hpp"
#include "View.hpp"
#include "Viewer.hpp"
#include "colormaps.hpp"
#include "events.hpp"
#include "globals.hpp"

NormImageObject::NormImageObject(float x, float y, std::shared_ptr<Image> image, float scaleX, float scaleY)
    : ImageObject(x, y, std::move(image), scaleX, scaleY)
{
    kind = "normimage";
}

std::unique_ptr<RenderCache> NormImageObject::makeCache(Viewer& viewer) const
{
    return std::make_unique<NormRenderCache>(viewer.handle);
}

void NormImageObject::setCuts(float low, float high)
{
    cuts = std::make_pair(low, high);
    forEachCache([](RenderCache& c) {
        auto& cache = static_cast<NormRenderCache&>(c);
        cache.prergb = nullptr;
        cache.rgbarr = nullptr;
    });
}

void NormImageObject::clearCuts()
{
    cuts.reset();
    forEachCache([](RenderCache& c) {
        auto& cache = static_cast<NormRenderCache&>(c);
        cache.prergb = nullptr;
        cache.rgbarr = nullptr;
    });
}

void NormImageObject::setRGBMap(std::shared_ptr<Colormap> cmap)
{
    rgbmap = std::move(cmap);
    size_t size = rgbmap ? rgbmap->getHashSize() : 0;
    forEachCache([size](RenderCache& c) {
        auto& cache = static_cast<NormRenderCache&>(c);
        // indices computed for another table size are out of range
        if (size != cache.prergbSize)
            cache.prergb = nullptr;
        cache.rgbarr = nullptr;
    });
}

void NormImageObject::setAutoCuts(std::shared_ptr<AutoCuts> ac)
{
    autocuts = std::move(ac);
    forEachCache([](RenderCache& c) {
        static_cast<NormRenderCache&>(c).prergb = nullptr;
    });
}

IndexArray NormImageObject::applyVisuals(const Viewer& viewer, const FloatArray& data,
                                         uint32_t vmin, uint32_t vmax) const
{
    std::shared_ptr<AutoCuts> ac = autocuts ? autocuts : viewer.getAutoCuts();
    std::pair<float, float> levels = cuts ? *cuts : viewer.getCuts();
    if (!ac) {
        static const MinMaxCuts fallback {};
        return fallback.cutLevels(data, levels.first, levels.second, vmin, vmax);
    }
    return ac->cutLevels(data, levels.first, levels.second, vmin, vmax);
}

void NormImageObject::drawImage(Viewer& viewer, RGBArray& dst, int whence)
{
    if (!image)
        return;

    uint64_t t = 0;
    letTimeFlow(&t);
    auto& cache = static_cast<NormRenderCache&>(getCache(viewer));

    bool cutoutRan = commonDraw(viewer, dst, cache, whence);
    if (!cache.cutout)
        return;
    double tcutout = letTimeFlow(&t);

    std::shared_ptr<Colormap> cmap = rgbmap ? rgbmap : viewer.getRGBMap();
    if (!cmap) {
        fprintf(stderr, "%s: no colormap to draw with\n", ID.c_str());
        return;
    }
    const std::string& imageOrder = image->getOrder();

    if (cutoutRan) {
        // the alpha channel stays out of the cut levels and the color mapping
        int a = orderIndex(imageOrder, 'A');
        if (a < 0) {
            cache.alpha = nullptr;
        } else {
            const FloatArray& cutout = *cache.cutout;
            auto alpha = std::make_shared<RGBArray>(cutout.w, cutout.h, 1);
            float norm = cmap->maxc / image->getMaxValue();
            for (size_t i = 0; i < cutout.w * cutout.h; i++) {
                float v = cutout.data[i * cutout.c + a] * norm;
                v = std::isnan(v) ? 0.f : std::min(std::max(v, 0.f), (float)cmap->maxc);
                alpha->data[i] = (uint8_t)std::lround(v);
            }
            cache.alpha = alpha;
            cache.cutout = std::make_shared<FloatArray>(cutout.withoutChannel(a));
        }
    }

    bool indexRan = false;
    if (cutoutRan || whence <= 1 || !cache.prergb || cache.prergbSize != cmap->getHashSize()
        || !getOptimize()) {
        uint32_t vmax = cmap->getHashSize() - 1;
        cache.prergb = std::make_shared<IndexArray>(applyVisuals(viewer, *cache.cutout, 0, vmax));
        cache.prergbSize = cmap->getHashSize();
        indexRan = true;
    }
    double tindex = letTimeFlow(&t);

    const std::string& dstOrder = viewer.getRGBOrder();
    if (indexRan || whence <= 2 || !cache.rgbarr || !getOptimize()) {
        auto rgbarr = std::make_shared<RGBArray>(cmap->getRGBArray(*cache.prergb, dstOrder, imageOrder));
        int a = orderIndex(dstOrder, 'A');
        if (cache.alpha && a >= 0) {
            for (size_t i = 0; i < rgbarr->w * rgbarr->h; i++)
                rgbarr->data[i * rgbarr->c + a] = cache.alpha->data[i];
        }
        cache.rgbarr = rgbarr;
    }
    double tcolor = letTimeFlow(&t);

    overlayImage(dst, cache.cvsPos, *cache.rgbarr, cmap->maxc, dstOrder, dstOrder, alpha, true, false);
    double tcomposite = letTimeFlow(&t);

    if (gVerbose) {
        fprintf(stderr, "%s: draw cutout=%.3fms index=%.3fms color=%.3fms composite=%.3fms\n",
                ID.c_str(), tcutout, tindex, tcolor, tcomposite);
    }
}

const std::vector<Param>& NormImageObject::getParamsMetadata()
{
    static const std::vector<Param> params = [] {
        std::vector<Param> p;
        for (const auto& param : ImageObject::getParamsMetadata()) {
            if (param.name != "flipy")
                p.push_back(param);
        }
        return p;
    }();
    return params;
}

const std::vector<Param>& NormImageObject::getParams() const
{
    return getParamsMetadata();
}

namespace {

struct NormFixture {
    View view;
    RGBArray dst;

    NormFixture()
        : dst(64, 64, 4, 0)
    {
        loadDefaultColorTables();
        view.resize(64, 64);
        view.pan = ImVec2(31.5f, 31.5f);
        view.rgbOrder = "RGBA";
        view.colormap = std::make_shared<Colormap>("gray", 256);
        view.autocuts = std::make_shared<MinMaxCuts>();
        view.cuts = { 0.f, 100.f };
    }
};

std::shared_ptr<Image> makeFlat(size_t w, size_t h)
{
    std::vector<float> px(w * h, 50.f);
    return std::make_shared<Image>(px, w, h, "M");
}

struct Snapshot {
    std::shared_ptr<FloatArray> cutout;
    std::shared_ptr<IndexArray> prergb;
    std::shared_ptr<RGBArray> rgbarr;

    explicit Snapshot(const NormRenderCache& c)
        : cutout(c.cutout)
        , prergb(c.prergb)
        , rgbarr(c.rgbarr)
    {
    }
};

} // namespace

TEST_CASE_FIXTURE(NormFixture, "NormImageObject whence protocol")
{
    NormImageObject obj(0, 0, makeFlat(32, 32));
    auto cacheOf = [&]() -> NormRenderCache& {
        return static_cast<NormRenderCache&>(obj.getCache(view));
    };

    obj.drawImage(view, dst, 0);
    REQUIRE(cacheOf().cutout);
    REQUIRE(cacheOf().prergb);
    REQUIRE(cacheOf().rgbarr);
    Snapshot s0(cacheOf());
    RGBArray first = dst;

    SUBCASE("nothing is recomputed past the color stage")
    {
        obj.drawImage(view, dst, 3);
        obj.drawImage(view, dst, 4);
        Snapshot s(cacheOf());
        CHECK(s.cutout == s0.cutout);
        CHECK(s.prergb == s0.prergb);
        CHECK(s.rgbarr == s0.rgbarr);
        CHECK(dst == first);
    }

    SUBCASE("whence 2 recomputes the colors only")
    {
        obj.drawImage(view, dst, 2);
        Snapshot s(cacheOf());
        CHECK(s.cutout == s0.cutout);
        CHECK(s.prergb == s0.prergb);
        CHECK(s.rgbarr != s0.rgbarr);
    }

    SUBCASE("whence 1 recomputes the index and the colors")
    {
        obj.drawImage(view, dst, 1);
        Snapshot s(cacheOf());
        CHECK(s.cutout == s0.cutout);
        CHECK(s.prergb != s0.prergb);
        CHECK(s.rgbarr != s0.rgbarr);
    }

    SUBCASE("whence 0 recomputes everything")
    {
        obj.drawImage(view, dst, 0);
        Snapshot s(cacheOf());
        CHECK(s.cutout != s0.cutout);
        CHECK(s.prergb != s0.prergb);
        CHECK(s.rgbarr != s0.rgbarr);
    }

    SUBCASE("a missing stage forces the stages after it")
    {
        cacheOf().prergb = nullptr;
        obj.drawImage(view, dst, 3);
        Snapshot s(cacheOf());
        CHECK(s.cutout == s0.cutout);
        CHECK(s.prergb);
        CHECK(s.rgbarr != s0.rgbarr);
    }

    SUBCASE("optimize off recomputes everything")
    {
        obj.setOptimize(false);
        obj.drawImage(view, dst, 0);
        Snapshot s1(cacheOf());
        obj.drawImage(view, dst, 3);
        Snapshot s(cacheOf());
        CHECK(s.cutout != s1.cutout);
        CHECK(s.prergb != s1.prergb);
        CHECK(s.rgbarr != s1.rgbarr);
    }

    SUBCASE("cut levels reset the index and the colors")
    {
        obj.setCuts(0.f, 50.f);
        CHECK(cacheOf().cutout == s0.cutout);
        CHECK(!cacheOf().prergb);
        CHECK(!cacheOf().rgbarr);
        obj.drawImage(view, dst, 3);
        CHECK(dst.at(0, 0, 0) == 255);
    }

    SUBCASE("colormap resets the colors")
    {
        auto cmap = std::make_shared<Colormap>("heat", 256);
        obj.setRGBMap(cmap);
        CHECK(cacheOf().prergb == s0.prergb);
        CHECK(!cacheOf().rgbarr);
        obj.drawImage(view, dst, 3);
        CHECK(cacheOf().prergb == s0.prergb);
        CHECK(dst.at(0, 0, 0) == 255); // heat is orange at the middle
        CHECK(std::abs(dst.at(0, 0, 1) - 129) <= 1);
        CHECK(dst.at(0, 0, 2) == 0);
    }

    SUBCASE("cut policy resets the index")
    {
        obj.setAutoCuts(std::make_shared<HistogramCuts>());
        CHECK(cacheOf().cutout == s0.cutout);
        CHECK(!cacheOf().prergb);
        CHECK(cacheOf().rgbarr == s0.rgbarr);
    }
}

TEST_CASE_FIXTURE(NormFixture, "NormImageObject cut levels and colors")
{
    NormImageObject obj(0, 0, makeFlat(32, 32));

    SUBCASE("viewer cut levels")
    {
        obj.drawImage(view, dst, 0);
        auto& cache = static_cast<NormRenderCache&>(obj.getCache(view));
        REQUIRE(cache.prergb);
        CHECK(cache.prergb->data[0] == 128);
        CHECK(dst.at(0, 0, 0) == 128);
        CHECK(dst.at(0, 0, 3) == 255);
        CHECK(dst.at(63, 63, 0) == 0);
    }

    SUBCASE("explicit cut levels win")
    {
        obj.setCuts(50.f, 150.f);
        obj.drawImage(view, dst, 0);
        CHECK(dst.at(0, 0, 0) == 0);
        obj.clearCuts();
        obj.drawImage(view, dst, 3);
        CHECK(dst.at(0, 0, 0) == 128);
    }

    SUBCASE("color images map each channel")
    {
        std::vector<uint8_t> px = { 255, 0, 128 };
        obj.setImage(std::make_shared<Image>(px, 1, 1, "RGB"));
        view.cuts = { 0.f, 255.f };
        obj.drawImage(view, dst, 0);
        CHECK(dst.at(0, 0, 0) == 255);
        CHECK(dst.at(0, 0, 1) == 0);
        CHECK(dst.at(0, 0, 2) == 128);
    }

    SUBCASE("off screen")
    {
        obj.setOrigin(-500, -500);
        RGBArray before = dst;
        obj.drawImage(view, dst, 0);
        auto& cache = static_cast<NormRenderCache&>(obj.getCache(view));
        CHECK(!cache.cutout);
        CHECK(!cache.prergb);
        CHECK(!cache.rgbarr);
        CHECK(dst == before);
    }
}

TEST_CASE_FIXTURE(NormFixture, "NormImageObject colormap of another size")
{
    NormImageObject obj(0, 0, makeFlat(8, 8));
    obj.drawImage(view, dst, 0);
    CHECK(dst.at(0, 0, 0) == 128);
    auto& cache = static_cast<NormRenderCache&>(obj.getCache(view));
    CHECK(cache.prergbSize == 256);

    RGBArray cached(64, 64, 4, 0);
    RGBArray fresh(64, 64, 4, 0);

    SUBCASE("object colormap")
    {
        obj.setRGBMap(std::make_shared<Colormap>("gray", 16));
        CHECK(!cache.prergb);
        obj.drawImage(view, cached, 2);
        CHECK(cache.prergbSize == 16);
        CHECK(cache.prergb->data[0] == 8);
        obj.drawImage(view, fresh, 0);
        CHECK(cached == fresh);
        CHECK(std::abs(cached.at(0, 0, 0) - 136) <= 1);
    }

    SUBCASE("viewer colormap")
    {
        view.colormap = std::make_shared<Colormap>("gray", 16);
        obj.drawImage(view, cached, 2);
        CHECK(cache.prergbSize == 16);
        obj.drawImage(view, fresh, 0);
        CHECK(cached == fresh);
        CHECK(std::abs(cached.at(0, 0, 0) - 136) <= 1);
    }

    SUBCASE("viewer table size")
    {
        REQUIRE(view.colormap->setHashSize(16));
        obj.drawImage(view, cached, 2);
        CHECK(cache.prergb->data[0] == 8);
        obj.drawImage(view, fresh, 0);
        CHECK(cached == fresh);
    }

    SUBCASE("same size keeps the indices")
    {
        auto prergb = cache.prergb;
        obj.setRGBMap(std::make_shared<Colormap>("heat", 256));
        CHECK(cache.prergb == prergb);
        CHECK(!cache.rgbarr);
    }
}

TEST_CASE_FIXTURE(NormFixture, "NormImageObject alpha channel")
{
    std::vector<uint8_t> px = {
        10, 10, 10, 0,
        20, 20, 20, 128,
        30, 30, 30, 255,
        40, 40, 40, 64,
    };
    NormImageObject obj(0, 0, std::make_shared<Image>(px, 2, 2, "RGBA"));
    view.cuts = { 0.f, 255.f };

    obj.drawImage(view, dst, 0);
    auto& cache = static_cast<NormRenderCache&>(obj.getCache(view));
    REQUIRE(cache.alpha);
    CHECK(cache.cutout->c == 3);
    CHECK(cache.prergb->c == 3);
    const std::vector<uint8_t> expected = { 0, 128, 255, 64 };
    CHECK(cache.alpha->data == expected);
    for (size_t i = 0; i < 4; i++)
        CHECK(cache.rgbarr->data[i * 4 + 3] == expected[i]);

    auto alpha = cache.alpha;
    obj.drawImage(view, dst, 1);
    CHECK(cache.alpha == alpha);
    CHECK(cache.rgbarr->data[1 * 4 + 3] == 128);

    obj.drawImage(view, dst, 0);
    CHECK(cache.alpha != alpha);
    CHECK(cache.alpha->data == expected);
}

TEST_CASE_FIXTURE(NormFixture, "NormImageObject image replacement")
{
    View other;
    other.resize(32, 32);
    other.colormap = view.colormap;
    other.autocuts = view.autocuts;

    NormImageObject obj(0, 0, makeFlat(16, 16));
    obj.drawImage(view, dst, 0);
    RGBArray small(32, 32, 4, 0);
    obj.drawImage(other, small, 0);

    int calls = 0;
    obj.addCallback("image-set", [&](ImageObject&, const std::shared_ptr<Image>&) { calls++; });
    obj.setImage(makeFlat(8, 8));
    CHECK(calls == 1);

    for (Viewer* v : { (Viewer*)&view, (Viewer*)&other }) {
        auto& cache = static_cast<NormRenderCache&>(obj.getCache(*v));
        CHECK(!cache.cutout);
        CHECK(!cache.alpha);
        CHECK(!cache.prergb);
        CHECK(!cache.rgbarr);
    }
}

TEST_CASE("NormImageObject params")
{
    NormImageObject obj(0, 0, nullptr);
    CHECK(obj.getKind() == "normimage");
    CHECK(obj.getParams().size() == ImageObject::getParamsMetadata().size() - 1);
    CHECK(findParam(obj.getParams(), "flipy") == nullptr);
    CHECK(!obj.setParam("flipy", "true"));
    CHECK(obj.setParam("alpha", "0.25"));
    CHECK(obj.alpha == .25f);
}
