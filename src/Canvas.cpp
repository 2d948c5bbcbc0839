#include <algorithm>
#include <memory>
#include <vector>

#include <doctest.h>

#include "Canvas.hpp"
#include "Image.hpp"
#include "ImageObject.hpp"
#include "NormImageObject.hpp"
#include "View.hpp"
#include "Viewer.hpp"

void Canvas::add(std::shared_ptr<ImageObject> obj)
{
    objects.push_back(std::move(obj));
    sortByZorder();
    // new objects have no cache yet, the others can be reused
    redrawViewers(3);
}

void Canvas::remove(const std::shared_ptr<ImageObject>& obj)
{
    auto it = std::find(objects.begin(), objects.end(), obj);
    if (it == objects.end())
        return;
    for (Viewer* viewer : viewers)
        obj->removeCache(*viewer);
    objects.erase(it);
    redrawViewers(3);
}

void Canvas::deleteAll()
{
    for (const auto& obj : objects) {
        for (Viewer* viewer : viewers)
            obj->removeCache(*viewer);
    }
    objects.clear();
    redrawViewers(3);
}

void Canvas::sortByZorder()
{
    std::stable_sort(objects.begin(), objects.end(),
        [](const std::shared_ptr<ImageObject>& lhs, const std::shared_ptr<ImageObject>& rhs) {
            return lhs->getZorder() < rhs->getZorder();
        });
}

void Canvas::attachViewer(Viewer* viewer)
{
    if (std::find(viewers.begin(), viewers.end(), viewer) == viewers.end())
        viewers.push_back(viewer);
}

void Canvas::detachViewer(const Viewer& viewer)
{
    for (const auto& obj : objects)
        obj->removeCache(viewer);
    viewers.erase(std::remove(viewers.begin(), viewers.end(), &viewer), viewers.end());
}

void Canvas::redrawViewers(int whence)
{
    for (Viewer* viewer : viewers)
        viewer->redraw(whence);
}

void Canvas::drawImages(Viewer& viewer, RGBArray& dst, int whence)
{
    for (const auto& obj : objects)
        obj->drawImage(viewer, dst, whence);
}

void Canvas::draw(Viewer& viewer)
{
    for (const auto& obj : objects)
        obj->draw(viewer);
}

TEST_CASE("Canvas")
{
    auto canvas = std::make_shared<Canvas>();
    auto img = std::make_shared<Image>(std::vector<uint8_t>(16, 100), 4, 4, "M");
    auto a = std::make_shared<ImageObject>(0, 0, img);
    auto b = std::make_shared<ImageObject>(0, 0, img);
    auto c = std::make_shared<ImageObject>(0, 0, img);

    SUBCASE("z-order sorting is stable")
    {
        b->setZorder(1);
        canvas->add(a);
        canvas->add(b);
        canvas->add(c);
        const auto& objs = canvas->getObjects();
        REQUIRE(objs.size() == 3);
        CHECK(objs[0] == a);
        CHECK(objs[1] == c);
        CHECK(objs[2] == b);

        a->setZorder(2);
        canvas->sortByZorder();
        CHECK(objs[0] == c);
        CHECK(objs[2] == a);
    }

    SUBCASE("the highest object is composited last")
    {
        View view(canvas);
        view.resize(8, 8);
        view.pan = ImVec2(3.5f, 3.5f);
        auto top = std::make_shared<ImageObject>(0, 0,
            std::make_shared<Image>(std::vector<uint8_t>(4, 250), 2, 2, "M"));
        top->setZorder(1);
        canvas->add(top);
        canvas->add(a);
        view.render();
        CHECK(view.framebuffer.at(0, 0, 0) == 250);
        CHECK(view.framebuffer.at(3, 3, 0) == 100);
        CHECK(view.framebuffer.at(5, 5, 0) == 0);
    }

    SUBCASE("adding and removing request a composite")
    {
        View view(canvas);
        view.resize(8, 8);
        view.render();
        canvas->add(a);
        CHECK(view.getPendingWhence() == 3);
        view.render();
        CHECK(a->inCache(view));

        canvas->remove(a);
        CHECK(!a->inCache(view));
        CHECK(canvas->getObjects().empty());
        CHECK(view.needsRender());
    }

    SUBCASE("detaching a viewer drops its caches")
    {
        auto view = std::make_unique<View>(canvas);
        View other(canvas);
        view->resize(8, 8);
        other.resize(8, 8);
        canvas->add(a);
        canvas->add(b);
        view->render();
        other.render();
        CHECK(a->inCache(*view));
        CHECK(b->inCache(other));

        canvas->detachViewer(*view);
        CHECK(!a->inCache(*view));
        CHECK(!b->inCache(*view));
        CHECK(a->inCache(other));

        view->render();
        view.reset();
        CHECK(b->inCache(other));
    }
}
