#pragma once

#include <memory>
#include <vector>

#include "Array.hpp"

struct ImageObject;
struct Viewer;

// Ordered image objects, drawn from the lowest z-order to the highest.
struct Canvas {
    Canvas() = default;
    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

    void add(std::shared_ptr<ImageObject> obj);
    void remove(const std::shared_ptr<ImageObject>& obj);
    void deleteAll();
    const std::vector<std::shared_ptr<ImageObject>>& getObjects() const { return objects; }

    // objects of equal z-order keep their insertion order
    void sortByZorder();

    void attachViewer(Viewer* viewer);
    // forgets the viewer and drops the caches of every object for it
    void detachViewer(const Viewer& viewer);

    void drawImages(Viewer& viewer, RGBArray& dst, int whence);
    void draw(Viewer& viewer);

private:
    std::vector<std::shared_ptr<ImageObject>> objects;
    std::vector<Viewer*> viewers;

    void redrawViewers(int whence);
};
