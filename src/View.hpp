#pragma once

#include <array>
#include <memory>
#include <string>
#include <utility>

#include <imgui.h>

#include "Array.hpp"
#include "Viewer.hpp"

struct Canvas;
struct Image;

struct View : Viewer {
    // size of the framebuffer, in canvas pixels
    ImVec2 windowSize;
    ImVec2 scale;
    // data point shown at the center of the framebuffer
    ImVec2 pan;
    float dataOffset;
    std::string rgbOrder;
    std::string interpolation;
    std::pair<float, float> cuts;
    std::shared_ptr<Colormap> colormap;
    std::shared_ptr<AutoCuts> autocuts;
    std::shared_ptr<Renderer> renderer;
    std::shared_ptr<Canvas> canvas;

    RGBArray framebuffer;
    std::array<uint8_t, 4> background;

    View(std::shared_ptr<Canvas> canvas = nullptr);
    ~View() override;

    View(const View&) = delete;
    View& operator=(const View&) = delete;

    bool operator==(const View& other);

    void resize(int w, int h);
    void changeZoom(float zoom);
    void setPan(ImVec2 p);
    void setCuts(float low, float high);
    void setInterpolation(const std::string& method);
    void setRGBOrder(const std::string& order);
    // computes the cut levels of the image with the current policy
    void autoCuts(const Image& image);

    // composites the canvas into the framebuffer if a redraw is pending,
    // returns true when it did
    bool render();
    bool needsRender() const { return needsRedraw; }
    int getPendingWhence() const { return pendingWhence; }

    ImVec2 canvasToData(ImVec2 pt) const;

    std::array<ImVec2, 4> getDrawRect() const override;
    ImVec2 getScaleXY() const override { return scale; }
    ImVec2 getPan() const override { return pan; }
    float getDataOffset() const override { return dataOffset; }
    const std::string& getRGBOrder() const override { return rgbOrder; }
    std::shared_ptr<Colormap> getRGBMap() const override { return colormap; }
    const std::string& getInterpolation() const override { return interpolation; }
    std::shared_ptr<AutoCuts> getAutoCuts() const override { return autocuts; }
    std::pair<float, float> getCuts() const override { return cuts; }
    ImVec2 dataToCanvas(ImVec2 pt) const override;
    Renderer* getRenderer() const override { return renderer.get(); }
    void redraw(int whence) override;
    void reorderLayers() override;

    void displaySettings();
    bool parseArg(const std::string& arg);

private:
    bool needsRedraw;
    int pendingWhence;
};
