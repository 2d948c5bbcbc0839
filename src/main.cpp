#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#define IMGUI_DEFINE_MATH_OPERATORS
#include <imgui.h>

#include <SDL.h>
#include <imgui_impl_opengl3.h>
#include <imgui_impl_sdl2.h>
#include <GL/gl3w.h>

#include "AutoCuts.hpp"
#include "Canvas.hpp"
#include "Colormap.hpp"
#include "ImGuiRenderer.hpp"
#include "Image.hpp"
#include "ImageObject.hpp"
#include "ImageProvider.hpp"
#include "LoadingThread.hpp"
#include "NormImageObject.hpp"
#include "ParamEditor.hpp"
#include "Texture.hpp"
#include "View.hpp"
#include "colormaps.hpp"
#include "config.hpp"
#include "events.hpp"
#include "globals.hpp"
#include "imgui_custom.hpp"
#include "strutils.hpp"

struct PendingImage {
    std::string filename;
    std::shared_ptr<ImageProvider> provider;
    bool raw;
};

static std::mutex pendingMutex;
static std::vector<PendingImage> pending;

static void help()
{
    ImGui::SetNextWindowSize(ImVec2(420, 0), ImGuiCond_FirstUseEver);
    if (!ImGui::Begin("Help", &gShowHelp)) {
        ImGui::End();
        return;
    }
    ImGui::BulletText("i / o: zoom in / out");
    ImGui::BulletText("arrows: pan");
    ImGui::BulletText("a: cut levels of the selected image");
    ImGui::BulletText("c / shift+c: next / previous color table");
    ImGui::BulletText("click: select an image, e: toggle its edition");
    ImGui::BulletText("s: settings, h: this help, q: quit");
    ImGui::Separator();
    ImGui::TextWrapped("Command line: ginga [v:zoom:Z] [v:pan:X,Y] [v:cuts:LO,HI] [v:interp:NAME] "
                       "[c:cmap:NAME] [c:size:N] [o:raw|o:norm] images...");
    ImGui::End();
}

static bool parseArgs(int argc, char** argv, View& view)
{
    bool raw = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "o:raw") {
            raw = true;
        } else if (arg == "o:norm") {
            raw = false;
        } else if (startswith(arg, "v:")) {
            if (!view.parseArg(arg)) {
                fprintf(stderr, "invalid view argument '%s'\n", arg.c_str());
                return false;
            }
        } else if (startswith(arg, "c:")) {
            if (!view.colormap->parseArg(arg)) {
                fprintf(stderr, "invalid colormap argument '%s'\n", arg.c_str());
                return false;
            }
        } else {
            std::shared_ptr<ImageProvider> provider = ImageProvider::create(arg);
            if (!provider) {
                fprintf(stderr, "%s: unsupported image format, skipped\n", arg.c_str());
                continue;
            }
            std::lock_guard<std::mutex> lk(pendingMutex);
            pending.push_back({ arg, provider, raw });
        }
    }
    return true;
}

// moves the loaded images to the canvas, side by side
static bool collectLoadedImages(View& view, float& nextX)
{
    std::vector<PendingImage> done;
    {
        std::lock_guard<std::mutex> lk(pendingMutex);
        auto it = std::stable_partition(pending.begin(), pending.end(),
                                        [](const PendingImage& p) { return !p.provider->isLoaded(); });
        done.assign(it, pending.end());
        pending.erase(it, pending.end());
    }

    bool added = false;
    for (const auto& p : done) {
        ImageProvider::Result res = p.provider->getResult();
        if (!res.has_value()) {
            fprintf(stderr, "%s\n", res.error().c_str());
            continue;
        }
        std::shared_ptr<Image> image = res.value();

        std::shared_ptr<ImageObject> obj;
        if (p.raw)
            obj = std::make_shared<ImageObject>(nextX, 0.f, image);
        else
            obj = std::make_shared<NormImageObject>(nextX, 0.f, image);
        obj->setZorder(gCanvas->getObjects().size());
        gCanvas->add(obj);

        if (!p.raw && !added && gCanvas->getObjects().size() == 1)
            view.autoCuts(*image);
        if (gVerbose)
            fprintf(stderr, "%s: %zux%zux%zu as %s at x=%g\n", p.filename.c_str(),
                    image->w, image->h, image->c, obj->getKind().c_str(), nextX);
        nextX += image->w;
        added = true;
    }
    return added;
}

static std::shared_ptr<ImageObject> objectAt(const View& view, ImVec2 cpt)
{
    ImVec2 pt = view.canvasToData(cpt);
    const auto& objects = gCanvas->getObjects();
    for (auto it = objects.rbegin(); it != objects.rend(); ++it) {
        if ((*it)->containsPt(pt))
            return *it;
    }
    return nullptr;
}

static void drawEditPoints(const View& view, const ImageObject& obj, ImDrawList* drawList, ImVec2 origin)
{
    for (const auto& ep : obj.getEditPoints()) {
        ImVec2 c = origin + view.dataToCanvas(ep.pt);
        ImU32 color = ep.move ? IM_COL32(255, 255, 0, 255) : IM_COL32(0, 255, 255, 255);
        drawList->AddCircleFilled(c, obj.capRadius, color);
    }
}

// index of the edit point under the mouse, -1 if none
static int pickEditPoint(const View& view, const ImageObject& obj, ImVec2 cpt)
{
    auto points = obj.getEditPoints();
    float radius = obj.capRadius * 2.f;
    for (size_t i = 0; i < points.size(); i++) {
        ImVec2 d = view.dataToCanvas(points[i].pt) - cpt;
        if (d.x * d.x + d.y * d.y <= radius * radius)
            return i;
    }
    return -1;
}

int main(int argc, char* argv[])
{
    try {
        config::load();
    } catch (const std::exception& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    loadDefaultColorTables();
    config::load_colormaps();
    if (!config::apply_globals()) {
        fprintf(stderr, "some settings were ignored\n");
    }

    gCanvas = std::make_shared<Canvas>();
    auto renderer = std::make_shared<ImGuiRenderer>();
    auto view = std::make_shared<View>(gCanvas);
    view->renderer = renderer;
    gViews.push_back(view);

    if (!parseArgs(argc, argv, *view)) {
        gViews.clear();
        return 1;
    }

    if (SDL_Init(SDL_INIT_VIDEO|SDL_INIT_TIMER) != 0)
    {
        fprintf(stderr, "Error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);

    int w = config::get_int("WINDOW_WIDTH");
    int h = config::get_int("WINDOW_HEIGHT");
    SDL_Window* window = SDL_CreateWindow("ginga", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          w, h, SDL_WINDOW_OPENGL|SDL_WINDOW_RESIZABLE|SDL_WINDOW_ALLOW_HIGHDPI);
    if (!window) {
        fprintf(stderr, "Error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }
    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1); // Enable vsync

    if (gl3wInit()) {
        fprintf(stderr, "failed to initialize OpenGL\n");
        return 1;
    }
    if (!gl3wIsSupported(3, 3)) {
        fprintf(stderr, "OpenGL 3.3 not supported\n");
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::GetIO().FontGlobalScale = gDefaultScale;
    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    SleepyLoadingThread<ImageProvider> iothread([]() -> std::shared_ptr<ImageProvider> {
        std::lock_guard<std::mutex> lk(pendingMutex);
        for (const auto& p : pending) {
            if (!p.provider->isLoaded())
                return p.provider;
        }
        return nullptr;
    });
    iothread.start();
    iothread.notify();

    auto texture = std::make_unique<Texture>();
    std::shared_ptr<ImageObject> selected;
    EditDetail editDetail;
    int editing = -1;
    float nextX = 0.f;
    uint64_t timer = 0;

    bool done = false;
    while (!done) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) {
                done = true;
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        if (collectLoadedImages(*view, nextX)) {
            iothread.notify();
        }

        ImGuiIO& io = ImGui::GetIO();
        if (view->windowSize.x != io.DisplaySize.x || view->windowSize.y != io.DisplaySize.y) {
            view->resize(io.DisplaySize.x, io.DisplaySize.y);
        }

        bool shift = isKeyDown(ImGuiKey_LeftShift) || isKeyDown(ImGuiKey_RightShift);
        if (isKeyPressed(ImGuiKey_Q, false)) {
            done = true;
        }
        if (isKeyPressed(ImGuiKey_I)) {
            view->changeZoom(view->scale.x * 2.f);
        }
        if (isKeyPressed(ImGuiKey_O)) {
            view->changeZoom(view->scale.x / 2.f);
        }
        float step = 20.f / view->scale.x;
        if (isKeyPressed(ImGuiKey_LeftArrow))
            view->setPan(view->pan - ImVec2(step, 0));
        if (isKeyPressed(ImGuiKey_RightArrow))
            view->setPan(view->pan + ImVec2(step, 0));
        if (isKeyPressed(ImGuiKey_UpArrow))
            view->setPan(view->pan - ImVec2(0, step));
        if (isKeyPressed(ImGuiKey_DownArrow))
            view->setPan(view->pan + ImVec2(0, step));
        if (isKeyPressed(ImGuiKey_C, false)) {
            if (shift)
                view->colormap->previousTable();
            else
                view->colormap->nextTable();
            view->redraw(2);
        }
        if (isKeyPressed(ImGuiKey_A, false)) {
            std::shared_ptr<ImageObject> target = selected;
            if (!target && !gCanvas->getObjects().empty())
                target = gCanvas->getObjects().back();
            if (target && target->getImage())
                view->autoCuts(*target->getImage());
        }
        if (isKeyPressed(ImGuiKey_E, false) && selected) {
            selected->editable = !selected->editable;
        }
        if (isKeyPressed(ImGuiKey_S, false)) {
            gShowSettings = !gShowSettings;
        }
        if (isKeyPressed(ImGuiKey_H, false)) {
            gShowHelp = !gShowHelp;
        }

        if (!io.WantCaptureMouse) {
            ImVec2 mouse = io.MousePos;
            if (ImGui::IsMouseClicked(0)) {
                editing = -1;
                if (selected && selected->editable)
                    editing = pickEditPoint(*view, *selected, mouse);
                if (editing >= 0) {
                    editDetail.startPos = view->canvasToData(mouse);
                    selected->setupEdit(editDetail);
                } else {
                    selected = objectAt(*view, mouse);
                }
            } else if (ImGui::IsMouseDragging(0) && editing >= 0 && selected) {
                try {
                    selected->setEditPoint(editing, view->canvasToData(mouse), editDetail);
                    view->redraw(0);
                } catch (const std::invalid_argument& e) {
                    fprintf(stderr, "%s: %s\n", selected->ID.c_str(), e.what());
                }
            }
            if (ImGui::IsMouseReleased(0)) {
                editing = -1;
            }
        }

        letTimeFlow(&timer);
        if (view->render()) {
            texture->upload(view->framebuffer, view->rgbOrder);
            double ms = letTimeFlow(&timer);
            if (gVerbose)
                fprintf(stderr, "%s: composited in %.2fms\n", view->ID.c_str(), ms);
        }

        ImDrawList* background = ImGui::GetBackgroundDrawList();
        if (texture->id) {
            background->AddImage(texture->getTextureID(), ImVec2(0, 0), texture->getSize());
        }
        renderer->drawList = background;
        renderer->origin = ImVec2(0, 0);
        gCanvas->draw(*view);
        if (selected && selected->editable) {
            drawEditPoints(*view, *selected, background, renderer->origin);
        }

        if (gShowSettings) {
            ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
            if (ImGui::Begin("Settings", &gShowSettings, ImGuiWindowFlags_AlwaysAutoResize)) {
                view->displaySettings();
                if (selected) {
                    ImGui::Separator();
                    if (displayParams(*selected))
                        view->redraw(0);
                }
            }
            ImGui::End();
        }

        {
            std::lock_guard<std::mutex> lk(pendingMutex);
            if (!pending.empty()) {
                ImGui::SetNextWindowPos(ImVec2(10, io.DisplaySize.y - 10), ImGuiCond_Always, ImVec2(0, 1));
                ImGui::Begin("Loading", nullptr, ImGuiWindowFlags_AlwaysAutoResize|ImGuiWindowFlags_NoTitleBar);
                for (const auto& p : pending) {
                    ImGui::TextUnformatted(p.filename.c_str());
                    ImGui::BufferingBar(p.filename.c_str(), p.provider->getProgressPercentage(),
                                        ImVec2(200, 4), IM_COL32(40, 40, 40, 255), IM_COL32(144, 238, 144, 255));
                }
                ImGui::End();
            }
        }

        if (gShowHelp) {
            help();
        }

        ImGui::Render();
        glViewport(0, 0, (int)io.DisplaySize.x, (int)io.DisplaySize.y);
        glClearColor(0.f, 0.f, 0.f, 1.f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    iothread.stop();
    iothread.join();
    texture = nullptr;

    selected = nullptr;
    gCanvas->deleteAll();
    gViews.clear();
    view = nullptr;
    gCanvas = nullptr;
    {
        std::lock_guard<std::mutex> lk(pendingMutex);
        pending.clear();
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
