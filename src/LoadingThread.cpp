#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <doctest.h>

#include "LoadingThread.hpp"
#include "Progressable.hpp"

namespace {

struct CountingTask : Progressable {
    int steps;
    std::atomic<int> done;

    CountingTask(int steps)
        : steps(steps)
        , done(0)
    {
    }

    float getProgressPercentage() const override { return (float)done / steps; }
    bool isLoaded() const override { return done >= steps; }
    void progress() override { done++; }
};

}

TEST_CASE("SleepyLoadingThread")
{
    std::mutex mutex;
    std::vector<std::shared_ptr<CountingTask>> tasks = {
        std::make_shared<CountingTask>(3),
        std::make_shared<CountingTask>(5),
    };

    SleepyLoadingThread<Progressable> thread([&]() -> std::shared_ptr<Progressable> {
        std::lock_guard<std::mutex> lk(mutex);
        for (auto& t : tasks) {
            if (!t->isLoaded())
                return t;
        }
        return nullptr;
    });
    thread.start();
    thread.notify();

    for (int i = 0; i < 500; i++) {
        if (tasks[0]->isLoaded() && tasks[1]->isLoaded())
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    CHECK(tasks[0]->isLoaded());
    CHECK(tasks[1]->isLoaded());
    CHECK(tasks[1]->getProgressPercentage() == doctest::Approx(1.f));

    thread.stop();
    thread.join();
    CHECK(tasks[0]->done == 3);
}
