#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

// Progresses the items returned by getnew one after the other,
// and sleeps until notified when there is nothing to do.
template<typename T>
class SleepyLoadingThread {
    std::atomic<bool> running;
    std::thread thread;
    std::shared_ptr<T> current;
    std::function<std::shared_ptr<T>()> getnew;
    std::mutex mutex;
    std::condition_variable cv;
    bool ready;

    bool tick()
    {
        if (current) {
            current->progress();
            if (current->isLoaded()) {
                current = nullptr;
            }
        }

        if (current) {
            return false;
        }

        current = getnew();
        return !current;
    }

    void run()
    {
        while (running) {
            bool canrest = tick();
            if (canrest) {
                std::unique_lock<std::mutex> lk(mutex);
                cv.wait(lk, [this]{ return ready; });
                ready = false;
            }
        }
    }

public:

    SleepyLoadingThread(std::function<std::shared_ptr<T>()> getnew)
        : running(false), getnew(getnew), ready(false) {
    }

    ~SleepyLoadingThread() {
        stop();
        join();
    }

    void start() {
        running = true;
        thread = std::thread(&SleepyLoadingThread::run, this);
    }

    void stop() {
        running = false;
        notify();
    }

    void join() {
        if (thread.joinable()) {
            thread.join();
        }
    }

    void notify() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            ready = true;
        }
        cv.notify_one();
    }
};
