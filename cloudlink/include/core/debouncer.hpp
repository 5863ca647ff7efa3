#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "core/context.hpp"

namespace cloudlink::core {

// Runs keyed tasks after a delay on one worker thread. Submitting a key again replaces
// the pending task for that key. Task failures are logged and never stop the worker.
class Debouncer {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    explicit Debouncer(const cloudlink::Context &ctx);
    ~Debouncer();

    Debouncer(const Debouncer &) = delete;
    Debouncer &operator=(const Debouncer &) = delete;

    void submit(const std::string &key, std::chrono::milliseconds delay, Task task);
    bool cancel(const std::string &key);
    void cancelAll();
    std::size_t pending() const;

private:
    struct Entry {
        Clock::time_point due;
        Task task;
    };

    void run();

    const cloudlink::Context &ctx_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::map<std::string, Entry> entries_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace cloudlink::core
