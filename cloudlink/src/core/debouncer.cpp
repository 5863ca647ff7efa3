#include "core/debouncer.hpp"

#include <exception>
#include <utility>

namespace cloudlink::core
{

    Debouncer::Debouncer(const cloudlink::Context &ctx)
        : ctx_(ctx), worker_([this]()
                             { run(); })
    {
    }

    Debouncer::~Debouncer()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            entries_.clear();
        }
        wake_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void Debouncer::submit(const std::string &key, std::chrono::milliseconds delay, Task task)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_[key] = Entry{Clock::now() + delay, std::move(task)};
        }
        wake_.notify_all();
    }

    bool Debouncer::cancel(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    void Debouncer::cancelAll()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    std::size_t Debouncer::pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void Debouncer::run()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_)
        {
            if (entries_.empty())
            {
                wake_.wait(lock);
                continue;
            }

            auto next = entries_.begin();
            for (auto it = entries_.begin(); it != entries_.end(); ++it)
            {
                if (it->second.due < next->second.due)
                {
                    next = it;
                }
            }

            const Clock::time_point due = next->second.due;
            if (Clock::now() < due)
            {
                wake_.wait_until(lock, due);
                continue;
            }

            Task task = std::move(next->second.task);
            entries_.erase(next);
            lock.unlock();
            try
            {
                task();
            }
            catch (const std::exception &e)
            {
                ctx_.error("Debounced task failed: ", e.what());
            }
            catch (...)
            {
                ctx_.error("Debounced task failed with an unknown exception");
            }
            lock.lock();
        }
    }

} // namespace cloudlink::core
