#include "action_queue.hpp"

#include <spdlog/spdlog.h>

ActionQueue::ActionQueue(Completion on_done)
    : on_done_(std::move(on_done)), worker_([this] { run(); }) {}

ActionQueue::~ActionQueue() { stop(); }

size_t ActionQueue::post(Action action) {
    size_t ahead = 0;
    {
        std::lock_guard lock(mtx_);
        if (stopping_) {
            spdlog::debug("action posted after stop, ignored");
            return 0;
        }
        ahead = queue_.size() + (busy_ ? 1 : 0);
        queue_.push_back(std::move(action));
    }
    cv_.notify_one();
    return ahead;
}

size_t ActionQueue::pending() const {
    std::lock_guard lock(mtx_);
    return queue_.size() + (busy_ ? 1 : 0);
}

size_t ActionQueue::stop() {
    size_t discarded = 0;
    {
        std::lock_guard lock(mtx_);
        if (stopping_ && !worker_.joinable())
            return 0;
        stopping_ = true;
        discarded = queue_.size();
        queue_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    if (discarded > 0)
        spdlog::warn("discarded {} queued action(s) at shutdown", discarded);
    return discarded;
}

void ActionQueue::run() {
    for (;;) {
        Action action;
        {
            std::unique_lock lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
                return;
            action = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        std::string message;
        bool        is_error = false;
        try {
            message = action();
        } catch (const std::exception& e) {
            message  = e.what();
            is_error = true;
            spdlog::warn("action failed: {}", message);
        }

        {
            std::lock_guard lock(mtx_);
            busy_ = false;
        }
        if (on_done_)
            on_done_(message, is_error);
    }
}
