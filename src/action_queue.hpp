#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Runs user-initiated mutations off the UI thread, one at a time and in the
// order they were posted. Each action returns the message to show; an
// exception's what() is reported as an error instead.
class ActionQueue {
public:
    using Action     = std::function<std::string()>;
    using Completion = std::function<void(const std::string& message, bool is_error)>;

    explicit ActionQueue(Completion on_done);
    ~ActionQueue();

    ActionQueue(const ActionQueue&)            = delete;
    ActionQueue& operator=(const ActionQueue&) = delete;

    // Returns how many actions run before this one (0 = starts right away).
    size_t post(Action action);

    // Actions posted but not yet started, plus the running one.
    size_t pending() const;

    // Lets the running action finish, discards the rest and joins the worker.
    // Returns the number discarded. Later posts are ignored.
    size_t stop();

private:
    Completion              on_done_;
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::deque<Action>      queue_;
    bool                    busy_     = false;
    bool                    stopping_ = false;
    std::thread             worker_;

    void run();
};
