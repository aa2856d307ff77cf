#include "warden/sync/mirror.hpp"

#include <exception>
#include <utility>

#include "warden/core/log.hpp"

namespace warden::sync {

AsyncMirrorNotifier::AsyncMirrorNotifier(Sink sink, std::size_t max_queue)
    : sink_(std::move(sink)), max_queue_(max_queue == 0 ? 1 : max_queue) {
    worker_ = std::thread([this] { run(); });
}

AsyncMirrorNotifier::~AsyncMirrorNotifier() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncMirrorNotifier::notify(const MirrorEvent& event) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || queue_.size() >= max_queue_) {
            ++dropped_;
            core::log_warn("mirror queue full, dropped event for %s", core::to_string(event.group).c_str());
            return;
        }
        queue_.push_back(event);
    } catch (const std::exception& e) {
        core::log_error("mirror notify failed: %s", e.what());
        return;
    }
    wake_.notify_one();
}

void AsyncMirrorNotifier::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

u64 AsyncMirrorNotifier::dropped() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void AsyncMirrorNotifier::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping with nothing left to deliver
            idle_.notify_all();
            return;
        }
        MirrorEvent event = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        try {
            sink_(event);
        } catch (const std::exception& e) {
            core::log_warn("mirror sink failed for %s [trace=%s]: %s", core::to_string(event.group).c_str(),
                           event.trace_id.c_str(), e.what());
        } catch (...) {
            core::log_warn("mirror sink failed for %s [trace=%s]: non-standard exception",
                           core::to_string(event.group).c_str(), event.trace_id.c_str());
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) {
            idle_.notify_all();
        }
    }
}

} // namespace warden::sync
