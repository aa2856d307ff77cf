#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "warden/core/models.hpp"
#include "warden/core/types.hpp"

namespace warden::sync {
    using warden::core::GroupIdentity;
    using warden::core::Subject;
    using u64 = warden::core::u64;

    // One committed change to a group's effective membership.
    struct MirrorEvent {
        GroupIdentity group;
        std::vector<Subject> changed_members;
        std::string trace_id;
    };

    // Informed after commit so an external mirror can converge; never
    // blocks or fails the committing call.
    class MirrorNotifier {
    public:
        virtual ~MirrorNotifier() = default;
        virtual void notify(const MirrorEvent& event) noexcept = 0;
    };

    class NullMirrorNotifier final : public MirrorNotifier {
    public:
        void notify(const MirrorEvent&) noexcept override {}
    };

    // Hands events to `sink` on a background worker. A full queue drops the
    // newest event; the mirror recovers it from list_unsynchronized_groups.
    class AsyncMirrorNotifier final : public MirrorNotifier {
    public:
        using Sink = std::function<void(const MirrorEvent&)>;

        explicit AsyncMirrorNotifier(Sink sink, std::size_t max_queue = 1024);
        ~AsyncMirrorNotifier() override;

        AsyncMirrorNotifier(const AsyncMirrorNotifier&) = delete;
        AsyncMirrorNotifier& operator=(const AsyncMirrorNotifier&) = delete;

        void notify(const MirrorEvent& event) noexcept override;

        // Blocks until every queued event has been delivered.
        void flush();
        [[nodiscard]] u64 dropped() const noexcept;

    private:
        void run();

        Sink sink_;
        std::size_t max_queue_;
        mutable std::mutex mutex_;
        std::condition_variable wake_;
        std::condition_variable idle_;
        std::deque<MirrorEvent> queue_;
        bool stopping_{false};
        bool delivering_{false};
        u64 dropped_{0};
        std::thread worker_;
    };

} // namespace warden::sync
