#pragma once

#include <techscreen/route/Job.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace TS::Runtime {

/**
 * Cooperative timer list driven by the owning actor. Nothing runs unless
 * runOnce() is called. A task stays scheduled while its Handle is alive and
 * it keeps returning true; dropping the Handle retires it, so a task can
 * never fire after the object that scheduled it is gone.
 */
class PollLoop {
    struct Tasks;

public:
    using Task = std::function<bool(Route::TimePoint)>;

    class Handle {
    public:
        Handle() = default;
        Handle(Handle&&) noexcept;
        auto operator=(Handle&&) noexcept -> Handle&;
        Handle(Handle const&)                    = delete;
        auto operator=(Handle const&) -> Handle& = delete;
        ~Handle();

        void cancel();
        [[nodiscard]] auto scheduled() const -> bool;

    private:
        friend class PollLoop;
        Handle(std::weak_ptr<Tasks> tasks, std::uint64_t id)
            : tasks_(std::move(tasks)), id_(id) {}

        std::weak_ptr<Tasks> tasks_;
        std::uint64_t        id_ = 0;
    };

    PollLoop();

    [[nodiscard]] auto schedule(Task task) -> Handle;
    // Runs every scheduled task once; returns how many ran.
    auto runOnce(Route::TimePoint now) -> std::size_t;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    std::shared_ptr<Tasks> tasks_;
};

} // namespace TS::Runtime
