#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/asio/thread_pool.hpp>

#include <tabula/core/types.h>

namespace tabula::compute {

// Environment variable the runtime sets to the name of the active context. It outlives the
// context; whoever owns the context lifecycle is expected to clear it.
inline constexpr const char* kContextIdEnv = "TABULA_CONTEXT_ID";

// Thrown when a context (or a lifecycle owning one) is used outside its active window. This is a
// programming error, not a runtime condition to recover from.
class LifecycleError : public std::logic_error {
public:
    explicit LifecycleError(const std::string& what)
        : std::logic_error(what), error_(ErrorCode::LifecycleMisuse, what) {}

    const Error& error() const noexcept { return error_; }
    ErrorCode code() const noexcept { return error_.code; }

private:
    Error error_;
};

enum class ContextState { Uninitialized, Active, Stopped };

constexpr const char* contextStateName(ContextState state) {
    switch (state) {
        case ContextState::Uninitialized: return "uninitialized";
        case ContextState::Active: return "active";
        case ContextState::Stopped: return "stopped";
    }
    return "unknown";
}

struct ParallelismSpec {
    std::size_t workers = 2;

    // Accepts "local" (1 worker), "local[N]" and "local[*]" (hardware concurrency).
    static Result<ParallelismSpec> fromMaster(std::string_view master);

    std::string master() const;
};

// Local execution session: a named pool of worker threads that datasets schedule work on.
// At most one context may be active per process.
class ComputeContext {
public:
    static Result<std::shared_ptr<ComputeContext>> create(std::string name, ParallelismSpec spec);

    ~ComputeContext();

    ComputeContext(const ComputeContext&) = delete;
    ComputeContext& operator=(const ComputeContext&) = delete;

    const std::string& name() const noexcept { return name_; }
    std::size_t parallelism() const noexcept { return spec_.workers; }
    ContextState state() const noexcept { return state_.load(); }
    bool isActive() const noexcept { return state() == ContextState::Active; }

    // Runs fn(i) for i in [0, tasks) on the worker pool and waits for all of them. The first
    // exception thrown by a task is rethrown here. Throws LifecycleError unless active.
    void parallelFor(std::size_t tasks, const std::function<void(std::size_t)>& fn);

    // Waits for outstanding work and joins the workers. Stopping a stopped context is a no-op.
    void stop() noexcept;

    // Throws LifecycleError unless the context is active.
    void requireActive(std::string_view operation) const;

private:
    ComputeContext(std::string name, ParallelismSpec spec);

    Result<void> start();

    std::string name_;
    ParallelismSpec spec_;
    std::atomic<ContextState> state_{ContextState::Uninitialized};
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::mutex stopMutex_;

    static std::atomic<ComputeContext*> active_;
};

using ComputeContextFactory =
    std::function<Result<std::shared_ptr<ComputeContext>>(const std::string&, const ParallelismSpec&)>;

ComputeContextFactory defaultComputeContextFactory();

} // namespace tabula::compute
