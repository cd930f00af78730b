#include <tabula/compute/compute_context.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <future>
#include <thread>
#include <vector>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace tabula::compute {

std::atomic<ComputeContext*> ComputeContext::active_{nullptr};

Result<ParallelismSpec> ParallelismSpec::fromMaster(std::string_view master) {
    if (master == "local") {
        return ParallelismSpec{1};
    }
    constexpr std::string_view prefix = "local[";
    if (master.size() <= prefix.size() + 1 || master.substr(0, prefix.size()) != prefix ||
        master.back() != ']') {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Unsupported master '{}', expected local or local[N]", master)};
    }

    auto inner = master.substr(prefix.size(), master.size() - prefix.size() - 1);
    if (inner == "*") {
        return ParallelismSpec{std::max<std::size_t>(1, std::thread::hardware_concurrency())};
    }

    std::size_t workers = 0;
    auto [ptr, ec] = std::from_chars(inner.data(), inner.data() + inner.size(), workers);
    if (ec != std::errc{} || ptr != inner.data() + inner.size() || workers == 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid worker count in master '{}'", master)};
    }
    return ParallelismSpec{workers};
}

std::string ParallelismSpec::master() const {
    return fmt::format("local[{}]", workers);
}

ComputeContext::ComputeContext(std::string name, ParallelismSpec spec)
    : name_(std::move(name)), spec_(spec) {}

ComputeContext::~ComputeContext() {
    stop();
}

Result<std::shared_ptr<ComputeContext>> ComputeContext::create(std::string name,
                                                               ParallelismSpec spec) {
    if (spec.workers == 0) {
        return Error{ErrorCode::InvalidArgument, "Compute context needs at least one worker"};
    }
    std::shared_ptr<ComputeContext> ctx(new ComputeContext(std::move(name), spec));
    if (auto started = ctx->start(); !started) {
        return started.error();
    }
    return ctx;
}

Result<void> ComputeContext::start() {
    ComputeContext* expected = nullptr;
    if (!active_.compare_exchange_strong(expected, this)) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("Cannot start compute context '{}': context '{}' is still active",
                                 name_, expected->name())};
    }

    pool_ = std::make_unique<boost::asio::thread_pool>(spec_.workers);
    if (::setenv(kContextIdEnv, name_.c_str(), 1) != 0) {
        spdlog::warn("Failed to publish {} for compute context '{}'", kContextIdEnv, name_);
    }
    state_ = ContextState::Active;
    spdlog::info("Started compute context '{}' on {}", name_, spec_.master());
    return {};
}

void ComputeContext::requireActive(std::string_view operation) const {
    auto current = state();
    if (current != ContextState::Active) {
        throw LifecycleError(fmt::format("Cannot {} on compute context '{}' in state {}",
                                         operation, name_, contextStateName(current)));
    }
}

void ComputeContext::parallelFor(std::size_t tasks, const std::function<void(std::size_t)>& fn) {
    requireActive("schedule work");

    std::vector<std::future<void>> pending;
    pending.reserve(tasks);
    for (std::size_t i = 0; i < tasks; ++i) {
        auto task = std::make_shared<std::packaged_task<void()>>([&fn, i]() { fn(i); });
        pending.push_back(task->get_future());
        boost::asio::post(*pool_, [task]() { (*task)(); });
    }

    // Every task borrows fn, so all of them must finish before an error can propagate.
    for (auto& f : pending) {
        f.wait();
    }
    for (auto& f : pending) {
        f.get();
    }
}

void ComputeContext::stop() noexcept {
    std::lock_guard<std::mutex> lock(stopMutex_);
    if (state_ != ContextState::Active) {
        return;
    }

    pool_->join();
    pool_.reset();
    state_ = ContextState::Stopped;

    ComputeContext* self = this;
    active_.compare_exchange_strong(self, nullptr);
    spdlog::info("Stopped compute context '{}'", name_);
}

ComputeContextFactory defaultComputeContextFactory() {
    return [](const std::string& name, const ParallelismSpec& spec) {
        return ComputeContext::create(name, spec);
    };
}

} // namespace tabula::compute
