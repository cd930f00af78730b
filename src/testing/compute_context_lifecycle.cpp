#include <tabula/testing/compute_context_lifecycle.h>

#include <cstdlib>

namespace tabula::testing {

ComputeContextLifecycle::ComputeContextLifecycle(logging::LogConfig& logConfig,
                                                 compute::ComputeContextFactory factory)
    : logLevels_(logConfig), factory_(std::move(factory)) {}

ComputeContextLifecycle::~ComputeContextLifecycle() {
    if (state_ != LifecycleState::Active) {
        return;
    }
    try {
        if (auto stopped = stop(); !stopped) {
            spdlog::warn("Stopping compute context for '{}' on destruction failed: {}", identity_,
                         stopped.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::error("Stopping compute context for '{}' on destruction threw: {}", identity_,
                      e.what());
    }
}

void ComputeContextLifecycle::requireState(LifecycleState expected, const char* operation) const {
    if (state_ != expected) {
        throw compute::LifecycleError(
            fmt::format("Cannot {} compute context lifecycle for '{}': state is {}, expected {}",
                        operation, identity_, lifecycleStateName(state_),
                        lifecycleStateName(expected)));
    }
}

Result<void> ComputeContextLifecycle::start(const std::string& identity, bool disableLogging) {
    requireState(LifecycleState::Uninitialized, "start");
    identity_ = identity;
    state_ = LifecycleState::Active;
    loggingDisabled_ = disableLogging;

    logLevels_.setLevel(disableLogging ? logging::kSilent : logging::kErrorsOnly);

    auto created = factory_(identity, compute::ParallelismSpec{kTestWorkers});
    if (!created) {
        spdlog::error("Failed to create compute context for '{}': {}", identity,
                      created.error().message);
        return created.error();
    }
    context_ = std::move(created).value();
    if (!context_) {
        return Error{ErrorCode::InternalError,
                     fmt::format("Compute context factory returned nothing for '{}'", identity)};
    }

    session_ = std::make_unique<data::QuerySession>(context_);
    spdlog::debug("Compute context for '{}' is up", identity);
    return {};
}

Result<void> ComputeContextLifecycle::stop() {
    requireState(LifecycleState::Active, "stop");

    Result<void> result;
    session_.reset();
    if (context_) {
        context_->stop();
        context_.reset();
    }

    if (::unsetenv(compute::kContextIdEnv) != 0) {
        result = Error{ErrorCode::InternalError,
                       fmt::format("Failed to clear {}", compute::kContextIdEnv)};
    }

    if (loggingDisabled_) {
        logLevels_.setLevel(logging::kErrorsOnly);
    }
    state_ = LifecycleState::Stopped;
    return result;
}

compute::ComputeContext& ComputeContextLifecycle::context() const {
    return *contextHandle();
}

std::shared_ptr<compute::ComputeContext> ComputeContextLifecycle::contextHandle() const {
    if (state_ != LifecycleState::Active || !context_) {
        throw compute::LifecycleError(
            fmt::format("No live compute context for '{}' (lifecycle is {})", identity_,
                        lifecycleStateName(state_)));
    }
    return context_;
}

data::QuerySession& ComputeContextLifecycle::session() const {
    if (state_ != LifecycleState::Active || !session_) {
        throw compute::LifecycleError(
            fmt::format("No query session for '{}' (lifecycle is {})", identity_,
                        lifecycleStateName(state_)));
    }
    return *session_;
}

} // namespace tabula::testing
