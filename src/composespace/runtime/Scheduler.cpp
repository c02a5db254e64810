#include <composespace/runtime/Scheduler.hpp>

#include "core/EnvFlags.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace CS::Runtime {

auto batchModeToString(BatchMode mode) -> std::string_view {
    switch (mode) {
    case BatchMode::Explicit:
        return "explicit";
    case BatchMode::Immediate:
        return "immediate";
    case BatchMode::Deferred:
        return "deferred";
    }
    return "explicit";
}

auto schedulerOptionsFromEnvironment(SchedulerOptions base) -> SchedulerOptions {
    if (auto mode = detail::read_env_flag("COMPOSESPACE_BATCH_MODE")) {
        if (*mode == "explicit" || *mode == "manual") {
            base.mode = BatchMode::Explicit;
        } else if (*mode == "immediate" || *mode == "sync") {
            base.mode = BatchMode::Immediate;
        } else if (*mode == "deferred" || *mode == "frame") {
            base.mode = BatchMode::Deferred;
        } else {
            cs_log("ignoring COMPOSESPACE_BATCH_MODE=" + *mode, "Config", "WARN");
        }
    }
    if (auto limit = detail::read_env_flag("COMPOSESPACE_MAX_REEXECUTIONS")) {
        if (auto parsed = detail::parse_positive(*limit)) {
            base.max_reexecutions_per_flush = *parsed;
        } else {
            cs_log("ignoring COMPOSESPACE_MAX_REEXECUTIONS=" + *limit, "Config", "WARN");
        }
    }
    return base;
}

Scheduler::Scheduler(ScopeHost& host, SchedulerOptions options, DiagnosticSink* diagnostics)
    : host_(host), options_(std::move(options)), diagnostics_(diagnostics) {
    if (options_.max_reexecutions_per_flush == 0) {
        options_.max_reexecutions_per_flush = 1;
    }
    if (options_.mode == BatchMode::Deferred && !options_.post) {
        cs_log("deferred batching without a post callback; flushes must be explicit", "Scheduler", "WARN");
    }
}

auto Scheduler::invalidate(ScopeId scope) -> void {
    if (!host_.markDirty(scope)) {
        return;
    }
    pending_.insert(scope);

    switch (options_.mode) {
    case BatchMode::Explicit:
        break;
    case BatchMode::Immediate:
        if (!flushing_ && batchDepth_ == 0) {
            lastReport_ = this->flush();
        }
        break;
    case BatchMode::Deferred:
        if (!posted_ && options_.post) {
            posted_ = true;
            std::weak_ptr<bool> alive = alive_;
            options_.post([this, alive]() {
                if (alive.expired()) {
                    return;
                }
                posted_     = false;
                lastReport_ = this->flush();
            });
        }
        break;
    }
}

auto Scheduler::forget(ScopeId scope) -> void {
    pending_.erase(scope);
}

auto Scheduler::flush() -> FlushReport {
    if (flushing_) {
        return {};
    }
    flushing_ = true;
    struct Reset {
        bool& flag;
        ~Reset() { flag = false; }
    } reset{flushing_};

    FlushReport                                report;
    phmap::flat_hash_map<ScopeId, std::size_t> executions;
    while (!pending_.empty()) {
        this->runPass(report, executions);
    }
    if (report.executions > 0) {
        cs_log("flush: " + std::to_string(report.executions) + " execution(s) in "
                   + std::to_string(report.passes) + " pass(es), "
                   + std::to_string(report.errors.size()) + " error(s)",
               "Scheduler", "INFO");
    }
    return report;
}

auto Scheduler::runPass(FlushReport& report, phmap::flat_hash_map<ScopeId, std::size_t>& executions) -> void {
    std::vector<std::pair<std::size_t, ScopeId>> order;
    order.reserve(pending_.size());
    for (auto scope : pending_) {
        if (auto depth = host_.scopeDepth(scope)) {
            order.emplace_back(*depth, scope);
        }
    }
    pending_.clear();
    std::sort(order.begin(), order.end());

    std::vector<ScopeId> executed;
    executed.reserve(order.size());
    for (auto const& [depth, scope] : order) {
        if (!host_.scopeNeedsExecution(scope)) {
            continue;
        }
        auto& count = executions[scope];
        if (count >= options_.max_reexecutions_per_flush) {
            Error overflow{Error::Code::SchedulingOverflow,
                           "scope " + std::to_string(scope) + " re-invalidated itself "
                               + std::to_string(count) + " times in one flush"};
            host_.failScope(scope, overflow);
            this->reportError(overflow);
            report.errors.push_back(std::move(overflow));
            continue;
        }
        ++count;
        ++report.executions;
        executed.push_back(scope);
        report.executed.push_back(scope);
        if (auto result = host_.executeScope(scope); !result) {
            report.errors.push_back(result.error());
        }
    }
    ++report.passes;

    auto effectErrors = host_.afterPass(executed);
    for (auto& error : effectErrors) {
        report.errors.push_back(std::move(error));
    }
}

auto Scheduler::reportError(Error const& error) -> void {
    cs_log("scheduler: " + describeError(error), "Scheduler", "ERROR");
    if (diagnostics_ != nullptr) {
        diagnostics_->report(error, "scheduler");
    }
}

} // namespace CS::Runtime
