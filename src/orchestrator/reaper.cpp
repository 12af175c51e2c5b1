/**
 * @file reaper.cpp
 * @brief SandboxReaper implementation.
 */

#include "orchestrator/reaper.hpp"

#include <algorithm>
#include <chrono>

namespace sandbox_gate {

SandboxReaper::SandboxReaper(IContainerRuntime& runtime,
                             const ReaperConfig& config,
                             std::shared_ptr<Logger> logger,
                             std::shared_ptr<AuditLog> audit)
    : runtime_(runtime)
    , config_(config)
    , logger_(std::move(logger))
    , audit_(std::move(audit)) {}

SandboxReaper::~SandboxReaper() {
    stop();
}

void SandboxReaper::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) {
        sweep_loop(stop);
    });
    logger_->info("Sandbox reaper started", {
        {"interval_s", std::to_string(config_.interval_seconds)},
        {"ttl_s", std::to_string(config_.sandbox_ttl_seconds)}
    });
}

void SandboxReaper::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

uint32_t SandboxReaper::sweep_once(Timestamp now) {
    std::lock_guard lock(sweep_mutex_);
    sweeps_.fetch_add(1);

    auto managed = runtime_.list_managed();
    if (!managed) {
        logger_->warn("Reaper could not list sandboxes", {{"error", managed.error().message}});
        return 0;
    }

    const auto ttl = std::chrono::seconds{config_.sandbox_ttl_seconds};
    uint32_t reaped = 0;
    for (const auto& info : *managed) {
        if (now - info.created_at < ttl) continue;

        const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - info.created_at);
        if (auto destroyed = runtime_.destroy(info.id); !destroyed) {
            logger_->error("Reaper failed to destroy sandbox", {
                {"sandbox", info.id},
                {"error", destroyed.error().message}
            });
            continue;
        }
        ++reaped;
        logger_->warn("Reaped stale sandbox", {
            {"sandbox", info.id},
            {"age_s", std::to_string(age.count())}
        });
        if (audit_) audit_->record_sandbox_event(info.id, "reaped");
    }

    reaped_total_.fetch_add(reaped);
    return reaped;
}

void SandboxReaper::sweep_loop(std::stop_token stop) {
    const auto interval = std::chrono::seconds{std::max<uint32_t>(1, config_.interval_seconds)};
    while (!stop.stop_requested()) {
        try {
            sweep_once();
        } catch (const std::exception& e) {
            logger_->error(std::string{"Reaper sweep failed: "} + e.what());
        }
        std::unique_lock lock(wait_mutex_);
        wake_.wait_for(lock, stop, interval, [] { return false; });
    }
}

}  // namespace sandbox_gate
