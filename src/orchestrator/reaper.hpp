/**
 * @file reaper.hpp
 * @brief SandboxReaper — background sweep of leftover sandboxes.
 *
 * Sessions destroy their own sandboxes; the reaper catches what they could
 * not (destroy failures, a crashed previous instance). It runs one sweep at
 * start-up and then one per interval on a dedicated std::jthread.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "runtime/container_runtime.hpp"
#include "telemetry/audit_log.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace sandbox_gate {

class SandboxReaper {
public:
    SandboxReaper(IContainerRuntime& runtime,
                  const ReaperConfig& config,
                  std::shared_ptr<Logger> logger,
                  std::shared_ptr<AuditLog> audit = nullptr);
    ~SandboxReaper();

    SandboxReaper(const SandboxReaper&) = delete;
    SandboxReaper& operator=(const SandboxReaper&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return thread_.joinable(); }

    /**
     * @brief Destroy every managed sandbox created before now - ttl.
     * @return Number of sandboxes destroyed.
     */
    uint32_t sweep_once(Timestamp now = std::chrono::system_clock::now());

    [[nodiscard]] uint64_t reaped_total() const noexcept { return reaped_total_.load(); }
    [[nodiscard]] uint64_t sweeps() const noexcept { return sweeps_.load(); }

private:
    void sweep_loop(std::stop_token stop);

    IContainerRuntime& runtime_;
    ReaperConfig config_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<AuditLog> audit_;

    std::mutex sweep_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;

    std::atomic<uint64_t> reaped_total_{0};
    std::atomic<uint64_t> sweeps_{0};
};

}  // namespace sandbox_gate
