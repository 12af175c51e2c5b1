/**
 * @file admission.hpp
 * @brief AdmissionController — concurrency cap with a bounded FIFO queue.
 *
 * One mutex-protected ledger: up to max_concurrency requests hold a slot;
 * under the "queue" policy further requests wait in arrival order (bounded
 * by depth and timeout), under "reject" they fail immediately.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace sandbox_gate {

enum class AdmissionPolicy : uint8_t {
    Queue,
    Reject
};

[[nodiscard]] constexpr std::string_view to_string(AdmissionPolicy policy) noexcept {
    switch (policy) {
        case AdmissionPolicy::Queue:  return "queue";
        case AdmissionPolicy::Reject: return "reject";
    }
    return "unknown";
}

[[nodiscard]] std::optional<AdmissionPolicy> parse_admission_policy(std::string_view name);

struct AdmissionOptions {
    uint32_t max_concurrency{10};
    AdmissionPolicy policy{AdmissionPolicy::Queue};
    uint32_t max_queue_depth{100};
    Millis queue_timeout{30000};
};

struct AdmissionStats {
    uint32_t capacity{0};
    uint32_t live{0};
    uint32_t peak_live{0};
    uint32_t queued{0};
    uint64_t admitted{0};
    uint64_t rejected{0};
    AdmissionPolicy policy{AdmissionPolicy::Queue};
};

class AdmissionController {
public:
    /**
     * @brief A held execution slot, released on destruction.
     */
    class Slot {
    public:
        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot& operator=(Slot&&) = delete;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot() { if (owner_) owner_->release(); }

    private:
        friend class AdmissionController;
        explicit Slot(AdmissionController* owner) : owner_(owner) {}

        AdmissionController* owner_;
    };

    explicit AdmissionController(AdmissionOptions options);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /**
     * @brief Take a slot, waiting in FIFO order if the policy allows.
     *
     * Errors: BackpressureRejected (reject policy, queue full, queue
     * timeout) or Cancelled (stop requested while queued).
     */
    Result<Slot> acquire(std::stop_token stop = {});

    [[nodiscard]] AdmissionStats stats() const;
    [[nodiscard]] const AdmissionOptions& options() const noexcept { return options_; }

private:
    void release();
    void admit_locked();

    AdmissionOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<uint64_t> queue_;
    uint64_t next_ticket_{0};
    uint32_t live_{0};
    uint32_t peak_live_{0};
    uint64_t admitted_{0};
    uint64_t rejected_{0};
};

}  // namespace sandbox_gate
