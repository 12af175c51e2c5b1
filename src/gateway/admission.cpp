/**
 * @file admission.cpp
 * @brief AdmissionController implementation.
 */

#include "gateway/admission.hpp"

#include <algorithm>
#include <chrono>

namespace sandbox_gate {

std::optional<AdmissionPolicy> parse_admission_policy(std::string_view name) {
    if (name == "queue") return AdmissionPolicy::Queue;
    if (name == "reject") return AdmissionPolicy::Reject;
    return std::nullopt;
}

AdmissionController::AdmissionController(AdmissionOptions options)
    : options_(options) {
    options_.max_concurrency = std::max<uint32_t>(1, options_.max_concurrency);
}

void AdmissionController::admit_locked() {
    ++live_;
    ++admitted_;
    peak_live_ = std::max(peak_live_, live_);
}

Result<AdmissionController::Slot> AdmissionController::acquire(std::stop_token stop) {
    std::unique_lock lock(mutex_);

    if (live_ < options_.max_concurrency && queue_.empty()) {
        admit_locked();
        return Slot(this);
    }

    if (options_.policy == AdmissionPolicy::Reject) {
        ++rejected_;
        return Error{ErrorKind::BackpressureRejected,
                     "Service at capacity (" + std::to_string(live_) + " executions running)"};
    }
    if (queue_.size() >= options_.max_queue_depth) {
        ++rejected_;
        return Error{ErrorKind::BackpressureRejected,
                     "Admission queue full (" + std::to_string(queue_.size()) + " waiting)"};
    }

    const uint64_t ticket = next_ticket_++;
    queue_.push_back(ticket);

    const auto deadline = std::chrono::steady_clock::now() + options_.queue_timeout;
    const bool admitted = cv_.wait_until(lock, stop, deadline, [&] {
        return live_ < options_.max_concurrency && queue_.front() == ticket;
    });

    if (!admitted) {
        queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
        cv_.notify_all();   // the new head may fit now
        if (stop.stop_requested()) {
            return Error{ErrorKind::Cancelled, "Cancelled while waiting for admission"};
        }
        ++rejected_;
        return Error{ErrorKind::BackpressureRejected,
                     "Timed out after " + std::to_string(options_.queue_timeout.count())
                     + " ms waiting for admission"};
    }

    queue_.pop_front();
    admit_locked();
    cv_.notify_all();
    return Slot(this);
}

void AdmissionController::release() {
    {
        std::lock_guard lock(mutex_);
        if (live_ > 0) --live_;
    }
    cv_.notify_all();
}

AdmissionStats AdmissionController::stats() const {
    std::lock_guard lock(mutex_);
    return AdmissionStats{
        .capacity = options_.max_concurrency,
        .live = live_,
        .peak_live = peak_live_,
        .queued = static_cast<uint32_t>(queue_.size()),
        .admitted = admitted_,
        .rejected = rejected_,
        .policy = options_.policy
    };
}

}  // namespace sandbox_gate
