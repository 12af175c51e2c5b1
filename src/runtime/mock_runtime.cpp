/**
 * @file mock_runtime.cpp
 * @brief MockRuntime implementation.
 */

#include "runtime/mock_runtime.hpp"
#include "core/request_id.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace sandbox_gate {

namespace {

class MockProcess : public ISandboxProcess {
public:
    MockProcess(MockBehavior behavior, std::shared_ptr<MockRuntime::ProcessState> state)
        : behavior_(std::move(behavior))
        , state_(std::move(state))
        , started_(std::chrono::steady_clock::now()) {}

    std::optional<ProcessOutcome> wait_for(Millis timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        const auto finish = started_ + behavior_.duration;

        std::unique_lock lock(state_->mutex);
        auto exited = [this, finish] {
            if (state_->killed) return true;
            if (state_->terminated && !behavior_.ignore_terminate) return true;
            return !behavior_.hang && std::chrono::steady_clock::now() >= finish;
        };

        while (!exited()) {
            auto wake = behavior_.hang ? deadline : std::min(deadline, finish);
            if (state_->cv.wait_until(lock, wake) == std::cv_status::timeout &&
                std::chrono::steady_clock::now() >= deadline && !exited()) {
                return std::nullopt;
            }
        }

        ProcessOutcome outcome;
        outcome.stdout_data = behavior_.stdout_data;
        outcome.stderr_data = behavior_.stderr_data;
        outcome.usage = behavior_.usage;
        outcome.usage.wall_time_seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

        if (state_->killed) {
            outcome.signal = SIGKILL;
        } else if (state_->terminated && !behavior_.ignore_terminate) {
            outcome.signal = SIGTERM;
        } else {
            outcome.exit_code = behavior_.exit_code;
            outcome.signal = behavior_.signal;
            outcome.oom_killed = behavior_.oom_killed;
        }
        return outcome;
    }

    void kill() override {
        {
            std::lock_guard lock(state_->mutex);
            state_->killed = true;
        }
        state_->cv.notify_all();
    }

private:
    MockBehavior behavior_;
    std::shared_ptr<MockRuntime::ProcessState> state_;
    SteadyTime started_;
};

}  // anonymous namespace

MockRuntime::MockRuntime()
    : script_([](const SandboxHandle&, const ExecSpec&) { return MockBehavior{}; }) {}

Result<void> MockRuntime::ping() {
    std::lock_guard lock(mutex_);
    if (!available_) {
        return Error{ErrorKind::InfrastructureError, "mock runtime unavailable"};
    }
    return Result<void>{};
}

Result<SandboxHandle> MockRuntime::provision(const SandboxSpec& spec) {
    ++provision_calls_;

    Millis delay;
    {
        std::lock_guard lock(mutex_);
        specs_.push_back(spec);
        delay = provision_delay_;
        if (!available_) {
            return Error{ErrorKind::InfrastructureError, "mock runtime unavailable"};
        }
        if (fail_provisions_ > 0) {
            --fail_provisions_;
            return Error{ErrorKind::InfrastructureError, "mock provisioning failure"};
        }
    }

    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    SandboxHandle handle{
        .id = generate_sandbox_id("mock"),
        .code_dir = "/sandbox",
        .scratch_dir = "/tmp",
        .limits = spec.limits,
        .created_at = std::chrono::system_clock::now()
    };

    std::lock_guard lock(mutex_);
    sandboxes_[handle.id] = MockSandbox{.created_at = handle.created_at};
    peak_live_ = std::max<uint32_t>(peak_live_, static_cast<uint32_t>(sandboxes_.size()));
    return handle;
}

Result<std::unique_ptr<ISandboxProcess>> MockRuntime::spawn(const SandboxHandle& handle,
                                                            const ExecSpec& exec) {
    ++spawn_calls_;

    MockScript script;
    auto state = std::make_shared<ProcessState>();
    {
        std::lock_guard lock(mutex_);
        auto it = sandboxes_.find(handle.id);
        if (it == sandboxes_.end()) {
            return Error{ErrorKind::NotFound, "Unknown sandbox " + handle.id};
        }
        it->second.processes.push_back(state);
        executed_.push_back(exec);
        script = script_;
    }

    return std::unique_ptr<ISandboxProcess>(
        std::make_unique<MockProcess>(script(handle, exec), std::move(state)));
}

Result<void> MockRuntime::signal_all(const SandboxHandle& handle, ProcessSignal signal) {
    std::vector<std::shared_ptr<ProcessState>> targets;
    {
        std::lock_guard lock(mutex_);
        signals_.push_back(signal);
        auto it = sandboxes_.find(handle.id);
        if (it == sandboxes_.end()) {
            return Error{ErrorKind::NotFound, "Unknown sandbox " + handle.id};
        }
        for (const auto& weak : it->second.processes) {
            if (auto proc = weak.lock()) targets.push_back(std::move(proc));
        }
    }

    for (const auto& proc : targets) {
        {
            std::lock_guard lock(proc->mutex);
            if (signal == ProcessSignal::Kill) {
                proc->killed = true;
            } else {
                proc->terminated = true;
            }
        }
        proc->cv.notify_all();
    }
    return Result<void>{};
}

Result<void> MockRuntime::destroy(const SandboxId& id) {
    ++destroy_calls_;

    std::vector<std::shared_ptr<ProcessState>> targets;
    {
        std::lock_guard lock(mutex_);
        if (fail_destroy_) {
            return Error{ErrorKind::InfrastructureError, "mock destroy failure"};
        }
        auto it = sandboxes_.find(id);
        if (it == sandboxes_.end()) return Result<void>{};
        for (const auto& weak : it->second.processes) {
            if (auto proc = weak.lock()) targets.push_back(std::move(proc));
        }
        sandboxes_.erase(it);
    }

    for (const auto& proc : targets) {
        {
            std::lock_guard lock(proc->mutex);
            proc->killed = true;
        }
        proc->cv.notify_all();
    }
    return Result<void>{};
}

Result<std::vector<SandboxInfo>> MockRuntime::list_managed() {
    std::lock_guard lock(mutex_);
    if (!available_) {
        return Error{ErrorKind::InfrastructureError, "mock runtime unavailable"};
    }
    std::vector<SandboxInfo> out;
    for (const auto& [id, sandbox] : sandboxes_) {
        out.push_back(SandboxInfo{.id = id, .created_at = sandbox.created_at});
    }
    return out;
}

void MockRuntime::set_script(MockScript script) {
    std::lock_guard lock(mutex_);
    script_ = std::move(script);
}

void MockRuntime::fail_next_provisions(uint32_t count) {
    std::lock_guard lock(mutex_);
    fail_provisions_ = count;
}

void MockRuntime::set_available(bool available) {
    std::lock_guard lock(mutex_);
    available_ = available;
}

void MockRuntime::set_provision_delay(Millis delay) {
    std::lock_guard lock(mutex_);
    provision_delay_ = delay;
}

void MockRuntime::set_fail_destroy(bool fail) {
    std::lock_guard lock(mutex_);
    fail_destroy_ = fail;
}

SandboxId MockRuntime::inject_leftover(Timestamp created_at) {
    auto id = generate_sandbox_id("mock");
    std::lock_guard lock(mutex_);
    sandboxes_[id] = MockSandbox{.created_at = created_at};
    return id;
}

void MockRuntime::backdate(const SandboxId& id, Timestamp created_at) {
    std::lock_guard lock(mutex_);
    if (auto it = sandboxes_.find(id); it != sandboxes_.end()) {
        it->second.created_at = created_at;
    }
}

uint32_t MockRuntime::live_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<uint32_t>(sandboxes_.size());
}

uint32_t MockRuntime::peak_live() const {
    std::lock_guard lock(mutex_);
    return peak_live_;
}

std::vector<ProcessSignal> MockRuntime::signals_sent() const {
    std::lock_guard lock(mutex_);
    return signals_;
}

std::vector<SandboxSpec> MockRuntime::provisioned_specs() const {
    std::lock_guard lock(mutex_);
    return specs_;
}

std::vector<ExecSpec> MockRuntime::executed() const {
    std::lock_guard lock(mutex_);
    return executed_;
}

}  // namespace sandbox_gate
