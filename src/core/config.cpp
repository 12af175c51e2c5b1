/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace sandbox_gate {

namespace {

template <typename T>
T read_uint(const toml::node_view<toml::node>& node, T fallback) {
    return static_cast<T>(node.value_or(static_cast<int64_t>(fallback)));
}

double read_double(const toml::node_view<toml::node>& node, double fallback) {
    // Accept integers where a float is expected ("timeout = 5")
    if (auto as_int = node.value<int64_t>()) return static_cast<double>(*as_int);
    return node.value_or(fallback);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            config.server.host = server["host"].value_or(config.server.host);
            config.server.port = read_uint(server["port"], config.server.port);
            config.server.worker_threads =
                read_uint(server["worker_threads"], config.server.worker_threads);
            config.server.max_body_bytes =
                read_uint(server["max_body_bytes"], config.server.max_body_bytes);
            config.server.read_timeout_ms =
                read_uint(server["read_timeout_ms"], config.server.read_timeout_ms);
        }

        // [gateway]
        if (auto gateway = tbl["gateway"]; gateway.is_table()) {
            config.gateway.max_concurrency =
                read_uint(gateway["max_concurrency"], config.gateway.max_concurrency);
            config.gateway.admission_policy =
                gateway["admission_policy"].value_or(config.gateway.admission_policy);
            config.gateway.max_queue_depth =
                read_uint(gateway["max_queue_depth"], config.gateway.max_queue_depth);
            config.gateway.queue_timeout_ms =
                read_uint(gateway["queue_timeout_ms"], config.gateway.queue_timeout_ms);
        }

        // [validator]
        if (auto validator = tbl["validator"]; validator.is_table()) {
            config.validator.max_code_length =
                read_uint(validator["max_code_length"], config.validator.max_code_length);
            config.validator.block_severity =
                validator["block_severity"].value_or(config.validator.block_severity);
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            auto& l = config.limits;
            l.default_timeout_seconds = read_double(limits["default_timeout_seconds"],
                                                    l.default_timeout_seconds);
            l.default_memory_mb = read_uint(limits["default_memory_mb"], l.default_memory_mb);
            l.default_cpu_quota = read_double(limits["default_cpu_quota"], l.default_cpu_quota);
            l.max_timeout_seconds = read_double(limits["max_timeout_seconds"],
                                                l.max_timeout_seconds);
            l.max_memory_mb = read_uint(limits["max_memory_mb"], l.max_memory_mb);
            l.max_cpu_quota = read_double(limits["max_cpu_quota"], l.max_cpu_quota);
            l.allow_network = limits["allow_network"].value_or(l.allow_network);
        }

        // [runtime]
        if (auto runtime = tbl["runtime"]; runtime.is_table()) {
            auto& r = config.runtime;
            r.backend = runtime["backend"].value_or(r.backend);
            r.docker_binary = runtime["docker_binary"].value_or(r.docker_binary);
            r.work_root = runtime["work_root"].value_or(r.work_root.string());
            r.scratch_size_mb = read_uint(runtime["scratch_size_mb"], r.scratch_size_mb);
            r.pids_limit = read_uint(runtime["pids_limit"], r.pids_limit);
            r.open_files_limit = read_uint(runtime["open_files_limit"], r.open_files_limit);
            r.output_limit_kb = read_uint(runtime["output_limit_kb"], r.output_limit_kb);
            r.grace_period_ms = read_uint(runtime["grace_period_ms"], r.grace_period_ms);
            r.poll_interval_ms = read_uint(runtime["poll_interval_ms"], r.poll_interval_ms);
            r.sandbox_uid = read_uint(runtime["sandbox_uid"], r.sandbox_uid);
            r.sandbox_gid = read_uint(runtime["sandbox_gid"], r.sandbox_gid);

            // [runtime.provisioning]
            if (auto prov = runtime["provisioning"]; prov.is_table()) {
                auto& p = r.provisioning;
                p.max_attempts = read_uint(prov["max_attempts"], p.max_attempts);
                p.initial_backoff_ms = read_uint(prov["initial_backoff_ms"], p.initial_backoff_ms);
                p.backoff_multiplier = read_double(prov["backoff_multiplier"],
                                                   p.backoff_multiplier);
                p.max_backoff_ms = read_uint(prov["max_backoff_ms"], p.max_backoff_ms);
                p.timeout_ms = read_uint(prov["timeout_ms"], p.timeout_ms);
            }

            // [runtime.circuit_breaker]
            if (auto breaker = runtime["circuit_breaker"]; breaker.is_table()) {
                auto& b = r.circuit_breaker;
                b.failure_threshold = read_uint(breaker["failure_threshold"], b.failure_threshold);
                b.open_duration_ms = read_uint(breaker["open_duration_ms"], b.open_duration_ms);
            }
        }

        // [reaper]
        if (auto reaper = tbl["reaper"]; reaper.is_table()) {
            config.reaper.enabled = reaper["enabled"].value_or(config.reaper.enabled);
            config.reaper.interval_seconds =
                read_uint(reaper["interval_seconds"], config.reaper.interval_seconds);
            config.reaper.sandbox_ttl_seconds =
                read_uint(reaper["sandbox_ttl_seconds"], config.reaper.sandbox_ttl_seconds);
        }

        // [harness]
        if (auto harness = tbl["harness"]; harness.is_table()) {
            config.harness.stop_on_first_failure =
                harness["stop_on_first_failure"].value_or(config.harness.stop_on_first_failure);
            config.harness.min_test_slice_ms =
                read_uint(harness["min_test_slice_ms"], config.harness.min_test_slice_ms);
        }

        // [languages.<name>]
        if (auto languages = tbl["languages"].as_table()) {
            for (const auto& [name, node] : *languages) {
                if (const auto* lang = node.as_table()) {
                    if (auto image = (*lang)["image"].value<std::string>()) {
                        config.language_images[std::string{name.str()}] = *image;
                    }
                }
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(t.log_dir.string());
            t.log_level = telemetry["log_level"].value_or(t.log_level);
            t.max_file_size_mb = read_uint(telemetry["max_file_size_mb"], t.max_file_size_mb);
            t.rotate_count = read_uint(telemetry["rotate_count"], t.rotate_count);
            t.audit_log = telemetry["audit_log"].value_or(t.audit_log);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::ValidationError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& l = config.limits;
    if (config.gateway.max_concurrency == 0) {
        return Error{ErrorKind::ValidationError, "gateway.max_concurrency must be at least 1"};
    }
    if (config.gateway.admission_policy != "queue" && config.gateway.admission_policy != "reject") {
        return Error{ErrorKind::ValidationError,
                     "gateway.admission_policy must be \"queue\" or \"reject\""};
    }
    if (!parse_severity(config.validator.block_severity)) {
        return Error{ErrorKind::ValidationError,
                     "validator.block_severity is not a severity: " + config.validator.block_severity};
    }
    if (config.validator.max_code_length == 0) {
        return Error{ErrorKind::ValidationError, "validator.max_code_length must be positive"};
    }
    if (l.default_timeout_seconds <= 0.0 || l.default_timeout_seconds > l.max_timeout_seconds) {
        return Error{ErrorKind::ValidationError,
                     "limits.default_timeout_seconds must be in (0, max_timeout_seconds]"};
    }
    if (l.default_memory_mb == 0 || l.default_memory_mb > l.max_memory_mb) {
        return Error{ErrorKind::ValidationError,
                     "limits.default_memory_mb must be in (0, max_memory_mb]"};
    }
    if (l.default_cpu_quota <= 0.0 || l.default_cpu_quota > l.max_cpu_quota) {
        return Error{ErrorKind::ValidationError,
                     "limits.default_cpu_quota must be in (0, max_cpu_quota]"};
    }
    if (config.runtime.backend != "docker" && config.runtime.backend != "process") {
        return Error{ErrorKind::ValidationError,
                     "runtime.backend must be \"docker\" or \"process\""};
    }
    if (config.runtime.provisioning.max_attempts == 0) {
        return Error{ErrorKind::ValidationError,
                     "runtime.provisioning.max_attempts must be at least 1"};
    }
    if (config.reaper.sandbox_ttl_seconds <= static_cast<uint32_t>(l.max_timeout_seconds)) {
        return Error{ErrorKind::ValidationError,
                     "reaper.sandbox_ttl_seconds must exceed limits.max_timeout_seconds"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorKind::ValidationError,
                     "telemetry.log_level is not a level: " + config.telemetry.log_level};
    }
    return Result<void>{};
}

ResourceLimits default_limits(const LimitsConfig& limits) {
    return ResourceLimits{
        .timeout_seconds = limits.default_timeout_seconds,
        .memory_limit_bytes = limits.default_memory_mb * 1024 * 1024,
        .cpu_quota = limits.default_cpu_quota,
        .network_access = false
    };
}

}  // namespace sandbox_gate
