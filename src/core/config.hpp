/**
 * @file config.hpp
 * @brief Service configuration with TOML deserialization.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace sandbox_gate {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8001;
    uint32_t worker_threads = 0;        ///< 0 = max_concurrency + 4
    uint64_t max_body_bytes = 256 * 1024;
    uint32_t read_timeout_ms = 10000;
};

struct GatewayConfig {
    uint32_t max_concurrency = 10;
    std::string admission_policy = "queue";     ///< "queue" or "reject"
    uint32_t max_queue_depth = 100;
    uint32_t queue_timeout_ms = 30000;
};

struct ValidatorConfig {
    uint64_t max_code_length = 50000;
    std::string block_severity = "critical";
};

/**
 * @brief Defaults applied to every request and the hard maxima no override
 *        may exceed.
 */
struct LimitsConfig {
    double default_timeout_seconds = 10.0;
    uint64_t default_memory_mb = 256;
    double default_cpu_quota = 1.0;

    double max_timeout_seconds = 30.0;
    uint64_t max_memory_mb = 512;
    double max_cpu_quota = 2.0;

    bool allow_network = false;
};

struct ProvisioningConfig {
    uint32_t max_attempts = 3;
    uint32_t initial_backoff_ms = 200;
    double backoff_multiplier = 2.0;
    uint32_t max_backoff_ms = 2000;
    uint32_t timeout_ms = 30000;        ///< Per provisioning attempt
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;
    uint32_t open_duration_ms = 30000;
};

struct RuntimeConfig {
    std::string backend = "docker";     ///< "docker" or "process"
    std::string docker_binary = "docker";
    std::filesystem::path work_root = "/tmp/sandbox-gate";
    uint64_t scratch_size_mb = 64;
    uint32_t pids_limit = 64;
    uint32_t open_files_limit = 256;
    uint64_t output_limit_kb = 1024;
    uint32_t grace_period_ms = 1000;
    uint32_t poll_interval_ms = 20;
    uint32_t sandbox_uid = 65534;
    uint32_t sandbox_gid = 65534;
    ProvisioningConfig provisioning;
    CircuitBreakerConfig circuit_breaker;
};

struct ReaperConfig {
    bool enabled = true;
    uint32_t interval_seconds = 60;
    uint32_t sandbox_ttl_seconds = 300;
};

struct HarnessConfig {
    bool stop_on_first_failure = false;
    uint32_t min_test_slice_ms = 100;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    bool audit_log = true;
};

/**
 * @brief Top-level service configuration.
 */
struct Config {
    ServerConfig server;
    GatewayConfig gateway;
    ValidatorConfig validator;
    LimitsConfig limits;
    RuntimeConfig runtime;
    ReaperConfig reaper;
    HarnessConfig harness;
    TelemetryConfig telemetry;
    std::map<std::string, std::string> language_images;   ///< [languages.<name>] image
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check cross-field consistency (defaults within maxima, known enums).
 */
Result<void> validate_config(const Config& config);

/// Request defaults derived from LimitsConfig.
[[nodiscard]] ResourceLimits default_limits(const LimitsConfig& limits);

}  // namespace sandbox_gate
