/**
 * @file request_id.cpp
 * @brief UUID and sandbox-name generation, timestamp formatting.
 */

#include "core/request_id.hpp"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace sandbox_gate {

namespace {

std::mt19937_64& rng() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::mutex& rng_mutex() {
    static std::mutex mutex;
    return mutex;
}

uint64_t next_random() {
    std::lock_guard lock(rng_mutex());
    return rng()();
}

void append_hex(std::ostringstream& oss, uint64_t value, int digits) {
    oss << std::hex << std::setfill('0') << std::setw(digits) << value;
}

}  // anonymous namespace

RequestId generate_request_id() {
    uint64_t hi = next_random();
    uint64_t lo = next_random();

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    append_hex(oss, hi >> 32, 8);
    oss << '-';
    append_hex(oss, (hi >> 16) & 0xFFFF, 4);
    oss << '-';
    append_hex(oss, hi & 0xFFFF, 4);
    oss << '-';
    append_hex(oss, lo >> 48, 4);
    oss << '-';
    append_hex(oss, lo & 0xFFFFFFFFFFFFULL, 12);
    return oss.str();
}

SandboxId generate_sandbox_id(std::string_view prefix) {
    std::ostringstream oss;
    oss << prefix << '-';
    append_hex(oss, next_random() & 0xFFFFFFFFFFFFULL, 12);
    return oss.str();
}

std::string format_timestamp(Timestamp ts) {
    auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace sandbox_gate
