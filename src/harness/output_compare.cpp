/**
 * @file output_compare.cpp
 * @brief Output normalization and structural JSON comparison using jsoncpp.
 */

#include "harness/output_compare.hpp"

#include <json/reader.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

namespace sandbox_gate {

namespace {

constexpr double kRelativeTolerance = 1e-9;

bool is_number(const Json::Value& value) {
    switch (value.type()) {
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue:
            return true;
        default:
            return false;
    }
}

bool numbers_equal(const Json::Value& lhs, const Json::Value& rhs) {
    if (lhs.isIntegral() && rhs.isIntegral()) {
        if (lhs.isInt64() && rhs.isInt64()) return lhs.asInt64() == rhs.asInt64();
        if (lhs.isUInt64() && rhs.isUInt64()) return lhs.asUInt64() == rhs.asUInt64();
        return false;   // one negative, one above int64 range
    }
    const double a = lhs.asDouble();
    const double b = rhs.asDouble();
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= kRelativeTolerance * scale;
}

}  // anonymous namespace

std::string normalize_output(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        const size_t end = text.find('\n', start);
        std::string_view line = text.substr(start, end == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : end - start);
        const size_t last = line.find_last_not_of(" \t\r\f\v");
        lines.push_back(last == std::string_view::npos ? std::string_view{}
                                                       : line.substr(0, last + 1));
        if (end == std::string_view::npos) break;
        start = end + 1;
    }

    while (!lines.empty() && lines.back().empty()) lines.pop_back();

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out.append(lines[i]);
    }
    return out;
}

std::optional<Json::Value> parse_json_document(std::string_view text) {
    if (text.empty()) return std::nullopt;

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    builder["allowSpecialFloats"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return std::nullopt;
    }
    return root;
}

bool json_equal(const Json::Value& lhs, const Json::Value& rhs) {
    if (is_number(lhs) && is_number(rhs)) return numbers_equal(lhs, rhs);
    if (lhs.type() != rhs.type()) return false;

    switch (lhs.type()) {
        case Json::arrayValue: {
            if (lhs.size() != rhs.size()) return false;
            for (Json::ArrayIndex i = 0; i < lhs.size(); ++i) {
                if (!json_equal(lhs[i], rhs[i])) return false;
            }
            return true;
        }
        case Json::objectValue: {
            if (lhs.size() != rhs.size()) return false;
            for (const auto& name : lhs.getMemberNames()) {
                if (!rhs.isMember(name)) return false;
                if (!json_equal(lhs[name], rhs[name])) return false;
            }
            return true;
        }
        default:
            return lhs == rhs;
    }
}

bool outputs_match(std::string_view actual, std::string_view expected) {
    const std::string a = normalize_output(actual);
    const std::string e = normalize_output(expected);
    if (a == e) return true;

    auto lhs = parse_json_document(a);
    if (!lhs) return false;
    auto rhs = parse_json_document(e);
    if (!rhs) return false;
    return json_equal(*lhs, *rhs);
}

}  // namespace sandbox_gate
