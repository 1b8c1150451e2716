#include <scopegraph/graph/RuntimeOptions.hpp>
#include <scopegraph/path/DotPath.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <string>

namespace SG {

namespace {

constexpr auto kKnownKeys = std::to_array<std::string_view>({
    "outputs_prefix",
    "time_path",
    "delta_path",
    "max_events_per_tick",
    "error_log_capacity",
    "publish_outputs",
    "trace_ticks",
});

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto invalid_type(std::string_view key, std::string_view expected) -> Error {
    return Error{Error::Code::InvalidType, std::string{key} + " must be " + std::string{expected}};
}

auto read_path(nlohmann::json const& document, std::string_view key, std::string& target) -> Expected<void> {
    auto it = document.find(std::string{key});
    if (it == document.end()) {
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected(invalid_type(key, "a string"));
    }
    target = it->get<std::string>();
    return {};
}

auto read_count(nlohmann::json const& document, std::string_view key, std::size_t& target) -> Expected<void> {
    auto it = document.find(std::string{key});
    if (it == document.end()) {
        return {};
    }
    if (!it->is_number_unsigned()) {
        return std::unexpected(invalid_type(key, "a non-negative integer"));
    }
    target = it->get<std::size_t>();
    return {};
}

auto read_flag(nlohmann::json const& document, std::string_view key, bool& target) -> Expected<void> {
    auto it = document.find(std::string{key});
    if (it == document.end()) {
        return {};
    }
    if (!it->is_boolean()) {
        return std::unexpected(invalid_type(key, "a boolean"));
    }
    target = it->get<bool>();
    return {};
}

} // namespace

auto loadRuntimeOptions(std::string_view json) -> Expected<RuntimeOptions> {
    auto document = nlohmann::json::parse(json.begin(), json.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Runtime options are not valid JSON"});
    }
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::InvalidType, "Runtime options must be a JSON object"});
    }
    for (auto const& [key, value] : document.items()) {
        if (std::find(kKnownKeys.begin(), kKnownKeys.end(), key) == kKnownKeys.end()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Unknown runtime option: " + key});
        }
    }

    RuntimeOptions options;
    for (auto result : {read_path(document, "outputs_prefix", options.outputs_prefix),
                        read_path(document, "time_path", options.time_path),
                        read_path(document, "delta_path", options.delta_path),
                        read_count(document, "max_events_per_tick", options.max_events_per_tick),
                        read_count(document, "error_log_capacity", options.error_log_capacity),
                        read_flag(document, "publish_outputs", options.publish_outputs),
                        read_flag(document, "trace_ticks", options.trace_ticks)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    if (auto invalid = resetInvalidPaths(options); !invalid.empty()) {
        return std::unexpected(invalid.front());
    }
    return options;
}

auto resetInvalidPaths(RuntimeOptions& options) -> std::vector<Error> {
    RuntimeOptions const defaults;
    std::vector<Error>   invalid;
    auto check = [&](std::string RuntimeOptions::*field, std::string_view key) {
        if (DotPath::parse(options.*field)) {
            return;
        }
        invalid.emplace_back(Error::Code::InvalidPath, std::string{key} + ": " + options.*field);
        options.*field = defaults.*field;
    };
    check(&RuntimeOptions::outputs_prefix, "outputs_prefix");
    check(&RuntimeOptions::time_path, "time_path");
    check(&RuntimeOptions::delta_path, "delta_path");
    return invalid;
}

auto applyEnvironmentFlags(RuntimeOptions& options) -> void {
    if (envFlagEnabled("SCOPEGRAPH_TRACE_TICKS")) {
        options.trace_ticks = true;
    }
}

auto envFlagEnabled(char const* name) -> bool {
    return parse_truthy(std::getenv(name));
}

} // namespace SG
