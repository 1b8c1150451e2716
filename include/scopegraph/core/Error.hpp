#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace SG {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        // Registry
        PathNotFound,
        ScopeNotFound,
        TypeMismatch,
        InvalidPath,
        ScopeHasChildren,
        // Graph structure
        CycleDetected,
        DanglingEdge,
        DuplicateEdge,
        NodeNotFound,
        EdgeNotFound,
        IncompatiblePins,
        UnknownNodeKind,
        DuplicateNodeKind,
        // Node evaluation
        MissingInput,
        TypeCoercionFailed,
        Custom,
        // Configuration / input
        MalformedInput,
        InvalidType
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

enum class ErrorFamily {
    General,
    Registry,
    Graph,
    Evaluation
};

[[nodiscard]] inline auto errorFamily(Error::Code code) -> ErrorFamily {
    switch (code) {
    case Error::Code::PathNotFound:
    case Error::Code::ScopeNotFound:
    case Error::Code::TypeMismatch:
    case Error::Code::InvalidPath:
    case Error::Code::ScopeHasChildren:
        return ErrorFamily::Registry;
    case Error::Code::CycleDetected:
    case Error::Code::DanglingEdge:
    case Error::Code::DuplicateEdge:
    case Error::Code::NodeNotFound:
    case Error::Code::EdgeNotFound:
    case Error::Code::IncompatiblePins:
    case Error::Code::UnknownNodeKind:
    case Error::Code::DuplicateNodeKind:
        return ErrorFamily::Graph;
    case Error::Code::MissingInput:
    case Error::Code::TypeCoercionFailed:
    case Error::Code::Custom:
        return ErrorFamily::Evaluation;
    default:
        return ErrorFamily::General;
    }
}

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::PathNotFound:
        return "path_not_found";
    case Error::Code::ScopeNotFound:
        return "scope_not_found";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::ScopeHasChildren:
        return "scope_has_children";
    case Error::Code::CycleDetected:
        return "cycle_detected";
    case Error::Code::DanglingEdge:
        return "dangling_edge";
    case Error::Code::DuplicateEdge:
        return "duplicate_edge";
    case Error::Code::NodeNotFound:
        return "node_not_found";
    case Error::Code::EdgeNotFound:
        return "edge_not_found";
    case Error::Code::IncompatiblePins:
        return "incompatible_pins";
    case Error::Code::UnknownNodeKind:
        return "unknown_node_kind";
    case Error::Code::DuplicateNodeKind:
        return "duplicate_node_kind";
    case Error::Code::MissingInput:
        return "missing_input";
    case Error::Code::TypeCoercionFailed:
        return "type_coercion_failed";
    case Error::Code::Custom:
        return "custom";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidType:
        return "invalid_type";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace SG
