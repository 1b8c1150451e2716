#include <scopegraph/path/DotPath.hpp>

#include <cctype>
#include <utility>

namespace {

using SG::Error;
using SG::Expected;

auto make_path_error(std::string message) -> Error {
    return Error{Error::Code::InvalidPath, std::move(message)};
}

auto split_segments(std::string_view raw) -> Expected<std::vector<std::string>> {
    if (raw.empty()) {
        return std::unexpected(make_path_error("Empty path"));
    }

    std::vector<std::string> segments;
    std::size_t              pos = 0;
    while (true) {
        auto next = raw.find('.', pos);
        auto end  = (next == std::string_view::npos) ? raw.size() : next;
        if (end == pos) {
            return std::unexpected(make_path_error("Empty path segment in '" + std::string{raw} + "'"));
        }
        segments.emplace_back(raw.substr(pos, end - pos));
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }
    return segments;
}

} // namespace

namespace SG {

DotPath::DotPath(std::vector<std::string> segments)
    : segments_(std::move(segments)) {
    for (std::size_t idx = 0; idx < segments_.size(); ++idx) {
        if (idx > 0) {
            joined_.push_back('.');
        }
        joined_.append(segments_[idx]);
    }
}

auto DotPath::isValidSegment(std::string_view segment) -> bool {
    if (segment.empty()) {
        return false;
    }
    for (char ch : segment) {
        auto uch = static_cast<unsigned char>(ch);
        if (!std::isalnum(uch) && ch != '_' && ch != '-') {
            return false;
        }
    }
    return true;
}

auto DotPath::parse(std::string_view text) -> Expected<DotPath> {
    auto segments = split_segments(text);
    if (!segments) {
        return std::unexpected(segments.error());
    }
    return fromSegments(std::move(*segments));
}

auto DotPath::fromSegments(std::vector<std::string> segments) -> Expected<DotPath> {
    if (segments.empty()) {
        return std::unexpected(make_path_error("A path needs at least one segment"));
    }
    for (auto const& segment : segments) {
        if (!isValidSegment(segment)) {
            return std::unexpected(make_path_error("Invalid path segment '" + segment + "'"));
        }
    }
    return DotPath{std::move(segments)};
}

auto DotPath::child(std::string_view segment) const -> Expected<DotPath> {
    if (!isValidSegment(segment)) {
        return std::unexpected(make_path_error("Invalid path segment '" + std::string{segment} + "'"));
    }
    auto segments = segments_;
    segments.emplace_back(segment);
    return DotPath{std::move(segments)};
}

auto DotPath::concat(DotPath const& suffix) const -> DotPath {
    auto segments = segments_;
    segments.insert(segments.end(), suffix.segments_.begin(), suffix.segments_.end());
    return DotPath{std::move(segments)};
}

auto DotPath::parent() const -> Expected<DotPath> {
    if (segments_.size() <= 1) {
        return std::unexpected(make_path_error("'" + joined_ + "' has no parent"));
    }
    std::vector<std::string> segments(segments_.begin(), segments_.end() - 1);
    return DotPath{std::move(segments)};
}

auto DotPath::isPrefixOf(DotPath const& other) const -> bool {
    if (segments_.size() > other.segments_.size()) {
        return false;
    }
    for (std::size_t idx = 0; idx < segments_.size(); ++idx) {
        if (segments_[idx] != other.segments_[idx]) {
            return false;
        }
    }
    return true;
}

} // namespace SG
