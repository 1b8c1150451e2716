#pragma once
#include <scopegraph/core/Error.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace SG {

/**
 * Dot-delimited registry address such as "canvas.slider.value".
 *
 * A DotPath always holds at least one segment. Segments are non-empty and made
 * of letters, digits, '_' or '-'. Instances are immutable; deriving a child or
 * parent produces a new path.
 */
class DotPath {
public:
    static auto parse(std::string_view text) -> Expected<DotPath>;
    static auto fromSegments(std::vector<std::string> segments) -> Expected<DotPath>;
    static auto isValidSegment(std::string_view segment) -> bool;

    auto segments() const -> std::vector<std::string> const& { return segments_; }
    auto size() const -> std::size_t { return segments_.size(); }
    auto front() const -> std::string const& { return segments_.front(); }
    auto back() const -> std::string const& { return segments_.back(); }

    auto child(std::string_view segment) const -> Expected<DotPath>;
    auto concat(DotPath const& suffix) const -> DotPath;
    auto parent() const -> Expected<DotPath>;
    auto isPrefixOf(DotPath const& other) const -> bool;

    auto str() const -> std::string const& { return joined_; }

    auto operator==(DotPath const& other) const -> bool { return joined_ == other.joined_; }
    auto operator<(DotPath const& other) const -> bool { return joined_ < other.joined_; }

private:
    explicit DotPath(std::vector<std::string> segments);

    std::vector<std::string> segments_;
    std::string              joined_;
};

} // namespace SG

template <>
struct std::hash<SG::DotPath> {
    auto operator()(SG::DotPath const& path) const noexcept -> std::size_t {
        return std::hash<std::string>{}(path.str());
    }
};
