#pragma once
#include <scopegraph/core/Error.hpp>
#include <scopegraph/graph/GraphTypes.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace SG {

// `node` is invalid for records that come from a rejected interaction event;
// `source` then names the event instead of a node kind.
struct NodeErrorRecord {
    std::uint64_t tick = 0;
    NodeId        node;
    std::string   source;
    Error         error;
};

/**
 * Bounded history of evaluation and event errors for the UI error panel.
 * Once full, appending drops the oldest record.
 */
class ErrorLog {
public:
    static constexpr std::size_t kDefaultCapacity = 256;

    explicit ErrorLog(std::size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    auto append(NodeErrorRecord record) -> void;
    // The newest `count` records, oldest first.
    auto recent(std::size_t count) const -> std::vector<NodeErrorRecord>;
    auto all() const -> std::vector<NodeErrorRecord>;
    auto clear() -> void;

    auto size() const -> std::size_t { return records_.size(); }
    auto empty() const -> bool { return records_.empty(); }
    auto capacity() const -> std::size_t { return capacity_; }
    // Records appended since construction or the last clear(), dropped ones included.
    auto totalRecorded() const -> std::uint64_t { return total_; }

private:
    std::size_t                 capacity_;
    std::deque<NodeErrorRecord> records_;
    std::uint64_t               total_ = 0;
};

} // namespace SG
