#include <scopegraph/graph/ErrorLog.hpp>

#include <algorithm>

namespace SG {

auto ErrorLog::append(NodeErrorRecord record) -> void {
    ++total_;
    if (capacity_ == 0) {
        return;
    }
    while (records_.size() >= capacity_) {
        records_.pop_front();
    }
    records_.push_back(std::move(record));
}

auto ErrorLog::recent(std::size_t count) const -> std::vector<NodeErrorRecord> {
    auto const take = std::min(count, records_.size());
    return {records_.end() - static_cast<std::ptrdiff_t>(take), records_.end()};
}

auto ErrorLog::all() const -> std::vector<NodeErrorRecord> {
    return {records_.begin(), records_.end()};
}

auto ErrorLog::clear() -> void {
    records_.clear();
    total_ = 0;
}

} // namespace SG
