#include <scopegraph/logic/EvaluationContext.hpp>

namespace SG {

auto EvaluationContext::read(DotPath const& path) const -> Expected<Value> {
    return registry_.get(scope_, path);
}

auto EvaluationContext::read(std::string_view path) const -> Expected<Value> {
    return registry_.get(scope_, path);
}

auto EvaluationContext::readLocal(DotPath const& path) const -> Expected<Value> {
    return registry_.getLocal(scope_, path);
}

auto EvaluationContext::readLocal(std::string_view path) const -> Expected<Value> {
    auto parsed = DotPath::parse(path);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return registry_.getLocal(scope_, *parsed);
}

auto EvaluationContext::write(DotPath const& path, Value value) -> Expected<void> {
    return registry_.set(scope_, path, std::move(value));
}

auto EvaluationContext::write(std::string_view path, Value value) -> Expected<void> {
    return registry_.set(scope_, path, std::move(value));
}

} // namespace SG
