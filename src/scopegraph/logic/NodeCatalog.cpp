#include <scopegraph/logic/BuiltinNodes.hpp>
#include <scopegraph/logic/ComputeNodes.hpp>
#include <scopegraph/logic/NodeCatalog.hpp>

#include "scopegraph/log/TaggedLogger.hpp"

#include <algorithm>

namespace SG {

auto NodeCatalog::withBuiltins() -> NodeCatalog {
    NodeCatalog catalog;
    auto add = [&catalog](std::string name, Factory factory) {
        if (auto registered = catalog.registerKind(name, std::move(factory)); !registered) {
            sg_log("Could not register built-in kind " + name + ": " + describeError(registered.error()),
                   "GraphRuntime",
                   "ERROR");
        }
    };

    add("constant", [] { return std::make_unique<ConstantNode>(); });
    add("add", [] { return std::make_unique<ArithmeticNode>(ArithmeticNode::Operation::Add); });
    add("subtract", [] { return std::make_unique<ArithmeticNode>(ArithmeticNode::Operation::Subtract); });
    add("multiply", [] { return std::make_unique<ArithmeticNode>(ArithmeticNode::Operation::Multiply); });
    add("divide", [] { return std::make_unique<ArithmeticNode>(ArithmeticNode::Operation::Divide); });
    add("compare", [] { return std::make_unique<CompareNode>(); });
    add("branch", [] { return std::make_unique<BranchNode>(); });
    add("clamp", [] { return std::make_unique<ClampNode>(); });
    add("concat", [] { return std::make_unique<ConcatNode>(); });
    add("timer", [] { return std::make_unique<TimerNode>(); });
    add("slider", [] { return std::make_unique<SliderNode>(); });
    add("button", [] { return std::make_unique<ButtonNode>(); });
    add("math", [] { return std::make_unique<MathNode>(); });
    add("string", [] { return std::make_unique<StringNode>(); });
    add("validation", [] { return std::make_unique<ValidationNode>(); });
    add("calculator", [] { return std::make_unique<CalculatorNode>(); });
    return catalog;
}

auto NodeCatalog::registerKind(std::string name, Factory factory) -> Expected<void> {
    if (entries_.contains(name)) {
        return std::unexpected(Error{Error::Code::DuplicateNodeKind, "Node kind already registered: " + name});
    }
    if (!factory) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Empty factory for node kind: " + name});
    }
    auto prototype = factory();
    if (!prototype) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Factory produced no node for kind: " + name});
    }
    auto signature = prototype->signature();
    signature.kind = name;
    sg_log("Registered node kind " + name, "GraphRuntime");
    entries_.emplace(std::move(name), Entry{std::move(factory), std::move(signature)});
    return {};
}

auto NodeCatalog::create(std::string_view kind) const -> Expected<std::unique_ptr<NodeKind>> {
    auto it = entries_.find(std::string{kind});
    if (it == entries_.end()) {
        return std::unexpected(Error{Error::Code::UnknownNodeKind, "Unknown node kind: " + std::string{kind}});
    }
    auto node = it->second.factory();
    if (!node) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Factory produced no node for kind: " + it->first});
    }
    return node;
}

auto NodeCatalog::signature(std::string_view kind) const -> Expected<NodeSignature> {
    auto it = entries_.find(std::string{kind});
    if (it == entries_.end()) {
        return std::unexpected(Error{Error::Code::UnknownNodeKind, "Unknown node kind: " + std::string{kind}});
    }
    return it->second.signature;
}

auto NodeCatalog::contains(std::string_view kind) const -> bool {
    return entries_.contains(std::string{kind});
}

auto NodeCatalog::kinds() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (auto const& [name, entry] : entries_) {
        names.push_back(name);
    }
    std::ranges::sort(names);
    return names;
}

} // namespace SG
