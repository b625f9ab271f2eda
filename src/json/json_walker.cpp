#include "pyspot/json/json_walker.hpp"
#include "pyspot/core/errors.hpp"

namespace pyspot {

auto WalkResult::merge_flags(const WalkResult& child) -> void {
    confidences.insert(confidences.end(), child.confidences.begin(), child.confidences.end());
    did_wrap = did_wrap || child.did_wrap;
    changed = changed || child.changed;
    dangerous = dangerous || child.dangerous;
}

JsonWalker::JsonWalker(const StringFieldProcessor& processor, size_t max_workers, size_t max_depth)
    : processor_(processor), pool_(max_workers), max_depth_(max_depth) {}

auto JsonWalker::wrap_code_in_json(const OrderedJson& value, const WrapTags& tags, bool parallel) const
    -> WalkResult {
    return walk(value, tags, parallel, 0);
}

auto JsonWalker::walk(const OrderedJson& node, const WrapTags& tags, bool fan_out, size_t depth) const
    -> WalkResult {
    if (depth > max_depth_) {
        throw NestingTooDeepError(max_depth_);
    }

    WalkResult result;

    if (node.is_object()) {
        result.value = OrderedJson::object();
        for (const auto& item : node.items()) {
            auto child = walk(item.value(), tags, fan_out, depth + 1);
            result.merge_flags(child);
            result.value[item.key()] = std::move(child.value);
        }
        return result;
    }

    if (node.is_array()) {
        return walk_array(node, tags, fan_out, depth);
    }

    if (node.is_string()) {
        auto field = processor_.process(node.get_ref<const std::string&>(), tags);
        result.value = std::move(field.value);
        result.confidences = std::move(field.confidences);
        result.did_wrap = field.did_wrap;
        result.changed = field.changed;
        result.dangerous = field.dangerous;
        return result;
    }

    // Numbers, booleans, null
    result.value = node;
    return result;
}

auto JsonWalker::walk_array(const OrderedJson& node, const WrapTags& tags, bool fan_out,
                            size_t depth) const -> WalkResult {
    WalkResult result;
    result.value = OrderedJson::array();

    if (fan_out && node.size() > 1) {
        // Each worker owns one slot; nested arrays inside a worker stay sequential
        std::vector<WalkResult> children(node.size());
        pool_.parallel_for(node.size(), [&](size_t i) {
            children[i] = walk(node[i], tags, false, depth + 1);
        });
        for (auto& child : children) {
            result.merge_flags(child);
            result.value.push_back(std::move(child.value));
        }
        return result;
    }

    for (const auto& element : node) {
        auto child = walk(element, tags, fan_out, depth + 1);
        result.merge_flags(child);
        result.value.push_back(std::move(child.value));
    }
    return result;
}

} // namespace pyspot
