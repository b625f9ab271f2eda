#pragma once

#include "pyspot/concurrency/worker_pool.hpp"
#include "pyspot/core/string_field_processor.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace pyspot {

using OrderedJson = nlohmann::ordered_json;

struct WalkResult {
    OrderedJson value;
    std::vector<double> confidences;
    bool did_wrap = false;
    bool changed = false;
    bool dangerous = false;

    auto merge_flags(const WalkResult& child) -> void;
};

// Rebuilds a JSON tree, running the string field processor on every string leaf
class JsonWalker {
public:
    JsonWalker(const StringFieldProcessor& processor, size_t max_workers, size_t max_depth);

    auto wrap_code_in_json(const OrderedJson& value, const WrapTags& tags, bool parallel) const
        -> WalkResult;

private:
    auto walk(const OrderedJson& node, const WrapTags& tags, bool fan_out, size_t depth) const
        -> WalkResult;
    auto walk_array(const OrderedJson& node, const WrapTags& tags, bool fan_out, size_t depth) const
        -> WalkResult;

    const StringFieldProcessor& processor_;
    WorkerPool pool_;
    size_t max_depth_;
};

} // namespace pyspot
