#include <genspec/document/SpecValidator.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <iterator>

#include <parallel_hashmap/phmap.h>

namespace GS::Document {

namespace {

constexpr std::array<char const*, 3> kHoistedFields{"visible", "on", "watch"};

auto node_path(NodeId const& id) -> std::string {
    return JoinPointer("/nodes", encode_pointer_segment(id));
}

auto error_issue(std::string code, std::string message, std::string path) -> ValidationIssue {
    ValidationIssue issue;
    issue.severity = IssueSeverity::Error;
    issue.code     = std::move(code);
    issue.message  = std::move(message);
    issue.path     = std::move(path);
    return issue;
}

auto quoted(std::string_view text) -> std::string {
    std::string out{"\""};
    out.append(text);
    out.push_back('"');
    return out;
}

auto collect_reachable(Spec const& spec) -> phmap::flat_hash_set<NodeId> {
    phmap::flat_hash_set<NodeId> reachable;
    if (!spec.contains(spec.root)) {
        return reachable;
    }
    std::vector<NodeId> pending{spec.root};
    while (!pending.empty()) {
        auto id = std::move(pending.back());
        pending.pop_back();
        if (!reachable.insert(id).second) {
            continue;
        }
        for (auto const& child : spec.find(id)->children) {
            if (spec.contains(child) && !reachable.contains(child)) {
                pending.push_back(child);
            }
        }
    }
    return reachable;
}

auto check_node(NodeId const& id, Node const& node, Spec const& spec, std::vector<ValidationIssue>& issues) -> void {
    for (auto const& child : node.children) {
        if (spec.contains(child)) {
            continue;
        }
        auto issue = error_issue("missing_child",
                                 "Node " + quoted(id) + " references child " + quoted(child)
                                         + " which does not exist in the nodes map.",
                                 node_path(child));
        issue.nodeId = id;
        issues.push_back(std::move(issue));
    }

    for (auto const* field : kHoistedFields) {
        if (!node.props.is_object() || !node.props.contains(field)) {
            continue;
        }
        auto issue = error_issue(std::string{field} + "_in_props",
                                 "Node " + quoted(id) + " has " + quoted(field)
                                         + " inside \"props\". It should be a top-level field on the node (sibling of type/props/children).",
                                 node_path(id) + "/props/" + field);
        issue.nodeId      = id;
        issue.autoFixable = true;
        issues.push_back(std::move(issue));
    }

    if (node.repeat && node.repeat->statePath.empty()) {
        ValidationIssue issue;
        issue.severity = IssueSeverity::Warning;
        issue.code     = "repeat_missing_state_path";
        issue.message  = "Node " + quoted(id) + " has a repeat without a statePath; it renders no items.";
        issue.path     = node_path(id) + "/repeat";
        issue.nodeId   = id;
        issues.push_back(std::move(issue));
    }
}

// Node-level entries win over ones hoisted from props.
auto merge_maps(Json const& fromProps, Json const& existing) -> Json {
    if (!fromProps.is_object() || !existing.is_object()) {
        return existing;
    }
    Json merged = fromProps;
    for (auto const& [key, value] : existing.items()) {
        merged[key] = value;
    }
    return merged;
}

auto hoist(std::optional<Json>& slot, Json value, bool mergeMaps) -> void {
    if (!slot) {
        slot = std::move(value);
    } else if (mergeMaps) {
        slot = merge_maps(value, *slot);
    }
}

} // namespace

auto SpecValidationResult::errors() const -> std::vector<ValidationIssue> {
    std::vector<ValidationIssue> out;
    std::copy_if(this->issues.begin(), this->issues.end(), std::back_inserter(out), [](ValidationIssue const& issue) {
        return issue.severity == IssueSeverity::Error;
    });
    return out;
}

auto SpecValidationResult::hasBlockingErrors() const -> bool {
    return std::any_of(this->issues.begin(), this->issues.end(), [](ValidationIssue const& issue) {
        return issue.severity == IssueSeverity::Error && !issue.autoFixable;
    });
}

auto ValidateSpec(Spec const& spec, SpecValidationOptions const& options) -> SpecValidationResult {
    SpecValidationResult result;

    if (spec.root.empty()) {
        result.issues.push_back(error_issue("missing_root", "Spec has no root node defined.", "/root"));
        result.valid = false;
        return result;
    }

    if (!spec.contains(spec.root)) {
        auto issue   = error_issue("root_not_found", "Root node " + quoted(spec.root) + " not found in nodes map.", node_path(spec.root));
        issue.nodeId = spec.root;
        result.issues.push_back(std::move(issue));
    }

    if (spec.nodes.empty()) {
        result.issues.push_back(error_issue("empty_spec", "Spec has no nodes.", "/nodes"));
        result.valid = false;
        return result;
    }

    auto ids = SortedNodeIds(spec);
    for (auto const& id : ids) {
        check_node(id, *spec.find(id), spec, result.issues);
    }

    if (options.checkOrphans) {
        auto reachable = collect_reachable(spec);
        for (auto const& id : ids) {
            if (reachable.contains(id)) {
                continue;
            }
            ValidationIssue issue;
            issue.severity = IssueSeverity::Warning;
            issue.code     = "orphaned_node";
            issue.message  = "Node " + quoted(id) + " is not reachable from root " + quoted(spec.root) + ".";
            issue.path     = node_path(id);
            issue.nodeId   = id;
            result.issues.push_back(std::move(issue));
        }
    }

    result.valid = std::none_of(result.issues.begin(), result.issues.end(), [](ValidationIssue const& issue) {
        return issue.severity == IssueSeverity::Error;
    });
    gs_log("Validated spec: " + std::to_string(result.issues.size()) + " issue(s)", "Validator");
    return result;
}

auto AutoFixSpec(Spec const& spec) -> AutoFixResult {
    AutoFixResult result;
    result.spec = spec;

    for (auto const& id : SortedNodeIds(spec)) {
        auto const& original = *spec.find(id);
        if (!original.props.is_object()) {
            continue;
        }
        bool needsFix = std::any_of(kHoistedFields.begin(), kHoistedFields.end(), [&](char const* field) {
            return original.props.contains(field);
        });
        if (!needsFix) {
            continue;
        }

        Node fixed = original;
        for (auto const* field : kHoistedFields) {
            auto it = fixed.props.find(field);
            if (it == fixed.props.end()) {
                continue;
            }
            Json value = *it;
            fixed.props.erase(it);
            std::string_view name{field};
            if (name == "visible") {
                hoist(fixed.visible, std::move(value), false);
            } else if (name == "on") {
                hoist(fixed.on, std::move(value), true);
            } else {
                hoist(fixed.watch, std::move(value), true);
            }
            result.fixes.push_back("Moved " + quoted(field) + " from props to node level on " + quoted(id) + ".");
        }
        result.spec.nodes.insert_or_assign(id, std::make_shared<Node const>(std::move(fixed)));
    }

    if (!result.fixes.empty()) {
        gs_log("Auto-fixed " + std::to_string(result.fixes.size()) + " issue(s)", "Validator", "INFO");
    }
    return result;
}

auto FormatSpecIssues(std::vector<ValidationIssue> const& issues) -> std::string {
    std::string text;
    for (auto const& issue : issues) {
        if (issue.severity != IssueSeverity::Error) {
            continue;
        }
        if (text.empty()) {
            text = "The generated UI spec has the following errors:";
        }
        text.append("\n- ");
        text.append(issue.message);
    }
    return text;
}

auto severityName(IssueSeverity severity) -> std::string_view {
    return severity == IssueSeverity::Error ? "error" : "warning";
}

} // namespace GS::Document
