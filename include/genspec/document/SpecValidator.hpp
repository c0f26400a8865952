#pragma once
#include <genspec/document/Spec.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GS::Document {

enum class IssueSeverity {
    Error,
    Warning
};

struct ValidationIssue {
    IssueSeverity         severity = IssueSeverity::Error;
    std::string           code;
    std::string           message;
    std::string           path;
    std::optional<NodeId> nodeId;
    bool                  autoFixable = false;
};

struct SpecValidationOptions {
    // Orphans are harmless, so this check is opt-in.
    bool checkOrphans = false;
};

struct SpecValidationResult {
    bool                         valid = true;
    std::vector<ValidationIssue> issues;

    [[nodiscard]] auto errors() const -> std::vector<ValidationIssue>;
    [[nodiscard]] auto hasBlockingErrors() const -> bool;
};

struct AutoFixResult {
    Spec                     spec;
    std::vector<std::string> fixes;
};

/**
 * Structural checks for a generated document.
 *
 * Errors:    missing_root, root_not_found, empty_spec, missing_child,
 *            visible_in_props, on_in_props, watch_in_props
 * Warnings:  repeat_missing_state_path, orphaned_node (opt-in)
 *
 * The *_in_props errors are auto-fixable; everything else needs the model to
 * produce more output. Node issues are reported in node id order.
 */
[[nodiscard]] auto ValidateSpec(Spec const& spec, SpecValidationOptions const& options = {}) -> SpecValidationResult;

/**
 * Hoists visible/on/watch out of props onto the node. A value already on the
 * node wins; for on and watch the two maps are merged with the node's entries
 * taking precedence. Running it on its own output reports no fixes.
 */
[[nodiscard]] auto AutoFixSpec(Spec const& spec) -> AutoFixResult;

// Error lines for a repair prompt; empty when there are no errors.
[[nodiscard]] auto FormatSpecIssues(std::vector<ValidationIssue> const& issues) -> std::string;

[[nodiscard]] auto severityName(IssueSeverity severity) -> std::string_view;

} // namespace GS::Document
