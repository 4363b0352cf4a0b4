#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/ui/declarative/Descriptor.hpp>

#include <optional>
#include <string>
#include <vector>

namespace TS::UI::Declarative {

/**
 * Checks the per-kind invariants of a single node and returns the first
 * violated rule as a ValidationFailed error. Rules run in a fixed order:
 * non-empty id, input kinds carry a valueKey, pickers and segmented controls
 * carry options, slider/stepper ranges are increasing, containers have
 * children, lists have an item template, navigation links a destination,
 * alerts and sheets a presentation key, images a source, and progress lies
 * in [0, 1]. Children are not visited.
 */
[[nodiscard]] auto ValidateComponent(ComponentDescriptor const& node) -> std::optional<Error>;

struct NodeIssue {
    std::string   id;
    ComponentKind kind;
    Error         error;
};

// Walks the whole tree (item templates included). Unresolved nodes are
// reported with their decode error.
[[nodiscard]] auto ValidateTree(ComponentDescriptor const& root) -> std::vector<NodeIssue>;

} // namespace TS::UI::Declarative
