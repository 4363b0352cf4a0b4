#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/route/Job.hpp>
#include <techscreen/store/InputValueStore.hpp>
#include <techscreen/ui/declarative/Descriptor.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TS::UI::Declarative {

// What resolution reads from: the job being rendered (if any), the local
// input values and the route's jobs for list expansion.
struct BindingContext {
    Store::InputValueStore const& store;
    Route::Job const*             entity = nullptr;
    std::span<Route::Job const>   jobs{};

    [[nodiscard]] auto withEntity(Route::Job const& job) const -> BindingContext {
        return BindingContext{store, &job, jobs};
    }
};

/*
 * Replaces every `{{variable}}` token with the text value stored under
 * `variable` (falling back to its global composite key), or nothing when
 * unset. Tokens do not nest and are not evaluated.
 */
[[nodiscard]] auto substituteTemplate(std::string_view text, Store::InputValueStore const& store) -> std::string;

// Bound entity field when both a binding key and an entity are present,
// otherwise the templated static text. Misses resolve to "".
[[nodiscard]] auto resolveText(ComponentDescriptor const& node, BindingContext const& context) -> std::string;
// Same order as resolveText, with `label` as the static fallback.
[[nodiscard]] auto resolveLabel(ComponentDescriptor const& node, BindingContext const& context) -> std::string;

// Nodes without a conditionKey always render their children. Otherwise the
// entity field must resolve to something other than "" or "false".
[[nodiscard]] auto shouldRenderChildren(ComponentDescriptor const& node, BindingContext const& context) -> bool;

// Composite key of an input or presentation node in this context.
[[nodiscard]] auto storeKeyFor(ComponentDescriptor const& node, BindingContext const& context)
    -> std::optional<std::string>;

struct ResolvedNode {
    std::string                id;
    ComponentKind              kind = ComponentKind::Text;
    std::string                text;
    std::string                label;
    std::optional<std::string> entityId;
    std::optional<std::string> actionId;
    std::optional<std::string> storeKey;
    // Current stored value in its queued text form.
    std::optional<std::string> value;
    bool                       visible = true;
    // Set on placeholders standing in for nodes that failed to decode or validate.
    std::optional<Error>       error;
    std::vector<ResolvedNode>  children;
};

[[nodiscard]] auto ResolveTree(ComponentDescriptor const& root, BindingContext const& context) -> ResolvedNode;
[[nodiscard]] auto EncodeResolved(ResolvedNode const& node) -> nlohmann::json;

} // namespace TS::UI::Declarative
