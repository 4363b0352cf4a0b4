#include <techscreen/ui/declarative/Resolver.hpp>

#include <techscreen/log/TaggedLogger.hpp>
#include <techscreen/ui/declarative/Schema.hpp>
#include <techscreen/ui/declarative/Validation.hpp>

namespace TS::UI::Declarative {
namespace {

auto entity_id(BindingContext const& context) -> std::optional<std::string_view> {
    if (context.entity == nullptr) {
        return std::nullopt;
    }
    return std::string_view{context.entity->id};
}

auto value_kind_for(ComponentDescriptor const& node) -> std::optional<Store::ValueKind> {
    switch (node.kind) {
    case ComponentKind::TextField:
        return Store::ValueKind::Text;
    case ComponentKind::Toggle:
        return Store::ValueKind::Toggle;
    case ComponentKind::Slider:
        return Store::ValueKind::Slider;
    case ComponentKind::Picker: {
        auto const* input = node.input();
        if (input != nullptr && input->selectionMode == "multiple") {
            return Store::ValueKind::MultiSelect;
        }
        return Store::ValueKind::Picker;
    }
    case ComponentKind::DatePicker:
        return Store::ValueKind::Date;
    case ComponentKind::Stepper:
        return Store::ValueKind::Stepper;
    case ComponentKind::SegmentedControl:
        return Store::ValueKind::Segmented;
    case ComponentKind::Alert:
    case ComponentKind::ActionSheet:
        return Store::ValueKind::Presentation;
    default:
        return std::nullopt;
    }
}

auto resolve_bound_or(ComponentDescriptor const& node,
                      BindingContext const& context,
                      std::optional<std::string> const& fallback) -> std::string {
    if (node.bindingKey && context.entity != nullptr) {
        return Route::JobFieldValue(*context.entity, *node.bindingKey).value_or("");
    }
    if (fallback) {
        return substituteTemplate(*fallback, context.store);
    }
    return {};
}

auto make_placeholder(ComponentDescriptor const& node, BindingContext const& context, Error error) -> ResolvedNode {
    ResolvedNode placeholder;
    placeholder.id    = node.id;
    placeholder.kind  = node.kind;
    placeholder.text  = describeError(error);
    placeholder.error = std::move(error);
    if (context.entity != nullptr) {
        placeholder.entityId = context.entity->id;
    }
    return placeholder;
}

auto resolve_node(ComponentDescriptor const& node, BindingContext const& context) -> ResolvedNode {
    if (auto const* unresolved = node.unresolved()) {
        return make_placeholder(node, context, unresolved->error);
    }
    if (auto invalid = ValidateComponent(node)) {
        ts_log("Placeholder for " + node.id + ": " + describeError(*invalid), "Resolver");
        return make_placeholder(node, context, std::move(*invalid));
    }

    ResolvedNode resolved;
    resolved.id       = node.id;
    resolved.kind     = node.kind;
    resolved.text     = resolveText(node, context);
    resolved.label    = resolveLabel(node, context);
    resolved.actionId = node.actionId;
    if (context.entity != nullptr) {
        resolved.entityId = context.entity->id;
    }

    if (auto const kind = value_kind_for(node)) {
        resolved.storeKey = storeKeyFor(node, context);
        if (resolved.storeKey) {
            resolved.value = context.store.valueText(*kind, *resolved.storeKey);
            if (*kind == Store::ValueKind::Presentation) {
                resolved.visible = context.store.presentation(*resolved.storeKey);
            }
        }
    }

    if (!shouldRenderChildren(node, context)) {
        if (node.kind == ComponentKind::Conditional) {
            resolved.visible = false;
        }
        return resolved;
    }

    switch (node.kind) {
    case ComponentKind::List:
        for (auto const& job : context.jobs) {
            resolved.children.push_back(resolve_node(*node.itemTemplate, context.withEntity(job)));
        }
        break;
    case ComponentKind::ForEach:
        for (auto const& job : context.jobs) {
            auto const jobContext = context.withEntity(job);
            for (auto const& child : node.children) {
                resolved.children.push_back(resolve_node(child, jobContext));
            }
        }
        break;
    default:
        resolved.children.reserve(node.children.size());
        for (auto const& child : node.children) {
            resolved.children.push_back(resolve_node(child, context));
        }
        break;
    }
    return resolved;
}

} // namespace

auto substituteTemplate(std::string_view text, Store::InputValueStore const& store) -> std::string {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '{' && i + 1 < text.size() && text[i + 1] == '{') {
            auto close = i + 2;
            while (close < text.size() && text[close] != '}') {
                ++close;
            }
            if (close > i + 2 && close + 1 < text.size() && text[close + 1] == '}') {
                std::string const variable{text.substr(i + 2, close - i - 2)};
                if (store.contains(Store::ValueKind::Text, variable)) {
                    out.append(store.text(variable));
                } else {
                    out.append(store.text(Store::makeCompositeKey(variable)));
                }
                i = close + 2;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

auto resolveText(ComponentDescriptor const& node, BindingContext const& context) -> std::string {
    return resolve_bound_or(node, context, node.text);
}

auto resolveLabel(ComponentDescriptor const& node, BindingContext const& context) -> std::string {
    return resolve_bound_or(node, context, node.label);
}

auto shouldRenderChildren(ComponentDescriptor const& node, BindingContext const& context) -> bool {
    if (!node.conditionKey) {
        return true;
    }
    if (context.entity == nullptr) {
        return false;
    }
    auto const value = Route::JobFieldValue(*context.entity, *node.conditionKey);
    return value && !value->empty() && *value != "false";
}

auto storeKeyFor(ComponentDescriptor const& node, BindingContext const& context) -> std::optional<std::string> {
    if (auto const* presentation = node.presentation()) {
        if (presentation->presentationKey) {
            return Store::makeCompositeKey(*presentation->presentationKey, entity_id(context));
        }
        return std::nullopt;
    }
    if (!node.valueKey) {
        return std::nullopt;
    }
    return Store::makeCompositeKey(*node.valueKey, entity_id(context));
}

auto ResolveTree(ComponentDescriptor const& root, BindingContext const& context) -> ResolvedNode {
    return resolve_node(root, context);
}

auto EncodeResolved(ResolvedNode const& node) -> nlohmann::json {
    nlohmann::json object{
        {"id", node.id},
        {"type", std::string{kind_name(node.kind)}},
        {"visible", node.visible},
    };
    if (!node.text.empty()) {
        object["text"] = node.text;
    }
    if (!node.label.empty()) {
        object["label"] = node.label;
    }
    if (node.entityId) {
        object["jobId"] = *node.entityId;
    }
    if (node.actionId) {
        object["actionId"] = *node.actionId;
    }
    if (node.storeKey) {
        object["storeKey"] = *node.storeKey;
    }
    if (node.value) {
        object["value"] = *node.value;
    }
    if (node.error) {
        object["error"] = describeError(*node.error);
    }
    if (!node.children.empty()) {
        auto children = nlohmann::json::array();
        for (auto const& child : node.children) {
            children.push_back(EncodeResolved(child));
        }
        object["children"] = std::move(children);
    }
    return object;
}

} // namespace TS::UI::Declarative
