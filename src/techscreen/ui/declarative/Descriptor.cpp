#include <techscreen/ui/declarative/Descriptor.hpp>

#include <techscreen/ui/declarative/Schema.hpp>

namespace TS::UI::Declarative {

ComponentDescriptor::ComponentDescriptor(ComponentDescriptor const& other)
    : id(other.id)
    , kind(other.kind)
    , text(other.text)
    , label(other.label)
    , actionId(other.actionId)
    , bindingKey(other.bindingKey)
    , conditionKey(other.conditionKey)
    , valueKey(other.valueKey)
    , style(other.style)
    , props(other.props)
    , children(other.children)
    , itemTemplate(other.itemTemplate ? std::make_unique<ComponentDescriptor>(*other.itemTemplate) : nullptr) {}

auto ComponentDescriptor::operator=(ComponentDescriptor const& other) -> ComponentDescriptor& {
    if (this != &other) {
        ComponentDescriptor copy{other};
        *this = std::move(copy);
    }
    return *this;
}

auto ComponentDescriptor::subtreeSize() const -> std::size_t {
    std::size_t count = 1;
    for (auto const& child : children) {
        count += child.subtreeSize();
    }
    if (itemTemplate) {
        count += itemTemplate->subtreeSize();
    }
    return count;
}

auto operator==(ComponentDescriptor const& lhs, ComponentDescriptor const& rhs) -> bool {
    if (lhs.id != rhs.id || lhs.kind != rhs.kind || lhs.text != rhs.text || lhs.label != rhs.label
        || lhs.actionId != rhs.actionId || lhs.bindingKey != rhs.bindingKey || lhs.conditionKey != rhs.conditionKey
        || lhs.valueKey != rhs.valueKey || !(lhs.style == rhs.style) || !(lhs.props == rhs.props)
        || lhs.children.size() != rhs.children.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.children.size(); ++i) {
        if (!(lhs.children[i] == rhs.children[i])) {
            return false;
        }
    }
    if (static_cast<bool>(lhs.itemTemplate) != static_cast<bool>(rhs.itemTemplate)) {
        return false;
    }
    return !lhs.itemTemplate || *lhs.itemTemplate == *rhs.itemTemplate;
}

auto MakeComponent(ComponentKind kind, std::string id) -> ComponentDescriptor {
    ComponentDescriptor node;
    node.id   = std::move(id);
    node.kind = kind;

    auto const* schema = schema_for(kind);
    if (schema == nullptr) {
        node.props = UnresolvedProps{};
        return node;
    }
    switch (schema->group) {
    case PropertyGroup::Layout:
        node.props = LayoutProps{};
        break;
    case PropertyGroup::Content:
        node.props = ContentProps{};
        break;
    case PropertyGroup::Image:
        node.props = ImageProps{};
        break;
    case PropertyGroup::Progress:
        node.props = ProgressProps{};
        break;
    case PropertyGroup::Input:
        node.props = InputProps{};
        break;
    case PropertyGroup::Navigation:
        node.props = NavigationProps{};
        break;
    case PropertyGroup::Presentation:
        node.props = PresentationProps{};
        break;
    case PropertyGroup::Map:
        node.props = MapProps{};
        break;
    case PropertyGroup::Web:
        node.props = WebProps{};
        break;
    case PropertyGroup::Chart:
        node.props = ChartProps{};
        break;
    case PropertyGroup::Domain:
        node.props = DomainProps{};
        break;
    }
    return node;
}

} // namespace TS::UI::Declarative
