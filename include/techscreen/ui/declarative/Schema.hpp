#pragma once

#include <techscreen/ui/declarative/Descriptor.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace TS::UI::Declarative {

enum class PropertyGroup {
    Layout,
    Content,
    Image,
    Progress,
    Input,
    Navigation,
    Presentation,
    Map,
    Web,
    Chart,
    Domain,
};

enum class KindFamily {
    Layout,
    Basic,
    Input,
    Navigation,
    Logic,
    Advanced,
    Equipment,
    Weather,
    Chemical,
};

struct ComponentSchema {
    std::string_view wire_name;
    ComponentKind    kind;
    KindFamily       family;
    PropertyGroup    group;
    bool             requires_children;
    std::string_view description;
};

struct ScreenVersionInfo {
    int              version;
    std::string_view compatibility;
};

inline constexpr int kCurrentScreenVersion = 5;

[[nodiscard]] auto component_schemas() -> std::span<ComponentSchema const>;
[[nodiscard]] auto find_component_schema(std::string_view wire_name) -> ComponentSchema const*;
// Every enumerator except Unresolved has an entry.
[[nodiscard]] auto schema_for(ComponentKind kind) -> ComponentSchema const*;
[[nodiscard]] auto kind_name(ComponentKind kind) -> std::string_view;

[[nodiscard]] auto is_input_kind(ComponentKind kind) -> bool;
[[nodiscard]] auto is_container_kind(ComponentKind kind) -> bool;

[[nodiscard]] auto screen_versions() -> std::span<ScreenVersionInfo const>;
[[nodiscard]] auto is_screen_version_supported(int version) -> bool;
[[nodiscard]] auto compatibility_mode(int version) -> std::string_view;

} // namespace TS::UI::Declarative
