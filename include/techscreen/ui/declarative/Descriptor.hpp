#pragma once

#include <techscreen/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace TS::UI::Declarative {

enum class ComponentKind {
    // Layout containers
    VStack,
    HStack,
    List,
    Scroll,
    Grid,
    TabView,
    Section,
    // Basic elements
    Text,
    Button,
    Spacer,
    Image,
    Divider,
    ProgressView,
    // Form inputs
    TextField,
    Toggle,
    Slider,
    Picker,
    DatePicker,
    Stepper,
    SegmentedControl,
    // Navigation and presentation
    NavigationLink,
    ActionSheet,
    Alert,
    // Flow control
    Conditional,
    ForEach,
    // Advanced
    MapView,
    WebView,
    Chart,
    Gauge,
    // Equipment
    EquipmentInspector,
    EquipmentSelector,
    QrScanner,
    DigitalChecklist,
    MaintenanceScheduler,
    CalibrationTracker,
    // Weather
    WeatherDashboard,
    WeatherAlert,
    WeatherForecast,
    WeatherMetrics,
    SafetyIndicator,
    TreatmentConditions,
    // Chemical
    ChemicalSelector,
    DosageCalculator,
    ChemicalInventory,
    TreatmentLogger,
    EpaCompliance,
    MixingInstructions,
    ApplicationTracker,
    ChemicalSearch,
    // Never produced from a wire `type`; marks a child whose payload failed to decode.
    Unresolved,
};

struct PickerOption {
    std::string id;
    std::string text;
    std::string value;

    bool operator==(PickerOption const&) const = default;
};

struct ShadowOffset {
    double x = 0.0;
    double y = 2.0;

    bool operator==(ShadowOffset const&) const = default;
};

struct AnimationSpec {
    std::optional<std::string> type;
    std::optional<double>      duration;

    bool operator==(AnimationSpec const&) const = default;
};

struct TransitionSpec {
    std::optional<std::string> type;

    bool operator==(TransitionSpec const&) const = default;
};

// Presentation tokens are carried verbatim for the renderer.
struct StyleTokens {
    std::optional<std::string>    font;
    std::optional<std::string>    color;
    std::optional<std::string>    fontWeight;
    std::optional<std::string>    foregroundColor;
    std::optional<std::string>    backgroundColor;
    std::optional<std::string>    borderColor;
    std::optional<std::string>    shadowColor;
    std::optional<double>         padding;
    std::optional<double>         cornerRadius;
    std::optional<double>         borderWidth;
    std::optional<double>         shadowRadius;
    std::optional<double>         opacity;
    std::optional<double>         rotation;
    std::optional<double>         scale;
    std::optional<ShadowOffset>   shadowOffset;
    std::optional<AnimationSpec>  animation;
    std::optional<TransitionSpec> transition;

    bool operator==(StyleTokens const&) const = default;
};

struct LayoutProps {
    std::optional<double>      spacing;
    std::optional<int>         columns;
    std::optional<std::string> gridItemSize;
    std::optional<double>      gridItemMinSize;

    bool operator==(LayoutProps const&) const = default;
};

struct ContentProps {
    bool operator==(ContentProps const&) const = default;
};

struct ImageProps {
    std::optional<std::string> imageName;
    std::optional<std::string> url;

    bool operator==(ImageProps const&) const = default;
};

struct ProgressProps {
    std::optional<double> progress;
    std::optional<double> gaugeMin;
    std::optional<double> gaugeMax;

    bool operator==(ProgressProps const&) const = default;
};

struct InputProps {
    std::optional<std::string>               placeholder;
    std::optional<double>                    minValue;
    std::optional<double>                    maxValue;
    std::optional<double>                    step;
    std::optional<bool>                      showValue;
    std::optional<std::vector<PickerOption>> options;
    std::optional<std::string>               selectionMode;

    bool operator==(InputProps const&) const = default;
};

struct NavigationProps {
    std::optional<std::string> destination;

    bool operator==(NavigationProps const&) const = default;
};

struct PresentationProps {
    // Composite-key stem of the presentation flag (wire `isPresented`).
    std::optional<std::string> presentationKey;
    std::optional<std::string> title;
    std::optional<std::string> message;

    bool operator==(PresentationProps const&) const = default;
};

struct MapProps {
    std::optional<double> centerLatitude;
    std::optional<double> centerLongitude;
    std::optional<double> span;

    bool operator==(MapProps const&) const = default;
};

struct WebProps {
    std::optional<std::string> webURL;

    bool operator==(WebProps const&) const = default;
};

struct ChartProps {
    std::optional<std::string> chartType;
    std::optional<std::string> dataKey;

    bool operator==(ChartProps const&) const = default;
};

// Equipment, weather and chemical kinds: attributes owned by their domain managers.
struct DomainProps {
    nlohmann::json attributes = nlohmann::json::object();

    bool operator==(DomainProps const&) const = default;
};

struct UnresolvedProps {
    Error          error{Error::Code::MalformedInput, {}};
    nlohmann::json raw = nlohmann::json::object();

    bool operator==(UnresolvedProps const& other) const {
        return error.code == other.error.code && raw == other.raw;
    }
};

using ComponentProps = std::variant<LayoutProps,
                                    ContentProps,
                                    ImageProps,
                                    ProgressProps,
                                    InputProps,
                                    NavigationProps,
                                    PresentationProps,
                                    MapProps,
                                    WebProps,
                                    ChartProps,
                                    DomainProps,
                                    UnresolvedProps>;

struct ComponentDescriptor {
    ComponentDescriptor() = default;
    ComponentDescriptor(ComponentDescriptor const& other);
    ComponentDescriptor(ComponentDescriptor&&) noexcept = default;
    auto operator=(ComponentDescriptor const& other) -> ComponentDescriptor&;
    auto operator=(ComponentDescriptor&&) noexcept -> ComponentDescriptor& = default;
    ~ComponentDescriptor() = default;

    std::string                id;
    ComponentKind              kind = ComponentKind::Text;
    std::optional<std::string> text;
    std::optional<std::string> label;
    std::optional<std::string> actionId;
    // Entity field name (wire `key`).
    std::optional<std::string> bindingKey;
    std::optional<std::string> conditionKey;
    std::optional<std::string> valueKey;
    StyleTokens                style;
    ComponentProps             props = ContentProps{};

    std::vector<ComponentDescriptor>     children;
    // Row template for list kinds (wire `itemView`).
    std::unique_ptr<ComponentDescriptor> itemTemplate;

    [[nodiscard]] auto layout() const -> LayoutProps const*             { return std::get_if<LayoutProps>(&props); }
    [[nodiscard]] auto image() const -> ImageProps const*               { return std::get_if<ImageProps>(&props); }
    [[nodiscard]] auto progress() const -> ProgressProps const*         { return std::get_if<ProgressProps>(&props); }
    [[nodiscard]] auto input() const -> InputProps const*               { return std::get_if<InputProps>(&props); }
    [[nodiscard]] auto navigation() const -> NavigationProps const*     { return std::get_if<NavigationProps>(&props); }
    [[nodiscard]] auto presentation() const -> PresentationProps const* { return std::get_if<PresentationProps>(&props); }
    [[nodiscard]] auto unresolved() const -> UnresolvedProps const*     { return std::get_if<UnresolvedProps>(&props); }

    // Total node count including templates.
    [[nodiscard]] auto subtreeSize() const -> std::size_t;
};

[[nodiscard]] auto operator==(ComponentDescriptor const& lhs, ComponentDescriptor const& rhs) -> bool;

// Builds an empty node of `kind` with the property group the kind carries.
[[nodiscard]] auto MakeComponent(ComponentKind kind, std::string id = {}) -> ComponentDescriptor;

} // namespace TS::UI::Declarative
