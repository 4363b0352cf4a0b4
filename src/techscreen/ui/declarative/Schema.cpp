#include <techscreen/ui/declarative/Schema.hpp>

#include <algorithm>

namespace TS::UI::Declarative {
namespace {

using K = ComponentKind;
using F = KindFamily;
using G = PropertyGroup;

constexpr ComponentSchema kComponentSchemas[] = {
    {"vstack", K::VStack, F::Layout, G::Layout, true, "Vertical stack of children."},
    {"hstack", K::HStack, F::Layout, G::Layout, true, "Horizontal stack of children."},
    {"list", K::List, F::Layout, G::Layout, false, "Reorderable list rendering `itemView` once per job."},
    {"scroll", K::Scroll, F::Layout, G::Layout, true, "Scrollable vertical container."},
    {"grid", K::Grid, F::Layout, G::Layout, true, "Grid with fixed, flexible or adaptive columns."},
    {"tabView", K::TabView, F::Layout, G::Layout, false, "Tabbed container; each child is a tab."},
    {"section", K::Section, F::Layout, G::Layout, true, "Grouped content with optional header text."},

    {"text", K::Text, F::Basic, G::Content, false, "Static, bound or templated text."},
    {"button", K::Button, F::Basic, G::Content, false, "Button dispatching `actionId` with the current job."},
    {"spacer", K::Spacer, F::Basic, G::Content, false, "Flexible space."},
    {"image", K::Image, F::Basic, G::Image, false, "Bundled asset (`imageName`) or remote `url`."},
    {"divider", K::Divider, F::Basic, G::Content, false, "Separator line."},
    {"progressView", K::ProgressView, F::Basic, G::Progress, false, "Determinate (0..1) or indeterminate progress."},

    {"textField", K::TextField, F::Input, G::Input, false, "Text input bound to the text map."},
    {"toggle", K::Toggle, F::Input, G::Input, false, "Boolean switch bound to the toggle map."},
    {"slider", K::Slider, F::Input, G::Input, false, "Continuous value within [minValue, maxValue]."},
    {"picker", K::Picker, F::Input, G::Input, false, "Single or multiple selection from `options`."},
    {"datePicker", K::DatePicker, F::Input, G::Input, false, "Date selection bound to the date map."},
    {"stepper", K::Stepper, F::Input, G::Input, false, "Stepped numeric value within [minValue, maxValue]."},
    {"segmentedControl", K::SegmentedControl, F::Input, G::Input, false, "Index selection across `options`."},

    {"navigationLink", K::NavigationLink, F::Navigation, G::Navigation, false, "Pushes the screen named by `destination`."},
    {"actionSheet", K::ActionSheet, F::Navigation, G::Presentation, false, "Sheet shown while its presentation flag is set."},
    {"alert", K::Alert, F::Navigation, G::Presentation, false, "Alert shown while its presentation flag is set."},

    {"conditional", K::Conditional, F::Logic, G::Layout, false, "Renders children only when `conditionKey` resolves truthy."},
    {"forEach", K::ForEach, F::Logic, G::Layout, false, "Renders children once per job."},

    {"mapView", K::MapView, F::Advanced, G::Map, false, "Map centred on a coordinate."},
    {"webView", K::WebView, F::Advanced, G::Web, false, "Embedded web content."},
    {"chart", K::Chart, F::Advanced, G::Chart, false, "Line, bar or pie chart fed by `dataKey`."},
    {"gauge", K::Gauge, F::Advanced, G::Progress, false, "Gauge within [gaugeMin, gaugeMax]."},

    {"equipmentInspector", K::EquipmentInspector, F::Equipment, G::Domain, false, "Equipment inspection checklist."},
    {"equipmentSelector", K::EquipmentSelector, F::Equipment, G::Domain, false, "Equipment picker."},
    {"qrScanner", K::QrScanner, F::Equipment, G::Domain, false, "QR equipment identification."},
    {"digitalChecklist", K::DigitalChecklist, F::Equipment, G::Domain, false, "Checklist driven by a template."},
    {"maintenanceScheduler", K::MaintenanceScheduler, F::Equipment, G::Domain, false, "Maintenance scheduling."},
    {"calibrationTracker", K::CalibrationTracker, F::Equipment, G::Domain, false, "Calibration history."},

    {"weatherDashboard", K::WeatherDashboard, F::Weather, G::Domain, false, "Current conditions summary."},
    {"weatherAlert", K::WeatherAlert, F::Weather, G::Domain, false, "Active weather alerts."},
    {"weatherForecast", K::WeatherForecast, F::Weather, G::Domain, false, "Forecast strip."},
    {"weatherMetrics", K::WeatherMetrics, F::Weather, G::Domain, false, "Selected weather metrics."},
    {"safetyIndicator", K::SafetyIndicator, F::Weather, G::Domain, false, "Treatment safety indicator."},
    {"treatmentConditions", K::TreatmentConditions, F::Weather, G::Domain, false, "Treatment condition checks."},

    {"chemicalSelector", K::ChemicalSelector, F::Chemical, G::Domain, false, "Chemical picker."},
    {"dosageCalculator", K::DosageCalculator, F::Chemical, G::Domain, false, "Dosage calculation."},
    {"chemicalInventory", K::ChemicalInventory, F::Chemical, G::Domain, false, "Inventory levels."},
    {"treatmentLogger", K::TreatmentLogger, F::Chemical, G::Domain, false, "Treatment log entry."},
    {"epaCompliance", K::EpaCompliance, F::Chemical, G::Domain, false, "EPA compliance checks."},
    {"mixingInstructions", K::MixingInstructions, F::Chemical, G::Domain, false, "Mixing instructions."},
    {"applicationTracker", K::ApplicationTracker, F::Chemical, G::Domain, false, "Application tracking."},
    {"chemicalSearch", K::ChemicalSearch, F::Chemical, G::Domain, false, "Chemical search."},
};

constexpr ScreenVersionInfo kScreenVersions[] = {
    {1, "Basic components only"},
    {2, "Added images and conditionals"},
    {3, "Form inputs and styling"},
    {4, "Full component library"},
    {5, "Complete core components with enhanced validation"},
};

} // namespace

auto component_schemas() -> std::span<ComponentSchema const> {
    return {std::begin(kComponentSchemas), std::end(kComponentSchemas)};
}

auto find_component_schema(std::string_view wire_name) -> ComponentSchema const* {
    auto const schemas = component_schemas();
    auto const it      = std::find_if(schemas.begin(), schemas.end(), [wire_name](ComponentSchema const& schema) {
        return schema.wire_name == wire_name;
    });
    if (it == schemas.end()) {
        return nullptr;
    }
    return &(*it);
}

auto schema_for(ComponentKind kind) -> ComponentSchema const* {
    auto const schemas = component_schemas();
    auto const it =
        std::find_if(schemas.begin(), schemas.end(), [kind](ComponentSchema const& schema) { return schema.kind == kind; });
    if (it == schemas.end()) {
        return nullptr;
    }
    return &(*it);
}

auto kind_name(ComponentKind kind) -> std::string_view {
    if (auto const* schema = schema_for(kind)) {
        return schema->wire_name;
    }
    return "unresolved";
}

auto is_input_kind(ComponentKind kind) -> bool {
    auto const* schema = schema_for(kind);
    return schema != nullptr && schema->family == KindFamily::Input;
}

auto is_container_kind(ComponentKind kind) -> bool {
    auto const* schema = schema_for(kind);
    return schema != nullptr && schema->requires_children;
}

auto screen_versions() -> std::span<ScreenVersionInfo const> {
    return {std::begin(kScreenVersions), std::end(kScreenVersions)};
}

auto is_screen_version_supported(int version) -> bool {
    auto const versions = screen_versions();
    return std::any_of(versions.begin(), versions.end(), [version](ScreenVersionInfo const& info) {
        return info.version == version;
    });
}

auto compatibility_mode(int version) -> std::string_view {
    for (auto const& info : screen_versions()) {
        if (info.version == version) {
            return info.compatibility;
        }
    }
    return "Unsupported version";
}

} // namespace TS::UI::Declarative
