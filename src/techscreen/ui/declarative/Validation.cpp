#include <techscreen/ui/declarative/Validation.hpp>

#include <techscreen/log/TaggedLogger.hpp>
#include <techscreen/ui/declarative/Schema.hpp>

namespace TS::UI::Declarative {
namespace {

auto make_validation_error(std::string message) -> Error {
    return Error{Error::Code::ValidationFailed, std::move(message)};
}

auto has_increasing_range(InputProps const& input) -> bool {
    if (!input.minValue || !input.maxValue) {
        return true;
    }
    return *input.minValue < *input.maxValue;
}

void collect_issues(ComponentDescriptor const& node, std::vector<NodeIssue>& issues) {
    if (auto const* unresolved = node.unresolved()) {
        issues.push_back(NodeIssue{node.id, node.kind, unresolved->error});
    } else if (auto error = ValidateComponent(node)) {
        issues.push_back(NodeIssue{node.id, node.kind, std::move(*error)});
    }
    for (auto const& child : node.children) {
        collect_issues(child, issues);
    }
    if (node.itemTemplate) {
        collect_issues(*node.itemTemplate, issues);
    }
}

} // namespace

auto ValidateComponent(ComponentDescriptor const& node) -> std::optional<Error> {
    if (node.id.empty()) {
        return make_validation_error("Component missing required 'id'");
    }

    auto const* input = node.input();
    if (is_input_kind(node.kind) && !node.valueKey) {
        return make_validation_error("Input component missing required 'valueKey'");
    }

    if (node.kind == ComponentKind::Picker || node.kind == ComponentKind::SegmentedControl) {
        if (input == nullptr || !input->options || input->options->empty()) {
            return make_validation_error("Picker component missing 'options'");
        }
    }

    if (node.kind == ComponentKind::Slider && input != nullptr && !has_increasing_range(*input)) {
        return make_validation_error("Slider minValue must be less than maxValue");
    }
    if (node.kind == ComponentKind::Stepper && input != nullptr && !has_increasing_range(*input)) {
        return make_validation_error("Stepper minValue must be less than maxValue");
    }

    if (is_container_kind(node.kind) && node.children.empty()) {
        return make_validation_error("Container component missing 'children'");
    }

    if (node.kind == ComponentKind::List && !node.itemTemplate) {
        return make_validation_error("List component missing 'itemView'");
    }

    if (node.kind == ComponentKind::NavigationLink) {
        auto const* navigation = node.navigation();
        if (navigation == nullptr || !navigation->destination) {
            return make_validation_error("NavigationLink missing 'destination'");
        }
    }

    if (node.kind == ComponentKind::Alert || node.kind == ComponentKind::ActionSheet) {
        auto const* presentation = node.presentation();
        if (presentation == nullptr || !presentation->presentationKey) {
            return make_validation_error(std::string{kind_name(node.kind)} + " missing 'isPresented' key");
        }
    }

    if (node.kind == ComponentKind::Image) {
        auto const* image = node.image();
        if (image == nullptr || (!image->imageName && !image->url)) {
            return make_validation_error("Image component missing 'imageName' or 'url'");
        }
    }

    if (node.kind == ComponentKind::ProgressView) {
        auto const* progress = node.progress();
        if (progress != nullptr && progress->progress && (*progress->progress < 0.0 || *progress->progress > 1.0)) {
            return make_validation_error("ProgressView progress must be between 0 and 1");
        }
    }

    return std::nullopt;
}

auto ValidateTree(ComponentDescriptor const& root) -> std::vector<NodeIssue> {
    std::vector<NodeIssue> issues;
    collect_issues(root, issues);
    for (auto const& issue : issues) {
        ts_log("Node " + issue.id + " (" + std::string{kind_name(issue.kind)} + "): " + describeError(issue.error),
               "Validation");
    }
    return issues;
}

} // namespace TS::UI::Declarative
