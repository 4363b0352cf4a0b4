#include <techscreen/ui/declarative/ScreenCodec.hpp>

#include <techscreen/core/Identifiers.hpp>
#include <techscreen/ui/declarative/Schema.hpp>

#include <techscreen/log/TaggedLogger.hpp>

#include <array>
#include <string>
#include <utility>

namespace TS::UI::Declarative {
namespace {

using json = nlohmann::json;

constexpr std::array<std::string_view, 27> kCommonKeys = {
    "id",           "type",         "key",          "text",          "label",
    "actionId",     "font",         "color",        "children",      "itemView",
    "conditionKey", "valueKey",     "padding",      "foregroundColor", "backgroundColor",
    "cornerRadius", "fontWeight",   "borderWidth",  "borderColor",   "shadowRadius",
    "shadowColor",  "shadowOffset", "opacity",      "rotation",      "scale",
    "animation",    "transition",
};

auto is_common_key(std::string_view key) -> bool {
    for (auto const& common : kCommonKeys) {
        if (common == key) {
            return true;
        }
    }
    return false;
}

auto make_codec_error(std::string message, Error::Code code = Error::Code::MalformedInput) -> Error {
    return Error{code, std::move(message)};
}

// Reads optional typed fields from one JSON object and remembers the first mismatch.
class FieldReader {
public:
    explicit FieldReader(json const& object)
        : object_(object) {}

    void string(char const* key, std::optional<std::string>& out) {
        if (auto const* value = lookup(key)) {
            if (!value->is_string()) {
                fail(key, "a string");
                return;
            }
            out = value->get<std::string>();
        }
    }

    void number(char const* key, std::optional<double>& out) {
        if (auto const* value = lookup(key)) {
            if (!value->is_number()) {
                fail(key, "a number");
                return;
            }
            out = value->get<double>();
        }
    }

    void integer(char const* key, std::optional<int>& out) {
        if (auto const* value = lookup(key)) {
            if (!value->is_number_integer()) {
                fail(key, "an integer");
                return;
            }
            out = value->get<int>();
        }
    }

    void boolean(char const* key, std::optional<bool>& out) {
        if (auto const* value = lookup(key)) {
            if (!value->is_boolean()) {
                fail(key, "a boolean");
                return;
            }
            out = value->get<bool>();
        }
    }

    void shadow(char const* key, std::optional<ShadowOffset>& out) {
        auto const* value = lookup(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_object()) {
            fail(key, "an object");
            return;
        }
        ShadowOffset offset{};
        auto const x = value->find("x");
        auto const y = value->find("y");
        if (x == value->end() || !x->is_number() || y == value->end() || !y->is_number()) {
            fail(key, "numeric 'x' and 'y'");
            return;
        }
        offset.x = x->get<double>();
        offset.y = y->get<double>();
        out      = offset;
    }

    void animation(char const* key, std::optional<AnimationSpec>& out) {
        auto const* value = lookup(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_object()) {
            fail(key, "an object");
            return;
        }
        FieldReader nested{*value};
        AnimationSpec spec{};
        nested.string("type", spec.type);
        nested.number("duration", spec.duration);
        adopt(key, nested);
        out = std::move(spec);
    }

    void transition(char const* key, std::optional<TransitionSpec>& out) {
        auto const* value = lookup(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_object()) {
            fail(key, "an object");
            return;
        }
        FieldReader nested{*value};
        TransitionSpec spec{};
        nested.string("type", spec.type);
        adopt(key, nested);
        out = std::move(spec);
    }

    void options(char const* key, std::optional<std::vector<PickerOption>>& out) {
        auto const* value = lookup(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_array()) {
            fail(key, "an array");
            return;
        }
        std::vector<PickerOption> parsed;
        parsed.reserve(value->size());
        for (auto const& entry : *value) {
            if (!entry.is_object()) {
                fail(key, "objects with 'text' and 'value'");
                return;
            }
            auto const text  = entry.find("text");
            auto const val   = entry.find("value");
            auto const ident = entry.find("id");
            if (text == entry.end() || !text->is_string() || val == entry.end() || !val->is_string()) {
                fail(key, "objects with 'text' and 'value'");
                return;
            }
            PickerOption option{};
            option.text  = text->get<std::string>();
            option.value = val->get<std::string>();
            if (ident != entry.end() && ident->is_string()) {
                option.id = ident->get<std::string>();
            } else {
                option.id = freshId();
            }
            parsed.push_back(std::move(option));
        }
        out = std::move(parsed);
    }

    [[nodiscard]] auto error() const -> std::optional<Error> const& { return error_; }

private:
    auto lookup(char const* key) const -> json const* {
        if (error_) {
            return nullptr;
        }
        auto const it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            return nullptr;
        }
        return &(*it);
    }

    void fail(std::string_view key, std::string_view expected) {
        if (error_) {
            return;
        }
        std::string message = "field '";
        message.append(key);
        message.append("' expects ");
        message.append(expected);
        error_ = make_codec_error(std::move(message));
    }

    void adopt(std::string_view key, FieldReader const& nested) {
        if (nested.error_ && !error_) {
            std::string message{key};
            message.push_back('.');
            message.append(nested.error_->message.value_or(""));
            error_ = make_codec_error(std::move(message));
        }
    }

    json const&          object_;
    std::optional<Error> error_;
};

auto decode_style(FieldReader& reader) -> StyleTokens {
    StyleTokens style{};
    reader.string("font", style.font);
    reader.string("color", style.color);
    reader.string("fontWeight", style.fontWeight);
    reader.string("foregroundColor", style.foregroundColor);
    reader.string("backgroundColor", style.backgroundColor);
    reader.string("borderColor", style.borderColor);
    reader.string("shadowColor", style.shadowColor);
    reader.number("padding", style.padding);
    reader.number("cornerRadius", style.cornerRadius);
    reader.number("borderWidth", style.borderWidth);
    reader.number("shadowRadius", style.shadowRadius);
    reader.number("opacity", style.opacity);
    reader.number("rotation", style.rotation);
    reader.number("scale", style.scale);
    reader.shadow("shadowOffset", style.shadowOffset);
    reader.animation("animation", style.animation);
    reader.transition("transition", style.transition);
    return style;
}

auto decode_props(PropertyGroup group, FieldReader& reader, json const& object) -> ComponentProps {
    switch (group) {
    case PropertyGroup::Layout: {
        LayoutProps props{};
        reader.number("spacing", props.spacing);
        reader.integer("columns", props.columns);
        reader.string("gridItemSize", props.gridItemSize);
        reader.number("gridItemMinSize", props.gridItemMinSize);
        return props;
    }
    case PropertyGroup::Content:
        return ContentProps{};
    case PropertyGroup::Image: {
        ImageProps props{};
        reader.string("imageName", props.imageName);
        reader.string("url", props.url);
        return props;
    }
    case PropertyGroup::Progress: {
        ProgressProps props{};
        reader.number("progress", props.progress);
        reader.number("gaugeMin", props.gaugeMin);
        reader.number("gaugeMax", props.gaugeMax);
        return props;
    }
    case PropertyGroup::Input: {
        InputProps props{};
        reader.string("placeholder", props.placeholder);
        reader.number("minValue", props.minValue);
        reader.number("maxValue", props.maxValue);
        reader.number("step", props.step);
        reader.boolean("showValue", props.showValue);
        reader.options("options", props.options);
        reader.string("selectionMode", props.selectionMode);
        return props;
    }
    case PropertyGroup::Navigation: {
        NavigationProps props{};
        reader.string("destination", props.destination);
        return props;
    }
    case PropertyGroup::Presentation: {
        PresentationProps props{};
        reader.string("isPresented", props.presentationKey);
        reader.string("title", props.title);
        reader.string("message", props.message);
        return props;
    }
    case PropertyGroup::Map: {
        MapProps props{};
        reader.number("centerLatitude", props.centerLatitude);
        reader.number("centerLongitude", props.centerLongitude);
        reader.number("span", props.span);
        return props;
    }
    case PropertyGroup::Web: {
        WebProps props{};
        reader.string("webURL", props.webURL);
        return props;
    }
    case PropertyGroup::Chart: {
        ChartProps props{};
        reader.string("chartType", props.chartType);
        reader.string("dataKey", props.dataKey);
        return props;
    }
    case PropertyGroup::Domain: {
        DomainProps props{};
        for (auto const& [key, value] : object.items()) {
            if (!is_common_key(key) && !value.is_null()) {
                props.attributes[key] = value;
            }
        }
        return props;
    }
    }
    return ContentProps{};
}

auto decode_node(json const& payload, std::size_t depth, DecodeOptions const& options)
    -> Expected<ComponentDescriptor>;

// A malformed child stays in the tree as an Unresolved placeholder.
auto decode_child(json const& payload, std::size_t depth, DecodeOptions const& options) -> ComponentDescriptor {
    auto decoded = decode_node(payload, depth, options);
    if (decoded) {
        return std::move(*decoded);
    }

    ComponentDescriptor placeholder;
    placeholder.kind = ComponentKind::Unresolved;
    UnresolvedProps unresolved{};
    unresolved.error = decoded.error();

    // raw always carries the resolved id as a string so the placeholder
    // re-decodes to itself. Payloads whose id cannot hold it are wrapped.
    auto wrap = payload.is_object();
    if (wrap) {
        auto const id = payload.find("id");
        wrap          = id != payload.end() && !id->is_null() && !id->is_string();
        if (id != payload.end() && id->is_string()) {
            placeholder.id = id->get<std::string>();
        }
    } else {
        wrap = true;
    }
    if (placeholder.id.empty()) {
        placeholder.id = freshId();
    }
    if (wrap) {
        unresolved.raw = json::object({{"id", placeholder.id}, {"payload", payload}});
    } else {
        unresolved.raw       = payload;
        unresolved.raw["id"] = placeholder.id;
    }
    ts_log("Unresolved child " + placeholder.id + ": " + describeError(unresolved.error), "Codec");
    placeholder.props = std::move(unresolved);
    return placeholder;
}

auto decode_node(json const& payload, std::size_t depth, DecodeOptions const& options)
    -> Expected<ComponentDescriptor> {
    if (depth > options.max_depth) {
        return std::unexpected(make_codec_error("component tree exceeds maximum depth"));
    }
    if (!payload.is_object()) {
        return std::unexpected(make_codec_error("component must be a JSON object"));
    }

    auto const type = payload.find("type");
    if (type == payload.end() || !type->is_string()) {
        return std::unexpected(make_codec_error("component missing required 'type'"));
    }
    auto const  wire_name = type->get<std::string>();
    auto const* schema    = find_component_schema(wire_name);
    if (schema == nullptr) {
        return std::unexpected(make_codec_error("unknown component type '" + wire_name + "'", Error::Code::UnknownKind));
    }

    ComponentDescriptor node;
    node.kind = schema->kind;

    FieldReader reader{payload};
    std::optional<std::string> id;
    reader.string("id", id);
    reader.string("text", node.text);
    reader.string("label", node.label);
    reader.string("actionId", node.actionId);
    reader.string("key", node.bindingKey);
    reader.string("conditionKey", node.conditionKey);
    reader.string("valueKey", node.valueKey);
    node.style = decode_style(reader);
    node.props = decode_props(schema->group, reader, payload);
    if (reader.error()) {
        return std::unexpected(*reader.error());
    }
    node.id = id ? std::move(*id) : freshId();

    if (auto const children = payload.find("children"); children != payload.end() && !children->is_null()) {
        if (!children->is_array()) {
            return std::unexpected(make_codec_error("field 'children' expects an array"));
        }
        node.children.reserve(children->size());
        for (auto const& child : *children) {
            node.children.push_back(decode_child(child, depth + 1, options));
        }
    }

    if (auto const item = payload.find("itemView"); item != payload.end() && !item->is_null()) {
        node.itemTemplate = std::make_unique<ComponentDescriptor>(decode_child(*item, depth + 1, options));
    }

    return node;
}

template <typename T>
void put(json& object, char const* key, std::optional<T> const& value) {
    if (value) {
        object[key] = *value;
    }
}

void encode_style(json& object, StyleTokens const& style) {
    put(object, "font", style.font);
    put(object, "color", style.color);
    put(object, "fontWeight", style.fontWeight);
    put(object, "foregroundColor", style.foregroundColor);
    put(object, "backgroundColor", style.backgroundColor);
    put(object, "borderColor", style.borderColor);
    put(object, "shadowColor", style.shadowColor);
    put(object, "padding", style.padding);
    put(object, "cornerRadius", style.cornerRadius);
    put(object, "borderWidth", style.borderWidth);
    put(object, "shadowRadius", style.shadowRadius);
    put(object, "opacity", style.opacity);
    put(object, "rotation", style.rotation);
    put(object, "scale", style.scale);
    if (style.shadowOffset) {
        object["shadowOffset"] = json{{"x", style.shadowOffset->x}, {"y", style.shadowOffset->y}};
    }
    if (style.animation) {
        json animation = json::object();
        put(animation, "type", style.animation->type);
        put(animation, "duration", style.animation->duration);
        object["animation"] = std::move(animation);
    }
    if (style.transition) {
        json transition = json::object();
        put(transition, "type", style.transition->type);
        object["transition"] = std::move(transition);
    }
}

struct PropsEncoder {
    json& object;

    void operator()(LayoutProps const& props) const {
        put(object, "spacing", props.spacing);
        put(object, "columns", props.columns);
        put(object, "gridItemSize", props.gridItemSize);
        put(object, "gridItemMinSize", props.gridItemMinSize);
    }
    void operator()(ContentProps const&) const {}
    void operator()(ImageProps const& props) const {
        put(object, "imageName", props.imageName);
        put(object, "url", props.url);
    }
    void operator()(ProgressProps const& props) const {
        put(object, "progress", props.progress);
        put(object, "gaugeMin", props.gaugeMin);
        put(object, "gaugeMax", props.gaugeMax);
    }
    void operator()(InputProps const& props) const {
        put(object, "placeholder", props.placeholder);
        put(object, "minValue", props.minValue);
        put(object, "maxValue", props.maxValue);
        put(object, "step", props.step);
        put(object, "showValue", props.showValue);
        put(object, "selectionMode", props.selectionMode);
        if (props.options) {
            json options = json::array();
            for (auto const& option : *props.options) {
                options.push_back(json{{"id", option.id}, {"text", option.text}, {"value", option.value}});
            }
            object["options"] = std::move(options);
        }
    }
    void operator()(NavigationProps const& props) const { put(object, "destination", props.destination); }
    void operator()(PresentationProps const& props) const {
        put(object, "isPresented", props.presentationKey);
        put(object, "title", props.title);
        put(object, "message", props.message);
    }
    void operator()(MapProps const& props) const {
        put(object, "centerLatitude", props.centerLatitude);
        put(object, "centerLongitude", props.centerLongitude);
        put(object, "span", props.span);
    }
    void operator()(WebProps const& props) const { put(object, "webURL", props.webURL); }
    void operator()(ChartProps const& props) const {
        put(object, "chartType", props.chartType);
        put(object, "dataKey", props.dataKey);
    }
    void operator()(DomainProps const& props) const {
        for (auto const& [key, value] : props.attributes.items()) {
            object[key] = value;
        }
    }
    void operator()(UnresolvedProps const&) const {}
};

} // namespace

auto DecodeComponent(nlohmann::json const& payload, int screenVersion, DecodeOptions const& options)
    -> Expected<ComponentDescriptor> {
    if (!is_screen_version_supported(screenVersion)) {
        ts_log("Rejected screen version " + std::to_string(screenVersion), "Codec", "ERROR");
        return std::unexpected(make_codec_error("unsupported screen version " + std::to_string(screenVersion),
                                                Error::Code::UnsupportedVersion));
    }
    return decode_node(payload, 0, options);
}

auto DecodeScreen(nlohmann::json const& payload, DecodeOptions const& options) -> Expected<DecodedScreen> {
    if (!payload.is_object()) {
        return std::unexpected(make_codec_error("screen payload must be a JSON object"));
    }
    auto const version = payload.find("version");
    if (version == payload.end() || !version->is_number_integer()) {
        return std::unexpected(make_codec_error("screen missing integer 'version'"));
    }
    auto const component = payload.find("component");
    if (component == payload.end()) {
        return std::unexpected(make_codec_error("screen missing 'component'"));
    }

    DecodedScreen screen{};
    screen.version = version->get<int>();
    auto root      = DecodeComponent(*component, screen.version, options);
    if (!root) {
        return std::unexpected(root.error());
    }
    screen.root = std::move(*root);
    ts_log("Decoded screen v" + std::to_string(screen.version) + " (" + std::string{compatibility_mode(screen.version)}
               + ") with " + std::to_string(screen.root.subtreeSize()) + " nodes",
           "Codec");
    return screen;
}

auto ParseScreen(std::string_view text, DecodeOptions const& options) -> Expected<DecodedScreen> {
    auto payload = json::parse(text.begin(), text.end(), nullptr, false);
    if (payload.is_discarded()) {
        return std::unexpected(make_codec_error("screen payload is not valid JSON"));
    }
    return DecodeScreen(payload, options);
}

auto EncodeComponent(ComponentDescriptor const& node) -> nlohmann::json {
    if (auto const* unresolved = node.unresolved()) {
        json raw  = unresolved->raw;
        raw["id"] = node.id;
        return raw;
    }

    json object     = json::object();
    object["id"]    = node.id;
    object["type"]  = std::string{kind_name(node.kind)};
    put(object, "text", node.text);
    put(object, "label", node.label);
    put(object, "actionId", node.actionId);
    put(object, "key", node.bindingKey);
    put(object, "conditionKey", node.conditionKey);
    put(object, "valueKey", node.valueKey);
    encode_style(object, node.style);
    std::visit(PropsEncoder{object}, node.props);

    if (!node.children.empty()) {
        json children = json::array();
        for (auto const& child : node.children) {
            children.push_back(EncodeComponent(child));
        }
        object["children"] = std::move(children);
    }
    if (node.itemTemplate) {
        object["itemView"] = EncodeComponent(*node.itemTemplate);
    }
    return object;
}

auto EncodeScreen(DecodedScreen const& screen) -> nlohmann::json {
    return json{{"version", screen.version}, {"component", EncodeComponent(screen.root)}};
}

} // namespace TS::UI::Declarative
