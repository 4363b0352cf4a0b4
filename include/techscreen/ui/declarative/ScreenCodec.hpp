#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/ui/declarative/Descriptor.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace TS::UI::Declarative {

struct DecodedScreen {
    int                 version = kDefaultVersion;
    ComponentDescriptor root;

    static constexpr int kDefaultVersion = 5;
};

struct DecodeOptions {
    // Payloads nested deeper than this are rejected rather than recursed into.
    std::size_t max_depth = 64;
};

/**
 * Decodes a single descriptor tree for a screen of `screenVersion`.
 *
 * The version is checked first and fails closed with UnsupportedVersion.
 * Nodes without an `id` receive a fresh one. A child whose payload is
 * malformed (missing or unknown `type`, mistyped field) does not fail the
 * tree: it is kept in place as an Unresolved node carrying the error and the
 * raw payload, so renderers can draw a placeholder beside healthy siblings.
 * Failures at the root are returned as the error.
 */
[[nodiscard]] auto DecodeComponent(nlohmann::json const& payload,
                                   int screenVersion,
                                   DecodeOptions const& options = {}) -> Expected<ComponentDescriptor>;

// `{version, component}` wrapper.
[[nodiscard]] auto DecodeScreen(nlohmann::json const& payload,
                                DecodeOptions const& options = {}) -> Expected<DecodedScreen>;

// Parses JSON text without throwing, then decodes the screen wrapper.
[[nodiscard]] auto ParseScreen(std::string_view text,
                               DecodeOptions const& options = {}) -> Expected<DecodedScreen>;

// Always writes the resolved id so a decode/encode/decode cycle keeps ids stable.
[[nodiscard]] auto EncodeComponent(ComponentDescriptor const& node) -> nlohmann::json;
[[nodiscard]] auto EncodeScreen(DecodedScreen const& screen) -> nlohmann::json;

} // namespace TS::UI::Declarative
