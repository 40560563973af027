// === Position Message Parser =================================================
//
// Decodes inbound GNSS payloads into normalized `PositionFix` records. Two wire
// formats are accepted: GGA positioning sentences from any constellation
// talker ($GPGGA, $GNGGA, $GLGGA, ...) and JSON objects whose coordinates sit
// at the root or one level down under a known container key. Parsing never
// throws; anything unrecognized yields std::nullopt.

#pragma once

#include <optional>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "drill_link/types.hpp"

namespace drill_link {

/** @brief Stateless decoder for sentence and structured position messages. */
class PositionMessageParser final {
  public:
    /**
     * @brief Decode raw payload text.
     *
     * Text starting with '$' is tried as a GGA sentence first; otherwise (or
     * if that fails) the text is decoded as JSON and handed to the structured
     * rules.
     */
    [[nodiscard]] static std::optional<PositionFix> parse(std::string_view raw_payload);

    /** @brief Decode an already-parsed JSON document (object or sentence string). */
    [[nodiscard]] static std::optional<PositionFix> parse_document(const nlohmann::json& document);

    /** @brief Decode a single GGA sentence. */
    [[nodiscard]] static std::optional<PositionFix> parse_sentence(std::string_view sentence);

    /** @brief Apply the ordered container/alias rules to a JSON object. */
    [[nodiscard]] static std::optional<PositionFix> parse_structured(const nlohmann::json& document);
};

}  // namespace drill_link
