/*
 * ChatRelay - event wire codec
 *
 * Events are carried as key/value text: `type` holds the event name, nested
 * records use dotted keys (file.name, metadata.total_chunks) and lists are
 * written as `<name>.count` plus indexed keys (users.0, users.1, ...).
 */

#pragma once

#include "events.hpp"

#include <optional>
#include <string>

namespace chatrelay {

std::string encode_event(const Event& event);

// Structural validation only: unknown names, names that do not belong to the
// given direction and malformed numeric fields are rejected with a
// description in `error`. Semantic checks (blank names, empty text) belong to
// the components.
std::optional<Event> decode_event(const std::string& text,
                                  EventDirection direction,
                                  std::string& error);

} // namespace chatrelay
