#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace eventsource {

struct OwnedMessage;

/// A message delivered to the consumer callback.
///
/// Every field is a view into the session's field buffers and is valid
/// only for the duration of the callback. The buffers are reused for the
/// next message as soon as the callback returns; call to_owned() to keep
/// anything.
///
/// A field is std::nullopt when the message did not carry it, and an empty
/// view when it carried the field with an empty value ("data:").
struct Message {
    std::optional<std::string_view> id;     // "id" field
    std::optional<std::string_view> event;  // "event" field (message type)
    std::optional<std::string_view> data;   // "data" lines joined with '\n'

    [[nodiscard]] OwnedMessage to_owned() const;
};

/// Self-contained copy of a Message.
struct OwnedMessage {
    std::optional<std::string> id;
    std::optional<std::string> event;
    std::optional<std::string> data;

    bool operator==(const OwnedMessage&) const = default;
};

inline OwnedMessage Message::to_owned() const {
    OwnedMessage copy;
    if (id.has_value()) {
        copy.id = std::string(*id);
    }
    if (event.has_value()) {
        copy.event = std::string(*event);
    }
    if (data.has_value()) {
        copy.data = std::string(*data);
    }
    return copy;
}

}  // namespace eventsource
