#include "eventsource/protocol/message_assembler.hpp"

#include "eventsource/log/logger.hpp"

#include <algorithm>
#include <cstdint>
#include <format>

namespace eventsource {

namespace {

// Grow geometrically, but never reserve past the limit
void reserve_limited(std::string& buffer, std::size_t required, std::size_t limit) {
    if (buffer.capacity() >= required) {
        return;
    }
    const std::size_t doubled = buffer.capacity() * 2;
    buffer.reserve(std::min(limit, std::max(required, doubled)));
}

bool replace_limited(std::string& buffer, std::string_view value, std::size_t limit) {
    if (value.size() > limit) {
        return false;
    }
    buffer.clear();
    reserve_limited(buffer, value.size(), limit);
    buffer.append(value);
    return true;
}

bool append_line_limited(std::string& buffer, bool has_previous, std::string_view value, std::size_t limit) {
    const std::size_t separator = has_previous ? 1 : 0;
    const std::size_t required = buffer.size() + separator + value.size();
    if (required > limit) {
        return false;
    }
    reserve_limited(buffer, required, limit);
    if (has_previous) {
        buffer.push_back('\n');
    }
    buffer.append(value);
    return true;
}

}  // namespace

std::string FieldTooLongError::message() const {
    return std::format("{} field is too long (limit {} bytes)", to_string(field), limit);
}

MessageAssembler::MessageAssembler(const BufferLimits& limits)
    : limits_(limits.resolved())
{}

MessageAssembler::FeedResult MessageAssembler::feed(std::string_view line) {
    if (line.empty()) {
        return FeedResult::MessageReady;
    }

    if (is_draining()) {
        return FeedResult::Continue;
    }

    const Field field = parse_field(line);
    if (field.kind == FieldKind::Retry) {
        const auto millis = parse_retry_millis(field.value_or_empty());
        if (millis.has_value() == false) {
            get_logger().debug_fmt("Ignoring malformed retry value '{}'", field.value_or_empty());
            return FeedResult::Continue;
        }
        constexpr auto ceiling = static_cast<std::uint64_t>(max_retry_delay.count());
        if (*millis > ceiling) {
            get_logger().debug_fmt("Clamping retry value {}ms to {}ms", *millis, ceiling);
        }
        retry_ = std::chrono::milliseconds{
            static_cast<std::chrono::milliseconds::rep>(std::min(*millis, ceiling))};
        return FeedResult::RetryUpdated;
    }

    apply(field);
    return FeedResult::Continue;
}

void MessageAssembler::apply(const Field& field) {
    const std::string_view value = field.value_or_empty();

    switch (field.kind) {
        case FieldKind::Id:
            if (replace_limited(id_, value, limits_.max_id) == false) {
                error_ = FieldTooLongError{FieldKind::Id, limits_.max_id};
                return;
            }
            has_id_ = true;
            return;

        case FieldKind::Event:
            if (replace_limited(event_, value, limits_.max_event) == false) {
                error_ = FieldTooLongError{FieldKind::Event, limits_.max_event};
                return;
            }
            has_event_ = true;
            return;

        case FieldKind::Data:
            if (append_line_limited(data_, has_data_, value, limits_.max_data) == false) {
                error_ = FieldTooLongError{FieldKind::Data, limits_.max_data};
                return;
            }
            has_data_ = true;
            return;

        case FieldKind::Retry:
        case FieldKind::Comment:
        case FieldKind::Unknown:
            return;
    }
}

AssembledMessage MessageAssembler::message() const {
    if (error_.has_value()) {
        return tl::unexpected(*error_);
    }

    Message msg;
    if (has_id_) {
        msg.id = std::string_view(id_);
    }
    if (has_event_) {
        msg.event = std::string_view(event_);
    }
    if (has_data_) {
        msg.data = std::string_view(data_);
    }
    return msg;
}

void MessageAssembler::end_message() {
    id_.clear();
    event_.clear();
    data_.clear();
    has_id_ = false;
    has_event_ = false;
    has_data_ = false;
    error_.reset();
}

void MessageAssembler::reset() {
    end_message();
    id_ = std::string{};
    event_ = std::string{};
    data_ = std::string{};
}

}  // namespace eventsource
