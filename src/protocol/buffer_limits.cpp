#include "eventsource/protocol/buffer_limits.hpp"

#include <algorithm>

namespace eventsource {

BufferLimits BufferLimits::resolved() const noexcept {
    BufferLimits result = *this;

    if (result.max_id == 0) {
        result.max_id = default_max_id;
    }
    if (result.max_event == 0) {
        result.max_event = default_max_event;
    }
    if (result.max_data == 0) {
        result.max_data = default_max_data;
    }
    if (result.max_line == 0) {
        const std::size_t largest_field = std::max({result.max_id, result.max_event, result.max_data});
        result.max_line = largest_field + line_framing_overhead;
    }

    return result;
}

}  // namespace eventsource
