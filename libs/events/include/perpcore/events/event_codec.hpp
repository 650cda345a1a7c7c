#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "perpcore/events/events.hpp"

namespace perpcore {
namespace events {

// Little-endian fixed layout per event kind; strings are u16 length + bytes.
[[nodiscard]] std::vector<std::byte> encode(const Event& event);
[[nodiscard]] Event decode(EventKind kind, std::span<const std::byte> payload);

}  // namespace events
}  // namespace perpcore
