#include "gbcore/bus/FlatBus.hpp"

#include <algorithm>

namespace gbcore::bus {

FlatBus FlatBus::fromBytes(std::span<const uint8_t> bytes) {
    FlatBus bus;
    bus.load(0, bytes);
    return bus;
}

std::size_t FlatBus::load(uint16_t address, std::span<const uint8_t> bytes) {
    const std::size_t count = std::min(bytes.size(), kSize - static_cast<std::size_t>(address));
    std::copy_n(bytes.begin(), count, memory_.begin() + address);
    return count;
}

}  // namespace gbcore::bus
