#include "tracing/ids.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <format>

namespace xraylite {

TraceId TraceId::generate() {
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return rendered(std::format("1-{:08x}-{}",
        static_cast<uint32_t>(epoch), utils::random_hex(12)));
}

SegmentId SegmentId::generate() {
    return rendered(utils::random_hex(8)); // 8 bytes = 16 hex chars
}

} // namespace xraylite
