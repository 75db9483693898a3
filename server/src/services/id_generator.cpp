#include "tubeq/id_generator.hpp"
#include <spdlog/fmt/fmt.h>
#include <random>

namespace tubeq {

std::string SequentialIdGenerator::next_id() {
    return prefix_ + std::to_string(next_.fetch_add(1));
}

std::string UuidGenerator::next_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t hi = dis(gen);
    std::uint64_t lo = dis(gen);

    // RFC 4122: version 4 in the time_hi nibble, variant 10xx in clock_seq
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32,
                       (hi >> 16) & 0xFFFF,
                       hi & 0xFFFF,
                       lo >> 48,
                       lo & 0xFFFFFFFFFFFFULL);
}

} // namespace tubeq
