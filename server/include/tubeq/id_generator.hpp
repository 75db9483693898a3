#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace tubeq {

/**
 * Source of job and waiter identities.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    virtual std::string next_id() = 0;
};

/**
 * Monotonic decimal ids ("1", "2", ...), optionally prefixed.
 * Thread-safe; one instance is shared by every tube of a registry so job
 * ids are unique across tubes.
 */
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(std::string prefix = "", std::uint64_t first = 1)
        : prefix_(std::move(prefix)), next_(first) {}

    std::string next_id() override;

private:
    std::string prefix_;
    std::atomic<std::uint64_t> next_;
};

/**
 * Random version-4 UUIDs
 */
class UuidGenerator : public IdGenerator {
public:
    std::string next_id() override;
};

} // namespace tubeq
