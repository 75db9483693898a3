#pragma once

#include "tubeq/clock.hpp"
#include "tubeq/config.hpp"
#include "tubeq/id_generator.hpp"
#include "tubeq/transition_listener.hpp"
#include "tubeq/tube.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tubeq {

/**
 * Owns the named tubes of one broker.
 *
 * Tubes are created on first use and share the registry's clock, id
 * generator (so job ids are unique across tubes), listener and config.
 * Lookups take a shared lock; only creation takes the exclusive one.
 */
class TubeRegistry {
public:
    TubeRegistry(TubeConfig config,
                 std::shared_ptr<Clock> clock = nullptr,
                 std::shared_ptr<IdGenerator> id_generator = nullptr,
                 std::shared_ptr<TransitionListener> listener = nullptr);

    TubeRegistry(const TubeRegistry&) = delete;
    TubeRegistry& operator=(const TubeRegistry&) = delete;

    std::shared_ptr<Tube> get_or_create(const std::string& name);
    std::shared_ptr<Tube> find(const std::string& name) const;

    std::vector<std::string> names() const;
    std::vector<std::shared_ptr<Tube>> tubes() const;

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tubes_.size();
    }

    const std::shared_ptr<Clock>& clock() const { return clock_; }

private:
    TubeConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<IdGenerator> id_generator_;
    std::shared_ptr<TransitionListener> listener_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Tube>> tubes_;
};

} // namespace tubeq
