#include "tubeq/tube_registry.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace tubeq {

TubeRegistry::TubeRegistry(TubeConfig config,
                           std::shared_ptr<Clock> clock,
                           std::shared_ptr<IdGenerator> id_generator,
                           std::shared_ptr<TransitionListener> listener)
    : config_(config),
      clock_(clock ? std::move(clock) : std::make_shared<SteadyClock>()),
      id_generator_(id_generator ? std::move(id_generator) : std::make_shared<SequentialIdGenerator>()),
      listener_(std::move(listener)) {
}

std::shared_ptr<Tube> TubeRegistry::get_or_create(const std::string& name) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = tubes_.find(name);
        if (it != tubes_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tubes_.find(name);
    if (it != tubes_.end()) {
        return it->second;
    }

    auto tube = std::make_shared<Tube>(name, config_, clock_, id_generator_, listener_);
    tubes_.emplace(name, tube);
    spdlog::info("TubeRegistry: created tube '{}' ({} tubes)", name, tubes_.size());
    return tube;
}

std::shared_ptr<Tube> TubeRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tubes_.find(name);
    return it != tubes_.end() ? it->second : nullptr;
}

std::vector<std::string> TubeRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(tubes_.size());
    for (const auto& [name, tube] : tubes_) {
        result.push_back(name);
    }
    return result;
}

std::vector<std::shared_ptr<Tube>> TubeRegistry::tubes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Tube>> result;
    result.reserve(tubes_.size());
    for (const auto& [name, tube] : tubes_) {
        result.push_back(tube);
    }
    return result;
}

} // namespace tubeq
