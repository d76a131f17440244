// =================================================================
// src/Hotify/PatternRouter.cpp
// =================================================================

#include "Hotify/PatternRouter.hpp"
#include <stdexcept>

namespace Hotify {

PatternRouter::PatternRouter(EnvironmentRegistryPtr registry)
    : m_registry(std::move(registry))
{
    if (!m_registry) {
        throw std::invalid_argument("PatternRouter requires an environment registry");
    }
}

const Environment* PatternRouter::route(const std::string& file_path) const {
    for (const auto& environment : m_registry->getEnvironments()) {
        if (environment.matches(file_path)) {
            return &environment;
        }
    }
    return nullptr;
}

const Environment* PatternRouter::route(const std::string& file_path, const std::string& hot_folder) const {
    const Environment* owner = m_registry->find(hot_folder);
    if (owner == nullptr) {
        return route(file_path);
    }
    return owner->matches(file_path) ? owner : nullptr;
}

} // namespace Hotify
