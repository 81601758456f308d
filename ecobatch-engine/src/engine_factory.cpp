/**
 * @file engine_factory.cpp
 * @brief Implementation of EngineFactory
 */

#include "engine_factory.hpp"
#include "reference_engine.hpp"

namespace ecobatch {

EngineFactory::EngineFactory() {
    registry_[EngineType::REFERENCE] = create_reference_engine;
}

std::unique_ptr<EngineSession> EngineFactory::create_engine(const std::string& engine_type) const {
    auto it = registry_.find(engine_type);
    if (it == registry_.end()) {
        std::string types;
        for (const auto& pair : registry_) {
            if (!types.empty()) types += ", ";
            types += pair.first;
        }
        throw ConfigurationError("Unknown engine type: " + engine_type +
                                 ". Available types: " + types);
    }

    std::unique_ptr<EngineSession> engine = it->second();
    if (!engine) {
        throw InitializationError("Factory for engine type '" + engine_type + "' returned null");
    }
    return engine;
}

void EngineFactory::register_engine(const std::string& engine_type, FactoryFunction factory_fn) {
    if (registry_.find(engine_type) != registry_.end()) {
        throw ConfigurationError("Engine type already registered: " + engine_type);
    }
    registry_[engine_type] = std::move(factory_fn);
}

bool EngineFactory::is_registered(const std::string& engine_type) const {
    return registry_.find(engine_type) != registry_.end();
}

std::vector<std::string> EngineFactory::list_engine_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

std::unique_ptr<EngineSession> EngineFactory::create_reference_engine() {
    return std::make_unique<ReferenceEngine>();
}

} // namespace ecobatch
