/**
 * @file engine_factory.hpp
 * @brief Factory for creating engine sessions by type
 *
 * The EngineFactory provides a centralized way to instantiate engine sessions.
 * The scenario interface creates its session through the factory, and so does
 * every worker process after fork, using the engine type carried in its recipe.
 *
 * Design Pattern: Factory Method with Registry
 * - Each engine type registers a factory function
 * - Callers request sessions by string identifier
 */

#ifndef ECOBATCH_ENGINE_FACTORY_HPP
#define ECOBATCH_ENGINE_FACTORY_HPP

#include "engine_session.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ecobatch {

/**
 * @brief Engine type identifiers
 */
namespace EngineType {
    constexpr const char* REFERENCE = "reference";
}

/**
 * @brief Factory for creating engine sessions
 *
 * Usage Example:
 *   @code
 *   EngineFactory factory;
 *   factory.register_engine("recording", [] { return std::make_unique<RecordingEngine>(); });
 *   auto engine = factory.create_engine("recording");
 *   @endcode
 */
class EngineFactory {
public:
    using FactoryFunction = std::function<std::unique_ptr<EngineSession>()>;

    /**
     * @brief Constructor - registers built-in engine types
     */
    EngineFactory();

    /**
     * @brief Create a session by type
     *
     * @throws ConfigurationError If engine type is unknown
     */
    std::unique_ptr<EngineSession> create_engine(const std::string& engine_type) const;

    /**
     * @brief Register a custom engine type
     *
     * @throws ConfigurationError If engine_type already registered
     */
    void register_engine(const std::string& engine_type, FactoryFunction factory_fn);

    bool is_registered(const std::string& engine_type) const;

    std::vector<std::string> list_engine_types() const;

private:
    std::map<std::string, FactoryFunction> registry_;

    static std::unique_ptr<EngineSession> create_reference_engine();
};

} // namespace ecobatch

#endif // ECOBATCH_ENGINE_FACTORY_HPP
