#include <catch2/catch_test_macros.hpp>
#include "../src/engine_factory.hpp"
#include "../src/reference_engine.hpp"

using namespace ecobatch;

namespace {

class TaggedEngine : public ReferenceEngine {
public:
    std::string country() const override { return "tagged"; }
};

} // anonymous namespace

TEST_CASE("EngineFactory: built-in types", "[engine_factory]") {
    EngineFactory factory;

    REQUIRE(factory.is_registered(EngineType::REFERENCE));
    REQUIRE(factory.list_engine_types() == std::vector<std::string>{"reference"});

    auto engine = factory.create_engine("reference");
    REQUIRE(engine != nullptr);
    REQUIRE_FALSE(engine->is_model_loaded());
}

TEST_CASE("EngineFactory: unknown type", "[engine_factory]") {
    EngineFactory factory;

    try {
        factory.create_engine("ecopath_desktop");
        FAIL("Expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        std::string message = e.what();
        REQUIRE(message.find("Unknown engine type: ecopath_desktop") != std::string::npos);
        REQUIRE(message.find("reference") != std::string::npos);
    }
}

TEST_CASE("EngineFactory: custom registration", "[engine_factory]") {
    EngineFactory factory;
    factory.register_engine("tagged", [] { return std::make_unique<TaggedEngine>(); });

    REQUIRE(factory.is_registered("tagged"));
    REQUIRE(factory.create_engine("tagged")->country() == "tagged");

    REQUIRE_THROWS_AS(
        factory.register_engine("tagged", [] { return std::make_unique<TaggedEngine>(); }),
        ConfigurationError);

    factory.register_engine("broken", [] { return std::unique_ptr<EngineSession>(); });
    REQUIRE_THROWS_AS(factory.create_engine("broken"), InitializationError);
}
