/**
 * @file reference_engine.hpp
 * @brief Deterministic reference implementation of EngineSession
 *
 * The reference engine reads a JSON model file describing functional groups,
 * fleets, forcing functions and named dynamic/tracer scenarios, and runs a
 * small monthly biomass and contaminant model. It reproduces the behavior the
 * batch layer depends on: stage flags, scenario persistence through
 * save_model(), result array layouts with placeholder slots, and a false return
 * from run() when the simulation diverges.
 *
 * Model file layout:
 *   @code
 *   {
 *     "name": "Demo Bay", "country": "Norway", "first_year": 1990, "balanced": true,
 *     "groups": [
 *       {"name": "Mackerel", "type": "consumer", "biomass": 2.0, "pb": 0.6, "qb": 3.0,
 *        "trophic_level": 3.4, "other_mortality": 0.1},
 *       {"name": "Phytoplankton", "type": "producer", "biomass": 20.0, "pb": 80.0},
 *       {"name": "Detritus", "type": "detritus", "biomass": 50.0}
 *     ],
 *     "fleets": [{"name": "Trawl", "effort": 1.0, "catchability": [0.1, 0.0, 0.0]}],
 *     "forcing_functions": [{"name": "inflow", "values": [1.0, 1.2]}],
 *     "dynamic_scenarios": [{"name": "baseline", "n_years": 5}],
 *     "tracer_scenarios": [{"name": "cesium"}]
 *   }
 *   @endcode
 * Groups must be ordered consumers, producers, detritus.
 */

#ifndef ECOBATCH_REFERENCE_ENGINE_HPP
#define ECOBATCH_REFERENCE_ENGINE_HPP

#include "engine_session.hpp"
#include <map>
#include <string>
#include <vector>

namespace ecobatch {

enum class GroupType {
    CONSUMER,
    PRODUCER,
    DETRITUS
};

class ReferenceEngine : public EngineSession {
public:
    static constexpr int DEFAULT_N_YEARS = 10;
    static constexpr double DEFAULT_VULNERABILITY = 2.0;

    ReferenceEngine();
    ~ReferenceEngine() override;

    bool load_model(const std::string& path) override;
    bool save_model() override;
    void close_model() noexcept override;
    bool is_model_loaded() const override { return model_loaded_; }

    std::vector<std::string> functional_group_names() const override;
    std::vector<std::string> fleet_names() const override;
    size_t n_consumers() const override;
    size_t n_producers() const override;
    int first_year() const override { return first_year_; }
    std::string country() const override { return country_; }

    size_t scenario_count(Subsystem subsystem) const override;
    void close_scenario(Subsystem subsystem) override;

    EngineStateSnapshot state() const override;
    ResultArrayView result_array(ResultSource source) const override;

    /**
     * @brief Number of simulated months of the last dynamic run
     */
    size_t simulated_months() const { return n_months_; }

protected:
    std::string do_scenario_name(Subsystem subsystem, size_t index) const override;
    bool do_new_scenario(Subsystem subsystem, const std::string& name,
                         const std::string& description) override;
    bool do_activate_scenario(Subsystem subsystem, size_t index) override;
    bool do_remove_scenario(Subsystem subsystem, size_t index) override;

    void do_set_group_property(GroupProperty property,
                               const std::vector<double>& values,
                               const std::vector<int>& group_indices) override;
    std::vector<double> do_get_group_property(GroupProperty property) const override;
    void do_set_scalar_property(ScalarProperty property, double value) override;
    double do_get_scalar_property(ScalarProperty property) const override;
    void do_set_pair_property(PairProperty property,
                              const std::vector<double>& values,
                              const std::vector<std::pair<int, int>>& pairs) override;
    double do_get_pair_property(PairProperty property, int prey, int predator) const override;
    int do_add_forcing_function(const std::string& name, const std::vector<double>& values) override;

    bool do_run(Stage stage) override;

private:
    struct GroupData {
        std::string name;
        GroupType type;
        double biomass;
        double pb;
        double qb;
        double trophic_level;
        double other_mortality;
    };

    struct FleetData {
        std::string name;
        double effort;
        std::vector<double> catchability;   ///< One entry per group
    };

    struct ForcingFunction {
        std::string name;
        std::vector<double> values;
    };

    struct DynamicScenario {
        std::string name;
        std::string description;
        int n_years;
        std::map<GroupProperty, std::vector<double>> properties;
        std::vector<double> vulnerabilities;   ///< Row-major [prey][predator]
    };

    struct TracerScenario {
        std::string name;
        std::string description;
        std::map<GroupProperty, std::vector<double>> properties;
        std::map<ScalarProperty, double> scalars;
    };

    // Model
    bool model_loaded_;
    bool model_balanced_;
    std::string model_path_;
    std::string model_name_;
    std::string country_;
    int first_year_;
    std::vector<GroupData> groups_;
    std::vector<FleetData> fleets_;
    std::vector<ForcingFunction> forcing_functions_;
    std::vector<DynamicScenario> dynamic_scenarios_;
    std::vector<TracerScenario> tracer_scenarios_;

    // Active scenarios (1-based, 0 = none)
    size_t active_dynamic_;
    size_t active_tracer_;

    // Stage flags
    bool mass_balance_ran_;
    bool dynamic_ran_;
    bool tracer_ran_;

    // Result arrays, reused across runs
    size_t n_months_;
    std::vector<double> group_stats_;
    std::vector<double> fleet_catch_;
    std::vector<double> tl_catch_;
    std::vector<double> fib_;
    std::vector<double> kemptons_q_;
    std::vector<double> shannon_;
    std::vector<double> concentration_;
    std::vector<double> conc_biomass_;

    DynamicScenario default_dynamic_scenario(const std::string& name,
                                             const std::string& description) const;
    TracerScenario default_tracer_scenario(const std::string& name,
                                           const std::string& description) const;
    DynamicScenario& active_dynamic();
    const DynamicScenario& active_dynamic() const;
    TracerScenario& active_tracer();
    const TracerScenario& active_tracer() const;

    bool run_mass_balance();
    bool run_simulation(bool with_tracer);
    void resize_results(size_t n_months, bool with_tracer);
    double forcing_value(int forcing_number, size_t month) const;
    void reset_model() noexcept;
};

} // namespace ecobatch

#endif // ECOBATCH_REFERENCE_ENGINE_HPP
