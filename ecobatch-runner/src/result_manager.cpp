#include "result_manager.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>

namespace ecobatch {

namespace {

std::string shape_to_string(const std::vector<size_t>& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << ")";
    return oss.str();
}

std::string local_run_date() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

size_t simulated_months(const EngineSession& engine) {
    double years = engine.get_scalar_property(ScalarProperty::N_YEARS);
    return static_cast<size_t>(std::max(0L, std::lround(years))) * 12;
}

} // anonymous namespace

ResultManager::ResultManager(EngineSession& engine,
                             const std::vector<std::string>& variable_names,
                             const ScenarioTable& scenarios,
                             BufferManager* shared_store,
                             Logger* logger)
    : engine_(engine),
      scenarios_(scenarios),
      store_(shared_store),
      logger_(logger != nullptr ? logger : &Logger::get_instance()),
      n_months_(0) {

    if (scenarios_.is_empty()) {
        throw ConfigurationError("Scenario table has no rows");
    }

    std::set<std::string> seen;
    for (const auto& name : variable_names) {
        if (!seen.insert(name).second) {
            throw ConfigurationError("Result variable listed twice: " + name);
        }
        variables_.push_back(find_result_variable(name));
    }

    // One extractor per engine array
    for (const auto& variable : variables_) {
        size_t index = extractors_.size();
        for (size_t e = 0; e < extractors_.size(); ++e) {
            if (extractors_[e]->source() == variable.source) {
                index = e;
                break;
            }
        }
        if (index == extractors_.size()) {
            extractors_.push_back(std::make_unique<ResultExtractor>(engine_, variable.source));
        }
        extractor_of_.push_back(index);
    }

    n_months_ = simulated_months(engine_);

    if (store_ == nullptr) {
        owned_store_ = std::make_unique<BufferManager>(BufferMode::EXCLUSIVE);
        store_ = owned_store_.get();
        for (const auto& variable : variables_) {
            store_->allocate_buffer(variable.name, store_shape(engine_, variable, scenarios_.n_scenarios()));
        }
        return;
    }

    for (const auto& variable : variables_) {
        std::vector<size_t> expected = store_shape(engine_, variable, scenarios_.n_scenarios());
        if (!store_->has_buffer(variable.name)) {
            throw ConfigurationError("Shared store has no buffer for " + variable.name);
        }
        std::vector<size_t> actual = store_->get_buffer(variable.name).shape;
        if (actual != expected) {
            throw ConfigurationError("Shared buffer " + variable.name + " has shape " +
                                     shape_to_string(actual) + ", expected " +
                                     shape_to_string(expected));
        }
    }
}

std::vector<size_t> ResultManager::store_shape(const EngineSession& engine,
                                               const ResultVariable& variable,
                                               size_t n_scenarios) {
    std::vector<size_t> shape;
    for (Dim dim : variable.dims) {
        switch (dim) {
            case Dim::SCENARIO: shape.push_back(n_scenarios); break;
            case Dim::FLEET: shape.push_back(engine.n_fleets()); break;
            case Dim::GROUP: shape.push_back(engine.n_groups()); break;
            case Dim::ENV_GROUP: shape.push_back(engine.n_groups() + 1); break;
            case Dim::TIME: shape.push_back(simulated_months(engine)); break;
        }
    }
    return shape;
}

std::unique_ptr<BufferManager> ResultManager::allocate_shared_store(
    const EngineSession& engine,
    const std::vector<std::string>& variable_names,
    size_t n_scenarios) {

    auto store = std::make_unique<BufferManager>(BufferMode::SHARED);
    for (const auto& name : variable_names) {
        const ResultVariable& variable = find_result_variable(name);
        store->allocate_buffer(variable.name, store_shape(engine, variable, n_scenarios));
    }
    return store;
}

void ResultManager::collect(size_t scenario_index) {
    for (const auto& extractor : extractors_) {
        extractor->check_ready();
    }
    for (auto& extractor : extractors_) {
        extractor->refresh();
    }

    ExecutionContext ctx("results");
    ctx.scenario_index = static_cast<long>(scenario_index);
    ctx.phase = "collect";

    std::vector<ArrayView> views;
    views.reserve(variables_.size());
    for (size_t v = 0; v < variables_.size(); ++v) {
        const ResultVariable& variable = variables_[v];
        const ResultExtractor& extractor = *extractors_[extractor_of_[v]];
        ArrayView view = extractor.is_packed()
            ? extractor.get_result(static_cast<size_t>(variable.packed_key))
            : extractor.get_result();

        BufferInfo info = store_->get_buffer(variable.name);
        std::vector<size_t> expected(info.shape.begin() + 1, info.shape.end());
        if (view.shape != expected) {
            throw ConfigurationError("Extracted " + variable.name + " has shape " +
                                     shape_to_string(view.shape) + ", store expects " +
                                     shape_to_string(expected));
        }
        views.push_back(view);
    }

    // Every shape matched, so the slot is written for all variables or none
    for (size_t v = 0; v < variables_.size(); ++v) {
        const std::string& name = variables_[v].name;
        double* slice = store_->scenario_slice(name, scenario_index);
        views[v].copy_to(slice);
        logger_->log_buffer_content(ctx, name, slice, store_->get_buffer(name).scenario_stride());
    }
}

void ResultManager::mark_invalid(size_t scenario_index) {
    for (const auto& variable : variables_) {
        store_->fill_scenario_nan(variable.name, scenario_index);
    }
}

std::vector<std::string> ResultManager::variable_names() const {
    std::vector<std::string> names;
    for (const auto& variable : variables_) {
        names.push_back(variable.name);
    }
    return names;
}

RunMetadata ResultManager::metadata() const {
    RunMetadata metadata;
    metadata.country = engine_.country();
    metadata.first_year = engine_.first_year();
    metadata.run_date = local_run_date();
    metadata.group_names = engine_.functional_group_names();
    metadata.fleet_names = engine_.fleet_names();
    metadata.n_months = n_months_;
    return metadata;
}

ResultSet ResultManager::to_result_set(const std::vector<ScenarioStatus>& statuses) const {
    std::vector<ResultArray> results;
    for (const auto& variable : variables_) {
        BufferInfo info = store_->get_buffer(variable.name);
        ResultArray array;
        array.variable = variable;
        array.shape = info.shape;
        array.data.assign(info.data, info.data + info.num_values);
        results.push_back(std::move(array));
    }
    return ResultSet(scenarios_, metadata(), std::move(results), statuses);
}

} // namespace ecobatch
