#include "economic_parameters.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace optimach {

EconomicParameters::EconomicParameters(MachineProfile existing_machine,
                                       MachineProfile new_machine,
                                       double interest_rate,
                                       int horizon_years)
    : existing_machine_(std::move(existing_machine)),
      new_machine_(std::move(new_machine)),
      interest_rate_(interest_rate),
      horizon_years_(horizon_years) {}

int EconomicParameters::max_keep_years() const {
    int limit = std::max(horizon_years_, 0);
    const auto& service_limit = existing_machine_.max_service_years();
    if (service_limit) {
        limit = std::min(limit, std::max(*service_limit, 0));
    }
    return limit;
}

void EconomicParameters::validate() const {
    if (horizon_years_ < 1) {
        throw ConfigurationError("Horizon must be at least 1 year, got " +
                                 std::to_string(horizon_years_));
    }
    if (horizon_years_ > MAX_HORIZON_YEARS) {
        throw ConfigurationError("Horizon must be at most " + std::to_string(MAX_HORIZON_YEARS) +
                                 " years, got " + std::to_string(horizon_years_));
    }
    // Written so that NaN fails too
    if (!(interest_rate_ > -1.0) || !std::isfinite(interest_rate_)) {
        throw ConfigurationError("Interest rate must be greater than -1, got " +
                                 std::to_string(interest_rate_));
    }
    // Factors are monotonic in t, so the horizon year bounds every other year
    double horizon_factor = 1.0 / std::pow(1.0 + interest_rate_, horizon_years_);
    if (!std::isfinite(horizon_factor) || !(horizon_factor > 0.0)) {
        throw ConfigurationError("Interest rate " + std::to_string(interest_rate_) +
                                 " gives no finite positive discount factor over " +
                                 std::to_string(horizon_years_) + " years");
    }

    existing_machine_.validate("Existing machine", max_keep_years());
    new_machine_.validate("New machine", horizon_years_);
}

} // namespace optimach
