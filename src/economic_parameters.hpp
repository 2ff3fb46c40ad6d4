#ifndef OPTIMACH_ECONOMIC_PARAMETERS_HPP
#define OPTIMACH_ECONOMIC_PARAMETERS_HPP

#include "machine_profile.hpp"

namespace optimach {

// EconomicParameters: read-only input bundle for one replacement analysis
//
// interest_rate is a fraction (0.10 = 10%) and must be greater than -1.
// horizon_years is the number of years over which all strategies are compared,
// 1 to MAX_HORIZON_YEARS. The discount factor 1 / (1 + rate)^horizon must be
// finite and positive.
class EconomicParameters {
public:
    static constexpr double DEFAULT_INTEREST_RATE = 0.10;
    static constexpr int DEFAULT_HORIZON_YEARS = 5;
    static constexpr int MAX_HORIZON_YEARS = 100;

    EconomicParameters(MachineProfile existing_machine,
                       MachineProfile new_machine,
                       double interest_rate = DEFAULT_INTEREST_RATE,
                       int horizon_years = DEFAULT_HORIZON_YEARS);

    double interest_rate() const { return interest_rate_; }
    int horizon_years() const { return horizon_years_; }
    const MachineProfile& existing_machine() const { return existing_machine_; }
    const MachineProfile& new_machine() const { return new_machine_; }

    // Largest feasible keep-duration: the horizon, capped by the existing
    // machine's remaining service years
    int max_keep_years() const;

    // Number of strategies evaluate_strategies() produces
    int strategy_count() const { return max_keep_years() + 1; }

    // Throws ConfigurationError describing the first invalid input
    void validate() const;

private:
    MachineProfile existing_machine_;
    MachineProfile new_machine_;
    double interest_rate_;
    int horizon_years_;
};

} // namespace optimach

#endif // OPTIMACH_ECONOMIC_PARAMETERS_HPP
