#ifndef OPTIMACH_MACHINE_PROFILE_HPP
#define OPTIMACH_MACHINE_PROFILE_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace optimach {

// OperatingCostSchedule: annual operating cost by service year (1-based)
// Service year 1 is the first year the machine is used within a strategy.
class OperatingCostSchedule {
public:
    enum class Kind : uint8_t {
        Constant = 0,   // Same cost every year
        Gradient = 1,   // first_year + (year - 1) * annual_increase
        Table = 2       // Explicit value per year
    };

    // Zero cost every year
    OperatingCostSchedule();

    static OperatingCostSchedule constant(double cost);
    static OperatingCostSchedule gradient(double first_year, double annual_increase);
    static OperatingCostSchedule from_values(std::vector<double> values);

    // Load from CSV: expects columns year,operating_cost with years 1..n in order
    static OperatingCostSchedule load_from_csv(const std::string& filepath);
    static OperatingCostSchedule load_from_csv(std::istream& is);

    // Cost for a service year; throws std::out_of_range for year < 1 or
    // years beyond an explicit table
    double cost(int service_year) const;

    // True if every service year 1..years has a defined cost
    bool covers(int years) const;

    // Throws ConfigurationError if any cost in years 1..years is negative or
    // undefined. label names the machine in the message.
    void validate(const std::string& label, int years) const;

    Kind kind() const { return kind_; }
    double first_year() const { return first_year_; }
    double annual_increase() const { return annual_increase_; }
    const std::vector<double>& values() const { return values_; }

private:
    OperatingCostSchedule(Kind kind, double first_year, double annual_increase,
                          std::vector<double> values);

    Kind kind_;
    double first_year_;
    double annual_increase_;
    std::vector<double> values_;
};

// SalvageSchedule: residual value if the machine is disposed of at a given age
// Age is measured in years of service from the start of the analysis
// (existing machine) or from purchase (new machine).
class SalvageSchedule {
public:
    enum class Kind : uint8_t {
        Constant = 0,   // Same value at every age
        Declining = 1,  // initial_value less cumulative depreciation, floored at 0
        Table = 2       // Explicit value per age starting at age 0
    };

    // Zero value at every age
    SalvageSchedule();

    static SalvageSchedule constant(double value);

    // Depreciation amounts apply to years 1, 2, ...; the last amount repeats
    // for later years. An empty list means the value never declines.
    static SalvageSchedule declining(double initial_value, std::vector<double> depreciation);

    static SalvageSchedule from_values(std::vector<double> values_by_age);

    // Load from CSV: expects columns age,salvage_value with ages 0..n in order
    static SalvageSchedule load_from_csv(const std::string& filepath);
    static SalvageSchedule load_from_csv(std::istream& is);

    double value_at(int age) const;
    bool covers(int age) const;

    // Throws ConfigurationError for negative inputs or ages 0..max_age that
    // have no value
    void validate(const std::string& label, int max_age) const;

    Kind kind() const { return kind_; }
    double initial_value() const { return initial_value_; }
    const std::vector<double>& depreciation() const { return depreciation_; }
    const std::vector<double>& values() const { return values_; }

private:
    SalvageSchedule(Kind kind, double initial_value, std::vector<double> depreciation,
                    std::vector<double> values);

    Kind kind_;
    double initial_value_;
    std::vector<double> depreciation_;
    std::vector<double> values_;
};

// MachineProfile: cost data for one asset
class MachineProfile {
public:
    MachineProfile();
    MachineProfile(double purchase_cost,
                   OperatingCostSchedule operating_cost,
                   SalvageSchedule salvage,
                   std::optional<int> max_service_years = std::nullopt);

    double purchase_cost() const { return purchase_cost_; }
    const OperatingCostSchedule& operating_cost() const { return operating_cost_; }
    const SalvageSchedule& salvage() const { return salvage_; }

    // Remaining years the machine can be used; empty if unlimited
    const std::optional<int>& max_service_years() const { return max_service_years_; }

    double operating_cost(int service_year) const { return operating_cost_.cost(service_year); }
    double salvage_value(int age) const { return salvage_.value_at(age); }

    // Throws ConfigurationError if the profile cannot support service_years
    // years of operation and disposal at any age up to service_years
    void validate(const std::string& label, int service_years) const;

private:
    double purchase_cost_;
    OperatingCostSchedule operating_cost_;
    SalvageSchedule salvage_;
    std::optional<int> max_service_years_;
};

} // namespace optimach

#endif // OPTIMACH_MACHINE_PROFILE_HPP
