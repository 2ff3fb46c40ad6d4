#include "machine_profile.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace optimach {

namespace {

void require_non_negative(const std::string& label, const std::string& what, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigurationError(label + " " + what + " must be a non-negative number, got " +
                                 std::to_string(value));
    }
}

} // anonymous namespace

// ============================================================================
// OperatingCostSchedule Implementation
// ============================================================================

OperatingCostSchedule::OperatingCostSchedule()
    : kind_(Kind::Constant), first_year_(0.0), annual_increase_(0.0) {}

OperatingCostSchedule::OperatingCostSchedule(Kind kind, double first_year, double annual_increase,
                                             std::vector<double> values)
    : kind_(kind),
      first_year_(first_year),
      annual_increase_(annual_increase),
      values_(std::move(values)) {}

OperatingCostSchedule OperatingCostSchedule::constant(double cost) {
    return OperatingCostSchedule(Kind::Constant, cost, 0.0, {});
}

OperatingCostSchedule OperatingCostSchedule::gradient(double first_year, double annual_increase) {
    return OperatingCostSchedule(Kind::Gradient, first_year, annual_increase, {});
}

OperatingCostSchedule OperatingCostSchedule::from_values(std::vector<double> values) {
    return OperatingCostSchedule(Kind::Table, 0.0, 0.0, std::move(values));
}

OperatingCostSchedule OperatingCostSchedule::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open operating cost file: " + filepath);
    }
    return load_from_csv(file);
}

OperatingCostSchedule OperatingCostSchedule::load_from_csv(std::istream& is) {
    io::CsvReader reader(is);
    std::vector<double> values;

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 2) {
            throw ConfigParseError("Operating cost CSV requires columns: year,operating_cost");
        }

        double year = io::parse_number(row[0], reader.line_number());
        int expected = static_cast<int>(values.size()) + 1;
        if (year != static_cast<double>(expected)) {
            throw ConfigParseError("Line " + std::to_string(reader.line_number()) +
                                   ": expected year " + std::to_string(expected));
        }
        values.push_back(io::parse_number(row[1], reader.line_number()));
    }

    return from_values(std::move(values));
}

double OperatingCostSchedule::cost(int service_year) const {
    if (service_year < 1) {
        throw std::out_of_range("Service year " + std::to_string(service_year) + " must be at least 1");
    }
    switch (kind_) {
        case Kind::Constant:
            return first_year_;
        case Kind::Gradient:
            return first_year_ + static_cast<double>(service_year - 1) * annual_increase_;
        case Kind::Table:
            if (static_cast<size_t>(service_year) > values_.size()) {
                throw std::out_of_range("Service year " + std::to_string(service_year) +
                                        " exceeds operating cost table of " +
                                        std::to_string(values_.size()) + " years");
            }
            return values_[service_year - 1];
    }
    return 0.0;
}

bool OperatingCostSchedule::covers(int years) const {
    if (kind_ != Kind::Table || years <= 0) {
        return true;
    }
    return static_cast<size_t>(years) <= values_.size();
}

void OperatingCostSchedule::validate(const std::string& label, int years) const {
    if (!covers(years)) {
        throw ConfigurationError(label + " operating cost schedule covers " +
                                 std::to_string(values_.size()) + " years but " +
                                 std::to_string(years) + " are required");
    }
    if (kind_ == Kind::Table) {
        for (double value : values_) {
            require_non_negative(label, "operating cost", value);
        }
        return;
    }
    require_non_negative(label, "operating cost", first_year_);
    for (int year = 2; year <= years; ++year) {
        require_non_negative(label, "operating cost in year " + std::to_string(year), cost(year));
    }
}

// ============================================================================
// SalvageSchedule Implementation
// ============================================================================

SalvageSchedule::SalvageSchedule()
    : kind_(Kind::Constant), initial_value_(0.0) {}

SalvageSchedule::SalvageSchedule(Kind kind, double initial_value, std::vector<double> depreciation,
                                 std::vector<double> values)
    : kind_(kind),
      initial_value_(initial_value),
      depreciation_(std::move(depreciation)),
      values_(std::move(values)) {}

SalvageSchedule SalvageSchedule::constant(double value) {
    return SalvageSchedule(Kind::Constant, value, {}, {});
}

SalvageSchedule SalvageSchedule::declining(double initial_value, std::vector<double> depreciation) {
    return SalvageSchedule(Kind::Declining, initial_value, std::move(depreciation), {});
}

SalvageSchedule SalvageSchedule::from_values(std::vector<double> values_by_age) {
    return SalvageSchedule(Kind::Table, 0.0, {}, std::move(values_by_age));
}

SalvageSchedule SalvageSchedule::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open salvage file: " + filepath);
    }
    return load_from_csv(file);
}

SalvageSchedule SalvageSchedule::load_from_csv(std::istream& is) {
    io::CsvReader reader(is);
    std::vector<double> values;

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 2) {
            throw ConfigParseError("Salvage CSV requires columns: age,salvage_value");
        }

        double age = io::parse_number(row[0], reader.line_number());
        int expected = static_cast<int>(values.size());
        if (age != static_cast<double>(expected)) {
            throw ConfigParseError("Line " + std::to_string(reader.line_number()) +
                                   ": expected age " + std::to_string(expected));
        }
        values.push_back(io::parse_number(row[1], reader.line_number()));
    }

    return from_values(std::move(values));
}

double SalvageSchedule::value_at(int age) const {
    if (age < 0) {
        throw std::out_of_range("Age " + std::to_string(age) + " must be non-negative");
    }
    switch (kind_) {
        case Kind::Constant:
            return initial_value_;
        case Kind::Declining: {
            double cumulative = 0.0;
            if (!depreciation_.empty()) {
                for (int year = 1; year <= age; ++year) {
                    size_t idx = std::min(static_cast<size_t>(year - 1), depreciation_.size() - 1);
                    cumulative += depreciation_[idx];
                }
            }
            return std::max(initial_value_ - cumulative, 0.0);
        }
        case Kind::Table:
            if (static_cast<size_t>(age) >= values_.size()) {
                throw std::out_of_range("Age " + std::to_string(age) +
                                        " exceeds salvage table covering ages 0-" +
                                        std::to_string(static_cast<int>(values_.size()) - 1));
            }
            return values_[age];
    }
    return 0.0;
}

bool SalvageSchedule::covers(int age) const {
    if (kind_ != Kind::Table || age < 0) {
        return true;
    }
    return static_cast<size_t>(age) < values_.size();
}

void SalvageSchedule::validate(const std::string& label, int max_age) const {
    if (!covers(max_age)) {
        throw ConfigurationError(label + " salvage table covers " + std::to_string(values_.size()) +
                                 " ages but a value at age " + std::to_string(max_age) +
                                 " is required");
    }
    switch (kind_) {
        case Kind::Constant:
            require_non_negative(label, "salvage value", initial_value_);
            break;
        case Kind::Declining:
            require_non_negative(label, "initial salvage value", initial_value_);
            for (double amount : depreciation_) {
                require_non_negative(label, "depreciation", amount);
            }
            break;
        case Kind::Table:
            for (double value : values_) {
                require_non_negative(label, "salvage value", value);
            }
            break;
    }
}

// ============================================================================
// MachineProfile Implementation
// ============================================================================

MachineProfile::MachineProfile() : purchase_cost_(0.0) {}

MachineProfile::MachineProfile(double purchase_cost,
                               OperatingCostSchedule operating_cost,
                               SalvageSchedule salvage,
                               std::optional<int> max_service_years)
    : purchase_cost_(purchase_cost),
      operating_cost_(std::move(operating_cost)),
      salvage_(std::move(salvage)),
      max_service_years_(max_service_years) {}

void MachineProfile::validate(const std::string& label, int service_years) const {
    require_non_negative(label, "purchase cost", purchase_cost_);
    if (max_service_years_ && *max_service_years_ < 0) {
        throw ConfigurationError(label + " max service years must be non-negative, got " +
                                 std::to_string(*max_service_years_));
    }
    operating_cost_.validate(label, service_years);
    salvage_.validate(label, service_years);
}

} // namespace optimach
