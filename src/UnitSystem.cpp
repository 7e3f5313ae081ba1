#include "UnitSystem.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace SWCS {

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    if (std::abs(L) > 1e-10) {
        ss << "L";
        if (std::abs(L - 1.0) > 1e-10) ss << "^" << L;
        first = false;
    }

    if (std::abs(T) > 1e-10) {
        if (!first) ss << " ";
        ss << "T";
        if (std::abs(T - 1.0) > 1e-10) ss << "^" << T;
    }

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    addLengthUnits();
    addTimeUnits();
    addAreaUnits();
    addVolumeUnits();
    addVelocityUnits();
    addAccelerationUnits();
    addVolumetricRateUnits();
    addKinematicViscosityUnits();
    addFrequencyUnits();
}

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0);

    registerUnit(Unit("meter", "m", length, 1.0, "length"));
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 0.001, "length"));
    registerUnit(Unit("kilometer", "km", length, 1000.0, "length"));
    registerUnit(Unit("foot", "ft", length, 0.3048, "length"));
    registerUnit(Unit("mile", "mi", length, 1609.344, "length"));
    registerUnit(Unit("nautical mile", "nmi", length, 1852.0, "length"));
}

void UnitSystem::addTimeUnits() {
    Dimension time(0, 1);

    registerUnit(Unit("second", "s", time, 1.0, "time"));
    registerUnit(Unit("minute", "min", time, 60.0, "time"));
    registerUnit(Unit("hour", "hr", time, 3600.0, "time"));
    registerUnit(Unit("day", "day", time, 86400.0, "time"));
}

void UnitSystem::addAreaUnits() {
    Dimension area(2, 0);

    registerUnit(Unit("square meter", "m2", area, 1.0, "area"));
    registerUnit(Unit("square kilometer", "km2", area, 1e6, "area"));
    registerUnit(Unit("hectare", "ha", area, 1e4, "area"));
}

void UnitSystem::addVolumeUnits() {
    Dimension volume(3, 0);

    registerUnit(Unit("cubic meter", "m3", volume, 1.0, "volume"));
    registerUnit(Unit("liter", "L", volume, 0.001, "volume"));
    registerUnit(Unit("cubic kilometer", "km3", volume, 1e9, "volume"));
    registerUnit(Unit("cubic foot", "ft3", volume, 0.028316846592, "volume"));
}

void UnitSystem::addVelocityUnits() {
    Dimension velocity(1, -1);

    registerUnit(Unit("meter per second", "m/s", velocity, 1.0, "velocity"));
    registerUnit(Unit("centimeter per second", "cm/s", velocity, 0.01, "velocity"));
    registerUnit(Unit("kilometer per hour", "km/h", velocity, 1.0/3.6, "velocity"));
    registerUnit(Unit("knot", "kn", velocity, 1852.0/3600.0, "velocity"));
    registerUnit(Unit("foot per second", "ft/s", velocity, 0.3048, "velocity"));
}

void UnitSystem::addAccelerationUnits() {
    Dimension acceleration(1, -2);

    registerUnit(Unit("meter per second squared", "m/s2", acceleration, 1.0, "acceleration"));
    registerUnit(Unit("standard gravity", "g0", acceleration, 9.80665, "acceleration"));
}

void UnitSystem::addVolumetricRateUnits() {
    Dimension rate(3, -1);

    registerUnit(Unit("cubic meter per second", "m3/s", rate, 1.0, "volumetric_rate"));
    registerUnit(Unit("cubic meter per hour", "m3/hr", rate, 1.0/3600.0, "volumetric_rate"));
    registerUnit(Unit("cubic meter per day", "m3/day", rate, 1.0/86400.0, "volumetric_rate"));
    registerUnit(Unit("liter per second", "L/s", rate, 0.001, "volumetric_rate"));
    registerUnit(Unit("cubic foot per second", "ft3/s", rate, 0.028316846592, "volumetric_rate"));
    // Oceanographic transport unit, 1 Sv = 1e6 m³/s
    registerUnit(Unit("sverdrup", "Sv", rate, 1e6, "volumetric_rate"));
}

void UnitSystem::addKinematicViscosityUnits() {
    Dimension nu(2, -1);

    registerUnit(Unit("square meter per second", "m2/s", nu, 1.0, "kinematic_viscosity"));
    registerUnit(Unit("stokes", "St", nu, 1e-4, "kinematic_viscosity"));
    registerUnit(Unit("centistokes", "cSt", nu, 1e-6, "kinematic_viscosity"));
}

void UnitSystem::addFrequencyUnits() {
    Dimension frequency(0, -1);

    registerUnit(Unit("radian per second", "rad/s", frequency, 1.0, "frequency"));
    registerUnit(Unit("per second", "1/s", frequency, 1.0, "frequency"));
    // One cycle per second
    registerUnit(Unit("hertz", "Hz", frequency, 2.0 * M_PI, "frequency"));
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Symbol: case-sensitive primary, lowercase secondary
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        units_.emplace(toLowerCase(unit.symbol), unit);
    }

    if (!unit.category.empty()) {
        categories_[unit.category].push_back(key);
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::runtime_error("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::runtime_error("Unknown destination unit: " + to_unit);
    }

    if (from->dimension != to->dimension) {
        throw std::runtime_error("Incompatible dimensions: " +
                                 from->dimension.toString() + " vs " +
                                 to->dimension.toString());
    }

    return to->convertFromBase(from->convertToBase(value));
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}


// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    size_t i = 0;
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits &&
                   i + 1 < trimmed.length() &&
                   (std::isdigit(static_cast<unsigned char>(trimmed[i + 1])) ||
                    trimmed[i + 1] == '+' || trimmed[i + 1] == '-')) {
            // Scientific notation
            i++;
            if (trimmed[i] == '+' || trimmed[i] == '-') i++;
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
    } catch (const std::exception&) {
        return false;
    }
    unit = unit_str;
    return true;
}

double UnitSystem::parseAndConvertToBase(const std::string& value_with_unit) const {
    double value;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw std::runtime_error("Failed to parse: " + value_with_unit);
    }

    if (unit.empty()) {
        return value;
    }

    return toBase(value, unit);
}

bool UnitSystem::parseQuantity(const std::string& text, const std::string& default_unit,
                               double& value) const {
    double parsed_value;
    std::string parsed_unit;
    if (!parseValueWithUnit(text, parsed_value, parsed_unit)) {
        return false;
    }

    const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
    value = unit.empty() ? parsed_value : toBase(parsed_value, unit);
    return true;
}

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->dimension == u2->dimension;
}

} // namespace SWCS
