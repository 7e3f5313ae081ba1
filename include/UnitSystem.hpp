#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <cmath>

namespace SWCS {

/**
 * @brief Unit dimension in terms of Length and Time (L T)
 *
 * The channel model never needs mass: every input is a length, a time or
 * a combination of the two (velocity, flux, viscosity, ...).
 */
struct Dimension {
    double L;  // Length exponent
    double T;  // Time exponent

    Dimension(double length = 0, double time = 0)
        : L(length), T(time) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(T - other.T) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to base SI units (m, s)
 */
struct Unit {
    std::string name;           // Full name (e.g., "kilometer")
    std::string symbol;         // Short symbol (e.g., "km")
    Dimension dimension;
    double to_base;
    std::string category;

    Unit() : to_base(1.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), category(cat) {}

    double convertToBase(double value) const { return value * to_base; }
    double convertFromBase(double value) const { return value / to_base; }
};

/**
 * @brief Unit database for configuration values
 *
 * Parses strings such as "40 km", "12 hr" or "1000 m3/s" and converts them
 * to SI. Lookup is by name or symbol, case-insensitive as a fallback.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    const Unit* getUnit(const std::string& name_or_symbol) const;
    bool hasUnit(const std::string& name_or_symbol) const;
    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;
    std::vector<std::string> getCategories() const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if a unit is unknown or dimensions differ
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split "100 km" into 100 and "km"
     * @param[out] value Numeric part, not converted
     * @param[out] unit Unit part, empty if none
     * @return false if the string does not start with a number
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse value with unit and convert to SI (no unit: already SI)
     */
    double parseAndConvertToBase(const std::string& value_with_unit) const;

    /**
     * @brief Read a number, converting with default_unit when none is given
     * @return false if the text is not numeric (e.g. a forcing name)
     * @throws std::runtime_error if the number carries an unknown unit
     */
    bool parseQuantity(const std::string& text, const std::string& default_unit,
                       double& value) const;

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

private:
    std::map<std::string, Unit> units_;
    std::map<std::string, std::vector<std::string>> categories_;

    void addLengthUnits();
    void addTimeUnits();
    void addAreaUnits();
    void addVolumeUnits();
    void addVelocityUnits();
    void addAccelerationUnits();
    void addVolumetricRateUnits();
    void addKinematicViscosityUnits();
    void addFrequencyUnits();

    void registerUnit(const Unit& unit);

    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

} // namespace SWCS

#endif // UNIT_SYSTEM_HPP
