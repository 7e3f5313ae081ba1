#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "SWCS.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace SWCS {

/**
 * @brief INI-style configuration reader for channel simulations
 *
 * Sections:
 *   [SIMULATION] [SOLVER] [OUTPUT] [GRID] [BATHYMETRY] [PHYSICS]
 *   [FORCING_<name>] [BOUNDARY_<id>] [OBSERVATION] [GAUGE_<name>]
 *
 * Numeric values may carry a unit ("40 km", "12 hr", "1000 m3/s"); they are
 * converted to SI through UnitSystem.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration text (same syntax as a file)
    bool loadString(const std::string& text);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    // [SIMULATION], [SOLVER] and [OUTPUT]; false if none of them is present
    bool parseSimulationConfig(SimulationConfig& config) const;
    bool parseGridConfig(GridConfig& config) const;

    // [BATHYMETRY] and [PHYSICS]
    bool parsePhysicsConfig(PhysicsConfig& config) const;

    /**
     * @brief All [FORCING_<name>] sections
     * @throws std::invalid_argument on a non-positive period
     */
    std::vector<ForcingConfig> parseForcings() const;

    /**
     * @brief All [BOUNDARY_<id>] sections, values kept as written
     * @throws std::invalid_argument if the id is not an integer
     */
    std::vector<BoundaryConfig> parseBoundaries() const;

    /**
     * @throws std::invalid_argument on an unknown match policy
     */
    bool parseObservationConfig(ObservationConfig& config) const;

    std::vector<GaugeConfig> parseGauges() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    // =========================================================================
    // Unit-Aware Value Accessors (converts to SI base units)
    // =========================================================================

    /**
     * @brief Get double value with automatic unit conversion to SI
     * @param default_val Default value (in SI units)
     * @param default_unit Unit assumed when the value carries none
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             double default_val = 0.0,
                             const std::string& default_unit = "") const;

    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& default_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    // Canonical tidal channel case
    static void generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    ValidationResult validate() const;

    const UnitSystem& units() const { return unit_system_; }

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    bool parseStream(std::istream& in);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
    std::string toUpper(const std::string& str) const;
};

} // namespace SWCS

#endif // CONFIG_READER_HPP
