#include "ConfigReader.hpp"
#include "BoundaryConditions.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace SWCS {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

std::string ConfigReader::toUpper(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;

    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as a number" << std::endl;
        return default_val;
    }

    const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
    if (unit.empty()) {
        // No unit specified and no default, assume already in SI
        return parsed_value;
    }

    try {
        return unit_system_.toBase(parsed_value, unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

std::vector<double> ConfigReader::getDoubleArrayWithUnit(const std::string& section,
                                                         const std::string& key,
                                                         const std::string& default_unit) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        double parsed_value;
        std::string parsed_unit;

        if (!unit_system_.parseValueWithUnit(token, parsed_value, parsed_unit)) {
            std::cerr << "Warning: Cannot parse '" << token << "' as a number" << std::endl;
            continue;
        }

        const std::string& unit = parsed_unit.empty() ? default_unit : parsed_unit;
        if (unit.empty()) {
            result.push_back(parsed_value);
            continue;
        }

        try {
            result.push_back(unit_system_.toBase(parsed_value, unit));
        } catch (const std::exception& e) {
            std::cerr << "Warning: Cannot convert '" << token << "': "
                      << e.what() << std::endl;
        }
    }

    return result;
}

// =============================================================================
// Section/Key Queries
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

// =============================================================================
// Parsing Methods
// =============================================================================

bool ConfigReader::parseSimulationConfig(SimulationConfig& config) const {
    // Each section is optional; missing keys keep their defaults

    config.start_time = getDoubleWithUnit("SIMULATION", "start_time", 0.0, "s");
    config.end_time = getDoubleWithUnit("SIMULATION", "end_time", 7200.0, "s");
    config.dt = getDoubleWithUnit("SIMULATION", "dt", 100.0, "s");
    config.export_interval = getDoubleWithUnit("SIMULATION", "export_interval", config.dt, "s");
    config.max_timesteps = getInt("SIMULATION", "max_timesteps", 100000);

    // Solver tolerances
    config.rtol = getDouble("SOLVER", "rtol", 1e-8);
    config.atol = getDouble("SOLVER", "atol", 1e-10);
    config.max_nonlinear_iterations = getInt("SOLVER", "max_nonlinear_iterations", 50);
    config.max_linear_iterations = getInt("SOLVER", "max_linear_iterations", 1000);

    // Output control
    config.output_dir = getString("OUTPUT", "output_dir", "output");
    config.output_prefix = getString("OUTPUT", "prefix", "channel");
    config.log_frequency = getInt("OUTPUT", "log_frequency", 10);
    config.write_vtk = getBool("OUTPUT", "write_vtk", true);
    config.write_gauges = getBool("OUTPUT", "write_gauges", true);
    config.write_plots = getBool("OUTPUT", "write_plots", true);

    return hasSection("SIMULATION") || hasSection("SOLVER") || hasSection("OUTPUT");
}

bool ConfigReader::parseGridConfig(GridConfig& config) const {
    if (!hasSection("GRID")) return false;

    config.nx = getInt("GRID", "nx", 25);
    config.ny = getInt("GRID", "ny", 2);
    config.Lx = getDoubleWithUnit("GRID", "Lx", 40.0e3, "m");
    config.Ly = getDoubleWithUnit("GRID", "Ly", 2.0e3, "m");
    config.origin_x = getDoubleWithUnit("GRID", "origin_x", 0.0, "m");
    config.origin_y = getDoubleWithUnit("GRID", "origin_y", 0.0, "m");

    return true;
}

bool ConfigReader::parsePhysicsConfig(PhysicsConfig& config) const {
    if (!hasSection("BATHYMETRY") && !hasSection("PHYSICS")) return false;

    config.depth = getDoubleWithUnit("BATHYMETRY", "depth", 20.0, "m");
    config.min_depth = getDoubleWithUnit("BATHYMETRY", "min_depth", 0.05, "m");

    config.gravity = getDoubleWithUnit("PHYSICS", "gravity", GRAVITY, "m/s2");
    config.use_nonlinear_equations = getBool("PHYSICS", "nonlinear", true);
    config.horizontal_viscosity = getDoubleWithUnit("PHYSICS", "viscosity", 0.0, "m2/s");
    config.coriolis_frequency = getDoubleWithUnit("PHYSICS", "coriolis", 0.0, "rad/s");
    config.initial_elevation = getDoubleWithUnit("PHYSICS", "initial_elevation", 0.0, "m");
    config.drag_coefficient = getDouble("PHYSICS", "drag_coefficient", 0.0025);
    config.manning_n = getDouble("PHYSICS", "manning_n", 0.02);

    std::string friction = toUpper(getString("PHYSICS", "friction", "NONE"));
    if (friction == "NONE") config.friction = FrictionModel::NONE;
    else if (friction == "QUADRATIC") config.friction = FrictionModel::QUADRATIC;
    else if (friction == "MANNING") config.friction = FrictionModel::MANNING;
    else {
        throw std::invalid_argument("Unknown friction model '" + friction +
                                    "' (NONE, QUADRATIC, MANNING)");
    }

    return true;
}

std::vector<ForcingConfig> ConfigReader::parseForcings() const {
    std::vector<ForcingConfig> forcings;

    for (const auto& section : getSectionsMatching("FORCING_")) {
        ForcingConfig fc;
        fc.name = section.substr(std::string("FORCING_").size());
        fc.baseline = getDoubleWithUnit(section, "baseline", 0.0);
        fc.amplitude = getDoubleWithUnit(section, "amplitude", 0.0);
        fc.period = getDoubleWithUnit(section, "period", 43200.0, "s");

        if (fc.name.empty()) {
            throw std::invalid_argument("Forcing section [" + section + "] has no name");
        }
        if (!(fc.period > 0.0)) {
            throw std::invalid_argument("Forcing '" + fc.name + "': period must be positive");
        }
        forcings.push_back(fc);
    }

    return forcings;
}

std::vector<BoundaryConfig> ConfigReader::parseBoundaries() const {
    std::vector<BoundaryConfig> boundaries;

    for (const auto& section : getSectionsMatching("BOUNDARY_")) {
        std::string tag = toUpper(section.substr(std::string("BOUNDARY_").size()));

        BoundaryConfig bc;
        if (tag == "XMIN") bc.id = BOUNDARY_WEST;
        else if (tag == "XMAX") bc.id = BOUNDARY_EAST;
        else if (tag == "YMIN") bc.id = BOUNDARY_SOUTH;
        else if (tag == "YMAX") bc.id = BOUNDARY_NORTH;
        else {
            try {
                size_t pos = 0;
                bc.id = std::stoi(tag, &pos);
                if (pos != tag.size()) {
                    throw std::invalid_argument(tag);
                }
            } catch (const std::exception&) {
                throw std::invalid_argument("Boundary section [" + section +
                                            "]: expected an id 1-4 or XMIN/XMAX/YMIN/YMAX");
            }
        }

        bc.elevation = getString(section, "elevation");
        bc.flux = getString(section, "flux");
        bc.normal_velocity = getString(section, "normal_velocity");
        boundaries.push_back(bc);
    }

    return boundaries;
}

bool ConfigReader::parseObservationConfig(ObservationConfig& config) const {
    if (!hasSection("OBSERVATION")) return false;

    config.forcing = getString("OBSERVATION", "forcing");
    config.trigger_times = getDoubleArrayWithUnit("OBSERVATION", "trigger_times", "s");
    config.tolerance = getDoubleWithUnit("OBSERVATION", "tolerance", -1.0, "s");
    config.colormap = getString("OBSERVATION", "colormap", "coolwarm");
    config.vmin = getDoubleWithUnit("OBSERVATION", "vmin", 0.0, "m");
    config.vmax = getDoubleWithUnit("OBSERVATION", "vmax", 0.0, "m");

    std::string policy = toUpper(getString("OBSERVATION", "match_policy", "EXACT"));
    if (policy == "EXACT") config.policy = TriggerMatchPolicy::EXACT;
    else if (policy == "TOLERANCE") config.policy = TriggerMatchPolicy::TOLERANCE;
    else if (policy == "STEP_INDEX") config.policy = TriggerMatchPolicy::STEP_INDEX;
    else {
        throw std::invalid_argument("Unknown match_policy '" + policy +
                                    "' (EXACT, TOLERANCE, STEP_INDEX)");
    }

    return true;
}

std::vector<GaugeConfig> ConfigReader::parseGauges() const {
    std::vector<GaugeConfig> gauges;

    for (const auto& section : getSectionsMatching("GAUGE_")) {
        GaugeConfig g;
        g.name = section.substr(std::string("GAUGE_").size());
        g.x = getDoubleWithUnit(section, "x", 0.0, "m");
        g.y = getDoubleWithUnit(section, "y", 0.0, "m");
        gauges.push_back(g);
    }

    return gauges;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write configuration template: " + filename);
    }

    file << "# SWCS Configuration File\n";
    file << "# Tidal flow in a rectangular channel\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value [unit]   (SI when no unit is given)\n\n";

    file << "[SIMULATION]\n";
    file << "start_time = 0.0\n";
    file << "end_time = 7200 s\n";
    file << "dt = 100 s                            # Triggers must be multiples of dt\n";
    file << "export_interval = 100 s\n";
    file << "max_timesteps = 100000\n\n";

    file << "[SOLVER]\n";
    file << "rtol = 1.0e-8\n";
    file << "atol = 1.0e-10\n";
    file << "max_nonlinear_iterations = 50\n";
    file << "max_linear_iterations = 1000\n\n";

    file << "[GRID]\n";
    file << "Lx = 40 km\n";
    file << "Ly = 2 km\n";
    file << "nx = 25\n";
    file << "ny = 2\n\n";

    file << "[BATHYMETRY]\n";
    file << "depth = 20 m\n";
    file << "min_depth = 0.05 m                    # Depth floor\n\n";

    file << "[PHYSICS]\n";
    file << "nonlinear = true\n";
    file << "viscosity = 0 m2/s\n";
    file << "friction = NONE                       # NONE, QUADRATIC, MANNING\n";
    file << "drag_coefficient = 0.0025\n";
    file << "manning_n = 0.02\n";
    file << "coriolis = 0 rad/s\n";
    file << "initial_elevation = 0 m\n\n";

    file << "# value(t) = baseline + amplitude * sin(2 pi t / period)\n";
    file << "[FORCING_tidal]\n";
    file << "baseline = 1000 m3/s\n";
    file << "amplitude = -2000 m3/s\n";
    file << "period = 12 hr\n\n";

    file << "# Sides: 1 = x-min, 2 = x-max, 3 = y-min, 4 = y-max (missing = wall)\n";
    file << "# Values: a number or the name of a forcing\n";
    file << "[BOUNDARY_1]\n";
    file << "flux = tidal                          # Positive into the channel\n\n";

    file << "[BOUNDARY_2]\n";
    file << "elevation = 0 m\n\n";

    file << "[OBSERVATION]\n";
    file << "forcing = tidal\n";
    file << "trigger_times = 1000, 2000, 4000, 7000\n";
    file << "match_policy = EXACT                  # EXACT, TOLERANCE, STEP_INDEX\n";
    file << "colormap = coolwarm\n\n";

    file << "[GAUGE_inlet]\n";
    file << "x = 0.8 km\n";
    file << "y = 1 km\n\n";

    file << "[GAUGE_mid]\n";
    file << "x = 20 km\n";
    file << "y = 1 km\n\n";

    file << "[OUTPUT]\n";
    file << "output_dir = output\n";
    file << "prefix = channel\n";
    file << "log_frequency = 10\n";
    file << "write_vtk = true\n";
    file << "write_gauges = true\n";
    file << "write_plots = true\n";
}

// =============================================================================
// Utility Methods
// =============================================================================

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    auto error = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    if (!hasSection("SIMULATION")) {
        result.warnings.push_back("No [SIMULATION] section found - using defaults");
    }
    if (!hasSection("GRID")) {
        result.warnings.push_back("No [GRID] section found - using defaults");
    }

    SimulationConfig sim;
    parseSimulationConfig(sim);
    if (!(sim.dt > 0.0)) {
        error("Time step dt must be positive");
    }
    if (!(sim.end_time > sim.start_time)) {
        error("end_time must be greater than start_time");
    }
    if (!(sim.export_interval > 0.0)) {
        error("export_interval must be positive");
    }

    GridConfig grid;
    parseGridConfig(grid);
    if (grid.nx < 1 || grid.ny < 1) {
        error("Grid needs at least one cell in each direction");
    }
    if (!(grid.Lx > 0.0) || !(grid.Ly > 0.0)) {
        error("Channel length and width must be positive");
    }

    if (getDoubleWithUnit("BATHYMETRY", "depth", 20.0, "m") <= 0.0) {
        error("Bathymetry depth must be positive");
    }

    // Forcings
    std::vector<std::string> forcing_names;
    for (const auto& section : getSectionsMatching("FORCING_")) {
        std::string name = section.substr(std::string("FORCING_").size());
        forcing_names.push_back(name);
        if (getDoubleWithUnit(section, "period", 43200.0, "s") <= 0.0) {
            error("Forcing '" + name + "': period must be positive");
        }
    }
    auto isForcing = [&forcing_names](const std::string& name) {
        return std::find(forcing_names.begin(), forcing_names.end(), name) != forcing_names.end();
    };

    // Boundaries
    std::vector<BoundaryConfig> boundaries;
    try {
        boundaries = parseBoundaries();
    } catch (const std::exception& e) {
        error(e.what());
    }

    if (boundaries.empty()) {
        result.warnings.push_back("No [BOUNDARY_<id>] sections - closed basin");
    }

    for (const auto& bc : boundaries) {
        std::string where = "Boundary " + std::to_string(bc.id);
        if (bc.id < BOUNDARY_WEST || bc.id > BOUNDARY_NORTH) {
            error(where + ": id must be 1-4");
        }
        if (!bc.flux.empty() && !bc.normal_velocity.empty()) {
            error(where + ": flux and normal_velocity are mutually exclusive");
        }
        if (bc.elevation.empty() && bc.flux.empty() && bc.normal_velocity.empty()) {
            error(where + ": no elevation, flux or normal_velocity given");
        }
        const std::pair<BoundaryRole, std::string> entries[] = {
            {BoundaryRole::ELEVATION, bc.elevation},
            {BoundaryRole::FLUX, bc.flux},
            {BoundaryRole::NORMAL_VELOCITY, bc.normal_velocity}
        };
        for (const auto& entry : entries) {
            double value;
            if (entry.second.empty()) continue;
            try {
                const std::string unit = BoundarySpec::roleUnit(entry.first);
                if (!unit_system_.parseQuantity(entry.second, unit, value) &&
                    !isForcing(entry.second)) {
                    error(where + ": unknown forcing '" + entry.second + "'");
                }
            } catch (const std::exception& e) {
                error(where + ": " + e.what());
            }
        }
    }

    // Observation
    if (hasSection("OBSERVATION")) {
        std::string forcing = getString("OBSERVATION", "forcing");
        if (!forcing.empty() && !isForcing(forcing)) {
            error("[OBSERVATION] refers to unknown forcing '" + forcing + "'");
        }
        std::string policy = toUpper(getString("OBSERVATION", "match_policy", "EXACT"));
        if (policy != "EXACT" && policy != "TOLERANCE" && policy != "STEP_INDEX") {
            error("Unknown match_policy '" + policy + "'");
        }
        for (double t : getDoubleArrayWithUnit("OBSERVATION", "trigger_times", "s")) {
            if (t <= sim.start_time || t > sim.end_time) {
                result.warnings.push_back("Trigger time " + std::to_string(t) +
                                          " lies outside the simulated interval");
            }
        }
    }

    std::string friction = toUpper(getString("PHYSICS", "friction", "NONE"));
    if (friction != "NONE" && friction != "QUADRATIC" && friction != "MANNING") {
        error("Unknown friction model '" + friction + "'");
    }

    return result;
}

} // namespace SWCS
