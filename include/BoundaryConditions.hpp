/**
 * @file BoundaryConditions.hpp
 * @brief Boundary values for the shallow water channel
 *
 * Implements:
 * - Constant or forcing-driven boundary values
 * - Per-side records of named roles (elevation, flux, normal velocity)
 * - Boundary specification keyed by rectangle side identifier
 *
 * Sides without an entry are closed walls (zero normal flux, free slip).
 */

#ifndef BOUNDARY_CONDITIONS_HPP
#define BOUNDARY_CONDITIONS_HPP

#include "SWCS.hpp"
#include "PeriodicForcing.hpp"
#include <map>
#include <string>
#include <vector>

namespace SWCS {

/**
 * @brief Single boundary value: either a constant or a live forcing
 *
 * A forced value keeps a const pointer to the ForcingState; it reads the
 * scalar each time the solver assembles and never modifies it.
 */
class BoundaryValue {
public:
    BoundaryValue();

    static BoundaryValue constant(double value);
    static BoundaryValue forced(const ForcingState& forcing);

    bool isSet() const { return set_; }
    bool isForced() const { return forcing_ != nullptr; }

    // Current value (constant, or the forcing's value right now)
    double current() const;

    const ForcingState* forcing() const { return forcing_; }

private:
    bool set_;
    double constant_;
    const ForcingState* forcing_;
};

/**
 * @brief Named roles imposed on one side
 */
struct BoundaryValues {
    BoundaryValue elevation;
    BoundaryValue flux;
    BoundaryValue normal_velocity;

    bool has(BoundaryRole role) const { return get(role).isSet(); }
    const BoundaryValue& get(BoundaryRole role) const;
    void set(BoundaryRole role, const BoundaryValue& value);

    // True if the normal velocity is prescribed (flux or normal_velocity)
    bool imposesNormalVelocity() const {
        return flux.isSet() || normal_velocity.isSet();
    }
    bool isWall() const {
        return !elevation.isSet() && !imposesNormalVelocity();
    }
};

/**
 * @brief Mapping boundary identifier -> imposed values
 *
 * Built once before the run. The solver reads it during residual
 * assembly; only the forcing scalars behind it change over time.
 */
class BoundarySpec {
public:
    BoundarySpec() = default;

    /**
     * @brief Register the values for one side
     * @throws std::invalid_argument if id is not 1..4, or flux and
     *         normal_velocity are both set
     */
    void setBoundary(int id, const BoundaryValues& values);

    bool hasBoundary(int id) const;

    /**
     * @brief Values for a side; a wall record if none was registered
     */
    const BoundaryValues& getBoundary(int id) const;

    std::vector<int> getBoundaryIds() const;

    /**
     * @brief Check every registered side
     * @return Error messages; empty when the spec is usable
     */
    std::vector<std::string> validate() const;

    // Human readable summary, one line per side
    std::string describe() const;

    static std::string roleName(BoundaryRole role);
    // SI unit of a bare number given for the role
    static std::string roleUnit(BoundaryRole role);
    static std::string sideName(int id);

private:
    std::map<int, BoundaryValues> sides_;
    BoundaryValues wall_;
};

} // namespace SWCS

#endif // BOUNDARY_CONDITIONS_HPP
