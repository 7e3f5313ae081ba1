#ifndef SWCS_HPP
#define SWCS_HPP

#include <petsc.h>
#include <petscts.h>
#include <petscdm.h>
#include <petscdmda.h>

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <functional>

namespace SWCS {

// Forward declarations
class Simulator;
class ChannelMesh;
class ShallowWaterSolver;
class PeriodicForcingUpdater;
class BoundarySpec;
class GnuplotViz;

// Physical constants
static const double GRAVITY = 9.81;                 // m/s²
static const double TWO_PI = 2.0 * M_PI;

/**
 * @brief Rectangle side identifiers
 *
 * Numbering follows the usual rectangle-mesh convention:
 * 1 = x-min, 2 = x-max, 3 = y-min, 4 = y-max.
 */
enum BoundaryId {
    BOUNDARY_WEST = 1,
    BOUNDARY_EAST = 2,
    BOUNDARY_SOUTH = 3,
    BOUNDARY_NORTH = 4
};

/**
 * @brief Named role a boundary value plays in the equations
 */
enum class BoundaryRole {
    ELEVATION,          ///< Prescribed free-surface elevation (m)
    FLUX,               ///< Total volume flux through the side (m³/s, positive inward)
    NORMAL_VELOCITY     ///< Depth-averaged normal velocity (m/s, positive inward)
};

/**
 * @brief How trigger instants are matched against the simulation clock
 */
enum class TriggerMatchPolicy {
    EXACT,              ///< t_new == trigger
    TOLERANCE,          ///< |t_new - trigger| <= tolerance
    STEP_INDEX          ///< step counter == round(trigger / dt)
};

enum class FrictionModel {
    NONE,
    QUADRATIC,          // τ/ρ = Cd |u| u
    MANNING             // Cd = g n² / H^(1/3)
};

// Configuration structures
struct SimulationConfig {
    double start_time = 0.0;
    double end_time = 7200.0;
    double dt = 100.0;
    double export_interval = 100.0;

    int max_timesteps = 100000;
    int log_frequency = 10;

    // Output
    std::string output_dir = "output";
    std::string output_prefix = "channel";
    bool write_vtk = true;
    bool write_gauges = true;
    bool write_plots = true;

    // Solver options
    double rtol = 1e-8;
    double atol = 1e-10;
    int max_nonlinear_iterations = 50;
    int max_linear_iterations = 1000;
};

struct GridConfig {
    double Lx = 40.0e3;     // Channel length (m)
    double Ly = 2.0e3;      // Channel width (m)
    int nx = 25;
    int ny = 2;
    double origin_x = 0.0;
    double origin_y = 0.0;
};

struct PhysicsConfig {
    double gravity = GRAVITY;
    double depth = 20.0;                        // Constant bathymetry (m)
    bool use_nonlinear_equations = true;        // H = h0 + η and advection
    double horizontal_viscosity = 0.0;          // m²/s
    FrictionModel friction = FrictionModel::NONE;
    double drag_coefficient = 0.0025;
    double manning_n = 0.02;
    double coriolis_frequency = 0.0;            // rad/s
    double min_depth = 0.05;                    // Depth floor (m)
    double initial_elevation = 0.0;
};

struct ForcingConfig {
    std::string name;
    double baseline = 0.0;
    double amplitude = 0.0;
    double period = 43200.0;
};

/**
 * @brief One side of the rectangle and the values imposed on it
 *
 * Each entry is either a number (constant) or the name of a forcing.
 * An empty string means the role is not imposed on this side.
 */
struct BoundaryConfig {
    int id = 0;
    std::string elevation;
    std::string flux;
    std::string normal_velocity;
};

struct ObservationConfig {
    std::string forcing;                    // Forcing driven by the step callback
    std::vector<double> trigger_times;
    TriggerMatchPolicy policy = TriggerMatchPolicy::EXACT;
    double tolerance = -1.0;                // < 0: half the time step
    std::string colormap = "coolwarm";
    double vmin = 0.0;                      // 0/0: auto range
    double vmax = 0.0;
};

struct GaugeConfig {
    std::string name;
    double x = 0.0;
    double y = 0.0;
};

} // namespace SWCS

#endif // SWCS_HPP
