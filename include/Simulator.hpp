#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include "SWCS.hpp"
#include "ChannelMesh.hpp"
#include "BoundaryConditions.hpp"
#include "PeriodicForcing.hpp"
#include "ShallowWaterSolver.hpp"
#include "GnuplotViz.hpp"
#include "Diagnostics.hpp"
#include "ConfigReader.hpp"
#include <memory>
#include <vector>
#include <map>

namespace SWCS {

/**
 * @brief Tidal channel simulation driver
 *
 * Typical use:
 *   sim.initializeFromConfigFile("tidal_channel.config");
 *   sim.setup();
 *   sim.run();
 *   sim.writeSummary();
 *
 * Each completed step runs, in order: the forcing updaters (which may plot
 * the elevation at a trigger instant), then gauge, volume and VTK output.
 */
class Simulator {
public:
    Simulator(MPI_Comm comm);
    ~Simulator();

    // Initialization
    PetscErrorCode initialize(const SimulationConfig& sim,
                              const GridConfig& grid,
                              const PhysicsConfig& physics);
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);

    // Case description (before setup)
    PetscErrorCode addForcing(const ForcingConfig& forcing);
    PetscErrorCode addBoundary(const BoundaryConfig& boundary);
    PetscErrorCode setObservation(const ObservationConfig& observation);
    PetscErrorCode addGauge(const GaugeConfig& gauge);

    // Setup, in this order
    PetscErrorCode setupMesh();
    PetscErrorCode setupForcing();
    PetscErrorCode setupBoundaries();
    PetscErrorCode setupSolver();
    PetscErrorCode setup();

    // Run simulation
    PetscErrorCode run();

    // Output
    PetscErrorCode writeOutput(int step);
    PetscErrorCode writeSummary();

    // Access
    const ForcingState* getForcing(const std::string& name) const;
    const PeriodicForcingUpdater* getObservedUpdater() const { return observed_updater_; }
    const ShallowWaterSolver* getSolver() const { return solver_.get(); }
    const ChannelMesh* getMesh() const { return mesh_.get(); }
    const BoundarySpec& getBoundarySpec() const { return bcs_; }
    const VolumeMonitor& getVolumeMonitor() const { return volume_; }
    const std::vector<TideGauge>& getGauges() const { return gauges_; }
    const std::vector<double>& getObservationTimes() const { return observation_times_; }
    const SimulationConfig& getSimulationConfig() const { return config; }

private:
    MPI_Comm comm;
    int rank, size;

    // Configuration
    SimulationConfig config;
    GridConfig grid_config;
    PhysicsConfig physics_config;
    std::vector<ForcingConfig> forcing_configs_;
    std::vector<BoundaryConfig> boundary_configs_;
    ObservationConfig observation_config_;
    bool has_observation_;
    std::vector<GaugeConfig> gauge_configs_;

    // Model
    std::unique_ptr<ChannelMesh> mesh_;
    std::unique_ptr<ShallowWaterSolver> solver_;
    BoundarySpec bcs_;

    // Forcing states must stay at fixed addresses: boundary values point at them
    std::map<std::string, std::unique_ptr<ForcingState>> forcings_;
    std::vector<std::unique_ptr<PeriodicForcingUpdater>> updaters_;
    PeriodicForcingUpdater* observed_updater_;

    // Output and diagnostics
    std::unique_ptr<GnuplotViz> viz_;
    std::vector<TideGauge> gauges_;
    VolumeMonitor volume_;
    std::vector<double> history_time_;
    std::map<std::string, std::vector<double>> forcing_history_;
    std::vector<double> observation_times_;
    int export_steps_;

    // Step hooks
    void observeElevation(double t);
    void recordDiagnostics(double t);

    PetscErrorCode recordInitialState();
    PetscErrorCode recordState(double t);
    // Rank 0 only; throw on a failed write
    void writeSummaryFiles() const;
    void generatePlots();

    // Collective: ok stays true only if it was true on every rank
    PetscErrorCode allRanksSucceeded(bool& ok) const;

    std::string outputPath(const std::string& name) const;
};

} // namespace SWCS

#endif // SIMULATOR_HPP
