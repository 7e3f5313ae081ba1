#include "Simulator.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <stdexcept>

namespace SWCS {

Simulator::Simulator(MPI_Comm comm_in)
    : comm(comm_in), rank(0), size(1),
      has_observation_(false),
      observed_updater_(nullptr),
      export_steps_(1) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);
}

Simulator::~Simulator() {
    // The solver reads the mesh and boundary spec; destroy it first
    solver_.reset();
    mesh_.reset();
}

// =============================================================================
// Initialization
// =============================================================================

PetscErrorCode Simulator::initialize(const SimulationConfig& sim,
                                     const GridConfig& grid,
                                     const PhysicsConfig& physics) {
    PetscFunctionBeginUser;

    config = sim;
    grid_config = grid;
    physics_config = physics;

    PetscPrintf(comm, "Configuration:\n");
    PetscPrintf(comm, "  Time: %g -> %g s, dt = %g s, export every %g s\n",
                config.start_time, config.end_time, config.dt, config.export_interval);
    PetscPrintf(comm, "  Channel: %g x %g m, %d x %d cells\n",
                grid_config.Lx, grid_config.Ly, grid_config.nx, grid_config.ny);
    PetscPrintf(comm, "  Depth: %g m, %s equations\n", physics_config.depth,
                physics_config.use_nonlinear_equations ? "nonlinear" : "linear");

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file %s",
                config_file.c_str());
    }

    ConfigReader::ValidationResult check = reader.validate();
    for (const auto& w : check.warnings) {
        PetscPrintf(comm, "  Warning: %s\n", w.c_str());
    }
    if (!check.valid) {
        for (const auto& e : check.errors) {
            PetscPrintf(comm, "  Error: %s\n", e.c_str());
        }
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid configuration in %s (%d errors)",
                config_file.c_str(), (int)check.errors.size());
    }

    SimulationConfig sim;
    GridConfig grid;
    PhysicsConfig physics;
    std::vector<ForcingConfig> forcings;
    std::vector<BoundaryConfig> boundaries;
    ObservationConfig observation;
    bool has_observation = false;

    try {
        reader.parseSimulationConfig(sim);
        reader.parseGridConfig(grid);
        reader.parsePhysicsConfig(physics);
        forcings = reader.parseForcings();
        boundaries = reader.parseBoundaries();
        has_observation = reader.parseObservationConfig(observation);
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "%s: %s", config_file.c_str(), e.what());
    }

    ierr = initialize(sim, grid, physics); CHKERRQ(ierr);

    for (const auto& f : forcings) {
        ierr = addForcing(f); CHKERRQ(ierr);
    }
    for (const auto& b : boundaries) {
        ierr = addBoundary(b); CHKERRQ(ierr);
    }
    if (has_observation) {
        ierr = setObservation(observation); CHKERRQ(ierr);
    }
    for (const auto& g : reader.parseGauges()) {
        ierr = addGauge(g); CHKERRQ(ierr);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::addForcing(const ForcingConfig& forcing) {
    PetscFunctionBeginUser;
    for (const auto& f : forcing_configs_) {
        if (f.name == forcing.name) {
            SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Forcing '%s' defined twice", forcing.name.c_str());
        }
    }
    forcing_configs_.push_back(forcing);
    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::addBoundary(const BoundaryConfig& boundary) {
    PetscFunctionBeginUser;
    boundary_configs_.push_back(boundary);
    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::setObservation(const ObservationConfig& observation) {
    PetscFunctionBeginUser;
    observation_config_ = observation;
    has_observation_ = true;
    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::addGauge(const GaugeConfig& gauge) {
    PetscFunctionBeginUser;
    gauge_configs_.push_back(gauge);
    PetscFunctionReturn(0);
}

// =============================================================================
// Setup
// =============================================================================

PetscErrorCode Simulator::setup() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    ierr = setupMesh(); CHKERRQ(ierr);
    ierr = setupForcing(); CHKERRQ(ierr);
    ierr = setupBoundaries(); CHKERRQ(ierr);
    ierr = setupSolver(); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::setupMesh() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    mesh_ = std::make_unique<ChannelMesh>(comm);
    ierr = mesh_->create(grid_config); CHKERRQ(ierr);

    PetscPrintf(comm, "Mesh: %d x %d cells, dx = %g m, dy = %g m (%d ranks)\n",
                mesh_->nx(), mesh_->ny(), mesh_->dx(), mesh_->dy(), size);

    gauges_.clear();
    for (const auto& g : gauge_configs_) {
        int i, j;
        if (!mesh_->locate(g.x, g.y, i, j)) {
            SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Gauge '%s' at (%g, %g) lies outside the channel",
                    g.name.c_str(), g.x, g.y);
        }
        gauges_.emplace_back(g.name, g.x, g.y);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::setupForcing() {
    PetscFunctionBeginUser;

    forcings_.clear();
    updaters_.clear();
    observed_updater_ = nullptr;

    try {
        for (const auto& fc : forcing_configs_) {
            auto state = std::make_unique<ForcingState>(fc.name, fc.baseline,
                                                        fc.amplitude, fc.period);
            updaters_.push_back(std::make_unique<PeriodicForcingUpdater>(*state));
            forcings_[fc.name] = std::move(state);

            PetscPrintf(comm, "Forcing '%s': %g + %g sin(2 pi t / %g)\n",
                        fc.name.c_str(), fc.baseline, fc.amplitude, fc.period);
        }
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "%s", e.what());
    }

    if (!has_observation_ || observation_config_.trigger_times.empty()) {
        PetscFunctionReturn(0);
    }

    // Observation rides on one forcing's step hook
    std::string name = observation_config_.forcing;
    if (name.empty() && forcing_configs_.size() == 1) {
        name = forcing_configs_.front().name;
    }
    for (size_t k = 0; k < forcing_configs_.size(); ++k) {
        if (forcing_configs_[k].name == name) observed_updater_ = updaters_[k].get();
    }
    if (!observed_updater_) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Observation needs a forcing to attach to (got '%s')",
                name.c_str());
    }

    try {
        observed_updater_->setTriggerTimes(observation_config_.trigger_times);
        observed_updater_->setTimeStep(config.dt, config.start_time);
        observed_updater_->setMatchPolicy(observation_config_.policy, observation_config_.tolerance);
    } catch (const std::exception& e) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "%s", e.what());
    }
    observed_updater_->setObservationAction([this](double t) { observeElevation(t); });

    for (double t : observed_updater_->checkAlignment(config.dt, config.start_time)) {
        if (observation_config_.policy == TriggerMatchPolicy::EXACT) {
            PetscPrintf(comm, "Warning: trigger time %g s is not reached by steps of %g s "
                        "and will not fire (use match_policy = TOLERANCE or STEP_INDEX)\n",
                        t, config.dt);
        } else {
            PetscPrintf(comm, "Warning: no step of %g s matches trigger time %g s "
                        "under the selected match_policy; it will not fire\n",
                        config.dt, t);
        }
    }
    for (double t : observation_config_.trigger_times) {
        if (t > config.end_time) {
            PetscPrintf(comm, "Warning: trigger time %g s is after the end time %g s\n",
                        t, config.end_time);
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::setupBoundaries() {
    PetscFunctionBeginUser;

    bcs_ = BoundarySpec();
    UnitSystem units;

    for (const auto& bc : boundary_configs_) {
        BoundaryValues values;
        const std::pair<BoundaryRole, const std::string*> roles[] = {
            {BoundaryRole::ELEVATION, &bc.elevation},
            {BoundaryRole::FLUX, &bc.flux},
            {BoundaryRole::NORMAL_VELOCITY, &bc.normal_velocity}
        };

        for (const auto& role : roles) {
            const std::string& text = *role.second;
            if (text.empty()) continue;

            double value;
            bool numeric = false;
            try {
                numeric = units.parseQuantity(text, BoundarySpec::roleUnit(role.first), value);
            } catch (const std::exception& e) {
                SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Boundary %d: %s", bc.id, e.what());
            }
            if (numeric) {
                values.set(role.first, BoundaryValue::constant(value));
                continue;
            }

            auto it = forcings_.find(text);
            if (it == forcings_.end()) {
                SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Boundary %d: unknown forcing '%s'",
                        bc.id, text.c_str());
            }
            values.set(role.first, BoundaryValue::forced(*it->second));
        }

        try {
            bcs_.setBoundary(bc.id, values);
        } catch (const std::exception& e) {
            SETERRQ(comm, PETSC_ERR_ARG_WRONG, "%s", e.what());
        }
    }

    std::vector<std::string> errors = bcs_.validate();
    if (!errors.empty()) {
        for (const auto& e : errors) PetscPrintf(comm, "  Error: %s\n", e.c_str());
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid boundary specification");
    }

    PetscPrintf(comm, "Boundaries:\n%s", bcs_.describe().c_str());

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::setupSolver() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!mesh_) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONGSTATE, "setupMesh() must run before setupSolver()");
    }

    bool created = true;
    if (rank == 0) {
        std::error_code ec;
        std::filesystem::create_directories(config.output_dir, ec);
        if (ec) {
            PetscPrintf(PETSC_COMM_SELF, "Error: %s: %s\n", config.output_dir.c_str(),
                        ec.message().c_str());
            created = false;
        }
    }
    ierr = allRanksSucceeded(created); CHKERRQ(ierr);
    if (!created) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Cannot create output directory %s",
                config.output_dir.c_str());
    }
    viz_ = std::make_unique<GnuplotViz>(config.output_dir);

    solver_ = std::make_unique<ShallowWaterSolver>(comm);
    ierr = solver_->initialize(*mesh_, bcs_, physics_config, config); CHKERRQ(ierr);

    // Forcings first: the observation must see the field of the step just taken
    for (auto& updater : updaters_) {
        PeriodicForcingUpdater* u = updater.get();
        solver_->addStepCallback([u](double t) { u->onStep(t); });
    }
    solver_->addStepCallback([this](double t) { recordDiagnostics(t); });

    export_steps_ = std::max(1L, std::lround(config.export_interval / config.dt));

    PetscFunctionReturn(0);
}

// =============================================================================
// Run
// =============================================================================

PetscErrorCode Simulator::run() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!solver_) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONGSTATE, "setup() must be called before run()");
    }

    ierr = recordInitialState(); CHKERRQ(ierr);

    PetscPrintf(comm, "\nStarting time integration...\n");
    ierr = solver_->run(); CHKERRQ(ierr);

    PetscPrintf(comm, "Finished at t = %g s after %d steps\n",
                solver_->getCurrentTime(), (int)solver_->getStepNumber());
    PetscPrintf(comm, "Volume: %.8e m3 (expected %.8e m3, max relative error %.3e)\n",
                volume_.currentVolume(), volume_.expectedVolume(), volume_.maxRelativeError());

    if (observed_updater_) {
        const auto& fired = observed_updater_->firedTriggers();
        PetscPrintf(comm, "Observations: %d of %d trigger times fired\n",
                    (int)fired.size(), (int)observed_updater_->triggerTimes().size());
    }

    PetscFunctionReturn(0);
}

void Simulator::observeElevation(double t) {
    std::vector<std::vector<double>> eta;
    if (solver_->getElevationField(eta)) {
        throw std::runtime_error("Failed to gather the elevation field");
    }
    observation_times_.push_back(t);

    char name[64];
    std::snprintf(name, sizeof(name), "elevation_t%g", t);

    std::string failure;
    if (rank == 0 && config.write_plots) {
        std::vector<GnuplotViz::PointMarker> markers;
        for (const auto& g : gauges_) {
            markers.push_back({g.x, g.y, g.name});
        }
        viz_->addMarkers(markers);

        char title[96];
        std::snprintf(title, sizeof(title), "Free surface elevation at t = %g s", t);
        try {
            bool rendered = viz_->plot2DField(eta, mesh_->originX(), mesh_->originY(),
                                              mesh_->Lx(), mesh_->Ly(),
                                              title, "x (m)", "y (m)", "eta (m)",
                                              observation_config_.colormap, name,
                                              observation_config_.vmin, observation_config_.vmax);
            if (!rendered) {
                PetscPrintf(PETSC_COMM_SELF, "Warning: %s.gp written but not rendered\n", name);
            }
        } catch (const std::exception& e) {
            failure = e.what();
        }
    }

    // The plot is made on rank 0 only; every rank must leave the step together
    bool plotted = failure.empty();
    if (allRanksSucceeded(plotted) || !plotted) {
        throw std::runtime_error(failure.empty() ? "Elevation plot failed on rank 0" : failure);
    }

    PetscPrintf(comm, "Observation at t = %g s: %s/%s\n", t, config.output_dir.c_str(), name);
}

void Simulator::recordDiagnostics(double t) {
    if (recordState(t)) {
        throw std::runtime_error("Failed to record diagnostics");
    }
}

PetscErrorCode Simulator::recordInitialState() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    double volume, inflow;
    ierr = solver_->getTotalVolume(volume); CHKERRQ(ierr);
    ierr = solver_->getBoundaryInflow(inflow); CHKERRQ(ierr);

    const double t0 = config.start_time;
    volume_.initialize(t0, volume, inflow);

    history_time_.assign(1, t0);
    forcing_history_.clear();
    for (const auto& f : forcings_) {
        forcing_history_[f.first].assign(1, f.second->value);
    }

    if (!gauges_.empty()) {
        std::vector<std::vector<double>> eta;
        ierr = solver_->getElevationField(eta); CHKERRQ(ierr);
        for (auto& g : gauges_) {
            int i, j;
            mesh_->locate(g.x, g.y, i, j);
            g.time.clear();
            g.eta.clear();
            g.record(t0, eta[j][i]);
        }
    }

    ierr = writeOutput(0); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::recordState(double t) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    const PetscInt step = solver_->getStepNumber();

    if (!gauges_.empty()) {
        std::vector<std::vector<double>> eta;
        ierr = solver_->getElevationField(eta); CHKERRQ(ierr);
        for (auto& g : gauges_) {
            int i, j;
            mesh_->locate(g.x, g.y, i, j);
            g.record(t, eta[j][i]);
        }
    }

    double volume, inflow;
    ierr = solver_->getTotalVolume(volume); CHKERRQ(ierr);
    ierr = solver_->getBoundaryInflow(inflow); CHKERRQ(ierr);
    volume_.record(t, volume, inflow);

    history_time_.push_back(t);
    for (const auto& f : forcings_) {
        forcing_history_[f.first].push_back(f.second->value);
    }

    if (step % export_steps_ == 0) {
        ierr = writeOutput((int)step); CHKERRQ(ierr);
        PetscPrintf(comm, "  t = %g s: volume %.6e m3, inflow %g m3/s, conservation error %.2e\n",
                    t, volume, inflow, volume_.relativeError());
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Output
// =============================================================================

std::string Simulator::outputPath(const std::string& name) const {
    return config.output_dir + "/" + config.output_prefix + name;
}

PetscErrorCode Simulator::writeOutput(int step) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (config.write_vtk) {
        char suffix[32];
        std::snprintf(suffix, sizeof(suffix), "_%05d.vts", step);
        ierr = solver_->writeVTK(outputPath(suffix)); CHKERRQ(ierr);
    }

    PetscFunctionReturn(0);
}

void Simulator::generatePlots() {
    if (!gauges_.empty()) {
        std::map<std::string, std::vector<double>> series;
        for (const auto& g : gauges_) series[g.name] = g.eta;
        viz_->plotLines(gauges_.front().time, series, "Tide gauges",
                        "Time (s)", "Elevation (m)", config.output_prefix + "_gauges");
    }
    if (!forcing_history_.empty()) {
        viz_->plotLines(history_time_, forcing_history_, "Boundary forcing",
                        "Time (s)", "Value", config.output_prefix + "_forcing");
    }
    std::map<std::string, std::vector<double>> volume;
    volume["volume"] = volume_.volumes();
    viz_->plotLines(volume_.times(), volume, "Water volume",
                    "Time (s)", "Volume (m^3)", config.output_prefix + "_volume");
}

PetscErrorCode Simulator::allRanksSucceeded(bool& ok) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    int flag = ok ? 1 : 0;
    ierr = MPI_Allreduce(MPI_IN_PLACE, &flag, 1, MPI_INT, MPI_MIN, comm); CHKERRQ(ierr);
    ok = (flag == 1);
    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::writeSummary() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!solver_) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONGSTATE, "Nothing to summarise before run()");
    }

    std::string failure;
    if (rank == 0) {
        try {
            writeSummaryFiles();
            if (config.write_plots) generatePlots();
        } catch (const std::exception& e) {
            failure = e.what();
            PetscPrintf(PETSC_COMM_SELF, "Error: %s\n", failure.c_str());
        }
    }

    bool written = failure.empty();
    ierr = allRanksSucceeded(written); CHKERRQ(ierr);
    if (!written) {
        SETERRQ(comm, PETSC_ERR_FILE_WRITE, "Failed to write the run summary in %s",
                config.output_dir.c_str());
    }

    PetscFunctionReturn(0);
}

void Simulator::writeSummaryFiles() const {
    if (config.write_gauges) {
        for (const auto& g : gauges_) {
            g.writeASCII(outputPath("_gauge_" + g.name + ".txt"));
        }
        volume_.writeASCII(outputPath("_volume.txt"));
    }

    const std::string summary_file = outputPath("_SUMMARY.txt");
    std::ofstream summary(summary_file);
    if (!summary) {
        throw std::runtime_error("Cannot write summary: " + summary_file);
    }

    summary << "Simulation Summary\n";
    summary << "==================\n\n";
    summary << "Total timesteps: " << solver_->getStepNumber() << "\n";
    summary << "Final time: " << solver_->getCurrentTime() << " s\n";
    summary << "Grid: " << mesh_->nx() << " x " << mesh_->ny() << " cells\n\n";

    summary << "Forcings (final value):\n";
    for (const auto& f : forcings_) {
        summary << "  " << f.first << ": " << f.second->value << "\n";
    }

    summary << "\nObservations:\n";
    for (double t : observation_times_) {
        summary << "  elevation snapshot at t = " << t << " s\n";
    }
    if (observed_updater_) {
        const auto& fired = observed_updater_->firedTriggers();
        for (double t : observed_updater_->triggerTimes()) {
            if (std::find(fired.begin(), fired.end(), t) == fired.end()) {
                summary << "  trigger " << t << " s did not fire\n";
            }
        }
    }

    summary << std::setprecision(10);
    summary << "\nVolume:\n";
    summary << "  initial: " << volume_.initialVolume() << " m3\n";
    summary << "  final: " << volume_.currentVolume() << " m3\n";
    summary << "  integrated inflow: " << volume_.integratedInflow() << " m3\n";
    summary << "  max relative error: " << volume_.maxRelativeError() << "\n";

    if (!gauges_.empty()) {
        summary << "\nGauges (min / max elevation):\n";
        for (const auto& g : gauges_) {
            summary << "  " << g.name << ": " << g.getMinElevation()
                    << " / " << g.getMaxAmplitude() << " m\n";
        }
    }
}

const ForcingState* Simulator::getForcing(const std::string& name) const {
    auto it = forcings_.find(name);
    if (it == forcings_.end()) return nullptr;
    return it->second.get();
}

} // namespace SWCS
