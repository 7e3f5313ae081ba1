/**
 * @file test_tidal_channel.cpp
 * @brief End-to-end tests of the tidal channel case through Simulator
 */

#include <gtest/gtest.h>
#include "Simulator.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <cstdio>

using namespace SWCS;

class TidalChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);

        output_dir = "test_tidal_output";

        sim.start_time = 0.0;
        sim.end_time = 7200.0;
        sim.dt = 100.0;
        sim.export_interval = 1000.0;
        sim.log_frequency = 0;
        sim.output_dir = output_dir;
        sim.write_vtk = false;
        sim.write_plots = false;
        sim.write_gauges = true;

        grid.Lx = 40.0e3;
        grid.Ly = 2.0e3;
        grid.nx = 25;
        grid.ny = 2;

        physics.depth = 20.0;

        tidal.name = "tidal";
        tidal.baseline = 1000.0;
        tidal.amplitude = -2000.0;
        tidal.period = 43200.0;

        inlet.id = BOUNDARY_WEST;
        inlet.flux = "tidal";
        outlet.id = BOUNDARY_EAST;
        outlet.elevation = "0.0";

        observation.forcing = "tidal";
        observation.trigger_times = {1000.0, 2000.0, 4000.0, 7000.0};
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::filesystem::remove_all(output_dir);
        }
    }

    PetscErrorCode buildCase(Simulator& simulator) {
        PetscErrorCode ierr;
        ierr = simulator.initialize(sim, grid, physics); CHKERRQ(ierr);
        ierr = simulator.addForcing(tidal); CHKERRQ(ierr);
        ierr = simulator.addBoundary(inlet); CHKERRQ(ierr);
        ierr = simulator.addBoundary(outlet); CHKERRQ(ierr);
        ierr = simulator.setObservation(observation); CHKERRQ(ierr);
        ierr = simulator.addGauge({"mid", 20.0e3, 1.0e3}); CHKERRQ(ierr);
        ierr = simulator.setup(); CHKERRQ(ierr);
        return 0;
    }

    int rank;
    std::string output_dir;
    SimulationConfig sim;
    GridConfig grid;
    PhysicsConfig physics;
    ForcingConfig tidal;
    BoundaryConfig inlet, outlet;
    ObservationConfig observation;
};

TEST_F(TidalChannelTest, ObservationsFireAtTriggerTimes) {
    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);
    ASSERT_EQ(simulator.run(), 0);

    const std::vector<double>& observed = simulator.getObservationTimes();
    ASSERT_EQ(observed.size(), 4u);
    EXPECT_DOUBLE_EQ(observed[0], 1000.0);
    EXPECT_DOUBLE_EQ(observed[1], 2000.0);
    EXPECT_DOUBLE_EQ(observed[2], 4000.0);
    EXPECT_DOUBLE_EQ(observed[3], 7000.0);

    ASSERT_NE(simulator.getObservedUpdater(), nullptr);
    EXPECT_EQ(simulator.getObservedUpdater()->firedTriggers().size(), 4u);
    EXPECT_EQ(simulator.getSolver()->getStepNumber(), 72);
}

TEST_F(TidalChannelTest, ForcingFollowsTideAtEndOfRun) {
    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);

    const ForcingState* forcing = simulator.getForcing("tidal");
    ASSERT_NE(forcing, nullptr);
    EXPECT_DOUBLE_EQ(forcing->value, 1000.0);

    ASSERT_EQ(simulator.run(), 0);

    const double expected = 1000.0 - 2000.0 * std::sin(2.0 * M_PI * 7200.0 / 43200.0);
    EXPECT_NEAR(forcing->value, expected, 1e-9);
    EXPECT_NEAR(simulator.getSolver()->getCurrentTime(), 7200.0, 1e-9);
}

TEST_F(TidalChannelTest, VolumeBudgetCloses) {
    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);
    ASSERT_EQ(simulator.run(), 0);

    const VolumeMonitor& volume = simulator.getVolumeMonitor();
    EXPECT_EQ(volume.times().size(), 73u);
    EXPECT_LT(volume.maxRelativeError(), 1e-3);

    EXPECT_NEAR(volume.currentVolume() - volume.initialVolume(),
                volume.integratedInflow(), 1e-3 * volume.initialVolume());
}

TEST_F(TidalChannelTest, GaugeRecordsEveryStep) {
    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);
    ASSERT_EQ(simulator.run(), 0);

    const std::vector<TideGauge>& gauges = simulator.getGauges();
    ASSERT_EQ(gauges.size(), 1u);
    EXPECT_EQ(gauges[0].time.size(), 73u);
    EXPECT_GT(gauges[0].getRange(), 0.0);
}

TEST_F(TidalChannelTest, MisalignedTriggersSkippedUnderExact) {
    sim.dt = 300.0;

    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);
    ASSERT_EQ(simulator.run(), 0);

    // 300 s steps land on none of 1000, 2000, 4000, 7000
    EXPECT_TRUE(simulator.getObservationTimes().empty());
}

TEST_F(TidalChannelTest, ToleranceMatchingCatchesMisalignedTriggers) {
    sim.dt = 300.0;
    observation.policy = TriggerMatchPolicy::TOLERANCE;

    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);
    ASSERT_EQ(simulator.run(), 0);

    const std::vector<double>& observed = simulator.getObservationTimes();
    ASSERT_EQ(observed.size(), 4u);
    EXPECT_DOUBLE_EQ(observed[0], 900.0);
    EXPECT_DOUBLE_EQ(observed[1], 2100.0);
    EXPECT_DOUBLE_EQ(observed[2], 3900.0);
    EXPECT_DOUBLE_EQ(observed[3], 6900.0);
}

TEST_F(TidalChannelTest, ToleranceFiresTriggerBetweenTwoSteps) {
    sim.dt = 200.0;
    observation.policy = TriggerMatchPolicy::TOLERANCE;
    observation.trigger_times = {1100.0};

    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);
    ASSERT_EQ(simulator.run(), 0);

    const std::vector<double>& observed = simulator.getObservationTimes();
    ASSERT_EQ(observed.size(), 1u);
    EXPECT_DOUBLE_EQ(observed[0], 1000.0);
}

TEST_F(TidalChannelTest, RepeatedTriggerTimeObservedOnce) {
    observation.trigger_times = {2000.0, 1000.0, 2000.0};

    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(buildCase(simulator), 0);
    ASSERT_EQ(simulator.run(), 0);

    const std::vector<double>& observed = simulator.getObservationTimes();
    ASSERT_EQ(observed.size(), 2u);
    EXPECT_DOUBLE_EQ(observed[0], 1000.0);
    EXPECT_DOUBLE_EQ(observed[1], 2000.0);
}

TEST_F(TidalChannelTest, UnwritableOutputDirectoryFailsOnEveryRank) {
    // A regular file where a directory is needed
    const std::string blocker = "test_tidal_blocker";
    if (rank == 0) {
        std::ofstream(blocker) << "not a directory\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    sim.output_dir = blocker + "/out";
    Simulator simulator(PETSC_COMM_WORLD);
    EXPECT_NE(buildCase(simulator), 0);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) {
        std::remove(blocker.c_str());
    }
}

TEST_F(TidalChannelTest, DuplicateForcingRejected) {
    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(simulator.initialize(sim, grid, physics), 0);
    ASSERT_EQ(simulator.addForcing(tidal), 0);
    EXPECT_NE(simulator.addForcing(tidal), 0);
}

TEST_F(TidalChannelTest, UnknownBoundaryForcingRejected) {
    inlet.flux = "surge";

    Simulator simulator(PETSC_COMM_WORLD);
    EXPECT_NE(buildCase(simulator), 0);
}

TEST_F(TidalChannelTest, RunFromConfigFile) {
    const std::string config_file = "test_tidal_channel.config";
    if (rank == 0) {
        std::ofstream config(config_file);
        config << "[SIMULATION]\n";
        config << "end_time = 2000 s\n";
        config << "dt = 100 s\n";
        config << "[GRID]\n";
        config << "Lx = 40 km\nLy = 2 km\nnx = 25\nny = 2\n";
        config << "[BATHYMETRY]\ndepth = 20 m\n";
        config << "[FORCING_tidal]\n";
        config << "baseline = 1000 m3/s\namplitude = -2000 m3/s\nperiod = 12 hr\n";
        config << "[BOUNDARY_XMIN]\nflux = tidal\n";
        config << "[BOUNDARY_XMAX]\nelevation = 0 m\n";
        config << "[OBSERVATION]\ntrigger_times = 1000, 2000\n";
        config << "[GAUGE_inlet]\nx = 0.8 km\ny = 1 km\n";
        config << "[OUTPUT]\n";
        config << "output_dir = " << output_dir << "\n";
        config << "log_frequency = 0\nwrite_vtk = false\nwrite_plots = false\n";
        config.close();
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    Simulator simulator(PETSC_COMM_WORLD);
    ASSERT_EQ(simulator.initializeFromConfigFile(config_file), 0);
    ASSERT_EQ(simulator.setup(), 0);
    ASSERT_EQ(simulator.run(), 0);
    ASSERT_EQ(simulator.writeSummary(), 0);

    // Unnamed observation attaches to the only forcing
    EXPECT_EQ(simulator.getObservationTimes().size(), 2u);
    EXPECT_EQ(simulator.getSimulationConfig().output_dir, output_dir);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) {
        EXPECT_TRUE(std::filesystem::exists(output_dir + "/channel_SUMMARY.txt"));
        EXPECT_TRUE(std::filesystem::exists(output_dir + "/channel_gauge_inlet.txt"));
        EXPECT_TRUE(std::filesystem::exists(output_dir + "/channel_volume.txt"));
        std::remove(config_file.c_str());
    }
}
