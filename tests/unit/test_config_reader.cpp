/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include <fstream>
#include <cstdio>
#include <stdexcept>

using namespace SWCS;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit.config";

        if (rank == 0) {
            std::ofstream config(test_config_file);
            config << "[SIMULATION]\n";
            config << "end_time = 2 hr\n";
            config << "dt = 100 s\n";
            config << "\n[GRID]\n";
            config << "Lx = 40 km\n";
            config << "Ly = 2000\n";
            config << "nx = 25\n";
            config << "ny = 2\n";
            config << "\n[BATHYMETRY]\n";
            config << "depth = 20 m\n";
            config << "\n[PHYSICS]\n";
            config << "friction = manning\n";
            config << "manning_n = 0.03\n";
            config << "\n[FORCING_tidal]\n";
            config << "baseline = 1000 m3/s\n";
            config << "amplitude = -2000 m3/s\n";
            config << "period = 12 hr\n";
            config << "\n[BOUNDARY_1]\n";
            config << "flux = tidal        # inflow\n";
            config << "\n[BOUNDARY_XMAX]\n";
            config << "elevation = 0.0\n";
            config << "\n[OBSERVATION]\n";
            config << "forcing = tidal\n";
            config << "trigger_times = 1000, 2000, 4000, 7000\n";
            config << "match_policy = tolerance\n";
            config << "\n[GAUGE_mid]\n";
            config << "x = 20 km\n";
            config << "y = 1 km\n";
            config.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(test_config_file.c_str());
        }
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(test_config_file));
    EXPECT_TRUE(reader.hasSection("GRID"));
    EXPECT_TRUE(reader.hasKey("FORCING_tidal", "period"));
}

TEST_F(ConfigReaderTest, MissingFileFails) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, ParseSimulationConfigWithUnits) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    SimulationConfig sim;
    ASSERT_TRUE(reader.parseSimulationConfig(sim));
    EXPECT_DOUBLE_EQ(sim.end_time, 7200.0);
    EXPECT_DOUBLE_EQ(sim.dt, 100.0);
    EXPECT_DOUBLE_EQ(sim.export_interval, 100.0);
    EXPECT_EQ(sim.output_dir, "output");
}

TEST_F(ConfigReaderTest, ParseGridConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    GridConfig grid;
    ASSERT_TRUE(reader.parseGridConfig(grid));
    EXPECT_DOUBLE_EQ(grid.Lx, 40000.0);
    EXPECT_DOUBLE_EQ(grid.Ly, 2000.0);
    EXPECT_EQ(grid.nx, 25);
    EXPECT_EQ(grid.ny, 2);
}

TEST_F(ConfigReaderTest, ParsePhysicsConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    PhysicsConfig physics;
    ASSERT_TRUE(reader.parsePhysicsConfig(physics));
    EXPECT_DOUBLE_EQ(physics.depth, 20.0);
    EXPECT_EQ(physics.friction, FrictionModel::MANNING);
    EXPECT_DOUBLE_EQ(physics.manning_n, 0.03);
    EXPECT_TRUE(physics.use_nonlinear_equations);
}

TEST_F(ConfigReaderTest, ParseForcings) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    std::vector<ForcingConfig> forcings = reader.parseForcings();
    ASSERT_EQ(forcings.size(), 1u);
    EXPECT_EQ(forcings[0].name, "tidal");
    EXPECT_DOUBLE_EQ(forcings[0].baseline, 1000.0);
    EXPECT_DOUBLE_EQ(forcings[0].amplitude, -2000.0);
    EXPECT_DOUBLE_EQ(forcings[0].period, 43200.0);
}

TEST_F(ConfigReaderTest, ParseBoundariesByIdAndName) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    std::vector<BoundaryConfig> boundaries = reader.parseBoundaries();
    ASSERT_EQ(boundaries.size(), 2u);

    bool found_inlet = false, found_outlet = false;
    for (const auto& bc : boundaries) {
        if (bc.id == BOUNDARY_WEST) {
            found_inlet = true;
            EXPECT_EQ(bc.flux, "tidal");
            EXPECT_TRUE(bc.elevation.empty());
        }
        if (bc.id == BOUNDARY_EAST) {
            found_outlet = true;
            EXPECT_EQ(bc.elevation, "0.0");
        }
    }
    EXPECT_TRUE(found_inlet);
    EXPECT_TRUE(found_outlet);
}

TEST_F(ConfigReaderTest, ParseObservationConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ObservationConfig obs;
    ASSERT_TRUE(reader.parseObservationConfig(obs));
    EXPECT_EQ(obs.forcing, "tidal");
    ASSERT_EQ(obs.trigger_times.size(), 4u);
    EXPECT_DOUBLE_EQ(obs.trigger_times[3], 7000.0);
    EXPECT_EQ(obs.policy, TriggerMatchPolicy::TOLERANCE);
    EXPECT_LT(obs.tolerance, 0.0);
}

TEST_F(ConfigReaderTest, ParseGauges) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    std::vector<GaugeConfig> gauges = reader.parseGauges();
    ASSERT_EQ(gauges.size(), 1u);
    EXPECT_EQ(gauges[0].name, "mid");
    EXPECT_DOUBLE_EQ(gauges[0].x, 20000.0);
    EXPECT_DOUBLE_EQ(gauges[0].y, 1000.0);
}

TEST_F(ConfigReaderTest, ValidConfigPassesValidation) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, UnknownForcingFailsValidation) {
    ConfigReader reader;
    reader.loadString("[SIMULATION]\ndt = 100\n"
                      "[GRID]\nnx = 4\nny = 1\n"
                      "[BOUNDARY_1]\nflux = missing\n");

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.errors.empty());
}

TEST_F(ConfigReaderTest, ConflictingBoundaryRolesFailValidation) {
    ConfigReader reader;
    reader.loadString("[SIMULATION]\ndt = 100\n"
                      "[GRID]\nnx = 4\nny = 1\n"
                      "[BOUNDARY_1]\nflux = 10\nnormal_velocity = 0.1\n"
                      "[BOUNDARY_9]\nelevation = 0\n");

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(ConfigReaderTest, BadEnumsThrow) {
    ConfigReader reader;
    reader.loadString("[PHYSICS]\nfriction = linear\n"
                      "[OBSERVATION]\nmatch_policy = nearest\n"
                      "[BOUNDARY_west]\nelevation = 0\n");

    PhysicsConfig physics;
    EXPECT_THROW(reader.parsePhysicsConfig(physics), std::invalid_argument);

    ObservationConfig obs;
    EXPECT_THROW(reader.parseObservationConfig(obs), std::invalid_argument);

    EXPECT_THROW(reader.parseBoundaries(), std::invalid_argument);
}

TEST_F(ConfigReaderTest, NonPositivePeriodThrows) {
    ConfigReader reader;
    reader.loadString("[FORCING_tidal]\nperiod = 0\n");
    EXPECT_THROW(reader.parseForcings(), std::invalid_argument);
}

TEST_F(ConfigReaderTest, DefaultValuesForMissingKeys) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_EQ(reader.getInt("GRID", "nz", 7), 7);
    EXPECT_DOUBLE_EQ(reader.getDouble("PHYSICS", "gravity", 9.81), 9.81);
    EXPECT_EQ(reader.getString("NOPE", "key", "dflt"), "dflt");
    EXPECT_TRUE(reader.getBool("OUTPUT", "write_vtk", true));
}

TEST_F(ConfigReaderTest, OutputSectionReadWithoutSimulationSection) {
    ConfigReader reader;
    reader.loadString("[OUTPUT]\noutput_dir = run_a\nwrite_vtk = false\n"
                      "[SOLVER]\nrtol = 1e-6\n");

    SimulationConfig sim;
    EXPECT_TRUE(reader.parseSimulationConfig(sim));
    EXPECT_EQ(sim.output_dir, "run_a");
    EXPECT_FALSE(sim.write_vtk);
    EXPECT_DOUBLE_EQ(sim.rtol, 1e-6);
    EXPECT_DOUBLE_EQ(sim.dt, 100.0);
}

TEST_F(ConfigReaderTest, NoRunSectionsKeepsDefaults) {
    ConfigReader reader;
    reader.loadString("[GRID]\nnx = 4\n");

    SimulationConfig sim;
    EXPECT_FALSE(reader.parseSimulationConfig(sim));
    EXPECT_EQ(sim.output_dir, "output");
}

TEST_F(ConfigReaderTest, BoundaryNumberWithWrongUnitFailsValidation) {
    ConfigReader reader;
    reader.loadString("[SIMULATION]\ndt = 100\n"
                      "[GRID]\nnx = 4\nny = 1\n"
                      "[BOUNDARY_1]\nflux = 5 parsecs\n");

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    const std::string template_file = "test_template.config";
    if (rank == 0) {
        ConfigReader::generateTemplate(template_file);
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(template_file));

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_TRUE(result.valid);

    ObservationConfig obs;
    ASSERT_TRUE(reader.parseObservationConfig(obs));
    EXPECT_EQ(obs.policy, TriggerMatchPolicy::EXACT);
    EXPECT_EQ(obs.trigger_times.size(), 4u);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) {
        std::remove(template_file.c_str());
    }
}
