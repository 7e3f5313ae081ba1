#include "SWCS.hpp"
#include "Simulator.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "SWCS - Shallow Water Channel Simulator\n"
                    "Usage: swcs -c <file> [options]\n\n"
                    "Options:\n"
                    "  -c <file>               Configuration file (.config)\n"
                    "  -generate_config <file> Write a template configuration and exit\n"
                    "  -da_grid_x <n>          Override the number of cells along the channel\n"
                    "  -da_grid_y <n>          Override the number of cells across the channel\n"
                    "  -ts_type <type>         Time stepping (default cn)\n"
                    "  -snes_type <type>       Nonlinear solver: newtonls, newtontr\n"
                    "  -ksp_type <type>        Linear solver: gmres, bcgs, preonly\n"
                    "  -pc_type <type>         Preconditioner: ilu, lu, asm\n\n"
                    "Examples:\n"
                    "  mpirun -np 2 swcs -c config/tidal_channel.config\n"
                    "  swcs -generate_config my_channel.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); if (ierr) return ierr;

    int status = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        char config_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                try {
                    SWCS::ConfigReader::generateTemplate(generate_config);
                    PetscPrintf(PETSC_COMM_SELF, "Configuration template written to: %s\n", generate_config);
                } catch (const std::exception& e) {
                    PetscPrintf(PETSC_COMM_SELF, "Error: %s\n", e.what());
                    status = 1;
                }
            }
        } else if (!config_provided) {
            PetscPrintf(comm, "Error: Configuration file (-c) required\n");
            PetscPrintf(comm, "Run with -help for usage information\n");
            PetscPrintf(comm, "Generate template: swcs -generate_config channel.config\n");
            status = 1;
        } else {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  SWCS - Shallow Water Channel Simulator\n");
            PetscPrintf(comm, "============================================================\n\n");

            try {
                SWCS::Simulator sim(comm);

                ierr = sim.initializeFromConfigFile(config_file); CHKERRQ(ierr);

                PetscPrintf(comm, "Setting up problem...\n");
                ierr = sim.setup(); CHKERRQ(ierr);

                double start_time = MPI_Wtime();
                ierr = sim.run(); CHKERRQ(ierr);
                double end_time = MPI_Wtime();

                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Simulation completed, wall time %.2f s\n", end_time - start_time);

                ierr = sim.writeSummary(); CHKERRQ(ierr);

                PetscPrintf(comm, "Output files written to: %s/\n",
                            sim.getSimulationConfig().output_dir.c_str());
            } catch (const std::exception& e) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
                status = 1;
            }
        }
    }

    ierr = PetscFinalize();
    return status ? status : (int)ierr;
}
