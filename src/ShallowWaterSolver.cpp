/**
 * @file ShallowWaterSolver.cpp
 * @brief Implementation of the channel shallow water solver
 */

#include "ShallowWaterSolver.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace SWCS {

namespace {

/**
 * @brief Read-only view of a ghosted local array plus boundary rules
 *
 * x-faces are numbered f = -1 .. nx-1 (face f separates cells f and f+1),
 * y-faces g = -1 .. ny-1. Faces -1 and nx-1 (resp. ny-1) lie on the
 * channel boundary and are reconstructed here; the matching u (v) slot of
 * the last column (row) is unused and carries a trivial equation.
 */
class ChannelStencil {
public:
    ChannelStencil(ChannelField** x_, const ChannelMesh& mesh,
                   const BoundarySpec& bcs, const PhysicsConfig& phys_)
        : x(x_), nx(mesh.nx()), ny(mesh.ny()),
          dx(mesh.dx()), dy(mesh.dy()),
          ew_edge(mesh.edgeLength(BOUNDARY_WEST)), sn_edge(mesh.edgeLength(BOUNDARY_SOUTH)),
          phys(phys_),
          west(bcs.getBoundary(BOUNDARY_WEST)),
          east(bcs.getBoundary(BOUNDARY_EAST)),
          south(bcs.getBoundary(BOUNDARY_SOUTH)),
          north(bcs.getBoundary(BOUNDARY_NORTH)) {}

    double depth(double eta) const {
        if (!phys.use_nonlinear_equations) return phys.depth;
        return std::max(phys.depth + eta, phys.min_depth);
    }

    // Elevation on x-face f
    double etaFaceX(int f, int j) const {
        if (f < 0) {
            return west.elevation.isSet() ? west.elevation.current() : x[j][0].eta;
        }
        if (f >= nx - 1) {
            return east.elevation.isSet() ? east.elevation.current() : x[j][nx - 1].eta;
        }
        return 0.5 * (x[j][f].eta + x[j][f + 1].eta);
    }

    // Elevation on y-face g
    double etaFaceY(int i, int g) const {
        if (g < 0) {
            return south.elevation.isSet() ? south.elevation.current() : x[0][i].eta;
        }
        if (g >= ny - 1) {
            return north.elevation.isSet() ? north.elevation.current() : x[ny - 1][i].eta;
        }
        return 0.5 * (x[g][i].eta + x[g + 1][i].eta);
    }

    /**
     * @brief Outward normal velocity on a boundary face
     *
     * Prescribed flux/velocity wins. With only an elevation, the Flather
     * condition un = sqrt(g/H) (eta_int - eta_b) lets waves leave.
     */
    double outwardVelocity(const BoundaryValues& bv, double eta_face, double eta_int,
                           double edge) const {
        double H = depth(eta_face);
        if (bv.flux.isSet()) return -bv.flux.current() / (edge * H);
        if (bv.normal_velocity.isSet()) return -bv.normal_velocity.current();
        if (bv.elevation.isSet()) {
            return std::sqrt(phys.gravity / H) * (eta_int - bv.elevation.current());
        }
        return 0.0;
    }

    // x-velocity on face f, f = -1 .. nx-1
    double uFace(int f, int j) const {
        if (f < 0) return -outwardVelocity(west, etaFaceX(-1, j), x[j][0].eta, ew_edge);
        if (f >= nx - 1) return outwardVelocity(east, etaFaceX(nx - 1, j), x[j][nx - 1].eta, ew_edge);
        return x[j][f].u;
    }

    // y-velocity on face g, g = -1 .. ny-1
    double vFace(int i, int g) const {
        if (g < 0) return -outwardVelocity(south, etaFaceY(i, -1), x[0][i].eta, sn_edge);
        if (g >= ny - 1) return outwardVelocity(north, etaFaceY(i, ny - 1), x[ny - 1][i].eta, sn_edge);
        return x[g][i].v;
    }

    // Volume flux per unit width through x-face f and y-face g
    double fluxX(int f, int j) const { return depth(etaFaceX(f, j)) * uFace(f, j); }
    double fluxY(int i, int g) const { return depth(etaFaceY(i, g)) * vFace(i, g); }

    // v averaged onto interior x-face f
    double vAtU(int f, int j) const {
        return 0.25 * (vFace(f, j) + vFace(f, j - 1) + vFace(f + 1, j) + vFace(f + 1, j - 1));
    }

    // u averaged onto interior y-face g
    double uAtV(int i, int g) const {
        return 0.25 * (uFace(i, g) + uFace(i - 1, g) + uFace(i, g + 1) + uFace(i - 1, g + 1));
    }

    double frictionCoefficient(double H) const {
        switch (phys.friction) {
            case FrictionModel::QUADRATIC:
                return phys.drag_coefficient;
            case FrictionModel::MANNING:
                return phys.gravity * phys.manning_n * phys.manning_n / std::cbrt(H);
            case FrictionModel::NONE:
            default:
                return 0.0;
        }
    }

    // Residual of the x-momentum equation on interior face f, minus ∂u/∂t
    double uMomentum(int f, int j) const {
        const double u = x[j][f].u;
        const double vbar = vAtU(f, j);
        const double uW = uFace(f - 1, j);
        const double uE = uFace(f + 1, j);
        // Free slip on the y-walls
        const double uS = j > 0 ? x[j - 1][f].u : u;
        const double uN = j < ny - 1 ? x[j + 1][f].u : u;

        double r = phys.gravity * (x[j][f + 1].eta - x[j][f].eta) / dx;

        if (phys.use_nonlinear_equations) {
            r += u * (uE - uW) / (2.0 * dx) + vbar * (uN - uS) / (2.0 * dy);
        }

        r -= phys.coriolis_frequency * vbar;

        const double H = depth(etaFaceX(f, j));
        r += frictionCoefficient(H) * std::sqrt(u * u + vbar * vbar) * u / H;

        if (phys.horizontal_viscosity > 0.0) {
            r -= phys.horizontal_viscosity *
                 ((uE - 2.0 * u + uW) / (dx * dx) + (uN - 2.0 * u + uS) / (dy * dy));
        }
        return r;
    }

    // Residual of the y-momentum equation on interior face g, minus ∂v/∂t
    double vMomentum(int i, int g) const {
        const double v = x[g][i].v;
        const double ubar = uAtV(i, g);
        const double vS = vFace(i, g - 1);
        const double vN = vFace(i, g + 1);
        const double vW = i > 0 ? x[g][i - 1].v : v;
        const double vE = i < nx - 1 ? x[g][i + 1].v : v;

        double r = phys.gravity * (x[g + 1][i].eta - x[g][i].eta) / dy;

        if (phys.use_nonlinear_equations) {
            r += ubar * (vE - vW) / (2.0 * dx) + v * (vN - vS) / (2.0 * dy);
        }

        r += phys.coriolis_frequency * ubar;

        const double H = depth(etaFaceY(i, g));
        r += frictionCoefficient(H) * std::sqrt(v * v + ubar * ubar) * v / H;

        if (phys.horizontal_viscosity > 0.0) {
            r -= phys.horizontal_viscosity *
                 ((vE - 2.0 * v + vW) / (dx * dx) + (vN - 2.0 * v + vS) / (dy * dy));
        }
        return r;
    }

    // Divergence of the volume flux in cell (i, j)
    double continuity(int i, int j) const {
        return (fluxX(i, j) - fluxX(i - 1, j)) / dx + (fluxY(i, j) - fluxY(i, j - 1)) / dy;
    }

private:
    ChannelField** x;
    const int nx, ny;
    const double dx, dy;
    const double ew_edge, sn_edge;   // Length of the x-min/x-max and y-min/y-max sides
    const PhysicsConfig& phys;
    const BoundaryValues& west;
    const BoundaryValues& east;
    const BoundaryValues& south;
    const BoundaryValues& north;
};

} // namespace

// =============================================================================
// ShallowWaterSolver
// =============================================================================

ShallowWaterSolver::ShallowWaterSolver(MPI_Comm comm_in)
    : comm(comm_in), rank(0), mesh(nullptr), bcs(nullptr),
      ts(nullptr), solution(nullptr), jacobian(nullptr),
      current_time(0.0), step_number(0), last_callback_step(0) {
    MPI_Comm_rank(comm, &rank);
}

ShallowWaterSolver::~ShallowWaterSolver() {
    if (ts) TSDestroy(&ts);
    if (jacobian) MatDestroy(&jacobian);
    if (solution) VecDestroy(&solution);
}

PetscErrorCode ShallowWaterSolver::initialize(const ChannelMesh& mesh_in,
                                              const BoundarySpec& bcs_in,
                                              const PhysicsConfig& physics_in,
                                              const SimulationConfig& sim_in) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!mesh_in.getDM()) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONGSTATE, "Channel mesh has not been created");
    }
    if (!(sim_in.dt > 0.0) || !(sim_in.end_time > sim_in.start_time)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Time step and run length must be positive");
    }
    if (!(physics_in.depth > 0.0)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Bathymetry depth must be positive");
    }

    mesh = &mesh_in;
    bcs = &bcs_in;
    physics = physics_in;
    sim_config = sim_in;

    DM da = mesh->getDM();

    ierr = DMCreateGlobalVector(da, &solution); CHKERRQ(ierr);
    ierr = PetscObjectSetName((PetscObject)solution, "solution"); CHKERRQ(ierr);

    // Create time stepper
    ierr = TSCreate(comm, &ts); CHKERRQ(ierr);
    ierr = TSSetDM(ts, da); CHKERRQ(ierr);
    ierr = TSSetProblemType(ts, TS_NONLINEAR); CHKERRQ(ierr);
    ierr = TSSetType(ts, TSCN); CHKERRQ(ierr);

    TSAdapt adapt;
    ierr = TSGetAdapt(ts, &adapt); CHKERRQ(ierr);
    ierr = TSAdaptSetType(adapt, TSADAPTNONE); CHKERRQ(ierr);

    // Set time parameters
    ierr = TSSetTime(ts, sim_config.start_time); CHKERRQ(ierr);
    ierr = TSSetMaxTime(ts, sim_config.end_time); CHKERRQ(ierr);
    ierr = TSSetTimeStep(ts, sim_config.dt); CHKERRQ(ierr);
    ierr = TSSetMaxSteps(ts, sim_config.max_timesteps); CHKERRQ(ierr);
    ierr = TSSetExactFinalTime(ts, TS_EXACTFINALTIME_MATCHSTEP); CHKERRQ(ierr);

    // Residual, colored finite-difference Jacobian
    ierr = TSSetIFunction(ts, nullptr, FormIFunction, this); CHKERRQ(ierr);
    ierr = DMSetMatType(da, MATAIJ); CHKERRQ(ierr);
    ierr = DMCreateMatrix(da, &jacobian); CHKERRQ(ierr);
    ierr = TSSetIJacobian(ts, jacobian, jacobian, TSComputeIJacobianDefaultColor, nullptr); CHKERRQ(ierr);

    ierr = TSMonitorSet(ts, MonitorFunction, this, nullptr); CHKERRQ(ierr);

    // Solver tolerances
    SNES snes;
    KSP ksp;
    ierr = TSGetSNES(ts, &snes); CHKERRQ(ierr);
    ierr = SNESSetTolerances(snes, sim_config.atol, sim_config.rtol,
                             PETSC_DEFAULT, sim_config.max_nonlinear_iterations,
                             PETSC_DEFAULT); CHKERRQ(ierr);
    ierr = SNESGetKSP(snes, &ksp); CHKERRQ(ierr);
    ierr = KSPSetTolerances(ksp, sim_config.rtol, sim_config.atol,
                            PETSC_DEFAULT, sim_config.max_linear_iterations); CHKERRQ(ierr);

    ierr = TSSetFromOptions(ts); CHKERRQ(ierr);

    ierr = setInitialCondition(physics.initial_elevation); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::setInitialCondition(double eta0) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    ierr = setInitialCondition([eta0](double, double) { return eta0; }); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::setInitialCondition(
        const std::function<double(double, double)>& eta0) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!solution) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONGSTATE, "Solver not initialized");
    }

    DM da = mesh->getDM();
    PetscInt xs, ys, xm, ym;
    ierr = mesh->getOwnedRange(xs, ys, xm, ym); CHKERRQ(ierr);

    ChannelField** x;
    ierr = DMDAVecGetArray(da, solution, &x); CHKERRQ(ierr);
    for (PetscInt j = ys; j < ys + ym; ++j) {
        for (PetscInt i = xs; i < xs + xm; ++i) {
            double xc, yc;
            mesh->cellCenter(i, j, xc, yc);
            x[j][i].eta = eta0(xc, yc);
            x[j][i].u = 0.0;
            x[j][i].v = 0.0;
        }
    }
    ierr = DMDAVecRestoreArray(da, solution, &x); CHKERRQ(ierr);

    ierr = TSSetSolution(ts, solution); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

void ShallowWaterSolver::addStepCallback(StepCallback cb) {
    callbacks.push_back(std::move(cb));
}

PetscErrorCode ShallowWaterSolver::run() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    ierr = TSSolve(ts, solution); CHKERRQ(ierr);

    TSConvergedReason reason;
    ierr = TSGetConvergedReason(ts, &reason); CHKERRQ(ierr);
    if (reason < 0) {
        SETERRQ(comm, PETSC_ERR_NOT_CONVERGED, "Time integration failed: %s",
                TSConvergedReasons[reason]);
    }

    ierr = TSGetTime(ts, &current_time); CHKERRQ(ierr);
    ierr = TSGetStepNumber(ts, &step_number); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::step() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    ierr = TSStep(ts); CHKERRQ(ierr);

    PetscReal t;
    PetscInt n;
    ierr = TSGetTime(ts, &t); CHKERRQ(ierr);
    ierr = TSGetStepNumber(ts, &n); CHKERRQ(ierr);
    ierr = MonitorFunction(ts, n, t, solution, this); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

// =============================================================================
// PETSc callbacks
// =============================================================================

PetscErrorCode ShallowWaterSolver::FormIFunction(TS ts, PetscReal t, Vec U, Vec U_t,
                                                 Vec F, void* ctx) {
    (void)ts;
    (void)t;  // Boundary values are read live from the forcing state

    PetscFunctionBeginUser;
    ShallowWaterSolver* solver = static_cast<ShallowWaterSolver*>(ctx);
    const ChannelMesh& mesh = *solver->mesh;
    PetscErrorCode ierr;

    DM da = mesh.getDM();
    Vec U_local;
    ierr = DMGetLocalVector(da, &U_local); CHKERRQ(ierr);
    ierr = DMGlobalToLocalBegin(da, U, INSERT_VALUES, U_local); CHKERRQ(ierr);
    ierr = DMGlobalToLocalEnd(da, U, INSERT_VALUES, U_local); CHKERRQ(ierr);

    ChannelField** x;
    ChannelField** xdot;
    ChannelField** f;
    ierr = DMDAVecGetArrayRead(da, U_local, &x); CHKERRQ(ierr);
    ierr = DMDAVecGetArrayRead(da, U_t, &xdot); CHKERRQ(ierr);
    ierr = DMDAVecGetArray(da, F, &f); CHKERRQ(ierr);

    ChannelStencil stencil(x, mesh, *solver->bcs, solver->physics);

    PetscInt xs, ys, xm, ym;
    ierr = mesh.getOwnedRange(xs, ys, xm, ym); CHKERRQ(ierr);
    const int nx = mesh.nx();
    const int ny = mesh.ny();

    for (PetscInt j = ys; j < ys + ym; ++j) {
        for (PetscInt i = xs; i < xs + xm; ++i) {
            f[j][i].eta = xdot[j][i].eta + stencil.continuity(i, j);

            // Boundary-face slots are unused: keep them at their initial value
            if (i < nx - 1) {
                f[j][i].u = xdot[j][i].u + stencil.uMomentum(i, j);
            } else {
                f[j][i].u = xdot[j][i].u;
            }

            if (j < ny - 1) {
                f[j][i].v = xdot[j][i].v + stencil.vMomentum(i, j);
            } else {
                f[j][i].v = xdot[j][i].v;
            }
        }
    }

    ierr = DMDAVecRestoreArray(da, F, &f); CHKERRQ(ierr);
    ierr = DMDAVecRestoreArrayRead(da, U_t, &xdot); CHKERRQ(ierr);
    ierr = DMDAVecRestoreArrayRead(da, U_local, &x); CHKERRQ(ierr);
    ierr = DMRestoreLocalVector(da, &U_local); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::MonitorFunction(TS ts, PetscInt step, PetscReal t,
                                                   Vec U, void* ctx) {
    (void)ts;
    (void)U;  // Same vector as solver->solution

    PetscFunctionBeginUser;
    ShallowWaterSolver* solver = static_cast<ShallowWaterSolver*>(ctx);

    solver->current_time = static_cast<double>(t);
    solver->step_number = step;

    // TSSolve also reports the step it starts from; only completed steps count
    if (step <= solver->last_callback_step) {
        PetscFunctionReturn(0);
    }
    solver->last_callback_step = step;

    if (solver->sim_config.log_frequency > 0 &&
        step % solver->sim_config.log_frequency == 0) {
        PetscPrintf(solver->comm, "Step %d, Time = %g\n", (int)step, (double)t);
    }

    for (const auto& cb : solver->callbacks) {
        try {
            cb(static_cast<double>(t));
        } catch (const std::exception& e) {
            SETERRQ(solver->comm, PETSC_ERR_USER, "Step callback failed at t = %g: %s",
                    (double)t, e.what());
        }
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Solution access
// =============================================================================

PetscErrorCode ShallowWaterSolver::gatherField(int component, std::vector<double>& data) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    DM da = mesh->getDM();
    const int nx = mesh->nx();
    const int ny = mesh->ny();

    Vec U_local;
    ierr = DMGetLocalVector(da, &U_local); CHKERRQ(ierr);
    ierr = DMGlobalToLocalBegin(da, solution, INSERT_VALUES, U_local); CHKERRQ(ierr);
    ierr = DMGlobalToLocalEnd(da, solution, INSERT_VALUES, U_local); CHKERRQ(ierr);

    ChannelField** x;
    ierr = DMDAVecGetArrayRead(da, U_local, &x); CHKERRQ(ierr);
    ChannelStencil stencil(x, *mesh, *bcs, physics);

    PetscInt xs, ys, xm, ym;
    ierr = mesh->getOwnedRange(xs, ys, xm, ym); CHKERRQ(ierr);

    std::vector<double> local(static_cast<size_t>(nx) * ny, 0.0);
    for (PetscInt j = ys; j < ys + ym; ++j) {
        for (PetscInt i = xs; i < xs + xm; ++i) {
            double value = 0.0;
            switch (component) {
                case 0: value = x[j][i].eta; break;
                case 1: value = 0.5 * (stencil.uFace(i - 1, j) + stencil.uFace(i, j)); break;
                case 2: value = 0.5 * (stencil.vFace(i, j - 1) + stencil.vFace(i, j)); break;
                default: break;
            }
            local[static_cast<size_t>(j) * nx + i] = value;
        }
    }

    ierr = DMDAVecRestoreArrayRead(da, U_local, &x); CHKERRQ(ierr);
    ierr = DMRestoreLocalVector(da, &U_local); CHKERRQ(ierr);

    // Every cell is owned by exactly one rank
    data.assign(local.size(), 0.0);
    ierr = MPI_Allreduce(local.data(), data.data(), (int)local.size(),
                         MPI_DOUBLE, MPI_SUM, comm); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::getElevationField(std::vector<std::vector<double>>& eta) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    std::vector<double> flat;
    ierr = gatherField(0, flat); CHKERRQ(ierr);

    const int nx = mesh->nx();
    const int ny = mesh->ny();
    eta.assign(ny, std::vector<double>(nx, 0.0));
    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            eta[j][i] = flat[static_cast<size_t>(j) * nx + i];
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::getVelocityField(std::vector<std::vector<double>>& u,
                                                    std::vector<std::vector<double>>& v) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    std::vector<double> flat_u, flat_v;
    ierr = gatherField(1, flat_u); CHKERRQ(ierr);
    ierr = gatherField(2, flat_v); CHKERRQ(ierr);

    const int nx = mesh->nx();
    const int ny = mesh->ny();
    u.assign(ny, std::vector<double>(nx, 0.0));
    v.assign(ny, std::vector<double>(nx, 0.0));
    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            u[j][i] = flat_u[static_cast<size_t>(j) * nx + i];
            v[j][i] = flat_v[static_cast<size_t>(j) * nx + i];
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::getTotalVolume(double& volume) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    DM da = mesh->getDM();
    PetscInt xs, ys, xm, ym;
    ierr = mesh->getOwnedRange(xs, ys, xm, ym); CHKERRQ(ierr);

    const ChannelField** x;
    ierr = DMDAVecGetArrayRead(da, solution, &x); CHKERRQ(ierr);

    double local = 0.0;
    for (PetscInt j = ys; j < ys + ym; ++j) {
        for (PetscInt i = xs; i < xs + xm; ++i) {
            local += (physics.depth + x[j][i].eta) * mesh->cellArea();
        }
    }

    ierr = DMDAVecRestoreArrayRead(da, solution, &x); CHKERRQ(ierr);

    ierr = MPI_Allreduce(&local, &volume, 1, MPI_DOUBLE, MPI_SUM, comm); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::getBoundaryInflow(double& inflow) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    DM da = mesh->getDM();
    const int nx = mesh->nx();
    const int ny = mesh->ny();

    Vec U_local;
    ierr = DMGetLocalVector(da, &U_local); CHKERRQ(ierr);
    ierr = DMGlobalToLocalBegin(da, solution, INSERT_VALUES, U_local); CHKERRQ(ierr);
    ierr = DMGlobalToLocalEnd(da, solution, INSERT_VALUES, U_local); CHKERRQ(ierr);

    ChannelField** x;
    ierr = DMDAVecGetArrayRead(da, U_local, &x); CHKERRQ(ierr);
    ChannelStencil stencil(x, *mesh, *bcs, physics);

    PetscInt xs, ys, xm, ym;
    ierr = mesh->getOwnedRange(xs, ys, xm, ym); CHKERRQ(ierr);

    double local = 0.0;
    for (PetscInt j = ys; j < ys + ym; ++j) {
        if (xs == 0) local += stencil.fluxX(-1, j) * mesh->dy();
        if (xs + xm == nx) local -= stencil.fluxX(nx - 1, j) * mesh->dy();
    }
    for (PetscInt i = xs; i < xs + xm; ++i) {
        if (ys == 0) local += stencil.fluxY(i, -1) * mesh->dx();
        if (ys + ym == ny) local -= stencil.fluxY(i, ny - 1) * mesh->dx();
    }

    ierr = DMDAVecRestoreArrayRead(da, U_local, &x); CHKERRQ(ierr);
    ierr = DMRestoreLocalVector(da, &U_local); CHKERRQ(ierr);

    ierr = MPI_Allreduce(&local, &inflow, 1, MPI_DOUBLE, MPI_SUM, comm); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::getEta(double xp, double yp, double& eta) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    int i, j;
    if (!mesh->locate(xp, yp, i, j)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Point (%g, %g) lies outside the channel", xp, yp);
    }

    std::vector<double> flat;
    ierr = gatherField(0, flat); CHKERRQ(ierr);
    eta = flat[static_cast<size_t>(j) * mesh->nx() + i];

    PetscFunctionReturn(0);
}

PetscErrorCode ShallowWaterSolver::writeVTK(const std::string& filename) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    PetscViewer viewer;
    ierr = PetscViewerVTKOpen(comm, filename.c_str(), FILE_MODE_WRITE, &viewer); CHKERRQ(ierr);
    ierr = VecView(solution, viewer); CHKERRQ(ierr);
    ierr = PetscViewerDestroy(&viewer); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

} // namespace SWCS
