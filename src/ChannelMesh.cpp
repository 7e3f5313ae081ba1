#include "ChannelMesh.hpp"
#include <cmath>
#include <algorithm>

namespace SWCS {

ChannelMesh::ChannelMesh(MPI_Comm comm_in)
    : comm(comm_in), da(nullptr),
      nx_(0), ny_(0), Lx_(0.0), Ly_(0.0), dx_(0.0), dy_(0.0),
      x0_(0.0), y0_(0.0) {}

ChannelMesh::~ChannelMesh() {
    if (da) DMDestroy(&da);
}

PetscErrorCode ChannelMesh::create(const GridConfig& config) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (config.nx < 1 || config.ny < 1) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Channel needs at least one cell in each direction");
    }
    if (!(config.Lx > 0.0) || !(config.Ly > 0.0)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Channel length and width must be positive");
    }

    if (da) {
        ierr = DMDestroy(&da); CHKERRQ(ierr);
    }

    // Box stencil: the C-grid needs the diagonal neighbour for averaged
    // cross velocities.
    ierr = DMDACreate2d(comm, DM_BOUNDARY_GHOSTED, DM_BOUNDARY_GHOSTED,
                        DMDA_STENCIL_BOX, config.nx, config.ny,
                        PETSC_DECIDE, PETSC_DECIDE, 3, 1,
                        nullptr, nullptr, &da); CHKERRQ(ierr);
    ierr = DMSetFromOptions(da); CHKERRQ(ierr);
    ierr = DMSetUp(da); CHKERRQ(ierr);

    ierr = DMDASetFieldName(da, 0, "elevation"); CHKERRQ(ierr);
    ierr = DMDASetFieldName(da, 1, "u"); CHKERRQ(ierr);
    ierr = DMDASetFieldName(da, 2, "v"); CHKERRQ(ierr);

    PetscInt M, N;
    ierr = DMDAGetInfo(da, nullptr, &M, &N, nullptr, nullptr, nullptr, nullptr,
                       nullptr, nullptr, nullptr, nullptr, nullptr, nullptr); CHKERRQ(ierr);

    nx_ = static_cast<int>(M);
    ny_ = static_cast<int>(N);
    Lx_ = config.Lx;
    Ly_ = config.Ly;
    x0_ = config.origin_x;
    y0_ = config.origin_y;
    dx_ = Lx_ / nx_;
    dy_ = Ly_ / ny_;

    ierr = setCellCoordinates(); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

// Cell-centre coordinates for the VTK export. Written point by point:
// DMDASetUniformCoordinates divides by (N - 1) and fails for a single row.
PetscErrorCode ChannelMesh::setCellCoordinates() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    DM cda;
    Vec coords;
    DMDACoor2d** c;
    PetscInt xs, ys, xm, ym;

    ierr = DMGetCoordinateDM(da, &cda); CHKERRQ(ierr);
    ierr = DMCreateGlobalVector(cda, &coords); CHKERRQ(ierr);
    ierr = DMDAGetCorners(cda, &xs, &ys, nullptr, &xm, &ym, nullptr); CHKERRQ(ierr);
    ierr = DMDAVecGetArray(cda, coords, &c); CHKERRQ(ierr);
    for (PetscInt j = ys; j < ys + ym; ++j) {
        for (PetscInt i = xs; i < xs + xm; ++i) {
            double x, y;
            cellCenter(static_cast<int>(i), static_cast<int>(j), x, y);
            c[j][i].x = x;
            c[j][i].y = y;
        }
    }
    ierr = DMDAVecRestoreArray(cda, coords, &c); CHKERRQ(ierr);
    ierr = DMSetCoordinates(da, coords); CHKERRQ(ierr);
    ierr = VecDestroy(&coords); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

double ChannelMesh::edgeLength(int boundary_id) const {
    switch (boundary_id) {
        case BOUNDARY_WEST:
        case BOUNDARY_EAST:
            return Ly_;
        case BOUNDARY_SOUTH:
        case BOUNDARY_NORTH:
            return Lx_;
        default:
            return 0.0;
    }
}

void ChannelMesh::cellCenter(int i, int j, double& x, double& y) const {
    x = x0_ + (i + 0.5) * dx_;
    y = y0_ + (j + 0.5) * dy_;
}

bool ChannelMesh::locate(double x, double y, int& i, int& j) const {
    if (x < x0_ || x > x0_ + Lx_ || y < y0_ || y > y0_ + Ly_) {
        return false;
    }
    i = std::min(nx_ - 1, static_cast<int>(std::floor((x - x0_) / dx_)));
    j = std::min(ny_ - 1, static_cast<int>(std::floor((y - y0_) / dy_)));
    return true;
}

PetscErrorCode ChannelMesh::getOwnedRange(PetscInt& xs, PetscInt& ys,
                                          PetscInt& xm, PetscInt& ym) const {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    ierr = DMDAGetCorners(da, &xs, &ys, nullptr, &xm, &ym, nullptr); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

} // namespace SWCS
