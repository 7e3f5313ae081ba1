/**
 * @file ChannelMesh.hpp
 * @brief Rectangular channel grid on a PETSc DMDA
 *
 * The channel [x0, x0+Lx] x [y0, y0+Ly] is divided into nx x ny cells.
 * Unknowns are stored on an Arakawa C-grid folded onto a collocated DMDA
 * with three degrees of freedom per cell (i, j):
 *
 *   eta  elevation at the cell centre         (x_i,     y_j)
 *   u    x-velocity on the east face          (x_i+1/2, y_j)
 *   v    y-velocity on the north face         (x_i,     y_j+1/2)
 *
 * Velocities on the four boundary faces are reconstructed from the
 * boundary conditions. The u slot of the last column and the v slot of
 * the last row are therefore unused and stay at zero.
 */

#ifndef CHANNEL_MESH_HPP
#define CHANNEL_MESH_HPP

#include "SWCS.hpp"

namespace SWCS {

/**
 * @brief Per-cell unknowns as laid out in DMDA vectors
 */
struct ChannelField {
    PetscScalar eta;
    PetscScalar u;
    PetscScalar v;
};

class ChannelMesh {
public:
    explicit ChannelMesh(MPI_Comm comm);
    ~ChannelMesh();

    ChannelMesh(const ChannelMesh&) = delete;
    ChannelMesh& operator=(const ChannelMesh&) = delete;

    /**
     * @brief Create the DMDA
     *
     * -da_grid_x / -da_grid_y on the command line override nx / ny.
     */
    PetscErrorCode create(const GridConfig& config);

    DM getDM() const { return da; }
    MPI_Comm getComm() const { return comm; }

    int nx() const { return nx_; }
    int ny() const { return ny_; }
    double dx() const { return dx_; }
    double dy() const { return dy_; }
    double Lx() const { return Lx_; }
    double Ly() const { return Ly_; }
    double originX() const { return x0_; }
    double originY() const { return y0_; }
    double cellArea() const { return dx_ * dy_; }

    /**
     * @brief Length of a rectangle side (the side a flux is spread over)
     */
    double edgeLength(int boundary_id) const;

    void cellCenter(int i, int j, double& x, double& y) const;

    /**
     * @brief Cell containing (x, y)
     * @return false if the point lies outside the channel
     */
    bool locate(double x, double y, int& i, int& j) const;

    // Owned index range of this rank
    PetscErrorCode getOwnedRange(PetscInt& xs, PetscInt& ys,
                                 PetscInt& xm, PetscInt& ym) const;

private:
    MPI_Comm comm;
    DM da;

    int nx_, ny_;
    double Lx_, Ly_;
    double dx_, dy_;
    double x0_, y0_;

    PetscErrorCode setCellCoordinates();
};

} // namespace SWCS

#endif // CHANNEL_MESH_HPP
