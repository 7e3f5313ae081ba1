/**
 * @file Diagnostics.hpp
 * @brief Point time series and volume bookkeeping for channel runs
 */

#ifndef DIAGNOSTICS_HPP
#define DIAGNOSTICS_HPP

#include "SWCS.hpp"
#include <string>
#include <vector>

namespace SWCS {

/**
 * @brief Tide gauge recording the surface elevation at a fixed point
 */
struct TideGauge {
    std::string name;

    double x;
    double y;

    // Recorded time series
    std::vector<double> time;
    std::vector<double> eta;    // Surface elevation (m)

    TideGauge() : name(""), x(0), y(0) {}
    TideGauge(const std::string& name_, double x_, double y_)
        : name(name_), x(x_), y(y_) {}

    void record(double t, double elevation);

    // Output
    void writeASCII(const std::string& filename) const;

    double getMaxAmplitude() const;
    double getMinElevation() const;
    // Highest minus lowest recorded elevation
    double getRange() const;
};

/**
 * @brief Tracks water volume against the integrated boundary inflow
 *
 * The inflow is integrated with the trapezoidal rule, which matches the
 * Crank-Nicolson update of the continuity equation, so
 * V(t) - V(0) - ∫ Q dt stays at solver tolerance.
 */
class VolumeMonitor {
public:
    VolumeMonitor();

    void initialize(double t0, double volume0, double inflow0);

    /**
     * @throws std::logic_error if called before initialize()
     */
    void record(double t, double volume, double inflow);

    double initialVolume() const { return volume0_; }
    double currentVolume() const { return volume_.empty() ? volume0_ : volume_.back(); }
    double integratedInflow() const { return integrated_inflow_; }

    // V(0) + ∫ Q dt
    double expectedVolume() const { return volume0_ + integrated_inflow_; }

    // |V - expected| / V(0)
    double relativeError() const;
    double maxRelativeError() const { return max_rel_error_; }

    const std::vector<double>& times() const { return time_; }
    const std::vector<double>& volumes() const { return volume_; }
    const std::vector<double>& inflows() const { return inflow_; }

    void writeASCII(const std::string& filename) const;

private:
    bool initialized_;
    double volume0_;
    double integrated_inflow_;
    double max_rel_error_;

    std::vector<double> time_;
    std::vector<double> volume_;
    std::vector<double> inflow_;
};

} // namespace SWCS

#endif // DIAGNOSTICS_HPP
