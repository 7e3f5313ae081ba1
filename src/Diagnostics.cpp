#include "Diagnostics.hpp"
#include <fstream>
#include <iomanip>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace SWCS {

// =============================================================================
// TideGauge Implementation
// =============================================================================

void TideGauge::record(double t, double elevation) {
    time.push_back(t);
    eta.push_back(elevation);
}

void TideGauge::writeASCII(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot write gauge record: " + filename);
    }

    file << "# Tide gauge: " << name << "\n";
    file << "# Location: x = " << x << " m, y = " << y << " m\n";
    file << "# Time (s), Eta (m)\n";

    file << std::fixed << std::setprecision(6);
    for (size_t i = 0; i < time.size(); ++i) {
        file << time[i] << ", " << eta[i] << "\n";
    }
}

double TideGauge::getMaxAmplitude() const {
    if (eta.empty()) return 0.0;
    return *std::max_element(eta.begin(), eta.end());
}

double TideGauge::getMinElevation() const {
    if (eta.empty()) return 0.0;
    return *std::min_element(eta.begin(), eta.end());
}

double TideGauge::getRange() const {
    return getMaxAmplitude() - getMinElevation();
}

// =============================================================================
// VolumeMonitor Implementation
// =============================================================================

VolumeMonitor::VolumeMonitor()
    : initialized_(false), volume0_(0.0), integrated_inflow_(0.0),
      max_rel_error_(0.0) {}

void VolumeMonitor::initialize(double t0, double volume0, double inflow0) {
    initialized_ = true;
    volume0_ = volume0;
    integrated_inflow_ = 0.0;
    max_rel_error_ = 0.0;

    time_.assign(1, t0);
    volume_.assign(1, volume0);
    inflow_.assign(1, inflow0);
}

void VolumeMonitor::record(double t, double volume, double inflow) {
    if (!initialized_) {
        throw std::logic_error("VolumeMonitor::record called before initialize");
    }

    integrated_inflow_ += 0.5 * (inflow_.back() + inflow) * (t - time_.back());

    time_.push_back(t);
    volume_.push_back(volume);
    inflow_.push_back(inflow);

    max_rel_error_ = std::max(max_rel_error_, relativeError());
}

double VolumeMonitor::relativeError() const {
    if (volume0_ == 0.0) return 0.0;
    return std::abs(currentVolume() - expectedVolume()) / volume0_;
}

void VolumeMonitor::writeASCII(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot write volume record: " + filename);
    }

    file << "# Time (s), Volume (m3), Boundary inflow (m3/s)\n";
    file << std::setprecision(12);
    for (size_t i = 0; i < time_.size(); ++i) {
        file << time_[i] << ", " << volume_[i] << ", " << inflow_[i] << "\n";
    }
}

} // namespace SWCS
