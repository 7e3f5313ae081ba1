#include "BoundaryConditions.hpp"
#include <sstream>
#include <stdexcept>

namespace SWCS {

// =============================================================================
// BoundaryValue
// =============================================================================

BoundaryValue::BoundaryValue()
    : set_(false), constant_(0.0), forcing_(nullptr) {}

BoundaryValue BoundaryValue::constant(double value) {
    BoundaryValue bv;
    bv.set_ = true;
    bv.constant_ = value;
    return bv;
}

BoundaryValue BoundaryValue::forced(const ForcingState& forcing) {
    BoundaryValue bv;
    bv.set_ = true;
    bv.forcing_ = &forcing;
    return bv;
}

double BoundaryValue::current() const {
    if (forcing_) return forcing_->value;
    return constant_;
}

// =============================================================================
// BoundaryValues
// =============================================================================

const BoundaryValue& BoundaryValues::get(BoundaryRole role) const {
    switch (role) {
        case BoundaryRole::ELEVATION:       return elevation;
        case BoundaryRole::FLUX:            return flux;
        case BoundaryRole::NORMAL_VELOCITY:
        default:                            return normal_velocity;
    }
}

void BoundaryValues::set(BoundaryRole role, const BoundaryValue& value) {
    switch (role) {
        case BoundaryRole::ELEVATION:       elevation = value; break;
        case BoundaryRole::FLUX:            flux = value; break;
        case BoundaryRole::NORMAL_VELOCITY: normal_velocity = value; break;
    }
}

// =============================================================================
// BoundarySpec
// =============================================================================

void BoundarySpec::setBoundary(int id, const BoundaryValues& values) {
    if (id < BOUNDARY_WEST || id > BOUNDARY_NORTH) {
        throw std::invalid_argument("Unknown boundary id " + std::to_string(id) +
                                    " (rectangle sides are 1-4)");
    }
    if (values.flux.isSet() && values.normal_velocity.isSet()) {
        throw std::invalid_argument("Boundary " + std::to_string(id) +
                                    ": flux and normal_velocity are mutually exclusive");
    }
    sides_[id] = values;
}

bool BoundarySpec::hasBoundary(int id) const {
    return sides_.find(id) != sides_.end();
}

const BoundaryValues& BoundarySpec::getBoundary(int id) const {
    auto it = sides_.find(id);
    if (it == sides_.end()) return wall_;
    return it->second;
}

std::vector<int> BoundarySpec::getBoundaryIds() const {
    std::vector<int> ids;
    for (const auto& pair : sides_) ids.push_back(pair.first);
    return ids;
}

std::vector<std::string> BoundarySpec::validate() const {
    std::vector<std::string> errors;

    for (const auto& pair : sides_) {
        const BoundaryValues& bv = pair.second;
        if (bv.isWall()) {
            errors.push_back("Boundary " + std::to_string(pair.first) +
                             " is registered but imposes no value");
        }
        if (bv.flux.isSet() && bv.normal_velocity.isSet()) {
            errors.push_back("Boundary " + std::to_string(pair.first) +
                             ": flux and normal_velocity are mutually exclusive");
        }
    }

    return errors;
}

std::string BoundarySpec::describe() const {
    std::ostringstream ss;
    for (int id = BOUNDARY_WEST; id <= BOUNDARY_NORTH; ++id) {
        const BoundaryValues& bv = getBoundary(id);
        ss << "  [" << id << "] " << sideName(id) << ": ";
        if (bv.isWall()) {
            ss << "wall";
        } else {
            bool first = true;
            for (BoundaryRole role : {BoundaryRole::ELEVATION, BoundaryRole::FLUX,
                                      BoundaryRole::NORMAL_VELOCITY}) {
                const BoundaryValue& v = bv.get(role);
                if (!v.isSet()) continue;
                if (!first) ss << ", ";
                ss << roleName(role) << " = ";
                if (v.isForced()) ss << "<" << v.forcing()->name << ">";
                else ss << v.current();
                first = false;
            }
        }
        ss << "\n";
    }
    return ss.str();
}

std::string BoundarySpec::roleName(BoundaryRole role) {
    switch (role) {
        case BoundaryRole::ELEVATION:       return "elevation";
        case BoundaryRole::FLUX:            return "flux";
        case BoundaryRole::NORMAL_VELOCITY: return "normal_velocity";
    }
    return "unknown";
}

std::string BoundarySpec::roleUnit(BoundaryRole role) {
    switch (role) {
        case BoundaryRole::ELEVATION:       return "m";
        case BoundaryRole::FLUX:            return "m3/s";
        case BoundaryRole::NORMAL_VELOCITY: return "m/s";
    }
    return "";
}

std::string BoundarySpec::sideName(int id) {
    switch (id) {
        case BOUNDARY_WEST:  return "x-min";
        case BOUNDARY_EAST:  return "x-max";
        case BOUNDARY_SOUTH: return "y-min";
        case BOUNDARY_NORTH: return "y-max";
        default:             return "invalid";
    }
}

} // namespace SWCS
