/**
 * @file PeriodicForcing.cpp
 * @brief Implementation of periodic boundary forcing
 */

#include "PeriodicForcing.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace SWCS {

// =============================================================================
// ForcingState Implementation
// =============================================================================

ForcingState::ForcingState(const std::string& name_, double baseline_,
                           double amplitude_, double period_)
    : name(name_), baseline(baseline_), amplitude(amplitude_),
      period(period_), value(0.0) {
    if (!(period > 0.0)) {
        throw std::invalid_argument("Forcing '" + name + "': period must be positive");
    }
    value = valueAt(0.0);
}

double ForcingState::valueAt(double t) const {
    return baseline + amplitude * std::sin(TWO_PI * t / period);
}

// =============================================================================
// PeriodicForcingUpdater Implementation
// =============================================================================

PeriodicForcingUpdater::PeriodicForcingUpdater(ForcingState& state)
    : state_(state),
      policy_(TriggerMatchPolicy::EXACT),
      tolerance_(-1.0),
      dt_(0.0),
      start_time_(0.0),
      step_count_(0) {
    if (!(state_.period > 0.0)) {
        throw std::invalid_argument("Forcing '" + state_.name + "': period must be positive");
    }
}

double PeriodicForcingUpdater::evaluate(double t) const {
    return state_.valueAt(t);
}

void PeriodicForcingUpdater::onStep(double t_new) {
    ++step_count_;

    state_.value = evaluate(t_new);

    for (size_t k = 0; k < triggers_.size(); ++k) {
        if (fired_[k] || !matches(k, t_new)) continue;

        fired_[k] = true;
        fired_times_.push_back(triggers_[k]);
        if (observe_) {
            observe_(t_new);
        }
    }
}

bool PeriodicForcingUpdater::matches(size_t k, double t_new) const {
    switch (policy_) {
        case TriggerMatchPolicy::TOLERANCE: {
            // Closed window: a trigger halfway between steps fires on the earlier one
            return std::abs(t_new - triggers_[k]) <= toleranceFor(dt_);
        }
        case TriggerMatchPolicy::STEP_INDEX:
            return trigger_steps_[k] == step_count_;
        case TriggerMatchPolicy::EXACT:
        default:
            return t_new == triggers_[k];
    }
}

void PeriodicForcingUpdater::setTriggerTimes(const std::vector<double>& times) {
    triggers_ = times;
    std::sort(triggers_.begin(), triggers_.end());
    triggers_.erase(std::unique(triggers_.begin(), triggers_.end()), triggers_.end());
    fired_.assign(triggers_.size(), false);
    fired_times_.clear();
    computeTriggerSteps();
}

void PeriodicForcingUpdater::setObservationAction(ObservationAction action) {
    observe_ = std::move(action);
}

void PeriodicForcingUpdater::setMatchPolicy(TriggerMatchPolicy policy, double tolerance) {
    policy_ = policy;
    tolerance_ = tolerance;
}

void PeriodicForcingUpdater::setTimeStep(double dt, double start_time) {
    if (!(dt > 0.0)) {
        throw std::invalid_argument("Time step must be positive");
    }
    dt_ = dt;
    start_time_ = start_time;
    computeTriggerSteps();
}

void PeriodicForcingUpdater::computeTriggerSteps() {
    trigger_steps_.assign(triggers_.size(), -1);
    if (dt_ <= 0.0) return;

    for (size_t k = 0; k < triggers_.size(); ++k) {
        trigger_steps_[k] = std::lround((triggers_[k] - start_time_) / dt_);
    }
}

double PeriodicForcingUpdater::toleranceFor(double dt) const {
    return tolerance_ >= 0.0 ? tolerance_ : 0.5 * dt;
}

std::vector<double> PeriodicForcingUpdater::checkAlignment(double dt, double start_time) const {
    std::vector<double> misaligned;
    if (!(dt > 0.0)) return triggers_;

    // Replays the clock the way the solver accumulates it
    auto clock = [&](long n) {
        double t = start_time;
        for (long i = 0; i < n; ++i) t += dt;
        return t;
    };

    for (double trigger : triggers_) {
        bool reachable = false;
        switch (policy_) {
            case TriggerMatchPolicy::TOLERANCE: {
                long n = static_cast<long>(std::floor((trigger - start_time) / dt));
                for (long m : {n, n + 1}) {
                    if (m >= 1 && std::abs(clock(m) - trigger) <= toleranceFor(dt)) {
                        reachable = true;
                    }
                }
                break;
            }
            case TriggerMatchPolicy::STEP_INDEX:
                reachable = std::lround((trigger - start_time) / dt) >= 1;
                break;
            case TriggerMatchPolicy::EXACT:
            default: {
                long n = std::lround((trigger - start_time) / dt);
                reachable = n >= 1 && clock(n) == trigger;
                break;
            }
        }
        if (!reachable) {
            misaligned.push_back(trigger);
        }
    }
    return misaligned;
}

void PeriodicForcingUpdater::reset() {
    std::fill(fired_.begin(), fired_.end(), false);
    fired_times_.clear();
    step_count_ = 0;
    state_.value = evaluate(start_time_);
}

} // namespace SWCS
