/**
 * @file PeriodicForcing.hpp
 * @brief Time-periodic boundary forcing driven by the solver's step callback
 *
 * A forcing is a single scalar that appears in the boundary terms of the
 * shallow water equations (e.g. the tidal volume flux through the channel
 * inlet). Its value follows
 *
 *     value(t) = baseline + amplitude * sin(2π t / period)
 *
 * The scalar lives in a ForcingState owned by the caller. Boundary values
 * hold a const reference to it; the PeriodicForcingUpdater holds the only
 * mutable reference and rewrites the value once per completed time step.
 *
 * @author SWCS Development Team
 */

#ifndef PERIODIC_FORCING_HPP
#define PERIODIC_FORCING_HPP

#include "SWCS.hpp"
#include <vector>
#include <string>
#include <functional>

namespace SWCS {

/**
 * @brief Mutable scalar forcing with its periodic parameters
 */
struct ForcingState {
    std::string name;
    double baseline;        // Mean value
    double amplitude;       // Sine amplitude (sign gives the initial direction)
    double period;          // s
    double value;           // Current value seen by the solver

    ForcingState() :
        name(""), baseline(0.0), amplitude(0.0), period(43200.0), value(0.0) {}

    /**
     * @brief Construct and initialise value at t = 0
     * @throws std::invalid_argument if period is not positive
     */
    ForcingState(const std::string& name, double baseline,
                 double amplitude, double period);

    // Closed-form value at time t; does not touch `value`
    double valueAt(double t) const;
};

/**
 * @brief Recomputes a ForcingState each step and fires observations
 *
 * Registered with the solver as a `void(double)` step callback. Each call
 * to onStep():
 *   1. writes evaluate(t_new) into the forcing state;
 *   2. checks t_new against the trigger instants and runs the observation
 *      action for any trigger that matches.
 *
 * With TriggerMatchPolicy::EXACT a trigger fires only when t_new compares
 * equal to it. A time step that does not divide the trigger instant will
 * silently skip it; checkAlignment() reports such instants up front.
 * TOLERANCE (closed window, dt/2 by default) and STEP_INDEX are available
 * for step sizes that do not land on the triggers. A trigger fires at most
 * once per run.
 */
class PeriodicForcingUpdater {
public:
    using ObservationAction = std::function<void(double)>;

    explicit PeriodicForcingUpdater(ForcingState& state);

    /**
     * @brief baseline + amplitude * sin(2π t / period). Pure.
     */
    double evaluate(double t) const;

    /**
     * @brief Step hook; t_new is the simulation time just reached
     */
    void onStep(double t_new);

    // Stored sorted; repeated instants collapse into one trigger
    void setTriggerTimes(const std::vector<double>& times);
    void setObservationAction(ObservationAction action);

    /**
     * @brief Select the trigger policy
     * @param tolerance Window for TOLERANCE; negative means dt/2
     */
    void setMatchPolicy(TriggerMatchPolicy policy, double tolerance = -1.0);

    /**
     * @brief Time step and start time used by TOLERANCE and STEP_INDEX
     */
    void setTimeStep(double dt, double start_time = 0.0);

    /**
     * @brief Trigger instants that no step can fire under the current policy
     *
     * EXACT: instants that a clock advancing by dt from the start time never
     * lands on. TOLERANCE: instants with no step time inside the window.
     * STEP_INDEX: instants that round to step zero or earlier.
     */
    std::vector<double> checkAlignment(double dt, double start_time = 0.0) const;

    // Restore all triggers to unfired, the step counter to zero and the
    // forcing value to its start-time value
    void reset();

    const ForcingState& state() const { return state_; }
    const std::vector<double>& triggerTimes() const { return triggers_; }
    const std::vector<double>& firedTriggers() const { return fired_times_; }
    TriggerMatchPolicy matchPolicy() const { return policy_; }
    long stepCount() const { return step_count_; }

private:
    ForcingState& state_;

    std::vector<double> triggers_;
    std::vector<bool> fired_;
    std::vector<long> trigger_steps_;
    std::vector<double> fired_times_;

    ObservationAction observe_;

    TriggerMatchPolicy policy_;
    double tolerance_;
    double dt_;
    double start_time_;
    long step_count_;

    bool matches(size_t k, double t_new) const;
    double toleranceFor(double dt) const;
    void computeTriggerSteps();
};

} // namespace SWCS

#endif // PERIODIC_FORCING_HPP
