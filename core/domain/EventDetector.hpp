#pragma once

#include "../InsightConfig.hpp"
#include "../PositionSample.hpp"
#include "../VehicleEvent.hpp"
#include "../ports/IPolicyEngine.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetsense::domain {

// Everything the detector remembers about one vehicle between samples.
struct DetectorState {
    std::optional<PositionSample> previous;
    std::optional<PositionSample> ignitionRunStart;   ///< First sample of the current ignition-on run
    std::optional<Timestamp> lowSpeedRunStart;        ///< Start of the current ignition-on, low-speed run
};

/**
 * @brief Rule set comparing a sample with the previous one of the same vehicle
 *
 * Rules are evaluated independently. A rule that needs the previous sample is
 * skipped while none exists, and a rule that throws is logged without
 * affecting the others. Cooldown suppression is the event store's job.
 */
class EventDetector {
public:
    EventDetector(DetectorConfig config, std::shared_ptr<ports::IPolicyEngine> policyEngine);

    // Runs all rules against (state.previous, sample) and then advances state.
    std::vector<VehicleEvent> evaluate(DetectorState& state, const PositionSample& sample) const;

    std::vector<std::string> ruleNames() const;

private:
    struct RuleContext {
        const PositionSample* previous;
        const PositionSample& current;
        const DetectorState& state;
    };

    using RuleFn = void (EventDetector::*)(const RuleContext&, std::vector<VehicleEvent>&) const;

    struct NamedRule {
        const char* name;
        RuleFn fn;
    };

    void batteryRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;
    void overspeedRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;
    void accelerationRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;
    void brakingRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;
    void ignitionRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;
    void movingAgainRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;
    void idleRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;
    void connectivityRule(const RuleContext& ctx, std::vector<VehicleEvent>& out) const;

    static const PositionSample& requirePrevious(const RuleContext& ctx);
    void advance(DetectorState& state, const PositionSample& sample) const;

    VehicleEvent makeEvent(EventType type, Severity severity, const PositionSample& sample,
                           std::string title, std::string description) const;

    DetectorConfig config_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::vector<NamedRule> rules_;
};

} // namespace fleetsense::domain
