#pragma once

/// @file include/prism/decision.hpp
/// @brief Decision Engine - six fixed pricing rules over a SignalSet.
///
/// # Module: Decision Engine
///
/// ## Responsibility
/// Evaluate every rule against one SignalSet, turn each rule that fires
/// into a Recommendation with its own confidence, and record an audit entry
/// per rule whether it fired or passed.
///
/// ## Rules
/// | Id                  | Trigger                              | Action   |
/// |---------------------|--------------------------------------|----------|
/// | CompetitorUndercut  | position > 1.10                      | decrease |
/// | DemandSurgeCapture  | growth > 0.15 and momentum > 10      | increase |
/// | LowDemandGuard      | growth < −0.15                       | discount |
/// | SeasonalDiscount    | seasonal < 0.9 and growth < 0        | discount |
/// | TrendSurgePrep      | momentum > 15 and growth < 0.05      | stock    |
/// | MarginFloor         | position < 0.85                      | increase |
///
/// Thresholds come from `RuleThresholds`. Rules are evaluated independently
/// (no short-circuit). When none fires a single "hold" recommendation is
/// emitted.
///
/// ## Guarantees
/// - The audit log always holds exactly one entry per rule, in rule order
/// - Recommendations are ordered by urgency (critical first), then by
///   confidence; ties keep rule order
/// - Stateless; `evaluate` is const and safe to call concurrently

#include "prism/config.hpp"
#include "prism/signals.hpp"
#include "prism/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace prism::decision {

// ─── Rule Table ───────────────────────────────────────────────────────────────

enum class RuleId {
    CompetitorUndercut = 1,
    DemandSurgeCapture,
    LowDemandGuard,
    SeasonalDiscount,
    TrendSurgePrep,
    MarginFloor,
};

/// Every rule, in evaluation order.
inline constexpr std::array<RuleId, 6> kAllRules{
    RuleId::CompetitorUndercut, RuleId::DemandSurgeCapture, RuleId::LowDemandGuard,
    RuleId::SeasonalDiscount,   RuleId::TrendSurgePrep,     RuleId::MarginFloor,
};

enum class Priority { Medium, High, Critical };

/// Static description of a rule.
struct RuleInfo {
    RuleId      id;
    const char* name;
    const char* trigger;
    const char* action;
    Priority    priority;
};

[[nodiscard]] const RuleInfo& rule_info(RuleId id) noexcept;

// ─── Recommendations ──────────────────────────────────────────────────────────

enum class ActionType { Increase, Decrease, Discount, Stock, Hold };

enum class Urgency { Low, Medium, High, Critical };

[[nodiscard]] const char* to_string(ActionType t) noexcept;
[[nodiscard]] const char* to_string(Urgency u) noexcept;
[[nodiscard]] const char* to_string(Priority p) noexcept;

struct Recommendation {
    ActionType            type = ActionType::Hold;
    std::string           title;
    std::string           rationale;
    std::string           impact;
    int                   confidence = 0;  ///< 0–100
    Urgency               urgency    = Urgency::Low;
    std::optional<RuleId> rule;            ///< nullopt for the default hold
    std::string           input;           ///< Signal values behind the verdict

    /// Rule name, or "Default Assessment" for the hold.
    [[nodiscard]] const char* source() const noexcept;
};

/// Audit record for one rule.
struct LogEntry {
    RuleId             rule;
    std::string        input;       ///< e.g. "growth=0.21, momentum=12"
    bool               fired = false;
    std::string        verdict;     ///< "ACTION: <title>" or "PASS: within threshold"
    std::optional<int> confidence;  ///< Set when the rule fired
};

struct Decision {
    std::string                 product_id;
    Timestamp                   evaluated_at{};
    std::vector<Recommendation> recommendations;
    std::vector<LogEntry>       log;

    /// Recommendations other than "hold".
    [[nodiscard]] std::size_t actions_triggered() const noexcept;

    [[nodiscard]] std::string to_string() const;
};

// ─── DecisionEngine ───────────────────────────────────────────────────────────

class DecisionEngine {
public:
    explicit DecisionEngine(AnalyticsConfig config = AnalyticsConfig{});

    /// Run every rule against `signals`.
    ///
    /// A decision is always complete; it is reported as Degraded when any
    /// signal block was computed on thin or missing data.
    [[nodiscard]] Outcome<Decision> evaluate(const signals::SignalSet& signals) const;

    /// Evaluate one rule; `nullopt` when it does not fire.
    [[nodiscard]] std::optional<Recommendation>
    evaluate_rule(RuleId id, const signals::SignalSet& signals) const;

    /// Formatted inputs a rule reads, as shown in the audit log.
    [[nodiscard]] static std::string rule_input(RuleId id, const signals::SignalSet& signals);

    /// The recommendation emitted when no rule fires.
    [[nodiscard]] static Recommendation hold();

    /// Stable sort: urgency descending, then confidence descending.
    static void rank(std::vector<Recommendation>& recommendations);

private:
    AnalyticsConfig config_;
};

}  // namespace prism::decision
