/**
 * @file  prop_decision_log.cpp
 * @brief Property: for any signal set the audit log holds exactly one entry
 *        per rule in rule order, and recommendations are complete and ranked.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_decision_log
 *
 * Failure modes this test guards against:
 *   • A rule short-circuiting the evaluation of later rules
 *   • Hold emitted alongside triggered actions
 *   • Ranking that reorders critical items below lower urgencies
 */

#include <rapidcheck.h>

#include <cstddef>

#include "prism/decision.hpp"

using namespace prism;
using namespace prism::decision;

int main() {
    bool ok = true;

    ok &= rc::check(
        "decision_log: six entries, ranked recommendations, hold iff nothing fired",
        []() {
            signals::SignalSet s;
            s.pricing.price_position_index = *rc::gen::inRange(50, 200) / 100.0;
            s.demand.demand_growth_rate    = *rc::gen::inRange(-100, 100) / 100.0;
            s.demand.seasonal_index        = *rc::gen::inRange(50, 200) / 100.0;
            s.trend.trend_momentum         = *rc::gen::inRange(-40, 40) * 1.0;

            const DecisionEngine engine;
            const auto out = engine.evaluate(s);

            RC_ASSERT(out->log.size() == kAllRules.size());
            std::size_t fired = 0;
            for (std::size_t i = 0; i < out->log.size(); ++i) {
                RC_ASSERT(out->log[i].rule == kAllRules[i]);
                RC_ASSERT(out->log[i].fired == out->log[i].confidence.has_value());
                if (out->log[i].fired) ++fired;
            }

            const auto& recs = out->recommendations;
            RC_ASSERT(!recs.empty());
            if (fired == 0) {
                RC_ASSERT(recs.size() == 1u);
                RC_ASSERT(recs.front().type == ActionType::Hold);
            } else {
                RC_ASSERT(recs.size() == fired);
                RC_ASSERT(out->actions_triggered() == fired);
            }
            for (std::size_t i = 1; i < recs.size(); ++i) {
                RC_ASSERT(static_cast<int>(recs[i - 1].urgency) >=
                          static_cast<int>(recs[i].urgency));
            }
        }
    );

    return ok ? 0 : 1;
}
