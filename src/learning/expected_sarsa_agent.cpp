#include "learning/expected_sarsa_agent.h"

namespace gridq {

ExpectedSarsaAgent::ExpectedSarsaAgent(const AgentConfig& config)
    : config_((validate_agent_config(config), config))
    , table_(config.initial_q)
    , policy_(config)
{}

Action ExpectedSarsaAgent::select_action(const Coordinate& state, Rng& rng) {
    return policy_.select(table_, state, rng);
}

double ExpectedSarsaAgent::expected_value(const Coordinate& state) const {
    double sum = 0.0;
    for (Action a : kAllActions) {
        sum += policy_.probability(table_, state, a) * table_.value(state, a);
    }
    return sum;
}

LearnResult ExpectedSarsaAgent::learn(const Transition& t, Rng& /* rng */) {
    double target = t.done ? t.reward
                           : t.reward + config_.discount_rate * expected_value(t.next_state);
    return apply_td_update(table_, t.state, t.action, target, config_.learning_rate);
}

} // namespace gridq
