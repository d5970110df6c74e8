#include "learning/q_learning_agent.h"

namespace gridq {

QLearningAgent::QLearningAgent(const AgentConfig& config)
    : config_((validate_agent_config(config), config))
    , table_(config.initial_q)
    , policy_(config)
{}

Action QLearningAgent::select_action(const Coordinate& state, Rng& rng) {
    return policy_.select(table_, state, rng);
}

LearnResult QLearningAgent::learn(const Coordinate& state, Action action, double reward,
                                  const Coordinate& next_state, bool done) {
    // No valid future from a terminal state: ignore the bootstrap term entirely.
    double target = done ? reward
                         : reward + config_.discount_rate * table_.max_value(next_state);
    return apply_td_update(table_, state, action, target, config_.learning_rate);
}

LearnResult QLearningAgent::learn(const Transition& t, Rng& /* rng */) {
    return learn(t.state, t.action, t.reward, t.next_state, t.done);
}

} // namespace gridq
