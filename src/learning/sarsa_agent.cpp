#include "learning/sarsa_agent.h"

namespace gridq {

SarsaAgent::SarsaAgent(const AgentConfig& config)
    : config_((validate_agent_config(config), config))
    , table_(config.initial_q)
    , policy_(config)
{}

Action SarsaAgent::select_action(const Coordinate& state, Rng& rng) {
    if (pending_ && pending_->state == state) {
        Action a = pending_->action;
        pending_.reset();
        return a;
    }
    pending_.reset();
    return policy_.select(table_, state, rng);
}

LearnResult SarsaAgent::learn(const Transition& t, Rng& rng) {
    if (t.done) {
        pending_.reset();
        return apply_td_update(table_, t.state, t.action, t.reward, config_.learning_rate);
    }
    Action next = policy_.select(table_, t.next_state, rng);
    double target = t.reward + config_.discount_rate * table_.value(t.next_state, next);
    LearnResult r = apply_td_update(table_, t.state, t.action, target, config_.learning_rate);
    pending_ = Pending{t.next_state, next};
    return r;
}

void SarsaAgent::decay_exploration() {
    pending_.reset();
    policy_.decay();
}

} // namespace gridq
