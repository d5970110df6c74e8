#pragma once
/**
 * QLearningAgent — Q-Learning (Watkins & Dayan 1992)
 *
 * off-policy TD(0) 控制:
 *   target = r                          (done)
 *          = r + γ · max_a' Q(s', a')   (otherwise)
 *   Q(s,a) ← Q(s,a) + α · (target − Q(s,a))
 *
 * 更新本身完全确定; 随机性只来自 select_action 中的 ε-贪心抽样。
 */

#include "learning/agent.h"

namespace gridq {

class QLearningAgent : public Agent {
public:
    explicit QLearningAgent(const AgentConfig& config = {});

    Action select_action(const Coordinate& state, Rng& rng) override;
    LearnResult learn(const Transition& t, Rng& rng) override;
    void decay_exploration() override { policy_.decay(); }

    /** The update itself needs no randomness. */
    LearnResult learn(const Coordinate& state, Action action, double reward,
                      const Coordinate& next_state, bool done);

    double exploration_rate() const override { return policy_.epsilon(); }
    const AgentConfig& config() const override { return config_; }
    const QTable& q_table() const override { return table_; }
    QTable& q_table() override { return table_; }
    const char* name() const override { return "q-learning"; }

    EpsilonGreedy& policy() { return policy_; }

private:
    AgentConfig config_;
    QTable table_;
    EpsilonGreedy policy_;
};

} // namespace gridq
