#pragma once
/**
 * ExpectedSarsaAgent — Expected SARSA (van Seijen et al. 2009)
 *
 *   target = r + γ · Σ_a' π_ε(a'|s') · Q(s', a')
 *   π_ε: 每个动作 ε/|A|, 贪心质量 (1−ε) 在并列最优动作间平分
 *
 * 更新是 s' 上当前策略的期望, 本身不消耗随机数。
 */

#include "learning/agent.h"

namespace gridq {

class ExpectedSarsaAgent : public Agent {
public:
    explicit ExpectedSarsaAgent(const AgentConfig& config = {});

    Action select_action(const Coordinate& state, Rng& rng) override;
    LearnResult learn(const Transition& t, Rng& rng) override;
    void decay_exploration() override { policy_.decay(); }

    double exploration_rate() const override { return policy_.epsilon(); }
    const AgentConfig& config() const override { return config_; }
    const QTable& q_table() const override { return table_; }
    QTable& q_table() override { return table_; }
    const char* name() const override { return "expected-sarsa"; }

    /** Σ_a' π(a'|state) Q(state, a') under the current ε. */
    double expected_value(const Coordinate& state) const;

private:
    AgentConfig config_;
    QTable table_;
    EpsilonGreedy policy_;
};

} // namespace gridq
