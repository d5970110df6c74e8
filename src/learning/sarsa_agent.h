#pragma once
/**
 * SarsaAgent — SARSA (Rummery & Niranjan 1994)
 *
 * on-policy TD(0) 控制:
 *   a' ~ π_ε(s')                         (learn 内按当前策略抽取)
 *   target = r                 (done)
 *          = r + γ · Q(s', a') (otherwise)
 *
 * 抽到的 a' 会被记住: 下一次 select_action(s') 直接返回它,
 * 保证 bootstrap 所用的动作就是实际执行的动作。
 * 记住的 a' 只在本 episode 内有效: decay_exploration() (每个 episode 结束时调用)
 * 会丢弃它。
 */

#include "learning/agent.h"
#include <optional>

namespace gridq {

class SarsaAgent : public Agent {
public:
    explicit SarsaAgent(const AgentConfig& config = {});

    Action select_action(const Coordinate& state, Rng& rng) override;
    LearnResult learn(const Transition& t, Rng& rng) override;
    void decay_exploration() override;

    double exploration_rate() const override { return policy_.epsilon(); }
    const AgentConfig& config() const override { return config_; }
    const QTable& q_table() const override { return table_; }
    QTable& q_table() override { return table_; }
    const char* name() const override { return "sarsa"; }

private:
    struct Pending {
        Coordinate state;
        Action     action;
    };

    AgentConfig config_;
    QTable table_;
    EpsilonGreedy policy_;
    std::optional<Pending> pending_;
};

} // namespace gridq
