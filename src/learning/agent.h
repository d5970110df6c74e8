#pragma once
/**
 * Agent — 表格型智能体能力接口
 *
 * 两个核心操作 + 探索衰减:
 *   select_action(state, rng)  : ε-贪心选动作 (随机源显式传入, 训练可复现)
 *   learn(transition, rng)     : 用一条经验做 TD(0) 更新
 *   decay_exploration()        : 每个完成的 episode 调用一次
 *
 * 实现 (互为并列, 无继承链):
 *   - QLearningAgent      : off-policy, 目标 r + γ max_a' Q(s',a')
 *   - SarsaAgent          : on-policy,  目标 r + γ Q(s',a'), a' 按当前策略抽取
 *   - ExpectedSarsaAgent  : on-policy,  目标 r + γ Σ π(a'|s') Q(s',a')
 *
 * 终止转移 (done) 的目标一律为 r, 不做 bootstrap。
 */

#include "engine/environment.h"
#include "learning/exploration.h"
#include "learning/q_table.h"

namespace gridq {

struct LearnResult {
    double td_error  = 0.0;
    double old_value = 0.0;
    double new_value = 0.0;
    double target    = 0.0;
};

class Agent {
public:
    virtual ~Agent() = default;

    virtual Action select_action(const Coordinate& state, Rng& rng) = 0;
    virtual LearnResult learn(const Transition& t, Rng& rng) = 0;
    virtual void decay_exploration() = 0;

    virtual double exploration_rate() const = 0;
    virtual const AgentConfig& config() const = 0;
    virtual const QTable& q_table() const = 0;
    virtual QTable& q_table() = 0;
    virtual const char* name() const = 0;
};

/**
 * old = Q(s,a); td = target - old; new = old + α·td; Q(s,a) ← new.
 * Shared by every tabular agent once it has computed its target.
 */
LearnResult apply_td_update(QTable& table, const Coordinate& state, Action action,
                            double target, double learning_rate);

} // namespace gridq
