#pragma once
/**
 * EpsilonGreedy — ε-贪心探索策略 + ε 衰减
 *
 * 选择:
 *   概率 ε   → 在全部 4 个动作中均匀随机 (与 Q 值无关)
 *   概率 1-ε → 在 best_actions(state) 中均匀随机 (并列时随机打破, 无方向偏置)
 *
 * 衰减 (每个完成的 episode 调用一次, 不在 episode 中途调用):
 *   MULTIPLICATIVE: ε ← max(floor, ε × decay_rate)
 *   LINEAR:         ε ← max(floor, ε − decay_step)
 *   单调不增, 永不低于 floor。
 */

#include "core/types.h"
#include <cstdint>

namespace gridq {

class QTable;

enum class DecayMode : uint8_t {
    MULTIPLICATIVE = 0,
    LINEAR         = 1
};

struct AgentConfig {
    double learning_rate     = 0.1;    // α ∈ (0, 1]
    double discount_rate     = 0.99;   // γ ∈ [0, 1)
    double exploration_rate  = 1.0;    // ε ∈ [0, 1]
    double exploration_min   = 0.01;   // ε floor ∈ [0, 1]
    double exploration_decay = 0.99;   // multiplicative factor ∈ [0, 1]
    DecayMode decay_mode     = DecayMode::MULTIPLICATIVE;
    double decay_step        = 0.01;   // linear decrement ≥ 0
    double initial_q         = 0.0;    // value of unseen (state, action) entries
};

/** Throws ConfigurationError on any out-of-range hyperparameter, or ε below its floor. */
void validate_agent_config(const AgentConfig& config);

class EpsilonGreedy {
public:
    explicit EpsilonGreedy(const AgentConfig& config);

    Action select(const QTable& table, const Coordinate& state, Rng& rng) const;

    /** π(action | state) under the current ε. */
    double probability(const QTable& table, const Coordinate& state, Action action) const;

    void decay();

    double epsilon() const { return epsilon_; }
    double floor() const { return floor_; }

    /** Sets ε, clamped to [floor, 1]. */
    void set_epsilon(double epsilon);

private:
    double epsilon_;
    double floor_;
    DecayMode mode_;
    double decay_rate_;
    double decay_step_;
};

} // namespace gridq
