#pragma once
/**
 * Environment — 抽象环境接口
 *
 * 定义智能体与格子世界的交互协议:
 *   - reset() : 开始新 episode, 返回起始状态
 *   - step()  : 执行离散动作, 返回 (next_state, reward, done, info)
 *
 * 设计原则:
 *   - 环境是合法性与奖励的唯一权威, 智能体从不直接修改环境状态
 *   - info.termination 区分真正终止 (GOAL/LOSS) 与步数截断 (TRUNCATED)
 *
 * 实现:
 *   - GridWorldEnv : 墙壁/传送门/金币/终点/失败格
 */

#include "core/types.h"
#include <cstdint>
#include <cstddef>

namespace gridq {

enum class Termination : uint8_t {
    NONE      = 0,
    GOAL      = 1,
    LOSS      = 2,
    TRUNCATED = 3   // step budget exhausted, not a failure
};

const char* termination_name(Termination t);

enum class StepEvent : uint8_t {
    MOVED             = 0,
    COLLIDED_BOUNDARY = 1,
    COLLIDED_WALL     = 2,
    ENTERED_PORTAL    = 3,
    COLLECTED_COIN    = 4,
    REACHED_GOAL      = 5,
    REACHED_LOSS      = 6
};

const char* step_event_name(StepEvent e);

struct StepInfo {
    StepEvent   event          = StepEvent::MOVED;
    Termination termination    = Termination::NONE;
    bool        blocked        = false;   // move rejected, agent stayed
    bool        teleported     = false;
    bool        coin_collected = false;
    uint32_t    step           = 0;       // step counter after this step
};

struct StepResult {
    Coordinate state;
    double     reward = 0.0;
    bool       done   = false;
    StepInfo   info;
};

/** One (s, a, r, s', done) experience, consumed immediately by Agent::learn. */
struct Transition {
    Coordinate state;
    Action     action = Action::UP;
    double     reward = 0.0;
    Coordinate next_state;
    bool       done   = false;
};

class Environment {
public:
    virtual ~Environment() = default;

    // --- Lifecycle ---
    virtual Coordinate reset() = 0;

    // --- Motor ---
    virtual StepResult step(Action action) = 0;

    // --- Observation ---
    virtual Coordinate agent() const = 0;
    virtual uint32_t step_count() const = 0;
    virtual size_t num_states() const = 0;
};

} // namespace gridq
