#pragma once
/**
 * GridWorldEnv — 格子世界状态转移引擎
 *
 * 持有不可变 GridLayout (shared_ptr, 可被多个环境共享) 与每个 episode
 * 独占的 EpisodeState。
 *
 * step(action) 解析顺序:
 *   1. candidate = agent + displacement(action)
 *   2. 越界 (wrap_map 时先取模) 或墙壁 → 拒绝移动, agent 原地不动,
 *      步数照常 +1, 奖励 = step_cost (可配置) + collision_penalty
 *   3. 否则移动; 若落在传送门入口, 同一步内立即传送到出口
 *   4. 在最终坐标结算奖励: step_cost 总是收取;
 *      LOSS → +loss_penalty 并终止; GOAL → +goal_reward 并终止;
 *      未收集的金币 → +coin_reward, 本 episode 内不再触发
 *   5. 到达 step budget (max_steps > 0) → done, termination = TRUNCATED
 *
 * 无内部随机性: 相同动作序列从 reset() 起总是产生相同轨迹。
 * 未 reset 就 step, 或 done 之后未 reset 又 step → InvalidStateError。
 */

#include "engine/environment.h"
#include "engine/grid_layout.h"
#include <memory>
#include <vector>

namespace gridq {

struct EpisodeState {
    enum class Phase : uint8_t { NOT_STARTED = 0, RUNNING = 1, FINISHED = 2 };

    Coordinate agent;
    std::vector<bool>     collected;   // per cell index, true = coin taken this episode
    std::vector<uint32_t> visits;      // per cell index
    uint32_t    step_count  = 0;
    Termination termination = Termination::NONE;
    Phase       phase       = Phase::NOT_STARTED;
};

class GridWorldEnv : public Environment {
public:
    explicit GridWorldEnv(std::shared_ptr<const GridLayout> layout, uint32_t max_steps = 0);
    explicit GridWorldEnv(const GridLayoutConfig& config, uint32_t max_steps = 0);

    // --- Environment interface ---
    Coordinate reset() override;
    StepResult step(Action action) override;

    Coordinate agent() const override { return state_.agent; }
    uint32_t step_count() const override { return state_.step_count; }
    size_t num_states() const override { return layout_->num_cells(); }

    // --- Read-only access (rendering / statistics) ---
    const GridLayout& layout() const { return *layout_; }
    std::shared_ptr<const GridLayout> shared_layout() const { return layout_; }
    const EpisodeState& episode() const { return state_; }

    bool episode_running() const { return state_.phase == EpisodeState::Phase::RUNNING; }
    Termination termination() const { return state_.termination; }

    /** True if the coin at c was collected during the current episode. */
    bool coin_collected(const Coordinate& c) const;
    size_t coins_collected() const;
    uint32_t visit_count(const Coordinate& c) const;

    uint32_t step_budget() const { return max_steps_; }
    /** 0 = unlimited. Takes effect immediately, including mid-episode. */
    void set_step_budget(uint32_t max_steps) { max_steps_ = max_steps; }

private:
    /** Applies wrap-around and bounds/wall checks. False if the move is rejected. */
    bool resolve_move(const Coordinate& from, Action action, Coordinate& to,
                      StepEvent& blocked_event) const;

    std::shared_ptr<const GridLayout> layout_;
    uint32_t max_steps_;
    EpisodeState state_;
};

} // namespace gridq
