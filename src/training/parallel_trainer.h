#pragma once
/**
 * ParallelTrainer — 多 worker 独立训练 + Q 表合并
 *
 * 每个 worker 独占一个 GridWorldEnv (共享同一个不可变 GridLayout)、
 * 一个 agent 和一个 std::mt19937(base_seed + worker_id)。
 * worker 之间不共享任何可变状态, OpenMP 并行 (GRIDQ_OPENMP), 否则顺序执行。
 *
 * 若给定 initial_table, 每个 worker 从它的一份拷贝开始训练。
 *
 * 合并策略: 所有 worker 的 Q 表共用一个原子更新时钟,
 * 训练结束后逐 (state, action) 取时间戳最新的值 (最近写入者胜出)。
 */

#include "engine/grid_layout.h"
#include "learning/agent.h"
#include "training/training_loop.h"
#include <memory>
#include <string>
#include <vector>

namespace gridq {

struct ParallelConfig {
    size_t   n_workers           = 4;
    uint32_t episodes_per_worker = 200;
    uint32_t max_steps           = 100;
    uint32_t base_seed           = 42;
    std::string agent_name       = "q-learning";
    AgentConfig agent_config;
    std::shared_ptr<const QTable> initial_table;   // nullptr = start from an empty table
};

struct ParallelResult {
    std::vector<std::vector<EpisodeSummary>> worker_summaries;
    std::vector<QTable> worker_tables;
    QTable merged;
};

class ParallelTrainer {
public:
    ParallelTrainer(std::shared_ptr<const GridLayout> layout, const ParallelConfig& config);

    ParallelResult run();

private:
    std::shared_ptr<const GridLayout> layout_;
    ParallelConfig config_;
};

} // namespace gridq
