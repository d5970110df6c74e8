#include "training/parallel_trainer.h"
#include "engine/grid_world_env.h"
#include "learning/agent_factory.h"
#include "core/errors.h"
#include <exception>

namespace gridq {

ParallelTrainer::ParallelTrainer(std::shared_ptr<const GridLayout> layout,
                                 const ParallelConfig& config)
    : layout_(std::move(layout))
    , config_(config)
{
    if (!layout_) {
        throw ConfigurationError("ParallelTrainer requires a layout");
    }
    if (config_.n_workers == 0) {
        throw ConfigurationError("ParallelTrainer requires at least one worker");
    }
    // Surface agent configuration errors here, not inside the parallel region.
    make_agent(config_.agent_name, config_.agent_config);
}

ParallelResult ParallelTrainer::run() {
    size_t n = config_.n_workers;
    auto clock = std::make_shared<UpdateClock>(0);

    std::vector<std::unique_ptr<Agent>> agents;
    std::vector<std::unique_ptr<GridWorldEnv>> envs;
    for (size_t w = 0; w < n; ++w) {
        agents.push_back(make_agent(config_.agent_name, config_.agent_config));
        QTable& table = agents.back()->q_table();
        table.set_clock(clock);
        if (config_.initial_table) {
            for (const auto& kv : config_.initial_table->entries()) {
                table.update(kv.first.state, kv.first.action, kv.second.value);
            }
        }
        envs.push_back(std::make_unique<GridWorldEnv>(layout_));
    }

    ParallelResult result;
    result.worker_summaries.resize(n);
    std::vector<std::exception_ptr> errors(n);

    // Workers are independent: each owns its env, agent, table and rng.
    int n_workers = static_cast<int>(n);
#ifdef GRIDQ_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int w = 0; w < n_workers; ++w) {
        try {
            Rng rng(config_.base_seed + static_cast<uint32_t>(w));
            result.worker_summaries[w] = gridq::run(*envs[w], *agents[w],
                                                    config_.episodes_per_worker,
                                                    config_.max_steps, rng);
        } catch (...) {
            // Exceptions must not cross the OpenMP region; rethrown below.
            errors[w] = std::current_exception();
        }
    }
    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    std::vector<const QTable*> tables;
    for (const auto& a : agents) {
        result.worker_tables.push_back(a->q_table());
        tables.push_back(&a->q_table());
    }
    result.merged = QTable::merge_latest(tables);
    return result;
}

} // namespace gridq
