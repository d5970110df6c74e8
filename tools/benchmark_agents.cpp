/**
 * benchmark_agents.cpp — 三种表格型智能体在同一格子世界上的学习表现
 */

#include "engine/grid_render.h"
#include "engine/grid_world_env.h"
#include "learning/agent_factory.h"
#include "training/training_loop.h"
#include <cstdio>

#ifdef _WIN32
#include <windows.h>
#endif

using namespace gridq;

int main() {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
#endif

    uint32_t seeds[] = {42, 77, 123, 256, 789};
    const size_t n_seeds = sizeof(seeds) / sizeof(seeds[0]);
    uint32_t episodes = 300;
    uint32_t max_steps = 100;

    // 5x6 with a loss strip, a wall, one coin and a portal
    GridLayoutConfig lcfg;
    lcfg.rows = 5; lcfg.columns = 6;
    lcfg.start = {0, 0};
    lcfg.goal = Coordinate{4, 5};
    lcfg.loss = {{2, 1}, {2, 2}, {2, 3}};
    lcfg.walls = {{1, 4}, {3, 4}};
    lcfg.coins = {{0, 3}};
    lcfg.portals = {{{4, 0}, {0, 5}}};
    auto layout = std::make_shared<const GridLayout>(lcfg);

    AgentConfig acfg;
    acfg.learning_rate = 0.2;
    acfg.discount_rate = 0.95;
    acfg.exploration_rate = 1.0;
    acfg.exploration_decay = 0.98;
    acfg.exploration_min = 0.05;

    printf("=== Agent Benchmark (%dx%d grid, %u episodes x %u steps) ===\n\n",
           layout->rows(), layout->columns(), episodes, max_steps);

    for (const auto& name : agent_names()) {
        double total_mean = 0.0, total_late = 0.0;
        size_t total_goal = 0, total_loss = 0;

        for (auto seed : seeds) {
            GridWorldEnv env(layout, max_steps);
            auto agent = make_agent(name, acfg);
            Rng rng(seed);

            auto summaries = run(env, *agent, episodes, max_steps, rng);
            TrainingStats st = summarize(summaries);

            // Last 10% of episodes: how well the learned policy does
            std::vector<EpisodeSummary> late(summaries.end() - episodes / 10, summaries.end());
            TrainingStats lt = summarize(late);

            printf("  %-15s seed=%3u | goal=%3zu loss=%3zu trunc=%3zu | "
                   "mean=%+.3f late=%+.3f late_steps=%.1f\n",
                   name.c_str(), seed, st.goal_count, st.loss_count, st.truncated,
                   st.mean_reward, lt.mean_reward, lt.mean_steps);

            total_mean += st.mean_reward;
            total_late += lt.mean_reward;
            total_goal += st.goal_count;
            total_loss += st.loss_count;
        }

        printf("  %-15s Avg: mean=%+.3f late=%+.3f goal=%.1f loss=%.1f  (%zu seeds)\n\n",
               name.c_str(), total_mean / n_seeds, total_late / n_seeds,
               static_cast<double>(total_goal) / n_seeds,
               static_cast<double>(total_loss) / n_seeds, n_seeds);
    }

    // Show one map
    printf("--- Map ---\n");
    GridWorldEnv show_env(layout);
    show_env.reset();
    printf("%s", render_grid(show_env).c_str());

    return 0;
}
