/**
 * gridq_play — 在格子世界上训练/运行表格型智能体
 *
 * Usage:
 *   gridq_play play [--episodes N] [--max-steps N]
 *                   [--rows N] [--columns N] [--start r,c] [--goal r,c]
 *                   [--loss "r,c r,c"] [--coins "r,c ..."] [--walls "r,c ..."]
 *                   [--portals "r,c:r,c ..."] [--wrap] [--render]
 *                   [--seed N] [--workers N] [--save-q path] [--load-q path]
 *                   <q-learning|sarsa|expected-sarsa>
 *                   [--learning-rate x] [--discount-rate x]
 *                   [--exploration-rate x] [--exploration-decay x] [--exploration-min x]
 *
 * defaults: 3x4 grid, goal (2,3), 100 episodes x 100 steps, q-learning
 */

#include "core/coordinate_parser.h"
#include "core/errors.h"
#include "engine/grid_render.h"
#include "engine/grid_world_env.h"
#include "learning/agent_factory.h"
#include "training/parallel_trainer.h"
#include "training/training_loop.h"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

using namespace gridq;

namespace {

struct PlayOptions {
    uint32_t episodes  = 100;
    uint32_t max_steps = 100;
    uint32_t seed      = 42;
    size_t   workers   = 1;
    bool     render    = false;
    std::string agent  = "q-learning";
    std::string save_q;
    std::string load_q;
    GridLayoutConfig layout;
    AgentConfig agent_config;
};

void print_usage() {
    printf("Usage: gridq_play play [options] <agent> [agent options]\n\n");
    printf("  --episodes N          episodes to play (default 100)\n");
    printf("  --max-steps N         step budget per episode (default 100)\n");
    printf("  --rows N --columns N  grid dimensions (default 3x4)\n");
    printf("  --start r,c           start coordinate (default 0,0)\n");
    printf("  --goal r,c            goal coordinate (default bottom-right)\n");
    printf("  --loss  \"r,c ...\"     loss squares\n");
    printf("  --coins \"r,c ...\"     coin squares\n");
    printf("  --walls \"r,c ...\"     wall squares\n");
    printf("  --portals \"r,c:r,c\"   portal entry:exit pairs\n");
    printf("  --wrap                wrap around grid boundaries\n");
    printf("  --render              print the grid after every step of the last episode\n");
    printf("  --seed N              random seed (default 42)\n");
    printf("  --workers N           independent workers, tables merged (default 1)\n");
    printf("  --save-q / --load-q   Q-table JSON path\n\n");
    printf("Agents:");
    for (const auto& n : agent_names()) printf(" %s", n.c_str());
    printf("\n  --learning-rate x --discount-rate x --exploration-rate x\n");
    printf("  --exploration-decay x --exploration-min x\n");
}

double parse_double(const char* flag, const char* text) {
    char* end = nullptr;
    double v = std::strtod(text, &end);
    if (end == text || *end != '\0') {
        throw ConfigurationError(std::string("Invalid value for ") + flag + ": '" + text + "'");
    }
    return v;
}

// Non-negative decimal integer that fits in T.
template <typename T>
T parse_count(const char* flag, const char* text) {
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (!std::isdigit(static_cast<unsigned char>(text[0])) || *end != '\0' ||
        errno == ERANGE ||
        v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        throw ConfigurationError(std::string("Invalid value for ") + flag + ": '" + text + "'");
    }
    return static_cast<T>(v);
}

PlayOptions parse_args(int argc, char* argv[]) {
    PlayOptions o;
    auto need = [&](int& i) -> const char* {
        if (i + 1 >= argc) {
            throw ConfigurationError(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    };

    for (int i = 2; i < argc; ++i) {
        const char* a = argv[i];
        if      (!std::strcmp(a, "--episodes"))   o.episodes  = parse_count<uint32_t>(a, need(i));
        else if (!std::strcmp(a, "--max-steps"))  o.max_steps = parse_count<uint32_t>(a, need(i));
        else if (!std::strcmp(a, "--seed"))       o.seed      = parse_count<uint32_t>(a, need(i));
        else if (!std::strcmp(a, "--workers"))    o.workers   = parse_count<size_t>(a, need(i));
        else if (!std::strcmp(a, "--rows"))       o.layout.rows    = parse_count<int>(a, need(i));
        else if (!std::strcmp(a, "--columns"))    o.layout.columns = parse_count<int>(a, need(i));
        else if (!std::strcmp(a, "--start"))      o.layout.start   = parse_coordinate(need(i));
        else if (!std::strcmp(a, "--goal"))       o.layout.goal    = parse_coordinate(need(i));
        else if (!std::strcmp(a, "--loss"))       o.layout.loss    = parse_coordinate_list(need(i));
        else if (!std::strcmp(a, "--coins"))      o.layout.coins   = parse_coordinate_list(need(i));
        else if (!std::strcmp(a, "--walls"))      o.layout.walls   = parse_coordinate_list(need(i));
        else if (!std::strcmp(a, "--portals"))    o.layout.portals = parse_portal_list(need(i));
        else if (!std::strcmp(a, "--wrap"))       o.layout.wrap_map = true;
        else if (!std::strcmp(a, "--render"))     o.render = true;
        else if (!std::strcmp(a, "--save-q"))     o.save_q = need(i);
        else if (!std::strcmp(a, "--load-q"))     o.load_q = need(i);
        else if (!std::strcmp(a, "--learning-rate"))     o.agent_config.learning_rate     = parse_double(a, need(i));
        else if (!std::strcmp(a, "--discount-rate"))     o.agent_config.discount_rate     = parse_double(a, need(i));
        else if (!std::strcmp(a, "--exploration-rate"))  o.agent_config.exploration_rate  = parse_double(a, need(i));
        else if (!std::strcmp(a, "--exploration-decay")) o.agent_config.exploration_decay = parse_double(a, need(i));
        else if (!std::strcmp(a, "--exploration-min"))   o.agent_config.exploration_min   = parse_double(a, need(i));
        else if (a[0] != '-')                     o.agent = a;
        else throw ConfigurationError(std::string("Unknown option ") + a);
    }
    return o;
}

void print_stats(const char* label, const std::vector<EpisodeSummary>& summaries) {
    TrainingStats st = summarize(summaries);
    printf("  %-10s episodes=%zu goal=%zu loss=%zu truncated=%zu | "
           "mean_reward=%+.3f best=%+.3f mean_steps=%.1f\n",
           label, st.episodes, st.goal_count, st.loss_count, st.truncated,
           st.mean_reward, st.best_reward, st.mean_steps);
}

int play_single(const PlayOptions& o, std::shared_ptr<const GridLayout> layout) {
    GridWorldEnv env(layout, o.max_steps);
    auto agent = make_agent(o.agent, o.agent_config);
    if (!o.load_q.empty()) {
        agent->q_table().load(o.load_q);
        printf("  Loaded %zu Q-values from %s\n", agent->q_table().size(), o.load_q.c_str());
    }

    env.reset();
    printf("%s\n", render_grid(env).c_str());

    Rng rng(o.seed);
    TrainingSession session(env, *agent, o.episodes, o.max_steps, rng);
    std::vector<EpisodeSummary> summaries;
    uint32_t report_every = o.episodes >= 10 ? o.episodes / 10 : 1;

    while (!session.finished()) {
        // Render every step of the final episode.
        if (o.render && session.episodes_completed() + 1 == o.episodes) {
            session.set_step_callback([&env](const Transition& t, const StepResult& r) {
                printf("\n  %s → %s  reward=%+.3f  %s\n", action_name(t.action),
                       to_string(r.state).c_str(), r.reward, step_event_name(r.info.event));
                printf("%s", render_grid(env).c_str());
            });
        }
        auto s = session.next();
        if (!s) break;
        summaries.push_back(*s);
        if (s->episode % report_every == 0 || s->episode == o.episodes) {
            printf("  Episode %4u/%u | reward=%+.3f steps=%3u %-9s coins=%u eps=%.3f\n",
                   s->episode, o.episodes, s->total_reward, s->steps,
                   termination_name(s->termination), s->coins_collected, s->exploration_rate);
        }
    }

    printf("\n");
    print_stats(agent->name(), summaries);
    printf("\n--- Greedy policy ---\n%s", render_policy(*layout, agent->q_table()).c_str());

    if (!o.save_q.empty()) {
        agent->q_table().save(o.save_q);
        printf("\n  Saved %zu Q-values to %s\n", agent->q_table().size(), o.save_q.c_str());
    }
    return 0;
}

int play_parallel(const PlayOptions& o, std::shared_ptr<const GridLayout> layout) {
    ParallelConfig pcfg;
    pcfg.n_workers = o.workers;
    pcfg.episodes_per_worker = o.episodes;
    pcfg.max_steps = o.max_steps;
    pcfg.base_seed = o.seed;
    pcfg.agent_name = o.agent;
    pcfg.agent_config = o.agent_config;
    if (!o.load_q.empty()) {
        auto initial = std::make_shared<QTable>(o.agent_config.initial_q);
        initial->load(o.load_q);
        printf("  Loaded %zu Q-values from %s into every worker\n", initial->size(), o.load_q.c_str());
        pcfg.initial_table = initial;
    }

    printf("  Training %zu independent %s workers (%u episodes each)\n",
           o.workers, o.agent.c_str(), o.episodes);
    ParallelTrainer trainer(layout, pcfg);
    ParallelResult res = trainer.run();

    for (size_t w = 0; w < res.worker_summaries.size(); ++w) {
        std::string label = "worker " + std::to_string(w);
        print_stats(label.c_str(), res.worker_summaries[w]);
    }
    printf("\n  Merged table (last writer wins): %zu Q-values\n", res.merged.size());
    printf("\n--- Greedy policy (merged) ---\n%s", render_policy(*layout, res.merged).c_str());

    if (!o.save_q.empty()) {
        res.merged.save(o.save_q);
        printf("\n  Saved merged table to %s\n", o.save_q.c_str());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
#endif

    if (argc < 2 || std::strcmp(argv[1], "play") != 0) {
        print_usage();
        return argc < 2 ? 0 : 1;
    }

    try {
        PlayOptions o = parse_args(argc, argv);
        auto layout = std::make_shared<const GridLayout>(o.layout);

        printf("=== gridq play: %s on %dx%d grid ===\n",
               o.agent.c_str(), layout->rows(), layout->columns());
        printf("  episodes=%u max_steps=%u seed=%u alpha=%.3f gamma=%.3f eps=%.3f\n\n",
               o.episodes, o.max_steps, o.seed, o.agent_config.learning_rate,
               o.agent_config.discount_rate, o.agent_config.exploration_rate);

        if (o.workers > 1) return play_parallel(o, layout);
        return play_single(o, layout);
    } catch (const Error& e) {
        fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
