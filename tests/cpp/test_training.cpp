/**
 * test_training.cpp — 训练循环 + 并行训练
 *
 * 验证:
 * 1. run_episode 终止原因 (GOAL / LOSS / TRUNCATED)
 * 2. TrainingSession: 计数, 每 episode 衰减一次, 迭代器
 * 3. 相同种子 → 相同结果
 * 4. 小网格上 Q-Learning 收敛到绕开失败格的路径
 * 5. 三种智能体都能跑完训练
 * 6. summarize 统计
 * 7. ParallelTrainer: worker 独立 + 合并 + 初始 Q 表
 */

#include "core/errors.h"
#include "engine/grid_world_env.h"
#include "learning/agent_factory.h"
#include "learning/q_learning_agent.h"
#include "training/parallel_trainer.h"
#include "training/training_loop.h"
#include "test_utils.h"

#include <cmath>

using namespace gridq;

static GridLayoutConfig cliff_layout() {
    GridLayoutConfig cfg;
    cfg.rows = 3; cfg.columns = 4;
    cfg.goal = Coordinate{2, 3};
    cfg.loss = {{1, 2}};
    cfg.walls = {{2, 2}};
    return cfg;
}

// =========================================================================
// Test 1: 终止原因
// =========================================================================
static void test_episode_termination() {
    printf("\n--- Test 1: Episode termination reasons ---\n");

    Rng rng(1);

    // 1x2: every episode ends at the goal eventually
    GridLayoutConfig line;
    line.rows = 1; line.columns = 2;
    GridWorldEnv env(line);
    QLearningAgent agent;
    EpisodeSummary s = run_episode(env, agent, 0, rng);
    TEST_ASSERT(s.termination == Termination::GOAL, "GOAL");
    TEST_ASSERT(s.steps >= 1, "At least one step");

    // Loss directly to the right, greedy preference for RIGHT
    GridLayoutConfig lossy;
    lossy.rows = 1; lossy.columns = 3;
    lossy.start = {0, 0};
    lossy.loss = {{0, 1}};
    GridWorldEnv env2(lossy);
    AgentConfig greedy;
    greedy.exploration_rate = 0.0;
    greedy.exploration_min = 0.0;
    QLearningAgent g(greedy);
    g.q_table().update({0, 0}, Action::RIGHT, 1.0);
    s = run_episode(env2, g, 10, rng);
    TEST_ASSERT(s.termination == Termination::LOSS, "LOSS");
    TEST_ASSERT(s.steps == 1, "One step to loss");
    TEST_ASSERT(approx_eq(s.total_reward, -1.01), "Loss return");

    // Loop budget runs out first: pinned against the top boundary
    GridWorldEnv env3(GridLayoutConfig{});
    QLearningAgent stuck(greedy);
    stuck.q_table().update({0, 0}, Action::UP, 10.0);
    s = run_episode(env3, stuck, 5, rng);
    TEST_ASSERT(s.termination == Termination::TRUNCATED, "TRUNCATED by loop");
    TEST_ASSERT(s.steps == 5, "Five steps");

    // Environment budget truncates
    GridWorldEnv env4(GridLayoutConfig{}, 3);
    QLearningAgent stuck2(greedy);
    stuck2.q_table().update({0, 0}, Action::UP, 10.0);
    s = run_episode(env4, stuck2, 0, rng);
    TEST_ASSERT(s.termination == Termination::TRUNCATED, "TRUNCATED by env");
    TEST_ASSERT(s.steps == 3, "Env budget of three");

    // Step callback sees every transition
    int calls = 0;
    run_episode(env4, stuck2, 0, rng, [&](const Transition&, const StepResult&) { calls++; });
    TEST_ASSERT(calls == 3, "Callback per step");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 2: TrainingSession
// =========================================================================
static void test_session() {
    printf("\n--- Test 2: TrainingSession ---\n");

    GridWorldEnv env(cliff_layout(), 50);
    AgentConfig cfg;
    cfg.exploration_rate = 1.0;
    cfg.exploration_decay = 0.9;
    cfg.exploration_min = 0.0;
    QLearningAgent agent(cfg);
    Rng rng(3);

    TrainingSession session(env, agent, 10, 50, rng);
    uint32_t n = 0;
    double expected_eps = 1.0;
    for (const auto& s : session) {
        n++;
        TEST_ASSERT(s.episode == n, "1-based episode index");
        TEST_ASSERT(approx_eq(s.exploration_rate, expected_eps), "ε in effect during episode");
        TEST_ASSERT(s.termination != Termination::NONE, "Every episode has a reason");
        expected_eps *= 0.9;
    }
    TEST_ASSERT(n == 10, "Ten episodes");
    TEST_ASSERT(session.finished(), "Finished");
    TEST_ASSERT(!session.next().has_value(), "Exhausted");
    TEST_ASSERT(approx_eq(agent.exploration_rate(), std::pow(0.9, 10)), "Decayed once per episode");

    TrainingSession none(env, agent, 0, 50, rng);
    TEST_ASSERT(none.begin() == none.end(), "Zero episodes is empty");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 3: 相同种子可复现
// =========================================================================
static void test_reproducible() {
    printf("\n--- Test 3: Same seed reproduces ---\n");

    GridWorldEnv ea(cliff_layout()), eb(cliff_layout());
    auto aa = make_agent("sarsa");
    auto ab = make_agent("sarsa");
    Rng ra(2024), rb(2024);
    auto sa = run(ea, *aa, 40, 60, ra);
    auto sb = run(eb, *ab, 40, 60, rb);

    TEST_ASSERT(sa.size() == sb.size(), "Same length");
    for (size_t i = 0; i < sa.size(); ++i) {
        TEST_ASSERT(sa[i].total_reward == sb[i].total_reward, "Same reward");
        TEST_ASSERT(sa[i].steps == sb[i].steps, "Same steps");
        TEST_ASSERT(sa[i].termination == sb[i].termination, "Same termination");
    }
    TEST_ASSERT(aa->q_table().serialize() == ab->q_table().serialize(), "Same Q-table");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 4: 收敛
// =========================================================================
static void test_convergence() {
    printf("\n--- Test 4: Q-Learning converges around the loss cell ---\n");

    GridWorldEnv env(cliff_layout());
    AgentConfig cfg;
    cfg.learning_rate = 0.5;
    cfg.discount_rate = 0.95;
    cfg.exploration_rate = 1.0;
    cfg.exploration_decay = 0.95;
    cfg.exploration_min = 0.0;
    QLearningAgent agent(cfg);
    Rng rng(42);

    auto summaries = run(env, agent, 300, 100, rng);
    std::vector<EpisodeSummary> late(summaries.end() - 50, summaries.end());
    TrainingStats st = summarize(late);
    printf("  last 50: goal=%zu loss=%zu trunc=%zu mean_steps=%.1f\n",
           st.goal_count, st.loss_count, st.truncated, st.mean_steps);
    TEST_ASSERT(st.goal_count >= 45, "Late episodes reach the goal");

    // Greedy rollout takes the 5-step top route
    Coordinate s = env.reset();
    StepResult r;
    int steps = 0;
    while (steps < 20) {
        auto best = agent.q_table().best_actions(s);
        r = env.step(best.front());
        s = r.state;
        steps++;
        if (r.done) break;
    }
    TEST_ASSERT(r.done && r.info.termination == Termination::GOAL, "Greedy policy reaches goal");
    TEST_ASSERT(steps == 5, "Shortest path");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 5: 所有智能体
// =========================================================================
static void test_all_agents_train() {
    printf("\n--- Test 5: Every agent trains ---\n");

    for (const auto& name : agent_names()) {
        GridWorldEnv env(cliff_layout());
        AgentConfig cfg;
        cfg.learning_rate = 0.3;
        cfg.exploration_decay = 0.95;
        auto agent = make_agent(name, cfg);
        Rng rng(11);
        auto out = run(env, *agent, 200, 100, rng);
        TrainingStats st = summarize(out);
        printf("  %-15s goal=%zu loss=%zu trunc=%zu mean=%+.3f\n",
               name.c_str(), st.goal_count, st.loss_count, st.truncated, st.mean_reward);
        TEST_ASSERT(out.size() == 200, "200 summaries");
        TEST_ASSERT(st.goal_count > 0, "Reached the goal at least once");
        TEST_ASSERT(!agent->q_table().empty(), "Learned something");
    }

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 6: summarize
// =========================================================================
static void test_summarize() {
    printf("\n--- Test 6: summarize ---\n");

    std::vector<EpisodeSummary> v(3);
    v[0].total_reward = 1.0;  v[0].steps = 4;  v[0].termination = Termination::GOAL;
    v[1].total_reward = -1.0; v[1].steps = 2;  v[1].termination = Termination::LOSS;
    v[2].total_reward = -0.5; v[2].steps = 9;  v[2].termination = Termination::TRUNCATED;

    TrainingStats st = summarize(v);
    TEST_ASSERT(st.episodes == 3, "Three episodes");
    TEST_ASSERT(st.goal_count == 1 && st.loss_count == 1 && st.truncated == 1, "Counts");
    TEST_ASSERT(approx_eq(st.mean_reward, -0.5 / 3.0), "Mean reward");
    TEST_ASSERT(st.best_reward == 1.0, "Best reward");
    TEST_ASSERT(approx_eq(st.mean_steps, 5.0), "Mean steps");

    TrainingStats empty = summarize({});
    TEST_ASSERT(empty.episodes == 0 && empty.mean_reward == 0.0, "Empty input");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 7: ParallelTrainer
// =========================================================================
static void test_parallel_trainer() {
    printf("\n--- Test 7: ParallelTrainer ---\n");

    auto layout = std::make_shared<const GridLayout>(cliff_layout());
    ParallelConfig pcfg;
    pcfg.n_workers = 3;
    pcfg.episodes_per_worker = 60;
    pcfg.max_steps = 80;
    pcfg.base_seed = 100;
    pcfg.agent_name = "q-learning";

    ParallelTrainer trainer(layout, pcfg);
    ParallelResult res = trainer.run();
    TEST_ASSERT(res.worker_summaries.size() == 3, "Three workers");
    TEST_ASSERT(res.worker_tables.size() == 3, "Three tables");
    for (const auto& ws : res.worker_summaries) {
        TEST_ASSERT(ws.size() == 60, "60 episodes per worker");
    }

    // Every merged value comes from some worker
    for (const auto& kv : res.merged.entries()) {
        bool found = false;
        for (const auto& t : res.worker_tables) {
            if (t.contains(kv.first.state, kv.first.action) &&
                t.value(kv.first.state, kv.first.action) == kv.second.value) {
                found = true;
            }
        }
        TEST_ASSERT(found, "Merged value originates in a worker table");
    }
    for (const auto& t : res.worker_tables) {
        TEST_ASSERT(res.merged.size() >= t.size(), "Merged covers each worker");
    }
    printf("  merged %zu Q-values\n", res.merged.size());

    // Worker w is the same process as a sequential run seeded base_seed + w
    GridWorldEnv env(layout);
    auto solo = make_agent("q-learning");
    Rng rng(pcfg.base_seed + 1);
    auto seq = run(env, *solo, 60, 80, rng);
    bool same = seq.size() == res.worker_summaries[1].size();
    for (size_t i = 0; same && i < seq.size(); ++i) {
        same = seq[i].total_reward == res.worker_summaries[1][i].total_reward &&
               seq[i].steps == res.worker_summaries[1][i].steps;
    }
    TEST_ASSERT(same, "Worker matches a sequential run with its seed");

    // Every worker starts from the given table
    auto initial = std::make_shared<QTable>();
    initial->update({2, 3}, Action::UP, 9.5);   // goal cell: never acted from
    ParallelConfig seeded = pcfg;
    seeded.episodes_per_worker = 10;
    seeded.initial_table = initial;
    ParallelResult sr = ParallelTrainer(layout, seeded).run();
    for (const auto& t : sr.worker_tables) {
        TEST_ASSERT(t.value({2, 3}, Action::UP) == 9.5, "Worker starts from initial table");
    }
    TEST_ASSERT(sr.merged.value({2, 3}, Action::UP) == 9.5, "Initial entry survives the merge");
    TEST_ASSERT(initial->size() == 1, "Initial table not modified");

    ParallelConfig bad = pcfg;
    bad.n_workers = 0;
    TEST_THROWS((void)ParallelTrainer(layout, bad), ConfigurationError, "Zero workers rejected");
    bad = pcfg;
    bad.agent_name = "monte-carlo";
    TEST_THROWS((void)ParallelTrainer(layout, bad), ConfigurationError, "Unknown agent rejected");

    printf("  [PASS]\n"); g_pass++;
}

int main() {
    init_test_console();
    printf("=== Training Tests ===\n");

    test_episode_termination();
    test_session();
    test_reproducible();
    test_convergence();
    test_all_agents_train();
    test_summarize();
    test_parallel_trainer();

    return finish_tests();
}
