/**
 * test_agents.cpp — 表格型智能体 + ε-贪心策略
 *
 * 验证:
 * 1. Q-Learning TD 更新数值 (失败格示例)
 * 2. 非终止 bootstrap / 终止忽略 bootstrap
 * 3. ε=0 贪心, ε=1 均匀
 * 4. 并列最优动作随机打破 (每个最优动作都会被选中)
 * 5. ε 衰减单调 + 下限
 * 6. SARSA: bootstrap 动作就是下一步执行的动作; episode 结束后不再沿用
 * 7. Expected SARSA 期望目标
 * 8. make_agent / 超参数校验
 */

#include "core/errors.h"
#include "engine/grid_world_env.h"
#include "learning/agent_factory.h"
#include "learning/expected_sarsa_agent.h"
#include "learning/q_learning_agent.h"
#include "learning/sarsa_agent.h"
#include "test_utils.h"

#include <array>
#include <set>

using namespace gridq;

static AgentConfig greedy_config() {
    AgentConfig cfg;
    cfg.exploration_rate = 0.0;
    cfg.exploration_min = 0.0;
    return cfg;
}

// =========================================================================
// Test 1: TD 更新 (失败格示例)
// =========================================================================
static void test_td_update_example() {
    printf("\n--- Test 1: TD update onto the loss cell ---\n");

    GridLayoutConfig lcfg;
    lcfg.rows = 3; lcfg.columns = 4;
    lcfg.goal = Coordinate{2, 3};
    lcfg.loss = {{1, 2}};
    lcfg.walls = {{2, 2}};
    lcfg.rewards.step_cost = 0.0;
    lcfg.rewards.loss_penalty = -1.0;
    GridWorldEnv env(lcfg);

    AgentConfig acfg;
    acfg.learning_rate = 0.1;
    acfg.discount_rate = 0.95;
    QLearningAgent agent(acfg);
    Rng rng(42);

    Coordinate s = env.reset();
    s = env.step(Action::RIGHT).state;
    s = env.step(Action::RIGHT).state;
    TEST_ASSERT(s == (Coordinate{0, 2}), "Next to the loss cell");

    StepResult r = env.step(Action::DOWN);
    TEST_ASSERT(r.done && r.info.termination == Termination::LOSS, "Stepped onto loss");
    TEST_ASSERT(r.reward == -1.0, "r = -1.0");

    LearnResult lr = agent.learn(Transition{s, Action::DOWN, r.reward, r.state, r.done}, rng);
    printf("  old=%.3f target=%.3f new=%.3f td=%.3f\n",
           lr.old_value, lr.target, lr.new_value, lr.td_error);
    TEST_ASSERT(lr.old_value == 0.0, "Q was 0");
    TEST_ASSERT(approx_eq(lr.new_value, -0.1), "0 + 0.1 * (-1.0 - 0) = -0.1");
    TEST_ASSERT(approx_eq(agent.q_table().value(s, Action::DOWN), -0.1), "Stored in table");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 2: bootstrap
// =========================================================================
static void test_bootstrap() {
    printf("\n--- Test 2: Bootstrap vs terminal ---\n");

    AgentConfig acfg;
    acfg.learning_rate = 0.5;
    acfg.discount_rate = 0.9;
    QLearningAgent agent(acfg);

    Coordinate s{0, 0}, s2{0, 1};
    agent.q_table().update(s2, Action::RIGHT, 2.0);
    agent.q_table().update(s2, Action::DOWN, 1.0);

    // target = 0.5 + 0.9 * max(2.0, 1.0, 0, 0) = 2.3; new = 0 + 0.5 * 2.3
    LearnResult lr = agent.learn(s, Action::RIGHT, 0.5, s2, false);
    TEST_ASSERT(approx_eq(lr.target, 2.3), "Bootstrap on max");
    TEST_ASSERT(approx_eq(lr.new_value, 1.15), "Half-way to target");

    // done: Q(s2) ignored entirely
    LearnResult term = agent.learn(s, Action::DOWN, 0.5, s2, true);
    TEST_ASSERT(term.target == 0.5, "Terminal target = r");
    TEST_ASSERT(approx_eq(term.new_value, 0.25), "Terminal update");

    // Repeated updates converge to the target
    for (int i = 0; i < 60; ++i) agent.learn(s, Action::LEFT, 1.0, s2, true);
    TEST_ASSERT(approx_eq(agent.q_table().value(s, Action::LEFT), 1.0, 1e-9), "Converges");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 3: ε=0 / ε=1
// =========================================================================
static void test_greedy_and_uniform() {
    printf("\n--- Test 3: Greedy and uniform selection ---\n");

    Coordinate s{1, 1};
    QLearningAgent greedy(greedy_config());
    greedy.q_table().update(s, Action::LEFT, 0.7);
    Rng rng(7);
    for (int i = 0; i < 200; ++i) {
        TEST_ASSERT(greedy.select_action(s, rng) == Action::LEFT, "ε=0 always greedy");
    }

    AgentConfig explore;
    explore.exploration_rate = 1.0;
    QLearningAgent uniform(explore);
    uniform.q_table().update(s, Action::LEFT, 0.7);
    std::array<int, kNumActions> counts{};
    for (int i = 0; i < 4000; ++i) counts[action_index(uniform.select_action(s, rng))]++;
    printf("  ε=1 counts: UP=%d DOWN=%d LEFT=%d RIGHT=%d\n",
           counts[0], counts[1], counts[2], counts[3]);
    for (int c : counts) {
        TEST_ASSERT(c > 800 && c < 1200, "ε=1 roughly uniform");
    }

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 4: 并列随机打破
// =========================================================================
static void test_tie_breaking() {
    printf("\n--- Test 4: Random tie-breaking ---\n");

    QLearningAgent agent(greedy_config());
    Rng rng(123);
    Coordinate s{2, 0};

    std::set<Action> seen;
    for (int i = 0; i < 400; ++i) seen.insert(agent.select_action(s, rng));
    TEST_ASSERT(seen.size() == 4, "Unseen state: all four actions chosen");

    agent.q_table().update(s, Action::UP, 0.4);
    agent.q_table().update(s, Action::RIGHT, 0.4);
    seen.clear();
    for (int i = 0; i < 400; ++i) seen.insert(agent.select_action(s, rng));
    TEST_ASSERT(seen.size() == 2, "Only tied maxima chosen");
    TEST_ASSERT(seen.count(Action::UP) && seen.count(Action::RIGHT), "Both maxima chosen");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 5: ε 衰减
// =========================================================================
static void test_decay() {
    printf("\n--- Test 5: Exploration decay ---\n");

    AgentConfig cfg;
    cfg.exploration_rate = 1.0;
    cfg.exploration_decay = 0.5;
    cfg.exploration_min = 0.1;
    QLearningAgent agent(cfg);

    double prev = agent.exploration_rate();
    TEST_ASSERT(prev == 1.0, "Starts at ε0");
    for (int i = 0; i < 10; ++i) {
        agent.decay_exploration();
        double e = agent.exploration_rate();
        TEST_ASSERT(e <= prev, "Monotone non-increasing");
        TEST_ASSERT(e >= 0.1, "Never below floor");
        prev = e;
    }
    TEST_ASSERT(agent.exploration_rate() == 0.1, "Reaches floor");

    AgentConfig lin;
    lin.exploration_rate = 0.5;
    lin.exploration_min = 0.05;
    lin.decay_mode = DecayMode::LINEAR;
    lin.decay_step = 0.2;
    SarsaAgent sarsa(lin);
    sarsa.decay_exploration();
    TEST_ASSERT(approx_eq(sarsa.exploration_rate(), 0.3), "Linear step");
    sarsa.decay_exploration();
    sarsa.decay_exploration();
    TEST_ASSERT(sarsa.exploration_rate() == 0.05, "Linear floor");

    // ε below the floor is rejected, not raised to the floor
    AgentConfig low;
    low.exploration_rate = 0.0;
    low.exploration_min = 0.2;
    TEST_THROWS(ExpectedSarsaAgent{low}, ConfigurationError, "ε below floor rejected");
    low.exploration_min = 0.0;
    ExpectedSarsaAgent es(low);
    TEST_ASSERT(es.exploration_rate() == 0.0, "ε = floor = 0 accepted");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 6: SARSA
// =========================================================================
static void test_sarsa() {
    printf("\n--- Test 6: SARSA on-policy target ---\n");

    AgentConfig cfg = greedy_config();
    cfg.learning_rate = 1.0;
    cfg.discount_rate = 0.5;
    SarsaAgent agent(cfg);
    Rng rng(5);

    Coordinate s{0, 0}, s2{0, 1};
    agent.q_table().update(s2, Action::DOWN, 0.8);

    LearnResult lr = agent.learn(Transition{s, Action::RIGHT, -0.1, s2, false}, rng);
    TEST_ASSERT(approx_eq(lr.target, -0.1 + 0.5 * 0.8), "Greedy a' bootstraps on Q(s', DOWN)");
    TEST_ASSERT(agent.select_action(s2, rng) == Action::DOWN, "Executes the bootstrapped a'");

    // ε=1: recover a' from the target and check it is the one executed
    AgentConfig wild;
    wild.exploration_rate = 1.0;
    wild.learning_rate = 1.0;
    wild.discount_rate = 0.5;
    SarsaAgent w(wild);
    w.q_table().update(s2, Action::UP, 1.0);
    w.q_table().update(s2, Action::DOWN, 2.0);
    w.q_table().update(s2, Action::LEFT, 3.0);
    w.q_table().update(s2, Action::RIGHT, 4.0);
    for (int i = 0; i < 20; ++i) {
        LearnResult r = w.learn(Transition{s, Action::UP, 0.0, s2, false}, rng);
        double q_next = r.target / 0.5;
        Action executed = w.select_action(s2, rng);
        TEST_ASSERT(approx_eq(w.q_table().value(s2, executed), q_next), "a' matches executed action");
    }

    // Terminal: no bootstrap, no pending action
    LearnResult term = agent.learn(Transition{s, Action::LEFT, 1.0, s2, true}, rng);
    TEST_ASSERT(term.target == 1.0, "Terminal target = r");

    // Truncated episode: the last learn() was non-terminal and remembered a'.
    // Ending the episode discards it, so the next episode draws afresh.
    SarsaAgent cut(wild);
    Coordinate start{0, 0};
    cut.learn(Transition{start, Action::UP, -0.1, start, false}, rng);
    cut.decay_exploration();
    Rng before = rng;
    cut.select_action(start, rng);
    TEST_ASSERT(!(rng == before), "New episode samples a fresh action");

    // Without the episode boundary the remembered a' is reused
    cut.learn(Transition{start, Action::UP, -0.1, start, false}, rng);
    before = rng;
    cut.select_action(start, rng);
    TEST_ASSERT(rng == before, "Same episode reuses remembered a'");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 7: Expected SARSA
// =========================================================================
static void test_expected_sarsa() {
    printf("\n--- Test 7: Expected SARSA target ---\n");

    AgentConfig cfg;
    cfg.exploration_rate = 0.2;
    cfg.exploration_min = 0.0;
    cfg.learning_rate = 1.0;
    cfg.discount_rate = 0.9;
    ExpectedSarsaAgent agent(cfg);
    Rng rng(9);

    Coordinate s{1, 0}, s2{1, 1};
    agent.q_table().update(s2, Action::UP, 1.0);

    // π(UP) = 0.2/4 + 0.8 = 0.85, others 0.05 with Q = 0
    TEST_ASSERT(approx_eq(agent.expected_value(s2), 0.85), "Expected value under ε-greedy");

    LearnResult lr = agent.learn(Transition{s, Action::RIGHT, 0.1, s2, false}, rng);
    TEST_ASSERT(approx_eq(lr.target, 0.1 + 0.9 * 0.85), "Target r + γ E[Q]");

    // Two-way tie splits the greedy mass
    agent.q_table().update(s2, Action::DOWN, 1.0);
    TEST_ASSERT(approx_eq(agent.expected_value(s2), 0.05 + 0.4 + 0.05 + 0.4), "Tie split");

    LearnResult term = agent.learn(Transition{s, Action::RIGHT, 0.1, s2, true}, rng);
    TEST_ASSERT(term.target == 0.1, "Terminal target = r");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 8: 工厂 + 校验
// =========================================================================
static void test_factory_and_validation() {
    printf("\n--- Test 8: make_agent and hyperparameter validation ---\n");

    for (const auto& name : agent_names()) {
        auto a = make_agent(name);
        TEST_ASSERT(a != nullptr, "Agent constructed");
        TEST_ASSERT(name == a->name(), "Name round trip");
    }
    TEST_THROWS(make_agent("double-q"), ConfigurationError, "Unknown agent rejected");

    AgentConfig bad;
    bad.learning_rate = 0.0;
    TEST_THROWS(QLearningAgent{bad}, ConfigurationError, "α = 0 rejected");
    bad = AgentConfig{};
    bad.discount_rate = 1.0;
    TEST_THROWS(SarsaAgent{bad}, ConfigurationError, "γ = 1 rejected");
    bad = AgentConfig{};
    bad.exploration_rate = 1.5;
    TEST_THROWS(make_agent("expected-sarsa", bad), ConfigurationError, "ε > 1 rejected");
    bad = AgentConfig{};
    bad.exploration_decay = -0.1;
    TEST_THROWS(make_agent("q-learning", bad), ConfigurationError, "Negative decay rejected");

    printf("  [PASS]\n"); g_pass++;
}

int main() {
    init_test_console();
    printf("=== Agent Tests ===\n");

    test_td_update_example();
    test_bootstrap();
    test_greedy_and_uniform();
    test_tie_breaking();
    test_decay();
    test_sarsa();
    test_expected_sarsa();
    test_factory_and_validation();

    return finish_tests();
}
