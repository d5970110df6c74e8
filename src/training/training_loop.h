#pragma once
/**
 * TrainingLoop — 智能体-环境交互循环
 *
 * 单个 episode:
 *   env.reset() → { agent.select_action → env.step → agent.learn } × N
 *   直到 done 或用尽 max_steps, 返回 EpisodeSummary
 *
 * 多个 episode:
 *   TrainingSession 是惰性、有限的 summary 序列: 每次 next() 跑一个
 *   episode, 然后调用 agent.decay_exploration()。
 *   新建 session 即重新开始; 随机源以相同种子初始化时结果逐位相同。
 *
 * 单线程、同步: select_action / step / learn 严格顺序执行。
 */

#include "engine/environment.h"
#include "learning/agent.h"
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <vector>

namespace gridq {

struct EpisodeSummary {
    uint32_t    episode          = 0;    // 1-based within its session
    double      total_reward     = 0.0;
    uint32_t    steps            = 0;
    Termination termination      = Termination::NONE;
    uint32_t    coins_collected  = 0;
    double      exploration_rate = 0.0;  // ε in effect during the episode
};

struct TrainingStats {
    size_t episodes       = 0;
    size_t goal_count     = 0;
    size_t loss_count     = 0;
    size_t truncated      = 0;
    double mean_reward    = 0.0;
    double best_reward    = 0.0;
    double mean_steps     = 0.0;
};

/** Called after every environment step, before the next action is selected. */
using StepCallback = std::function<void(const Transition& t, const StepResult& r)>;

/** Called after every finished episode. */
using ProgressCallback = std::function<void(const EpisodeSummary& s)>;

/**
 * Runs one episode. max_steps = 0 leaves termination entirely to the
 * environment. Termination is the environment's reason, or TRUNCATED when
 * max_steps ran out first.
 */
EpisodeSummary run_episode(Environment& env, Agent& agent, uint32_t max_steps, Rng& rng,
                           const StepCallback& on_step = nullptr);

class TrainingSession {
public:
    TrainingSession(Environment& env, Agent& agent, uint32_t episodes, uint32_t max_steps,
                    Rng& rng);

    /** Runs the next episode and decays exploration. Empty once exhausted. */
    std::optional<EpisodeSummary> next();

    bool finished() const { return completed_ >= episodes_; }
    uint32_t episodes_completed() const { return completed_; }
    uint32_t episodes_total() const { return episodes_; }

    void set_step_callback(StepCallback cb) { on_step_ = std::move(cb); }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = EpisodeSummary;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const EpisodeSummary*;
        using reference         = const EpisodeSummary&;

        iterator() = default;
        explicit iterator(TrainingSession* session) : session_(session) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }

        bool operator==(const iterator& o) const { return session_ == o.session_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        void advance() {
            if (!session_) return;
            current_ = session_->next();
            if (!current_) session_ = nullptr;
        }

        TrainingSession* session_ = nullptr;
        std::optional<EpisodeSummary> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    Environment& env_;
    Agent& agent_;
    uint32_t episodes_;
    uint32_t max_steps_;
    Rng& rng_;
    uint32_t completed_ = 0;
    StepCallback on_step_;
};

/** Runs a full session and collects its summaries. */
std::vector<EpisodeSummary> run(Environment& env, Agent& agent, uint32_t episodes,
                                uint32_t max_steps, Rng& rng,
                                const ProgressCallback& on_episode = nullptr);

TrainingStats summarize(const std::vector<EpisodeSummary>& summaries);

} // namespace gridq
