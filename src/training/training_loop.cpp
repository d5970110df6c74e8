#include "training/training_loop.h"
#include <algorithm>

namespace gridq {

EpisodeSummary run_episode(Environment& env, Agent& agent, uint32_t max_steps, Rng& rng,
                           const StepCallback& on_step) {
    EpisodeSummary summary;
    summary.exploration_rate = agent.exploration_rate();

    Coordinate state = env.reset();
    bool done = false;

    while (!done && (max_steps == 0 || summary.steps < max_steps)) {
        Action action = agent.select_action(state, rng);
        StepResult r = env.step(action);

        Transition t{state, action, r.reward, r.state, r.done};
        agent.learn(t, rng);

        summary.total_reward += r.reward;
        summary.steps++;
        if (r.info.coin_collected) summary.coins_collected++;
        if (on_step) on_step(t, r);

        done = r.done;
        summary.termination = r.info.termination;
        state = r.state;
    }

    if (!done) {
        summary.termination = Termination::TRUNCATED;
    }
    return summary;
}

// =============================================================================
// TrainingSession
// =============================================================================

TrainingSession::TrainingSession(Environment& env, Agent& agent, uint32_t episodes,
                                 uint32_t max_steps, Rng& rng)
    : env_(env)
    , agent_(agent)
    , episodes_(episodes)
    , max_steps_(max_steps)
    , rng_(rng)
{}

std::optional<EpisodeSummary> TrainingSession::next() {
    if (finished()) return std::nullopt;

    EpisodeSummary s = run_episode(env_, agent_, max_steps_, rng_, on_step_);
    s.episode = ++completed_;
    agent_.decay_exploration();
    return s;
}

std::vector<EpisodeSummary> run(Environment& env, Agent& agent, uint32_t episodes,
                                uint32_t max_steps, Rng& rng,
                                const ProgressCallback& on_episode) {
    std::vector<EpisodeSummary> out;
    out.reserve(episodes);
    TrainingSession session(env, agent, episodes, max_steps, rng);
    for (const auto& s : session) {
        out.push_back(s);
        if (on_episode) on_episode(s);
    }
    return out;
}

TrainingStats summarize(const std::vector<EpisodeSummary>& summaries) {
    TrainingStats st;
    st.episodes = summaries.size();
    if (summaries.empty()) return st;

    double reward_sum = 0.0, step_sum = 0.0;
    st.best_reward = summaries.front().total_reward;
    for (const auto& s : summaries) {
        switch (s.termination) {
            case Termination::GOAL:      st.goal_count++; break;
            case Termination::LOSS:      st.loss_count++; break;
            case Termination::TRUNCATED: st.truncated++;  break;
            case Termination::NONE:      break;
        }
        reward_sum += s.total_reward;
        step_sum   += s.steps;
        st.best_reward = std::max(st.best_reward, s.total_reward);
    }
    st.mean_reward = reward_sum / static_cast<double>(st.episodes);
    st.mean_steps  = step_sum / static_cast<double>(st.episodes);
    return st;
}

} // namespace gridq
