#include "learning/exploration.h"
#include "learning/q_table.h"
#include "core/errors.h"
#include <algorithm>
#include <sstream>

namespace gridq {

namespace {

void require(bool ok, const char* name, double value, const char* range) {
    if (!ok) {
        std::ostringstream ss;
        ss << "Invalid " << name << " " << value << ", expected " << range;
        throw ConfigurationError(ss.str());
    }
}

} // namespace

void validate_agent_config(const AgentConfig& c) {
    require(c.learning_rate > 0.0 && c.learning_rate <= 1.0,
            "learning rate", c.learning_rate, "(0, 1]");
    require(c.discount_rate >= 0.0 && c.discount_rate < 1.0,
            "discount rate", c.discount_rate, "[0, 1)");
    require(c.exploration_rate >= 0.0 && c.exploration_rate <= 1.0,
            "exploration rate", c.exploration_rate, "[0, 1]");
    require(c.exploration_min >= 0.0 && c.exploration_min <= 1.0,
            "exploration minimum", c.exploration_min, "[0, 1]");
    require(c.exploration_rate >= c.exploration_min,
            "exploration rate", c.exploration_rate, ">= exploration minimum");
    require(c.exploration_decay >= 0.0 && c.exploration_decay <= 1.0,
            "exploration decay", c.exploration_decay, "[0, 1]");
    require(c.decay_step >= 0.0, "decay step", c.decay_step, ">= 0");
}

EpsilonGreedy::EpsilonGreedy(const AgentConfig& config)
    : epsilon_(config.exploration_rate)
    , floor_(config.exploration_min)
    , mode_(config.decay_mode)
    , decay_rate_(config.exploration_decay)
    , decay_step_(config.decay_step)
{}

Action EpsilonGreedy::select(const QTable& table, const Coordinate& state, Rng& rng) const {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng) < epsilon_) {
        std::uniform_int_distribution<size_t> any(0, kNumActions - 1);
        return kAllActions[any(rng)];
    }
    auto best = table.best_actions(state);
    if (best.size() == 1) return best.front();
    std::uniform_int_distribution<size_t> pick(0, best.size() - 1);
    return best[pick(rng)];
}

double EpsilonGreedy::probability(const QTable& table, const Coordinate& state,
                                  Action action) const {
    auto best = table.best_actions(state);
    double p = epsilon_ / static_cast<double>(kNumActions);
    if (std::find(best.begin(), best.end(), action) != best.end()) {
        p += (1.0 - epsilon_) / static_cast<double>(best.size());
    }
    return p;
}

void EpsilonGreedy::decay() {
    double next = (mode_ == DecayMode::LINEAR) ? epsilon_ - decay_step_
                                               : epsilon_ * decay_rate_;
    // ε ≥ floor always holds, and decay_rate ≤ 1, decay_step ≥ 0, so this never increases ε.
    epsilon_ = std::max(floor_, next);
}

void EpsilonGreedy::set_epsilon(double epsilon) {
    epsilon_ = std::clamp(epsilon, floor_, 1.0);
}

} // namespace gridq
