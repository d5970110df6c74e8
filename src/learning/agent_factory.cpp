#include "learning/agent_factory.h"
#include "learning/q_learning_agent.h"
#include "learning/sarsa_agent.h"
#include "learning/expected_sarsa_agent.h"
#include "core/errors.h"

namespace gridq {

std::unique_ptr<Agent> make_agent(const std::string& name, const AgentConfig& config) {
    if (name == "q-learning")     return std::make_unique<QLearningAgent>(config);
    if (name == "sarsa")          return std::make_unique<SarsaAgent>(config);
    if (name == "expected-sarsa") return std::make_unique<ExpectedSarsaAgent>(config);

    std::string known;
    for (const auto& n : agent_names()) {
        known += (known.empty() ? "" : ", ") + n;
    }
    throw ConfigurationError("Unknown agent '" + name + "' (known: " + known + ")");
}

std::vector<std::string> agent_names() {
    return {"q-learning", "sarsa", "expected-sarsa"};
}

} // namespace gridq
