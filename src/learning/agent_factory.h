#pragma once
/**
 * 按名称构造智能体 (CLI / Python / ParallelTrainer 共用)
 *
 *   "q-learning"      → QLearningAgent
 *   "sarsa"           → SarsaAgent
 *   "expected-sarsa"  → ExpectedSarsaAgent
 *
 * 未知名称 → ConfigurationError
 */

#include "learning/agent.h"
#include <memory>
#include <string>
#include <vector>

namespace gridq {

std::unique_ptr<Agent> make_agent(const std::string& name, const AgentConfig& config = {});

std::vector<std::string> agent_names();

} // namespace gridq
