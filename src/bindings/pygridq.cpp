/**
 * pygridq — Python bindings for the gridq grid-world / tabular RL engine
 *
 * Exposes GridLayout, GridWorldEnv, the tabular agents, QTable and the
 * training loop to Python via pybind11 for notebooks and plotting.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "core/coordinate_parser.h"
#include "core/errors.h"
#include "engine/grid_render.h"
#include "engine/grid_world_env.h"
#include "learning/agent_factory.h"
#include "learning/expected_sarsa_agent.h"
#include "learning/q_learning_agent.h"
#include "learning/sarsa_agent.h"
#include "training/parallel_trainer.h"
#include "training/training_loop.h"

namespace py = pybind11;
using namespace gridq;

// Python-side training keeps its own seeded generator per call.
static std::vector<EpisodeSummary> train(Environment& env, Agent& agent, uint32_t episodes,
                                         uint32_t max_steps, uint32_t seed,
                                         const ProgressCallback& on_episode) {
    Rng rng(seed);
    return run(env, agent, episodes, max_steps, rng, on_episode);
}

PYBIND11_MODULE(pygridq, m) {
    m.doc() = "gridq: grid-world MDP + tabular Q-learning / SARSA / Expected SARSA";

    // =========================================================================
    // Errors
    // =========================================================================
    auto base = py::register_exception<Error>(m, "GridqError", PyExc_RuntimeError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", base.ptr());
    py::register_exception<InvalidStateError>(m, "InvalidStateError", base.ptr());
    py::register_exception<SerializationError>(m, "SerializationError", base.ptr());

    // =========================================================================
    // Core types
    // =========================================================================
    py::class_<Coordinate>(m, "Coordinate")
        .def(py::init<>())
        .def(py::init([](int row, int column) { return Coordinate{row, column}; }),
             py::arg("row"), py::arg("column"))
        .def_readwrite("row",    &Coordinate::row)
        .def_readwrite("column", &Coordinate::column)
        .def("__eq__", [](const Coordinate& a, const Coordinate& b) { return a == b; })
        .def("__hash__", [](const Coordinate& c) { return CoordinateHash{}(c); })
        .def("__repr__", [](const Coordinate& c) { return to_string(c); });

    py::enum_<Action>(m, "Action")
        .value("UP",    Action::UP)
        .value("DOWN",  Action::DOWN)
        .value("LEFT",  Action::LEFT)
        .value("RIGHT", Action::RIGHT);

    m.def("parse_coordinate", &parse_coordinate, py::arg("text"));
    m.def("parse_coordinate_list", &parse_coordinate_list, py::arg("text"));

    // =========================================================================
    // Layout
    // =========================================================================
    py::enum_<CellKind>(m, "CellKind")
        .value("EMPTY",        CellKind::EMPTY)
        .value("WALL",         CellKind::WALL)
        .value("GOAL",         CellKind::GOAL)
        .value("LOSS",         CellKind::LOSS)
        .value("COIN",         CellKind::COIN)
        .value("PORTAL_ENTRY", CellKind::PORTAL_ENTRY)
        .value("PORTAL_EXIT",  CellKind::PORTAL_EXIT);

    py::class_<PortalSpec>(m, "PortalSpec")
        .def(py::init<>())
        .def(py::init([](const Coordinate& entry, const Coordinate& exit) {
            return PortalSpec{entry, exit};
        }), py::arg("entry"), py::arg("exit"))
        .def_readwrite("entry", &PortalSpec::entry)
        .def_readwrite("exit",  &PortalSpec::exit);

    py::class_<RewardConfig>(m, "RewardConfig")
        .def(py::init<>())
        .def_readwrite("step_cost",         &RewardConfig::step_cost)
        .def_readwrite("goal_reward",       &RewardConfig::goal_reward)
        .def_readwrite("loss_penalty",      &RewardConfig::loss_penalty)
        .def_readwrite("coin_reward",       &RewardConfig::coin_reward)
        .def_readwrite("collision_penalty", &RewardConfig::collision_penalty)
        .def_readwrite("charge_step_cost_on_collision",
                       &RewardConfig::charge_step_cost_on_collision);

    py::class_<GridLayoutConfig>(m, "GridLayoutConfig")
        .def(py::init<>())
        .def_readwrite("rows",     &GridLayoutConfig::rows)
        .def_readwrite("columns",  &GridLayoutConfig::columns)
        .def_readwrite("start",    &GridLayoutConfig::start)
        .def_readwrite("goal",     &GridLayoutConfig::goal)
        .def_readwrite("loss",     &GridLayoutConfig::loss)
        .def_readwrite("walls",    &GridLayoutConfig::walls)
        .def_readwrite("coins",    &GridLayoutConfig::coins)
        .def_readwrite("portals",  &GridLayoutConfig::portals)
        .def_readwrite("wrap_map", &GridLayoutConfig::wrap_map)
        .def_readwrite("rewards",  &GridLayoutConfig::rewards);

    py::class_<GridLayout, std::shared_ptr<GridLayout>>(m, "GridLayout")
        .def(py::init<const GridLayoutConfig&>(), py::arg("config") = GridLayoutConfig{})
        .def("rows",        &GridLayout::rows)
        .def("columns",     &GridLayout::columns)
        .def("kind",        &GridLayout::kind, py::arg("coordinate"))
        .def("portal_exit", &GridLayout::portal_exit, py::arg("coordinate"))
        .def("start",       &GridLayout::start)
        .def("goal",        &GridLayout::goal)
        .def("wrap_map",    &GridLayout::wrap_map);

    // =========================================================================
    // Environment
    // =========================================================================
    py::enum_<Termination>(m, "Termination")
        .value("NONE",      Termination::NONE)
        .value("GOAL",      Termination::GOAL)
        .value("LOSS",      Termination::LOSS)
        .value("TRUNCATED", Termination::TRUNCATED);

    py::enum_<StepEvent>(m, "StepEvent")
        .value("MOVED",             StepEvent::MOVED)
        .value("COLLIDED_BOUNDARY", StepEvent::COLLIDED_BOUNDARY)
        .value("COLLIDED_WALL",     StepEvent::COLLIDED_WALL)
        .value("ENTERED_PORTAL",    StepEvent::ENTERED_PORTAL)
        .value("COLLECTED_COIN",    StepEvent::COLLECTED_COIN)
        .value("REACHED_GOAL",      StepEvent::REACHED_GOAL)
        .value("REACHED_LOSS",      StepEvent::REACHED_LOSS);

    py::class_<StepInfo>(m, "StepInfo")
        .def_readonly("event",          &StepInfo::event)
        .def_readonly("termination",    &StepInfo::termination)
        .def_readonly("blocked",        &StepInfo::blocked)
        .def_readonly("teleported",     &StepInfo::teleported)
        .def_readonly("coin_collected", &StepInfo::coin_collected)
        .def_readonly("step",           &StepInfo::step);

    py::class_<StepResult>(m, "StepResult")
        .def_readonly("state",  &StepResult::state)
        .def_readonly("reward", &StepResult::reward)
        .def_readonly("done",   &StepResult::done)
        .def_readonly("info",   &StepResult::info);

    py::class_<Transition>(m, "Transition")
        .def(py::init<>())
        .def(py::init([](const Coordinate& state, Action action, double reward,
                         const Coordinate& next_state, bool done) {
            return Transition{state, action, reward, next_state, done};
        }), py::arg("state"), py::arg("action"), py::arg("reward"),
            py::arg("next_state"), py::arg("done"))
        .def_readwrite("state",      &Transition::state)
        .def_readwrite("action",     &Transition::action)
        .def_readwrite("reward",     &Transition::reward)
        .def_readwrite("next_state", &Transition::next_state)
        .def_readwrite("done",       &Transition::done);

    py::class_<Environment>(m, "Environment",
        "Abstract environment: reset() / step(action)")
        .def("reset",       &Environment::reset)
        .def("step",        &Environment::step, py::arg("action"))
        .def("agent",       &Environment::agent)
        .def("step_count",  &Environment::step_count)
        .def("num_states",  &Environment::num_states);

    py::class_<GridWorldEnv, Environment>(m, "GridWorldEnv", "Grid world with walls, portals and coins")
        .def(py::init<const GridLayoutConfig&, uint32_t>(),
             py::arg("config") = GridLayoutConfig{}, py::arg("max_steps") = 0)
        .def("coin_collected",  &GridWorldEnv::coin_collected, py::arg("coordinate"))
        .def("coins_collected", &GridWorldEnv::coins_collected)
        .def("visit_count",     &GridWorldEnv::visit_count, py::arg("coordinate"))
        .def("termination",     &GridWorldEnv::termination)
        .def("episode_running", &GridWorldEnv::episode_running)
        .def("step_budget",     &GridWorldEnv::step_budget)
        .def("set_step_budget", &GridWorldEnv::set_step_budget, py::arg("max_steps"))
        .def("render",          [](const GridWorldEnv& e) { return render_grid(e); });

    // =========================================================================
    // Q-table + agents
    // =========================================================================
    py::class_<Rng>(m, "Rng", "std::mt19937 passed to select_action / learn")
        .def(py::init<Rng::result_type>(), py::arg("seed") = Rng::default_seed)
        .def("seed",     [](Rng& r, Rng::result_type seed) { r.seed(seed); }, py::arg("seed"))
        .def("__call__", [](Rng& r) { return r(); });

    py::class_<QTable>(m, "QTable")
        .def(py::init<double>(), py::arg("initial_value") = 0.0)
        .def("value",        &QTable::value, py::arg("state"), py::arg("action"))
        .def("update",       &QTable::update, py::arg("state"), py::arg("action"), py::arg("value"))
        .def("best_actions", &QTable::best_actions, py::arg("state"))
        .def("max_value",    &QTable::max_value, py::arg("state"))
        .def("serialize",    &QTable::serialize)
        .def("deserialize",  &QTable::deserialize, py::arg("json"))
        .def("save",         &QTable::save, py::arg("path"))
        .def("load",         &QTable::load, py::arg("path"))
        .def("__len__",      &QTable::size);

    py::enum_<DecayMode>(m, "DecayMode")
        .value("MULTIPLICATIVE", DecayMode::MULTIPLICATIVE)
        .value("LINEAR",         DecayMode::LINEAR);

    py::class_<AgentConfig>(m, "AgentConfig")
        .def(py::init<>())
        .def_readwrite("learning_rate",     &AgentConfig::learning_rate)
        .def_readwrite("discount_rate",     &AgentConfig::discount_rate)
        .def_readwrite("exploration_rate",  &AgentConfig::exploration_rate)
        .def_readwrite("exploration_min",   &AgentConfig::exploration_min)
        .def_readwrite("exploration_decay", &AgentConfig::exploration_decay)
        .def_readwrite("decay_mode",        &AgentConfig::decay_mode)
        .def_readwrite("decay_step",        &AgentConfig::decay_step)
        .def_readwrite("initial_q",         &AgentConfig::initial_q);

    py::class_<LearnResult>(m, "LearnResult")
        .def_readonly("td_error",  &LearnResult::td_error)
        .def_readonly("old_value", &LearnResult::old_value)
        .def_readonly("new_value", &LearnResult::new_value)
        .def_readonly("target",    &LearnResult::target);

    py::class_<Agent>(m, "Agent", "Tabular agent interface")
        .def("select_action",     &Agent::select_action, py::arg("state"), py::arg("rng"))
        .def("learn",             &Agent::learn, py::arg("transition"), py::arg("rng"))
        .def("decay_exploration", &Agent::decay_exploration)
        .def("exploration_rate",  &Agent::exploration_rate)
        .def("name",              &Agent::name)
        .def("q_table",           static_cast<QTable& (Agent::*)()>(&Agent::q_table),
             py::return_value_policy::reference_internal);

    // learn is redefined here, so the Transition overload is repeated to stay visible.
    py::class_<QLearningAgent, Agent>(m, "QLearningAgent")
        .def(py::init<const AgentConfig&>(), py::arg("config") = AgentConfig{})
        .def("learn", static_cast<LearnResult (QLearningAgent::*)(const Transition&, Rng&)>(
                 &QLearningAgent::learn),
             py::arg("transition"), py::arg("rng"))
        .def("learn", static_cast<LearnResult (QLearningAgent::*)(
                 const Coordinate&, Action, double, const Coordinate&, bool)>(&QLearningAgent::learn),
             py::arg("state"), py::arg("action"), py::arg("reward"),
             py::arg("next_state"), py::arg("done"));

    py::class_<SarsaAgent, Agent>(m, "SarsaAgent")
        .def(py::init<const AgentConfig&>(), py::arg("config") = AgentConfig{});

    py::class_<ExpectedSarsaAgent, Agent>(m, "ExpectedSarsaAgent")
        .def(py::init<const AgentConfig&>(), py::arg("config") = AgentConfig{})
        .def("expected_value", &ExpectedSarsaAgent::expected_value, py::arg("state"));

    m.def("make_agent", &make_agent, py::arg("name"), py::arg("config") = AgentConfig{});
    m.def("agent_names", &agent_names);

    m.def("render_policy", &render_policy, py::arg("layout"), py::arg("table"));

    // =========================================================================
    // Training
    // =========================================================================
    py::class_<EpisodeSummary>(m, "EpisodeSummary")
        .def_readonly("episode",          &EpisodeSummary::episode)
        .def_readonly("total_reward",     &EpisodeSummary::total_reward)
        .def_readonly("steps",            &EpisodeSummary::steps)
        .def_readonly("termination",      &EpisodeSummary::termination)
        .def_readonly("coins_collected",  &EpisodeSummary::coins_collected)
        .def_readonly("exploration_rate", &EpisodeSummary::exploration_rate);

    py::class_<TrainingStats>(m, "TrainingStats")
        .def_readonly("episodes",    &TrainingStats::episodes)
        .def_readonly("goal_count",  &TrainingStats::goal_count)
        .def_readonly("loss_count",  &TrainingStats::loss_count)
        .def_readonly("truncated",   &TrainingStats::truncated)
        .def_readonly("mean_reward", &TrainingStats::mean_reward)
        .def_readonly("best_reward", &TrainingStats::best_reward)
        .def_readonly("mean_steps",  &TrainingStats::mean_steps);

    m.def("train", &train, "Run a training session with a seeded generator",
          py::arg("env"), py::arg("agent"), py::arg("episodes"),
          py::arg("max_steps") = 100, py::arg("seed") = 42,
          py::arg("on_episode") = ProgressCallback{});
    m.def("summarize", &summarize, py::arg("summaries"));

    py::class_<ParallelConfig>(m, "ParallelConfig")
        .def(py::init<>())
        .def_readwrite("n_workers",           &ParallelConfig::n_workers)
        .def_readwrite("episodes_per_worker", &ParallelConfig::episodes_per_worker)
        .def_readwrite("max_steps",           &ParallelConfig::max_steps)
        .def_readwrite("base_seed",           &ParallelConfig::base_seed)
        .def_readwrite("agent_name",          &ParallelConfig::agent_name)
        .def_readwrite("agent_config",        &ParallelConfig::agent_config)
        .def_property("initial_table",
            [](const ParallelConfig& c) { return c.initial_table.get(); },
            [](ParallelConfig& c, const QTable* t) {
                c.initial_table = t ? std::make_shared<const QTable>(*t) : nullptr;
            }, py::return_value_policy::reference_internal);

    py::class_<ParallelResult>(m, "ParallelResult")
        .def_readonly("worker_summaries", &ParallelResult::worker_summaries)
        .def_readonly("worker_tables",    &ParallelResult::worker_tables)
        .def_readonly("merged",           &ParallelResult::merged);

    py::class_<ParallelTrainer>(m, "ParallelTrainer")
        .def(py::init([](const GridLayoutConfig& layout, const ParallelConfig& cfg) {
            return std::make_unique<ParallelTrainer>(
                std::make_shared<const GridLayout>(layout), cfg);
        }), py::arg("layout") = GridLayoutConfig{}, py::arg("config") = ParallelConfig{})
        .def("run", &ParallelTrainer::run, py::call_guard<py::gil_scoped_release>());

    m.def("version", []() { return "0.1.0"; });
}
