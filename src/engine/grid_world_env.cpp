#include "engine/grid_world_env.h"
#include "core/errors.h"

namespace gridq {

const char* termination_name(Termination t) {
    switch (t) {
        case Termination::NONE:      return "none";
        case Termination::GOAL:      return "goal";
        case Termination::LOSS:      return "loss";
        case Termination::TRUNCATED: return "truncated";
    }
    return "unknown";
}

const char* step_event_name(StepEvent e) {
    switch (e) {
        case StepEvent::MOVED:             return "moved";
        case StepEvent::COLLIDED_BOUNDARY: return "collided with boundary";
        case StepEvent::COLLIDED_WALL:     return "collided with wall";
        case StepEvent::ENTERED_PORTAL:    return "entered portal";
        case StepEvent::COLLECTED_COIN:    return "collected a coin";
        case StepEvent::REACHED_GOAL:      return "reached goal";
        case StepEvent::REACHED_LOSS:      return "reached loss";
    }
    return "unknown";
}

GridWorldEnv::GridWorldEnv(std::shared_ptr<const GridLayout> layout, uint32_t max_steps)
    : layout_(std::move(layout))
    , max_steps_(max_steps)
{
    if (!layout_) {
        throw ConfigurationError("GridWorldEnv requires a layout");
    }
}

GridWorldEnv::GridWorldEnv(const GridLayoutConfig& config, uint32_t max_steps)
    : GridWorldEnv(std::make_shared<const GridLayout>(config), max_steps)
{}

// --- Lifecycle ---

Coordinate GridWorldEnv::reset() {
    EpisodeState fresh;
    fresh.agent = layout_->start();
    fresh.collected.assign(layout_->num_cells(), false);
    fresh.visits.assign(layout_->num_cells(), 0);
    fresh.visits[layout_->index(fresh.agent)] = 1;
    fresh.phase = EpisodeState::Phase::RUNNING;
    state_ = std::move(fresh);
    return state_.agent;
}

// --- Motor ---

bool GridWorldEnv::resolve_move(const Coordinate& from, Action action, Coordinate& to,
                                StepEvent& blocked_event) const {
    Coordinate d = displacement(action);
    Coordinate c{from.row + d.row, from.column + d.column};

    if (!layout_->in_bounds(c)) {
        if (!layout_->wrap_map()) {
            blocked_event = StepEvent::COLLIDED_BOUNDARY;
            return false;
        }
        int rows = layout_->rows();
        int cols = layout_->columns();
        c.row    = ((c.row % rows) + rows) % rows;
        c.column = ((c.column % cols) + cols) % cols;
    }

    if (layout_->kind(c) == CellKind::WALL) {
        blocked_event = StepEvent::COLLIDED_WALL;
        return false;
    }

    to = c;
    return true;
}

StepResult GridWorldEnv::step(Action action) {
    if (state_.phase == EpisodeState::Phase::NOT_STARTED) {
        throw InvalidStateError("step() called before reset()");
    }
    if (state_.phase == EpisodeState::Phase::FINISHED) {
        throw InvalidStateError(std::string("step() called after episode ended (") +
                                termination_name(state_.termination) +
                                ") without reset()");
    }

    const RewardConfig& rw = layout_->rewards();
    StepResult result;
    state_.step_count++;

    Coordinate target;
    StepEvent blocked_event = StepEvent::MOVED;
    if (!resolve_move(state_.agent, action, target, blocked_event)) {
        // Rejected: stay in place. The agent never stands on a terminal
        // cell while the episode is running, so no terminal check here.
        result.info.blocked = true;
        result.info.event = blocked_event;
        result.reward = (rw.charge_step_cost_on_collision ? rw.step_cost : 0.0)
                      + rw.collision_penalty;
    } else {
        if (auto exit = layout_->portal_exit(target)) {
            target = *exit;
            result.info.teleported = true;
            result.info.event = StepEvent::ENTERED_PORTAL;
        }
        state_.agent = target;

        result.reward = rw.step_cost;
        size_t cell = layout_->index(target);
        switch (layout_->kind(target)) {
            case CellKind::LOSS:
                result.reward += rw.loss_penalty;
                result.info.event = StepEvent::REACHED_LOSS;
                result.info.termination = Termination::LOSS;
                break;
            case CellKind::GOAL:
                result.reward += rw.goal_reward;
                result.info.event = StepEvent::REACHED_GOAL;
                result.info.termination = Termination::GOAL;
                break;
            case CellKind::COIN:
                if (!state_.collected[cell]) {
                    state_.collected[cell] = true;
                    result.reward += rw.coin_reward;
                    result.info.coin_collected = true;
                    result.info.event = StepEvent::COLLECTED_COIN;
                }
                break;
            default:
                break;
        }
    }
    state_.visits[layout_->index(state_.agent)]++;

    if (result.info.termination == Termination::NONE &&
        max_steps_ > 0 && state_.step_count >= max_steps_) {
        result.info.termination = Termination::TRUNCATED;
    }

    result.done = result.info.termination != Termination::NONE;
    if (result.done) {
        state_.phase = EpisodeState::Phase::FINISHED;
        state_.termination = result.info.termination;
    }

    result.state = state_.agent;
    result.info.step = state_.step_count;
    return result;
}

// --- Statistics ---

bool GridWorldEnv::coin_collected(const Coordinate& c) const {
    if (!layout_->in_bounds(c) || state_.collected.empty()) return false;
    return state_.collected[layout_->index(c)];
}

size_t GridWorldEnv::coins_collected() const {
    size_t n = 0;
    for (bool b : state_.collected) {
        if (b) n++;
    }
    return n;
}

uint32_t GridWorldEnv::visit_count(const Coordinate& c) const {
    if (!layout_->in_bounds(c) || state_.visits.empty()) return 0;
    return state_.visits[layout_->index(c)];
}

} // namespace gridq
