#include "learning/agent.h"

namespace gridq {

LearnResult apply_td_update(QTable& table, const Coordinate& state, Action action,
                            double target, double learning_rate) {
    LearnResult r;
    r.target    = target;
    r.old_value = table.value(state, action);
    r.td_error  = target - r.old_value;
    r.new_value = r.old_value + learning_rate * r.td_error;
    table.update(state, action, r.new_value);
    return r;
}

} // namespace gridq
