#include "learning/q_table.h"
#include "core/errors.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace gridq {

QTable::QTable(double initial_value)
    : initial_value_(initial_value)
{}

double QTable::value(const Coordinate& state, Action action) const {
    auto it = entries_.find({state, action});
    if (it == entries_.end()) return initial_value_;
    return it->second.value;
}

bool QTable::contains(const Coordinate& state, Action action) const {
    return entries_.count({state, action}) > 0;
}

double QTable::max_value(const Coordinate& state) const {
    double best = value(state, kAllActions[0]);
    for (size_t i = 1; i < kNumActions; ++i) {
        best = std::max(best, value(state, kAllActions[i]));
    }
    return best;
}

std::vector<Action> QTable::best_actions(const Coordinate& state) const {
    double best = max_value(state);
    std::vector<Action> out;
    for (Action a : kAllActions) {
        if (value(state, a) == best) out.push_back(a);
    }
    return out;
}

uint64_t QTable::next_stamp() {
    if (clock_) return clock_->fetch_add(1, std::memory_order_relaxed) + 1;
    return ++local_clock_;
}

void QTable::update(const Coordinate& state, Action action, double value) {
    Entry& e = entries_[{state, action}];
    e.value = value;
    e.stamp = next_stamp();
}

// =============================================================================
// Persistence
// =============================================================================

std::string QTable::encode_key(const Coordinate& state, Action action) {
    return std::to_string(state.row) + "," + std::to_string(state.column) + ":" +
           action_name(action);
}

namespace {

// Non-negative decimal integer, digits only, within int range.
bool parse_index(const std::string& text, int& out) {
    if (text.empty() || text.size() > 10) return false;
    long long v = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9') return false;
        v = v * 10 + (ch - '0');
    }
    if (v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
}

} // namespace

bool QTable::decode_key(const std::string& key, Coordinate& state, Action& action) {
    size_t comma = key.find(',');
    size_t colon = key.find(':');
    if (comma == std::string::npos || colon == std::string::npos || comma > colon) {
        return false;
    }
    int row = 0;
    int col = 0;
    if (!parse_index(key.substr(0, comma), row)) return false;
    if (!parse_index(key.substr(comma + 1, colon - comma - 1), col)) return false;
    if (!parse_action(key.substr(colon + 1), action)) return false;
    state = {row, col};
    return true;
}

std::string QTable::serialize() const {
    // nlohmann::json objects keep keys sorted; dump() prints doubles so they read back exactly.
    nlohmann::json out = nlohmann::json::object();
    for (const auto& kv : entries_) {
        if (!std::isfinite(kv.second.value)) {
            throw SerializationError("Cannot serialize non-finite Q-value at " +
                                     encode_key(kv.first.state, kv.first.action));
        }
        out[encode_key(kv.first.state, kv.first.action)] = kv.second.value;
    }
    return out.dump(2);
}

void QTable::deserialize(const std::string& json) {
    nlohmann::json in;
    try {
        in = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("Malformed Q-table JSON: ") + e.what());
    }
    if (!in.is_object()) {
        throw SerializationError("Malformed Q-table JSON: expected an object");
    }

    EntryMap parsed;
    for (auto it = in.begin(); it != in.end(); ++it) {
        StateActionKey k;
        if (!decode_key(it.key(), k.state, k.action)) {
            throw SerializationError("Malformed Q-table JSON: invalid key '" + it.key() +
                                     "', expected \"row,col:ACTION\"");
        }
        if (!it.value().is_number()) {
            throw SerializationError("Malformed Q-table JSON: value of '" + it.key() +
                                     "' is not a number");
        }
        double v = it.value().get<double>();
        if (!std::isfinite(v)) {
            throw SerializationError("Malformed Q-table JSON: value of '" + it.key() +
                                     "' is not finite");
        }
        parsed[k] = Entry{v, 0};
    }

    entries_ = std::move(parsed);
}

void QTable::save(const std::string& path) const {
    std::string json = serialize();
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw SerializationError("Cannot open '" + path + "' for writing");
    }
    ofs << json << "\n";
    if (!ofs) {
        throw SerializationError("Failed writing Q-table to '" + path + "'");
    }
}

void QTable::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw SerializationError("Cannot open '" + path + "' for reading");
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    deserialize(ss.str());
}

// =============================================================================
// Merge
// =============================================================================

QTable QTable::merge_latest(const std::vector<const QTable*>& tables) {
    QTable merged(tables.empty() || !tables.front() ? 0.0 : tables.front()->initial_value_);
    for (const QTable* t : tables) {
        if (!t) continue;
        for (const auto& kv : t->entries_) {
            auto it = merged.entries_.find(kv.first);
            if (it == merged.entries_.end() || kv.second.stamp >= it->second.stamp) {
                merged.entries_[kv.first] = kv.second;
            }
        }
    }
    uint64_t newest = 0;
    for (const auto& kv : merged.entries_) newest = std::max(newest, kv.second.stamp);
    merged.local_clock_ = newest;
    return merged;
}

} // namespace gridq
