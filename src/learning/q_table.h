#pragma once
/**
 * QTable — 稀疏动作价值表
 *
 * (state, action) → double, 状态即 agent 所在格子坐标。
 *   - 首次写入时才创建条目; 读取不存在的条目返回 initial_value (默认 0.0),
 *     且不修改表
 *   - 无容量上限: 规模受 |cells| × 4 约束
 *   - 每个条目带更新时间戳 (stamp), 用于多 worker 表的 "最近写入者胜出" 合并
 *
 * 持久化: JSON 对象 {"row,col:ACTION": value, ...}
 *   - 读写经 nlohmann::json; 数值按最短往返表示输出, 读回后逐位相等
 *   - 只接受严格 JSON; 键中的行列必须是非负十进制整数
 *   - "{}" 是合法的空表 (新 agent)
 */

#include "core/types.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridq {

struct StateActionKey {
    Coordinate state;
    Action     action = Action::UP;

    bool operator==(const StateActionKey& o) const {
        return state == o.state && action == o.action;
    }
};

struct StateActionKeyHash {
    size_t operator()(const StateActionKey& k) const {
        return CoordinateHash{}(k.state) * 31u + action_index(k.action);
    }
};

using UpdateClock = std::atomic<uint64_t>;

class QTable {
public:
    struct Entry {
        double   value = 0.0;
        uint64_t stamp = 0;
    };
    using EntryMap = std::unordered_map<StateActionKey, Entry, StateActionKeyHash>;

    explicit QTable(double initial_value = 0.0);

    // --- 查询 (从不修改表, 从不抛异常) ---
    double value(const Coordinate& state, Action action) const;
    bool contains(const Coordinate& state, Action action) const;

    /** Every action attaining the maximum value at state (unseen actions count at initial_value). */
    std::vector<Action> best_actions(const Coordinate& state) const;

    /** max_a value(state, a) */
    double max_value(const Coordinate& state) const;

    // --- 修改 ---
    void update(const Coordinate& state, Action action, double value);
    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    double initial_value() const { return initial_value_; }
    const EntryMap& entries() const { return entries_; }

    /**
     * Share an update clock with other tables so stamps are comparable
     * across them (required by merge_latest). nullptr reverts to the
     * table-local counter.
     */
    void set_clock(std::shared_ptr<UpdateClock> clock) { clock_ = std::move(clock); }

    // --- 持久化 ---
    std::string serialize() const;
    /** Replaces all entries with those in json. Throws SerializationError. */
    void deserialize(const std::string& json);
    void save(const std::string& path) const;
    void load(const std::string& path);

    static std::string encode_key(const Coordinate& state, Action action);
    static bool decode_key(const std::string& key, Coordinate& state, Action& action);

    /**
     * Per-key reduction: the entry with the newest stamp wins. Stamp ties
     * go to the table later in the list. The merged table takes the
     * initial value of the first table.
     */
    static QTable merge_latest(const std::vector<const QTable*>& tables);

private:
    uint64_t next_stamp();

    double initial_value_;
    EntryMap entries_;
    std::shared_ptr<UpdateClock> clock_;
    uint64_t local_clock_ = 0;
};

} // namespace gridq
