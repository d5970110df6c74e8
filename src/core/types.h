#pragma once
/**
 * Layer 0: 基础类型定义
 *
 * 格子世界最底层的值类型, 不依赖任何其他模块:
 *   - Coordinate : (row, column) 格子坐标
 *   - Action     : 四个单位位移
 *   - Rng        : 显式传递的随机源 (训练可复现)
 */

#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <random>
#include <string>

namespace gridq {

// =============================================================================
// 坐标
// =============================================================================

struct Coordinate {
    int row    = 0;
    int column = 0;

    bool operator==(const Coordinate& o) const { return row == o.row && column == o.column; }
    bool operator!=(const Coordinate& o) const { return !(*this == o); }
    bool operator<(const Coordinate& o) const {
        return row < o.row || (row == o.row && column < o.column);
    }
};

struct CoordinateHash {
    size_t operator()(const Coordinate& c) const {
        uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(c.row)) << 32)
                     | static_cast<uint32_t>(c.column);
        return std::hash<uint64_t>{}(key);
    }
};

/** "(r, c)" */
std::string to_string(const Coordinate& c);

// =============================================================================
// 动作
// =============================================================================

enum class Action : uint8_t {
    UP    = 0,
    DOWN  = 1,
    LEFT  = 2,
    RIGHT = 3
};

constexpr size_t kNumActions = 4;

constexpr std::array<Action, kNumActions> kAllActions = {
    Action::UP, Action::DOWN, Action::LEFT, Action::RIGHT
};

inline size_t action_index(Action a) { return static_cast<size_t>(a); }

/** Unit displacement (d_row, d_col). UP decreases the row index. */
inline Coordinate displacement(Action a) {
    switch (a) {
        case Action::UP:    return {-1,  0};
        case Action::DOWN:  return { 1,  0};
        case Action::LEFT:  return { 0, -1};
        case Action::RIGHT: return { 0,  1};
    }
    return {0, 0};
}

const char* action_name(Action a);

/** Parses "UP"/"DOWN"/"LEFT"/"RIGHT". Returns false on unknown names. */
bool parse_action(const std::string& name, Action& out);

// =============================================================================
// 随机源
// =============================================================================

using Rng = std::mt19937;

} // namespace gridq
