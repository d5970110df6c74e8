#pragma once
/**
 * GridLayout — 格子世界静态布局 (不可变, 跨 episode 共享)
 *
 * 内容:
 *   - rows × columns 网格, 起点, 终点 (goal)
 *   - 失败格 (loss), 墙壁, 金币, 传送门 (entry → exit, 一一对应)
 *   - 奖励表 (RewardConfig)
 *
 * 构造时校验, 违规抛 ConfigurationError:
 *   - 尺寸必须为正
 *   - 所有特征坐标在界内
 *   - start/goal/loss/wall/coin/entry/exit 两两不相交
 *     (因此传送门出口不可能是墙, 也不可能是另一个入口, 传送不会串联)
 *   - 不同入口的出口互不相同
 *
 * 行号从上到下递增: UP = row-1, DOWN = row+1。
 */

#include "core/types.h"
#include "core/coordinate_parser.h"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace gridq {

enum class CellKind : uint8_t {
    EMPTY        = 0,
    WALL         = 1,
    GOAL         = 2,
    LOSS         = 3,
    COIN         = 4,
    PORTAL_ENTRY = 5,
    PORTAL_EXIT  = 6
};

const char* cell_kind_name(CellKind kind);

struct RewardConfig {
    double step_cost         = -0.01;  // 每步都收取
    double goal_reward       =  1.0;   // 到达终点额外奖励
    double loss_penalty      = -1.0;   // 踩到失败格额外惩罚
    double coin_reward       =  0.5;   // 每个金币每 episode 至多一次
    double collision_penalty =  0.0;   // 撞墙/撞边界的额外惩罚

    // 被拒绝的移动是否仍收取 step_cost
    bool charge_step_cost_on_collision = true;
};

struct GridLayoutConfig {
    int rows    = 3;
    int columns = 4;

    Coordinate start{0, 0};
    std::optional<Coordinate> goal;   // 缺省: 右下角 (rows-1, columns-1)

    std::vector<Coordinate> loss;
    std::vector<Coordinate> walls;
    std::vector<Coordinate> coins;
    std::vector<PortalSpec> portals;

    // 越界时从对边出现 (而非撞边界)
    bool wrap_map = false;

    RewardConfig rewards;
};

class GridLayout {
public:
    explicit GridLayout(const GridLayoutConfig& config = {});

    // --- 尺寸 ---
    int rows()    const { return rows_; }
    int columns() const { return columns_; }
    size_t num_cells() const { return cells_.size(); }

    bool in_bounds(const Coordinate& c) const {
        return c.row >= 0 && c.row < rows_ && c.column >= 0 && c.column < columns_;
    }

    /** Row-major cell index. Caller guarantees in_bounds(c). */
    size_t index(const Coordinate& c) const {
        return static_cast<size_t>(c.row) * static_cast<size_t>(columns_)
             + static_cast<size_t>(c.column);
    }

    Coordinate coordinate_at(size_t index) const {
        return {static_cast<int>(index / static_cast<size_t>(columns_)),
                static_cast<int>(index % static_cast<size_t>(columns_))};
    }

    // --- 特征 ---

    /** Static kind of an in-bounds cell; out-of-bounds reads as WALL. */
    CellKind kind(const Coordinate& c) const;

    /** Exit of the portal whose entry is c, if any. */
    std::optional<Coordinate> portal_exit(const Coordinate& c) const;

    const Coordinate& start() const { return start_; }
    const Coordinate& goal()  const { return goal_; }
    const std::vector<Coordinate>& loss()  const { return loss_; }
    const std::vector<Coordinate>& walls() const { return walls_; }
    const std::vector<Coordinate>& coins() const { return coins_; }
    const std::vector<PortalSpec>& portals() const { return portals_; }

    bool wrap_map() const { return wrap_map_; }
    const RewardConfig& rewards() const { return rewards_; }

private:
    void validate_and_place(const GridLayoutConfig& config);
    void place(const Coordinate& c, CellKind kind, const char* feature);

    int rows_;
    int columns_;
    Coordinate start_;
    Coordinate goal_;
    std::vector<Coordinate> loss_;
    std::vector<Coordinate> walls_;
    std::vector<Coordinate> coins_;
    std::vector<PortalSpec> portals_;
    bool wrap_map_;
    RewardConfig rewards_;

    std::vector<CellKind> cells_;   // row-major [row * columns + column]
    std::unordered_map<Coordinate, Coordinate, CoordinateHash> portal_map_;
};

} // namespace gridq
