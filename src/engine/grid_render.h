#pragma once
/**
 * 文本渲染 (调试/CLI)
 *
 * render_grid: 固定宽度的方框网格, 左侧行号, 底部列号
 *
 *      ┌───┬───┬───┬───┐
 *    0 │ A │   │   │   │
 *      ├───┼───┼───┼───┤
 *    1 │   │   │ ◎ │   │
 *      ├───┼───┼───┼───┤
 *    2 │   │   │ ╳ │ ◉ │
 *      └───┴───┴───┴───┘
 *        0   1   2   3
 *
 * 字形: agent A, goal ◉, loss ◎, wall ╳, coin $, portal entry ░, 空格
 *
 * render_policy: 同样的方框, 每格显示贪心动作箭头 (并列/未学习 → ·)
 */

#include "engine/grid_world_env.h"
#include <string>

namespace gridq {

class QTable;

std::string render_grid(const GridWorldEnv& env);

std::string render_policy(const GridLayout& layout, const QTable& table);

} // namespace gridq
