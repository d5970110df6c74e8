#include "engine/grid_render.h"
#include "learning/q_table.h"
#include <functional>
#include <iomanip>
#include <sstream>

namespace gridq {

namespace {

constexpr int kGutter = 4;   // width of the row-index column

void border(std::ostringstream& ss, int columns,
            const char* left, const char* mid, const char* right) {
    ss << std::string(kGutter, ' ') << left;
    for (int c = 0; c < columns; ++c) {
        ss << "───" << (c + 1 < columns ? mid : right);
    }
    ss << '\n';
}

std::string boxed(const GridLayout& layout,
                  const std::function<const char*(const Coordinate&)>& glyph) {
    std::ostringstream ss;
    int rows = layout.rows();
    int cols = layout.columns();

    border(ss, cols, "┌", "┬", "┐");
    for (int r = 0; r < rows; ++r) {
        ss << std::setw(kGutter - 1) << r << " │";
        for (int c = 0; c < cols; ++c) {
            ss << ' ' << glyph({r, c}) << " │";
        }
        ss << '\n';
        if (r + 1 < rows) {
            border(ss, cols, "├", "┼", "┤");
        }
    }
    border(ss, cols, "└", "┴", "┘");

    ss << std::string(kGutter, ' ');
    for (int c = 0; c < cols; ++c) {
        ss << std::setw(3) << c << ' ';
    }
    ss << '\n';
    return ss.str();
}

const char* static_glyph(CellKind kind) {
    switch (kind) {
        case CellKind::WALL:         return "╳";
        case CellKind::GOAL:         return "◉";
        case CellKind::LOSS:         return "◎";
        case CellKind::COIN:         return "$";
        case CellKind::PORTAL_ENTRY: return "░";
        case CellKind::PORTAL_EXIT:
        case CellKind::EMPTY:        return " ";
    }
    return " ";
}

const char* arrow(Action a) {
    switch (a) {
        case Action::UP:    return "↑";
        case Action::DOWN:  return "↓";
        case Action::LEFT:  return "←";
        case Action::RIGHT: return "→";
    }
    return "·";
}

} // namespace

std::string render_grid(const GridWorldEnv& env) {
    const GridLayout& layout = env.layout();
    bool show_agent = env.episode().phase != EpisodeState::Phase::NOT_STARTED;
    return boxed(layout, [&](const Coordinate& c) -> const char* {
        if (show_agent && c == env.agent()) return "A";
        CellKind k = layout.kind(c);
        if (k == CellKind::COIN && env.coin_collected(c)) return " ";
        return static_glyph(k);
    });
}

std::string render_policy(const GridLayout& layout, const QTable& table) {
    return boxed(layout, [&](const Coordinate& c) -> const char* {
        CellKind k = layout.kind(c);
        if (k == CellKind::WALL || k == CellKind::GOAL || k == CellKind::LOSS) {
            return static_glyph(k);
        }
        auto best = table.best_actions(c);
        if (best.size() != 1) return "·";
        return arrow(best.front());
    });
}

} // namespace gridq
