#include "engine/grid_layout.h"
#include "core/errors.h"
#include <algorithm>

namespace gridq {

namespace {

std::vector<Coordinate> unique_sorted(std::vector<Coordinate> v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
    return v;
}

} // namespace

const char* cell_kind_name(CellKind kind) {
    switch (kind) {
        case CellKind::EMPTY:        return "empty";
        case CellKind::WALL:         return "wall";
        case CellKind::GOAL:         return "goal";
        case CellKind::LOSS:         return "loss";
        case CellKind::COIN:         return "coin";
        case CellKind::PORTAL_ENTRY: return "portal entry";
        case CellKind::PORTAL_EXIT:  return "portal exit";
    }
    return "unknown";
}

GridLayout::GridLayout(const GridLayoutConfig& config)
    : rows_(config.rows)
    , columns_(config.columns)
    , start_(config.start)
    , wrap_map_(config.wrap_map)
    , rewards_(config.rewards)
{
    if (rows_ <= 0 || columns_ <= 0) {
        throw ConfigurationError("Grid dimensions must be positive, got " +
                                 std::to_string(rows_) + "x" + std::to_string(columns_));
    }
    goal_ = config.goal ? *config.goal : Coordinate{rows_ - 1, columns_ - 1};
    cells_.assign(static_cast<size_t>(rows_) * static_cast<size_t>(columns_), CellKind::EMPTY);
    validate_and_place(config);
}

void GridLayout::place(const Coordinate& c, CellKind kind, const char* feature) {
    if (!in_bounds(c)) {
        throw ConfigurationError(std::string("Coordinate is out of bounds for ") + feature +
                                 ": " + to_string(c) + " (grid " + std::to_string(rows_) +
                                 "x" + std::to_string(columns_) + ")");
    }
    if (c == start_) {
        throw ConfigurationError(std::string("Start ") + to_string(c) +
                                 " overlaps " + feature);
    }
    CellKind& cell = cells_[index(c)];
    if (cell != CellKind::EMPTY) {
        throw ConfigurationError(std::string("Intersecting coordinates for ") + feature +
                                 " at " + to_string(c) + " (already " +
                                 cell_kind_name(cell) + ")");
    }
    cell = kind;
}

void GridLayout::validate_and_place(const GridLayoutConfig& config) {
    if (!in_bounds(start_)) {
        throw ConfigurationError("Coordinate is out of bounds for start: " + to_string(start_));
    }

    place(goal_, CellKind::GOAL, "goal");

    loss_ = unique_sorted(config.loss);
    for (const auto& c : loss_) place(c, CellKind::LOSS, "loss");

    walls_ = unique_sorted(config.walls);
    for (const auto& c : walls_) place(c, CellKind::WALL, "wall");

    coins_ = unique_sorted(config.coins);
    for (const auto& c : coins_) place(c, CellKind::COIN, "coin");

    // Entries first, then exits: an exit landing on any entry is an overlap.
    for (const auto& p : config.portals) place(p.entry, CellKind::PORTAL_ENTRY, "portal entry");
    for (const auto& p : config.portals) {
        if (p.entry == p.exit) {
            throw ConfigurationError("Portal entry and exit coincide at " + to_string(p.entry));
        }
        place(p.exit, CellKind::PORTAL_EXIT, "portal exit");
        portal_map_.emplace(p.entry, p.exit);
    }
    portals_ = config.portals;
}

CellKind GridLayout::kind(const Coordinate& c) const {
    if (!in_bounds(c)) return CellKind::WALL;
    return cells_[index(c)];
}

std::optional<Coordinate> GridLayout::portal_exit(const Coordinate& c) const {
    auto it = portal_map_.find(c);
    if (it == portal_map_.end()) return std::nullopt;
    return it->second;
}

} // namespace gridq
