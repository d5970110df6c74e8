#pragma once
/**
 * 坐标字面量解析 (命令行/配置文件)
 *
 * 格式:
 *   单个坐标   "r,c"  或  "(r,c)"
 *   坐标列表   "r,c r,c ..."      (空白或 ';' 分隔, 空串 = 空列表)
 *   传送门列表 "r,c:r,c r,c:r,c"  (entry:exit)
 *
 * 任何格式错误都抛 ConfigurationError。
 */

#include "core/types.h"
#include <string>
#include <utility>
#include <vector>

namespace gridq {

struct PortalSpec {
    Coordinate entry;
    Coordinate exit;
};

Coordinate parse_coordinate(const std::string& text);

std::vector<Coordinate> parse_coordinate_list(const std::string& text);

std::vector<PortalSpec> parse_portal_list(const std::string& text);

} // namespace gridq
