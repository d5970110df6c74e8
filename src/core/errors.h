#pragma once
/**
 * 错误分类
 *
 *   ConfigurationError : 构造期参数非法 (网格尺寸/坐标越界/重叠/超参数)
 *   InvalidStateError  : 调用顺序错误 (未 reset 就 step, 或终止后继续 step)
 *   SerializationError : Q 表 JSON 格式错误或文件读写失败
 *
 * step()/learn() 内部不存在可恢复错误: 撞墙是正常结果, 查表永不失败。
 */

#include <stdexcept>
#include <string>

namespace gridq {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

class InvalidStateError : public Error {
public:
    explicit InvalidStateError(const std::string& what) : Error(what) {}
};

class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& what) : Error(what) {}
};

} // namespace gridq
