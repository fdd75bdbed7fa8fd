#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "language/adapter.hpp"

namespace grader {

/**
 * @brief 语言名到适配器的映射
 * 查找时不区分大小写，一个适配器可以有多个别名（如 python、python3、py）。
 * 构造完成之后只读，可以被多个线程同时查找。
 */
class language_registry {
public:
    /**
     * @brief 注册一个适配器
     * @param adapter 适配器，其 name() 自动成为一个别名
     * @param aliases 额外的别名
     * @throw std::invalid_argument 别名已被其他适配器占用
     */
    void add(std::shared_ptr<language_adapter> adapter, const std::vector<std::string> &aliases = {});

    /**
     * @brief 按名称或别名查找适配器
     * @return 不支持的语言返回 nullptr
     */
    std::shared_ptr<language_adapter> find(const std::string &language) const;

    /**
     * @brief 所有已注册语言的标准名称，按字典序排列
     */
    std::vector<std::string> languages() const;

    /**
     * @brief 根据配置文件的 languages 一节修改适配器，如
     * { "cpp": { "compiler": "g++-12", "limits": { "memory_mb": 512 } } }
     * @throw std::invalid_argument 语言不存在或者配置项不合法
     */
    void configure(const nlohmann::json &languages);

    /**
     * @brief 包含 Python、C++、C、JavaScript、Java 五种语言的注册表
     */
    static language_registry with_defaults();

private:
    std::map<std::string, std::shared_ptr<language_adapter>> adapters;
};

}  // namespace grader
