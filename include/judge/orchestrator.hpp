#pragma once

#include <filesystem>
#include <string>
#include "judge/report.hpp"
#include "judge/submission.hpp"
#include "language/registry.hpp"

namespace grader {

/**
 * @brief 语法检查的结果
 */
struct syntax_check {
    bool valid = false;

    /**
     * @brief 编译器的错误信息，通过时为 "Syntax OK"
     */
    std::string message;

    /**
     * @brief 选手代码是否具有语言要求的基本结构（如 main 函数）
     */
    bool structure_ok = false;
};

void to_json(nlohmann::json &j, const syntax_check &check);

/**
 * @brief 评测一个提交的完整流程
 * 1. 查找语言适配器，不支持的语言直接返回 IE
 * 2. 创建独占的临时目录，将选手代码写入适配器要求的入口文件
 * 3. 编译一次，编译失败返回 CE，不运行任何测试点
 * 4. 若干个 worker 线程并发运行测试点，每个测试点使用独立命名的输入输出文件
 * 5. 运行结果为 OK 时使用比较器比较输出，不匹配时结果为 WA
 * 6. 按提交中测试点的顺序汇总结果
 * 7. 在任何情况下（包括异常）删除临时目录
 *
 * 不同提交之间不共享任何可变状态，同一个 orchestrator 可以被多个线程同时使用。
 */
class execution_orchestrator {
public:
    /**
     * @param registry 语言注册表，必须比 orchestrator 活得更久
     * @param workers 每个提交最多同时运行的测试点数
     */
    explicit execution_orchestrator(const language_registry &registry, size_t workers = 1);

    /**
     * @brief 评测一个提交，不会抛出异常
     * 评测系统内部的错误会被记录到日志中并作为 IE 报告。
     */
    judge_report grade(const submission &submit) const;

    /**
     * @brief 只编译选手代码，检查语法是否正确
     */
    syntax_check validate_syntax(const std::string &language, const std::string &source) const;

private:
    const language_registry &registry;
    size_t workers;

    test_case_result run_test_case(const language_adapter &adapter,
                                   const std::filesystem::path &workdir,
                                   const resource_limits &limits,
                                   const test_case &test) const;

    std::vector<test_case_result> run_test_cases(const language_adapter &adapter,
                                                 const std::filesystem::path &workdir,
                                                 const resource_limits &limits,
                                                 const std::vector<test_case> &test_cases) const;
};

/**
 * @brief 所有测试点都是 IE 的报告，用于不支持的语言和评测开始前的内部错误
 */
judge_report internal_error_report(const submission &submit, const std::string &message);

}  // namespace grader
