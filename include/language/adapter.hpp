#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "sandbox/enforcer.hpp"
#include "sandbox/resource_limits.hpp"

namespace grader {

/**
 * @brief 一次编译的结果，每个提交只会产生一个
 * 没有编译步骤的语言的编译结果总是成功的
 */
struct compile_result {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    double compile_time_ms = 0;
};

/**
 * @brief 语言适配器
 * 适配器只决定要运行什么命令（编译命令、运行命令、环境变量），
 * 进程的资源限制和超时终止全部交给 resource_limit_enforcer。
 */
class language_adapter {
public:
    virtual ~language_adapter() = default;

    /**
     * @brief 语言的标准名称，如 "cpp"
     */
    virtual std::string name() const = 0;

    /**
     * @brief 选手代码在工作目录中的文件名，如 "main.cpp"
     */
    virtual std::string entry_file() const = 0;

    /**
     * @brief 编译工作目录中的选手代码
     * 入口文件不存在时直接返回失败，不会启动任何进程。
     * 编译使用独立的时间限制 COMPILE_TIME_LIMIT_MS，与测试点的时间限制无关。
     * @param workdir 提交的工作目录
     * @throw internal_error 编译器或解释器不存在
     */
    virtual compile_result compile(const std::filesystem::path &workdir) const;

    /**
     * @brief 在资源限制下运行编译好的选手程序
     * @param workdir 提交的工作目录
     * @param stdin_file 标准输入文件
     * @param stdout_file 标准输出文件，标准错误输出写入同名的 .err 文件
     * @param limits 本次运行的资源限制
     */
    virtual run_result run(const std::filesystem::path &workdir,
                           const std::filesystem::path &stdin_file,
                           const std::filesystem::path &stdout_file,
                           const resource_limits &limits) const;

    /**
     * @brief 选手代码的初始模板
     */
    virtual std::string template_content() const = 0;

    /**
     * @brief 检查工作目录中的选手代码是否具有基本结构，如包含头文件和 main 函数
     */
    virtual bool validate_solution(const std::filesystem::path &workdir) const = 0;

    /**
     * @brief 本语言的默认资源限制
     */
    const resource_limits &default_limits() const;

    void set_default_limits(const resource_limits &limits);

    /**
     * @brief 覆盖运行时（解释器、虚拟机或者编译产物之外的运行程序）的可执行文件
     */
    void set_executable(const std::string &executable);

    /**
     * @brief 覆盖编译器的可执行文件
     */
    void set_compiler(const std::string &compiler);

protected:
    language_adapter(const resource_limits &limits, const std::string &executable, const std::string &compiler);

    /**
     * @brief 编译命令，返回空列表表示本语言没有编译步骤
     */
    virtual std::vector<std::string> compile_command() const = 0;

    /**
     * @brief 运行命令
     * @param limits 本次运行的资源限制，用于设置运行时的堆大小等参数
     */
    virtual std::vector<std::string> run_command(const resource_limits &limits) const = 0;

    /**
     * @brief 编译和运行时的额外环境变量
     */
    virtual std::map<std::string, std::string> environment(const std::filesystem::path &workdir) const;

    /**
     * @brief 托管运行时在堆之外需要的虚拟地址空间（MB）
     */
    virtual int64_t address_space_reserve_mb() const;

    /**
     * @brief 读取入口文件的内容，文件不存在时返回空串
     */
    std::string read_entry(const std::filesystem::path &workdir) const;

    resource_limits limits;
    std::string executable;
    std::string compiler;
    resource_limit_enforcer enforcer;
};

/**
 * @brief 编译器使用的资源限制
 */
resource_limits compile_limits();

/**
 * @brief 只包含空白字符
 */
bool is_blank(const std::string &content);

}  // namespace grader
