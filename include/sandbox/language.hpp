#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace runbox {

/**
 * @brief 表示一种编程语言在沙箱中的运行方式
 * 每种语言的镜像、源文件命名、编译运行命令都集中在这里，
 * 沙箱的其他部分不再根据语言名做分支判断。
 */
struct language_profile {
    /**
     * @brief 语言名，比如 python、javascript、java、cpp
     */
    std::string name;

    /**
     * @brief 临时容器使用的镜像
     */
    std::string image;

    /**
     * @brief 根据源代码决定单文件运行时的源文件名
     * 对于 Java，文件名必须和 public class 的类名一致
     */
    std::function<std::string(const std::string &code)> file_name;

    /**
     * @brief 生成编译并运行程序的 shell 命令
     * 对于编译型语言，编译失败时不会继续运行
     * @param workdir 容器内的工作目录
     * @param file_name 相对于 workdir 的主源文件名
     */
    std::function<std::string(const std::string &workdir, const std::string &file_name)> build_command;

    /**
     * @brief 编译产生的文件，运行结束后需要清理
     * 返回值是可以直接拼接进 shell 命令的单词（可能包含 glob），相对于 workdir
     */
    std::function<std::vector<std::string>(const std::string &file_name)> artifacts;
};

/**
 * @brief 查找 Java 源代码中的 public class 类名
 * @return 第一个 public class 的类名，没有时返回 Main
 */
std::string detect_java_class(const std::string &code);

/**
 * @brief 所有支持的语言
 * 在构造时建好，之后只读，可以被多个线程同时访问
 */
class language_table {
public:
    /**
     * @param images 覆盖默认镜像，键为语言名
     */
    explicit language_table(const std::map<std::string, std::string> &images = {});

    /**
     * @brief 根据语言名查找语言（不区分大小写，c++ 是 cpp 的别名）
     * @throw unsupported_language 若语言不被支持
     */
    const language_profile &find(const std::string &name) const;

    bool supports(const std::string &name) const;

    /**
     * @brief 所有支持的语言名（不包含别名）
     */
    std::vector<std::string> names() const;

private:
    const language_profile *lookup(const std::string &name) const;

    std::map<std::string, language_profile> profiles;
    std::map<std::string, std::string> aliases;
};

}  // namespace runbox
