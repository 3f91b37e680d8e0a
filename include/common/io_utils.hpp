#pragma once

#include <filesystem>
#include <string>

namespace coderun {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将文本写入文件，覆盖已有内容
 * @param path 文件路径
 * @param content 写入的内容
 * @param perms 写入后设置的文件权限
 */
void write_file_content(const std::filesystem::path &path, const std::string &content, std::filesystem::perms perms);

/**
 * @brief 读取请求内容，path 为 "-" 时从 stdin 读取
 */
std::string read_input(const std::string &path);

/**
 * @brief 在 parent 下创建一个名字随机的私有文件夹
 * @param parent 父文件夹，不存在时会被创建
 * @param prefix 文件夹名前缀
 * @return 新创建的文件夹路径
 */
std::filesystem::path make_unique_directory(const std::filesystem::path &parent, const std::string &prefix);

/**
 * @brief 持有一个临时文件夹，析构时递归删除
 */
struct scoped_directory {
    scoped_directory();
    explicit scoped_directory(const std::filesystem::path &path);
    scoped_directory(scoped_directory &&other) noexcept;
    scoped_directory(const scoped_directory &) = delete;
    ~scoped_directory();

    scoped_directory &operator=(scoped_directory &&other) noexcept;

    const std::filesystem::path &path() const;

    void release();

private:
    std::filesystem::path dir;
};

}  // namespace coderun
