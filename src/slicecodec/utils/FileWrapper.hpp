/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器，提供异常安全的文件管理
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace slicecodec {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 *
 * 所有失败都以 core::FileException 抛出，析构时自动关闭文件句柄。
 * 需要确认关闭成功（写入端）时应显式调用 close()。
 */
class FileWrapper {
public:
    /**
     * @brief 构造函数，打开文件
     * @param filename 文件名
     * @param mode 文件打开模式（"rb" / "wb" / "ab"）
     * @throws FileException 文件打开失败时
     */
    FileWrapper(const std::string& filename, const char* mode);

    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;

    // 禁用拷贝构造和拷贝赋值
    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    FILE* get() const noexcept {
        return file_.get();
    }

    explicit operator bool() const noexcept {
        return file_ != nullptr;
    }

    const std::string& path() const noexcept { return path_; }

    /**
     * @brief 读取最多 size 字节
     * @return 实际读取的字节数，0 表示文件结束
     * @throws FileException 读取出错时
     */
    size_t read(void* buffer, size_t size);

    /**
     * @brief 完整写入 size 字节
     * @throws FileException 写入不完整时
     */
    void write(const void* data, size_t size);

    /**
     * @brief 定位到文件开头起的绝对偏移
     * @throws FileException 定位失败时
     */
    void seek(uint64_t offset);

    /**
     * @brief 刷新文件缓冲区
     * @throws FileException 刷新失败时
     */
    void flush();

    /**
     * @brief 关闭文件并检查结果，重复调用无副作用
     * @throws FileException fclose 失败时（缓冲数据可能丢失）
     */
    void close();

    /**
     * @brief 放弃写入：关闭句柄并删除目标（仅普通文件），失败只记录日志
     *
     * 写入失败后使用，避免留下看似完整的半截文件。
     */
    void discard();

private:
    std::string path_;
    std::unique_ptr<FILE, int(*)(FILE*)> file_{nullptr, &std::fclose};
};

} // namespace utils
} // namespace slicecodec
