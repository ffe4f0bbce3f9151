#pragma once

#include "slicecodec/codec/ColumnType.hpp"
#include "slicecodec/core/Constants.hpp"
#include "slicecodec/core/Expected.hpp"
#include "slicecodec/core/Value.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace slicecodec {
namespace column {

/**
 * @brief 哈希切片限制
 *
 * 值属于切片 hash(value) % slices；spread_none 时 None 全部归入最后一个切片。
 */
struct HashFilter {
    uint32_t sliceno = 0;
    uint32_t slices = 1;
    bool spread_none = false;

    HashFilter() = default;
    HashFilter(uint32_t slice, uint32_t total, bool spread = false)
        : sliceno(slice), slices(total), spread_none(spread) {}

    /**
     * @brief 解析 "sliceno,slices[,spread_none]"，spread_none 为 0/1/true/false
     * @throws ParameterException 格式错误或 sliceno >= slices
     */
    static HashFilter parse(const std::string& text);

    /**
     * @throws ParameterException slices 为 0 或 sliceno >= slices
     */
    void validate() const;

    /**
     * @brief 哈希值为 hash 的值（或 None）是否属于本切片
     */
    bool keeps(uint64_t hash, bool is_none) const noexcept {
        if (is_none && spread_none) {
            return sliceno == slices - 1;
        }
        return hash % slices == sliceno;
    }
};

/**
 * @brief 读取回调的返回值
 */
enum class CallbackAction {
    Continue,
    Stop
};

/**
 * @brief 读取进度回调，参数为已产出值数 + callback_offset
 */
using ReadCallback = std::function<CallbackAction(int64_t)>;

/**
 * @brief 写入器配置，写入器生命周期内不可变
 */
struct WriterOptions {
    std::string compression = "gzip";
    int compression_level = core::Constants::kDefaultCompressionLevel;
    bool none_support = false;
    std::optional<core::Value> default_value;   // 被拒绝的值用它替换
    std::optional<HashFilter> hashfilter;
    std::string error_extra;                    // 附加到每条值错误消息末尾

    /**
     * @brief 从字符串键值对构造
     *
     * 识别 compression, compression_level, none_support, default, hashfilter, error_extra。
     * default 按列类型的 parsed: 变体解析，字面量 "None" 表示 None。
     * @throws ParameterException 未知键或非法取值
     */
    static WriterOptions fromKeyValues(const std::map<std::string, std::string>& options,
                                       codec::ColumnType type);
};

/**
 * @brief 读取器配置
 */
struct ReaderOptions {
    std::string compression = "gzip";
    std::optional<HashFilter> hashfilter;
    int64_t want_count = -1;        // -1 表示读取全部
    uint64_t seek = 0;              // 压缩流在文件中的起始偏移
    ReadCallback callback;
    int64_t callback_interval = 0;  // 0 表示不回调
    int64_t callback_offset = 0;

    /**
     * @brief 识别 compression, hashfilter, want_count, seek, callback_interval, callback_offset
     * @throws ParameterException 未知键或非法取值
     */
    static ReaderOptions fromKeyValues(const std::map<std::string, std::string>& options);

    /**
     * @throws ParameterException want_count < -1 或回调间隔为负
     */
    void validate() const;
};

/**
 * @brief 把文本转换为列类型的规范值
 *
 * 数值与时间类型使用 parsed: 变体解析，bool 接受 true/false/1/0，
 * bytes 取文本的原始字节，ascii/unicode 校验编码。
 */
core::Result<core::Value> valueFromText(codec::ColumnType type, const std::string& text);

}} // namespace slicecodec::column
