#include "slicecodec/SliceCodec.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <iostream>

namespace slicecodec {

bool initialize(const std::string& log_file_path, Logger::Level level, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, level, enable_console);
        SLICECODEC_LOG_INFO("SliceCodec {} initialized", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统不可用，只能输出到标准错误
        std::cerr << "Failed to initialize SliceCodec: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    SLICECODEC_LOG_INFO("SliceCodec cleanup completed");
    Logger::getInstance().shutdown();
}

} // namespace slicecodec
