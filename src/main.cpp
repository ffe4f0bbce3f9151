#include "slicecodec/SliceCodec.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <fmt/format.h>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace slicecodec;

namespace {

void printUsage() {
    std::cerr <<
        "Usage:\n"
        "  slicecodec cat <type> <file> [--compression NAME] [--slice I/N[/spread]] [--count K] [--seek OFFSET]\n"
        "  slicecodec hash <type> <text>\n"
        "  slicecodec write <type> <file> [--compression NAME] [--none-support] [--default TEXT]\n"
        "Common options: --verbose (debug logging)\n";
}

struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool none_support = false;
    bool verbose = false;
};

// 解析 "--key value" 形式的选项，返回 false 表示用法错误
bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    if (argc < 2) {
        return false;
    }
    cmd.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--none-support") {
            cmd.none_support = true;
        } else if (arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            cmd.options[arg.substr(2)] = argv[++i];
        } else {
            cmd.positional.push_back(arg);
        }
    }
    return true;
}

// "I/N" 或 "I/N/spread" 转为 hashfilter 选项格式
std::string sliceToHashfilter(const std::string& slice) {
    std::string result = slice;
    for (auto& c : result) {
        if (c == '/') {
            c = ',';
        }
    }
    if (result.size() > 7 && result.compare(result.size() - 7, 7, ",spread") == 0) {
        result.replace(result.size() - 7, 7, ",1");
    }
    return result;
}

int runCat(const CommandLine& cmd) {
    if (cmd.positional.size() != 2) {
        printUsage();
        return 2;
    }
    ColumnType type = codec::columnTypeFromName(cmd.positional[0]);

    std::map<std::string, std::string> kv;
    for (const auto& [key, value] : cmd.options) {
        if (key == "compression" || key == "seek") {
            kv[key] = value;
        } else if (key == "slice") {
            kv["hashfilter"] = sliceToHashfilter(value);
        } else if (key == "count") {
            kv["want_count"] = value;
        } else {
            SLICECODEC_THROW_PARAM(fmt::format("Unknown option --{} for cat", key), key);
        }
    }

    ColumnReader reader(cmd.positional[1], type, ReaderOptions::fromKeyValues(kv));
    for (const auto& value : reader) {
        std::cout << core::describe(value) << '\n';
    }
    CLI_DEBUG("cat {}: {} values", cmd.positional[1], reader.count());
    return 0;
}

int runHash(const CommandLine& cmd) {
    if (cmd.positional.size() != 2) {
        printUsage();
        return 2;
    }
    ColumnType type = codec::columnTypeFromName(cmd.positional[0]);
    auto value = column::valueFromText(type, cmd.positional[1]);
    if (!value) {
        std::cerr << value.error().fullMessage() << '\n';
        return 1;
    }
    auto hash = ColumnWriter::hash(type, value.value());
    if (!hash) {
        std::cerr << hash.error().fullMessage() << '\n';
        return 1;
    }
    std::cout << hash.value() << '\n';
    return 0;
}

int runWrite(const CommandLine& cmd) {
    if (cmd.positional.size() != 2) {
        printUsage();
        return 2;
    }
    ColumnType type = codec::columnTypeFromName(cmd.positional[0]);

    std::map<std::string, std::string> kv;
    for (const auto& [key, value] : cmd.options) {
        if (key == "compression" || key == "default") {
            kv[key] = value;
        } else {
            SLICECODEC_THROW_PARAM(fmt::format("Unknown option --{} for write", key), key);
        }
    }
    if (cmd.none_support) {
        kv["none_support"] = "1";
    }

    ColumnWriter writer(cmd.positional[1], type, WriterOptions::fromKeyValues(kv, type));
    std::string line;
    int64_t line_number = 0;
    int64_t rejected = 0;
    while (std::getline(std::cin, line)) {
        ++line_number;
        Value value = core::None;
        if (line != "None") {
            auto parsed = column::valueFromText(type, line);
            // 无法解析的行交给写入器，由默认值决定是否替换
            value = parsed ? parsed.value() : Value(line);
        }
        auto written = writer.write(value);
        if (!written) {
            ++rejected;
            std::cerr << fmt::format("line {}: {}", line_number, written.error().fullMessage()) << '\n';
        }
    }

    ColumnStats stats = writer.finish();
    std::cout << fmt::format("type={} compression={} count={} min={} max={} rejected={}\n",
                             codec::columnTypeName(stats.type), stats.compression, stats.count,
                             core::describe(stats.min), core::describe(stats.max), rejected);
    return rejected ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage();
        return 2;
    }

    slicecodec::initialize("", cmd.verbose ? Logger::Level::DEBUG : Logger::Level::WARN, true);

    int rc = 2;
    try {
        if (cmd.command == "cat") {
            rc = runCat(cmd);
        } else if (cmd.command == "hash") {
            rc = runHash(cmd);
        } else if (cmd.command == "write") {
            rc = runWrite(cmd);
        } else {
            printUsage();
        }
    } catch (const core::ParameterException& e) {
        CLI_ERROR("{}", e.getDetailedMessage());
        std::cerr << "error: " << e.what() << '\n';
        rc = 2;
    } catch (const core::SliceCodecException& e) {
        CLI_ERROR("{}", e.getDetailedMessage());
        std::cerr << "error: " << e.what() << '\n';
        rc = 1;
    }

    slicecodec::cleanup();
    return rc;
}
