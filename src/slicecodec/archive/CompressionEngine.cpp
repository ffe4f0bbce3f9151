#include "CompressionEngine.hpp"
#include "StoredEngine.hpp"
#include "ZlibEngine.hpp"

#include <algorithm>
#include <cctype>

namespace slicecodec {
namespace archive {

using core::ErrorCode;
using core::makeError;
using core::makeExpected;

Result<std::unique_ptr<CompressionEngine>> CompressionEngine::create(Backend backend, int compression_level) {
    std::unique_ptr<CompressionEngine> engine;
    switch (backend) {
        case Backend::NONE:
            engine = std::make_unique<StoredEngine>();
            break;
        case Backend::GZIP: {
            auto zlib_engine = std::make_unique<ZlibEngine>(compression_level);
            auto init = zlib_engine->initialize();
            if (!init) {
                return init.error();
            }
            engine = std::move(zlib_engine);
            break;
        }
        default:
            return makeError(ErrorCode::UnknownCompression, "Unknown compression backend");
    }
    return makeExpected(std::move(engine));
}

Result<std::unique_ptr<DecompressionEngine>> DecompressionEngine::create(CompressionEngine::Backend backend) {
    std::unique_ptr<DecompressionEngine> engine;
    switch (backend) {
        case CompressionEngine::Backend::NONE:
            engine = std::make_unique<StoredDecompressor>();
            break;
        case CompressionEngine::Backend::GZIP: {
            auto zlib_engine = std::make_unique<ZlibDecompressor>();
            auto init = zlib_engine->initialize();
            if (!init) {
                return init.error();
            }
            engine = std::move(zlib_engine);
            break;
        }
        default:
            return makeError(ErrorCode::UnknownCompression, "Unknown compression backend");
    }
    return makeExpected(std::move(engine));
}

std::vector<CompressionEngine::Backend> CompressionEngine::getAvailableBackends() {
    return {Backend::NONE, Backend::GZIP};
}

std::string CompressionEngine::backendToString(Backend backend) {
    switch (backend) {
        case Backend::NONE:
            return "none";
        case Backend::GZIP:
            return "gzip";
        default:
            return "unknown";
    }
}

Result<CompressionEngine::Backend> CompressionEngine::stringToBackend(const std::string& name) {
    std::string lower_name = name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_name == "none") {
        return makeExpected(Backend::NONE);
    } else if (lower_name == "gzip") {
        return makeExpected(Backend::GZIP);
    } else {
        return makeError(ErrorCode::UnknownCompression, "Unknown compression name: " + name);
    }
}

}} // namespace slicecodec::archive
