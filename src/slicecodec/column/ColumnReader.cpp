#include "slicecodec/column/ColumnReader.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace slicecodec {
namespace column {

ColumnReader::ColumnReader(const std::string& path, codec::ColumnType type, ReaderOptions options)
    : path_(path)
    , options_(std::move(options))
    , codec_(codec::TypeCodec::create(type)) {
    options_.validate();
    auto backend = archive::CompressionEngine::stringToBackend(options_.compression);
    if (!backend) {
        SLICECODEC_THROW_PARAM(backend.error().message, "compression");
    }
    stream_ = std::make_unique<stream::BlockReader>(path_, backend.value(), options_.seek);
    if (options_.callback && options_.callback_interval > 0) {
        next_callback_at_ = options_.callback_interval;
    }
    COLUMN_DEBUG("Opened {} reader {}", codec_->name(), path_);
}

bool ColumnReader::isTerminal() const noexcept {
    return state_ == State::Exhausted || state_ == State::StoppedByCallback ||
           state_ == State::Aborted || state_ == State::Closed;
}

bool ColumnReader::runCallback() {
    if (next_callback_at_ <= 0 || yielded_ < next_callback_at_) {
        return true;
    }
    next_callback_at_ += options_.callback_interval;
    CallbackAction action = CallbackAction::Continue;
    try {
        action = options_.callback(yielded_ + options_.callback_offset);
    } catch (...) {
        state_ = State::Aborted;
        throw;
    }
    if (action == CallbackAction::Stop) {
        state_ = State::StoppedByCallback;
        COLUMN_DEBUG("Reader {} stopped by callback after {} values", path_, yielded_);
        return false;
    }
    return true;
}

std::optional<core::Value> ColumnReader::next() {
    if (isTerminal()) {
        return std::nullopt;
    }
    state_ = State::Iterating;

    while (true) {
        if (!runCallback()) {
            return std::nullopt;
        }
        if (options_.want_count >= 0 && yielded_ >= options_.want_count) {
            state_ = State::Exhausted;
            return std::nullopt;
        }

        std::optional<core::Value> value;
        try {
            value = codec_->decode(*stream_);
        } catch (const core::FileException& e) {
            state_ = State::Aborted;
            COLUMN_ERROR("Reading {} failed after {} values: {}", path_, yielded_, e.what());
            throw;
        }
        if (!value) {
            state_ = State::Exhausted;
            return std::nullopt;
        }

        if (options_.hashfilter) {
            bool is_none = core::isNone(*value);
            uint64_t hash = is_none ? 0 : codec_->hashCanonical(*value);
            if (!options_.hashfilter->keeps(hash, is_none)) {
                continue;
            }
        }

        ++yielded_;
        return value;
    }
}

std::vector<core::Value> ColumnReader::readAll() {
    std::vector<core::Value> values;
    while (auto value = next()) {
        values.push_back(std::move(*value));
    }
    return values;
}

void ColumnReader::close() {
    if (state_ == State::Closed) {
        return;
    }
    stream_.reset();
    state_ = State::Closed;
}

const char* toString(ColumnReader::State state) noexcept {
    switch (state) {
        case ColumnReader::State::Opened: return "Opened";
        case ColumnReader::State::Iterating: return "Iterating";
        case ColumnReader::State::Exhausted: return "Exhausted";
        case ColumnReader::State::StoppedByCallback: return "StoppedByCallback";
        case ColumnReader::State::Aborted: return "Aborted";
        case ColumnReader::State::Closed: return "Closed";
    }
    return "Unknown";
}

}} // namespace slicecodec::column
