#include "slicecodec/column/ColumnWriter.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace slicecodec {
namespace column {

namespace {

archive::CompressionEngine::Backend backendFor(const std::string& compression) {
    auto backend = archive::CompressionEngine::stringToBackend(compression);
    if (!backend) {
        SLICECODEC_THROW_PARAM(backend.error().message, "compression");
    }
    return backend.value();
}

} // namespace

ColumnWriter::ColumnWriter(const std::string& path, codec::ColumnType type, WriterOptions options)
    : path_(path)
    , options_(std::move(options))
    , codec_(codec::TypeCodec::create(type)) {
    auto backend = backendFor(options_.compression);
    if (options_.hashfilter) {
        options_.hashfilter->validate();
    }

    if (options_.default_value) {
        const core::Value& wanted = *options_.default_value;
        if (core::isNone(wanted)) {
            if (!options_.none_support) {
                SLICECODEC_THROW_PARAM("Default None requires none_support", "default");
            }
            default_ = wanted;
        } else {
            auto converted = codec_->convert(wanted);
            if (!converted) {
                SLICECODEC_THROW_PARAM(fmt::format("Default value not accepted by {} column: {}",
                                                   codec_->name(), converted.error().message), "default");
            }
            default_ = std::move(converted).value();
        }
    }

    stream_ = std::make_unique<stream::BlockWriter>(path_, backend, options_.compression_level);
    COLUMN_DEBUG("Opened {} writer {} (none_support={}, default={})", codec_->name(), path_,
                 options_.none_support, default_ ? core::describe(*default_) : "-");
}

ColumnWriter::~ColumnWriter() {
    if (state_ != State::Open) {
        return;
    }
    try {
        finish();
    } catch (const core::SliceCodecException& e) {
        COLUMN_ERROR("Failed to finish {} during destruction: {}", path_, e.what());
    }
}

void ColumnWriter::ensureOpen(const char* operation) const {
    if (state_ == State::Failed) {
        SLICECODEC_THROW_OP(fmt::format("Writer for {} failed earlier", path_), operation);
    }
    if (state_ == State::Finished) {
        SLICECODEC_THROW_OP(fmt::format("Writer for {} is already finished", path_), operation);
    }
}

core::Error ColumnWriter::withExtra(core::Error error) const {
    if (!options_.error_extra.empty()) {
        error.message += options_.error_extra;
    }
    return error;
}

core::Result<core::Value> ColumnWriter::effectiveValue(const core::Value& value) const {
    if (core::isNone(value)) {
        if (options_.none_support) {
            return value;
        }
        if (default_) {
            return *default_;
        }
        return withExtra(core::makeError(core::ErrorCode::NoneNotAllowed,
                                         fmt::format("None not allowed in {} column", codec_->name())));
    }

    auto converted = codec_->convert(value);
    if (!converted) {
        if (default_) {
            SLICECODEC_LOG_VALUE_DEBUG("Replaced rejected value {} with default", core::describe(value));
            return *default_;
        }
        return withExtra(std::move(converted).error());
    }
    return converted;
}

bool ColumnWriter::keeps(const core::Value& effective) const {
    if (!options_.hashfilter) {
        return true;
    }
    bool is_none = core::isNone(effective);
    return options_.hashfilter->keeps(is_none ? 0 : codec_->hashCanonical(effective), is_none);
}

void ColumnWriter::updateMinMax(const core::Value& value) {
    if (!codec_->ordered() || core::isNone(value)) {
        return;
    }
    // NaN 与自身无序
    if (codec_->compare(value, value) == 2) {
        return;
    }
    if (core::isNone(min_) || codec_->compare(value, min_) < 0) {
        min_ = value;
    }
    if (core::isNone(max_) || codec_->compare(value, max_) > 0) {
        max_ = value;
    }
}

core::Result<bool> ColumnWriter::write(const core::Value& value) {
    ensureOpen("write");

    auto effective = effectiveValue(value);
    if (!effective) {
        return effective.error();
    }
    if (!keeps(effective.value())) {
        return false;
    }

    scratch_.clear();
    codec_->encode(effective.value(), scratch_);
    try {
        stream_->write(scratch_);
    } catch (const core::FileException& e) {
        state_ = State::Failed;
        COLUMN_ERROR("Write to {} failed: {}", path_, e.what());
        throw;
    }

    ++count_;
    updateMinMax(effective.value());
    SLICECODEC_LOG_VALUE_DEBUG("Wrote {} to {}", core::describe(effective.value()), path_);
    return true;
}

core::Result<bool> ColumnWriter::hashcheck(const core::Value& value) const {
    auto effective = effectiveValue(value);
    if (!effective) {
        return effective.error();
    }
    return keeps(effective.value());
}

ColumnStats ColumnWriter::finish() {
    if (state_ == State::Finished) {
        return stats_;
    }
    ensureOpen("finish");

    try {
        stream_->close();
    } catch (const core::FileException& e) {
        state_ = State::Failed;
        COLUMN_ERROR("Finishing {} failed: {}", path_, e.what());
        throw;
    }

    state_ = State::Finished;
    stats_.type = codec_->type();
    stats_.compression = options_.compression;
    stats_.none_support = options_.none_support;
    stats_.count = count_;
    stats_.min = min_;
    stats_.max = max_;
    stats_.uncompressed_bytes = stream_->bytesWritten();
    COLUMN_DEBUG("Finished {}: {} values, min {}, max {}", path_, count_,
                 core::describe(min_), core::describe(max_));
    return stats_;
}

core::Result<uint64_t> ColumnWriter::hash(codec::ColumnType type, const core::Value& value) {
    return codec::TypeCodec::create(type)->hash(value);
}

}} // namespace slicecodec::column
