/// @file state_codec.cpp
/// @brief Text encoding of per-key limiter state.

#include "rk/limiter/limiter_state.hpp"

#include "rk/version.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace rk::limiter {

using foundation::ErrorCode;
using foundation::LimiterError;
using foundation::LimiterResult;

namespace {

constexpr std::string_view kVersion = rk::Version::stateTag;
constexpr std::string_view kBucketTag = "tb";
constexpr std::string_view kQueueTag = "lb";
constexpr std::string_view kWindowTag = "fw";
constexpr std::string_view kLogTag = "sl";
constexpr std::string_view kDualTag = "sc";

constexpr char kFieldSep = ';';
constexpr char kPairSep = ',';

// ── Writing ─────────────────────────────────────────────────────────────────

void appendDouble(std::string& out, double v) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    // 32 bytes always fits the shortest round-trip form of a double.
    out.append(buf, ec == std::errc() ? ptr : buf);
}

void appendInt(std::string& out, int64_t v) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    out.append(buf, ec == std::errc() ? ptr : buf);
}

std::string header(std::string_view tag) {
    std::string out;
    out.reserve(48);
    out.append(kVersion);
    out += kFieldSep;
    out.append(tag);
    return out;
}

// ── Reading ─────────────────────────────────────────────────────────────────

/// Sequential ';'-separated field reader.
class FieldReader {
public:
    explicit FieldReader(std::string_view raw) : rest_(raw) {}

    bool next(std::string_view& field) {
        if (done_) {
            return false;
        }
        auto pos = rest_.find(kFieldSep);
        if (pos == std::string_view::npos) {
            field = rest_;
            done_ = true;
        } else {
            field = rest_.substr(0, pos);
            rest_.remove_prefix(pos + 1);
        }
        return true;
    }

    [[nodiscard]] bool exhausted() const noexcept { return done_; }

private:
    std::string_view rest_;
    bool done_ = false;
};

bool parseInt(std::string_view text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

bool parseDouble(std::string_view text, double& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size() && std::isfinite(out);
}

bool readInt(FieldReader& reader, int64_t& out) {
    std::string_view field;
    return reader.next(field) && parseInt(field, out);
}

bool readDouble(FieldReader& reader, double& out) {
    std::string_view field;
    return reader.next(field) && parseDouble(field, out);
}

bool readTimestamp(FieldReader& reader, foundation::Timestamp& out) {
    int64_t micros = 0;
    if (!readInt(reader, micros)) {
        return false;
    }
    out = foundation::fromEpochMicros(micros);
    return true;
}

bool readHeader(FieldReader& reader, std::string_view tag) {
    std::string_view version;
    std::string_view found;
    return reader.next(version) && version == kVersion && reader.next(found) && found == tag;
}

LimiterResult<void> corrupt(std::string_view tag, std::string_view raw) {
    return LimiterResult<void>::err(
        LimiterError(ErrorCode::CorruptState,
                     "malformed " + std::string(tag) + " state: " + std::string(raw)));
}

} // anonymous namespace

// ── Encode ──────────────────────────────────────────────────────────────────

std::string encodeState(const BucketState& s) {
    auto out = header(kBucketTag);
    out += kFieldSep;
    appendDouble(out, s.tokens);
    out += kFieldSep;
    appendInt(out, foundation::toEpochMicros(s.lastRefillAt));
    return out;
}

std::string encodeState(const QueueState& s) {
    auto out = header(kQueueTag);
    out += kFieldSep;
    appendDouble(out, s.queueLevel);
    out += kFieldSep;
    appendInt(out, foundation::toEpochMicros(s.lastLeakAt));
    return out;
}

std::string encodeState(const WindowCounter& s) {
    auto out = header(kWindowTag);
    out += kFieldSep;
    appendInt(out, s.count);
    out += kFieldSep;
    appendInt(out, foundation::toEpochMicros(s.windowStart));
    return out;
}

std::string encodeState(const TimestampLog& s) {
    auto out = header(kLogTag);
    out.reserve(out.size() + 4 + s.entries.size() * 24);
    out += kFieldSep;
    appendInt(out, static_cast<int64_t>(s.entries.size()));
    for (const auto& entry : s.entries) {
        out += kFieldSep;
        appendInt(out, foundation::toEpochMicros(entry.at));
        out += kPairSep;
        appendInt(out, entry.weight);
    }
    return out;
}

std::string encodeState(const DualWindowCounter& s) {
    auto out = header(kDualTag);
    out += kFieldSep;
    appendInt(out, s.previousCount);
    out += kFieldSep;
    appendInt(out, foundation::toEpochMicros(s.previousWindowStart));
    out += kFieldSep;
    appendInt(out, s.currentCount);
    out += kFieldSep;
    appendInt(out, foundation::toEpochMicros(s.currentWindowStart));
    return out;
}

// ── Decode ──────────────────────────────────────────────────────────────────

LimiterResult<void> decodeState(std::string_view raw, BucketState& out) {
    FieldReader reader(raw);
    BucketState s;
    if (!readHeader(reader, kBucketTag) || !readDouble(reader, s.tokens) ||
        !readTimestamp(reader, s.lastRefillAt) || !reader.exhausted() || s.tokens < 0.0) {
        return corrupt(kBucketTag, raw);
    }
    out = s;
    return LimiterResult<void>::ok();
}

LimiterResult<void> decodeState(std::string_view raw, QueueState& out) {
    FieldReader reader(raw);
    QueueState s;
    if (!readHeader(reader, kQueueTag) || !readDouble(reader, s.queueLevel) ||
        !readTimestamp(reader, s.lastLeakAt) || !reader.exhausted() || s.queueLevel < 0.0) {
        return corrupt(kQueueTag, raw);
    }
    out = s;
    return LimiterResult<void>::ok();
}

LimiterResult<void> decodeState(std::string_view raw, WindowCounter& out) {
    FieldReader reader(raw);
    WindowCounter s;
    if (!readHeader(reader, kWindowTag) || !readInt(reader, s.count) ||
        !readTimestamp(reader, s.windowStart) || !reader.exhausted() || s.count < 0) {
        return corrupt(kWindowTag, raw);
    }
    out = s;
    return LimiterResult<void>::ok();
}

LimiterResult<void> decodeState(std::string_view raw, TimestampLog& out) {
    FieldReader reader(raw);
    int64_t count = 0;
    if (!readHeader(reader, kLogTag) || !readInt(reader, count) || count < 0) {
        return corrupt(kLogTag, raw);
    }

    TimestampLog s;
    s.entries.reserve(static_cast<std::size_t>(count));
    for (int64_t i = 0; i < count; ++i) {
        std::string_view field;
        if (!reader.next(field)) {
            return corrupt(kLogTag, raw);
        }
        auto comma = field.find(kPairSep);
        int64_t micros = 0;
        LogEntry entry;
        if (comma == std::string_view::npos || !parseInt(field.substr(0, comma), micros) ||
            !parseInt(field.substr(comma + 1), entry.weight) || entry.weight <= 0) {
            return corrupt(kLogTag, raw);
        }
        entry.at = foundation::fromEpochMicros(micros);
        if (!s.entries.empty() && entry.at < s.entries.back().at) {
            return corrupt(kLogTag, raw);
        }
        s.entries.push_back(entry);
    }
    if (!reader.exhausted()) {
        return corrupt(kLogTag, raw);
    }
    out = std::move(s);
    return LimiterResult<void>::ok();
}

LimiterResult<void> decodeState(std::string_view raw, DualWindowCounter& out) {
    FieldReader reader(raw);
    DualWindowCounter s;
    if (!readHeader(reader, kDualTag) || !readInt(reader, s.previousCount) ||
        !readTimestamp(reader, s.previousWindowStart) || !readInt(reader, s.currentCount) ||
        !readTimestamp(reader, s.currentWindowStart) || !reader.exhausted() ||
        s.previousCount < 0 || s.currentCount < 0) {
        return corrupt(kDualTag, raw);
    }
    out = s;
    return LimiterResult<void>::ok();
}

} // namespace rk::limiter
