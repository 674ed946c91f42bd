/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/archive/codecs.hxx>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace stash {

/////////////////////////////////////////////////////////////////////////////
/// A UTC point in time with microsecond resolution, held by a Value.
/// - The text form is ISO-8601, `2024-01-31T12:30:00Z`, with a six digit
///   fraction when the microseconds are not zero.
/////////////////////////////////////////////////////////////////////////////
class Timestamp : public Opaque
{
  public:
    Timestamp() = default;
    explicit Timestamp(Int micros) : m_micros{micros} {}

    /// Parse ISO-8601 text.  A trailing `Z` is optional.  Offsets other than
    /// UTC are not accepted.
    /// @throws StashException if the text is malformed.
    static Timestamp parse(const StringView& text);

    static Timestamp from_time_t(std::time_t seconds, Int micros = 0) {
        return Timestamp{(Int)seconds * 1000000 + micros};
    }

    /// Microseconds since the epoch.
    Int micros() const { return m_micros; }

    String iso() const;

    Opaque* clone() const override { return new Timestamp{m_micros}; }
    String str() const override    { return iso(); }

    bool equals(const Opaque& other) const override {
        auto p_other = dynamic_cast<const Timestamp*>(&other);
        return p_other != nullptr && p_other->m_micros == m_micros;
    }

  private:
    Int m_micros = 0;
};

inline
String Timestamp::iso() const {
    Int seconds = m_micros / 1000000;
    Int fraction = m_micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    std::time_t time = (std::time_t)seconds;
    std::tm tm;
    gmtime_r(&time, &tm);
    if (fraction == 0) return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z", tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}Z", tm, fraction);
}

inline
Timestamp Timestamp::parse(const StringView& text) {
    String copy{text};
    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (std::sscanf(copy.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second, &consumed) != 6)
        throw StashException{fmt::format("Invalid timestamp: {}", copy)};

    Int fraction = 0;
    size_t pos = consumed;
    if (pos < copy.size() && copy[pos] == '.') {
        ++pos;
        int n_digits = 0;
        for (; pos < copy.size() && std::isdigit((unsigned char)copy[pos]); ++pos, ++n_digits)
            if (n_digits < 6) fraction = fraction * 10 + (copy[pos] - '0');
        if (n_digits == 0) throw StashException{fmt::format("Invalid timestamp: {}", copy)};
        for (; n_digits < 6; ++n_digits) fraction *= 10;
    }
    if (pos < copy.size() && copy[pos] == 'Z') ++pos;
    if (pos != copy.size()) throw StashException{fmt::format("Invalid timestamp: {}", copy)};

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return from_time_t(timegm(&tm), fraction);
}

namespace codecs {

/// Stored inline as ISO-8601 text.
class TimestampCodec : public Codec
{
  public:
    Encoding encode(const Value& value) const override {
        return {.inline_value = value.as<Timestamp>().iso()};
    }

    Value decode(const Encoding& encoding) const override {
        require_inline(encoding, "datetime");
        return Value::make<Timestamp>(Timestamp::parse(encoding.inline_value.as<String>()));
    }
};

} // namespace codecs
} // namespace stash
