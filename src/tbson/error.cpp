#include <tbson/error.hpp>

#include <fmt/format.h>

#include <cstdio>

using namespace tbson;

namespace {

struct decode_category_cls : std::error_category {
    const char* name() const noexcept override { return "tbson.de"; }
    std::string message(int ec) const noexcept override {
        switch (static_cast<errc>(ec)) {
        case errc::okay:
            return "okay";
        case errc::end_of_stream:
            return "end of stream";
        case errc::invalid_type:
            return "invalid type";
        case errc::invalid_value:
            return "invalid value";
        case errc::invalid_length:
            return "invalid length";
        case errc::custom:
            return "custom error";
        }
        return fmt::format("tbson.de:{}", ec);
    }
} decode_category_inst;

struct raw_category_cls : std::error_category {
    const char* name() const noexcept override { return "tbson.raw"; }
    std::string message(int ec) const noexcept override {
        char buf[64];
        return message_noalloc(ec, buf, sizeof buf);
    }

    const char* message_noalloc(int ec, char* buf, size_t buflen) const noexcept {
        switch (static_cast<raw_errc>(ec)) {
        case raw_errc::okay:
            return "okay";
        case raw_errc::short_read:
            return "data is truncated";
        case raw_errc::invalid_header:
            return "document header declares an invalid length";
        case raw_errc::invalid_terminator:
            return "document is missing its null terminator";
        case raw_errc::invalid_type:
            return "element has an unknown type tag";
        case raw_errc::invalid_length:
            return "element has an invalid length prefix";
        case raw_errc::invalid_document:
            return "element is malformed";
        case raw_errc::invalid_utf8:
            return "string is not valid UTF-8";
        case raw_errc::depth_exceeded:
            return "documents are nested too deeply";
        }
        std::snprintf(buf, buflen, "tbson.raw:%d", ec);
        return buf;
    }
} raw_category_inst;

}  // namespace

const std::error_category& tbson::decode_category() noexcept { return decode_category_inst; }
const std::error_category& tbson::raw_category() noexcept { return raw_category_inst; }

unexpected unexpected::boolean(bool b) { return unexpected(fmt::format("boolean `{}`", b)); }
unexpected unexpected::signed_integer(std::int64_t i) {
    return unexpected(fmt::format("integer `{}`", i));
}
unexpected unexpected::unsigned_integer(std::uint64_t u) {
    return unexpected(fmt::format("integer `{}`", u));
}
unexpected unexpected::floating(double d) {
    return unexpected(fmt::format("floating point `{}`", d));
}
unexpected unexpected::str(std::string_view s) { return unexpected(fmt::format("string {:?}", s)); }
unexpected unexpected::bytes() { return unexpected("byte array"); }
unexpected unexpected::unit() { return unexpected("unit value"); }
unexpected unexpected::option() { return unexpected("Option value"); }
unexpected unexpected::newtype_struct() { return unexpected("newtype struct"); }
unexpected unexpected::seq() { return unexpected("sequence"); }
unexpected unexpected::map() { return unexpected("map"); }
unexpected unexpected::enum_() { return unexpected("enum"); }
unexpected unexpected::other(std::string_view what) { return unexpected(std::string(what)); }

decode_error decode_error::end_of_stream() {
    return decode_error(errc::end_of_stream, "end of stream");
}

decode_error decode_error::invalid_type(const unexpected& got, std::string_view expected) {
    return decode_error(errc::invalid_type,
                        fmt::format("invalid type: {}, expected {}", got.describe(), expected));
}

decode_error decode_error::invalid_value(const unexpected& got, std::string_view expected) {
    return decode_error(errc::invalid_value,
                        fmt::format("invalid value: {}, expected {}", got.describe(), expected));
}

decode_error decode_error::invalid_length(std::size_t len, std::string_view expected) {
    return decode_error(errc::invalid_length,
                        fmt::format("invalid length {}, expected {}", len, expected));
}

decode_error decode_error::custom(std::string message) {
    return decode_error(errc::custom, std::move(message));
}

decode_error decode_error::raw(raw_errc reason) {
    return decode_error(errc::custom, raw_category().message(static_cast<int>(reason)), reason);
}

std::error_code decode_error::code() const noexcept {
    if (_reason != raw_errc::okay) {
        return make_error_code(_reason);
    }
    return make_error_code(_kind);
}
