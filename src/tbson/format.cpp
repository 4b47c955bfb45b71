#include <tbson/format.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <span>

using namespace tbson;

namespace {

// Writes the single-line debug representation of BSON values
struct bson_writer {
    fmt::format_context::iterator _output;

    template <typename... Args>
    void write(fmt::format_string<Args...> fstr, Args&&... args) {
        _output = fmt::format_to(_output, fstr, static_cast<Args&&>(args)...);
    }

    void put(std::string_view sep) { _output = std::copy(sep.begin(), sep.end(), _output); }

    void print_bytes(std::span<const std::byte> bytes) {
        for (auto b : bytes) {
            write("{:0>2x}", static_cast<unsigned>(b));
        }
    }

    void write_value(const document& doc) {
        if (doc.empty()) {
            write("{{ }}");
            return;
        }
        write("{{");
        bool first = true;
        for (auto& [key, value] : doc) {
            put(first ? " " : ", ");
            write("{:?}: ", key);
            write_value(value);
            first = false;
        }
        write(" }}");
    }

    void write_value(const array& arr) {
        if (arr.empty()) {
            write("[]");
            return;
        }
        write("[");
        bool first = true;
        for (auto& value : arr) {
            put(first ? " " : ", ");
            write_value(value);
            first = false;
        }
        write(" ]");
    }

    void write_value(const raw_document& doc) {
        auto iter = doc.begin();
        if (iter.stop()) {
            write("{{ }}");
            return;
        }
        write("{{");
        for (; not iter.stop(); ++iter) {
            if (iter.has_error()) {
                write(" <error: {}> }}", decode_error::raw(iter.error()).message());
                return;
            }
            put(iter == doc.begin() ? " " : ", ");
            write("{:?}: ", iter->key());
            write_value(iter->value());
        }
        write(" }}");
    }

    void write_value(const raw_array& arr) {
        auto iter = arr.begin();
        if (iter.stop()) {
            write("[]");
            return;
        }
        write("[");
        for (; not iter.stop(); ++iter) {
            if (iter.has_error()) {
                write(" <error: {}> ]", decode_error::raw(iter.error()).message());
                return;
            }
            put(iter == arr.begin() ? " " : ", ");
            write_value(iter->value());
        }
        write(" ]");
    }

    void write_value(const bson& b) {
        b.visit([&](const auto& x) { this->write_value(x); });
    }
    void write_value(const raw_bson& b) {
        std::visit([&](const auto& x) { this->write_value(x); }, b.data());
    }

    void write_value(std::string_view sv) { write("{:?}", sv); }
    void write_value(const std::string& s) { write("{:?}", s); }
    void write_value(bool b) { write("{}", b); }
    void write_value(std::int32_t i) { write("{}:i32", i); }
    void write_value(std::int64_t i) { write("{}:i64", i); }
    void write_value(std::uint32_t i) { write("{}:u32", i); }
    void write_value(std::uint64_t i) { write("{}:u64", i); }
    void write_value(double d) { write("{}:f64", d); }
    void write_value(null) { write("null"); }
    void write_value(datetime dt) { write("DateTime({})", dt.to_rfc3339()); }
    void write_value(timestamp ts) { write("Timestamp({}, {})", ts.time, ts.increment); }
    void write_value(const decimal128& d) {
        write("Decimal128(0x");
        print_bytes(d.bytes());
        write(")");
    }
    void write_binary(binary_subtype subtype, std::span<const std::byte> bytes) {
        write("Binary(subtype 0x{:0>2x}, bytes 0x", static_cast<unsigned>(subtype));
        print_bytes(bytes);
        write(")");
    }
    void write_value(const binary& bin) { write_binary(bin.subtype, bin.bytes); }
    void write_value(const raw_binary& bin) { write_binary(bin.subtype, bin.bytes); }
};

}  // namespace

fmt::format_context::iterator fmt::formatter<bson>::format(const bson& b, format_context& ctx) const {
    bson_writer wr{ctx.out()};
    wr.write_value(b);
    return wr._output;
}

fmt::format_context::iterator fmt::formatter<document>::format(const document& d,
                                                               format_context& ctx) const {
    bson_writer wr{ctx.out()};
    wr.write_value(d);
    return wr._output;
}

fmt::format_context::iterator fmt::formatter<binary>::format(const binary&   b,
                                                             format_context& ctx) const {
    bson_writer wr{ctx.out()};
    wr.write_value(b);
    return wr._output;
}

fmt::format_context::iterator fmt::formatter<raw_bson>::format(const raw_bson& b,
                                                               format_context& ctx) const {
    bson_writer wr{ctx.out()};
    wr.write_value(b);
    return wr._output;
}

fmt::format_context::iterator fmt::formatter<raw_document>::format(const raw_document& d,
                                                                   format_context&     ctx) const {
    bson_writer wr{ctx.out()};
    wr.write_value(d);
    return wr._output;
}
