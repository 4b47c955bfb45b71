#include <tbson/extjson.hpp>

#include <fmt/format.h>
#include <openssl/evp.h>

#include <cmath>
#include <limits>

using namespace tbson;

namespace {

document single(std::string_view key, bson value) {
    document doc;
    doc.insert(std::string(key), std::move(value));
    return doc;
}

}  // namespace

std::string extjson::base64_encode(std::span<const std::byte> bytes) {
    if (bytes.empty()) {
        return {};
    }
    // Four output characters per three input bytes, plus the null terminator
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    const int   n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                    reinterpret_cast<const unsigned char*>(bytes.data()),
                                    static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

result<std::vector<std::byte>> extjson::base64_decode(std::string_view text) {
    if (text.empty()) {
        return std::vector<std::byte>{};
    }
    if (text.size() % 4 != 0) {
        return error(decode_error::custom(fmt::format("invalid base64 string {:?}", text)));
    }
    std::vector<std::byte> out(text.size() / 4 * 3);
    const int              n = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                    reinterpret_cast<const unsigned char*>(text.data()),
                                    static_cast<int>(text.size()));
    if (n < 0) {
        return error(decode_error::custom(fmt::format("invalid base64 string {:?}", text)));
    }
    // EVP_DecodeBlock counts the padding as decoded zero bytes
    std::size_t pad = 0;
    if (text.ends_with("==")) {
        pad = 2;
    } else if (text.ends_with('=')) {
        pad = 1;
    }
    out.resize(static_cast<std::size_t>(n) - pad);
    return out;
}

document extjson::extended_document(const binary& b) {
    document body;
    body.insert("base64", base64_encode(b.bytes));
    body.insert("subType", fmt::format("{:02x}", static_cast<unsigned>(b.subtype)));
    return single(binary_marker, std::move(body));
}

document extjson::extended_document(datetime dt) {
    return single(date_marker, single(number_long, std::to_string(dt.millis())));
}

document extjson::extended_document(timestamp ts) {
    document body;
    body.insert("t", static_cast<std::int64_t>(ts.time));
    body.insert("i", static_cast<std::int64_t>(ts.increment));
    return single(timestamp_marker, std::move(body));
}

document extjson::extended_document(const decimal128& d) {
    auto bytes = d.bytes();
    return single(number_decimal_bytes,
                  binary{binary_subtype::generic, std::vector<std::byte>(bytes.begin(), bytes.end())});
}

std::optional<document> extjson::canonical_document(const bson& value) {
    switch (value.type()) {
    case element_type::double_: {
        const double d = *value.get_if<double>();
        if (std::isnan(d)) {
            return single(number_double, "NaN");
        } else if (std::isinf(d)) {
            return single(number_double, d > 0 ? "Infinity" : "-Infinity");
        }
        return std::nullopt;
    }
    case element_type::int32:
        return single(number_int, std::to_string(*value.get_if<std::int32_t>()));
    case element_type::int64:
        return single(number_long, std::to_string(*value.get_if<std::int64_t>()));
    case element_type::uint32:
        return single(number_uint32, std::to_string(*value.get_if<std::uint32_t>()));
    case element_type::uint64:
        return single(number_uint64, std::to_string(*value.get_if<std::uint64_t>()));
    case element_type::binary:
        return extended_document(*value.get_if<binary>());
    case element_type::datetime:
        return extended_document(*value.get_if<datetime>());
    case element_type::timestamp:
        return extended_document(*value.get_if<timestamp>());
    case element_type::decimal128:
        return extended_document(*value.get_if<decimal128>());
    case element_type::string:
    case element_type::document:
    case element_type::array:
    case element_type::boolean:
    case element_type::null:
        return std::nullopt;
    }
    return std::nullopt;
}
