#include "./bytes.hpp"

#include <tbson/extjson.hpp>
#include <tbson/format.hpp>
#include <tbson/raw.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace tbson;
using detail::as_chars;
using detail::read_int_le;

namespace {

// The bytes of an empty document, used by default-constructed views
constexpr std::byte empty_document_bytes[] = {
    std::byte{5},
    std::byte{0},
    std::byte{0},
    std::byte{0},
    std::byte{0},
};

// Projects raw values into owned values
struct owned_converter {
    unsigned depth;
    unsigned max_depth;

    result<document> convert_document(const raw_document& doc) const {
        if (depth >= max_depth) {
            return error(decode_error::raw(raw_errc::depth_exceeded));
        }
        owned_converter nested{depth + 1, max_depth};
        document        out;
        for (auto it = doc.begin(); not it.stop(); ++it) {
            if (it.has_error()) {
                return error(decode_error::raw(it.error()));
            }
            TBSON_TRY(auto value, nested.convert(it->value()));
            out.insert(std::string(it->key()), std::move(value));
        }
        return out;
    }

    result<array> convert_array(const raw_array& arr) const {
        if (depth >= max_depth) {
            return error(decode_error::raw(raw_errc::depth_exceeded));
        }
        owned_converter nested{depth + 1, max_depth};
        array           out;
        for (auto it = arr.begin(); not it.stop(); ++it) {
            if (it.has_error()) {
                return error(decode_error::raw(it.error()));
            }
            TBSON_TRY(auto value, nested.convert(it->value()));
            out.push_back(std::move(value));
        }
        return out;
    }

    result<bson> convert(const raw_bson& value) const {
        return std::visit([&](const auto& v) { return this->convert_one(v); }, value.data());
    }

    result<bson> convert_one(const raw_document& d) const {
        TBSON_TRY(auto doc, convert_document(d));
        return bson(std::move(doc));
    }
    result<bson> convert_one(const raw_array& a) const {
        TBSON_TRY(auto arr, convert_array(a));
        return bson(std::move(arr));
    }
    result<bson> convert_one(std::string_view s) const { return bson(std::string(s)); }
    result<bson> convert_one(const raw_binary& b) const { return bson(b.to_owned()); }
    // Scalars are copied
    template <typename T>
    result<bson> convert_one(const T& v) const {
        return bson(v);
    }
};

}  // namespace

raw_document::raw_document() noexcept
    : _bytes(empty_document_bytes) {}

result<raw_document> raw_document::from_bytes(std::span<const std::byte> bytes) {
    // All BSON data must be at least five bytes long
    if (bytes.size() < 5) {
        return error(decode_error::raw(raw_errc::short_read));
    }
    // Read the length header. This includes the header's four bytes, the
    // document's element data, and the null terminator byte.
    const auto len = read_int_le<std::int32_t>(bytes);
    if (len < 5) {
        return error(decode_error::raw(raw_errc::invalid_header));
    }
    if (static_cast<std::size_t>(len) > bytes.size()) {
        return error(decode_error::raw(raw_errc::short_read));
    }
    if (bytes[static_cast<std::size_t>(len) - 1] != std::byte{0}) {
        return error(decode_error::raw(raw_errc::invalid_terminator));
    }
    return raw_document(bytes.first(static_cast<std::size_t>(len)));
}

raw_document::iterator raw_document::begin() const noexcept { return iterator(_bytes.subspan(4)); }
raw_document::iterator raw_document::end() const noexcept { return iterator(_bytes.last(1)); }

result<std::optional<raw_bson>> raw_document::get(std::string_view key) const {
    for (auto it = begin(); not it.stop(); ++it) {
        if (it.has_error()) {
            return error(decode_error::raw(it.error()));
        }
        if (it->key() == key) {
            return std::optional<raw_bson>(it->value());
        }
    }
    return std::optional<raw_bson>();
}

result<document> raw_document::to_document(unsigned max_depth) const {
    return owned_converter{0, max_depth}.convert_document(*this);
}

bool raw_document::operator==(const raw_document& other) const noexcept {
    return std::ranges::equal(_bytes, other._bytes);
}

void raw_document::iterator::_parse() noexcept {
    _size    = 0;
    _current = raw_element();
    if (_rest.size() <= 1) {
        // Only the document's null terminator remains
        return;
    }
    const auto tag = static_cast<std::uint8_t>(_rest[0]);
    if (not is_known_type_tag(tag)) {
        _error = raw_errc::invalid_type;
        return;
    }
    // The element must end before the terminator of the enclosing document
    const auto body = _rest.first(_rest.size() - 1).subspan(1);

    const auto nul = std::ranges::find(body, std::byte{0});
    if (nul == body.end()) {
        _error = raw_errc::short_read;
        return;
    }
    const auto             keylen = static_cast<std::size_t>(nul - body.begin());
    const std::string_view key    = as_chars(body.first(keylen));
    if (not detail::is_valid_utf8(key)) {
        _error = raw_errc::invalid_utf8;
        return;
    }
    // The bytes that are available for the element's value
    const auto value = body.subspan(keylen + 1);

    raw_bson    v;
    std::size_t vsize = 0;
    auto        fixed = [&](std::size_t n) {
        vsize = n;
        return value.size() >= n;
    };

    switch (tag) {
    case static_cast<std::uint8_t>(element_type::double_):
        if (not fixed(8)) {
            _error = raw_errc::short_read;
            return;
        }
        v = detail::read_double_le(value);
        break;
    case static_cast<std::uint8_t>(element_type::string): {
        if (not fixed(4)) {
            _error = raw_errc::short_read;
            return;
        }
        const auto len = read_int_le<std::int32_t>(value);
        if (len < 1) {
            _error = raw_errc::invalid_length;
            return;
        }
        if (not fixed(4 + static_cast<std::size_t>(len))) {
            _error = raw_errc::short_read;
            return;
        }
        if (value[vsize - 1] != std::byte{0}) {
            _error = raw_errc::invalid_length;
            return;
        }
        const auto str = as_chars(value.subspan(4, static_cast<std::size_t>(len) - 1));
        if (not detail::is_valid_utf8(str)) {
            _error = raw_errc::invalid_utf8;
            return;
        }
        v = str;
        break;
    }
    case static_cast<std::uint8_t>(element_type::document):
    case static_cast<std::uint8_t>(element_type::array): {
        if (not fixed(4)) {
            _error = raw_errc::short_read;
            return;
        }
        const auto len = read_int_le<std::int32_t>(value);
        if (len < 5) {
            _error = raw_errc::invalid_document;
            return;
        }
        if (not fixed(static_cast<std::size_t>(len))) {
            _error = raw_errc::short_read;
            return;
        }
        if (value[vsize - 1] != std::byte{0}) {
            _error = raw_errc::invalid_document;
            return;
        }
        const auto doc = raw_document(value.first(vsize));
        if (tag == static_cast<std::uint8_t>(element_type::array)) {
            v = raw_array(doc);
        } else {
            v = doc;
        }
        break;
    }
    case static_cast<std::uint8_t>(element_type::binary): {
        if (not fixed(5)) {
            _error = raw_errc::short_read;
            return;
        }
        const auto len = read_int_le<std::int32_t>(value);
        if (len < 0) {
            _error = raw_errc::invalid_length;
            return;
        }
        if (not fixed(5 + static_cast<std::size_t>(len))) {
            _error = raw_errc::short_read;
            return;
        }
        const auto subtype = static_cast<binary_subtype>(value[4]);
        auto       payload = value.subspan(5, static_cast<std::size_t>(len));
        if (subtype == binary_subtype::binary_old) {
            // Old binary repeats the payload length inside the payload
            if (payload.size() < 4
                or read_int_le<std::int32_t>(payload)
                       != static_cast<std::int32_t>(payload.size() - 4)) {
                _error = raw_errc::invalid_length;
                return;
            }
            payload = payload.subspan(4);
        }
        v = raw_binary{subtype, payload};
        break;
    }
    case static_cast<std::uint8_t>(element_type::boolean): {
        if (not fixed(1)) {
            _error = raw_errc::short_read;
            return;
        }
        const auto b = static_cast<std::uint8_t>(value[0]);
        if (b > 1) {
            _error = raw_errc::invalid_document;
            return;
        }
        v = b == 1;
        break;
    }
    case static_cast<std::uint8_t>(element_type::datetime):
        if (not fixed(8)) {
            _error = raw_errc::short_read;
            return;
        }
        v = datetime::from_millis(read_int_le<std::int64_t>(value));
        break;
    case static_cast<std::uint8_t>(element_type::null):
        fixed(0);
        v = null{};
        break;
    case static_cast<std::uint8_t>(element_type::int32):
        if (not fixed(4)) {
            _error = raw_errc::short_read;
            return;
        }
        v = read_int_le<std::int32_t>(value);
        break;
    case static_cast<std::uint8_t>(element_type::timestamp):
        if (not fixed(8)) {
            _error = raw_errc::short_read;
            return;
        }
        // The increment is stored in the low four bytes
        v = timestamp{.time      = read_int_le<std::uint32_t>(value.subspan(4)),
                      .increment = read_int_le<std::uint32_t>(value)};
        break;
    case static_cast<std::uint8_t>(element_type::int64):
        if (not fixed(8)) {
            _error = raw_errc::short_read;
            return;
        }
        v = read_int_le<std::int64_t>(value);
        break;
    case static_cast<std::uint8_t>(element_type::decimal128): {
        if (not fixed(16)) {
            _error = raw_errc::short_read;
            return;
        }
        auto dec = decimal128::from_bytes(value.first(16));
        v        = *dec;
        break;
    }
    case static_cast<std::uint8_t>(element_type::uint32):
        if (not fixed(4)) {
            _error = raw_errc::short_read;
            return;
        }
        v = read_int_le<std::uint32_t>(value);
        break;
    case static_cast<std::uint8_t>(element_type::uint64):
        if (not fixed(8)) {
            _error = raw_errc::short_read;
            return;
        }
        v = read_int_le<std::uint64_t>(value);
        break;
    default:
        _error = raw_errc::invalid_type;
        return;
    }
    _size    = 1 + keylen + 1 + vsize;
    _current = raw_element(key, v);
}

raw_document::iterator& raw_document::iterator::operator++() noexcept {
    if (has_error() or stop()) {
        return *this;
    }
    _rest = _rest.subspan(_size);
    _parse();
    return *this;
}

void raw_document::iterator::throw_if_error() const {
    if (has_error()) {
        throw tbson::exception(decode_error::raw(_error));
    }
}

result<raw_array> raw_array::from_bytes(std::span<const std::byte> bytes) {
    return raw_document::from_bytes(bytes).transform(
        [](raw_document doc) { return raw_array(doc); });
}

raw_array::iterator raw_array::begin() const noexcept { return _doc.begin(); }
raw_array::iterator raw_array::end() const noexcept { return _doc.end(); }

result<std::optional<raw_bson>> raw_array::get(std::size_t index) const {
    std::size_t n = 0;
    for (auto it = begin(); not it.stop(); ++it, ++n) {
        if (it.has_error()) {
            return error(decode_error::raw(it.error()));
        }
        if (n == index) {
            return std::optional<raw_bson>(it->value());
        }
    }
    return std::optional<raw_bson>();
}

result<array> raw_array::to_array(unsigned max_depth) const {
    return owned_converter{0, max_depth}.convert_array(*this);
}

binary raw_binary::to_owned() const {
    return binary{subtype, std::vector<std::byte>(bytes.begin(), bytes.end())};
}

bson raw_binary::to_bson(bool human_readable) const {
    if (subtype == binary_subtype::generic) {
        return bson(to_owned());
    }
    document body;
    if (human_readable) {
        body.insert("base64", extjson::base64_encode(bytes));
        body.insert("subType", fmt::format("{:02x}", static_cast<unsigned>(subtype)));
    } else {
        body.insert("bytes", binary{binary_subtype::generic, to_owned().bytes});
        body.insert("subType", static_cast<std::int32_t>(subtype));
    }
    document doc;
    doc.insert(std::string(extjson::binary_marker), std::move(body));
    return bson(std::move(doc));
}

bool raw_binary::operator==(const raw_binary& other) const noexcept {
    return subtype == other.subtype and std::ranges::equal(bytes, other.bytes);
}

element_type raw_bson::type() const noexcept {
    static constexpr element_type types[] = {
#define X(_code, _type, Name) element_type::Name,
        TBSON_ELEMENT_TYPE_X_LIST
#undef X
    };
    static_assert(std::size(types) == std::variant_size_v<variant_type>);
    return types[_value.index()];
}

namespace {

template <typename T>
std::optional<T> get_opt(const raw_bson::variant_type& v) noexcept {
    if (auto p = std::get_if<T>(&v)) {
        return *p;
    }
    return std::nullopt;
}

}  // namespace

std::optional<double> raw_bson::as_double() const noexcept { return get_opt<double>(_value); }
std::optional<std::string_view> raw_bson::as_str() const noexcept {
    return get_opt<std::string_view>(_value);
}
std::optional<raw_array> raw_bson::as_array() const noexcept { return get_opt<raw_array>(_value); }
std::optional<raw_document> raw_bson::as_document() const noexcept {
    return get_opt<raw_document>(_value);
}
std::optional<bool> raw_bson::as_bool() const noexcept { return get_opt<bool>(_value); }
std::optional<std::int32_t> raw_bson::as_int32() const noexcept {
    return get_opt<std::int32_t>(_value);
}
std::optional<std::int64_t> raw_bson::as_int64() const noexcept {
    return get_opt<std::int64_t>(_value);
}
std::optional<raw_binary> raw_bson::as_binary() const noexcept {
    return get_opt<raw_binary>(_value);
}
std::optional<datetime> raw_bson::as_datetime() const noexcept {
    return get_opt<datetime>(_value);
}
std::optional<timestamp> raw_bson::as_timestamp() const noexcept {
    return get_opt<timestamp>(_value);
}
std::optional<null> raw_bson::as_null() const noexcept { return get_opt<null>(_value); }

result<bson> raw_bson::to_bson(unsigned max_depth) const {
    return owned_converter{0, max_depth}.convert(*this);
}

unexpected raw_bson::as_unexpected() const {
    switch (type()) {
    case element_type::double_:
        return unexpected::floating(*get_if<double>());
    case element_type::string:
        return unexpected::str(*get_if<std::string_view>());
    case element_type::array:
        return unexpected::seq();
    case element_type::document:
        return unexpected::map();
    case element_type::boolean:
        return unexpected::boolean(*get_if<bool>());
    case element_type::null:
        return unexpected::unit();
    case element_type::int32:
        return unexpected::signed_integer(*get_if<std::int32_t>());
    case element_type::int64:
        return unexpected::signed_integer(*get_if<std::int64_t>());
    case element_type::uint32:
        return unexpected::unsigned_integer(*get_if<std::uint32_t>());
    case element_type::uint64:
        return unexpected::unsigned_integer(*get_if<std::uint64_t>());
    case element_type::binary:
        return unexpected::bytes();
    case element_type::datetime:
    case element_type::timestamp:
    case element_type::decimal128:
        return unexpected::other(fmt::format("{}", *this));
    }
    return unexpected::other("unknown");
}
