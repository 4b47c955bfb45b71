#include <tbson/format.hpp>
#include <tbson/value.hpp>

#include <fmt/format.h>

#include <algorithm>

using namespace tbson;

document::document() noexcept                      = default;
document::document(const document&)                = default;
document::document(document&&) noexcept            = default;
document& document::operator=(const document&)     = default;
document& document::operator=(document&&) noexcept = default;
document::~document()                              = default;

std::size_t document::size() const noexcept { return _entries.size(); }
bool        document::empty() const noexcept { return _entries.empty(); }

document::iterator       document::begin() noexcept { return _entries.begin(); }
document::iterator       document::end() noexcept { return _entries.end(); }
document::const_iterator document::begin() const noexcept { return _entries.begin(); }
document::const_iterator document::end() const noexcept { return _entries.end(); }

void document::insert(std::string key, bson value) {
    if (auto existing = this->get(key)) {
        *existing = std::move(value);
        return;
    }
    _entries.push_back(document_entry{std::move(key), std::move(value)});
}

const bson* document::get(std::string_view key) const noexcept {
    auto it = std::ranges::find_if(_entries, [&](const document_entry& e) { return e.key == key; });
    return it == _entries.end() ? nullptr : &it->value;
}

bson* document::get(std::string_view key) noexcept {
    auto it = std::ranges::find_if(_entries, [&](const document_entry& e) { return e.key == key; });
    return it == _entries.end() ? nullptr : &it->value;
}

std::vector<document_entry> document::take_entries() && noexcept {
    return std::exchange(_entries, {});
}

bool document::operator==(const document& other) const { return _entries == other._entries; }

element_type bson::type() const noexcept {
    static constexpr element_type types[] = {
#define X(_code, _type, Name) element_type::Name,
        TBSON_ELEMENT_TYPE_X_LIST
#undef X
    };
    static_assert(std::size(types) == std::variant_size_v<variant_type>);
    return types[_value.index()];
}

unexpected bson::as_unexpected() const {
    switch (type()) {
    case element_type::double_:
        return unexpected::floating(*get_if<double>());
    case element_type::string:
        return unexpected::str(*get_if<std::string>());
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
