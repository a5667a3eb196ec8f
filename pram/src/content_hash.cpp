#include <pram/content_hash.hpp>
#include <cstring>

namespace pram {

namespace {

// Type tags keep values of different kinds apart in the byte stream
constexpr std::uint8_t TAG_BOOL = 0x01;
constexpr std::uint8_t TAG_INT = 0x02;
constexpr std::uint8_t TAG_REAL = 0x03;
constexpr std::uint8_t TAG_STRING = 0x04;
constexpr std::uint8_t TAG_LABEL = 0x11;
constexpr std::uint8_t TAG_ENTITY = 0x12;
constexpr std::uint8_t TAG_ATTRS = 0x21;
constexpr std::uint8_t TAG_RELS = 0x22;

std::uint64_t real_bits(double v) {
    if (v == 0.0) {
        v = 0.0;  // fold -0.0 into 0.0
    }
    std::uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

} // anonymous namespace

ContentHasher& ContentHasher::add_value(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::BOOL:
            add_byte(TAG_BOOL);
            add_bool(value.as_bool());
            break;
        case Value::Kind::INT:
            add_byte(TAG_INT);
            add_u64(static_cast<std::uint64_t>(value.as_int()));
            break;
        case Value::Kind::REAL:
            add_byte(TAG_REAL);
            add_u64(real_bits(value.as_real()));
            break;
        case Value::Kind::STRING:
            add_byte(TAG_STRING);
            add_string(value.as_string());
            break;
    }
    return *this;
}

ContentHasher& ContentHasher::add_rel_value(const RelValue& value) {
    if (value.is_label()) {
        add_byte(TAG_LABEL);
        add_string(value.label());
    } else {
        // An entity reference digests exactly like its registered hash
        add_byte(TAG_ENTITY);
        add_u64(value.entity_hash().value);
    }
    return *this;
}

ContentHasher& ContentHasher::add_attrs(const AttrMap& attrs) {
    add_byte(TAG_ATTRS);
    add_u64(attrs.size());
    for (const auto& [key, value] : attrs) {
        add_string(key);
        add_value(value);
    }
    return *this;
}

ContentHasher& ContentHasher::add_rels(const RelMap& rels) {
    add_byte(TAG_RELS);
    add_u64(rels.size());
    for (const auto& [key, value] : rels) {
        add_string(key);
        add_rel_value(value);
    }
    return *this;
}

ContentHash hash_content(const AttrMap& attrs, const RelMap& rels) {
    ContentHasher hasher;
    hasher.add_attrs(attrs);
    hasher.add_rels(rels);
    return hasher.digest();
}

} // namespace pram
