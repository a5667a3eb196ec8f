#ifndef PRAM_CONTENT_HASH_HPP
#define PRAM_CONTENT_HASH_HPP

#include <pram/types.hpp>
#include <cstdint>
#include <string>

namespace pram {

/**
 * Incremental FNV-1a digest over a canonical byte encoding.
 * Maps are fed in key order, so the digest does not depend on insertion order,
 * and nothing address- or run-dependent ever enters it.
 */
class ContentHasher {
public:
    static constexpr std::uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

    ContentHasher& add_byte(std::uint8_t byte) {
        hash_ ^= byte;
        hash_ *= FNV_PRIME;
        return *this;
    }

    ContentHasher& add_u64(std::uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            add_byte(static_cast<std::uint8_t>(value >> (8 * i)));
        }
        return *this;
    }

    // Length-prefixed so that ("ab","c") and ("a","bc") differ
    ContentHasher& add_string(const std::string& s) {
        add_u64(s.size());
        for (char c : s) {
            add_byte(static_cast<std::uint8_t>(c));
        }
        return *this;
    }

    ContentHasher& add_bool(bool b) { return add_byte(b ? 1 : 0); }

    ContentHasher& add_value(const Value& value);
    ContentHasher& add_rel_value(const RelValue& value);
    ContentHasher& add_attrs(const AttrMap& attrs);
    ContentHasher& add_rels(const RelMap& rels);

    std::uint64_t digest() const { return hash_; }

private:
    std::uint64_t hash_ = FNV_OFFSET;
};

// Identity digest of a group's (attributes, relations)
ContentHash hash_content(const AttrMap& attrs, const RelMap& rels);

} // namespace pram

#endif // PRAM_CONTENT_HASH_HPP
