#ifndef PRAM_TYPES_HPP
#define PRAM_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <type_traits>
#include <variant>

namespace pram {

class Resource;

// Content digest of an entity (group, site, resource, query)
using ContentHash = std::uint64_t;

// Relation name under which a group records the site it is currently at
inline const std::string SITE_AT = "@";

// Attribute whose presence flags a group for removal at the end of the iteration
inline const std::string VOID_ATTR = "__void__";

// Strong type for the content hash of a registered Site or Resource
struct EntityHash {
    ContentHash value;
    explicit constexpr EntityHash(ContentHash v = 0) : value(v) {}
    constexpr bool operator==(const EntityHash& other) const { return value == other.value; }
    constexpr bool operator!=(const EntityHash& other) const { return value != other.value; }
    constexpr bool operator<(const EntityHash& other) const { return value < other.value; }
};

/**
 * Attribute value.
 * Values of different kinds never compare equal (1 != 1.0 != true).
 */
class Value {
public:
    using Storage = std::variant<bool, std::int64_t, double, std::string>;

    enum class Kind : std::uint8_t {
        BOOL,
        INT,
        REAL,
        STRING
    };

    Value() : data_(std::string()) {}
    Value(bool v) : data_(v) {}
    Value(int v) : data_(static_cast<std::int64_t>(v)) {}
    Value(long v) : data_(static_cast<std::int64_t>(v)) {}
    Value(long long v) : data_(static_cast<std::int64_t>(v)) {}
    Value(unsigned int v) : data_(static_cast<std::int64_t>(v)) {}
    // Throw std::out_of_range above INT64_MAX
    Value(unsigned long v) : data_(checked_int(v)) {}
    Value(unsigned long long v) : data_(checked_int(v)) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_bool() const { return kind() == Kind::BOOL; }
    bool is_int() const { return kind() == Kind::INT; }
    bool is_real() const { return kind() == Kind::REAL; }
    bool is_number() const { return is_int() || is_real(); }
    bool is_string() const { return kind() == Kind::STRING; }

    // Typed accessors throw std::bad_variant_access on a kind mismatch
    bool as_bool() const { return std::get<bool>(data_); }
    std::int64_t as_int() const { return std::get<std::int64_t>(data_); }
    double as_real() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }

    // Integer or real value widened to double; throws std::invalid_argument otherwise
    double as_number() const;

    const Storage& storage() const { return data_; }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return data_ != other.data_; }
    bool operator<(const Value& other) const { return data_ < other.data_; }

    std::string to_string() const;

private:
    static std::int64_t checked_int(unsigned long long v);

    Storage data_;
};

/**
 * Relation value: a plain label, the hash of a registered entity, or a
 * reference to a Site/Resource that has not been registered yet.
 * Entity references compare and hash as the entity's own content hash.
 */
class RelValue {
public:
    using Storage = std::variant<std::string, EntityHash, std::shared_ptr<Resource>>;

    RelValue() : data_(std::string()) {}
    RelValue(const char* label) : data_(std::string(label)) {}
    RelValue(std::string label) : data_(std::move(label)) {}
    RelValue(EntityHash hash) : data_(hash) {}

    template<typename T, typename = std::enable_if_t<std::is_base_of<Resource, T>::value>>
    RelValue(std::shared_ptr<T> entity) : data_(std::shared_ptr<Resource>(std::move(entity))) {}

    bool is_label() const { return data_.index() == 0; }
    bool is_hash() const { return data_.index() == 1; }
    bool is_entity() const { return data_.index() == 2; }

    // True for both an entity hash and an unresolved entity reference
    bool refers_to_entity() const { return !is_label(); }

    const std::string& label() const { return std::get<std::string>(data_); }
    const std::shared_ptr<Resource>& entity() const { return std::get<std::shared_ptr<Resource>>(data_); }

    // Hash of the referenced entity; throws std::logic_error for a plain label
    EntityHash entity_hash() const;

    // Copy with an entity reference replaced by its hash
    RelValue resolved() const;

    bool operator==(const RelValue& other) const;
    bool operator!=(const RelValue& other) const { return !(*this == other); }
    bool operator<(const RelValue& other) const;

    std::string to_string() const;

private:
    Storage data_;
};

using AttrMap = std::map<std::string, Value>;
using RelMap = std::map<std::string, RelValue>;
using KeySet = std::set<std::string>;

std::string to_string(const AttrMap& attrs);
std::string to_string(const RelMap& rels);

} // namespace pram

// Hash functions for the strong types
namespace std {
    template<>
    struct hash<pram::EntityHash> {
        std::size_t operator()(const pram::EntityHash& h) const {
            return std::hash<pram::ContentHash>{}(h.value);
        }
    };
}

#endif // PRAM_TYPES_HPP
