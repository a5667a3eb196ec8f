#include <pram/types.hpp>
#include <pram/resource.hpp>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace pram {

std::int64_t Value::checked_int(unsigned long long v) {
    if (v > static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max())) {
        std::ostringstream oss;
        oss << "Integer attribute value " << v << " does not fit in 64 signed bits";
        throw std::out_of_range(oss.str());
    }
    return static_cast<std::int64_t>(v);
}

double Value::as_number() const {
    switch (kind()) {
        case Kind::INT:
            return static_cast<double>(as_int());
        case Kind::REAL:
            return as_real();
        default:
            throw std::invalid_argument("Value is not numeric: " + to_string());
    }
}

std::string Value::to_string() const {
    std::ostringstream oss;
    switch (kind()) {
        case Kind::BOOL:
            oss << (as_bool() ? "true" : "false");
            break;
        case Kind::INT:
            oss << as_int();
            break;
        case Kind::REAL:
            oss << as_real();
            break;
        case Kind::STRING:
            oss << '"' << as_string() << '"';
            break;
    }
    return oss.str();
}

EntityHash RelValue::entity_hash() const {
    if (is_hash()) {
        return std::get<EntityHash>(data_);
    }
    if (is_entity()) {
        const auto& e = entity();
        if (!e) {
            throw std::logic_error("Relation holds a null entity reference");
        }
        return EntityHash{e->hash()};
    }
    throw std::logic_error("Relation value '" + label() + "' is a label, not an entity");
}

RelValue RelValue::resolved() const {
    if (is_entity()) {
        return RelValue(entity_hash());
    }
    return *this;
}

bool RelValue::operator==(const RelValue& other) const {
    if (is_label() != other.is_label()) {
        return false;
    }
    if (is_label()) {
        return label() == other.label();
    }
    return entity_hash() == other.entity_hash();
}

bool RelValue::operator<(const RelValue& other) const {
    // Labels order before entities
    if (is_label() != other.is_label()) {
        return is_label();
    }
    if (is_label()) {
        return label() < other.label();
    }
    return entity_hash() < other.entity_hash();
}

std::string RelValue::to_string() const {
    if (is_label()) {
        return '"' + label() + '"';
    }
    std::ostringstream oss;
    if (is_entity() && entity()) {
        oss << entity()->name() << "#";
    } else {
        oss << "#";
    }
    oss << std::hex << entity_hash().value;
    return oss.str();
}

std::string to_string(const AttrMap& attrs) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : attrs) {
        if (!first) oss << ", ";
        oss << key << ": " << value.to_string();
        first = false;
    }
    oss << "}";
    return oss.str();
}

std::string to_string(const RelMap& rels) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : rels) {
        if (!first) oss << ", ";
        oss << key << ": " << value.to_string();
        first = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace pram
