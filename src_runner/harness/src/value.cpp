#include "babel_testing/value.hpp"

namespace babel::testing {

Value Value::from_json(json data) {
    std::string name = json_type_name(data);
    return Value{std::move(data), std::move(name)};
}

const char* json_type_name(const json& data) noexcept {
    switch (data.type()) {
        case json::value_t::null: return "null";
        case json::value_t::boolean: return "bool";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned: return "int";
        case json::value_t::number_float: return "float";
        case json::value_t::string: return "string";
        case json::value_t::array: return "array";
        case json::value_t::object: return "object";
        case json::value_t::binary: return "bytes";
        case json::value_t::discarded: return "null";
    }
    return "null";
}

}  // namespace babel::testing
