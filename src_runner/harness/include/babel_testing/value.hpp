#pragma once

#include "failure.hpp"
#include "ir.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace babel::testing {

/**
 * \brief Value returned by an invoked target: normalized JSON payload plus its runtime type name.
 *
 * The payload is what the matcher compares; the type name is what `type` expectations check.
 */
class Value {
public:
    Value() = default;
    Value(json data, std::string type_name) : data_(std::move(data)), type_name_{std::move(type_name)} {}

    /// Payload with the neutral name of its JSON kind.
    [[nodiscard]] static Value from_json(json data);

    [[nodiscard]] const json& data() const noexcept { return data_; }
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] bool is_null() const noexcept { return data_.is_null(); }

private:
    json data_{};
    std::string type_name_{"null"};
};

/// `null`, `bool`, `int`, `float`, `string`, `array` or `object`.
[[nodiscard]] const char* json_type_name(const json& data) noexcept;

namespace detail {

template <typename T, typename = void>
struct has_to_json_member : std::false_type {};
template <typename T>
struct has_to_json_member<T, std::void_t<decltype(std::declval<const T&>().to_json())>> : std::true_type {};

template <typename T, typename = void>
struct has_serialize_member : std::false_type {};
template <typename T>
struct has_serialize_member<T, std::void_t<decltype(std::declval<const T&>().serialize())>> : std::true_type {};

template <typename T, typename = void>
struct is_range : std::false_type {};
template <typename T>
struct is_range<T, std::void_t<decltype(std::declval<const T&>().begin()), decltype(std::declval<const T&>().end())>>
    : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

}  // namespace detail

/**
 * \brief Builds a Value from an arbitrary C++ result.
 *
 * Order: Value/json pass-through, `to_json()` member, `serialize()` member, std::optional,
 * records with nlohmann ADL serialization (named after their class), then scalars and containers.
 */
template <typename T>
[[nodiscard]] Value capture(T&& value) {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;

    if constexpr (std::is_same_v<U, Value>) {
        return std::forward<T>(value);
    } else if constexpr (std::is_same_v<U, json>) {
        return Value::from_json(std::forward<T>(value));
    } else if constexpr (detail::has_to_json_member<U>::value) {
        return Value{json(value.to_json()), unqualified_type_name(typeid(U))};
    } else if constexpr (detail::has_serialize_member<U>::value) {
        return Value{json(value.serialize()), unqualified_type_name(typeid(U))};
    } else if constexpr (detail::is_optional<U>::value) {
        if (!value) {
            return Value{};
        }
        return capture(*value);
    } else if constexpr (std::is_class_v<U> && !detail::is_range<U>::value) {
        static_assert(std::is_constructible_v<json, const U&>,
                      "record results need nlohmann to_json (NLOHMANN_DEFINE_TYPE_*) or a to_json() member");
        return Value{json(value), unqualified_type_name(typeid(U))};
    } else {
        static_assert(std::is_constructible_v<json, const U&>, "result type is not convertible to JSON");
        return Value::from_json(json(value));
    }
}

}  // namespace babel::testing
