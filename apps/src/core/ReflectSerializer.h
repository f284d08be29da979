#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ReflectSerializerAdl {

// Wrapping the json in a distinct type keeps nlohmann's own to_json/from_json
// templates out of overload resolution, so only user-declared converters match.
struct JsonAdapter {
    nlohmann::json& json;
    operator nlohmann::json&() const { return json; }
};

struct ConstJsonAdapter {
    const nlohmann::json& json;
    operator const nlohmann::json&() const { return json; }
};

template <typename T>
auto test_to_json(int)
    -> decltype(to_json(JsonAdapter{ std::declval<nlohmann::json&>() }, std::declval<const T&>()), std::true_type{});

template <typename T>
std::false_type test_to_json(...);

template <typename T>
inline constexpr bool has_adl_to_json_v = decltype(test_to_json<T>(0))::value;

template <typename T>
auto test_from_json(int)
    -> decltype(from_json(ConstJsonAdapter{ std::declval<const nlohmann::json&>() }, std::declval<T&>()), std::true_type{});

template <typename T>
std::false_type test_from_json(...);

template <typename T>
inline constexpr bool has_adl_from_json_v = decltype(test_from_json<T>(0))::value;

} // namespace ReflectSerializerAdl

/**
 * Reflection-based JSON serialization for aggregate config structs.
 *
 * Member names become JSON keys. Enum members use the enum's own ADL
 * to_json/from_json when declared, otherwise the enumerator name.
 * from_json only overwrites members present in the JSON, so defaults survive
 * partial documents.
 *
 * Example:
 *   struct Point { double x = 0.0; double y = 0.0; };
 *   auto j = ReflectSerializer::to_json(Point{ 1.5, 2.5 });
 *   auto p = ReflectSerializer::from_json<Point>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename EnumType>
nlohmann::json enumToJson(const EnumType& value)
{
    nlohmann::json out;
    if constexpr (ReflectSerializerAdl::has_adl_to_json_v<EnumType>) {
        to_json(ReflectSerializerAdl::JsonAdapter{ out }, value);
    }
    else {
        out = std::string(reflect::enum_name(value));
    }
    return out;
}

template <typename EnumType>
void enumFromJson(const nlohmann::json& j, EnumType& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_from_json_v<EnumType>) {
        from_json(ReflectSerializerAdl::ConstJsonAdapter{ j }, value);
    }
    else {
        const auto str = j.get<std::string>();
        for (const auto& [enumValue, enumName] : reflect::enumerators<EnumType>) {
            if (enumName == str) {
                value = static_cast<EnumType>(enumValue);
                return;
            }
        }
        throw std::runtime_error("Invalid enum value: " + str);
    }
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();
    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    if constexpr (std::is_enum_v<typename MemberType::value_type>) {
                        j[name] = enumToJson(*value);
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = enumToJson(value);
            }
            else {
                j[name] = value;
            }
        },
        obj);
    return j;
}

template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};
    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name)) {
                return;
            }
            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if constexpr (is_optional_v<MemberType>) {
                if (j[name].is_null()) {
                    return;
                }
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    InnerType inner{};
                    enumFromJson(j[name], inner);
                    reflect::get<I>(obj) = inner;
                }
                else {
                    reflect::get<I>(obj) = j[name].template get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                enumFromJson(j[name], reflect::get<I>(obj));
            }
            else {
                reflect::get<I>(obj) = j[name].template get<MemberType>();
            }
        },
        obj);
    return obj;
}

} // namespace ReflectSerializer
