#pragma once

#include <nlohmann/json.hpp>
#include <reflect>
#include <string>
#include <type_traits>

/**
 * Reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time member iteration and nlohmann/json for
 * the document. Member names become JSON keys.
 *
 * Example:
 *   struct Point { double x = 0.0; double y = 0.0; };
 *   auto j = ReflectSerializer::to_json(Point{ 1.5, 2.5 });
 *   auto p = ReflectSerializer::from_json<Point>(j);
 */
namespace BouncePit::ReflectSerializer {

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            j[name] = reflect::get<I>(obj);
        },
        obj);

    return j;
}

/**
 * Overlay the keys present in @p j onto @p base. Keys missing from the
 * document keep the value from @p base; unknown keys are ignored.
 * Throws nlohmann::json::exception when a present key has the wrong type.
 */
template <typename T>
T from_json(const nlohmann::json& j, T base = T{})
{
    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(base));
            if (j.contains(name)) {
                using MemberType = std::remove_cvref_t<decltype(reflect::get<I>(base))>;
                reflect::get<I>(base) = j.at(name).template get<MemberType>();
            }
        },
        base);

    return base;
}

} // namespace BouncePit::ReflectSerializer
