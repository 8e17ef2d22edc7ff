#pragma once

#include <nlohmann/json.hpp>
#include <utility/describe.hpp>
#include <utility/enum_string_convert.hpp>

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <string>

namespace SharedData
{
    namespace Detail
    {
        template <typename T>
        struct IsOptional : std::false_type
        {};
        template <typename T>
        struct IsOptional<std::optional<T>> : std::true_type
        {};

        /// Optional members are omitted from JSON when empty and read as empty when missing.
        template <typename T>
        concept OptionalMember = IsOptional<T>::value;
    }

    template <typename EnumT, typename EnumDescription = boost::describe::describe_enumerators<EnumT>>
    void to_json(nlohmann::json& j, EnumT const& e)
    {
        j = Utility::enumToString<EnumT>(e);
    }
    template <typename EnumT, typename EnumDescription = boost::describe::describe_enumerators<EnumT>>
    void from_json(nlohmann::json const& j, EnumT& e)
    {
        e = Utility::enumFromString<EnumT>(j.template get<std::string>());
    }

    template <
        typename T,
        class Bases = boost::describe::describe_bases<T, boost::describe::mod_any_access>,
        class Members = boost::describe::describe_members<T, boost::describe::mod_any_access>,
        class Enable = std::enable_if_t<!std::is_union_v<T>>>
    void to_json(nlohmann::json& j, T const& obj)
    {
        j = nlohmann::json::object();

        boost::mp11::mp_for_each<Bases>([&](auto&& base) {
            using type = typename std::decay_t<decltype(base)>::type;
            to_json(j, static_cast<type const&>(obj));
        });
        boost::mp11::mp_for_each<Members>([&](auto&& memAccessor) {
            using memberType = std::decay_t<decltype(obj.*memAccessor.pointer)>;
            if constexpr (Detail::OptionalMember<memberType>)
            {
                if (obj.*memAccessor.pointer)
                    j[memAccessor.name] = *(obj.*memAccessor.pointer);
            }
            else
            {
                j[memAccessor.name] = obj.*memAccessor.pointer;
            }
        });
    }

    template <
        typename T,
        class Bases = boost::describe::describe_bases<T, boost::describe::mod_any_access>,
        class Members = boost::describe::describe_members<T, boost::describe::mod_any_access>,
        class Enable = std::enable_if_t<!std::is_union_v<T>>>
    void from_json(nlohmann::json const& j, T& obj)
    {
        boost::mp11::mp_for_each<Bases>([&](auto&& base) {
            using type = typename std::decay_t<decltype(base)>::type;
            from_json(j, static_cast<type&>(obj));
        });
        boost::mp11::mp_for_each<Members>([&](auto&& memAccessor) {
            using memberType = std::decay_t<decltype(obj.*memAccessor.pointer)>;
            if constexpr (Detail::OptionalMember<memberType>)
            {
                if (j.contains(memAccessor.name) && !j.at(memAccessor.name).is_null())
                    obj.*memAccessor.pointer = j.at(memAccessor.name).template get<typename memberType::value_type>();
                else
                    obj.*memAccessor.pointer = std::nullopt;
            }
            else
            {
                if (j.contains(memAccessor.name))
                    j.at(memAccessor.name).get_to(obj.*memAccessor.pointer);
                else
                    throw std::runtime_error(
                        std::string("Missing required field '") + memAccessor.name + "' in JSON object");
            }
        });
    }
}
