#pragma once

#include <utility/algorithm/case_convert.hpp>
#include <utility/describe.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Utility
{
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            throw std::invalid_argument("Invalid enum value");
        return result;
    }

    /**
     * @brief Looks up an enumerator by name, optionally ignoring ASCII case.
     */
    template <typename EnumType>
    std::optional<EnumType> tryEnumFromString(std::string_view str, bool ignoreCase = false)
    {
        std::optional<EnumType> enumValue{};
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>(
            [&enumValue, str, ignoreCase](auto desc) {
                if (enumValue)
                    return;
                if (ignoreCase ? Algorithm::equalsIgnoreCase(str, desc.name) : str == desc.name)
                    enumValue = desc.value;
            });
        return enumValue;
    }

    template <typename EnumType>
    EnumType enumFromString(std::string const& str)
    {
        if (auto enumValue = tryEnumFromString<EnumType>(str); enumValue)
            return *enumValue;
        throw std::invalid_argument("Invalid enum string: " + str);
    }
}
