#pragma once

#include <nlohmann/json.hpp>

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <functional>
#include <sstream>
#include <string>

namespace Ids
{
    class Id
    {
      public:
        friend Id generateId();

        Id(Id const&) = default;
        Id(Id&&) = default;
        Id& operator=(Id const&) = default;
        Id& operator=(Id&&) = default;
        ~Id() = default;

        std::string const& id() const
        {
            return id_;
        }

        auto operator*() const
        {
            return id_;
        }

        std::string value() const
        {
            return id_;
        }

        friend std::strong_ordering operator<=>(Id const& lhs, Id const& rhs) = default;

        bool isValid() const
        {
            return id_ != "INVALID_ID" && !id_.empty();
        }

      protected:
        Id() = delete;
        explicit Id(std::string const& id)
            : id_{id}
        {}

      private:
        std::string id_;
    };

    struct IdHash
    {
        template <typename T>
        std::size_t operator()(T const& id) const
        {
            return std::hash<std::string>{}(id.value());
        }
    };

    inline Id generateId()
    {
        thread_local boost::uuids::random_generator generator{};
        std::stringstream sstr;
        sstr << generator();
        return Id{sstr.str()};
    }

    /**
     * @brief Backend identifiers arrive as strings or integers, both are kept as their string form.
     */
    inline std::string idStringFromJson(nlohmann::json const& j)
    {
        if (j.is_number_integer())
            return std::to_string(j.get<long long>());
        return j.get<std::string>();
    }
}

#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        class name : public Id \
        { \
          public: \
            friend name generate##name(); \
            friend name make##name(std::string const&); \
\
          public: \
            name() \
                : Id{"INVALID_ID"} \
            {} \
            name(Id id) \
                : Id{std::move(id)} \
            {} \
\
          private: \
            name(std::string const& str) \
                : Id{str} \
            {} \
        }; \
\
        inline name generate##name() \
        { \
            return name{generateId().value()}; \
        } \
\
        inline name make##name(std::string const& str) \
        { \
            return name{str}; \
        } \
        inline void to_json(nlohmann::json& j, name const& id) \
        { \
            j = id.value(); \
        } \
        inline void from_json(nlohmann::json const& j, name& id) \
        { \
            id = make##name(idStringFromJson(j)); \
        } \
    }
