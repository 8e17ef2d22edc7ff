#pragma once

#include <expected>
#include <string>

namespace Transfer::Http
{
    struct Url
    {
        std::string scheme{"http"};
        std::string host{};
        std::string port{"80"};
        /// Path and query, never empty.
        std::string target{"/"};

        bool isSecure() const
        {
            return scheme == "https";
        }

        static std::expected<Url, std::string> parse(std::string const& url);

        /**
         * @brief Appends a path to the target, avoiding doubled slashes.
         */
        Url withPath(std::string const& path) const;
    };
}
