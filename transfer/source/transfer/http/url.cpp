#include <transfer/http/url.hpp>

namespace Transfer::Http
{
    std::expected<Url, std::string> Url::parse(std::string const& url)
    {
        const auto schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos)
            return std::unexpected("Missing scheme in '" + url + "'");

        Url result{};
        result.scheme = url.substr(0, schemeEnd);
        if (result.scheme != "http" && result.scheme != "https")
            return std::unexpected("Unsupported scheme '" + result.scheme + "'");
        result.port = result.isSecure() ? "443" : "80";

        const auto authorityStart = schemeEnd + 3;
        const auto targetStart = url.find_first_of("/?", authorityStart);
        const auto authority = url.substr(
            authorityStart, targetStart == std::string::npos ? std::string::npos : targetStart - authorityStart);
        if (authority.empty())
            return std::unexpected("Missing host in '" + url + "'");

        if (const auto colon = authority.rfind(':'); colon != std::string::npos && authority.back() != ']')
        {
            result.host = authority.substr(0, colon);
            result.port = authority.substr(colon + 1);
            if (result.port.empty())
                return std::unexpected("Empty port in '" + url + "'");
        }
        else
            result.host = authority;

        if (targetStart != std::string::npos)
        {
            result.target = url.substr(targetStart);
            if (result.target.front() == '?')
                result.target.insert(result.target.begin(), '/');
        }
        return result;
    }

    Url Url::withPath(std::string const& path) const
    {
        Url result = *this;
        if (path.empty())
            return result;
        if (result.target.back() == '/' && path.front() == '/')
            result.target += path.substr(1);
        else if (result.target.back() != '/' && path.front() != '/')
            result.target += "/" + path;
        else
            result.target += path;
        return result;
    }
}
