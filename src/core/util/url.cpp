#include "dingstream/core/util/url.hpp"
#include <cctype>
#include <stdexcept>

namespace dingstream {

    ParsedUrl parseUrl(std::string_view url) {
        ParsedUrl out;
        auto pos = url.find("://");
        if (pos == std::string_view::npos)
            throw std::invalid_argument("url without scheme: " + std::string(url));

        out.scheme = std::string(url.substr(0, pos));
        for (auto& c : out.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        std::string defaultPort;
        if (out.scheme == "https" || out.scheme == "wss") defaultPort = "443";
        else if (out.scheme == "http" || out.scheme == "ws") defaultPort = "80";
        else throw std::invalid_argument("unsupported url scheme: " + out.scheme);

        std::string_view rest = url.substr(pos + 3);
        auto slash = rest.find_first_of("/?");
        std::string_view hostport = slash == std::string_view::npos ? rest : rest.substr(0, slash);
        if (slash == std::string_view::npos) {
            out.target = "/";
        } else if (rest[slash] == '?') {
            out.target = "/" + std::string(rest.substr(slash));
        } else {
            out.target = std::string(rest.substr(slash));
        }

        auto colon = hostport.rfind(':');
        if (colon == std::string_view::npos) {
            out.host = std::string(hostport);
            out.port = defaultPort;
        } else {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
            if (out.port.empty()) out.port = defaultPort;
        }
        if (out.host.empty())
            throw std::invalid_argument("url without host: " + std::string(url));
        return out;
    }

    std::string urlEncode(std::string_view value) {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(value.size());
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back('%');
                out.push_back(hex[c >> 4]);
                out.push_back(hex[c & 0x0F]);
            }
        }
        return out;
    }

}
