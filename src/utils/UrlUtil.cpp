#include "UrlUtil.hpp"
#include <regex>
#include <algorithm>
#include <cctype>

namespace Fanout {
namespace UrlUtil {

static inline std::string CleanUrl(std::string s) {
    auto rtrim_any = [](std::string& x, const std::string& chars) {
        while (!x.empty() && chars.find(x.back()) != std::string::npos) x.pop_back();
    };

    // 1) Strip common trailing punctuation
    rtrim_any(s, ")],.!?;:");

    // 2) Fix parenthesis balance: drop extra trailing ')'
    auto count_char = [](const std::string& x, char c){ return static_cast<int>(std::count(x.begin(), x.end(), c)); };
    while (!s.empty() && count_char(s, ')') > count_char(s, '(') && s.back() == ')') {
        s.pop_back();
    }

    return s;
}

std::vector<std::string> ExtractUrls(const std::string& text) {
    std::vector<std::string> urls;
    static const std::regex url_regex(R"((https?://[^\s<>"']+))");
    auto words_begin = std::sregex_iterator(text.begin(), text.end(), url_regex);
    auto words_end = std::sregex_iterator();

    for (std::sregex_iterator i = words_begin; i != words_end; ++i) {
        auto u = CleanUrl(i->str());
        if (!u.empty()) urls.push_back(std::move(u));
    }
    return urls;
}

static inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

bool StartsWithIgnoreCase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower((unsigned char)s[i]) != std::tolower((unsigned char)prefix[i])) return false;
    }
    return true;
}

std::string ExtractHost(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return {};
    auto start = scheme_end + 3;
    auto end = url.find_first_of("/\\?#", start);
    if (end == std::string::npos) end = url.size();
    std::string authority = url.substr(start, end - start);
    // Drop userinfo and port
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        return close == std::string::npos ? std::string() : ToLower(authority.substr(0, close + 1));
    }
    auto colon = authority.find(':');
    if (colon != std::string::npos) authority = authority.substr(0, colon);
    return ToLower(authority);
}

bool IsHttpUrl(const std::string& url) {
    if (!(StartsWithIgnoreCase(url, "http://") || StartsWithIgnoreCase(url, "https://"))) return false;
    if (std::any_of(url.begin(), url.end(), [](unsigned char c) { return std::isspace(c) || c < 0x20; })) return false;
    return !ExtractHost(url).empty();
}

}
}
