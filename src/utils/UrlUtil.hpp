#pragma once
#include <string>
#include <vector>

namespace Fanout {
namespace UrlUtil {

// Extract absolute URLs from text and sanitize trailing punctuation
std::vector<std::string> ExtractUrls(const std::string& text);

// True for syntactically plausible absolute http:// or https:// URLs with a host.
bool IsHttpUrl(const std::string& url);

// Lowercased host (without port) of an absolute URL, empty if there is none.
std::string ExtractHost(const std::string& url);

// ASCII case-insensitive prefix test, used for Content-Type matching.
bool StartsWithIgnoreCase(const std::string& s, const std::string& prefix);

}
}
