#ifndef TEXT_UTIL_HPP
#define TEXT_UTIL_HPP

#include <map>
#include <string>
#include <vector>

namespace rplayer {

// Trim leading/trailing whitespace
std::string trim(const std::string& str);

std::string to_lower(const std::string& str);

// Split on a delimiter, trimming each part and dropping empty ones
std::vector<std::string> split_list(const std::string& str, char delim = ',');

std::string url_encode(const std::string& str);

// Encode key=value pairs as application/x-www-form-urlencoded
std::string form_encode(const std::map<std::string, std::string>& params);

// Append query parameters, replacing keys already present in the URL
std::string with_query(const std::string& url, const std::map<std::string, std::string>& params);

// Resolve a (possibly relative) playlist entry against the URL it came from
std::string resolve_url(const std::string& base, const std::string& ref);

std::string base64_encode(const std::string& data);

// Random lowercase hex string of the given byte length
std::string random_hex(size_t bytes);

// Cut to max_len characters with a trailing "..." (UTF-8 aware)
std::string fit_text(const std::string& text, size_t max_len);

bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

} // namespace rplayer

#endif // TEXT_UTIL_HPP
