#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace rplayer {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> split_list(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex;

    for (char c : str) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << std::uppercase;
            encoded << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
            encoded << std::nouppercase;
        }
    }

    return encoded.str();
}

std::string form_encode(const std::map<std::string, std::string>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out += '&';
        }
        out += url_encode(key) + "=" + url_encode(value);
    }
    return out;
}

std::string with_query(const std::string& url, const std::map<std::string, std::string>& params) {
    std::string base = url;
    std::string fragment;
    size_t hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base = base.substr(0, hash);
    }

    std::vector<std::string> kept;
    size_t qpos = base.find('?');
    if (qpos != std::string::npos) {
        std::string query = base.substr(qpos + 1);
        base = base.substr(0, qpos);
        std::stringstream ss(query);
        std::string pair;
        while (std::getline(ss, pair, '&')) {
            if (pair.empty()) continue;
            std::string key = pair.substr(0, pair.find('='));
            if (params.find(key) == params.end()) {
                kept.push_back(pair);
            }
        }
    }

    std::string query;
    for (const auto& pair : kept) {
        query += (query.empty() ? "" : "&") + pair;
    }
    std::string extra = form_encode(params);
    if (!extra.empty()) {
        query += (query.empty() ? "" : "&") + extra;
    }
    return query.empty() ? base + fragment : base + "?" + query + fragment;
}

std::string resolve_url(const std::string& base, const std::string& ref) {
    if (ref.find("://") != std::string::npos) {
        return ref;
    }
    size_t scheme_end = base.find("://");
    if (scheme_end == std::string::npos) {
        return ref;
    }
    if (starts_with(ref, "//")) {
        return base.substr(0, scheme_end + 1) + ref;
    }
    size_t host_end = base.find('/', scheme_end + 3);
    std::string origin = host_end == std::string::npos ? base : base.substr(0, host_end);
    if (starts_with(ref, "/")) {
        return origin + ref;
    }
    std::string path = base.substr(0, base.find_first_of("?#"));
    size_t last_slash = path.rfind('/');
    if (last_slash == std::string::npos || last_slash < scheme_end + 3) {
        return origin + "/" + ref;
    }
    return path.substr(0, last_slash + 1) + ref;
}

std::string base64_encode(const std::string& data) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8) |
                     static_cast<unsigned char>(data[i + 2]);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += table[n & 0x3F];
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<unsigned char>(data[i]) << 16;
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8);
        out += table[(n >> 18) & 0x3F];
        out += table[(n >> 12) & 0x3F];
        out += table[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string random_hex(size_t bytes) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << dist(rng);
    }
    return out.str();
}

std::string fit_text(const std::string& text, size_t max_len) {
    // Count code points, not bytes, so Japanese titles are not cut mid-character
    size_t count = 0;
    size_t cut = std::string::npos;
    size_t limit = max_len > 3 ? max_len - 3 : 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (count == limit) {
                cut = i;
            }
            ++count;
        }
    }
    if (count <= max_len) {
        return text;
    }
    if (max_len <= 3) {
        return std::string(max_len, '.');
    }
    return text.substr(0, cut) + "...";
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace rplayer
