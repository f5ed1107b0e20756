#include "xml_scan.hpp"
#include "text_util.hpp"

#include <cctype>
#include <cstdint>

namespace rplayer {

namespace {

bool is_name_end(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '>' || c == '/';
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string decode_entities(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out += text[i];
            continue;
        }
        size_t semi = text.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out += text[i];
            continue;
        }
        std::string entity = text.substr(i + 1, semi - i - 1);
        if (entity == "amp") out += '&';
        else if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "quot") out += '"';
        else if (entity == "apos") out += '\'';
        else if (!entity.empty() && entity[0] == '#') {
            try {
                uint32_t cp = (entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X'))
                    ? static_cast<uint32_t>(std::stoul(entity.substr(2), nullptr, 16))
                    : static_cast<uint32_t>(std::stoul(entity.substr(1)));
                append_utf8(out, cp);
            } catch (const std::exception&) {
                out += text.substr(i, semi - i + 1);
            }
        } else {
            out += text.substr(i, semi - i + 1);
        }
        i = semi;
    }
    return out;
}

// Parse attributes between the tag name and the closing '>'
std::map<std::string, std::string> parse_attributes(const std::string& raw) {
    std::map<std::string, std::string> attrs;
    size_t i = 0;
    while (i < raw.size()) {
        while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        size_t key_start = i;
        while (i < raw.size() && raw[i] != '=' && !std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        std::string key = raw.substr(key_start, i - key_start);
        while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        if (i >= raw.size() || raw[i] != '=') {
            if (!key.empty() && key != "/") attrs[key] = "";
            ++i;
            continue;
        }
        ++i;
        while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
        if (i >= raw.size()) break;
        char quote = raw[i];
        if (quote != '"' && quote != '\'') {
            size_t value_start = i;
            while (i < raw.size() && !std::isspace(static_cast<unsigned char>(raw[i]))) ++i;
            attrs[key] = decode_entities(raw.substr(value_start, i - value_start));
            continue;
        }
        size_t close = raw.find(quote, i + 1);
        if (close == std::string::npos) break;
        attrs[key] = decode_entities(raw.substr(i + 1, close - i - 1));
        i = close + 1;
    }
    return attrs;
}

// Find the end of the start tag beginning at pos, honouring quoted '>'
size_t find_tag_end(const std::string& doc, size_t pos) {
    char quote = 0;
    for (size_t i = pos; i < doc.size(); ++i) {
        char c = doc[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i;
        }
    }
    return std::string::npos;
}

// Matching close tag for an element whose content starts at pos
size_t find_close(const std::string& doc, const std::string& tag, size_t pos, size_t& content_end) {
    int depth = 1;
    size_t i = pos;
    const std::string open = "<" + tag;
    const std::string close = "</" + tag;
    while (i < doc.size()) {
        size_t next_open = doc.find(open, i);
        size_t next_close = doc.find(close, i);
        if (next_close == std::string::npos) {
            return std::string::npos;
        }
        if (next_open != std::string::npos && next_open < next_close &&
            next_open + open.size() < doc.size() && is_name_end(doc[next_open + open.size()])) {
            size_t end = find_tag_end(doc, next_open);
            if (end == std::string::npos) return std::string::npos;
            if (doc[end - 1] != '/') ++depth;
            i = end + 1;
            continue;
        }
        size_t end = doc.find('>', next_close);
        if (end == std::string::npos) return std::string::npos;
        if (--depth == 0) {
            content_end = next_close;
            return end + 1;
        }
        i = end + 1;
    }
    return std::string::npos;
}

} // namespace

std::string XmlElement::attribute(const std::string& key) const {
    auto it = attributes.find(key);
    return it == attributes.end() ? std::string() : it->second;
}

std::string XmlElement::text() const {
    return xml_decode(inner);
}

std::vector<XmlElement> XmlElement::find_all(const std::string& tag) const {
    return xml_find_all(inner, tag);
}

std::optional<XmlElement> XmlElement::find(const std::string& tag) const {
    return xml_find(inner, tag);
}

std::string XmlElement::child_text(const std::string& tag) const {
    auto child = find(tag);
    return child ? trim(child->text()) : std::string();
}

std::vector<XmlElement> xml_find_all(const std::string& document, const std::string& tag) {
    std::vector<XmlElement> result;
    const std::string open = "<" + tag;
    size_t pos = 0;
    while ((pos = document.find(open, pos)) != std::string::npos) {
        size_t after_name = pos + open.size();
        if (after_name >= document.size() || !is_name_end(document[after_name])) {
            pos = after_name;
            continue;
        }
        size_t tag_end = find_tag_end(document, after_name);
        if (tag_end == std::string::npos) {
            break;
        }

        XmlElement element;
        element.name = tag;
        bool self_closing = document[tag_end - 1] == '/';
        std::string raw_attrs = document.substr(after_name, tag_end - after_name - (self_closing ? 1 : 0));
        element.attributes = parse_attributes(raw_attrs);

        if (self_closing) {
            result.push_back(std::move(element));
            pos = tag_end + 1;
            continue;
        }

        size_t content_end = 0;
        size_t next = find_close(document, tag, tag_end + 1, content_end);
        if (next == std::string::npos) {
            break;
        }
        element.inner = document.substr(tag_end + 1, content_end - tag_end - 1);
        result.push_back(std::move(element));
        // Continue inside the element so nested same-name tags are found too
        pos = tag_end + 1;
    }
    return result;
}

std::optional<XmlElement> xml_find(const std::string& document, const std::string& tag) {
    auto all = xml_find_all(document, tag);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::string xml_decode(const std::string& text) {
    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        if (text.compare(i, 9, "<![CDATA[") == 0) {
            size_t end = text.find("]]>", i + 9);
            if (end == std::string::npos) {
                out += text.substr(i + 9);
                break;
            }
            out += text.substr(i + 9, end - i - 9);
            i = end + 3;
            continue;
        }
        if (text[i] == '<') {
            // Skip markup (child tags, comments)
            size_t end = text.compare(i, 4, "<!--") == 0 ? text.find("-->", i) : text.find('>', i);
            if (end == std::string::npos) break;
            i = end + (text.compare(i, 4, "<!--") == 0 ? 3 : 1);
            continue;
        }
        size_t next = text.find_first_of('<', i);
        std::string chunk = text.substr(i, next == std::string::npos ? std::string::npos : next - i);
        out += decode_entities(chunk);
        if (next == std::string::npos) break;
        i = next;
    }
    return out;
}

} // namespace rplayer
