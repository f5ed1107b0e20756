#ifndef XML_SCAN_HPP
#define XML_SCAN_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rplayer {

// Minimal element scanner for the small, well-formed XML documents the
// upstream service returns. No DTDs, no namespaces, no validation.
struct XmlElement {
    std::string name;
    std::map<std::string, std::string> attributes;
    std::string inner;  // raw content between the start and end tag

    std::string attribute(const std::string& key) const;

    // Decoded text content with child markup removed
    std::string text() const;

    // Descendants with the given tag name, document order
    std::vector<XmlElement> find_all(const std::string& tag) const;
    std::optional<XmlElement> find(const std::string& tag) const;

    // Decoded, trimmed text of the first descendant with this tag, or ""
    std::string child_text(const std::string& tag) const;
};

std::vector<XmlElement> xml_find_all(const std::string& document, const std::string& tag);
std::optional<XmlElement> xml_find(const std::string& document, const std::string& tag);

// Replace entity and character references; CDATA sections are unwrapped
std::string xml_decode(const std::string& text);

} // namespace rplayer

#endif // XML_SCAN_HPP
