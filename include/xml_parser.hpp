#ifndef ZONESCAN_XML_PARSER_HPP
#define ZONESCAN_XML_PARSER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>

namespace xml
{

class parse_error : public std::runtime_error
{
public:

    parse_error(const std::string& what, size_t where)
        : std::runtime_error {what}, m_where {where}
    {}

    /// Byte offset in the input where parsing stopped
    size_t where() const
    {
        return m_where;
    }

private:

    size_t m_where;

};

/**
 * One parsed element
 * Only the children are owned, the parent pointer is a plain back reference into the tree.
 * Nodes are pinned in memory once created so the back references stay valid.
 */
struct node
{
    node() = default;
    node(const node&) = delete;
    node& operator=(const node&) = delete;
    node(node&&) = delete;
    node& operator=(node&&) = delete;
    ~node() = default;

    std::string name;                           /// Tag name without namespace prefix, empty for the document root
    std::map<std::string, std::string> attributes;
    std::optional<std::string> text;            /// Direct text content
    node* parent = nullptr;
    std::vector<std::unique_ptr<node>> children;

    std::string attribute(const std::string& key) const;
};

using document = std::unique_ptr<node>;

/// Deepest element nesting parse() accepts
constexpr size_t max_depth = 256;

/**
 * Parses an xml string into a tree below a synthetic root node
 * Close tags that do not match the currently open element are ignored instead of rejected,
 * device descriptions in the wild are not always well formed.
 * Throws xml::parse_error on input that can not be tokenized at all or that nests deeper than max_depth.
 */
document parse(std::string_view input);

/**
 * Matches a chain of direct children by exact tag name, e.g. "/root/device/serviceList/service".
 * A leading slash is optional. There are no wildcards, attribute tests or descendant axes.
 * Results are in document order, a path that does not match simply yields nothing.
 */
std::vector<const node*> query(const node& root, std::string_view path);

/// Text of the first node matching path or an empty string
std::string query_text(const node& root, std::string_view path);

/// Writes the element structure (names, attributes, text and children) back to xml
std::string serialize(const node& n);

/**
 * Decodes xml that arrived url encoded and entity encoded a second time.
 * Only &lt; &gt; &quot; &#039; and &amp; are replaced, in that order.
 */
std::string decode(std::string_view encoded);

} // namespace xml

#endif
