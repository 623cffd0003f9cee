#include "xml_parser.hpp"

#include "utils.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

namespace xml
{

static std::string strip_namespace(std::string_view name)
{
    std::string_view::size_type colon = name.find(':');
    if(colon != std::string_view::npos)
        name.remove_prefix(colon + 1);
    return std::string {name};
}

static void append_utf8(std::string& out, uint32_t cp)
{
    if(cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if(cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if(cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Resolves one entity reference (without & and ;). Returns false for anything unknown.
static bool resolve_entity(std::string_view entity, std::string& out)
{
    if(entity == "lt")
        out.push_back('<');
    else if(entity == "gt")
        out.push_back('>');
    else if(entity == "amp")
        out.push_back('&');
    else if(entity == "quot")
        out.push_back('"');
    else if(entity == "apos")
        out.push_back('\'');
    else if(entity.size() > 1 && entity[0] == '#')
    {
        uint32_t cp = 0;
        int base = 10;
        entity.remove_prefix(1);
        if(entity[0] == 'x' || entity[0] == 'X')
        {
            base = 16;
            entity.remove_prefix(1);
        }

        auto res = std::from_chars(entity.data(), entity.data() + entity.size(), cp, base);
        if(entity.empty() || res.ec != std::errc {} || res.ptr != entity.data() + entity.size() || cp > 0x10FFFF)
            return false;

        append_utf8(out, cp);
    }
    else
        return false;

    return true;
}

static std::string decode_entities(std::string_view raw)
{
    std::string decoded;
    decoded.reserve(raw.size());

    for(size_t i = 0; i < raw.size(); ++i)
    {
        if(raw[i] == '&')
        {
            size_t semicolon = raw.find(';', i + 1);
            if(semicolon != std::string_view::npos && resolve_entity(raw.substr(i + 1, semicolon - i - 1), decoded))
            {
                i = semicolon;
                continue;
            }
        }
        decoded.push_back(raw[i]);
    }

    return decoded;
}

static bool is_blank(std::string_view view)
{
    for(char c : view)
    {
        if(!std::isspace(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

namespace
{

// Builds the node tree from the events of the tokenizer
class tree_builder
{
public:

    tree_builder()
        : m_root {std::make_unique<node>()}, m_current {m_root.get()}
    {}

    void on_open_tag(std::string_view name, std::map<std::string, std::string>&& attributes, size_t where)
    {
        if(m_depth >= max_depth)
            throw parse_error {"Elements are nested too deeply", where};
        ++m_depth;

        auto child = std::make_unique<node>();
        child->name = strip_namespace(name);
        child->attributes = std::move(attributes);
        child->parent = m_current;

        node* next = child.get();
        m_current->children.push_back(std::move(child));
        m_current = next;
    }

    void on_text(std::string&& text)
    {
        if(m_current->text)
            m_current->text->append(text);
        else
            m_current->text = std::move(text);
    }

    void on_close_tag(std::string_view name)
    {
        // A close tag for anything but the open element leaves the tree as it is
        if(m_current->parent != nullptr && m_current->name == strip_namespace(name))
        {
            m_current = m_current->parent;
            --m_depth;
        }
    }

    document release()
    {
        m_current = nullptr;
        return std::move(m_root);
    }

private:

    document m_root;

    node* m_current;

    size_t m_depth = 0;

};

// Single pass tokenizer pushing open tag, text and close tag events into a tree_builder
class tokenizer
{
public:

    tokenizer(std::string_view input, tree_builder& builder)
        : m_input {input}, m_builder {builder}
    {}

    void run()
    {
        bool element_seen = false;

        while(m_pos < m_input.size())
        {
            if(m_input[m_pos] != '<')
            {
                read_text();
            }
            else if(starts_with("<!--"))
            {
                skip_past("-->", "Unterminated comment");
            }
            else if(starts_with("<![CDATA["))
            {
                size_t start = m_pos + 9;
                size_t end = m_input.find("]]>", start);
                if(end == std::string_view::npos)
                    throw parse_error {"Unterminated CDATA section", m_pos};

                m_builder.on_text(std::string {m_input.substr(start, end - start)});
                m_pos = end + 3;
            }
            else if(starts_with("<?"))
            {
                skip_past("?>", "Unterminated processing instruction");
            }
            else if(starts_with("<!"))
            {
                skip_declaration();
            }
            else if(starts_with("</"))
            {
                read_close_tag();
            }
            else
            {
                read_open_tag();
                element_seen = true;
            }
        }

        if(!element_seen)
            throw parse_error {"Document contains no element", m_pos};
    }

private:

    bool starts_with(std::string_view token) const
    {
        return m_input.substr(m_pos, token.size()) == token;
    }

    void skip_past(std::string_view terminator, const char* error)
    {
        size_t end = m_input.find(terminator, m_pos);
        if(end == std::string_view::npos)
            throw parse_error {error, m_pos};
        m_pos = end + terminator.size();
    }

    void skip_whitespace()
    {
        while(m_pos < m_input.size() && std::isspace(static_cast<unsigned char>(m_input[m_pos])))
            ++m_pos;
    }

    // <!DOCTYPE ...> with an optional [ internal subset ]
    void skip_declaration()
    {
        size_t depth = 0;
        for(size_t i = m_pos + 2; i < m_input.size(); ++i)
        {
            if(m_input[i] == '[')
                ++depth;
            else if(m_input[i] == ']' && depth > 0)
                --depth;
            else if(m_input[i] == '>' && depth == 0)
            {
                m_pos = i + 1;
                return;
            }
        }
        throw parse_error {"Unterminated declaration", m_pos};
    }

    void read_text()
    {
        size_t end = m_input.find('<', m_pos);
        if(end == std::string_view::npos)
            end = m_input.size();

        std::string_view raw = m_input.substr(m_pos, end - m_pos);
        if(!is_blank(raw))
            m_builder.on_text(decode_entities(raw));

        m_pos = end;
    }

    std::string_view read_name()
    {
        size_t start = m_pos;
        while(m_pos < m_input.size())
        {
            char c = m_input[m_pos];
            if(std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '>' || c == '=' || c == '<')
                break;
            ++m_pos;
        }
        return m_input.substr(start, m_pos - start);
    }

    void read_close_tag()
    {
        size_t tag_start = m_pos;
        m_pos += 2;

        std::string_view name = read_name();
        if(name.empty())
            throw parse_error {"Expected element name in close tag", m_pos};

        skip_whitespace();
        if(m_pos >= m_input.size() || m_input[m_pos] != '>')
            throw parse_error {"Unterminated close tag", tag_start};
        ++m_pos;

        m_builder.on_close_tag(name);
    }

    void read_open_tag()
    {
        size_t tag_start = m_pos;
        ++m_pos;

        std::string_view name = read_name();
        if(name.empty())
            throw parse_error {"Expected element name", m_pos};

        std::map<std::string, std::string> attributes;
        while(true)
        {
            skip_whitespace();
            if(m_pos >= m_input.size())
                throw parse_error {"Unterminated tag", tag_start};

            if(m_input[m_pos] == '>')
            {
                ++m_pos;
                m_builder.on_open_tag(name, std::move(attributes), tag_start);
                return;
            }

            if(starts_with("/>"))
            {
                m_pos += 2;
                m_builder.on_open_tag(name, std::move(attributes), tag_start);
                m_builder.on_close_tag(name);
                return;
            }

            std::string_view key = read_name();
            if(key.empty())
                throw parse_error {"Expected attribute name", m_pos};

            skip_whitespace();
            if(m_pos >= m_input.size() || m_input[m_pos] != '=')
                throw parse_error {"Expected '=' after attribute name", m_pos};
            ++m_pos;

            skip_whitespace();
            if(m_pos >= m_input.size() || (m_input[m_pos] != '"' && m_input[m_pos] != '\''))
                throw parse_error {"Expected quoted attribute value", m_pos};

            char quote = m_input[m_pos++];
            size_t end = m_input.find(quote, m_pos);
            if(end == std::string_view::npos)
                throw parse_error {"Unterminated attribute value", m_pos};

            attributes.emplace(std::string {key}, decode_entities(m_input.substr(m_pos, end - m_pos)));
            m_pos = end + 1;
        }
    }

    std::string_view m_input;

    size_t m_pos = 0;

    tree_builder& m_builder;

};

} // anonymous namespace

std::string node::attribute(const std::string& key) const
{
    auto it = attributes.find(key);
    return (it != attributes.end()) ? it->second : std::string {};
}

document parse(std::string_view input)
{
    tree_builder builder;
    tokenizer {input, builder}.run();
    return builder.release();
}

static void sub_query(const std::vector<std::string_view>& path, size_t depth, const node& parent,
    std::vector<const node*>& results)
{
    for(const auto& child : parent.children)
    {
        if(child->name != path[depth])
            continue;

        if(depth + 1 < path.size())
            sub_query(path, depth + 1, *child, results);
        else
            results.push_back(child.get());
    }
}

std::vector<const node*> query(const node& root, std::string_view path)
{
    std::vector<std::string_view> segments;
    for(size_t start = 0; ; )
    {
        size_t sep = path.find('/', start);
        if(sep == std::string_view::npos)
        {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, sep - start));
        start = sep + 1;
    }

    // Leading "/" only marks the document root
    if(segments.front().empty())
        segments.erase(segments.begin());

    std::vector<const node*> results;
    if(!segments.empty())
        sub_query(segments, 0, root, results);

    return results;
}

std::string query_text(const node& root, std::string_view path)
{
    std::vector<const node*> nodes = query(root, path);
    if(nodes.empty() || !nodes.front()->text)
        return {};
    return *nodes.front()->text;
}

static std::string escape(std::string_view raw, bool attribute)
{
    std::string escaped;
    escaped.reserve(raw.size());
    for(char c : raw)
    {
        switch(c)
        {
            case '<':
                escaped.append("&lt;");
                break;
            case '>':
                escaped.append("&gt;");
                break;
            case '&':
                escaped.append("&amp;");
                break;
            case '"':
                if(attribute)
                    escaped.append("&quot;");
                else
                    escaped.push_back(c);
                break;
            default:
                escaped.push_back(c);
        }
    }
    return escaped;
}

std::string serialize(const node& n)
{
    std::string out;
    if(n.name.empty())
    {
        for(const auto& child : n.children)
            out.append(serialize(*child));
        return out;
    }

    out.append("<").append(n.name);
    for(const auto& [key, value] : n.attributes)
        out.append(" ").append(key).append("=\"").append(escape(value, true)).append("\"");

    if(!n.text && n.children.empty())
        return out.append("/>");

    out.append(">");
    if(n.text)
        out.append(escape(*n.text, false));
    for(const auto& child : n.children)
        out.append(serialize(*child));

    return out.append("</").append(n.name).append(">");
}

static void replace_all(std::string& str, std::string_view from, std::string_view to)
{
    for(size_t pos = str.find(from); pos != std::string::npos; pos = str.find(from, pos + to.size()))
        str.replace(pos, from.size(), to);
}

std::string decode(std::string_view encoded)
{
    std::string decoded = utils::url_decode(encoded);

    // &amp; has to be the last one, otherwise "&amp;lt;" would turn into "<"
    replace_all(decoded, "&lt;", "<");
    replace_all(decoded, "&gt;", ">");
    replace_all(decoded, "&quot;", "\"");
    replace_all(decoded, "&#039;", "'");
    replace_all(decoded, "&amp;", "&");

    return decoded;
}

} // namespace xml
