#include "core/FeedParser.hpp"
#include "core/Errors.hpp"
#include "core/StringUtil.hpp"
#include <cstring>
#include <optional>
#include <unordered_set>

namespace corkboard {
namespace core {

const char* const kAtomNamespace = "http://www.w3.org/2005/Atom";

namespace {

const std::string kNoNamespace;

std::string prefixOf(const pugi::xml_node& node) {
    const char* name = node.name();
    const char* colon = std::strchr(name, ':');
    return colon ? std::string(name, colon) : std::string();
}

std::string localName(const pugi::xml_node& node) {
    const char* name = node.name();
    const char* colon = std::strchr(name, ':');
    return colon ? std::string(colon + 1) : std::string(name);
}

// pugixml does not resolve namespaces, so walk up looking for the
// xmlns declaration that binds this element's prefix
std::string namespaceOf(const pugi::xml_node& node) {
    std::string prefix = prefixOf(node);
    std::string declaration = prefix.empty() ? "xmlns" : "xmlns:" + prefix;

    for (pugi::xml_node current = node; current && current.type() == pugi::node_element;
         current = current.parent()) {
        if (auto attribute = current.attribute(declaration.c_str())) {
            return attribute.value();
        }
    }
    return std::string();
}

// Stops at the first element whose prefix has no xmlns declaration in scope
class UndeclaredPrefixFinder : public pugi::xml_tree_walker {
public:
    bool for_each(pugi::xml_node& node) override {
        if (node.type() != pugi::node_element) {
            return true;
        }
        std::string prefix = prefixOf(node);
        if (prefix.empty() || prefix == "xml" || !namespaceOf(node).empty()) {
            return true;
        }
        offending = node.name();
        return false;
    }

    std::string offending;
};

bool matches(const pugi::xml_node& node, const char* name, const std::string& ns) {
    return node.type() == pugi::node_element && localName(node) == name && namespaceOf(node) == ns;
}

pugi::xml_node findChild(const pugi::xml_node& parent, const char* name, const std::string& ns) {
    for (auto child : parent.children()) {
        if (matches(child, name, ns)) {
            return child;
        }
    }
    return pugi::xml_node();
}

// Text content of a direct child, absent when missing or blank
std::optional<std::string> childText(const pugi::xml_node& parent, const char* name, const std::string& ns) {
    auto child = findChild(parent, name, ns);
    if (!child) {
        return std::nullopt;
    }
    std::string text = trim(child.text().get());
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

void addUnique(Channel& channel, Entry entry, std::unordered_set<std::string>& seen) {
    if (seen.insert(entry.identity).second) {
        channel.entries.push_back(std::move(entry));
    }
}

std::optional<Entry> rssItemToEntry(const pugi::xml_node& item) {
    auto primaryText = childText(item, "title", kNoNamespace);
    if (!primaryText) {
        primaryText = childText(item, "description", kNoNamespace);
    }
    if (!primaryText) {
        return std::nullopt;
    }

    auto link = childText(item, "link", kNoNamespace);

    std::optional<Timestamp> publishedAt;
    if (auto pubDate = childText(item, "pubDate", kNoNamespace)) {
        publishedAt = parseRfc2822(*pubDate);
    }

    return Entry(*primaryText, link, publishedAt);
}

std::optional<std::string> atomEntryLink(const pugi::xml_node& entry, const std::string& atom) {
    std::optional<std::string> fallback;
    for (auto link : entry.children()) {
        if (!matches(link, "link", atom)) {
            continue;
        }
        std::string href = trim(link.attribute("href").value());
        if (href.empty()) {
            continue;
        }
        std::string rel = link.attribute("rel").value();
        if (rel.empty() || rel == "alternate") {
            return href;
        }
        if (!fallback) {
            fallback = href;
        }
    }
    return fallback;
}

std::optional<Entry> atomEntryToEntry(const pugi::xml_node& entry, const std::string& atom) {
    auto title = childText(entry, "title", atom);
    if (!title) {
        return std::nullopt;
    }

    std::optional<Timestamp> publishedAt;
    if (auto updated = childText(entry, "updated", atom)) {
        publishedAt = parseRfc3339(*updated);
    }

    return Entry(*title, atomEntryLink(entry, atom), publishedAt);
}

} // namespace

FeedDocument detectDialect(const pugi::xml_node& root) {
    std::string ns = namespaceOf(root);

    if (localName(root) == "rss" && prefixOf(root).empty() && ns.empty()) {
        return RssDocument{root};
    }
    if (ns == kAtomNamespace) {
        return AtomDocument{root};
    }

    throw ParseError(ParseErrorKind::UnknownFormat,
                     "root element <" + std::string(root.name()) + "> is neither RSS nor Atom");
}

Channel toChannel(const RssDocument& document) {
    auto channelNode = findChild(document.root, "channel", kNoNamespace);
    if (!channelNode) {
        throw ParseError(ParseErrorKind::MalformedDocument, "RSS document has no <channel> element");
    }

    Channel channel;
    auto title = childText(channelNode, "title", kNoNamespace);
    if (!title) {
        throw ParseError(ParseErrorKind::MissingTitle, "RSS channel has no <title>");
    }
    auto link = childText(channelNode, "link", kNoNamespace);
    if (!link) {
        throw ParseError(ParseErrorKind::MissingLink, "RSS channel has no <link>");
    }

    channel.title = *title;
    channel.link = *link;
    // Required by RSS 2.0 but omitted by plenty of generators
    channel.description = childText(channelNode, "description", kNoNamespace).value_or("");

    if (auto lastBuildDate = childText(channelNode, "lastBuildDate", kNoNamespace)) {
        channel.lastBuildDate = parseRfc2822(*lastBuildDate);
    }

    std::unordered_set<std::string> seen;
    for (auto item : channelNode.children()) {
        if (!matches(item, "item", kNoNamespace)) {
            continue;
        }
        if (auto entry = rssItemToEntry(item)) {
            addUnique(channel, std::move(*entry), seen);
        }
    }

    return channel;
}

Channel toChannel(const AtomDocument& document) {
    const std::string atom = kAtomNamespace;
    const pugi::xml_node& feed = document.root;

    Channel channel;
    auto title = childText(feed, "title", atom);
    if (!title) {
        throw ParseError(ParseErrorKind::MissingTitle, "Atom feed has no <title>");
    }
    channel.title = *title;

    // Stricter than RFC 4287: we insist on a rel="self" link
    for (auto link : feed.children()) {
        if (matches(link, "link", atom) && std::string(link.attribute("rel").value()) == "self") {
            channel.link = trim(link.attribute("href").value());
            break;
        }
    }
    if (channel.link.empty()) {
        throw ParseError(ParseErrorKind::MissingLink, "Atom feed has no <link rel=\"self\">");
    }

    if (auto updated = childText(feed, "updated", atom)) {
        channel.lastBuildDate = parseRfc3339(*updated);
    }

    std::unordered_set<std::string> seen;
    for (auto node : feed.children()) {
        if (!matches(node, "entry", atom)) {
            continue;
        }
        if (auto entry = atomEntryToEntry(node, atom)) {
            addUnique(channel, std::move(*entry), seen);
        }
    }

    return channel;
}

Channel parseFeed(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        throw ParseError(ParseErrorKind::MalformedDocument,
                         "Failed to parse XML feed: " + std::string(result.description()));
    }

    size_t rootCount = 0;
    for (auto node : doc.children()) {
        if (node.type() == pugi::node_element) {
            ++rootCount;
        }
    }
    if (rootCount == 0) {
        throw ParseError(ParseErrorKind::MalformedDocument, "document has no root element");
    }
    if (rootCount > 1) {
        throw ParseError(ParseErrorKind::MalformedDocument, "document has more than one root element");
    }

    UndeclaredPrefixFinder finder;
    doc.traverse(finder);
    if (!finder.offending.empty()) {
        throw ParseError(ParseErrorKind::MalformedDocument,
                         "element <" + finder.offending + "> uses an undeclared namespace prefix");
    }

    pugi::xml_node root = doc.document_element();

    FeedDocument document = detectDialect(root);
    return std::visit([](const auto& dialect) { return toChannel(dialect); }, document);
}

} // namespace core
} // namespace corkboard
