#pragma once

#include "core/Channel.hpp"
#include <string>
#include <variant>
#include <pugixml.hpp>

namespace corkboard {
namespace core {

extern const char* const kAtomNamespace;

// Root element of an RSS 2.0 document (<rss>, no namespace)
struct RssDocument {
    pugi::xml_node root;
};

// Root element of an Atom document (any root in the Atom namespace)
struct AtomDocument {
    pugi::xml_node root;
};

using FeedDocument = std::variant<RssDocument, AtomDocument>;

// Parses raw document bytes into a Channel. Throws ParseError.
// The returned channel's link is the feed's self-declared one; callers
// replace it with the URL they fetched from.
Channel parseFeed(const std::string& xml);

// Throws ParseError(UnknownFormat) for anything that is neither dialect
FeedDocument detectDialect(const pugi::xml_node& root);

Channel toChannel(const RssDocument& document);
Channel toChannel(const AtomDocument& document);

} // namespace core
} // namespace corkboard
