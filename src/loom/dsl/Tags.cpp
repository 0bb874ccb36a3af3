#include <loom/dsl/Tags.hpp>

#include <array>

namespace LM {

namespace {

constexpr auto kTagNames = std::to_array<std::string_view>({
    "div",     "span",  "p",     "section", "header", "footer",   "nav",    "main",
    "article", "aside", "h1",    "h2",      "h3",     "h4",       "h5",     "h6",
    "ul",      "ol",    "li",    "button",  "input",  "form",     "textarea", "select",
    "option",  "label", "a",     "img",     "table",  "thead",    "tbody",  "tr",
    "td",      "th",    "strong", "em",     "br",     "hr",       "pre",    "code",
});

static_assert(kTagNames.size() == kKnownTagCount);

} // namespace

auto is_known_tag(TagId tag) -> bool {
    return tag < kTagNames.size();
}

auto tag_name(TagId tag) -> std::string_view {
    if (!is_known_tag(tag)) {
        return "unknown";
    }
    return kTagNames[tag];
}

auto tag_from_name(std::string_view name) -> TagId {
    for (std::size_t i = 0; i < kTagNames.size(); ++i) {
        if (kTagNames[i] == name) {
            return static_cast<TagId>(i);
        }
    }
    return Tag::Unknown;
}

} // namespace LM
