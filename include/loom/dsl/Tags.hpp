#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace LM {

using TagId = std::uint8_t;

// Stable HTML tag ids shared with renderers.
namespace Tag {
// Layout and sectioning
inline constexpr TagId Div     = 0;
inline constexpr TagId Span    = 1;
inline constexpr TagId P       = 2;
inline constexpr TagId Section = 3;
inline constexpr TagId Header  = 4;
inline constexpr TagId Footer  = 5;
inline constexpr TagId Nav     = 6;
inline constexpr TagId Main    = 7;
inline constexpr TagId Article = 8;
inline constexpr TagId Aside   = 9;
// Headings
inline constexpr TagId H1 = 10;
inline constexpr TagId H2 = 11;
inline constexpr TagId H3 = 12;
inline constexpr TagId H4 = 13;
inline constexpr TagId H5 = 14;
inline constexpr TagId H6 = 15;
// Lists
inline constexpr TagId Ul = 16;
inline constexpr TagId Ol = 17;
inline constexpr TagId Li = 18;
// Interactive
inline constexpr TagId Button   = 19;
inline constexpr TagId Input    = 20;
inline constexpr TagId Form     = 21;
inline constexpr TagId Textarea = 22;
inline constexpr TagId Select   = 23;
inline constexpr TagId Option   = 24;
inline constexpr TagId Label    = 25;
// Links and media
inline constexpr TagId A   = 26;
inline constexpr TagId Img = 27;
// Tables
inline constexpr TagId Table = 28;
inline constexpr TagId Thead = 29;
inline constexpr TagId Tbody = 30;
inline constexpr TagId Tr    = 31;
inline constexpr TagId Td    = 32;
inline constexpr TagId Th    = 33;
// Inline
inline constexpr TagId Strong = 34;
inline constexpr TagId Em     = 35;
inline constexpr TagId Br     = 36;
inline constexpr TagId Hr     = 37;
inline constexpr TagId Pre    = 38;
inline constexpr TagId Code   = 39;

inline constexpr TagId Unknown = 255;
} // namespace Tag

inline constexpr std::size_t kKnownTagCount = 40;

[[nodiscard]] auto is_known_tag(TagId tag) -> bool;
// Lowercase HTML name, "unknown" for ids outside the table.
[[nodiscard]] auto tag_name(TagId tag) -> std::string_view;
// Exact (lowercase) lookup; Tag::Unknown when the name is not in the table.
[[nodiscard]] auto tag_from_name(std::string_view name) -> TagId;

} // namespace LM
