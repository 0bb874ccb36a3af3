#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace LM {

/*
 * Byte string with a fixed 24-byte layout {data pointer, length, capacity}.
 * Payloads of up to 23 bytes live inline in the struct itself: bit 63 of the
 * capacity word flags inline storage and bits 56-60 carry the inline length.
 * Longer payloads are heap allocated. Storage mode never changes the byte contract;
 * UTF-8 sequences are opaque bytes.
 */
class SsoString {
public:
    static constexpr std::size_t   kInlineCapacity = 23;
    static constexpr std::uint64_t kInlineFlag     = 0x8000000000000000ull;
    static constexpr std::uint64_t kInlineLenMask  = 0x1f00000000000000ull;
    static constexpr unsigned      kInlineLenShift = 56;

    SsoString() noexcept;
    explicit SsoString(std::string_view bytes);
    ~SsoString();

    SsoString(SsoString const& other);
    SsoString(SsoString&& other) noexcept;
    auto operator=(SsoString const& other) -> SsoString&;
    auto operator=(SsoString&& other) noexcept -> SsoString&;

    [[nodiscard]] auto length() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool { return length() == 0; }
    [[nodiscard]] auto is_inline() const noexcept -> bool;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t;
    [[nodiscard]] auto data() const noexcept -> char const*;
    [[nodiscard]] auto view() const noexcept -> std::string_view { return {data(), length()}; }
    [[nodiscard]] auto str() const -> std::string { return std::string{view()}; }

    [[nodiscard]] auto eq(SsoString const& other) const noexcept -> bool { return view() == other.view(); }

    // Raw {data pointer, length, capacity} words as laid out in memory.
    [[nodiscard]] auto layout_words() const noexcept -> std::array<std::uint64_t, 3>;

    friend auto operator==(SsoString const& lhs, SsoString const& rhs) noexcept -> bool { return lhs.eq(rhs); }
    friend auto operator==(SsoString const& lhs, std::string_view rhs) noexcept -> bool { return lhs.view() == rhs; }

private:
    [[nodiscard]] auto word(std::size_t index) const noexcept -> std::uint64_t;
    [[nodiscard]] auto tag_byte() const noexcept -> std::uint64_t;
    auto               set_word(std::size_t index, std::uint64_t value) noexcept -> void;
    auto               assign(std::string_view bytes) -> void;
    auto               release() noexcept -> void;
    auto               reset_inline() noexcept -> void;

    alignas(std::uint64_t) std::array<std::byte, 24> bytes_{};
};

static_assert(sizeof(SsoString) == 24, "SsoString must keep the 24-byte string layout");
static_assert(std::endian::native == std::endian::little, "inline SsoString storage assumes a little-endian capacity word");

[[nodiscard]] auto concat(SsoString const& lhs, SsoString const& rhs) -> SsoString;

// Negative counts are treated as zero.
[[nodiscard]] auto repeat(SsoString const& value, std::int64_t count) -> SsoString;

} // namespace LM
