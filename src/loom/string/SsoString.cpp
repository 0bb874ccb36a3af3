#include <loom/string/SsoString.hpp>

#include <cstring>
#include <utility>

namespace LM {

namespace {

constexpr std::size_t kDataWord     = 0;
constexpr std::size_t kLengthWord   = 1;
constexpr std::size_t kCapacityWord = 2;
// Top byte of the little-endian capacity word; inline payload bytes 16..22 share the rest of that word.
constexpr std::size_t kTagByte      = 23;

} // namespace

SsoString::SsoString() noexcept {
    reset_inline();
}

SsoString::SsoString(std::string_view bytes) {
    reset_inline();
    assign(bytes);
}

SsoString::~SsoString() {
    release();
}

SsoString::SsoString(SsoString const& other) {
    reset_inline();
    assign(other.view());
}

SsoString::SsoString(SsoString&& other) noexcept
    : bytes_(other.bytes_) {
    other.reset_inline();
}

auto SsoString::operator=(SsoString const& other) -> SsoString& {
    if (this != &other) {
        SsoString copy{other};
        *this = std::move(copy);
    }
    return *this;
}

auto SsoString::operator=(SsoString&& other) noexcept -> SsoString& {
    if (this != &other) {
        release();
        bytes_ = other.bytes_;
        other.reset_inline();
    }
    return *this;
}

auto SsoString::word(std::size_t index) const noexcept -> std::uint64_t {
    std::uint64_t value = 0;
    std::memcpy(&value, bytes_.data() + index * sizeof(std::uint64_t), sizeof(value));
    return value;
}

auto SsoString::set_word(std::size_t index, std::uint64_t value) noexcept -> void {
    std::memcpy(bytes_.data() + index * sizeof(std::uint64_t), &value, sizeof(value));
}

auto SsoString::tag_byte() const noexcept -> std::uint64_t {
    return static_cast<std::uint64_t>(bytes_[kTagByte]) << kInlineLenShift;
}

auto SsoString::is_inline() const noexcept -> bool {
    return (tag_byte() & kInlineFlag) != 0;
}

auto SsoString::length() const noexcept -> std::size_t {
    if (is_inline()) {
        return static_cast<std::size_t>((tag_byte() & kInlineLenMask) >> kInlineLenShift);
    }
    return static_cast<std::size_t>(word(kLengthWord));
}

auto SsoString::capacity() const noexcept -> std::size_t {
    if (is_inline()) {
        return kInlineCapacity;
    }
    return static_cast<std::size_t>(word(kCapacityWord));
}

auto SsoString::data() const noexcept -> char const* {
    if (is_inline()) {
        return reinterpret_cast<char const*>(bytes_.data());
    }
    return reinterpret_cast<char const*>(static_cast<std::uintptr_t>(word(kDataWord)));
}

auto SsoString::layout_words() const noexcept -> std::array<std::uint64_t, 3> {
    return {word(kDataWord), word(kLengthWord), word(kCapacityWord)};
}

auto SsoString::reset_inline() noexcept -> void {
    bytes_.fill(std::byte{0});
    bytes_[kTagByte] = static_cast<std::byte>(kInlineFlag >> kInlineLenShift);
}

auto SsoString::release() noexcept -> void {
    if (!is_inline()) {
        delete[] reinterpret_cast<char*>(static_cast<std::uintptr_t>(word(kDataWord)));
    }
    reset_inline();
}

auto SsoString::assign(std::string_view bytes) -> void {
    release();
    if (bytes.size() <= kInlineCapacity) {
        if (!bytes.empty()) {
            std::memcpy(bytes_.data(), bytes.data(), bytes.size());
        }
        auto const tag   = kInlineFlag | (static_cast<std::uint64_t>(bytes.size()) << kInlineLenShift);
        bytes_[kTagByte] = static_cast<std::byte>(tag >> kInlineLenShift);
        return;
    }
    // Heap payloads keep a trailing NUL so data() doubles as a C string.
    auto const capacity = bytes.size() + 1;
    auto*      buffer   = new char[capacity];
    std::memcpy(buffer, bytes.data(), bytes.size());
    buffer[bytes.size()] = '\0';
    set_word(kDataWord, static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(buffer)));
    set_word(kLengthWord, static_cast<std::uint64_t>(bytes.size()));
    set_word(kCapacityWord, static_cast<std::uint64_t>(capacity));
}

auto concat(SsoString const& lhs, SsoString const& rhs) -> SsoString {
    std::string joined;
    joined.reserve(lhs.length() + rhs.length());
    joined.append(lhs.view());
    joined.append(rhs.view());
    return SsoString{joined};
}

auto repeat(SsoString const& value, std::int64_t count) -> SsoString {
    if (count <= 0 || value.empty()) {
        return SsoString{};
    }
    std::string repeated;
    repeated.reserve(value.length() * static_cast<std::size_t>(count));
    for (std::int64_t i = 0; i < count; ++i) {
        repeated.append(value.view());
    }
    return SsoString{repeated};
}

} // namespace LM
