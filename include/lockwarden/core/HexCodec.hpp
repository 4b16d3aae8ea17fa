#ifndef INCLUDE_LOCKWARDEN_CORE_HEXCODEC_HPP
#define INCLUDE_LOCKWARDEN_CORE_HEXCODEC_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lockwarden::core
{

// Lowercase, two digits per byte.
[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

// Accepts either case. Rejects odd length and non-hex digits.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> fromHex(std::string_view text);

// Decodes into a fixed-size destination; false unless text is exactly 2 * out.size() valid digits.
[[nodiscard]] bool fromHexInto(std::string_view text, std::span<std::uint8_t> out) noexcept;

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_HEXCODEC_HPP
