#ifndef LOCKWARDEN_UI_CLI_TOKENIZER_HPP
#define LOCKWARDEN_UI_CLI_TOKENIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lockwarden::ui::cli
{

// Splits a shell line into words. Single quotes are literal, double quotes honour \" and \\, a backslash
// outside quotes escapes the next character. std::nullopt when a quote is left open.
[[nodiscard]] std::optional<std::vector<std::string>> tokenize(std::string_view line);

} // namespace lockwarden::ui::cli

#endif // LOCKWARDEN_UI_CLI_TOKENIZER_HPP
