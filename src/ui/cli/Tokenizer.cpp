#include "Tokenizer.hpp"

#include <cctype>

namespace lockwarden::ui::cli
{

std::optional<std::vector<std::string>> tokenize(std::string_view line)
{
    std::vector<std::string> words{};
    std::string word{};
    bool inWord{ false };
    char quote{ '\0' };

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c{ line[i] };
        const bool hasNext{ i + 1U < line.size() };

        if (quote == '\'')
        {
            if (c == '\'')
            {
                quote = '\0';
            }
            else
            {
                word.push_back(c);
            }
            continue;
        }

        if (quote == '"')
        {
            if (c == '"')
            {
                quote = '\0';
            }
            else if (c == '\\' && hasNext && (line[i + 1U] == '"' || line[i + 1U] == '\\'))
            {
                word.push_back(line[++i]);
            }
            else
            {
                word.push_back(c);
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c)) != 0)
        {
            if (inWord)
            {
                words.push_back(std::move(word));
                word.clear();
                inWord = false;
            }
            continue;
        }

        inWord = true;
        if (c == '\'' || c == '"')
        {
            quote = c;
        }
        else if (c == '\\' && hasNext)
        {
            word.push_back(line[++i]);
        }
        else
        {
            word.push_back(c);
        }
    }

    if (quote != '\0')
    {
        return std::nullopt;
    }
    if (inWord)
    {
        words.push_back(std::move(word));
    }
    return words;
}

} // namespace lockwarden::ui::cli
