#include "lucent/pattern.hpp"
#include <cctype>
#include <unordered_set>

namespace lucent
{

    namespace
    {
        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::vector<std::string> split_on(std::string_view text, char separator)
        {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (start <= text.size())
            {
                auto end = text.find(separator, start);
                if (end == std::string_view::npos)
                    end = text.size();
                if (end > start)
                    out.emplace_back(text.substr(start, end - start));
                start = end + 1;
            }
            return out;
        }

        std::optional<std::string> variable_name(std::string_view segment)
        {
            if (segment.size() >= 3 && segment.front() == '{' && segment.back() == '}')
                return std::string(segment.substr(1, segment.size() - 2));
            return std::nullopt;
        }
    } // namespace

    Result<CompiledPattern> CompiledPattern::compile(std::string_view source, PatternStyle style)
    {
        CompiledPattern pattern;
        pattern.source_ = std::string(source);

        std::vector<std::string> segments = style == PatternStyle::Path
                                                ? split_on(source, '/')
                                                : tokenize_command(source);

        std::unordered_set<std::string> seen;
        for (auto &segment : segments)
        {
            if (auto name = variable_name(segment))
            {
                if (!seen.insert(*name).second)
                {
                    return std::unexpected(LucentError::invalid_input(
                        "Duplicate variable '" + *name + "' in pattern '" + pattern.source_ + "'"));
                }
                pattern.tokens_.push_back(PatternToken::variable(std::move(*name)));
            }
            else
            {
                pattern.tokens_.push_back(PatternToken::literal(std::move(segment)));
            }
        }
        return pattern;
    }

    std::optional<CapturedVariables> CompiledPattern::match(const std::vector<std::string> &segments) const
    {
        if (segments.size() != tokens_.size())
            return std::nullopt;

        CapturedVariables captured;
        for (std::size_t i = 0; i < tokens_.size(); ++i)
        {
            const auto &token = tokens_[i];
            if (token.is_variable())
            {
                captured[token.text] = segments[i];
            }
            else if (token.text != segments[i])
            {
                return std::nullopt;
            }
        }
        return captured;
    }

    std::vector<std::string> CompiledPattern::variable_names() const
    {
        std::vector<std::string> names;
        for (const auto &token : tokens_)
        {
            if (token.is_variable())
                names.push_back(token.text);
        }
        return names;
    }

    std::vector<std::string> tokenize_path(std::string_view target)
    {
        auto cut = target.find_first_of("?#");
        if (cut != std::string_view::npos)
            target = target.substr(0, cut);

        std::vector<std::string> out;
        for (auto &segment : split_on(target, '/'))
            out.push_back(percent_decode(segment));
        return out;
    }

    std::vector<std::string> tokenize_command(std::string_view line)
    {
        std::vector<std::string> out;
        std::size_t i = 0;
        while (i < line.size())
        {
            while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
                ++i;
            std::size_t start = i;
            while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])))
                ++i;
            if (i > start)
                out.emplace_back(line.substr(start, i - start));
        }
        return out;
    }

    std::vector<std::string> tokenize(std::string_view input, PatternStyle style)
    {
        return style == PatternStyle::Path ? tokenize_path(input) : tokenize_command(input);
    }

    std::string percent_decode(std::string_view text, bool plus_as_space)
    {
        std::string out;
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            char c = text[i];
            if (c == '%' && i + 2 < text.size())
            {
                int hi = hex_value(text[i + 1]);
                int lo = hex_value(text[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                    continue;
                }
            }
            if (c == '+' && plus_as_space)
            {
                out.push_back(' ');
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    std::unordered_map<std::string, std::string> parse_query(std::string_view query)
    {
        std::unordered_map<std::string, std::string> out;
        for (auto &pair : split_on(query, '&'))
        {
            auto eq = pair.find('=');
            if (eq == std::string::npos)
            {
                out[percent_decode(pair, true)] = "";
                continue;
            }
            out[percent_decode(std::string_view(pair).substr(0, eq), true)] =
                percent_decode(std::string_view(pair).substr(eq + 1), true);
        }
        return out;
    }

} // namespace lucent
