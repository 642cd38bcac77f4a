#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lucent
{

    /** How a pattern or an input line is split into segments. */
    enum class PatternStyle
    {
        Path,   // "/users/{id}" split on '/'
        Command // "user show {id}" split on whitespace
    };

    /**
     * One segment of a compiled pattern: either a literal that must match the
     * input segment exactly, or a variable that captures exactly one segment.
     */
    struct PatternToken
    {
        enum class Kind
        {
            Literal,
            Variable
        };

        Kind kind{Kind::Literal};
        std::string text; // literal text or variable name

        static PatternToken literal(std::string text)
        {
            return PatternToken{Kind::Literal, std::move(text)};
        }

        static PatternToken variable(std::string name)
        {
            return PatternToken{Kind::Variable, std::move(name)};
        }

        bool is_variable() const { return kind == Kind::Variable; }

        bool operator==(const PatternToken &other) const = default;
    };

    using CapturedVariables = std::unordered_map<std::string, std::string>;

    class CompiledPattern
    {
    public:
        /**
         * Compile a route definition. Segments written as {name} become
         * variables; variable names must be unique within the pattern.
         */
        static Result<CompiledPattern> compile(std::string_view source, PatternStyle style);

        /**
         * Match input segments. Lengths must be equal and every literal must
         * match exactly; variables capture the segment at their position.
         */
        std::optional<CapturedVariables> match(const std::vector<std::string> &segments) const;

        const std::string &source() const { return source_; }
        const std::vector<PatternToken> &tokens() const { return tokens_; }
        std::vector<std::string> variable_names() const;

    private:
        std::string source_;
        std::vector<PatternToken> tokens_;
    };

    /**
     * Split a request target into decoded path segments. The query string and
     * fragment are dropped and empty segments are skipped.
     */
    std::vector<std::string> tokenize_path(std::string_view target);

    /** Split a command line on whitespace. */
    std::vector<std::string> tokenize_command(std::string_view line);

    std::vector<std::string> tokenize(std::string_view input, PatternStyle style);

    /** Decode %XX escapes and '+' in a URL component. Malformed escapes are kept verbatim. */
    std::string percent_decode(std::string_view text, bool plus_as_space = false);

    /** Parse "a=1&b=2" into a map of decoded keys and values. */
    std::unordered_map<std::string, std::string> parse_query(std::string_view query);

} // namespace lucent
