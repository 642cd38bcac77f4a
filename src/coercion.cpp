#include "lucent/coercion.hpp"
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace lucent
{

    namespace
    {
        bool is_space(char c)
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        bool is_digit(char c)
        {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        // Length of the longest decimal number at the start of text (after
        // leading whitespace), or 0 when there is none.
        std::size_t numeric_prefix(std::string_view text, std::size_t start)
        {
            std::size_t i = start;
            if (i < text.size() && (text[i] == '+' || text[i] == '-'))
                ++i;

            std::size_t digits = 0;
            while (i < text.size() && is_digit(text[i]))
            {
                ++i;
                ++digits;
            }
            if (i < text.size() && text[i] == '.')
            {
                std::size_t j = i + 1;
                std::size_t frac = 0;
                while (j < text.size() && is_digit(text[j]))
                {
                    ++j;
                    ++frac;
                }
                if (digits + frac > 0)
                {
                    i = j;
                    digits += frac;
                }
            }
            if (digits == 0)
                return 0;

            if (i < text.size() && (text[i] == 'e' || text[i] == 'E'))
            {
                std::size_t j = i + 1;
                if (j < text.size() && (text[j] == '+' || text[j] == '-'))
                    ++j;
                std::size_t exp_digits = 0;
                while (j < text.size() && is_digit(text[j]))
                {
                    ++j;
                    ++exp_digits;
                }
                if (exp_digits > 0)
                    i = j;
            }
            return i - start;
        }

        double leading_double(std::string_view text)
        {
            std::size_t start = 0;
            while (start < text.size() && is_space(text[start]))
                ++start;
            auto len = numeric_prefix(text, start);
            if (len == 0)
                return 0.0;
            std::string number(text.substr(start, len));
            return std::strtod(number.c_str(), nullptr);
        }

        std::int64_t truncate_to_integer(double value)
        {
            if (std::isnan(value))
                return 0;
            if (value >= static_cast<double>(std::numeric_limits<std::int64_t>::max()))
                return std::numeric_limits<std::int64_t>::max();
            if (value <= static_cast<double>(std::numeric_limits<std::int64_t>::min()))
                return std::numeric_limits<std::int64_t>::min();
            return static_cast<std::int64_t>(value);
        }

        // Integer prefixes parse exactly; only a fraction or exponent goes
        // through double. Out-of-range values clamp to the int64 limits.
        std::int64_t leading_integer(std::string_view text)
        {
            std::size_t start = 0;
            while (start < text.size() && is_space(text[start]))
                ++start;
            auto len = numeric_prefix(text, start);
            if (len == 0)
                return 0;
            auto number = text.substr(start, len);
            if (number.find_first_of(".eE") != std::string_view::npos)
                return truncate_to_integer(leading_double(text));

            bool negative = number.front() == '-';
            if (number.front() == '+')
                number.remove_prefix(1);

            std::int64_t result = 0;
            auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), result);
            if (ec == std::errc::result_out_of_range)
            {
                return negative ? std::numeric_limits<std::int64_t>::min()
                                : std::numeric_limits<std::int64_t>::max();
            }
            return result;
        }

        std::int64_t to_integer(const nlohmann::json &value)
        {
            if (value.is_number_unsigned())
            {
                auto u = value.get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                    return std::numeric_limits<std::int64_t>::max();
                return static_cast<std::int64_t>(u);
            }
            if (value.is_number_integer())
                return value.get<std::int64_t>();
            if (value.is_number_float())
                return truncate_to_integer(value.get<double>());
            if (value.is_boolean())
                return value.get<bool>() ? 1 : 0;
            if (value.is_string())
                return leading_integer(value.get_ref<const std::string &>());
            if (value.is_array() || value.is_object())
                return value.empty() ? 0 : 1;
            return 0;
        }

        double to_float(const nlohmann::json &value)
        {
            if (value.is_number())
                return value.get<double>();
            if (value.is_boolean())
                return value.get<bool>() ? 1.0 : 0.0;
            if (value.is_string())
                return leading_double(value.get_ref<const std::string &>());
            if (value.is_array() || value.is_object())
                return value.empty() ? 0.0 : 1.0;
            return 0.0;
        }

        bool to_boolean(const nlohmann::json &value)
        {
            if (value.is_null())
                return false;
            if (value.is_boolean())
                return value.get<bool>();
            if (value.is_number_float())
                return value.get<double>() != 0.0;
            if (value.is_number())
                return value.get<std::int64_t>() != 0;
            if (value.is_string())
            {
                const auto &s = value.get_ref<const std::string &>();
                return !(s.empty() || s == "0");
            }
            return !value.empty();
        }

        std::string to_string_value(const nlohmann::json &value)
        {
            if (value.is_string())
                return value.get<std::string>();
            if (value.is_null())
                return {};
            if (value.is_boolean())
                return value.get<bool>() ? "1" : "";
            if (value.is_number_unsigned())
                return std::to_string(value.get<std::uint64_t>());
            if (value.is_number_integer())
                return std::to_string(value.get<std::int64_t>());
            if (value.is_number_float())
            {
                double d = value.get<double>();
                if (std::floor(d) == d && std::abs(d) < 1e15)
                    return std::to_string(static_cast<std::int64_t>(d));
                return value.dump();
            }
            return value.dump();
        }
    } // namespace

    std::string scalar_type_to_string(ScalarType type)
    {
        switch (type)
        {
        case ScalarType::Integer:
            return "int";
        case ScalarType::Float:
            return "float";
        case ScalarType::Boolean:
            return "bool";
        case ScalarType::String:
            return "string";
        case ScalarType::Array:
            return "array";
        case ScalarType::Any:
            return "any";
        }
        return "any";
    }

    std::optional<ScalarType> scalar_type_from_string(std::string_view name)
    {
        if (name == "int" || name == "integer")
            return ScalarType::Integer;
        if (name == "float" || name == "double")
            return ScalarType::Float;
        if (name == "bool" || name == "boolean")
            return ScalarType::Boolean;
        if (name == "string")
            return ScalarType::String;
        if (name == "array")
            return ScalarType::Array;
        if (name == "any" || name == "mixed")
            return ScalarType::Any;
        return std::nullopt;
    }

    nlohmann::json coerce(const nlohmann::json &value, ScalarType type)
    {
        switch (type)
        {
        case ScalarType::Integer:
            return to_integer(value);
        case ScalarType::Float:
            return to_float(value);
        case ScalarType::Boolean:
            return to_boolean(value);
        case ScalarType::String:
            return to_string_value(value);
        case ScalarType::Array:
            if (value.is_null())
                return nlohmann::json::array();
            if (value.is_array() || value.is_object())
                return value;
            return nlohmann::json::array({value});
        case ScalarType::Any:
            return value;
        }
        return value;
    }

    std::string to_display_string(const nlohmann::json &value)
    {
        return to_string_value(value);
    }

    bool is_numeric(std::string_view text)
    {
        std::size_t start = 0;
        while (start < text.size() && is_space(text[start]))
            ++start;
        auto len = numeric_prefix(text, start);
        if (len == 0)
            return false;
        for (std::size_t i = start + len; i < text.size(); ++i)
        {
            if (!is_space(text[i]))
                return false;
        }
        return true;
    }

    std::string trim(std::string_view text)
    {
        std::size_t begin = 0;
        std::size_t end = text.size();
        while (begin < end && is_space(text[begin]))
            ++begin;
        while (end > begin && is_space(text[end - 1]))
            --end;
        return std::string(text.substr(begin, end - begin));
    }

} // namespace lucent
