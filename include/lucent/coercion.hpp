#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace lucent
{

    /**
     * Declared scalar type of a handler parameter or rule operation argument.
     * Any passes values through unconverted.
     */
    enum class ScalarType
    {
        Integer,
        Float,
        Boolean,
        String,
        Array,
        Any
    };

    std::string scalar_type_to_string(ScalarType type);

    /** Parse "int", "float", "bool", "string", "array" or "any". */
    std::optional<ScalarType> scalar_type_from_string(std::string_view name);

    /**
     * Convert a raw value to the declared scalar type using the fixed coercion
     * table shared by parameter binding and rule evaluation:
     *  - Integer: leading numeric prefix truncated toward zero, otherwise 0
     *  - Float:   leading numeric prefix, otherwise 0.0
     *  - Boolean: "", "0", 0, null and empty arrays are false, everything else true
     *  - String:  numbers rendered in decimal, true -> "1", false/null -> ""
     *  - Array:   null -> [], scalars wrapped in a one-element array
     *  - Any:     unchanged
     */
    nlohmann::json coerce(const nlohmann::json &value, ScalarType type);

    /** String form of a value, as used when rendering messages and keys. */
    std::string to_display_string(const nlohmann::json &value);

    /**
     * True when the whole string is a decimal number, optionally signed, with an
     * optional fraction and exponent. Surrounding whitespace is accepted.
     */
    bool is_numeric(std::string_view text);

    std::string trim(std::string_view text);

} // namespace lucent
