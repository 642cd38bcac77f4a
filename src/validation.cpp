#include "lucent/validation.hpp"
#include <array>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace lucent
{

    namespace
    {
        struct StaticRegexDef
        {
            std::string_view key;
            std::string_view pattern;
            std::string_view message;
            bool case_insensitive;
        };

        constexpr std::array<StaticRegexDef, 10> kDefaultPatterns = {
            StaticRegexDef{"password", R"(^(?=.*[a-z])(?=.*[A-Z]).{8,}$)",
                           "Password must contain at least one lowercase letter, one uppercase letter, and be at least 8 characters long.", false},
            StaticRegexDef{"email", R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)",
                           "Email address must be a valid email address. (test@example.com)", false},
            StaticRegexDef{"date", R"(^\d{4}-\d{2}-\d{2}$)", "Date must be in YYYY-MM-DD format.", false},
            StaticRegexDef{"url", R"(^(https?://)?([\da-z.-]+)\.([a-z.]{2,6})([/\w .-]*)/?$)",
                           "URL must be a valid web address.", false},
            StaticRegexDef{"phone", R"(^\+?[1-9]\d{1,14}$)", "Phone number must be in a valid international format.", false},
            StaticRegexDef{"ip", R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)",
                           "Must be a valid IPv4 address.", false},
            StaticRegexDef{"hex_color", R"(^#?([a-fA-F0-9]{6}|[a-fA-F0-9]{3})$)",
                           "Must be a valid HEX color code (e.g., #FFF or #FFFFFF).", false},
            StaticRegexDef{"uuid", R"(^[0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$)",
                           "Must be a valid UUID.", true},
            StaticRegexDef{"alpha", R"(^[a-zA-Z]+$)", "Must contain only letters.", false},
            StaticRegexDef{"alphanumeric", R"(^[a-zA-Z0-9]+$)", "Must contain only letters and numbers.", false},
        };

        struct StaticMessageDef
        {
            std::string_view operation;
            std::string_view message;
        };

        constexpr std::array<StaticMessageDef, 6> kDefaultMessages = {
            StaticMessageDef{"required", ":attribute is required"},
            StaticMessageDef{"min", ":attribute must be at least :min characters"},
            StaticMessageDef{"max", ":attribute may not be greater than :max characters"},
            StaticMessageDef{"min_num", ":attribute must be greater than :min"},
            StaticMessageDef{"max_num", ":attribute may not be greater than :max"},
            StaticMessageDef{"same", ":attribute and :second must match"},
        };

        void replace_all(std::string &text, const std::string &from, const std::string &to)
        {
            if (from.empty())
                return;
            std::size_t pos = 0;
            while ((pos = text.find(from, pos)) != std::string::npos)
            {
                text.replace(pos, from.size(), to);
                pos += to.size();
            }
        }

        std::string humanize(std::string name)
        {
            for (auto &c : name)
            {
                if (c == '_')
                    c = ' ';
            }
            return name;
        }

        const std::string &value_arg(const OperationCall &call)
        {
            return call.args.back().get_ref<const std::string &>();
        }

        Result<bool> lookup_entity(OperationCall &call, bool expect_missing)
        {
            const auto &table = call.args[0].get_ref<const std::string &>();
            const auto &column = call.args[1].get_ref<const std::string &>();
            auto *store = call.env.catalog.store();
            if (!store)
            {
                return std::unexpected(LucentError::internal(
                    "Rule on field '" + call.field + "' needs an entity store, none is configured"));
            }
            auto found = store->find_one(table, column, value_arg(call));
            if (!found)
                return std::unexpected(found.error());
            if (found->has_value() && call.env.request)
                call.env.request->entities.put(table, **found);
            return expect_missing ? !found->has_value() : found->has_value();
        }

        Operation length_operation(bool at_least)
        {
            Operation op;
            op.params = {{at_least ? "min" : "max", ScalarType::Integer, std::nullopt},
                         {"value", ScalarType::String, std::nullopt}};
            op.fn = [at_least](OperationCall &call) -> Result<bool> {
                auto bound = call.args[0].get<std::int64_t>();
                auto length = static_cast<std::int64_t>(value_arg(call).size());
                return at_least ? length >= bound : length <= bound;
            };
            return op;
        }

        Operation numeric_operation(bool at_least)
        {
            Operation op;
            op.params = {{at_least ? "min" : "max", ScalarType::Integer, std::nullopt},
                         {"value", ScalarType::String, std::nullopt}};
            op.fn = [at_least](OperationCall &call) -> Result<bool> {
                const auto &value = value_arg(call);
                if (!is_numeric(value))
                    return false;
                auto bound = call.args[0].get<std::int64_t>();
                auto number = coerce(nlohmann::json(value), ScalarType::Integer).get<std::int64_t>();
                return at_least ? number >= bound : number <= bound;
            };
            return op;
        }

        Operation entity_operation(bool expect_missing)
        {
            Operation op;
            op.params = {{"table", ScalarType::String, std::nullopt},
                         {"column", ScalarType::String, std::nullopt},
                         {"value", ScalarType::String, std::nullopt}};
            op.appends_field = true;
            op.fn = [expect_missing](OperationCall &call) -> Result<bool> {
                return lookup_entity(call, expect_missing);
            };
            return op;
        }
    } // namespace

    RuleInvocation parse_rule_token(std::string_view token)
    {
        RuleInvocation rule;
        rule.token = std::string(token);

        std::vector<std::string> parts;
        std::size_t start = 0;
        while (true)
        {
            auto end = token.find(':', start);
            parts.emplace_back(token.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
            if (end == std::string_view::npos)
                break;
            start = end + 1;
        }

        rule.operation = trim(parts.front());
        if (rule.operation.starts_with('!'))
        {
            rule.negated = true;
            rule.operation.erase(0, 1);
        }
        rule.args.assign(parts.begin() + 1, parts.end());
        return rule;
    }

    RuleSpec parse_rules(const FieldRules &rules)
    {
        RuleSpec spec;
        spec.reserve(rules.size());
        for (const auto &[field, tokens] : rules)
        {
            FieldRuleSpec entry;
            entry.field = field;
            for (const auto &token : tokens)
            {
                if (token == "nullable")
                {
                    entry.nullable = true;
                    continue;
                }
                entry.rules.push_back(parse_rule_token(token));
            }
            spec.push_back(std::move(entry));
        }
        return spec;
    }

    Result<RegexRule> make_regex_rule(const std::string &source,
                                      std::optional<std::string> message,
                                      bool case_insensitive)
    {
        auto flags = std::regex::ECMAScript;
        if (case_insensitive)
            flags |= std::regex::icase;
        try
        {
            return RegexRule{source, std::regex(source, flags), std::move(message)};
        }
        catch (const std::regex_error &e)
        {
            return std::unexpected(LucentError::invalid_rule("Invalid regex '" + source + "': " + e.what()));
        }
    }

    const RegexRule *OperationCall::regex(const std::string &key) const
    {
        if (auto it = env.local_patterns.find(key); it != env.local_patterns.end())
            return &it->second;
        return env.catalog.regex(key);
    }

    RuleCatalog RuleCatalog::defaults()
    {
        RuleCatalog catalog;

        for (const auto &def : kDefaultPatterns)
        {
            auto rule = make_regex_rule(std::string(def.pattern), std::string(def.message), def.case_insensitive);
            if (!rule)
                throw rule.error();
            catalog.regex_.insert_or_assign(std::string(def.key), std::move(*rule));
        }

        for (const auto &def : kDefaultMessages)
            catalog.messages_.insert_or_assign(std::string(def.operation), std::string(def.message));

        Operation required;
        required.params = {{"value", ScalarType::String, std::nullopt}};
        required.fn = [](OperationCall &call) -> Result<bool> {
            return !trim(value_arg(call)).empty();
        };
        catalog.add_operation("required", std::move(required));

        Operation regex;
        regex.params = {{"key", ScalarType::String, std::nullopt},
                        {"value", ScalarType::String, std::nullopt}};
        regex.fn = [](OperationCall &call) -> Result<bool> {
            const auto &key = call.args[0].get_ref<const std::string &>();
            const auto *rule = call.regex(key);
            if (!rule)
            {
                return std::unexpected(LucentError::invalid_rule(
                    "Regex " + key + " does not exist (field '" + call.field + "')"));
            }
            if (rule->message)
                call.message = rule->message;
            const auto &value = value_arg(call);
            if (value.size() > call.env.catalog.max_regex_input())
            {
                spdlog::debug("field '{}' is {} bytes, over the {} byte regex limit", call.field, value.size(),
                              call.env.catalog.max_regex_input());
                return false;
            }
            return std::regex_search(value, rule->pattern);
        };
        catalog.add_operation("regex", std::move(regex));

        catalog.add_operation("min", length_operation(true));
        catalog.add_operation("max", length_operation(false));
        catalog.add_operation("min_num", numeric_operation(true));
        catalog.add_operation("max_num", numeric_operation(false));

        Operation same;
        same.params = {{"second", ScalarType::String, std::nullopt},
                       {"value", ScalarType::String, std::nullopt}};
        same.fn = [](OperationCall &call) -> Result<bool> {
            return call.args[0].get_ref<const std::string &>() == value_arg(call);
        };
        catalog.add_operation("same", std::move(same));

        catalog.add_operation("unique", entity_operation(true));
        catalog.add_operation("exists", entity_operation(false));

        return catalog;
    }

    void RuleCatalog::add_operation(const std::string &name, Operation operation)
    {
        operations_.insert_or_assign(name, std::move(operation));
    }

    const Operation *RuleCatalog::operation(const std::string &name) const
    {
        auto it = operations_.find(name);
        return it == operations_.end() ? nullptr : &it->second;
    }

    Result<void> RuleCatalog::add_regex(const std::string &key,
                                        const std::string &pattern,
                                        std::optional<std::string> message,
                                        bool case_insensitive)
    {
        auto rule = make_regex_rule(pattern, std::move(message), case_insensitive);
        if (!rule)
            return std::unexpected(rule.error());
        regex_.insert_or_assign(key, std::move(*rule));
        return {};
    }

    const RegexRule *RuleCatalog::regex(const std::string &key) const
    {
        auto it = regex_.find(key);
        return it == regex_.end() ? nullptr : &it->second;
    }

    void RuleCatalog::override_message(const std::string &operation, std::string message)
    {
        messages_.insert_or_assign(operation, std::move(message));
    }

    std::optional<std::string> RuleCatalog::message(const std::string &operation) const
    {
        auto it = messages_.find(operation);
        if (it == messages_.end())
            return std::nullopt;
        return it->second;
    }

    const std::string *ValidationOutcome::error(const std::string &field) const
    {
        auto it = errors.find(field);
        return it == errors.end() ? nullptr : &it->second;
    }

    nlohmann::json ValidationOutcome::to_json() const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &[field, message] : errors)
            j[field] = message;
        return j;
    }

    RuleSet::RuleSet(std::shared_ptr<const RuleCatalog> catalog) : catalog_(std::move(catalog)) {}

    const RuleSpec &RuleSet::rules()
    {
        if (!spec_)
            spec_ = parse_rules(setup());
        return *spec_;
    }

    Result<void> RuleSet::add_regex_pattern(const std::string &name,
                                            const std::string &pattern,
                                            std::optional<std::string> message,
                                            bool case_insensitive)
    {
        auto rule = make_regex_rule(pattern, std::move(message), case_insensitive);
        if (!rule)
            return std::unexpected(rule.error());
        local_patterns_.insert_or_assign(name, std::move(*rule));
        return {};
    }

    void RuleSet::override_message(const std::string &operation, std::string message)
    {
        messages_.insert_or_assign(operation, std::move(message));
    }

    Result<ValidationOutcome> RuleSet::validate(const InputMap &data, RequestContext *request)
    {
        ValidationOutcome outcome;
        RuleEnvironment env{*catalog_, local_patterns_, request};

        auto field_value = [&data](const std::string &name) -> std::optional<std::string> {
            auto it = data.find(name);
            if (it == data.end())
                return std::nullopt;
            return trim(it->second);
        };

        for (const auto &field : rules())
        {
            auto value = field_value(field.field).value_or(std::string{});

            if (field.nullable && value.empty())
                continue;

            for (const auto &rule : field.rules)
            {
                const auto *op = catalog_->operation(rule.operation);
                if (!op)
                {
                    return std::unexpected(LucentError::unknown_rule(
                        "Unknown validation rule '" + rule.token + "' in field '" + field.field + "'"));
                }

                std::vector<std::string> raw = rule.args;
                if (op->appends_field)
                    raw.push_back(field.field);

                // The input value always fills the last parameter; declared
                // arguments fill the ones before it.
                const auto positional = op->params.empty() ? 0 : op->params.size() - 1;
                if (raw.size() > positional)
                {
                    spdlog::debug("rule '{}' on field '{}' ignores {} extra argument(s)",
                                  rule.token, field.field, raw.size() - positional);
                }

                std::vector<nlohmann::json> args;
                std::vector<std::optional<std::string>> references;
                args.reserve(op->params.size());
                for (std::size_t i = 0; i < op->params.size(); ++i)
                {
                    const auto &param = op->params[i];
                    nlohmann::json resolved;
                    std::optional<std::string> reference;

                    if (i == positional)
                    {
                        resolved = value;
                    }
                    else if (i < raw.size())
                    {
                        if (raw[i].starts_with('@'))
                        {
                            reference = raw[i].substr(1);
                            auto referenced = field_value(*reference);
                            resolved = referenced ? nlohmann::json(*referenced) : nlohmann::json();
                        }
                        else
                        {
                            resolved = raw[i];
                        }
                    }
                    else if (param.default_value)
                    {
                        resolved = *param.default_value;
                    }
                    else
                    {
                        return std::unexpected(LucentError::invalid_rule(
                            "Rule '" + rule.token + "' in field '" + field.field + "' is missing argument '" +
                            param.name + "'"));
                    }

                    args.push_back(coerce(resolved, param.type));
                    references.push_back(std::move(reference));
                }

                OperationCall call{field.field, std::move(args), env, std::nullopt};
                auto result = op->fn(call);
                if (!result)
                    return std::unexpected(result.error());

                bool passed = *result != rule.negated;
                if (!passed)
                {
                    outcome.errors[field.field] =
                        render_failure(field, rule, *op, call.args, references, call.message);
                }
            }
        }

        return outcome;
    }

    std::string RuleSet::render_failure(const FieldRuleSpec &field,
                                        const RuleInvocation &rule,
                                        const Operation &op,
                                        const std::vector<nlohmann::json> &args,
                                        const std::vector<std::optional<std::string>> &references,
                                        const std::optional<std::string> &op_message) const
    {
        std::optional<std::string> message = op_message;
        if (!message)
        {
            if (auto it = messages_.find(rule.operation); it != messages_.end())
                message = it->second;
            else
                message = catalog_->message(rule.operation);
        }

        if (!message)
            return field.field + " failed " + humanize(rule.operation) + " validation rule";

        std::string text = *message;
        replace_all(text, ":attribute", field.field);
        for (std::size_t i = 0; i < op.params.size() && i < args.size(); ++i)
        {
            // Field references render as the referenced field's name.
            auto replacement = references[i] ? *references[i] : to_display_string(args[i]);
            replace_all(text, ":" + op.params[i].name, replacement);
        }
        return trim(text);
    }

    FieldRuleSet::FieldRuleSet(std::shared_ptr<const RuleCatalog> catalog, FieldRules rules)
        : RuleSet(std::move(catalog)), rules_(std::move(rules))
    {
    }

} // namespace lucent
