#pragma once

#include "types.hpp"
#include "coercion.hpp"
#include "entity_store.hpp"
#include "request_context.hpp"
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lucent
{

    /**
     * One parsed rule token such as "min:5", "!same:@password" or "unique:User".
     */
    struct RuleInvocation
    {
        std::string token; // as declared, for error messages
        bool negated{false};
        std::string operation;
        std::vector<std::string> args; // literals or "@field" references
    };

    struct FieldRuleSpec
    {
        std::string field;
        bool nullable{false};
        std::vector<RuleInvocation> rules;
    };

    /** Parsed rules of a rule set, in field declaration order. */
    using RuleSpec = std::vector<FieldRuleSpec>;

    /** User-declared field -> rule tokens mapping, in declaration order. */
    using FieldRules = std::vector<std::pair<std::string, std::vector<std::string>>>;

    /** Raw input batch being validated. */
    using InputMap = std::unordered_map<std::string, std::string>;

    /** Split "!op:a:b" into negation flag, operation name and positional args. */
    RuleInvocation parse_rule_token(std::string_view token);

    /** Parse every field's tokens once; "nullable" becomes a flag. */
    RuleSpec parse_rules(const FieldRules &rules);

    struct RegexRule
    {
        std::string source;
        std::regex pattern;
        std::optional<std::string> message;
    };

    /** Compile a named pattern; invalid expressions yield InvalidRule. */
    Result<RegexRule> make_regex_rule(const std::string &source,
                                      std::optional<std::string> message = std::nullopt,
                                      bool case_insensitive = false);

    class RuleCatalog;

    /** Resources available to an operation while a rule set is evaluated. */
    struct RuleEnvironment
    {
        const RuleCatalog &catalog;
        const std::unordered_map<std::string, RegexRule> &local_patterns;
        RequestContext *request{nullptr};
    };

    /**
     * Arguments handed to an operation. args are already resolved and coerced
     * to the operation's declared parameter types; the input value is last.
     * An operation may set message to supply the failure template itself.
     */
    struct OperationCall
    {
        const std::string &field;
        std::vector<nlohmann::json> args;
        const RuleEnvironment &env;
        std::optional<std::string> message;

        /** Named pattern, searching rule-set patterns before catalog ones. */
        const RegexRule *regex(const std::string &key) const;
    };

    struct OperationParam
    {
        std::string name; // also the ":name" message placeholder
        ScalarType type{ScalarType::String};
        std::optional<nlohmann::json> default_value;
    };

    struct Operation
    {
        std::vector<OperationParam> params;
        std::function<Result<bool>(OperationCall &)> fn;
        bool appends_field{false}; // the field name is passed as an extra trailing argument
    };

    /**
     * Operations, named regex patterns and message templates shared by every
     * rule set of an application. Populated at boot and read-only afterwards.
     */
    class RuleCatalog
    {
    public:
        /** Built-in operations, patterns and messages. */
        static RuleCatalog defaults();

        void add_operation(const std::string &name, Operation operation);
        const Operation *operation(const std::string &name) const;

        Result<void> add_regex(const std::string &key,
                               const std::string &pattern,
                               std::optional<std::string> message = std::nullopt,
                               bool case_insensitive = false);
        const RegexRule *regex(const std::string &key) const;

        void override_message(const std::string &operation, std::string message);
        std::optional<std::string> message(const std::string &operation) const;

        void set_store(std::shared_ptr<EntityStore> store) { store_ = std::move(store); }
        EntityStore *store() const { return store_.get(); }

        /** Longest value a "regex" rule will match; longer values fail the rule. */
        void set_max_regex_input(std::size_t length) { max_regex_input_ = length; }
        std::size_t max_regex_input() const { return max_regex_input_; }

        static constexpr std::size_t kDefaultMaxRegexInput = 4096;

    private:
        std::unordered_map<std::string, Operation> operations_;
        std::unordered_map<std::string, RegexRule> regex_;
        std::unordered_map<std::string, std::string> messages_;
        std::shared_ptr<EntityStore> store_;
        std::size_t max_regex_input_{kDefaultMaxRegexInput};
    };

    /**
     * Field-keyed validation errors. Each field keeps the message of its last
     * failing rule; the outcome is empty exactly when validation passed.
     */
    struct ValidationOutcome
    {
        std::map<std::string, std::string> errors;

        bool passed() const { return errors.empty(); }
        const std::string *error(const std::string &field) const;
        nlohmann::json to_json() const;
    };

    /**
     * A set of per-field rules evaluated against an input batch. Subclasses
     * declare their rules in setup(); the declaration is parsed on first use
     * and reused for every later validation.
     */
    class RuleSet
    {
    public:
        explicit RuleSet(std::shared_ptr<const RuleCatalog> catalog);
        virtual ~RuleSet() = default;

        /**
         * Validate an input batch.
         * @param data Raw field values; missing fields validate as ""
         * @param request Receives entities found by "unique"/"exists", if given
         * @return The outcome, or UnknownValidationRule / InvalidRule errors
         */
        Result<ValidationOutcome> validate(const InputMap &data, RequestContext *request = nullptr);

        /** Add a pattern visible only to this rule set. */
        Result<void> add_regex_pattern(const std::string &name,
                                       const std::string &pattern,
                                       std::optional<std::string> message = std::nullopt,
                                       bool case_insensitive = false);

        /** Override the failure message of an operation for this rule set. */
        void override_message(const std::string &operation, std::string message);

        const RuleSpec &rules();

    protected:
        virtual FieldRules setup() const = 0;

    private:
        std::string render_failure(const FieldRuleSpec &field,
                                   const RuleInvocation &rule,
                                   const Operation &op,
                                   const std::vector<nlohmann::json> &args,
                                   const std::vector<std::optional<std::string>> &references,
                                   const std::optional<std::string> &op_message) const;

        std::shared_ptr<const RuleCatalog> catalog_;
        std::unordered_map<std::string, RegexRule> local_patterns_;
        std::unordered_map<std::string, std::string> messages_;
        std::optional<RuleSpec> spec_;
    };

    /** RuleSet whose rules are supplied at construction. */
    class FieldRuleSet final : public RuleSet
    {
    public:
        FieldRuleSet(std::shared_ptr<const RuleCatalog> catalog, FieldRules rules);

    protected:
        FieldRules setup() const override { return rules_; }

    private:
        FieldRules rules_;
    };

} // namespace lucent
