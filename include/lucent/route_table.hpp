#pragma once

#include "types.hpp"
#include "middleware.hpp"
#include "pattern.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lucent
{

    /** Controller identity and method name a route dispatches to. */
    struct HandlerRef
    {
        std::string controller;
        std::string action;
    };

    struct RouteEntry
    {
        CompiledPattern pattern;
        HandlerRef handler;
        std::vector<MiddlewarePtr> middleware; // table-level stages first, then the route's own
    };

    struct RouteMatch
    {
        RouteEntry route;
        CapturedVariables variables;
    };

    /**
     * Compiled routes grouped by request kind (HTTP verb or command type), in
     * registration order. Lookup returns the first registered route whose
     * pattern matches; registration is expected to finish before concurrent
     * lookups begin.
     */
    class RouteTable
    {
    public:
        explicit RouteTable(PatternStyle style = PatternStyle::Path);

        /**
         * Register middleware merged into every route registered afterwards.
         */
        void use(MiddlewarePtr middleware);

        /**
         * Compile and store a route under (kind, pattern). Registering the same
         * pattern again replaces the earlier entry in its original position.
         */
        Result<void> add(const std::string &kind,
                         std::string_view pattern,
                         HandlerRef handler,
                         std::vector<MiddlewarePtr> middleware = {});

        /** Look up already-tokenized input. */
        Result<RouteMatch> lookup(const std::string &kind, const std::vector<std::string> &segments) const;

        /** Tokenize raw input with this table's style, then look it up. */
        Result<RouteMatch> lookup_input(const std::string &kind, std::string_view input) const;

        const std::vector<RouteEntry> &entries(const std::string &kind) const;
        std::vector<std::string> kinds() const;
        PatternStyle style() const { return style_; }

        void clear();

    private:
        PatternStyle style_;
        std::vector<MiddlewarePtr> table_middleware_;
        std::vector<std::string> kind_order_;
        std::unordered_map<std::string, std::vector<RouteEntry>> routes_;
    };

} // namespace lucent
