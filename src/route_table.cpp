#include "lucent/route_table.hpp"
#include <algorithm>

namespace lucent
{

    RouteTable::RouteTable(PatternStyle style) : style_(style) {}

    void RouteTable::use(MiddlewarePtr middleware)
    {
        table_middleware_.push_back(std::move(middleware));
    }

    Result<void> RouteTable::add(const std::string &kind,
                                 std::string_view pattern,
                                 HandlerRef handler,
                                 std::vector<MiddlewarePtr> middleware)
    {
        auto compiled = CompiledPattern::compile(pattern, style_);
        if (!compiled)
            return std::unexpected(compiled.error());

        std::vector<MiddlewarePtr> merged = table_middleware_;
        merged.insert(merged.end(), middleware.begin(), middleware.end());

        RouteEntry entry{std::move(*compiled), std::move(handler), std::move(merged)};

        if (!routes_.contains(kind))
            kind_order_.push_back(kind);
        auto &bucket = routes_[kind];

        auto existing = std::find_if(bucket.begin(), bucket.end(), [&](const RouteEntry &r) {
            return r.pattern.tokens() == entry.pattern.tokens();
        });
        if (existing != bucket.end())
        {
            *existing = std::move(entry);
            return {};
        }
        bucket.push_back(std::move(entry));
        return {};
    }

    Result<RouteMatch> RouteTable::lookup(const std::string &kind, const std::vector<std::string> &segments) const
    {
        auto it = routes_.find(kind);
        if (it != routes_.end())
        {
            for (const auto &entry : it->second)
            {
                if (auto captured = entry.pattern.match(segments))
                    return RouteMatch{entry, std::move(*captured)};
            }
        }

        std::string joined;
        for (const auto &s : segments)
        {
            if (!joined.empty())
                joined += style_ == PatternStyle::Path ? "/" : " ";
            joined += s;
        }
        return std::unexpected(LucentError::route_not_found("No route for " + kind + " '" + joined + "'"));
    }

    Result<RouteMatch> RouteTable::lookup_input(const std::string &kind, std::string_view input) const
    {
        return lookup(kind, tokenize(input, style_));
    }

    const std::vector<RouteEntry> &RouteTable::entries(const std::string &kind) const
    {
        static const std::vector<RouteEntry> empty;
        auto it = routes_.find(kind);
        return it == routes_.end() ? empty : it->second;
    }

    std::vector<std::string> RouteTable::kinds() const
    {
        return kind_order_;
    }

    void RouteTable::clear()
    {
        table_middleware_.clear();
        kind_order_.clear();
        routes_.clear();
    }

} // namespace lucent
