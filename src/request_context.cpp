#include "lucent/request_context.hpp"
#include <algorithm>
#include <cctype>

namespace lucent
{

    namespace
    {
        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    } // namespace

    void EntityCache::put(const std::string &name, Entity entity)
    {
        auto key = std::make_pair(name, entity.type);
        entries_.insert_or_assign(std::move(key), std::move(entity));
    }

    const Entity *EntityCache::find(const std::string &name, const std::string &type) const
    {
        auto it = entries_.find(std::make_pair(name, type));
        if (it == entries_.end())
            return nullptr;
        return &it->second;
    }

    RequestContext RequestContext::from_http(const HttpRequest &request)
    {
        RequestContext ctx;
        ctx.method = request.method;
        std::transform(ctx.method.begin(), ctx.method.end(), ctx.method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        auto query_pos = request.target.find('?');
        ctx.path = request.target.substr(0, request.target.find_first_of("?#"));
        if (query_pos != std::string::npos)
        {
            auto query = std::string_view(request.target).substr(query_pos + 1);
            query = query.substr(0, query.find('#'));
            ctx.input = parse_query(query);
        }

        for (const auto &[name, value] : request.headers)
            ctx.headers[lower(name)] = value;
        ctx.body = request.body;
        return ctx;
    }

    std::optional<std::string> RequestContext::header(const std::string &name) const
    {
        auto it = headers.find(lower(name));
        if (it == headers.end())
            return std::nullopt;
        return it->second;
    }

} // namespace lucent
