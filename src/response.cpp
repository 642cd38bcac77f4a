#include "lucent/response.hpp"

namespace lucent
{

    Response Response::json(int status, const nlohmann::json &payload)
    {
        Response res;
        res.status = status;
        res.headers["Content-Type"] = "application/json";
        res.body = payload.dump();
        return res;
    }

    Response Response::text(int status, std::string body)
    {
        Response res;
        res.status = status;
        res.headers["Content-Type"] = "text/plain; charset=utf-8";
        res.body = std::move(body);
        return res;
    }

    Response Response::error(int status, const std::string &message)
    {
        return json(status, {{"outcome", false},
                             {"status", status},
                             {"message", message.empty() ? default_error_message(status) : message}});
    }

    std::string default_error_message(int status)
    {
        switch (status)
        {
        case 401:
            return "Authentication required. Please log in to access this resource.";
        case 403:
            return "You don't have permission to access this resource.";
        case 404:
            return "The page you're looking for cannot be found. It may have been moved, deleted, or never existed.";
        case 500:
            return "We're experiencing technical difficulties. Our team has been notified and is working to resolve the issue.";
        default:
            return "An error occurred while processing your request.";
        }
    }

} // namespace lucent
