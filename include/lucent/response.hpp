#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace lucent
{

    /**
     * Handler result forwarded to the transport: status code, headers and an
     * already-rendered body. The dispatcher never interprets the body.
     */
    struct Response
    {
        int status{200};
        std::map<std::string, std::string> headers;
        std::string body;

        static Response json(int status, const nlohmann::json &payload);
        static Response text(int status, std::string body);

        /**
         * Framework error body: {"outcome": false, "status": code, "message": text}.
         * An empty message selects the default text for the status.
         */
        static Response error(int status, const std::string &message = {});
    };

    /** Default user-facing text for an error status. */
    std::string default_error_message(int status);

} // namespace lucent
