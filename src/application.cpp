#include "lucent/application.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace lucent
{

    namespace
    {
        constexpr const char *kHelpController = "lucent.help";

        std::string upper(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        std::string join(const std::vector<std::string> &parts, const char *sep)
        {
            std::string out;
            for (const auto &p : parts)
            {
                if (!out.empty())
                    out += sep;
                out += p;
            }
            return out;
        }

        bool counts_as_positional(const ParamDescriptor &p)
        {
            return p.kind != ParamKind::Context && p.kind != ParamKind::Service && p.name != "options";
        }

        /** Built-in "help" command listing every registered command pattern. */
        class HelpCommand : public Controller
        {
        public:
            explicit HelpCommand(const RouteTable &commands) : commands_(commands) {}

            Result<std::string> index(BoundArguments &)
            {
                std::string out = "Available commands:";
                for (const auto &entry : commands_.entries(kCommandKind))
                    out += "\n  " + entry.pattern.source();
                return out;
            }

        private:
            const RouteTable &commands_;
        };
    } // namespace

    ProcessedArguments process_arguments(const std::vector<std::string> &args)
    {
        ProcessedArguments out;
        for (const auto &arg : args)
        {
            if (!arg.starts_with("--"))
            {
                out.positional.push_back(arg);
                continue;
            }
            auto option = arg.substr(2);
            auto eq = option.find('=');
            if (eq == std::string::npos)
                out.options[option] = true;
            else
                out.options[option.substr(0, eq)] = option.substr(eq + 1);
        }
        return out;
    }

    Application::Application(AppConfig config)
        : config_(std::move(config)), rules_(std::make_shared<RuleCatalog>(RuleCatalog::defaults()))
    {
    }

    void Application::set_entity_store(std::shared_ptr<EntityStore> store)
    {
        store_ = std::move(store);
        rules_->set_store(store_);
    }

    Result<void> Application::register_route(const std::string &method,
                                             std::string_view pattern,
                                             const std::string &controller,
                                             const std::string &action,
                                             std::vector<MiddlewarePtr> middleware)
    {
        auto verb = upper(method);
        auto added = http_.add(verb, pattern, HandlerRef{controller, action}, std::move(middleware));
        if (added)
            spdlog::debug("registered route {} {} -> {}::{}", verb, pattern, controller, action);
        return added;
    }

    Result<void> Application::register_command(std::string_view pattern,
                                               const std::string &controller,
                                               const std::string &action,
                                               std::vector<MiddlewarePtr> middleware)
    {
        auto added = cli_.add(kCommandKind, pattern, HandlerRef{controller, action}, std::move(middleware));
        if (added)
            spdlog::debug("registered command '{}' -> {}::{}", pattern, controller, action);
        return added;
    }

    void Application::register_global_middleware(MiddlewarePtr middleware)
    {
        global_middleware_.push_back(std::move(middleware));
    }

    void Application::alias_middleware(const std::string &name, MiddlewarePtr middleware)
    {
        middleware_aliases_.insert_or_assign(name, std::move(middleware));
    }

    void Application::register_fallback(Response response)
    {
        fallback_ = std::move(response);
    }

    void Application::register_error_template(int status, Response response)
    {
        response.status = status;
        error_templates_.insert_or_assign(status, std::move(response));
    }

    Result<void> Application::register_declaration(const RouteDeclaration &decl)
    {
        std::vector<MiddlewarePtr> middleware;
        for (const auto &name : decl.middleware)
        {
            auto it = middleware_aliases_.find(name);
            if (it == middleware_aliases_.end())
            {
                return std::unexpected(LucentError::config("Route '" + decl.pattern +
                                                           "' references unknown middleware '" + name + "'"));
            }
            middleware.push_back(it->second);
        }

        if (decl.is_command)
            return register_command(decl.pattern, decl.controller, decl.action, std::move(middleware));
        return register_route(decl.method, decl.pattern, decl.controller, decl.action, std::move(middleware));
    }

    Result<void> Application::load_routing_file(const std::string &path)
    {
        auto declarations = RouteLoader::load(path);
        if (!declarations)
            return std::unexpected(declarations.error());
        for (const auto &decl : *declarations)
        {
            auto registered = register_declaration(decl);
            if (!registered)
                return registered;
        }
        spdlog::info("loaded {} declaration(s) from {}", declarations->size(), path);
        return {};
    }

    Result<void> Application::boot()
    {
        if (booted_)
            return {};

        for (const auto &path : config_.routing.route_files)
        {
            auto loaded = load_routing_file(path);
            if (!loaded)
                return loaded;
        }
        for (const auto &path : config_.routing.command_files)
        {
            auto loaded = load_routing_file(path);
            if (!loaded)
                return loaded;
        }

        handlers_.controller<HelpCommand>(kHelpController)
            .construct({}, [this](BoundArguments &) { return std::make_shared<HelpCommand>(cli_); })
            .command("index", {}, &HelpCommand::index);
        if (!cli_.lookup(kCommandKind, {"help"}))
        {
            auto help = register_command("help", kHelpController, "index");
            if (!help)
                return help;
        }

        services_.add<RuleCatalog>("RuleCatalog", rules_);

        booted_ = true;
        spdlog::info("{} booted ({} environment)", config_.name, config_.environment);
        return {};
    }

    void Application::teardown()
    {
        http_.clear();
        cli_.clear();
        services_.clear();
        handlers_.clear();
        global_middleware_.clear();
        middleware_aliases_.clear();
        fallback_.reset();
        error_templates_.clear();
        entities_.clear();
        rules_ = std::make_shared<RuleCatalog>(RuleCatalog::defaults());
        rules_->set_store(store_);
        booted_ = false;
        spdlog::debug("{} torn down", config_.name);
    }

    Response Application::error_response(int status, const std::string &message) const
    {
        if (auto it = error_templates_.find(status); it != error_templates_.end())
            return it->second;
        return Response::error(status, message);
    }

    ParameterBinder Application::binder() const
    {
        return ParameterBinder(services_, entities_, store_);
    }

    Result<Response> Application::handle(const HttpRequest &request)
    {
        if (!booted_)
        {
            return std::unexpected(LucentError::internal(
                config_.name + " has not been booted; call boot() before dispatching"));
        }

        auto context = RequestContext::from_http(request);
        auto segments = tokenize_path(request.target);

        auto match = http_.lookup(context.method, segments);
        if (!match)
        {
            spdlog::warn("{}", match.error().what());
            if (fallback_)
                return *fallback_;
            return error_response(404);
        }

        const auto &handler = match->route.handler;
        spdlog::debug("{} {} matched {} -> {}::{}", context.method, context.path,
                      match->route.pattern.source(), handler.controller, handler.action);

        const auto *controller = handlers_.find(handler.controller);
        if (!controller)
        {
            spdlog::error("controller {} is not registered", handler.controller);
            return error_response(500);
        }
        const auto *method = controller->method(handler.action);
        if (!method)
        {
            spdlog::error("controller {} has no action {}", handler.controller, handler.action);
            return error_response(500);
        }

        context.variables = match->variables;
        context.route = RouteInfo{handler.controller, handler.action, match->route.pattern.source(),
                                  context.method, match->variables};

        auto pipeline = MiddlewarePipeline::concat(global_middleware_, match->route.middleware);
        context = pipeline.run(std::move(context));

        auto binding = binder();

        auto ctor_args = binding.bind_constructor(controller->name, controller->constructor_params);
        if (!ctor_args)
        {
            spdlog::error("{}", ctor_args.error().what());
            return error_response(500);
        }
        if (!controller->factory)
        {
            spdlog::error("controller {} declares no constructor", controller->name);
            return error_response(500);
        }
        auto instance = controller->factory(*ctor_args);

        auto args = binding.bind(method->params, context, BindMode::Http);
        if (!args)
        {
            const auto &err = args.error();
            switch (err.code)
            {
            case ErrorCode::EntityNotFound:
                spdlog::warn("{}", err.what());
                return error_response(404);
            case ErrorCode::MissingArgument:
                spdlog::error("{}", err.what());
                return error_response(500, err.what());
            case ErrorCode::HandlerResolution:
                spdlog::error("{}", err.what());
                return error_response(500);
            default:
                spdlog::error("binding {}::{} failed: {}", handler.controller, handler.action, err.what());
                return std::unexpected(err);
            }
        }

        auto response = method->invoke(*instance, *args);
        if (!response)
        {
            spdlog::error("{}::{} failed: {}", handler.controller, handler.action, response.error().what());
        }
        return response;
    }

    Result<std::string> Application::run_command(const std::vector<std::string> &args)
    {
        if (!booted_)
        {
            return std::unexpected(LucentError::internal(
                config_.name + " has not been booted; call boot() before dispatching"));
        }

        auto processed = process_arguments(args);

        auto match = cli_.lookup(kCommandKind, processed.positional);
        if (!match)
        {
            spdlog::warn("{}", match.error().what());
            return std::string("Unrecognized command. Type 'help' to see available commands.\n"
                               "Did you mean something similar?");
        }

        const auto &handler = match->route.handler;
        const auto &pattern = match->route.pattern.source();

        const auto *controller = handlers_.find(handler.controller);
        if (!controller)
        {
            spdlog::error("command controller {} is not registered", handler.controller);
            return "Command registration error: The controller class '" + handler.controller +
                   "' could not be found.\nPlease check your command registration and ensure the class exists.";
        }
        const auto *method = controller->method(handler.action);
        if (!method)
        {
            spdlog::error("command controller {} has no action {}", handler.controller, handler.action);
            return "Invalid command: The method '" + handler.action + "' is not defined in the '" +
                   handler.controller + "' class.\nPlease verify the command registration and the controller's method.";
        }

        std::size_t required = 0;
        std::size_t total = 0;
        for (const auto &param : method->params)
        {
            if (!counts_as_positional(param))
                continue;
            ++total;
            if (!param.has_default())
                ++required;
        }
        auto captured = match->variables.size();
        if (captured < required || total < captured)
        {
            spdlog::warn("command '{}' expects {} argument(s), pattern captures {}", pattern, required, captured);
            return "Insufficient arguments! The command requires at least " + std::to_string(required) +
                   " parameters.\nUsage: " + pattern + usage_suffix(method->params);
        }

        RequestContext context;
        context.method = kCommandKind;
        context.path = join(processed.positional, " ");
        context.variables = match->variables;
        context.options = std::move(processed.options);
        context.route = RouteInfo{handler.controller, handler.action, pattern, kCommandKind, match->variables};

        MiddlewarePipeline pipeline(match->route.middleware);
        context = pipeline.run(std::move(context));

        auto binding = binder();

        auto ctor_args = binding.bind_constructor(controller->name, controller->constructor_params);
        if (!ctor_args)
        {
            spdlog::error("{}", ctor_args.error().what());
            return std::string(ctor_args.error().what());
        }
        if (!controller->factory)
        {
            return "Command registration error: The controller class '" + handler.controller +
                   "' could not be constructed.\nPlease check your command registration and ensure the class exists.";
        }
        auto instance = controller->factory(*ctor_args);

        auto bound = binding.bind(method->params, context, BindMode::Command);
        if (!bound)
        {
            const auto &err = bound.error();
            if (err.code == ErrorCode::MissingArgument || err.code == ErrorCode::HandlerResolution)
            {
                spdlog::warn("{}", err.what());
                return std::string(err.what());
            }
            return std::unexpected(err);
        }

        auto response = method->invoke(*instance, *bound);
        if (!response)
        {
            spdlog::error("command '{}' failed: {}", pattern, response.error().what());
            return std::unexpected(response.error());
        }
        return std::move(response->body);
    }

} // namespace lucent
