#include "lucent/demo.hpp"
#include <cstdint>
#include <spdlog/spdlog.h>

namespace lucent::demo
{

    namespace
    {
        constexpr const char *kUserType = "User";

        nlohmann::json user_view(const Entity &user)
        {
            return user.attributes;
        }

        class UserController : public Controller
        {
        public:
            UserController(std::shared_ptr<UserService> users, std::shared_ptr<const RuleCatalog> rules)
                : users_(std::move(users)), rules_(std::move(rules))
            {
            }

            Result<Response> show(BoundArguments &args)
            {
                return Response::json(200, user_view(args.entity("user")));
            }

            Result<Response> store(BoundArguments &args)
            {
                auto &request = args.context();

                InputMap input(request.input.begin(), request.input.end());
                if (!request.body.empty())
                {
                    auto body = nlohmann::json::parse(request.body, nullptr, false);
                    if (body.is_discarded() || !body.is_object())
                        return Response::error(400, "Request body must be a JSON object");
                    for (const auto &[key, value] : body.items())
                        input[key] = to_display_string(value);
                }

                UserRules rules(rules_);
                auto outcome = rules.validate(input, &request);
                if (!outcome)
                    return std::unexpected(outcome.error());
                if (!outcome->passed())
                {
                    return Response::json(422, {{"outcome", false},
                                                {"status", 422},
                                                {"errors", outcome->to_json()}});
                }

                auto user = users_->create(input["email"], input["name"]);
                if (!user)
                    return std::unexpected(user.error());
                return Response::json(201, user_view(*user));
            }

        private:
            std::shared_ptr<UserService> users_;
            std::shared_ptr<const RuleCatalog> rules_;
        };

        class UserCommands : public Controller
        {
        public:
            explicit UserCommands(std::shared_ptr<UserService> users) : users_(std::move(users)) {}

            Result<std::string> show(BoundArguments &args)
            {
                auto id = args.string("user");
                auto user = users_->find(id);
                if (!user)
                    return std::unexpected(user.error());
                if (!user->has_value())
                    return "No user with id " + id;
                return user_view(**user).dump(2);
            }

            Result<std::string> add(BoundArguments &args)
            {
                const auto &options = args.value("options");
                std::string name;
                if (auto it = options.find("name"); it != options.end())
                    name = to_display_string(*it);

                UserRules rules(args.service<RuleCatalog>("rules"));
                auto outcome = rules.validate({{"email", args.string("email")}, {"name", name}});
                if (!outcome)
                    return std::unexpected(outcome.error());
                if (!outcome->passed())
                {
                    std::string out = "Validation failed:";
                    for (const auto &[field, message] : outcome->errors)
                        out += "\n  " + field + ": " + message;
                    return out;
                }

                auto user = users_->create(args.string("email"), name);
                if (!user)
                    return std::unexpected(user.error());
                return "Created user " + user->key();
            }

        private:
            std::shared_ptr<UserService> users_;
        };
    } // namespace

    UserService::UserService(std::shared_ptr<EntityStore> store) : store_(std::move(store)) {}

    Result<std::optional<Entity>> UserService::find(const std::string &id) const
    {
        return store_->find_one(kUserType, "id", id);
    }

    Result<Entity> UserService::create(const std::string &email, const std::string &name)
    {
        std::int64_t id = 1;
        while (true)
        {
            auto existing = find(std::to_string(id));
            if (!existing)
                return std::unexpected(existing.error());
            if (!existing->has_value())
                break;
            ++id;
        }

        Entity user;
        user.type = kUserType;
        user.attributes = {{"id", id}, {"email", email}, {"name", name}};
        auto saved = store_->save(user);
        if (!saved)
            return std::unexpected(saved.error());
        spdlog::info("created user {} <{}>", id, email);
        return user;
    }

    FieldRules UserRules::setup() const
    {
        return {
            {"email", {"required", "regex:email", "unique:User"}},
            {"name", {"nullable", "min:2", "max:64"}},
        };
    }

    Result<void> install(Application &app)
    {
        auto store = app.entity_store();
        if (!store)
            return std::unexpected(LucentError::config("The demo application needs an entity store"));

        app.entities().add(kUserType, "id");
        app.services().add<UserService>("UserService", std::make_shared<UserService>(store));

        app.handlers()
            .controller<UserController>("UserController")
            .construct({ParamDescriptor::service("users", "UserService"),
                        ParamDescriptor::service("rules", "RuleCatalog")},
                       [](BoundArguments &args) {
                           return std::make_shared<UserController>(args.service<UserService>("users"),
                                                                   args.service<RuleCatalog>("rules"));
                       })
            .action("show", {ParamDescriptor::entity("user", kUserType)}, &UserController::show)
            .action("store", {ParamDescriptor::context("request")}, &UserController::store);

        app.handlers()
            .controller<UserCommands>("UserCommands")
            .construct({ParamDescriptor::service("users", "UserService")},
                       [](BoundArguments &args) {
                           return std::make_shared<UserCommands>(args.service<UserService>("users"));
                       })
            .command("show", {ParamDescriptor::scalar("user")}, &UserCommands::show)
            .command("add",
                     {ParamDescriptor::scalar("email"),
                      ParamDescriptor::scalar("options", ScalarType::Any, nlohmann::json::object()),
                      ParamDescriptor::service("rules", "RuleCatalog")},
                     &UserCommands::add);

        for (auto result : {app.register_route("GET", "/users/{user}", "UserController", "show"),
                            app.register_route("POST", "/users", "UserController", "store"),
                            app.register_command("user show {user}", "UserCommands", "show"),
                            app.register_command("user add {email}", "UserCommands", "add")})
        {
            if (!result)
                return result;
        }
        return {};
    }

} // namespace lucent::demo
