#pragma once

#include "application.hpp"
#include "entity_store.hpp"
#include "validation.hpp"
#include <memory>
#include <string>

namespace lucent::demo
{

    /** Creates and looks up "User" entities. */
    class UserService
    {
    public:
        explicit UserService(std::shared_ptr<EntityStore> store);

        Result<std::optional<Entity>> find(const std::string &id) const;

        /** Store a new user under the next free numeric id. */
        Result<Entity> create(const std::string &email, const std::string &name);

    private:
        std::shared_ptr<EntityStore> store_;
    };

    /** email: required, well-formed and not taken; name: optional, 2 to 64 characters. */
    class UserRules : public RuleSet
    {
    public:
        using RuleSet::RuleSet;

    protected:
        FieldRules setup() const override;
    };

    /**
     * Register the User entity, UserService, the HTTP routes
     * GET /users/{user} and POST /users and the commands "user show {user}"
     * and "user add {email}". The application must already have a store.
     */
    Result<void> install(Application &app);

} // namespace lucent::demo
