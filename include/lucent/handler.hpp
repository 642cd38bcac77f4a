#pragma once

#include "types.hpp"
#include "coercion.hpp"
#include "entity.hpp"
#include "request_context.hpp"
#include "response.hpp"
#include "service_registry.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace lucent
{

    /** How a handler parameter is resolved by the binder. */
    enum class ParamKind
    {
        Context, // the live RequestContext
        Entity,  // route-model binding through the EntityStore
        Service, // singleton from the ServiceRegistry
        Scalar   // captured variable coerced to a scalar type
    };

    /**
     * Statically declared description of one handler parameter, built at
     * registration time in place of runtime reflection.
     */
    struct ParamDescriptor
    {
        std::string name;
        ParamKind kind{ParamKind::Scalar};
        std::string type; // entity type name or service key
        ScalarType scalar_type{ScalarType::String};
        std::optional<nlohmann::json> default_value;

        static ParamDescriptor context(std::string name);
        static ParamDescriptor entity(std::string name, std::string entity_type);
        static ParamDescriptor service(std::string name, std::string service_key);
        static ParamDescriptor scalar(std::string name,
                                      ScalarType type = ScalarType::String,
                                      std::optional<nlohmann::json> default_value = std::nullopt);

        bool has_default() const { return default_value.has_value(); }
    };

    /**
     * Name-keyed handler arguments in declaration order.
     */
    class BoundArguments
    {
    public:
        using Value = std::variant<nlohmann::json, Entity, ServiceHandle, RequestContext *>;

        void set(const std::string &name, Value value);
        bool contains(const std::string &name) const;
        std::size_t size() const { return values_.size(); }
        const std::vector<std::string> &names() const { return order_; }

        /** Scalar value; throws LucentError when absent or not a scalar. */
        const nlohmann::json &value(const std::string &name) const;

        std::int64_t integer(const std::string &name) const;
        double number(const std::string &name) const;
        bool boolean(const std::string &name) const;
        std::string string(const std::string &name) const;

        const Entity &entity(const std::string &name) const;

        template <typename T>
        std::shared_ptr<T> service(const std::string &name) const
        {
            auto *h = std::get_if<ServiceHandle>(&at(name));
            if (!h)
                throw LucentError::internal("Argument '" + name + "' is not a service");
            auto instance = h->get<T>();
            if (!instance)
                throw LucentError::internal("Service argument '" + name + "' has a different type");
            return instance;
        }

        /** The injected request context; throws when the handler did not declare one. */
        RequestContext &context() const;

    private:
        const Value &at(const std::string &name) const;

        std::vector<std::string> order_;
        std::unordered_map<std::string, Value> values_;
    };

    /** Base class of every controller. */
    class Controller
    {
    public:
        virtual ~Controller() = default;
    };

    using HandlerFn = std::function<Result<Response>(Controller &, BoundArguments &)>;
    using ControllerFactory = std::function<std::shared_ptr<Controller>(BoundArguments &)>;

    struct MethodDescriptor
    {
        std::string name;
        std::vector<ParamDescriptor> params;
        HandlerFn invoke;
    };

    struct ControllerDescriptor
    {
        std::string name;
        std::vector<ParamDescriptor> constructor_params; // service parameters only
        ControllerFactory factory;
        std::unordered_map<std::string, MethodDescriptor> methods;

        const MethodDescriptor *method(const std::string &action) const;
    };

    template <typename C>
    class ControllerBuilder
    {
        static_assert(std::is_base_of_v<Controller, C>, "controllers must derive from lucent::Controller");

    public:
        explicit ControllerBuilder(ControllerDescriptor &descriptor) : descriptor_(descriptor) {}

        /** Declare constructor services and the factory that receives them. */
        ControllerBuilder &construct(std::vector<ParamDescriptor> params,
                                     std::function<std::shared_ptr<C>(BoundArguments &)> factory)
        {
            descriptor_.constructor_params = std::move(params);
            descriptor_.factory = [factory = std::move(factory)](BoundArguments &args) -> std::shared_ptr<Controller> {
                return factory(args);
            };
            return *this;
        }

        /** Declare an HTTP action. */
        ControllerBuilder &action(std::string name,
                                  std::vector<ParamDescriptor> params,
                                  Result<Response> (C::*fn)(BoundArguments &))
        {
            HandlerFn invoke = [fn](Controller &controller, BoundArguments &args) -> Result<Response> {
                return (static_cast<C &>(controller).*fn)(args);
            };
            add(std::move(name), std::move(params), std::move(invoke));
            return *this;
        }

        /** Declare a command action; its text becomes the response body. */
        ControllerBuilder &command(std::string name,
                                   std::vector<ParamDescriptor> params,
                                   Result<std::string> (C::*fn)(BoundArguments &))
        {
            HandlerFn invoke = [fn](Controller &controller, BoundArguments &args) -> Result<Response> {
                auto output = (static_cast<C &>(controller).*fn)(args);
                if (!output)
                    return std::unexpected(output.error());
                return Response::text(200, std::move(*output));
            };
            add(std::move(name), std::move(params), std::move(invoke));
            return *this;
        }

    private:
        void add(std::string name, std::vector<ParamDescriptor> params, HandlerFn invoke)
        {
            auto key = name;
            descriptor_.methods.insert_or_assign(
                std::move(key), MethodDescriptor{std::move(name), std::move(params), std::move(invoke)});
        }

        ControllerDescriptor &descriptor_;
    };

    /**
     * Explicit registry mapping controller names to their declared
     * constructors and methods.
     */
    class HandlerRegistry
    {
    public:
        template <typename C>
        ControllerBuilder<C> controller(const std::string &name)
        {
            auto &descriptor = controllers_[name];
            descriptor.name = name;
            if constexpr (std::is_default_constructible_v<C>)
            {
                if (!descriptor.factory)
                {
                    descriptor.factory = [](BoundArguments &) -> std::shared_ptr<Controller> {
                        return std::make_shared<C>();
                    };
                }
            }
            return ControllerBuilder<C>(descriptor);
        }

        const ControllerDescriptor *find(const std::string &name) const;

        void clear() { controllers_.clear(); }

    private:
        std::unordered_map<std::string, ControllerDescriptor> controllers_;
    };

} // namespace lucent
