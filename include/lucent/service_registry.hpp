#pragma once

#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace lucent
{

    /**
     * A type-erased singleton service. The stored type is recorded so that
     * retrieval with the wrong type yields nullptr instead of a bad cast.
     */
    class ServiceHandle
    {
    public:
        ServiceHandle() : type_(typeid(void)) {}

        template <typename T>
        explicit ServiceHandle(std::shared_ptr<T> instance)
            : instance_(std::move(instance)), type_(typeid(T))
        {
        }

        template <typename T>
        std::shared_ptr<T> get() const
        {
            if (type_ != std::type_index(typeid(T)))
                return nullptr;
            return std::static_pointer_cast<T>(instance_);
        }

        bool empty() const { return instance_ == nullptr; }

    private:
        std::shared_ptr<void> instance_;
        std::type_index type_;
    };

    /**
     * Process-lifetime mapping from a service key to its singleton instance.
     * Populated during boot, read-only while requests are served.
     */
    class ServiceRegistry
    {
    public:
        template <typename T>
        std::shared_ptr<T> add(std::string key, std::shared_ptr<T> instance)
        {
            services_.insert_or_assign(std::move(key), ServiceHandle(instance));
            return instance;
        }

        bool contains(const std::string &key) const
        {
            return services_.contains(key);
        }

        std::optional<ServiceHandle> handle(const std::string &key) const
        {
            auto it = services_.find(key);
            if (it == services_.end())
                return std::nullopt;
            return it->second;
        }

        template <typename T>
        std::shared_ptr<T> get(const std::string &key) const
        {
            auto h = handle(key);
            return h ? h->template get<T>() : nullptr;
        }

        void clear() { services_.clear(); }

    private:
        std::unordered_map<std::string, ServiceHandle> services_;
    };

} // namespace lucent
