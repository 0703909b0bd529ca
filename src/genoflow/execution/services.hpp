/**
 * @file services.hpp
 * @brief Type-erased named services (client handles, caches) shared by the tasks of one run.
 * @see services.inline.hpp for implementations of type-parameterized methods.
 */
#pragma once
#include "genoflow/common/common.hpp"

namespace genoflow
{

/**
 * @brief Exception thrown when a service is requested with the wrong type.
 */
class ServiceTypeError : public std::runtime_error
{
public:
    explicit ServiceTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Shared ownership of one service object of any type.
 *
 * @details
 * Stores a `shared_ptr<void>` together with the `type_index` of the object it
 * was created from, so that the object can only be recovered as its own type.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_pvoid == nullptr`
 *
 * @par Thread Safety
 * - Safe for simultaneous reading and being copied from.
 * - The handle does not synchronize access to the service object itself;
 *   services used by concurrent tasks must be thread-safe.
 */
class ServiceHandle
{
public:
    ServiceHandle() = default;

    /**
     * @brief Wrap an existing shared object.
     * @tparam T The service type. May be const-qualified.
     */
    template <typename T>
    explicit ServiceHandle(std::shared_ptr<T> service);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pvoid != nullptr;
    }

    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Get the service as T.
     * @return shared_ptr<T> if the type matches, nullptr otherwise.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> get() const noexcept;

private:
    std::shared_ptr<void> m_pvoid{};
    std::type_index m_ti{typeid(void)};
};

/**
 * @brief Name-keyed collection of ServiceHandles.
 *
 * @details
 * Populated by the caller before a run and copied into the run's
 * RunContext. Copies share the service objects.
 *
 * @par Thread safety
 * - No internal synchronization; populate before the run starts.
 */
class ServiceSet
{
public:
    /**
     * @brief Register @p service under @p name, replacing any previous one.
     * @throws std::invalid_argument if @p name is empty or @p service is null.
     */
    template <typename T>
    void set(const std::string& name, std::shared_ptr<T> service);

    /**
     * @brief Look up a service by name.
     * @return The service, or nullptr if absent.
     * @throws ServiceTypeError if the service exists with another type.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> get(const std::string& name) const;

    bool contains(const std::string& name) const
    {
        return m_services.find(name) != m_services.end();
    }

    bool remove(const std::string& name)
    {
        return m_services.erase(name) > 0;
    }

    size_t size() const noexcept
    {
        return m_services.size();
    }

    std::vector<std::string> names() const;

private:
    std::map<std::string, ServiceHandle> m_services;
};

} // namespace genoflow
