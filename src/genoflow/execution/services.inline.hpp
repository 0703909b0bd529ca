/**
 * @file services.inline.hpp
 * @brief Implementations for type-parameterized methods of ServiceHandle and ServiceSet.
 */
#pragma once
#include "genoflow/execution/services.hpp"

namespace genoflow
{

namespace detail
{

/**
 * @brief The type a service is keyed by: T without reference or cv-qualifiers.
 */
template <typename T>
using service_key_t = std::remove_cv_t<std::remove_reference_t<T>>;

} // namespace detail

template <typename T>
ServiceHandle::ServiceHandle(std::shared_ptr<T> service)
{
    using KeyT = detail::service_key_t<T>;
    static_assert(!std::is_void_v<KeyT>, "ServiceHandle: T cannot be void");
    if (service)
    {
        m_pvoid = std::const_pointer_cast<KeyT>(std::move(service));
        m_ti = std::type_index{typeid(KeyT)};
    }
}

template <typename T>
bool ServiceHandle::has_type() const noexcept
{
    using KeyT = detail::service_key_t<T>;
    return m_ti == std::type_index{typeid(KeyT)};
}

template <typename T>
std::shared_ptr<T> ServiceHandle::get() const noexcept
{
    using KeyT = detail::service_key_t<T>;
    if (!m_pvoid || m_ti != std::type_index{typeid(KeyT)})
    {
        return nullptr;
    }
    return std::static_pointer_cast<KeyT>(m_pvoid);
}

template <typename T>
void ServiceSet::set(const std::string& name, std::shared_ptr<T> service)
{
    if (name.empty())
    {
        throw std::invalid_argument("Service name must not be empty");
    }
    if (!service)
    {
        throw std::invalid_argument("Service '" + name + "' is null");
    }
    m_services[name] = ServiceHandle{std::move(service)};
}

template <typename T>
std::shared_ptr<T> ServiceSet::get(const std::string& name) const
{
    auto it = m_services.find(name);
    if (it == m_services.end())
    {
        return nullptr;
    }
    if (!it->second.has_type<T>())
    {
        throw ServiceTypeError{"Service '" + name + "' has type " + it->second.type().name() +
                               ", requested " + typeid(detail::service_key_t<T>).name()};
    }
    return it->second.get<T>();
}

} // namespace genoflow
