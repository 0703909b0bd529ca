#include "genoflow/execution/services.hpp"

namespace genoflow
{

std::vector<std::string> ServiceSet::names() const
{
    std::vector<std::string> result;
    result.reserve(m_services.size());
    for (const auto& [name, handle] : m_services)
    {
        result.push_back(name);
    }
    return result;
}

} // namespace genoflow
