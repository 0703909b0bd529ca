#include "genoflow/execution/run_outcome.hpp"
#include <iomanip>
#include <sstream>

namespace genoflow
{

std::string RunOutcome::status_table() const
{
    size_t id_width = 4;
    for (const auto& r : results)
    {
        id_width = std::max(id_width, r.task_id.size());
    }

    std::ostringstream oss;
    oss << std::left << std::setw(static_cast<int>(id_width)) << "TASK" << "  "
        << std::setw(10) << "STATUS" << "  "
        << std::setw(7) << "ATTEMPT" << "  "
        << std::setw(10) << "DURATION" << "  "
        << "DETAIL" << '\n';

    for (const auto& r : results)
    {
        std::string detail;
        if (r.error)
        {
            detail = r.error->kind + ": " + r.error->message;
        }
        else if (!r.skip_reason.empty())
        {
            detail = "skipped: " + r.skip_reason;
        }

        oss << std::setw(static_cast<int>(id_width)) << r.task_id << "  "
            << std::setw(10) << to_string(r.status) << "  "
            << std::setw(7) << r.attempt << "  "
            << std::setw(10) << (std::to_string(r.duration().count()) + "ms") << "  "
            << detail << '\n';
    }
    return oss.str();
}

} // namespace genoflow
