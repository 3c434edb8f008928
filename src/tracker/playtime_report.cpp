#include "playtime_report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace tracker
{
    std::string format_duration(std::chrono::nanoseconds duration)
    {
        const bool negative = duration.count() < 0;
        const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(negative ? -duration : duration).count();

        const auto hours = total_seconds / 3600;
        const auto minutes = (total_seconds / 60) % 60;
        const auto seconds = total_seconds % 60;

        std::ostringstream oss;
        if (negative)
        {
            oss << '-';
        }
        oss << std::setfill('0')
            << std::setw(2) << hours << ':'
            << std::setw(2) << minutes << ':'
            << std::setw(2) << seconds;
        return oss.str();
    }

    std::string render_totals(const std::optional<playtime::ActivityTotals>& totals,
                              const playtime::ActivityCatalog& catalog,
                              std::optional<std::chrono::nanoseconds> liveElapsed)
    {
        std::ostringstream oss;
        if (!totals)
        {
            oss << "No playtime recorded yet.\n";
        }
        else
        {
            std::vector<std::pair<std::string, std::int64_t>> rows(totals->begin(), totals->end());
            std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
                return a.second > b.second;
            });

            oss << "Played:\n";
            for (const auto& [activity, nanos] : rows)
            {
                oss << "  " << catalog.display_name(activity) << "  "
                    << format_duration(std::chrono::nanoseconds{nanos}) << '\n';
            }
        }

        if (liveElapsed)
        {
            oss << "  (current session, not yet saved)  " << format_duration(*liveElapsed) << '\n';
        }

        return oss.str();
    }
}
