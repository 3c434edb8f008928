#pragma once

#include "activity_catalog.hpp"
#include "ledger.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace tracker
{
    // HH:MM:SS; hours keep growing past 24 rather than rolling into days.
    [[nodiscard]] std::string format_duration(std::chrono::nanoseconds duration);

    // The "played" listing for one identity, longest activity first. When a
    // live elapsed value is given it is reported on its own line and not mixed
    // into the stored totals.
    [[nodiscard]] std::string render_totals(const std::optional<playtime::ActivityTotals>& totals,
                                            const playtime::ActivityCatalog& catalog,
                                            std::optional<std::chrono::nanoseconds> liveElapsed = std::nullopt);
}
