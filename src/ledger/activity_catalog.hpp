#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace playtime
{
    // Display names for activity ids. Ledger keys stay opaque; the catalog only
    // decorates reports and lets the presence router skip unknown activities.
    class ActivityCatalog
    {
    public:
        [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
        [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

        [[nodiscard]] bool contains(const std::string& activity_id) const;
        [[nodiscard]] std::string_view name_for(const std::string& activity_id) const;

        // Falls back to the raw id when the activity is not catalogued.
        [[nodiscard]] std::string display_name(const std::string& activity_id) const;

        void add(std::string activity_id, std::string name);

    private:
        std::unordered_map<std::string, std::string> names_;
    };

    // Accepts either [{"id": 1, "name": "Game"}, ...] or {"1": "Game", ...}.
    // Throws std::invalid_argument on malformed documents.
    [[nodiscard]] ActivityCatalog parse_activity_catalog(const nlohmann::json& json);
    [[nodiscard]] ActivityCatalog load_activity_catalog_from_file(const std::filesystem::path& path);
}
