#include "activity_catalog.hpp"

#include <fstream>
#include <stdexcept>

namespace playtime
{
    namespace
    {
        std::string read_id(const nlohmann::json& value)
        {
            if (value.is_string())
            {
                return value.get<std::string>();
            }
            if (value.is_number_integer())
            {
                return std::to_string(value.get<std::int64_t>());
            }
            throw std::invalid_argument("activity id must be a string or integer");
        }
    }

    bool ActivityCatalog::contains(const std::string& activity_id) const
    {
        return names_.find(activity_id) != names_.end();
    }

    std::string_view ActivityCatalog::name_for(const std::string& activity_id) const
    {
        const auto it = names_.find(activity_id);
        if (it == names_.end())
        {
            return std::string_view{};
        }
        return it->second;
    }

    std::string ActivityCatalog::display_name(const std::string& activity_id) const
    {
        const auto name = name_for(activity_id);
        return name.empty() ? activity_id : std::string{name};
    }

    void ActivityCatalog::add(std::string activity_id, std::string name)
    {
        names_[std::move(activity_id)] = std::move(name);
    }

    ActivityCatalog parse_activity_catalog(const nlohmann::json& json)
    {
        ActivityCatalog catalog;

        if (json.is_object())
        {
            for (const auto& [id, name] : json.items())
            {
                if (!name.is_string())
                {
                    throw std::invalid_argument("activity name for '" + id + "' must be a string");
                }
                catalog.add(id, name.get<std::string>());
            }
            return catalog;
        }

        if (!json.is_array())
        {
            throw std::invalid_argument("activity catalog must be an array or object");
        }

        for (const auto& entry : json)
        {
            if (!entry.is_object() || !entry.contains("id") || !entry.contains("name"))
            {
                throw std::invalid_argument("activity catalog entries need id and name");
            }

            const auto& name = entry.at("name");
            if (!name.is_string())
            {
                throw std::invalid_argument("activity name must be a string");
            }

            auto id = read_id(entry.at("id"));
            if (id.empty())
            {
                throw std::invalid_argument("activity id must not be empty");
            }
            catalog.add(std::move(id), name.get<std::string>());
        }

        return catalog;
    }

    ActivityCatalog load_activity_catalog_from_file(const std::filesystem::path& path)
    {
        std::ifstream stream(path);
        if (!stream)
        {
            throw std::runtime_error("Failed to open activity catalog: " + path.string());
        }

        const auto json = nlohmann::json::parse(stream, nullptr, false);
        if (json.is_discarded())
        {
            throw std::invalid_argument("Activity catalog is not valid JSON: " + path.string());
        }

        return parse_activity_catalog(json);
    }
}
