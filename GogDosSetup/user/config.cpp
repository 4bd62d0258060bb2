#include "config.h"

#include <fstream>

#include <os/logger.h>

static IConfigDef* findDefinition(std::string_view section, std::string_view name)
{
    for (IConfigDef* def : g_configDefinitions)
    {
        if (def->GetSection() == section && def->GetName() == name)
        {
            return def;
        }
    }

    return nullptr;
}

void Config::MakeDefaults()
{
    for (IConfigDef* def : g_configDefinitions)
    {
        def->MakeDefault();
    }
}

bool Config::Load(const std::filesystem::path& path)
{
    MakeDefaults();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        LOGF_UTILITY("No configuration at {}, using defaults", path.string());
        return true;
    }

    std::ifstream inStream(path);
    if (!std::filesystem::is_regular_file(path, ec) || !inStream.is_open())
    {
        LOGFN_WARNING("Unable to read configuration {}", path.string());
        return false;
    }

    nlohmann::json root = nlohmann::json::parse(inStream, nullptr, false, true);
    if (root.is_discarded())
    {
        LOGFN_WARNING("Unable to parse configuration {}", path.string());
        return false;
    }

    if (!root.is_object())
    {
        LOGFN_WARNING("{}: expected an object of sections", path.string());
        return false;
    }

    for (const auto& [section, settings] : root.items())
    {
        if (!settings.is_object())
        {
            LOGFN_WARNING("{}: section {} is not an object", path.string(), section);
            continue;
        }

        for (const auto& [name, value] : settings.items())
        {
            IConfigDef* def = findDefinition(section, name);
            if (def == nullptr)
            {
                LOGFN_WARNING("{}: unknown setting {}.{}", path.string(), section, name);
                continue;
            }

            if (!def->ReadValue(value))
            {
                LOGFN_WARNING("{}: invalid value {} for {}.{}", path.string(), value.dump(), section, name);
                def->MakeDefault();
                continue;
            }

            LOGF_UTILITY("{}.{} = {}", section, name, def->GetValueString());
        }
    }

    return true;
}
