#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

class IConfigDef
{
public:
    virtual ~IConfigDef() = default;
    virtual const std::string& GetSection() const = 0;
    virtual const std::string& GetName() const = 0;
    virtual bool ReadValue(const nlohmann::json& json) = 0;
    virtual void MakeDefault() = 0;
    virtual std::string GetValueString() const = 0;
};

inline std::vector<IConfigDef*> g_configDefinitions;

template<typename T>
class ConfigDef final : public IConfigDef
{
public:
    std::string Section;
    std::string Name;
    T DefaultValue;
    T Value;

    ConfigDef(std::string section, std::string name, T defaultValue)
        : Section(std::move(section)), Name(std::move(name)), DefaultValue(defaultValue), Value(defaultValue)
    {
        g_configDefinitions.push_back(this);
    }

    const std::string& GetSection() const override
    {
        return Section;
    }

    const std::string& GetName() const override
    {
        return Name;
    }

    bool ReadValue(const nlohmann::json& json) override
    {
        try
        {
            Value = json.get<T>();
            return true;
        }
        catch (const nlohmann::json::type_error&)
        {
            return false;
        }
    }

    void MakeDefault() override
    {
        Value = DefaultValue;
    }

    std::string GetValueString() const override
    {
        return nlohmann::json(Value).dump();
    }

    operator const T&() const
    {
        return Value;
    }

    ConfigDef& operator=(const T& value)
    {
        Value = value;
        return *this;
    }
};

#define CONFIG_DEFINE(section, type, name, ...) \
    static inline ConfigDef<type> name{ section, #name, __VA_ARGS__ }

class Config
{
public:
#include "config_def.h"

    /**
     * Reset every setting and read the JSON file at path over the defaults.
     * The file holds one object per section, keyed by setting name. Comments
     * are allowed. A missing file is not an error. Unknown keys and values of
     * the wrong type are reported as warnings and skipped.
     * @return false if the file exists but cannot be read or parsed
     */
    static bool Load(const std::filesystem::path& path);

    static void MakeDefaults();
};

#undef CONFIG_DEFINE
