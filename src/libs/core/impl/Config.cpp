/*
 * Copyright (C) 2016 Emeric Poupon
 *
 * This file is part of LPD.
 *
 * LPD is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LPD is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LPD.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Config.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"

namespace lpd::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw LpdException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw LpdException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw LpdException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    template<typename T>
    T Config::lookup(std::string_view setting, T def) const
    {
        T res{ def };
        // lookupValue leaves res untouched if the setting is missing or of the wrong type
        if (!_config.lookupValue(std::string{ setting }, res) && _config.exists(std::string{ setting }))
            LPD_LOG(UTILS, WARNING, "Invalid type for config setting '" << setting << "', using default value");

        return res;
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        try
        {
            return static_cast<const char*>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::ConfigException&)
        {
            return def;
        }
    }

    void Config::visitStrings(std::string_view setting, std::function<void(std::string_view)> _func, std::initializer_list<std::string_view> defs)
    {
        try
        {
            const libconfig::Setting& values{ _config.lookup(std::string{ setting }) };
            for (int i{}; i < values.getLength(); ++i)
                _func(static_cast<const char*>(values[i]));
        }
        catch (const libconfig::SettingNotFoundException&)
        {
            for (std::string_view def : defs)
                _func(def);
        }
        catch (const libconfig::SettingTypeException&)
        {
            LPD_LOG(UTILS, WARNING, "Config setting '" << setting << "' must be a list of strings");
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        const std::string_view res{ getString(setting, "") };
        if (res.empty())
            return def;

        return std::filesystem::path{ res };
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        // libconfig has no unsigned long accessor
        const long long res{ lookup<long long>(setting, static_cast<long long>(def)) };
        if (res < 0)
        {
            LPD_LOG(UTILS, WARNING, "Config setting '" << setting << "' must be positive, using default value");
            return def;
        }

        return static_cast<unsigned long>(res);
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        return lookup<bool>(setting, def);
    }
} // namespace lpd::core
