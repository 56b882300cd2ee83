#include "model/loader.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace lazyserve::model
{

    namespace
    {

        std::vector<std::string> toStringList(const json &node)
        {
            std::vector<std::string> out;
            if (!node.is_array())
            {
                return out;
            }

            for (const auto &item : node)
            {
                if (!item.is_string())
                {
                    continue;
                }
                std::string value = item.get<std::string>();
                if (!value.empty())
                {
                    out.push_back(value);
                }
            }
            return out;
        }

        fs::path resolveAgainst(const fs::path &base, const std::string &value)
        {
            fs::path path(value);
            if (path.is_absolute())
            {
                return path;
            }
            return (base / path).lexically_normal();
        }

        bool readString(const json &data, const char *key, std::string &out, const lazyserve::Context &ctx)
        {
            if (!data.contains(key))
            {
                return false;
            }
            if (!data[key].is_string())
            {
                ctx.warn("Config key '", key, "' must be a string, ignored");
                return false;
            }
            out = data[key].get<std::string>();
            return true;
        }

        void readBool(const json &data, const char *key, bool &out, const lazyserve::Context &ctx)
        {
            if (!data.contains(key))
            {
                return;
            }
            if (!data[key].is_boolean())
            {
                ctx.warn("Config key '", key, "' must be a boolean, ignored");
                return;
            }
            out = data[key].get<bool>();
        }

    } // namespace

    std::optional<ServeSpec> loadServeFile(
        const fs::path &configFile,
        const ServeSpec &base,
        const lazyserve::Context &ctx)
    {
        json data;
        try
        {
            data = io::loadJsonFile(configFile);
        }
        catch (const std::runtime_error &e)
        {
            ctx.error(e.what());
            return std::nullopt;
        }

        const fs::path configDir = fs::absolute(configFile).parent_path();
        ServeSpec spec = base;

        if (data.contains("port"))
        {
            if (data["port"].is_number_integer())
            {
                const std::int64_t port = data["port"].get<std::int64_t>();
                if (port <= 0 || port > 65535)
                {
                    ctx.error("Config key 'port' out of range: ", data["port"].dump());
                    return std::nullopt;
                }
                spec.port = static_cast<int>(port);
            }
            else
            {
                ctx.warn("Config key 'port' must be an integer, ignored");
            }
        }

        readString(data, "host", spec.host, ctx);
        readString(data, "index", spec.indexFile, ctx);
        readString(data, "command", spec.command, ctx);

        std::string value;
        if (readString(data, "serve", value, ctx))
        {
            spec.serveDir = resolveAgainst(configDir, value);
        }
        if (readString(data, "watch", value, ctx))
        {
            spec.watchDir = resolveAgainst(configDir, value);
        }

        if (data.contains("ignore"))
        {
            if (!data["ignore"].is_array())
            {
                ctx.warn("Config key 'ignore' must be an array of strings, ignored");
            }
            for (const auto &item : toStringList(data["ignore"]))
            {
                spec.ignore.push_back(resolveAgainst(configDir, item));
            }
        }

        readBool(data, "open", spec.openBrowser, ctx);
        readBool(data, "verbose", spec.verbose, ctx);

        return spec;
    }

} // namespace lazyserve::model
