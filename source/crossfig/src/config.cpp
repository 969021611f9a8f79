#include "crossfig/config.hpp"
#include "crossfig/hash.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

namespace crossfig
{
    static inline void trim_inplace(std::string& s)
    {
        size_t a = 0;
        while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a])))
            ++a;
        size_t b = s.size();
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
            --b;
        s = s.substr(a, b - a);
    }

    static inline std::string_view trim_view(std::string_view v)
    {
        size_t a = 0;
        while (a < v.size() && std::isspace(static_cast<unsigned char>(v[a])))
            ++a;
        size_t b = v.size();
        while (b > a && std::isspace(static_cast<unsigned char>(v[b - 1])))
            --b;
        return v.substr(a, b - a);
    }

    static inline std::string_view unquote(std::string_view v)
    {
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
            return v.substr(1, v.size() - 2);
        return v;
    }

    bool is_identifier(std::string_view s)
    {
        if (s.empty())
            return false;
        const auto first = static_cast<unsigned char>(s[0]);
        if (!std::isalpha(first) && s[0] != '_')
            return false;
        for (char c : s)
        {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
                return false;
        }
        return true;
    }

    bool ConfigFile::hasFlag(std::string_view name) const { return flags.find(name) != flags.end(); }

    bool ConfigFile::hasValue(std::string_view key, std::string_view value) const
    {
        auto range = values.equal_range(key);
        for (auto it = range.first; it != range.second; ++it)
        {
            if (it->second == value)
                return true;
        }
        return false;
    }

    void ConfigFile::merge(const ConfigFile& other)
    {
        flags.insert(other.flags.begin(), other.flags.end());
        for (const auto& [key, value] : other.values)
        {
            if (!hasValue(key, value))
                values.emplace(key, value);
        }
    }

    static Result<void> set_key_value(ConfigFile& config, std::string_view kv)
    {
        const auto eq = kv.find('=');
        if (eq == std::string_view::npos)
            return Result<void>::err({ErrorCode::eParseError, "set requires KEY=VALUE"});

        const auto key   = trim_view(kv.substr(0, eq));
        const auto value = unquote(trim_view(kv.substr(eq + 1)));
        if (!is_identifier(key))
            return Result<void>::err({ErrorCode::eParseError, "invalid key: '" + std::string(key) + "'"});

        if (!config.hasValue(key, value))
            config.values.emplace(std::string(key), std::string(value));
        return Result<void>::ok();
    }

    Result<ConfigFile> parse_config_vcfg(std::string_view text, std::string_view path)
    {
        ConfigFile out;

        const std::string where = path.empty() ? std::string("vcfg") : std::string(path);

        std::istringstream iss((std::string(text)));
        std::string        line;
        size_t             lineNo = 0;

        while (std::getline(iss, line))
        {
            ++lineNo;
            trim_inplace(line);
            if (line.empty() || line[0] == '#')
                continue;

            const auto prefix = where + ":" + std::to_string(lineNo) + ": ";

            // directive + rest of line
            std::string_view s(line);
            size_t           k = 0;
            while (k < s.size() && !std::isspace(static_cast<unsigned char>(s[k])))
                ++k;
            const std::string_view directive = s.substr(0, k);
            const std::string_view rest      = trim_view(s.substr(k));

            if (directive == "flag")
            {
                if (!is_identifier(rest))
                    return Result<ConfigFile>::err(
                        {ErrorCode::eParseError, prefix + "flag requires an identifier, got '" + std::string(rest) + "'"});
                out.flags.emplace(rest);
            }
            else if (directive == "set")
            {
                auto r = set_key_value(out, rest);
                if (!r.isOk())
                    return Result<ConfigFile>::err({ErrorCode::eParseError, prefix + r.error().message});
            }
            else
            {
                return Result<ConfigFile>::err(
                    {ErrorCode::eParseError, prefix + "unknown directive: " + std::string(directive)});
            }
        }

        return Result<ConfigFile>::ok(std::move(out));
    }

    Result<ConfigFile> load_config_vcfg(const std::string& filePath)
    {
        std::ifstream f(filePath, std::ios::binary);
        if (!f)
            return Result<ConfigFile>::err({ErrorCode::eIO, "Failed to open vcfg file: " + filePath});

        f.seekg(0, std::ios::end);
        const auto size = static_cast<size_t>(f.tellg());
        f.seekg(0, std::ios::beg);

        std::string text;
        text.resize(size);
        f.read(text.data(), static_cast<std::streamsize>(size));
        if (!f)
            return Result<ConfigFile>::err({ErrorCode::eIO, "Failed to read vcfg file: " + filePath});

        return parse_config_vcfg(text, filePath);
    }

    Result<void> apply_define(ConfigFile& config, std::string_view define)
    {
        define = trim_view(define);
        if (define.find('=') != std::string_view::npos)
            return set_key_value(config, define);

        if (!is_identifier(define))
            return Result<void>::err({ErrorCode::eInvalidArgument, "invalid define: '" + std::string(define) + "'"});
        config.flags.emplace(define);
        return Result<void>::ok();
    }

    uint64_t config_fingerprint(const ConfigFile& config)
    {
        // flags and values are ordered containers, so the serialization is
        // canonical. Values of one key are sorted explicitly since multimap
        // keeps insertion order among equal keys.
        std::vector<uint8_t> buf;
        buf.reserve(256);

        auto append_str = [&](std::string_view s) {
            const uint32_t n = static_cast<uint32_t>(s.size());
            uint8_t        b[4];
            std::memcpy(b, &n, 4);
            buf.insert(buf.end(), b, b + 4);
            buf.insert(buf.end(), s.begin(), s.end());
        };

        buf.push_back('F');
        for (const auto& f : config.flags)
            append_str(f);

        buf.push_back('V');
        auto it = config.values.begin();
        while (it != config.values.end())
        {
            auto                     range = config.values.equal_range(it->first);
            std::vector<std::string> vals;
            for (auto v = range.first; v != range.second; ++v)
                vals.push_back(v->second);
            std::sort(vals.begin(), vals.end());

            append_str(it->first);
            for (const auto& v : vals)
                append_str(v);
            buf.push_back(0);

            it = range.second;
        }

        return xxhash64(buf.data(), buf.size());
    }
} // namespace crossfig
