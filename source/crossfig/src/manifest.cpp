#include "crossfig/manifest.hpp"
#include "crossfig/io.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>

namespace crossfig
{
    static inline std::string trim_copy(std::string_view v)
    {
        size_t a = 0;
        while (a < v.size() && std::isspace(static_cast<unsigned char>(v[a])))
            ++a;
        size_t b = v.size();
        while (b > a && std::isspace(static_cast<unsigned char>(v[b - 1])))
            --b;
        return std::string(v.substr(a, b - a));
    }

    static inline std::string normalize_path_slashes(std::string s)
    {
        for (auto& c : s)
            if (c == '\\')
                c = '/';
        return s;
    }

    static std::string resolve_path(const std::string& baseDir, const std::string& p)
    {
        const std::filesystem::path fp(normalize_path_slashes(p));
        if (fp.is_absolute() || baseDir.empty())
            return fp.generic_string();
        return (std::filesystem::path(baseDir) / fp).lexically_normal().generic_string();
    }

    void split_list(std::string_view s, std::vector<std::string>& out)
    {
        out.clear();
        std::string cur;
        for (char c : s)
        {
            if (c == ';' || c == ',')
            {
                cur = trim_copy(cur);
                if (!cur.empty())
                    out.push_back(cur);
                cur.clear();
            }
            else
            {
                cur.push_back(c);
            }
        }
        cur = trim_copy(cur);
        if (!cur.empty())
            out.push_back(cur);
    }

    Result<UnitManifest> parse_units_manifest(std::string_view text, std::string_view path, const std::string& baseDir)
    {
        const std::string where = path.empty() ? std::string("manifest") : std::string(path);

        UnitManifest m;
        m.path = std::string(path);

        UnitEntry cur;
        bool      inUnit = false;

        auto flush = [&]() {
            if (inUnit)
            {
                const auto prefix = where + ":" + std::to_string(cur.line) + ": ";
                if (cur.name.empty())
                    return Result<void>::err({ErrorCode::eParseError, prefix + "missing 'name' in [unit]"});
                if (cur.input.empty())
                    return Result<void>::err({ErrorCode::eParseError, prefix + "missing 'input' in [unit] " + cur.name});
                if (cur.output.empty())
                    return Result<void>::err({ErrorCode::eParseError, prefix + "missing 'output' in [unit] " + cur.name});
                m.units.push_back(std::move(cur));
                cur    = UnitEntry {};
                inUnit = false;
            }
            return Result<void>::ok();
        };

        std::istringstream iss((std::string(text)));
        std::string        line;
        size_t             lineNo = 0;

        while (std::getline(iss, line))
        {
            ++lineNo;
            line = trim_copy(line);
            if (line.empty() || line[0] == '#')
                continue;

            if (line == "[unit]")
            {
                auto fr = flush();
                if (!fr.isOk())
                    return Result<UnitManifest>::err(fr.error());
                inUnit   = true;
                cur.line = lineNo;
                continue;
            }

            const auto prefix = where + ":" + std::to_string(lineNo) + ": ";

            if (line.front() == '[')
                return Result<UnitManifest>::err({ErrorCode::eParseError, prefix + "unknown section: " + line});

            auto eq = line.find('=');
            if (eq == std::string::npos)
                return Result<UnitManifest>::err({ErrorCode::eParseError, prefix + "expected key=value"});

            auto key = trim_copy(std::string_view(line).substr(0, eq));
            auto val = trim_copy(std::string_view(line).substr(eq + 1));

            if (!inUnit)
                return Result<UnitManifest>::err(
                    {ErrorCode::eParseError, prefix + "key only valid inside [unit]: " + key});

            if (key == "name")
                cur.name = val;
            else if (key == "input")
                cur.input = resolve_path(baseDir, val);
            else if (key == "config")
                cur.config = resolve_path(baseDir, val);
            else if (key == "output")
                cur.output = resolve_path(baseDir, val);
            else if (key == "deps")
                split_list(val, cur.deps);
            else if (key == "defines")
                split_list(val, cur.defines);
            else
                return Result<UnitManifest>::err({ErrorCode::eParseError, prefix + "unknown key: " + key});
        }

        auto fr = flush();
        if (!fr.isOk())
            return Result<UnitManifest>::err(fr.error());

        if (m.units.empty())
            return Result<UnitManifest>::err({ErrorCode::eParseError, where + ": no [unit] blocks found"});

        return Result<UnitManifest>::ok(std::move(m));
    }

    Result<UnitManifest> load_units_manifest(const std::string& path)
    {
        auto text = read_text_file(path);
        if (!text.isOk())
            return Result<UnitManifest>::err({ErrorCode::eIO, "Failed to read manifest: " + path});

        const auto baseDir = std::filesystem::path(path).parent_path().generic_string();
        return parse_units_manifest(text.value(), path, baseDir);
    }
} // namespace crossfig
