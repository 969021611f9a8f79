#include <crossfig/config.hpp>
#include <crossfig/expression_parser.hpp>
#include <crossfig/evaluator.hpp>
#include <crossfig/io.hpp>
#include <crossfig/manifest.hpp>
#include <crossfig/oracle.hpp>
#include <crossfig/result.hpp>
#include <crossfig/system.hpp>

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace crossfig;

// ============================================================
// Logging
// ============================================================

static bool g_verbose = false;

static void log_info(const std::string& s) { std::cout << "[crossfigc] " << s << std::endl; }

static void log_verbose(const std::string& s)
{
    if (g_verbose)
        std::cout << "[crossfigc][verbose] " << s << std::endl;
}

static void log_error(const std::string& s) { std::cerr << "[crossfigc][error] " << s << std::endl; }

static void log_verbose_lines(const std::string& prefix, const std::string& text)
{
    if (!g_verbose)
        return;
    std::istringstream iss(text);
    std::string        line;
    while (std::getline(iss, line))
        log_verbose(prefix + line);
}

// ============================================================
// Usage
// ============================================================

static void print_usage()
{
    std::cout <<
        R"(crossfigc - build-time configuration switch expander

Usage:
  crossfigc expand -i <input> -o <output> [options]
  crossfigc build -m <manifest.vunits> [--verbose]
  crossfigc eval [--config <unit.vcfg>] [-D <define>] <expr>
  crossfigc aliases -m <manifest.vunits> [--unit <name>]

Options (expand):
  --config <vcfg>        Configuration snapshot of the unit
  -D <NAME|KEY=VALUE>    Set a flag or a key/value (repeatable)
  --name <unit>          Unit name (default: main)
  --verbose              Print every switch and alias decision

Options (build):
  -m, --manifest <vunits> Unit manifest; outputs whose content is unchanged are not rewritten
  --verbose               Print every switch and alias decision

Exit codes:
  0 success, 2 usage, 3 input/config, 4 expansion, 5 write

Examples:
  crossfigc expand -i src/lib.rs.in -o out/lib.rs --config lib.vcfg -D feature=std
  crossfigc build -m examples/workspace/workspace.vunits --verbose
  crossfigc eval -D unix 'any(cfg(unix), cfg(windows))'
)";
}

// ============================================================
// Argument helpers
// ============================================================

// Accepts "-D NAME" and "-DNAME".
static bool take_define(int argc, char** argv, int& i, std::vector<std::string>& defines)
{
    const std::string a = argv[i];
    if (a == "-D")
    {
        if (i + 1 >= argc)
            return false;
        defines.push_back(argv[++i]);
        return true;
    }
    defines.push_back(a.substr(2));
    return true;
}

static int load_config(const std::string& configPath, const std::vector<std::string>& defines, ConfigFile& out)
{
    if (!configPath.empty())
    {
        auto cfg = load_config_vcfg(configPath);
        if (!cfg.isOk())
        {
            log_error(cfg.error().message);
            return 3;
        }
        out = std::move(cfg.value());
    }

    for (const auto& d : defines)
    {
        auto r = apply_define(out, d);
        if (!r.isOk())
        {
            log_error("-D " + d + ": " + r.error().message);
            return 3;
        }
    }
    return 0;
}

// Unit graph errors come from the inputs; the rest from expansion.
static int build_error_exit_code(const Error& e)
{
    if (e.code == ErrorCode::eDependencyError || e.code == ErrorCode::eInvalidArgument || e.code == ErrorCode::eIO)
        return 3;
    return 4;
}

static void log_build_summary(const BuildResult& res)
{
    for (const auto& o : res.outputs)
    {
        log_verbose_lines(o.name + ": ", o.log);
        log_verbose(o.name + ": switches=" + std::to_string(o.switchCount) +
                    " invocations=" + std::to_string(o.invocationCount) + " aliases=" + std::to_string(o.aliasCount) +
                    " configHash=" + std::to_string(o.configHash) + " contentHash=" + std::to_string(o.contentHash));
    }
}

// ============================================================
// expand
// ============================================================

static int cmd_expand(int argc, char** argv)
{
    std::string              inPath;
    std::string              outPath;
    std::string              configPath;
    std::string              unitName = "main";
    std::vector<std::string> defines;

    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-i" && i + 1 < argc)
        {
            inPath = argv[++i];
        }
        else if (a == "-o" && i + 1 < argc)
        {
            outPath = argv[++i];
        }
        else if (a == "--config" && i + 1 < argc)
        {
            configPath = argv[++i];
        }
        else if (a == "--name" && i + 1 < argc)
        {
            unitName = argv[++i];
        }
        else if (a.rfind("-D", 0) == 0)
        {
            if (!take_define(argc, argv, i, defines))
            {
                log_error("expand: -D requires a value");
                return 2;
            }
        }
        else if (a == "--verbose")
        {
            g_verbose = true;
        }
        else
        {
            log_error("expand: unknown arg: " + a);
            return 2;
        }
    }

    if (inPath.empty() || outPath.empty())
    {
        log_error("expand: -i <input> and -o <output> are required");
        return 2;
    }

    UnitSource unit;
    unit.name        = unitName;
    unit.virtualPath = inPath;

    const int cfgRc = load_config(configPath, defines, unit.config);
    if (cfgRc != 0)
        return cfgRc;

    auto text = read_text_file(inPath);
    if (!text.isOk())
    {
        log_error("expand: " + text.error().message);
        return 3;
    }
    unit.sourceText = std::move(text.value());

    BuildRequest req;
    req.units.push_back(std::move(unit));

    auto br = build_units(req);
    if (!br.isOk())
    {
        log_error(br.error().message);
        return build_error_exit_code(br.error());
    }

    log_build_summary(br.value());

    const auto& out = br.value().outputs.front();
    auto        w   = write_text_file(outPath, out.text);
    if (!w.isOk())
    {
        log_error("expand: " + w.error().message);
        return 5;
    }

    log_info("expand: OK -> " + outPath);
    return 0;
}

// ============================================================
// build
// ============================================================

static int parse_manifest_args(int argc, char** argv, const char* cmd, std::string& manifestPath, std::string* unitFilter)
{
    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if ((a == "-m" || a == "--manifest") && i + 1 < argc)
        {
            manifestPath = argv[++i];
        }
        else if (unitFilter && a == "--unit" && i + 1 < argc)
        {
            *unitFilter = argv[++i];
        }
        else if (a == "--verbose")
        {
            g_verbose = true;
        }
        else
        {
            log_error(std::string(cmd) + ": unknown arg: " + a);
            return 2;
        }
    }

    if (manifestPath.empty())
    {
        log_error(std::string(cmd) + ": -m <manifest.vunits> is required");
        return 2;
    }
    return 0;
}

static int load_and_build(const std::string& manifestPath, UnitManifest& manifest, BuildResult& result)
{
    auto mr = load_units_manifest(manifestPath);
    if (!mr.isOk())
    {
        log_error(mr.error().message);
        return 3;
    }
    manifest = std::move(mr.value());
    log_verbose("loaded " + manifestPath + " units=" + std::to_string(manifest.units.size()));

    auto req = make_build_request(manifest);
    if (!req.isOk())
    {
        log_error(req.error().message);
        return 3;
    }

    auto start = std::chrono::steady_clock::now();
    auto br    = build_units(req.value());
    auto end   = std::chrono::steady_clock::now();
    if (!br.isOk())
    {
        log_error(br.error().message);
        return build_error_exit_code(br.error());
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    log_verbose("expansion took " + std::to_string(ms) + " ms");

    result = std::move(br.value());
    return 0;
}

static int cmd_build(int argc, char** argv)
{
    std::string manifestPath;
    const int   argRc = parse_manifest_args(argc, argv, "build", manifestPath, nullptr);
    if (argRc != 0)
        return argRc;

    UnitManifest manifest;
    BuildResult  result;
    const int    rc = load_and_build(manifestPath, manifest, result);
    if (rc != 0)
        return rc;

    log_build_summary(result);

    size_t written = 0;
    for (const auto& entry : manifest.units)
    {
        const UnitOutput* out = result.find(entry.name);
        if (!out)
        {
            log_error("build: no output for unit " + entry.name);
            return 4;
        }

        auto w = write_text_file_if_changed(entry.output, out->text);
        if (!w.isOk())
        {
            log_error("build: " + w.error().message);
            return 5;
        }

        if (w.value())
        {
            ++written;
            log_info("build: " + entry.name + " -> " + entry.output);
        }
        else
        {
            log_verbose("build: " + entry.name + " up to date: " + entry.output);
        }
    }

    log_info("build: OK units=" + std::to_string(manifest.units.size()) + " written=" + std::to_string(written));
    return 0;
}

// ============================================================
// eval
// ============================================================

static int cmd_eval(int argc, char** argv)
{
    std::string              configPath;
    std::vector<std::string> defines;
    std::string              expr;

    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc)
        {
            configPath = argv[++i];
        }
        else if (a.rfind("-D", 0) == 0)
        {
            if (!take_define(argc, argv, i, defines))
            {
                log_error("eval: -D requires a value");
                return 2;
            }
        }
        else if (a == "--verbose")
        {
            g_verbose = true;
        }
        else if (!a.empty() && a[0] == '-')
        {
            log_error("eval: unknown arg: " + a);
            return 2;
        }
        else
        {
            if (!expr.empty())
                expr.push_back(' ');
            expr += a;
        }
    }

    if (expr.empty())
    {
        log_error("eval: an expression is required");
        return 2;
    }

    ConfigFile config;
    const int  cfgRc = load_config(configPath, defines, config);
    if (cfgRc != 0)
        return cfgRc;

    const auto oracle = make_config_oracle(std::move(config));
    log_verbose("config fingerprint: " + std::to_string(oracle->fingerprint()));

    const RegistryResolver resolver;
    auto                   e = parse_expression(expr, resolver, "<expr>");
    if (!e.isOk())
    {
        log_error(e.error().message);
        return 4;
    }

    log_verbose("parsed: " + e.value().to_string());
    std::cout << (evaluate(e.value(), *oracle) ? "true" : "false") << std::endl;
    return 0;
}

// ============================================================
// aliases
// ============================================================

static int cmd_aliases(int argc, char** argv)
{
    std::string manifestPath;
    std::string unitFilter;
    const int   argRc = parse_manifest_args(argc, argv, "aliases", manifestPath, &unitFilter);
    if (argRc != 0)
        return argRc;

    UnitManifest manifest;
    BuildResult  result;
    const int    rc = load_and_build(manifestPath, manifest, result);
    if (rc != 0)
        return rc;

    if (!unitFilter.empty() && !result.graph.find(unitFilter))
    {
        log_error("aliases: unknown unit: " + unitFilter);
        return 2;
    }

    for (const auto& unit : result.graph.units())
    {
        if (!unitFilter.empty() && unit->name() != unitFilter)
            continue;

        for (const auto& alias : unit->registry().aliases())
        {
            std::cout << alias->qualifiedName() << (alias->isPublic() ? " pub " : " private ")
                      << (alias->value() ? "true" : "false") << " = " << alias->body().to_string() << std::endl;
        }
    }
    return 0;
}

// ============================================================
// main dispatch
// ============================================================

int main(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage();
        return 2;
    }

    const std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help")
    {
        print_usage();
        return 0;
    }

    if (cmd == "expand")
        return cmd_expand(argc, argv);

    if (cmd == "build")
        return cmd_build(argc, argv);

    if (cmd == "eval")
        return cmd_eval(argc, argv);

    if (cmd == "aliases")
        return cmd_aliases(argc, argv);

    log_error("Unknown command: " + cmd);
    print_usage();
    return 2;
}
