#include "crossfig/system.hpp"
#include "crossfig/hash.hpp"
#include "crossfig/io.hpp"

#include <unordered_map>

namespace crossfig
{
    const UnitOutput* BuildResult::find(std::string_view name) const
    {
        for (const auto& o : outputs)
            if (o.name == name)
                return &o;
        return nullptr;
    }

    Result<BuildResult> build_units(const BuildRequest& req)
    {
        BuildResult res;

        std::unordered_map<const CompilationUnit*, const UnitSource*> sources;
        sources.reserve(req.units.size());

        for (const auto& src : req.units)
        {
            auto u = res.graph.addUnit(src.name, src.virtualPath, src.config, src.deps);
            if (!u.isOk())
                return Result<BuildResult>::err(u.error());
            sources.emplace(u.value(), &src);
        }

        auto order = res.graph.dependencyOrder();
        if (!order.isOk())
            return Result<BuildResult>::err(order.error());

        res.outputs.reserve(order.value().size());
        for (CompilationUnit* unit : order.value())
        {
            const UnitSource* src = sources.at(unit);

            auto er = expand_unit(*unit, res.graph, src->sourceText, req.options);
            if (!er.isOk())
                return Result<BuildResult>::err(er.error());

            auto& ex = er.value();

            UnitOutput out;
            out.name            = unit->name();
            out.virtualPath     = unit->virtualPath();
            out.configHash      = unit->oracle().fingerprint();
            out.contentHash     = xxhash64(ex.output);
            out.switchCount     = ex.switchCount;
            out.invocationCount = ex.invocationCount;
            out.aliasCount      = ex.aliasCount;
            out.text            = std::move(ex.output);
            out.log             = std::move(ex.log);
            res.outputs.push_back(std::move(out));
        }

        return Result<BuildResult>::ok(std::move(res));
    }

    Result<BuildRequest> make_build_request(const UnitManifest& manifest)
    {
        BuildRequest req;
        req.units.reserve(manifest.units.size());

        for (const auto& entry : manifest.units)
        {
            UnitSource src;
            src.name        = entry.name;
            src.virtualPath = entry.input;
            src.deps        = entry.deps;

            auto text = read_text_file(entry.input);
            if (!text.isOk())
                return Result<BuildRequest>::err(
                    {ErrorCode::eIO, "unit " + entry.name + ": " + text.error().message});
            src.sourceText = std::move(text.value());

            if (!entry.config.empty())
            {
                auto cfg = load_config_vcfg(entry.config);
                if (!cfg.isOk())
                    return Result<BuildRequest>::err(
                        {cfg.error().code, "unit " + entry.name + ": " + cfg.error().message});
                src.config = std::move(cfg.value());
            }

            for (const auto& d : entry.defines)
            {
                auto r = apply_define(src.config, d);
                if (!r.isOk())
                    return Result<BuildRequest>::err(
                        {r.error().code, "unit " + entry.name + ": " + r.error().message});
            }

            req.units.push_back(std::move(src));
        }

        return Result<BuildRequest>::ok(std::move(req));
    }
} // namespace crossfig
