#include "kairos/temporal/narrator.hpp"
#include "kairos/core/log.hpp"
#include "kairos/core/time.hpp"
#include "kairos/temporal/segmenter.hpp"

#include <cstdio>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace kairos::temporal {

using namespace kairos::core;

namespace {
    const char* kind_tag(EntityKind k) noexcept {
        switch (k) {
            case EntityKind::Event: return "EVENT";
            case EntityKind::Action: return "ACTION";
            case EntityKind::Decision: return "DECISION";
        }
        return "EVENT";
    }

    const char* kind_label(EntityKind k) noexcept {
        switch (k) {
            case EntityKind::Event: return "Event";
            case EntityKind::Action: return "Action";
            case EntityKind::Decision: return "Decision";
        }
        return "Event";
    }

    const char* unnamed(EntityKind k) noexcept {
        switch (k) {
            case EntityKind::Event: return "Unnamed event";
            case EntityKind::Action: return "Unnamed action";
            case EntityKind::Decision: return "Unnamed decision";
        }
        return "Unnamed event";
    }

    std::string format_when(const TemporalFact& f) {
        std::string s = "[" + format_timestamp(f.start);
        if (f.region == RegionType::Interval) {
            if (f.end.has_value()) {
                s += " to " + format_timestamp(*f.end);
            } else {
                s += " onwards";
            }
        }
        s += "]";
        return s;
    }

    std::string join(const std::vector<std::string>& items, const char* sep) {
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out += sep;
            }
            out += items[i];
        }
        return out;
    }

    // Facts of one scope with their resolved entities. Each owner is looked
    // up once per render.
    struct Scene {
        std::vector<TemporalFact> facts;
        std::vector<std::optional<EntityInfo>> infos;
        std::map<u64, std::size_t> by_id;

        void index() {
            for (std::size_t i = 0; i < facts.size(); ++i) {
                by_id[facts[i].id.v] = i;
            }
        }
    };

    Status load_scene(db::FactStore& store, EntityResolver& resolver, ScopeId scope, Scene* scene) {
        bool exists = false;
        Status s = store.scope_exists(scope, &exists);
        if (!is_ok(s)) {
            return with_scope(s, scope);
        }
        if (!exists) {
            return with_scope(make_status(StatusDomain::Narrative, StatusCode::NotFound), scope);
        }

        db::FactFilter filter{};
        filter.scope = scope;
        s = store.fact_list(filter, &scene->facts);
        if (!is_ok(s)) {
            return with_scope(s, scope);
        }
        sort_for_timeline(&scene->facts);
        scene->index();

        scene->infos.reserve(scene->facts.size());
        for (const TemporalFact& f : scene->facts) {
            EntityInfo info;
            s = resolver.resolve(f.owner, &info);
            if (is_ok(s)) {
                scene->infos.emplace_back(std::move(info));
            } else {
                log_status(LogLevel::Warn, "narrative", "description unavailable",
                           with_fact(with_scope(s, scope), f.id));
                scene->infos.emplace_back(std::nullopt);
            }
        }
        return ok_status();
    }

    // Endpoint of a relation: the fact plus its entity, if it resolves.
    struct Endpoint {
        TemporalFact fact{};
        std::optional<EntityInfo> info{};
    };

    [[nodiscard]] bool find_endpoint(db::FactStore& store, EntityResolver& resolver, const Scene& scene,
                                     FactId id, Endpoint* out) {
        const auto it = scene.by_id.find(id.v);
        if (it != scene.by_id.end()) {
            out->fact = scene.facts[it->second];
            out->info = scene.infos[it->second];
            return out->info.has_value();
        }

        // Relation into another scope.
        if (!is_ok(store.fact_get(id, &out->fact))) {
            return false;
        }
        EntityInfo info;
        if (!is_ok(resolver.resolve(out->fact.owner, &info))) {
            return false;
        }
        out->info = std::move(info);
        return true;
    }

    std::string endpoint_text(const Endpoint& e) {
        return std::string(kind_label(e.fact.owner.kind)) + " '" + e.info->description + "'";
    }

    std::string confidence_suffix(const Relation& rel, bool include_confidence) {
        if (!include_confidence || !relation_is_inferred(rel)) {
            return std::string();
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), " (confidence: %.2f)", static_cast<double>(rel.confidence));
        return std::string(buf);
    }
}

const char* Narrator::relation_phrase(RelationType type) noexcept {
    switch (type) {
        case RelationType::Precedes: return "happens before";
        case RelationType::Follows: return "happens after";
        case RelationType::CoincidesWith: return "happens at the same time as";
        case RelationType::Overlaps: return "overlaps with";
        case RelationType::Necessitates: return "necessitates";
        case RelationType::IsNecessitatedBy: return "is necessitated by";
        case RelationType::HasConsequence: return "leads to";
        case RelationType::IsConsequenceOf: return "is a consequence of";
        case RelationType::CausedBy: return "was caused by";
        case RelationType::EnabledBy: return "was enabled by";
        case RelationType::PreventedBy: return "was prevented by";
        case RelationType::None: break;
    }
    return nullptr;
}

Status Narrator::build_timeline(ScopeId scope, Timeline* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Narrative, StatusCode::Invalid);
    }

    Scene scene;
    Status s = load_scene(store_, resolver_, scope, &scene);
    if (!is_ok(s)) {
        return s;
    }

    *out = Timeline{};
    out->scope = scope;

    for (std::size_t i = 0; i < scene.facts.size(); ++i) {
        const TemporalFact& f = scene.facts[i];

        TimelineEntry e;
        e.fact = f.id;
        e.kind = f.owner.kind;
        e.entity = f.owner.id;
        e.start = f.start;
        e.end = f.end;
        if (scene.infos[i].has_value()) {
            const EntityInfo& info = *scene.infos[i];
            e.description = info.description;
            e.actor = info.actor;
            e.options = info.options;
            e.selected_option = info.selected_option;
            e.ethical_principles = info.ethical_principles;
        } else {
            e.description = unnamed(f.owner.kind);
        }

        if (f.relation.has_value()) {
            e.relation_summary = relation_phrase(f.relation->type) ? relation_phrase(f.relation->type) : "";
            Endpoint target;
            if (find_endpoint(store_, resolver_, scene, f.relation->target, &target)) {
                e.relation_summary += " " + endpoint_text(target);
            } else {
                e.relation_summary += " fact " + std::to_string(f.relation->target.v);
            }
        }

        switch (f.owner.kind) {
            case EntityKind::Event: out->events.push_back(std::move(e)); break;
            case EntityKind::Action: out->actions.push_back(std::move(e)); break;
            case EntityKind::Decision: out->decisions.push_back(std::move(e)); break;
        }
    }
    return ok_status();
}

Status Narrator::get_context(ScopeId scope, std::string* out) noexcept {
    ContextOptions opts;
    opts.include_confidence = cfg_.include_confidence;
    opts.include_causal = cfg_.include_causal;
    return get_context(scope, opts, out);
}

Status Narrator::get_context(ScopeId scope, const ContextOptions& opts, std::string* out,
                             RenderStats* stats) noexcept {
    if (!out) {
        return make_status(StatusDomain::Narrative, StatusCode::Invalid);
    }
    RenderStats local{};
    RenderStats* st = stats ? stats : &local;
    *st = RenderStats{};

    Scene scene;
    Status s = load_scene(store_, resolver_, scope, &scene);
    if (!is_ok(s)) {
        return s;
    }

    std::string text = "TIMELINE:\n\n";
    for (std::size_t i = 0; i < scene.facts.size(); ++i) {
        const TemporalFact& f = scene.facts[i];
        const std::optional<EntityInfo>& info = scene.infos[i];

        text += kind_tag(f.owner.kind);
        text += " " + format_when(f) + ": ";
        text += info.has_value() ? info->description : std::string(unnamed(f.owner.kind));
        text += "\n";

        if (info.has_value() && f.owner.kind == EntityKind::Decision) {
            if (!info->options.empty()) {
                text += "  Options:\n";
                for (const DecisionOption& opt : info->options) {
                    text += "    - " + opt.label;
                    if (info->selected_option.has_value() && *info->selected_option == opt.label) {
                        text += " (SELECTED)";
                    }
                    if (!opt.description.empty()) {
                        text += ": " + opt.description;
                    }
                    text += "\n";
                }
            }
            if (!info->ethical_principles.empty()) {
                text += "  Ethical principles: " + join(info->ethical_principles, ", ") + "\n";
            }
        }
        text += "\n";
        ++st->facts;
    }

    std::string temporal;
    std::string causal;
    std::set<std::tuple<u64, u64, u8>> rendered;

    for (const TemporalFact& f : scene.facts) {
        if (!f.relation.has_value()) {
            continue;
        }
        const Relation& rel = *f.relation;
        const char* phrase = relation_phrase(rel.type);
        if (!phrase) {
            continue;
        }

        // A mirrored edge (B follows A after A precedes B) reads as the same
        // sentence twice; keep the first.
        const RelationType inverse = relation_inverse(rel.type);
        if (inverse != RelationType::None &&
            rendered.count({rel.target.v, f.id.v, static_cast<u8>(inverse)}) > 0) {
            continue;
        }

        Endpoint from;
        Endpoint to;
        if (!find_endpoint(store_, resolver_, scene, f.id, &from) ||
            !find_endpoint(store_, resolver_, scene, rel.target, &to)) {
            Status skipped = with_fact(with_scope(make_status(StatusDomain::Narrative, StatusCode::RenderSkipped),
                                                  scope), f.id);
            skipped.aux = static_cast<u32>(rel.type);
            log_status(LogLevel::Warn, "narrative", "relation not rendered", skipped);
            ++st->skipped;
            continue;
        }

        rendered.insert({f.id.v, rel.target.v, static_cast<u8>(rel.type)});

        const std::string line = "- " + endpoint_text(from) + " " + phrase + " " + endpoint_text(to) +
                                 confidence_suffix(rel, opts.include_confidence) + "\n";
        temporal += line;
        ++st->relations;
        // The pair is causal when either direction is; the causal section
        // always reads from the causal side.
        if (relation_is_causal(rel.type)) {
            causal += line;
        } else if (relation_is_causal(inverse)) {
            causal += "- " + endpoint_text(to) + " " + relation_phrase(inverse) + " " + endpoint_text(from) +
                      confidence_suffix(rel, opts.include_confidence) + "\n";
        }
    }

    text += "TEMPORAL RELATIONSHIPS:\n\n";
    text += temporal;
    if (opts.include_causal) {
        text += "\nCAUSAL RELATIONSHIPS:\n\n";
        text += causal;
    }

    *out = std::move(text);
    return ok_status();
}

} // namespace kairos::temporal
