#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kairos/bindings/http.hpp"
#include "kairos/cli/catalogue.hpp"
#include "kairos/cli/commands.hpp"
#include "kairos/cli/options.hpp"
#include "kairos/core/errors.hpp"
#include "kairos/core/log.hpp"
#include "kairos/core/time.hpp"
#include "kairos/db/db.hpp"
#include "kairos/temporal/timeline_service.hpp"

using kairos::cli::CliArgs;
using kairos::cli::CommandId;
using kairos::cli::OptionId;
using kairos::cli::OptionType;
using kairos::cli::ParsedOption;
using kairos::cli::ParsedOptions;
using kairos::core::Status;

namespace core = kairos::core;
namespace temporal = kairos::temporal;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string db_path;
    std::string entities_path;
    core::ScopeId scope{1};
};

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// ========================================================================
// Option Tables
// ========================================================================

const kairos::cli::OptionSpec kGlobalOptions[] = {
    {OptionId::Db, OptionType::String, "db", 'd'},
    {OptionId::Entities, OptionType::String, "entities", 'e'},
    {OptionId::Scope, OptionType::I64, "scope", 's'},
    {OptionId::LogLevel, OptionType::String, "log-level", '\0'},
    {OptionId::Help, OptionType::Flag, "help", 'h'},
};

const kairos::cli::OptionSpec kCommandOptions[] = {
    {OptionId::Id, OptionType::I64, "id", 'i'},
    {OptionId::At, OptionType::String, "at", 'a'},
    {OptionId::Duration, OptionType::I64, "duration", '\0'},
    {OptionId::Decision, OptionType::Flag, "decision", '\0'},
    {OptionId::Granularity, OptionType::String, "granularity", 'g'},
    {OptionId::From, OptionType::I64, "from", '\0'},
    {OptionId::To, OptionType::I64, "to", '\0'},
    {OptionId::Type, OptionType::String, "type", 't'},
    {OptionId::Kind, OptionType::String, "kind", 'k'},
    {OptionId::Limit, OptionType::I64, "limit", 'n'},
    {OptionId::Start, OptionType::String, "start", '\0'},
    {OptionId::End, OptionType::String, "end", '\0'},
    {OptionId::Fact, OptionType::I64, "fact", 'f'},
    {OptionId::Confidence, OptionType::Flag, "confidence", '\0'},
    {OptionId::Causal, OptionType::Flag, "causal", '\0'},
    {OptionId::Strategy, OptionType::String, "strategy", '\0'},
    {OptionId::Gap, OptionType::I64, "gap", '\0'},
    {OptionId::Batch, OptionType::I64, "batch", '\0'},
    {OptionId::Method, OptionType::String, "method", 'X'},
    {OptionId::Path, OptionType::String, "path", 'p'},
    {OptionId::Body, OptionType::String, "body", 'b'},
};

const kairos::cli::CommandSpec kCommands[] = {
    {CommandId::Help, "help", "show this message"},
    {CommandId::Event, "event", "--id N --at TIME [--duration MIN] [--granularity G]"},
    {CommandId::Action, "action", "--id N --at TIME [--duration MIN] [--decision] [--granularity G]"},
    {CommandId::Relate, "relate", "--from FACT --to FACT --type RELATION"},
    {CommandId::Infer, "infer", "infer missing relations for the scope"},
    {CommandId::Order, "order", "recompute the timeline order of the scope"},
    {CommandId::Timeline, "timeline", "print the timeline as JSON"},
    {CommandId::Context, "context", "[--confidence] [--causal]"},
    {CommandId::Sequence, "sequence", "[--kind K] [--limit N]"},
    {CommandId::Frame, "frame", "--start TIME --end TIME [--kind K]"},
    {CommandId::Related, "related", "--fact FACT --type RELATION"},
    {CommandId::Segment, "segment", "--strategy by_actor|by_gap|by_kind|auto [--gap SEC] [--batch N]"},
    {CommandId::Request, "request", "--method GET|POST --path PATH [--body JSON]"},
};

constexpr core::u32 kMaxOptions = 32;

// ========================================================================
// Output Helpers
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, Status s) {
    char detail[256];
    core::format_status(s, detail, sizeof(detail));
    fprintf(stderr, "error: %s failed: %s\n", context, detail);
}

void print_fact(const core::TemporalFact& f) {
    std::string when = core::format_timestamp(f.start);
    if (f.region == core::RegionType::Interval) {
        when += f.end.has_value() ? " to " + core::format_timestamp(*f.end) : std::string(" onwards");
    }
    printf("%llu\t%s:%llu\t[%s]", static_cast<unsigned long long>(f.id.v),
           core::entity_kind_name(f.owner.kind), static_cast<unsigned long long>(f.owner.id.v), when.c_str());
    if (f.relation.has_value()) {
        printf("\t%s %llu", core::relation_type_name(f.relation->type),
               static_cast<unsigned long long>(f.relation->target.v));
        if (core::relation_is_inferred(*f.relation)) {
            printf(" (%.2f)", static_cast<double>(f.relation->confidence));
        }
    }
    printf("\n");
}

void print_facts(const std::vector<core::TemporalFact>& facts) {
    for (const core::TemporalFact& f : facts) {
        print_fact(f);
    }
}

void handle_help() {
    printf("usage: kairos [--db PATH] [--entities FILE] [--scope N] [--log-level LEVEL] <command> [options]\n\n");
    printf("commands:\n");
    for (const auto& c : kCommands) {
        printf("  %-10s %s\n", c.name, c.summary);
    }
    printf("\nTIME is YYYY-MM-DD[THH:MM[:SS]] (UTC). KAIROS_DB_PATH sets the default database.\n");
}

// ========================================================================
// Option Accessors
// ========================================================================

const char* opt_str(const ParsedOptions& opts, OptionId id) {
    const ParsedOption* o = kairos::cli::find_option(opts, id);
    return o ? o->value.str : nullptr;
}

std::optional<core::i64> opt_i64(const ParsedOptions& opts, OptionId id) {
    const ParsedOption* o = kairos::cli::find_option(opts, id);
    if (!o) {
        return std::nullopt;
    }
    return o->value.i64v;
}

bool opt_time(const ParsedOptions& opts, OptionId id, const char* what, core::Timestamp* out) {
    const char* text = opt_str(opts, id);
    if (!text) {
        fprintf(stderr, "error: --%s is required\n", what);
        return false;
    }
    if (!core::is_ok(core::parse_timestamp(text, out))) {
        fprintf(stderr, "error: --%s: invalid time '%s'\n", what, text);
        return false;
    }
    return true;
}

bool opt_kind(const ParsedOptions& opts, std::optional<core::EntityKind>* out) {
    const char* text = opt_str(opts, OptionId::Kind);
    if (!text) {
        return true;
    }
    core::EntityKind k{};
    if (!core::entity_kind_parse(text, &k)) {
        fprintf(stderr, "error: --kind: expected event, action or decision\n");
        return false;
    }
    *out = k;
    return true;
}

bool opt_relation(const ParsedOptions& opts, core::RelationType* out) {
    const char* text = opt_str(opts, OptionId::Type);
    if (!text) {
        print_error("--type is required");
        return false;
    }
    *out = core::relation_type_parse(text);
    return true;
}

bool opt_positive_id(const ParsedOptions& opts, OptionId id, const char* what, core::u64* out) {
    const auto v = opt_i64(opts, id);
    if (!v.has_value() || *v < 0) {
        fprintf(stderr, "error: --%s must be a non-negative id\n", what);
        return false;
    }
    *out = static_cast<core::u64>(*v);
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

int handle_enhance(temporal::TimelineService& svc, const CliConfig& cfg, const ParsedOptions& opts, bool action) {
    core::u64 id = 0;
    core::Timestamp at = 0;
    if (!opt_positive_id(opts, OptionId::Id, "id", &id) || !opt_time(opts, OptionId::At, "at", &at)) {
        return kExitUsage;
    }

    core::Granularity g = core::Granularity::Minutes;
    if (const char* gs = opt_str(opts, OptionId::Granularity); gs && !core::granularity_parse(gs, &g)) {
        fprintf(stderr, "error: --granularity: unknown value '%s'\n", gs);
        return kExitUsage;
    }

    const std::optional<core::i64> duration = opt_i64(opts, OptionId::Duration);
    core::FactId fact{};
    Status s;
    if (action) {
        s = svc.enhance_action(cfg.scope, core::EntityId{id}, at, duration,
                               kairos::cli::has_flag(opts, OptionId::Decision), &fact, g);
    } else {
        s = svc.enhance_event(cfg.scope, core::EntityId{id}, at, duration, &fact, g);
    }
    if (!core::is_ok(s)) {
        print_status_error(action ? "action" : "event", s);
        return kExitFailure;
    }
    printf("%llu\n", static_cast<unsigned long long>(fact.v));
    return kExitOk;
}

int handle_relate(temporal::TimelineService& svc, const ParsedOptions& opts) {
    core::u64 from = 0;
    core::u64 to = 0;
    core::RelationType type{};
    if (!opt_positive_id(opts, OptionId::From, "from", &from) ||
        !opt_positive_id(opts, OptionId::To, "to", &to) || !opt_relation(opts, &type)) {
        return kExitUsage;
    }

    const Status s = svc.relations().create_relation(core::FactId{from}, core::FactId{to}, type);
    if (!core::is_ok(s)) {
        print_status_error("relate", s);
        return kExitFailure;
    }
    return kExitOk;
}

int handle_infer(temporal::TimelineService& svc, const CliConfig& cfg) {
    temporal::InferenceStats stats{};
    const Status s = svc.inference().infer_relations(cfg.scope, &stats);
    if (!core::is_ok(s)) {
        print_status_error("infer", s);
        return kExitFailure;
    }
    printf("examined=%u inferred=%u inverses=%u kept=%u\n",
           stats.examined, stats.inferred, stats.inverses_written, stats.inverses_kept);
    return kExitOk;
}

int handle_order(temporal::TimelineService& svc, const CliConfig& cfg) {
    core::u32 assigned = 0;
    const Status s = svc.inference().recompute_timeline_order(cfg.scope, &assigned);
    if (!core::is_ok(s)) {
        print_status_error("order", s);
        return kExitFailure;
    }
    printf("ordered=%u\n", assigned);
    return kExitOk;
}

int handle_context(temporal::TimelineService& svc, const CliConfig& cfg, const ParsedOptions& opts) {
    temporal::ContextOptions copts;
    copts.include_confidence = kairos::cli::has_flag(opts, OptionId::Confidence);
    copts.include_causal = kairos::cli::has_flag(opts, OptionId::Causal);

    std::string text;
    temporal::RenderStats stats{};
    const Status s = svc.narrator().get_context(cfg.scope, copts, &text, &stats);
    if (!core::is_ok(s)) {
        print_status_error("context", s);
        return kExitFailure;
    }
    fputs(text.c_str(), stdout);
    if (stats.skipped > 0) {
        fprintf(stderr, "warn: %u relation(s) skipped\n", stats.skipped);
    }
    return kExitOk;
}

int handle_sequence(temporal::TimelineService& svc, const CliConfig& cfg, const ParsedOptions& opts) {
    std::optional<core::EntityKind> kind;
    if (!opt_kind(opts, &kind)) {
        return kExitUsage;
    }
    std::optional<core::u32> limit;
    if (const auto l = opt_i64(opts, OptionId::Limit); l.has_value()) {
        if (*l < 0 || *l > UINT32_MAX) {
            print_error("--limit must be a non-negative count");
            return kExitUsage;
        }
        limit = static_cast<core::u32>(*l);
    }

    std::vector<core::TemporalFact> facts;
    const Status s = svc.store().find_sequence(cfg.scope, kind, limit, &facts);
    if (!core::is_ok(s)) {
        print_status_error("sequence", s);
        return kExitFailure;
    }
    print_facts(facts);
    return kExitOk;
}

int handle_frame(temporal::TimelineService& svc, const CliConfig& cfg, const ParsedOptions& opts) {
    core::Timestamp start = 0;
    core::Timestamp end = 0;
    std::optional<core::EntityKind> kind;
    if (!opt_time(opts, OptionId::Start, "start", &start) || !opt_time(opts, OptionId::End, "end", &end) ||
        !opt_kind(opts, &kind)) {
        return kExitUsage;
    }

    std::vector<core::TemporalFact> facts;
    const Status s = svc.store().find_in_timeframe(cfg.scope, start, end, kind, &facts);
    if (!core::is_ok(s)) {
        print_status_error("frame", s);
        return kExitFailure;
    }
    print_facts(facts);
    return kExitOk;
}

int handle_related(temporal::TimelineService& svc, const ParsedOptions& opts) {
    core::u64 fact = 0;
    core::RelationType type{};
    if (!opt_positive_id(opts, OptionId::Fact, "fact", &fact) || !opt_relation(opts, &type)) {
        return kExitUsage;
    }

    std::vector<core::TemporalFact> facts;
    const Status s = svc.relations().find_related(core::FactId{fact}, type, &facts);
    if (!core::is_ok(s)) {
        print_status_error("related", s);
        return kExitFailure;
    }
    print_facts(facts);
    return kExitOk;
}

int handle_segment(temporal::TimelineService& svc, const CliConfig& cfg, const ParsedOptions& opts) {
    temporal::SegmentStrategy strategy = temporal::SegmentStrategy::Auto;
    if (const char* name = opt_str(opts, OptionId::Strategy); name &&
        !temporal::segment_strategy_parse(name, &strategy)) {
        fprintf(stderr, "error: --strategy: unknown value '%s'\n", name);
        return kExitUsage;
    }

    temporal::SegmentParams params;
    params.gap_threshold_seconds = opt_i64(opts, OptionId::Gap);
    if (const auto b = opt_i64(opts, OptionId::Batch); b.has_value()) {
        if (*b <= 0 || *b > UINT32_MAX) {
            print_error("--batch must be positive");
            return kExitUsage;
        }
        params.batch_size = static_cast<core::u32>(*b);
    }

    std::vector<temporal::Segment> segments;
    const Status s = svc.segmenter().group(cfg.scope, strategy, params, &segments);
    if (!core::is_ok(s)) {
        print_status_error("segment", s);
        return kExitFailure;
    }
    for (const temporal::Segment& seg : segments) {
        printf("%s (%zu)\n", seg.key.c_str(), seg.facts.size());
        for (const core::TemporalFact& f : seg.facts) {
            printf("  ");
            print_fact(f);
        }
    }
    return kExitOk;
}

int handle_request(temporal::TimelineService& svc, const ParsedOptions& opts) {
    const char* method = opt_str(opts, OptionId::Method);
    const char* path = opt_str(opts, OptionId::Path);
    if (!path) {
        print_error("--path is required");
        return kExitUsage;
    }

    namespace http = kairos::bindings::http;
    http::HttpRequest req{};
    req.method = http::view_of(method ? method : "GET");
    req.path = http::view_of(path);
    req.body = http::view_of(opt_str(opts, OptionId::Body));

    http::HttpResponse resp;
    const Status s = http::handle_http_request(svc, req, &resp);
    if (!core::is_ok(s)) {
        core::log_status(core::LogLevel::Debug, "cli", "request failed", s);
    }
    printf("%u\n%s\n", static_cast<unsigned>(resp.status), resp.body.c_str());
    return resp.status < 400 ? kExitOk : kExitFailure;
}

int handle_timeline(temporal::TimelineService& svc, const CliConfig& cfg) {
    namespace http = kairos::bindings::http;
    const std::string path = "/timeline/" + std::to_string(cfg.scope.v);
    http::HttpRequest req{};
    req.method = http::view_of("GET");
    req.path = http::view_of(path.c_str());

    http::HttpResponse resp;
    const Status s = http::handle_http_request(svc, req, &resp);
    if (!core::is_ok(s)) {
        print_status_error("timeline", s);
        return kExitFailure;
    }
    printf("%s\n", resp.body.c_str());
    return kExitOk;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    const CliArgs all{argv + 1, argc > 0 ? static_cast<core::u32>(argc - 1) : 0};

    ParsedOption global_buf[kMaxOptions];
    ParsedOptions global{global_buf, 0, kMaxOptions};
    core::u32 consumed = 0;
    Status s = kairos::cli::parse_options(all, kGlobalOptions,
                                          sizeof(kGlobalOptions) / sizeof(kGlobalOptions[0]), &global, &consumed);
    if (!core::is_ok(s)) {
        fprintf(stderr, "error: bad option '%s'\n", s.aux < all.argc ? all.argv[s.aux] : "");
        return kExitUsage;
    }

    if (const char* level = opt_str(global, OptionId::LogLevel)) {
        core::LogLevel l{};
        if (!core::log_level_parse(level, &l)) {
            fprintf(stderr, "error: --log-level: expected error, warn, info or debug\n");
            return kExitUsage;
        }
        core::set_log_level(l);
    }

    const CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (kairos::cli::has_flag(global, OptionId::Help) || rest.argc == 0) {
        handle_help();
        return rest.argc == 0 && !kairos::cli::has_flag(global, OptionId::Help) ? kExitUsage : kExitOk;
    }

    kairos::cli::CommandInvocation inv{};
    s = kairos::cli::parse_command(rest, kCommands, sizeof(kCommands) / sizeof(kCommands[0]), &inv, &consumed);
    if (!core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s'\n", rest.argv[0]);
        return kExitUsage;
    }
    if (inv.id == CommandId::Help) {
        handle_help();
        return kExitOk;
    }

    ParsedOption cmd_buf[kMaxOptions];
    ParsedOptions opts{cmd_buf, 0, kMaxOptions};
    s = kairos::cli::parse_options(inv.args, kCommandOptions,
                                   sizeof(kCommandOptions) / sizeof(kCommandOptions[0]), &opts, &consumed);
    if (!core::is_ok(s) || consumed != inv.args.argc) {
        const core::u32 bad = core::is_ok(s) ? consumed : s.aux;
        fprintf(stderr, "error: %s: bad argument '%s'\n", rest.argv[0], bad < inv.args.argc ? inv.args.argv[bad] : "");
        return kExitUsage;
    }

    // Configuration
    CliConfig cfg;
    if (const char* db = opt_str(global, OptionId::Db)) {
        cfg.db_path = db;
    } else if (const char* env = std::getenv("KAIROS_DB_PATH"); env && *env) {
        cfg.db_path = env;
    }
    if (const char* ent = opt_str(global, OptionId::Entities)) {
        cfg.entities_path = ent;
    }
    if (const auto scope = opt_i64(global, OptionId::Scope); scope.has_value()) {
        if (*scope < 0 || *scope >= static_cast<core::i64>(core::ScopeId::invalid().v)) {
            print_error("--scope out of range");
            return kExitUsage;
        }
        cfg.scope = core::ScopeId{static_cast<core::u32>(*scope)};
    }

    kairos::db::DbConfig db_cfg{};
    db_cfg.path = cfg.db_path.empty() ? nullptr : cfg.db_path.c_str();
    std::unique_ptr<kairos::db::SqliteFactStore> store;
    s = kairos::db::SqliteFactStore::open(db_cfg, &store);
    if (!core::is_ok(s)) {
        print_status_error("database open", s);
        return kExitFailure;
    }
    if (cfg.db_path.empty()) {
        fprintf(stderr, "warn: no --db given; using an in-memory database\n");
    }

    temporal::CatalogEntityResolver resolver;
    if (!cfg.entities_path.empty()) {
        core::u32 loaded = 0;
        s = kairos::cli::load_entity_catalogue(cfg.entities_path.c_str(), &resolver, &loaded);
        if (!core::is_ok(s)) {
            print_status_error("entity catalogue", s);
            return kExitFailure;
        }
        core::log_message(core::LogLevel::Info, "cli", "%u entities loaded", loaded);
    }

    temporal::TimelineService svc(*store, resolver);

    switch (inv.id) {
        case CommandId::Event: return handle_enhance(svc, cfg, opts, false);
        case CommandId::Action: return handle_enhance(svc, cfg, opts, true);
        case CommandId::Relate: return handle_relate(svc, opts);
        case CommandId::Infer: return handle_infer(svc, cfg);
        case CommandId::Order: return handle_order(svc, cfg);
        case CommandId::Timeline: return handle_timeline(svc, cfg);
        case CommandId::Context: return handle_context(svc, cfg, opts);
        case CommandId::Sequence: return handle_sequence(svc, cfg, opts);
        case CommandId::Frame: return handle_frame(svc, cfg, opts);
        case CommandId::Related: return handle_related(svc, opts);
        case CommandId::Segment: return handle_segment(svc, cfg, opts);
        case CommandId::Request: return handle_request(svc, opts);
        case CommandId::Help:
        case CommandId::None:
            break;
    }
    handle_help();
    return kExitUsage;
}
