#include "kairos/bindings/http.hpp"
#include "kairos/core/log.hpp"
#include "kairos/core/time.hpp"
#include "kairos/temporal/timeline_service.hpp"

#include <json/json.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kairos::bindings::http {

using namespace kairos::core;
using namespace kairos::temporal;

namespace {
    using QueryParams = std::map<std::string, std::string>;

    // Helper to convert BufferView to null-terminated string
    bool buffer_to_string(const BufferView& buf, char* out, u32 max_len) {
        if (buf.len >= max_len) return false;
        if (buf.len > 0) {
            std::memcpy(out, buf.data, buf.len);
        }
        out[buf.len] = '\0';
        return true;
    }

    // Helper to match HTTP method
    bool method_is(const BufferView& method, const char* expected) {
        const size_t len = std::strlen(expected);
        return method.len == len && std::memcmp(method.data, expected, len) == 0;
    }

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::string url_decode(const char* s) {
        std::string out;
        for (; *s; ++s) {
            if (*s == '+') {
                out += ' ';
            } else if (*s == '%' && s[1] && s[2] && hex_value(s[1]) >= 0 && hex_value(s[2]) >= 0) {
                out += static_cast<char>(hex_value(s[1]) * 16 + hex_value(s[2]));
                s += 2;
            } else {
                out += *s;
            }
        }
        return out;
    }

    void parse_query(char* query, QueryParams* out) {
        char* save = nullptr;
        for (char* pair = strtok_r(query, "&", &save); pair; pair = strtok_r(nullptr, "&", &save)) {
            char* eq = std::strchr(pair, '=');
            if (eq) {
                *eq = '\0';
                (*out)[url_decode(pair)] = url_decode(eq + 1);
            } else {
                (*out)[url_decode(pair)] = "";
            }
        }
    }

    // Routes:
    // GET  /timeline/{scope}
    // GET  /temporal_context/{scope}
    // POST /events_in_timeframe
    // GET  /temporal_sequence/{scope}
    // GET  /temporal_relation/{fact_id}
    // POST /create_temporal_relation
    struct ParsedPath {
        enum { TIMELINE, CONTEXT, TIMEFRAME, SEQUENCE, RELATION, CREATE_RELATION, UNKNOWN } action{UNKNOWN};
        std::string arg;
        bool has_arg{false};
        QueryParams query;
    };

    bool parse_path(const BufferView& path, ParsedPath* out) {
        char path_str[1024];
        if (!buffer_to_string(path, path_str, sizeof(path_str))) {
            return false;
        }

        char* q = std::strchr(path_str, '?');
        if (q) {
            *q = '\0';
            parse_query(q + 1, &out->query);
        }

        char* save = nullptr;
        char* token = strtok_r(path_str, "/", &save);
        if (!token) {
            return false;
        }
        // Accept the historical /api prefix.
        if (std::strcmp(token, "api") == 0) {
            token = strtok_r(nullptr, "/", &save);
            if (!token) return false;
        }

        if (std::strcmp(token, "timeline") == 0) out->action = ParsedPath::TIMELINE;
        else if (std::strcmp(token, "temporal_context") == 0) out->action = ParsedPath::CONTEXT;
        else if (std::strcmp(token, "events_in_timeframe") == 0) out->action = ParsedPath::TIMEFRAME;
        else if (std::strcmp(token, "temporal_sequence") == 0) out->action = ParsedPath::SEQUENCE;
        else if (std::strcmp(token, "temporal_relation") == 0) out->action = ParsedPath::RELATION;
        else if (std::strcmp(token, "create_temporal_relation") == 0) out->action = ParsedPath::CREATE_RELATION;
        else return false;

        token = strtok_r(nullptr, "/", &save);
        if (token) {
            out->arg = token;
            out->has_arg = true;
            if (strtok_r(nullptr, "/", &save)) {
                return false;
            }
        }
        return true;
    }

    bool parse_u64(const std::string& s, u64* out) {
        if (s.empty() || s[0] == '-' || s[0] == '+') return false;
        errno = 0;
        char* end = nullptr;
        const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
        if (errno != 0 || !end || *end != '\0') return false;
        *out = v;
        return true;
    }

    bool parse_scope(const std::string& s, ScopeId* out) {
        u64 v = 0;
        if (!parse_u64(s, &v) || v >= ScopeId::invalid().v) return false;
        *out = ScopeId{static_cast<u32>(v)};
        return true;
    }

    bool parse_fact_id(const std::string& s, FactId* out) {
        u64 v = 0;
        if (!parse_u64(s, &v) || v == FactId::invalid().v) return false;
        *out = FactId{v};
        return true;
    }

    // Query flags: present with no value, "1" or "true" switch on.
    bool query_flag(const QueryParams& q, const char* name) {
        const auto it = q.find(name);
        if (it == q.end()) return false;
        return it->second.empty() || it->second == "1" || it->second == "true";
    }

    std::string to_json(const Json::Value& v) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, v);
    }

    Status respond(HttpResponse* out, u16 code, const Json::Value& body, Status s) {
        out->status = code;
        out->body = to_json(body);
        return s;
    }

    Status respond_error(HttpResponse* out, u16 code, const std::string& message, Status s) {
        Json::Value body(Json::objectValue);
        body["error"] = message;
        if (code >= 500) {
            log_status(LogLevel::Error, "http", message.c_str(), s);
        }
        return respond(out, code, body, s);
    }

    Status respond_status(HttpResponse* out, Status s) {
        char detail[256];
        format_status(s, detail, sizeof(detail));
        return respond_error(out, http_status_for(s), detail, s);
    }

    Status bad_request(HttpResponse* out, const char* message) {
        return respond_error(out, 400, message, make_status(StatusDomain::Bindings, StatusCode::Invalid));
    }

    Json::Value timestamp_json(Timestamp t) {
        return Json::Value(format_timestamp(t, TimestampStyle::Iso));
    }

    Json::Value fact_json(const TemporalFact& f) {
        Json::Value v(Json::objectValue);
        v["id"] = Json::UInt64(f.id.v);
        v["scope_id"] = Json::UInt(f.scope.v);
        v["entity_kind"] = entity_kind_name(f.owner.kind);
        v["entity_id"] = Json::UInt64(f.owner.id.v);
        v["region"] = region_type_name(f.region);
        v["start"] = timestamp_json(f.start);
        v["end"] = f.end.has_value() ? timestamp_json(*f.end) : Json::Value(Json::nullValue);
        v["granularity"] = granularity_name(f.granularity);
        v["confidence"] = static_cast<double>(f.confidence);
        if (f.relation.has_value()) {
            Json::Value rel(Json::objectValue);
            rel["type"] = relation_type_name(f.relation->type);
            rel["target"] = Json::UInt64(f.relation->target.v);
            rel["confidence"] = static_cast<double>(f.relation->confidence);
            v["relation"] = rel;
        } else {
            v["relation"] = Json::Value(Json::nullValue);
        }
        v["timeline_order"] = Json::Int64(f.timeline_order);
        return v;
    }

    Json::Value facts_json(const std::vector<TemporalFact>& facts) {
        Json::Value arr(Json::arrayValue);
        for (const TemporalFact& f : facts) {
            arr.append(fact_json(f));
        }
        return arr;
    }

    Json::Value entry_json(const TimelineEntry& e) {
        Json::Value v(Json::objectValue);
        v["id"] = Json::UInt64(e.entity.v);
        v["fact_id"] = Json::UInt64(e.fact.v);
        v["time"] = timestamp_json(e.start);
        v["end_time"] = e.end.has_value() ? timestamp_json(*e.end) : Json::Value(Json::nullValue);
        v["description"] = e.description;
        v["actor_id"] = e.actor.has_value() ? Json::Value(Json::UInt(e.actor->v)) : Json::Value(Json::nullValue);
        v["relation"] = e.relation_summary;
        if (e.kind == EntityKind::Decision) {
            Json::Value opts(Json::arrayValue);
            for (const DecisionOption& o : e.options) {
                Json::Value ov(Json::objectValue);
                ov["label"] = o.label;
                ov["description"] = o.description;
                opts.append(ov);
            }
            v["options"] = opts;
            v["selected_option"] = e.selected_option.has_value() ? Json::Value(*e.selected_option)
                                                                 : Json::Value(Json::nullValue);
            Json::Value principles(Json::arrayValue);
            for (const std::string& p : e.ethical_principles) {
                principles.append(p);
            }
            v["ethical_principles"] = principles;
        }
        return v;
    }

    Json::Value entries_json(const std::vector<TimelineEntry>& entries) {
        Json::Value arr(Json::arrayValue);
        for (const TimelineEntry& e : entries) {
            arr.append(entry_json(e));
        }
        return arr;
    }

    bool parse_body(const HttpRequest& req, Json::Value* root) {
        if (req.body.len == 0 || !req.body.data) {
            return false;
        }
        Json::CharReaderBuilder builder;
        const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        const char* begin = reinterpret_cast<const char*>(req.body.data);
        std::string errs;
        try {
            if (!reader->parse(begin, begin + req.body.len, root, &errs)) {
                return false;
            }
        } catch (const Json::Exception& e) {
            // Nesting past the reader's stack limit throws.
            log_message(LogLevel::Warn, "http", "request body rejected: %s", e.what());
            return false;
        }
        return root->isObject();
    }

    // First present member among the given names.
    const Json::Value* member(const Json::Value& obj, std::initializer_list<const char*> names) {
        for (const char* n : names) {
            const Json::Value* v = obj.find(n, n + std::strlen(n));
            if (v && !v->isNull()) {
                return v;
            }
        }
        return nullptr;
    }

    bool json_timestamp(const Json::Value& v, Timestamp* out) {
        if (v.isString()) {
            return is_ok(parse_timestamp(v.asCString(), out));
        }
        if (v.isInt64()) {
            *out = v.asInt64();
            return true;
        }
        return false;
    }

    bool json_u64(const Json::Value& v, u64* out) {
        if (v.isUInt64()) {
            *out = v.asUInt64();
            return true;
        }
        if (v.isString()) {
            return parse_u64(v.asString(), out);
        }
        return false;
    }

    bool parse_kind(const std::string& s, std::optional<EntityKind>* out) {
        if (s.empty()) {
            out->reset();
            return true;
        }
        EntityKind k{};
        if (!entity_kind_parse(s.c_str(), &k)) {
            return false;
        }
        *out = k;
        return true;
    }

    // Handle GET /timeline/{scope}
    Status handle_timeline(TimelineService& svc, const ParsedPath& path, HttpResponse* out) {
        ScopeId scope{};
        if (!path.has_arg || !parse_scope(path.arg, &scope)) {
            return bad_request(out, "Invalid scope id");
        }

        Timeline tl;
        const Status s = svc.narrator().build_timeline(scope, &tl);
        if (!is_ok(s)) {
            return respond_status(out, s);
        }

        Json::Value body(Json::objectValue);
        body["scope_id"] = Json::UInt(scope.v);
        body["events"] = entries_json(tl.events);
        body["actions"] = entries_json(tl.actions);
        body["decisions"] = entries_json(tl.decisions);
        return respond(out, 200, body, s);
    }

    // Handle GET /temporal_context/{scope}
    Status handle_context(TimelineService& svc, const ParsedPath& path, HttpResponse* out) {
        ScopeId scope{};
        if (!path.has_arg || !parse_scope(path.arg, &scope)) {
            return bad_request(out, "Invalid scope id");
        }

        ContextOptions opts;
        opts.include_confidence = svc.config().narrator.include_confidence || query_flag(path.query, "confidence");
        opts.include_causal = svc.config().narrator.include_causal || query_flag(path.query, "causal");

        std::string text;
        const Status s = svc.narrator().get_context(scope, opts, &text);
        if (!is_ok(s)) {
            return respond_status(out, s);
        }

        Json::Value body(Json::objectValue);
        body["context"] = text;
        return respond(out, 200, body, s);
    }

    // Handle POST /events_in_timeframe
    Status handle_timeframe(TimelineService& svc, const HttpRequest& req, HttpResponse* out) {
        Json::Value root;
        if (!parse_body(req, &root)) {
            return bad_request(out, "Missing request data");
        }

        const Json::Value* start_v = member(root, {"start", "start_time"});
        const Json::Value* end_v = member(root, {"end", "end_time"});
        const Json::Value* scope_v = member(root, {"scope", "scenario_id"});
        const Json::Value* kind_v = member(root, {"kind", "entity_type"});
        if (!start_v || !end_v || !scope_v) {
            return bad_request(out, "Missing required parameters: start, end, scope");
        }

        Timestamp start = 0;
        Timestamp end = 0;
        if (!json_timestamp(*start_v, &start) || !json_timestamp(*end_v, &end)) {
            return bad_request(out, "Invalid datetime format. Use ISO format (YYYY-MM-DDTHH:MM:SS)");
        }

        u64 scope_raw = 0;
        if (!json_u64(*scope_v, &scope_raw) || scope_raw >= ScopeId::invalid().v) {
            return bad_request(out, "Invalid scope id");
        }

        std::optional<EntityKind> kind;
        if (kind_v && (!kind_v->isString() || !parse_kind(kind_v->asString(), &kind))) {
            return bad_request(out, "Invalid entity kind");
        }

        std::vector<TemporalFact> facts;
        const Status s = svc.store().find_in_timeframe(ScopeId{static_cast<u32>(scope_raw)}, start, end, kind, &facts);
        if (!is_ok(s)) {
            return respond_status(out, s);
        }

        Json::Value body(Json::objectValue);
        body["events"] = facts_json(facts);
        return respond(out, 200, body, s);
    }

    // Handle GET /temporal_sequence/{scope}
    Status handle_sequence(TimelineService& svc, const ParsedPath& path, HttpResponse* out) {
        ScopeId scope{};
        if (!path.has_arg || !parse_scope(path.arg, &scope)) {
            return bad_request(out, "Invalid scope id");
        }

        std::optional<EntityKind> kind;
        auto it = path.query.find("kind");
        if (it == path.query.end()) {
            it = path.query.find("entity_type");
        }
        if (it != path.query.end() && !parse_kind(it->second, &kind)) {
            return bad_request(out, "Invalid entity kind");
        }

        std::optional<u32> limit;
        it = path.query.find("limit");
        if (it != path.query.end() && !it->second.empty()) {
            u64 v = 0;
            if (!parse_u64(it->second, &v) || v > UINT32_MAX) {
                return bad_request(out, "Invalid limit parameter");
            }
            limit = static_cast<u32>(v);
        }

        std::vector<TemporalFact> facts;
        const Status s = svc.store().find_sequence(scope, kind, limit, &facts);
        if (!is_ok(s)) {
            return respond_status(out, s);
        }

        Json::Value body(Json::objectValue);
        body["sequence"] = facts_json(facts);
        return respond(out, 200, body, s);
    }

    // Handle GET /temporal_relation/{fact_id}
    Status handle_relation(TimelineService& svc, const ParsedPath& path, HttpResponse* out) {
        FactId fact{};
        if (!path.has_arg || !parse_fact_id(path.arg, &fact)) {
            return bad_request(out, "Invalid fact id");
        }

        const auto it = path.query.find("relation_type");
        if (it == path.query.end() || it->second.empty()) {
            return bad_request(out, "Missing relation_type parameter");
        }

        std::vector<TemporalFact> facts;
        const Status s = svc.relations().find_related(fact, relation_type_parse(it->second.c_str()), &facts);
        if (!is_ok(s)) {
            return respond_status(out, s);
        }

        Json::Value body(Json::objectValue);
        body["relations"] = facts_json(facts);
        return respond(out, 200, body, s);
    }

    // Handle POST /create_temporal_relation
    Status handle_create_relation(TimelineService& svc, const HttpRequest& req, HttpResponse* out) {
        Json::Value root;
        if (!parse_body(req, &root)) {
            return bad_request(out, "Missing request data");
        }

        const Json::Value* from_v = member(root, {"from", "from_triple_id"});
        const Json::Value* to_v = member(root, {"to", "to_triple_id"});
        const Json::Value* type_v = member(root, {"type", "relation_type"});
        if (!from_v || !to_v || !type_v) {
            return bad_request(out, "Missing required parameters: from, to, type");
        }

        u64 from = 0;
        u64 to = 0;
        if (!json_u64(*from_v, &from) || !json_u64(*to_v, &to)) {
            return bad_request(out, "Invalid fact id");
        }
        const RelationType type = type_v->isString() ? relation_type_parse(type_v->asCString()) : RelationType::None;

        const Status s = svc.relations().create_relation(FactId{from}, FactId{to}, type);
        if (!is_ok(s)) {
            return respond_status(out, s);
        }

        Json::Value body(Json::objectValue);
        body["success"] = true;
        return respond(out, 200, body, s);
    }
}

BufferView view_of(const char* s) noexcept {
    BufferView v{};
    if (s) {
        v.data = reinterpret_cast<const u8*>(s);
        v.len = static_cast<u32>(std::strlen(s));
    }
    return v;
}

u16 http_status_for(Status s) noexcept {
    switch (s.code) {
        case StatusCode::Ok:
            return 200;
        case StatusCode::NotFound:
            return 404;
        case StatusCode::Invalid:
        case StatusCode::InvalidInterval:
        case StatusCode::InvalidRegion:
        case StatusCode::InvalidRelationType:
            return 400;
        case StatusCode::Conflict:
            return 409;
        case StatusCode::Busy:
        case StatusCode::Unavailable:
            return 503;
        default:
            return 500;
    }
}

Status handle_http_request(TimelineService& service, const HttpRequest& req, HttpResponse* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }

    // Initialize response
    out->status = 500;
    out->body.clear();

    ParsedPath path;
    if (!parse_path(req.path, &path)) {
        return respond_error(out, 404, "Not found", make_status(StatusDomain::Bindings, StatusCode::NotFound));
    }

    const bool get = method_is(req.method, "GET");
    const bool post = method_is(req.method, "POST");

    switch (path.action) {
        case ParsedPath::TIMELINE:
            if (get) return handle_timeline(service, path, out);
            break;
        case ParsedPath::CONTEXT:
            if (get) return handle_context(service, path, out);
            break;
        case ParsedPath::TIMEFRAME:
            if (post && !path.has_arg) return handle_timeframe(service, req, out);
            break;
        case ParsedPath::SEQUENCE:
            if (get) return handle_sequence(service, path, out);
            break;
        case ParsedPath::RELATION:
            if (get) return handle_relation(service, path, out);
            break;
        case ParsedPath::CREATE_RELATION:
            if (post && !path.has_arg) return handle_create_relation(service, req, out);
            break;
        case ParsedPath::UNKNOWN:
            return respond_error(out, 404, "Not found", make_status(StatusDomain::Bindings, StatusCode::NotFound));
    }

    return respond_error(out, 405, "Method not allowed", make_status(StatusDomain::Bindings, StatusCode::Unsupported));
}

} // namespace kairos::bindings::http
