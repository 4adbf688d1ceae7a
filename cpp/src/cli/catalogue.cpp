#include "kairos/cli/catalogue.hpp"
#include "kairos/core/log.hpp"

#include <json/json.h>

#include <cstdio>
#include <memory>
#include <utility>

namespace kairos::cli {

using namespace kairos::core;
using kairos::temporal::CatalogEntityResolver;
using kairos::temporal::DecisionOption;
using kairos::temporal::EntityInfo;

namespace {
    [[nodiscard]] Status catalogue_error(u32 entry) noexcept {
        return make_status(StatusDomain::Cli, StatusCode::Invalid, entry);
    }

    [[nodiscard]] bool read_entry(const Json::Value& v, OwnerRef* owner, EntityInfo* info) {
        if (!v.isObject()) {
            return false;
        }
        const Json::Value& kind = v["kind"];
        const Json::Value& id = v["id"];
        if (!kind.isString() || !entity_kind_parse(kind.asCString(), &owner->kind) || !id.isUInt64()) {
            return false;
        }
        owner->id = EntityId{id.asUInt64()};

        const Json::Value& desc = v["description"];
        if (!desc.isNull() && !desc.isString()) {
            return false;
        }
        info->description = desc.isString() ? desc.asString() : std::string();

        const Json::Value& actor = v["actor_id"];
        if (!actor.isNull()) {
            if (!actor.isUInt() || actor.asUInt() == ActorId::invalid().v) {
                return false;
            }
            info->actor = ActorId{actor.asUInt()};
        }

        const Json::Value& options = v["options"];
        if (!options.isNull()) {
            if (!options.isArray()) {
                return false;
            }
            for (const Json::Value& o : options) {
                DecisionOption opt;
                if (o.isString()) {
                    opt.label = o.asString();
                } else if (o.isObject() && o["label"].isString()) {
                    opt.label = o["label"].asString();
                    if (o["description"].isString()) {
                        opt.description = o["description"].asString();
                    }
                } else {
                    return false;
                }
                info->options.push_back(std::move(opt));
            }
        }

        const Json::Value& selected = v["selected_option"];
        if (!selected.isNull()) {
            if (!selected.isString()) {
                return false;
            }
            info->selected_option = selected.asString();
        }

        const Json::Value& principles = v["ethical_principles"];
        if (!principles.isNull()) {
            if (!principles.isArray()) {
                return false;
            }
            for (const Json::Value& p : principles) {
                if (!p.isString()) {
                    return false;
                }
                info->ethical_principles.push_back(p.asString());
            }
        }
        return true;
    }
}

Status parse_entity_catalogue(const std::string& text, CatalogEntityResolver* out, u32* loaded) noexcept {
    if (!out) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    bool parsed = false;
    try {
        parsed = reader->parse(text.data(), text.data() + text.size(), &root, &errs);
    } catch (const Json::Exception& e) {
        errs = e.what();
    }
    if (!parsed) {
        log_message(LogLevel::Error, "catalogue", "invalid JSON: %s", errs.c_str());
        return catalogue_error(0);
    }

    const Json::Value* entries = &root;
    if (root.isObject()) {
        entries = &root["entities"];
    }
    if (!entries->isArray()) {
        return catalogue_error(0);
    }

    u32 count = 0;
    for (Json::ArrayIndex i = 0; i < entries->size(); ++i) {
        OwnerRef owner{};
        EntityInfo info;
        if (!read_entry((*entries)[i], &owner, &info)) {
            log_message(LogLevel::Error, "catalogue", "entry %u is malformed", static_cast<unsigned>(i + 1));
            return catalogue_error(static_cast<u32>(i + 1));
        }
        out->put(owner, std::move(info));
        ++count;
    }

    if (loaded) {
        *loaded = count;
    }
    return ok_status();
}

Status load_entity_catalogue(const char* path, CatalogEntityResolver* out, u32* loaded) noexcept {
    if (!path || !out) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }

    FILE* f = std::fopen(path, "rb");
    if (!f) {
        log_message(LogLevel::Error, "catalogue", "cannot open %s", path);
        return make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    std::string text;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        text.append(buf, n);
    }
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed) {
        return make_status(StatusDomain::Cli, StatusCode::Io);
    }

    return parse_entity_catalogue(text, out, loaded);
}

} // namespace kairos::cli
