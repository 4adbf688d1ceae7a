#pragma once

#include <string>

#include "kairos/core/errors.hpp"
#include "kairos/temporal/entity_resolver.hpp"

namespace kairos::cli {

    // Catalogue text is a JSON array (or {"entities": [...]}) of
    //   {"kind": "event|action|decision", "id": 7, "description": "...",
    //    "actor_id": 2, "options": [{"label": "...", "description": "..."}],
    //    "selected_option": "...", "ethical_principles": ["..."]}
    // On a malformed entry the status aux is its 1-based index.
    kairos::core::Status parse_entity_catalogue(const std::string& text,
        kairos::temporal::CatalogEntityResolver* out,
        kairos::core::u32* loaded) noexcept;

    kairos::core::Status load_entity_catalogue(const char* path,
        kairos::temporal::CatalogEntityResolver* out,
        kairos::core::u32* loaded) noexcept;

} // namespace kairos::cli
