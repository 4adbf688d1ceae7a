#include <gtest/gtest.h>

// Every public header must compile when included together.

#include "kairos/bindings/http.hpp"
#include "kairos/cli/catalogue.hpp"
#include "kairos/cli/commands.hpp"
#include "kairos/cli/options.hpp"
#include "kairos/core/errors.hpp"
#include "kairos/core/log.hpp"
#include "kairos/core/models.hpp"
#include "kairos/core/relation.hpp"
#include "kairos/core/time.hpp"
#include "kairos/core/types.hpp"
#include "kairos/db/db.hpp"
#include "kairos/temporal/config.hpp"
#include "kairos/temporal/entity_resolver.hpp"
#include "kairos/temporal/inference.hpp"
#include "kairos/temporal/narrator.hpp"
#include "kairos/temporal/relation_graph.hpp"
#include "kairos/temporal/segmenter.hpp"
#include "kairos/temporal/temporal_store.hpp"
#include "kairos/temporal/timeline_service.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
