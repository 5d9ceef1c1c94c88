#pragma once

// Aggregator header for the core value types.
// Instead of including each individual header (e.g. docsage_core/types/chunk.hpp),
// users can simply do `#include "docsage_core/types.hpp"`.
//
#include "docsage_core/types/chunk.hpp"
#include "docsage_core/types/distance_metric.hpp"
#include "docsage_core/types/document.hpp"
