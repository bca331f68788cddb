#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. grounded_core/types/chunk.hpp),
// users can simply do `#include "grounded_core/types.hpp"`.
//
#include "grounded_core/types/answer.hpp"
#include "grounded_core/types/chunk.hpp"
#include "grounded_core/types/document.hpp"
#include "grounded_core/types/metric.hpp"
#include "grounded_core/types/retrieval.hpp"
