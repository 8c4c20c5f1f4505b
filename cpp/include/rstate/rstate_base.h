/*
 * The core imports for rstate. Include this first so the third-party and export headers are seen in a consistent
 * order by every translation unit.
 */

#ifndef RSTATE_BASE_H
#define RSTATE_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ankerl/unordered_dense.h>

#include <rstate/rstate_export.h>
#include <rstate/rstate_forward_declarations.h>
#include <rstate/util/errors.h>

#endif //RSTATE_BASE_H
