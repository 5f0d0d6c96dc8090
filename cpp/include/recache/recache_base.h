/*
 * The core imports for recache. Use this to ensure the correct import order can be maintained.
 */

#ifndef RECACHE_BASE_H
#define RECACHE_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <recache/recache_export.h>
#include <recache/recache_forward_declarations.h>

#endif //RECACHE_BASE_H
