/*
 * The core imports for blockflow. Include this first so the formatting support and the export macros are
 * always seen in the same order.
 */

#ifndef BLOCKFLOW_BASE_H
#define BLOCKFLOW_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <blockflow/blockflow_export.h>
#include <blockflow/blockflow_forward_declarations.h>

#endif //BLOCKFLOW_BASE_H
