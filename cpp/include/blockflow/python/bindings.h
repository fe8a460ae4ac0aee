#pragma once

/**
 * Shared includes for the _blockflow extension module. Only the python sources include this; the core library
 * has no nanobind dependency.
 */

#include <blockflow/blockflow_base.h>

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>
#include <nanobind/stl/array.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace blockflow::python {

    // Copies a pulled block out of the node so Python never holds a view into node-owned storage.
    inline std::optional<std::vector<lane_value_t>> to_list(BlockResult block) {
        if (!block) { return std::nullopt; }
        return std::vector<lane_value_t>(block->begin(), block->end());
    }

} // namespace blockflow::python
