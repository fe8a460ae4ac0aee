/*
 * The entry point into the python _blockflow module exposing the block graph to python.
 *
 * Nodes are held by std::shared_ptr on both sides, so a node built through a BlockGraph stays alive while Python
 * holds it even after the graph is dropped.
 */
#include <blockflow/python/bindings.h>
#include <blockflow/types/block_config.h>
#include <blockflow/util/errors.h>

void export_types(nb::module_ &);

void export_nodes(nb::module_ &);

void export_runtime(nb::module_ &);

NB_MODULE(_blockflow, m) {
    m.doc() = "Sparse block-oriented dataflow engine";

    nb::exception<blockflow::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    m.attr("MAX_ENTITIES") = blockflow::MAX_ENTITIES;
    m.def("host_simd_lanes", &blockflow::host_simd_lanes, "Lane count of the widest float vector the build targets");

    export_types(m);
    export_nodes(m);
    export_runtime(m);
}
