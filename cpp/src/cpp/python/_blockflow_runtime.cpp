#include <blockflow/python/bindings.h>
#include <blockflow/compose/local_transform_graph.h>
#include <blockflow/runtime/block_graph.h>

void export_runtime(nb::module_ &m) {
    using namespace blockflow;

    nb::class_<BlockGraph>(m, "BlockGraph")
        .def(nb::init<const BlockConfig &, std::string>(), "config"_a = BlockConfig{}, "label"_a = "graph")
        .def_prop_ro("config", &BlockGraph::config)
        .def_prop_ro("label", &BlockGraph::label)
        .def("add_input", &BlockGraph::add_input, "label"_a, "fill_value"_a = nb::none(), "allocation"_a = nb::none())
        .def("add_scalar", &BlockGraph::add_scalar, "label"_a, "initial"_a = nb::none())
        .def("recalculate", &BlockGraph::recalculate)
        .def_prop_ro("block_nodes", &BlockGraph::block_nodes)
        .def_prop_ro("scalar_node_count", &BlockGraph::scalar_node_count);

    nb::class_<LocalTransformGraph> transform(m, "LocalTransformGraph");

    nb::enum_<LocalTransformGraph::Element>(transform, "Element")
        .value("M11", LocalTransformGraph::Element::M11)
        .value("M12", LocalTransformGraph::Element::M12)
        .value("M13", LocalTransformGraph::Element::M13)
        .value("M21", LocalTransformGraph::Element::M21)
        .value("M22", LocalTransformGraph::Element::M22)
        .value("M23", LocalTransformGraph::Element::M23)
        .value("M31", LocalTransformGraph::Element::M31)
        .value("M32", LocalTransformGraph::Element::M32)
        .value("M33", LocalTransformGraph::Element::M33)
        .value("M41", LocalTransformGraph::Element::M41)
        .value("M42", LocalTransformGraph::Element::M42)
        .value("M43", LocalTransformGraph::Element::M43);

    transform.def(nb::init<const BlockConfig &>(), "config"_a = BlockConfig{})
        .def("attach", &LocalTransformGraph::attach, "entity_index"_a)
        .def("set_position", &LocalTransformGraph::set_position, "entity_index"_a, "x"_a, "y"_a, "z"_a)
        .def("set_rotation", &LocalTransformGraph::set_rotation, "entity_index"_a, "x"_a, "y"_a, "z"_a, "w"_a)
        .def("set_scale", &LocalTransformGraph::set_scale, "entity_index"_a, "x"_a, "y"_a, "z"_a)
        .def("set_anchor", &LocalTransformGraph::set_anchor, "entity_index"_a, "x"_a, "y"_a, "z"_a)
        .def("element", &LocalTransformGraph::element, "element"_a)
        .def("matrix_for", &LocalTransformGraph::matrix_for, "entity_index"_a)
        .def("recalculate", &LocalTransformGraph::recalculate);
}
