#include <blockflow/python/bindings.h>
#include <blockflow/types/block_address.h>
#include <blockflow/types/block_config.h>
#include <blockflow/types/block_node.h>
#include <blockflow/types/input_block_node.h>
#include <blockflow/types/scalar_node.h>
#include <blockflow/util/debug_log.h>

void export_types(nb::module_ &m) {
    using namespace blockflow;

    nb::enum_<AllocationMode>(m, "AllocationMode")
        .value("SPARSE", AllocationMode::Sparse)
        .value("DENSE", AllocationMode::Dense);

    nb::enum_<DebugChannel>(m, "DebugChannel")
        .value("STALENESS", DebugChannel::Staleness)
        .value("RECOMPUTE", DebugChannel::Recompute)
        .value("SPARSITY", DebugChannel::Sparsity);
    m.def("debug_enabled", &debug_enabled, "channel"_a);
    m.def("set_debug_enabled", &set_debug_enabled, "channel"_a, "enabled"_a);

    nb::class_<BlockConfig>(m, "BlockConfig")
        .def(nb::init<>())
        .def("__init__",
             [](BlockConfig *self, lane_value_t fill_value, AllocationMode allocation, uint16_t block_size,
                std::size_t capacity) {
                 new (self) BlockConfig{fill_value, allocation, block_size, capacity};
                 self->validate();
             },
             "fill_value"_a = 0.0f, "allocation"_a = AllocationMode::Sparse, "block_size"_a = host_simd_lanes(),
             "capacity"_a = MAX_ENTITIES)
        .def_rw("fill_value", &BlockConfig::fill_value)
        .def_rw("allocation", &BlockConfig::allocation)
        .def_rw("block_size", &BlockConfig::block_size)
        .def_rw("capacity", &BlockConfig::capacity)
        .def_prop_ro("block_count", &BlockConfig::block_count)
        .def("validate", &BlockConfig::validate)
        .def("__str__", &BlockConfig::to_string);

    nb::class_<BlockAddress>(m, "BlockAddress")
        .def_ro("block_index", &BlockAddress::block_index)
        .def_ro("lane_index", &BlockAddress::lane_index)
        .def("__eq__", [](const BlockAddress &a, const BlockAddress &b) { return a == b; })
        .def("__repr__", [](const BlockAddress &a) { return fmt::format("{}", a); });

    nb::class_<BlockNode>(m, "BlockNode")
        .def_prop_ro("config", &BlockNode::config)
        .def_prop_ro("block_count", &BlockNode::block_count)
        .def_prop_ro("block_size", &BlockNode::block_size)
        .def_prop_ro("label", &BlockNode::label)
        .def("locate", &BlockNode::locate, "entity_index"_a)
        .def("recalculate_block",
             [](BlockNode &self, block_index_t block_index) { return python::to_list(self.recalculate_block(block_index)); },
             "block_index"_a)
        .def("recalculate", &BlockNode::recalculate)
        .def("value_at", &BlockNode::value_at, "entity_index"_a)
        .def("is_stale", &BlockNode::is_stale, "block_index"_a)
        .def_prop_ro("allocated_block_count", &BlockNode::allocated_block_count)
        .def_prop_ro("subscriber_count", &BlockNode::subscriber_count);

    nb::class_<InputBlockNode, BlockNode>(m, "InputBlockNode")
        .def(nb::new_([](const BlockConfig &config, std::string label) {
                 return std::make_shared<InputBlockNode>(config, std::move(label));
             }),
             "config"_a = BlockConfig{}, "label"_a = "input")
        .def("set", nb::overload_cast<entity_index_t, lane_value_t>(&InputBlockNode::set), "entity_index"_a, "value"_a)
        .def("assign_block",
             [](InputBlockNode &self, block_index_t block_index, const std::vector<lane_value_t> &values) {
                 self.assign_block(block_index, ConstLaneSpan{values});
             },
             "block_index"_a, "values"_a);

    nb::class_<ScalarNode<lane_value_t>>(m, "ScalarNode")
        .def("recalculate", &ScalarNode<lane_value_t>::recalculate)
        .def_prop_ro("value", &ScalarNode<lane_value_t>::value)
        .def_prop_ro("is_stale", &ScalarNode<lane_value_t>::is_stale)
        .def_prop_ro("label", &ScalarNode<lane_value_t>::label);

    nb::class_<InputScalarNode<lane_value_t>, ScalarNode<lane_value_t>>(m, "InputScalarNode")
        .def(nb::new_([](std::optional<lane_value_t> initial, std::string label) {
                 return std::make_shared<InputScalarNode<lane_value_t>>(initial, std::move(label));
             }),
             "initial"_a = nb::none(), "label"_a = "scalar")
        .def("set", &InputScalarNode<lane_value_t>::set, "value"_a)
        .def("reset", &InputScalarNode<lane_value_t>::reset);

    nb::class_<ScalarNode<int64_t>>(m, "CountScalarNode")
        .def("recalculate", &ScalarNode<int64_t>::recalculate)
        .def_prop_ro("value", &ScalarNode<int64_t>::value)
        .def_prop_ro("label", &ScalarNode<int64_t>::label);
}
