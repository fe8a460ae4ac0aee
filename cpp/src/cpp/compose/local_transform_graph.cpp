#include <blockflow/compose/local_transform_graph.h>
#include <blockflow/nodes/binary_nodes.h>
#include <blockflow/nodes/scalar_operand_nodes.h>

#include <fmt/format.h>

namespace blockflow {

    namespace {
        constexpr std::size_t index_of(LocalTransformGraph::Element element) { return static_cast<std::size_t>(element); }
    }

    LocalTransformGraph::LocalTransformGraph(const BlockConfig &config) : graph_{config, "local_transform"} {
        position_ = add_vector3("position", 0.0f);
        rotation_ = QuaternionInputs{
            graph_.add_input("rotation.x", 0.0f),
            graph_.add_input("rotation.y", 0.0f),
            graph_.add_input("rotation.z", 0.0f),
            graph_.add_input("rotation.w", 1.0f),
        };
        scale_ = add_vector3("scale", 1.0f);
        anchor_ = add_vector3("anchor", 0.0f);

        auto one = graph_.add_scalar("one", 1.0f);
        auto two = graph_.add_scalar("two", 2.0f);

        auto product = [this](std::string name, const block_node_ptr &a, const block_node_ptr &b) -> block_node_ptr {
            return graph_.add<MultiplyBlockNode>(std::move(name), a, b);
        };
        auto doubled = [this, &two](const char *name, const block_node_ptr &x) -> block_node_ptr {
            return graph_.add<MultiplyScalarBlockNode>(name, x, two);
        };

        const auto &[qx, qy, qz, qw] = rotation_;
        auto xx2 = doubled("2xx", product("xx", qx, qx));
        auto yy2 = doubled("2yy", product("yy", qy, qy));
        auto zz2 = doubled("2zz", product("zz", qz, qz));
        auto xy2 = doubled("2xy", product("xy", qx, qy));
        auto xz2 = doubled("2xz", product("xz", qx, qz));
        auto yz2 = doubled("2yz", product("yz", qy, qz));
        auto wx2 = doubled("2wx", product("wx", qw, qx));
        auto wy2 = doubled("2wy", product("wy", qw, qy));
        auto wz2 = doubled("2wz", product("wz", qw, qz));

        // Unscaled rotation
        auto r11 = graph_.add<ScalarSubtractBlockNode>("r11", one, graph_.add<AddBlockNode>("2(yy+zz)", yy2, zz2));
        auto r12 = graph_.add<SubtractBlockNode>("r12", xy2, wz2);
        auto r13 = graph_.add<AddBlockNode>("r13", xz2, wy2);
        auto r21 = graph_.add<AddBlockNode>("r21", xy2, wz2);
        auto r22 = graph_.add<ScalarSubtractBlockNode>("r22", one, graph_.add<AddBlockNode>("2(xx+zz)", xx2, zz2));
        auto r23 = graph_.add<SubtractBlockNode>("r23", yz2, wx2);
        auto r31 = graph_.add<SubtractBlockNode>("r31", xz2, wy2);
        auto r32 = graph_.add<AddBlockNode>("r32", yz2, wx2);
        auto r33 = graph_.add<ScalarSubtractBlockNode>("r33", one, graph_.add<AddBlockNode>("2(xx+yy)", xx2, yy2));

        auto &m = elements_;
        m[index_of(Element::M11)] = product("M11", scale_.x, r11);
        m[index_of(Element::M12)] = product("M12", scale_.x, r21);
        m[index_of(Element::M13)] = product("M13", scale_.x, r31);
        m[index_of(Element::M21)] = product("M21", scale_.y, r12);
        m[index_of(Element::M22)] = product("M22", scale_.y, r22);
        m[index_of(Element::M23)] = product("M23", scale_.y, r32);
        m[index_of(Element::M31)] = product("M31", scale_.z, r13);
        m[index_of(Element::M32)] = product("M32", scale_.z, r23);
        m[index_of(Element::M33)] = product("M33", scale_.z, r33);

        // Translation row: position + anchor - (rotation-scale applied to the anchor)
        auto translation = [&](const char *axis, Element row1, Element row2, Element row3,
                               const input_block_node_ptr &p, const input_block_node_ptr &a) -> block_node_ptr {
            auto moved = graph_.add<AddBlockNode>(
                fmt::format("rs*anchor.{}", axis),
                graph_.add<AddBlockNode>(fmt::format("rs*anchor.{}.xy", axis),
                                         product(fmt::format("m1{}*anchor.x", axis), m[index_of(row1)], anchor_.x),
                                         product(fmt::format("m2{}*anchor.y", axis), m[index_of(row2)], anchor_.y)),
                product(fmt::format("m3{}*anchor.z", axis), m[index_of(row3)], anchor_.z));
            auto pivot = graph_.add<AddBlockNode>(fmt::format("position+anchor.{}", axis), p, a);
            return graph_.add<SubtractBlockNode>(fmt::format("translation.{}", axis), pivot, moved);
        };
        m[index_of(Element::M41)] = translation("x", Element::M11, Element::M21, Element::M31, position_.x, anchor_.x);
        m[index_of(Element::M42)] = translation("y", Element::M12, Element::M22, Element::M32, position_.y, anchor_.y);
        m[index_of(Element::M43)] = translation("z", Element::M13, Element::M23, Element::M33, position_.z, anchor_.z);
    }

    LocalTransformGraph::Vector3Inputs LocalTransformGraph::add_vector3(const char *name, lane_value_t fill) {
        return Vector3Inputs{
            graph_.add_input(fmt::format("{}.x", name), fill),
            graph_.add_input(fmt::format("{}.y", name), fill),
            graph_.add_input(fmt::format("{}.z", name), fill),
        };
    }

    void LocalTransformGraph::attach(entity_index_t entity_index) {
        for (const auto *inputs : {&position_, &scale_, &anchor_}) {
            (void)inputs->x->instance_for(entity_index);
            (void)inputs->y->instance_for(entity_index);
            (void)inputs->z->instance_for(entity_index);
        }
        for (const auto &component : {rotation_.x, rotation_.y, rotation_.z, rotation_.w}) {
            (void)component->instance_for(entity_index);
        }
    }

    void LocalTransformGraph::set_position(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z) {
        position_.x->set(entity_index, x);
        position_.y->set(entity_index, y);
        position_.z->set(entity_index, z);
    }

    void LocalTransformGraph::set_rotation(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z,
                                           lane_value_t w) {
        rotation_.x->set(entity_index, x);
        rotation_.y->set(entity_index, y);
        rotation_.z->set(entity_index, z);
        rotation_.w->set(entity_index, w);
    }

    void LocalTransformGraph::set_scale(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z) {
        scale_.x->set(entity_index, x);
        scale_.y->set(entity_index, y);
        scale_.z->set(entity_index, z);
    }

    void LocalTransformGraph::set_anchor(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z) {
        anchor_.x->set(entity_index, x);
        anchor_.y->set(entity_index, y);
        anchor_.z->set(entity_index, z);
    }

    const block_node_ptr &LocalTransformGraph::element(Element element) const { return elements_[index_of(element)]; }

    std::optional<LocalTransformGraph::Matrix> LocalTransformGraph::matrix_for(entity_index_t entity_index) {
        const auto address = position_.x->locate(entity_index);
        std::array<lane_value_t, ELEMENT_COUNT> computed{};
        for (std::size_t i = 0; i < ELEMENT_COUNT; ++i) {
            auto block = elements_[i]->recalculate_block(address.block_index);
            if (!block) { return std::nullopt; }
            computed[i] = (*block)[address.lane_index];
        }
        const auto &c = computed;
        return Matrix{
            c[0], c[1], c[2], 0.0f,
            c[3], c[4], c[5], 0.0f,
            c[6], c[7], c[8], 0.0f,
            c[9], c[10], c[11], 1.0f,
        };
    }

    void LocalTransformGraph::recalculate() {
        for (const auto &element : elements_) { element->recalculate(); }
    }

} // namespace blockflow
