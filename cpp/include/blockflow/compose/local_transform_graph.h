#pragma once

/**
 * @file local_transform_graph.h
 * @brief LocalTransformGraph - per-entity local affine transforms composed from the operator catalogue.
 *
 * Inputs are per-entity position, rotation quaternion, scale and anchor leaves. Outputs are the 12 computed
 * elements of the row-vector affine matrix (M11..M43); M14, M24, M34 and M44 are the constants 0, 0, 0, 1.
 *
 *   rotation-scale: M1j = sx * R(j,1), M2j = sy * R(j,2), M3j = sz * R(j,3) with R the quaternion rotation
 *   translation:    M4j = p_j + a_j - (M1j * ax + M2j * ay + M3j * az)
 *
 * so the anchor is the pivot the rotation and scale apply around.
 *
 * An entity has a transform once attach() has allocated its block on every input; until then its outputs are
 * absent, like any other sparse stream.
 */

#include <blockflow/runtime/block_graph.h>

#include <array>

namespace blockflow {

class BLOCKFLOW_EXPORT LocalTransformGraph {
public:
    struct Vector3Inputs {
        input_block_node_ptr x;
        input_block_node_ptr y;
        input_block_node_ptr z;
    };

    struct QuaternionInputs {
        input_block_node_ptr x;
        input_block_node_ptr y;
        input_block_node_ptr z;
        input_block_node_ptr w;
    };

    enum class Element : uint8_t { M11, M12, M13, M21, M22, M23, M31, M32, M33, M41, M42, M43 };

    static constexpr std::size_t ELEMENT_COUNT = 12;

    // Row-major 4x4
    using Matrix = std::array<lane_value_t, 16>;

    explicit LocalTransformGraph(const BlockConfig &config = {});

    /**
     * Allocates the entity's block on every input, so its transform becomes computable with the default
     * (identity) components.
     */
    void attach(entity_index_t entity_index);

    void set_position(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z);

    void set_rotation(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z, lane_value_t w);

    void set_scale(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z);

    void set_anchor(entity_index_t entity_index, lane_value_t x, lane_value_t y, lane_value_t z);

    [[nodiscard]] const Vector3Inputs &position() const { return position_; }

    [[nodiscard]] const QuaternionInputs &rotation() const { return rotation_; }

    [[nodiscard]] const Vector3Inputs &scale() const { return scale_; }

    [[nodiscard]] const Vector3Inputs &anchor() const { return anchor_; }

    [[nodiscard]] const block_node_ptr &element(Element element) const;

    /**
     * Pulls the entity's block on all 12 outputs and assembles the matrix.
     * @return std::nullopt when the entity has not been attached
     */
    [[nodiscard]] std::optional<Matrix> matrix_for(entity_index_t entity_index);

    /**
     * Pulls every block of every output.
     */
    void recalculate();

    [[nodiscard]] BlockGraph &graph() { return graph_; }

private:
    Vector3Inputs add_vector3(const char *name, lane_value_t fill);

    BlockGraph graph_;
    Vector3Inputs position_;
    QuaternionInputs rotation_;
    Vector3Inputs scale_;
    Vector3Inputs anchor_;
    std::array<block_node_ptr, ELEMENT_COUNT> elements_;
};

} // namespace blockflow
