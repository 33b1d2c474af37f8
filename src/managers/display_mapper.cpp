#include "display_mapper.hpp"
#include <core/constants.hpp>

DisplayDirectives map_snapshot(const CanonicalSnapshot& snapshot) {
    DisplayDirectives d;
    d.indicator_a = snapshot.classical_active;
    d.indicator_b = snapshot.quantum_active;

    if (snapshot.classical_active && snapshot.quantum_active) {
        d.matrix_text = MatrixText{"QCSC",
            {COLOR_QUANTUM, COLOR_QUANTUM, COLOR_CLASSICAL, COLOR_CLASSICAL},
            MATRIX_QCSC_X};
    } else if (snapshot.classical_active) {
        d.matrix_text = MatrixText{"HPC",
            {COLOR_CLASSICAL, COLOR_CLASSICAL, COLOR_CLASSICAL}, MATRIX_HPC_X};
    } else if (snapshot.quantum_active) {
        d.matrix_text = MatrixText{"Q", {COLOR_QUANTUM}, MATRIX_Q_X};
    }

    d.node_lights = snapshot.node_active;
    return d;
}
