#include "core/ShapeCatalog.hpp"

namespace rustycubes::core {

Shape shapeFor(PieceKind kind) noexcept {
    using S = Shape;

    switch (kind) {
    case PieceKind::I:
        // [ ][ ][ ][ ]
        return S{{ {0, 0}, {1, 0}, {2, 0}, {3, 0} }};

    case PieceKind::J:
        // [ ]
        // [ ][ ][ ]
        return S{{ {0, 0}, {0, 1}, {1, 1}, {2, 1} }};

    case PieceKind::L:
        //       [ ]
        // [ ][ ][ ]
        return S{{ {2, 0}, {0, 1}, {1, 1}, {2, 1} }};

    case PieceKind::O:
        // [ ][ ]
        // [ ][ ]
        return S{{ {0, 0}, {0, 1}, {1, 0}, {1, 1} }};

    case PieceKind::S:
        //    [ ][ ]
        // [ ][ ]
        return S{{ {1, 0}, {2, 0}, {0, 1}, {1, 1} }};

    case PieceKind::T:
        //    [ ]
        // [ ][ ][ ]
        return S{{ {1, 0}, {0, 1}, {1, 1}, {2, 1} }};

    case PieceKind::Z:
        // [ ][ ]
        //    [ ][ ]
        return S{{ {0, 0}, {1, 0}, {1, 1}, {2, 1} }};
    }

    // Fallback (should never happen)
    return S{{ {0, 0}, {0, 0}, {0, 0}, {0, 0} }};
}

ColorPair colorsFor(PieceKind kind) noexcept {
    switch (kind) {
    case PieceKind::I: return {{  0, 170, 200}, {  0, 240, 255}}; // cyan
    case PieceKind::J: return {{  0,  40, 200}, { 60, 110, 255}}; // blue
    case PieceKind::L: return {{242, 125,   0}, {255, 172,  84}}; // orange
    case PieceKind::O: return {{210, 190,   0}, {255, 240,  60}}; // yellow
    case PieceKind::S: return {{  0, 170,   0}, { 70, 240,  70}}; // green
    case PieceKind::T: return {{120,  20, 190}, {170,  80, 240}}; // purple
    case PieceKind::Z: return {{200,   0,   0}, {250,   0,   0}}; // red
    }
    return {{200, 200, 200}, {230, 230, 230}};
}

} // namespace rustycubes::core
