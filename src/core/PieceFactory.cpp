#include "core/PieceFactory.hpp"
#include <random>
#include <stdexcept>
#include <utility>

namespace rustycubes::core {

PieceFactory::PieceFactory()
    : rng_{std::random_device{}()}
{
}

PieceFactory::PieceFactory(std::uint32_t seed)
    : rng_{seed}
{
}

PieceFactory::PieceFactory(std::vector<PieceKind> sequence)
    : rng_{}
    , sequence_{std::move(sequence)}
{
    if (sequence_.empty()) {
        throw std::invalid_argument("PieceFactory sequence must not be empty");
    }
}

PieceKind PieceFactory::nextKind() {
    if (!sequence_.empty()) {
        PieceKind kind = sequence_[sequenceIndex_];
        sequenceIndex_ = (sequenceIndex_ + 1) % sequence_.size();
        return kind;
    }

    std::uniform_int_distribution<int> dist(0, PieceKindCount - 1);
    return static_cast<PieceKind>(dist(rng_));
}

Piece PieceFactory::create(GridPosition anchor) {
    return Piece::spawn(nextKind(), anchor);
}

} // namespace rustycubes::core
