#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Grid.hpp"

// Empty -> Building -> Carving -> Carved -> Bounded -> Finalized
enum class MazeState
{
    Empty,
    Building,
    Carving,
    Carved,
    Bounded,
    Finalized,
};

const char* MazeStateName(MazeState s);

// Read-only view of a generated maze. Only MazeCarver moves it through its
// lifecycle; once Finalized it never changes and can be shared freely.
class Maze
{
public:
    Maze() = default;

    const Grid& GetGrid() const noexcept { return grid_; }
    int32_t Width() const noexcept { return grid_.Width(); }
    int32_t Height() const noexcept { return grid_.Height(); }

    MazeState State() const noexcept { return state_; }
    bool IsFinalized() const noexcept { return state_ == MazeState::Finalized; }

    bool HasEntrance() const noexcept { return hasEntrance_; }
    bool HasExit() const noexcept { return hasExit_; }
    const BoundaryOpening& Entrance() const noexcept { return entrance_; }
    const BoundaryOpening& Exit() const noexcept { return exit_; }

    // seed GenerateMaze was called with; 0 when the caller passed an engine
    uint32_t Seed() const noexcept { return seed_; }

    bool operator==(const Maze& other) const
    {
        return state_ == other.state_ && grid_ == other.grid_
            && hasEntrance_ == other.hasEntrance_ && entrance_ == other.entrance_
            && hasExit_ == other.hasExit_ && exit_ == other.exit_;
    }

private:
    friend class MazeCarver;
    friend class MazeBuilder;

    Grid grid_{};
    MazeState state_{MazeState::Empty};

    BoundaryOpening entrance_{};
    BoundaryOpening exit_{};
    bool hasEntrance_{false};
    bool hasExit_{false};

    uint32_t seed_{0};
};
