#include "core/Maze.hpp"

const char* MazeStateName(MazeState s)
{
    switch (s)
    {
    case MazeState::Empty:     return "Empty";
    case MazeState::Building:  return "Building";
    case MazeState::Carving:   return "Carving";
    case MazeState::Carved:    return "Carved";
    case MazeState::Bounded:   return "Bounded";
    case MazeState::Finalized: return "Finalized";
    }
    return "Unknown";
}
