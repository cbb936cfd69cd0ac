#include "core/MazeError.hpp"

const char* MazeErrcName(MazeErrc code)
{
    switch (code)
    {
    case MazeErrc::InvalidDimension:     return "InvalidDimension";
    case MazeErrc::AlreadyCarved:        return "AlreadyCarved";
    case MazeErrc::InvalidState:         return "InvalidState";
    case MazeErrc::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
    case MazeErrc::InvalidBoundary:      return "InvalidBoundary";
    }
    return "Unknown";
}

MazeError::MazeError(MazeErrc code, const std::string& what)
    : std::runtime_error(std::string(MazeErrcName(code)) + ": " + what)
    , code_(code)
{
}
