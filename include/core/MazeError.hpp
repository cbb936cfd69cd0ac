#pragma once
#include "core/Common.hpp"

enum class MazeErrc
{
    InvalidDimension,
    AlreadyCarved,
    InvalidState,
    UnsupportedAlgorithm,
    InvalidBoundary,
};

const char* MazeErrcName(MazeErrc code);

// Base for every failure raised by the generator. what() carries the
// human-readable detail, code() the category.
class MazeError : public std::runtime_error
{
public:
    MazeError(MazeErrc code, const std::string& what);

    MazeErrc code() const noexcept { return code_; }

private:
    MazeErrc code_;
};

class InvalidDimension : public MazeError
{
public:
    explicit InvalidDimension(const std::string& what)
        : MazeError(MazeErrc::InvalidDimension, what) {}
};

class AlreadyCarved : public MazeError
{
public:
    explicit AlreadyCarved(const std::string& what)
        : MazeError(MazeErrc::AlreadyCarved, what) {}
};

class InvalidState : public MazeError
{
public:
    explicit InvalidState(const std::string& what)
        : MazeError(MazeErrc::InvalidState, what) {}
};

class UnsupportedAlgorithm : public MazeError
{
public:
    explicit UnsupportedAlgorithm(const std::string& what)
        : MazeError(MazeErrc::UnsupportedAlgorithm, what) {}
};

class InvalidBoundary : public MazeError
{
public:
    explicit InvalidBoundary(const std::string& what)
        : MazeError(MazeErrc::InvalidBoundary, what) {}
};
