#pragma once
#include "core/Common.hpp"
#include "Export/Rasterizer.hpp"

struct AppConfig
{
    int32_t width{0};
    int32_t height{0};
    std::string algorithm{"dfs"};

    uint32_t seed{0};
    bool hasSeed{false};   // false: draw one from std::random_device

    int32_t cellSize{kDefaultCellSize};
    std::string outPath{"maze"};

    bool ascii{false};
    bool quiet{false};
    bool showHelp{false};
};

// argv[0] is the program name. Returns false and fills outError on any
// malformed or missing argument. Dimensions are only checked for being
// integers; their range is enforced by the generator.
bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError);

void PrintUsage(std::ostream& os, const char* prog);

// Generates, optionally prints, and saves the maze. Returns the process
// exit status; failures are reported on std::cerr.
int runApp(const AppConfig& cfg);
