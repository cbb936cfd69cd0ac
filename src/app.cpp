#include "App/App.hpp"
#include "core/MazeBuilder.hpp"
#include "core/MazeError.hpp"
#include "Export/PngWriter.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <random>
#include <string>

static std::string toLower(const std::string& s)
{
    std::string t;
    t.reserve(s.size());
    for (unsigned char ch : s) t.push_back((char)std::tolower(ch));
    return t;
}

static bool parseInt(const std::string& s, long long lo, long long hi, long long& out)
{
    if (s.empty()) return false;

    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (v < lo || v > hi) return false;

    out = v;
    return true;
}

bool ParseArgs(int argc, const char* const* argv, AppConfig& out, std::string& outError)
{
    AppConfig cfg;
    std::vector<std::string> positional;

    constexpr long long kI32Min = std::numeric_limits<int32_t>::min();
    constexpr long long kI32Max = std::numeric_limits<int32_t>::max();

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        // options taking a value
        auto value = [&](std::string& v) {
            if (i + 1 >= argc) {
                outError = "missing value for " + arg;
                return false;
            }
            v = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            cfg.showHelp = true;
        }
        else if (arg == "-a" || arg == "--algorithm")
        {
            std::string v;
            if (!value(v)) return false;
            cfg.algorithm = toLower(v);
        }
        else if (arg == "-s" || arg == "--seed")
        {
            std::string v;
            long long n = 0;
            if (!value(v)) return false;
            if (!parseInt(v, 0, std::numeric_limits<uint32_t>::max(), n)) {
                outError = "invalid seed '" + v + "'";
                return false;
            }
            cfg.seed = (uint32_t)n;
            cfg.hasSeed = true;
        }
        else if (arg == "-c" || arg == "--cell")
        {
            std::string v;
            long long n = 0;
            if (!value(v)) return false;
            if (!parseInt(v, kMinCellSize, 1024, n)) {
                outError = "invalid cell size '" + v + "' (expected " + std::to_string(kMinCellSize) + "..1024)";
                return false;
            }
            cfg.cellSize = (int32_t)n;
        }
        else if (arg == "-o" || arg == "--out")
        {
            if (!value(cfg.outPath)) return false;
            if (cfg.outPath.empty()) {
                outError = "output path is empty";
                return false;
            }
        }
        else if (arg == "--ascii")
        {
            cfg.ascii = true;
        }
        else if (arg == "-q" || arg == "--quiet")
        {
            cfg.quiet = true;
        }
        else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit((unsigned char)arg[1]))
        {
            outError = "unknown option " + arg;
            return false;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (cfg.showHelp)
    {
        out = cfg;
        return true;
    }

    if (positional.size() != 2)
    {
        outError = "expected <width> <height>";
        return false;
    }

    long long w = 0, h = 0;
    if (!parseInt(positional[0], kI32Min, kI32Max, w)) {
        outError = "invalid width '" + positional[0] + "'";
        return false;
    }
    if (!parseInt(positional[1], kI32Min, kI32Max, h)) {
        outError = "invalid height '" + positional[1] + "'";
        return false;
    }
    cfg.width = (int32_t)w;
    cfg.height = (int32_t)h;

    out = cfg;
    return true;
}

void PrintUsage(std::ostream& os, const char* prog)
{
    os << "usage: " << prog << " <width> <height> [options]\n"
       << "  -a, --algorithm NAME   carving algorithm (dfs)\n"
       << "  -s, --seed N           random seed, default: random\n"
       << "  -c, --cell N           pixels per cell, default " << kDefaultCellSize << "\n"
       << "  -o, --out PATH         output image, default maze.png\n"
       << "      --ascii            also print the maze as text\n"
       << "  -q, --quiet            no summary line\n"
       << "  -h, --help             show this help\n";
}

int runApp(const AppConfig& cfg)
{
    try
    {
        const uint32_t seed = cfg.hasSeed ? cfg.seed : std::random_device{}();

        const Maze maze = MazeBuilder::GenerateMaze(cfg.width, cfg.height, cfg.algorithm, seed);

        if (cfg.ascii)
            std::cout << Rasterizer::RenderAscii(maze);

        const std::string written = PngWriter::SavePNG(maze, cfg.outPath, cfg.cellSize);

        if (!cfg.quiet)
        {
            std::cout << "maze " << maze.Width() << "x" << maze.Height()
                      << " algorithm=" << cfg.algorithm
                      << " seed=" << seed
                      << " passages=" << maze.GetGrid().CountPassages()
                      << " entrance=" << maze.Entrance()
                      << " exit=" << maze.Exit()
                      << " -> " << written << std::endl;
        }
    }
    catch (const MazeError& e)
    {
        std::cerr << "mazegen: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "mazegen: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
