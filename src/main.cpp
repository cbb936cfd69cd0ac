#include "core/Common.hpp"
#include "App/App.hpp"

int main(int argc, char** argv)
{
    AppConfig cfg;
    std::string error;

    if (!ParseArgs(argc, argv, cfg, error))
    {
        std::cerr << "mazegen: " << error << "\n";
        PrintUsage(std::cerr, argv[0]);
        return 2;
    }

    if (cfg.showHelp)
    {
        PrintUsage(std::cout, argv[0]);
        return 0;
    }

    return runApp(cfg);
}
