#include "core/Common.hpp"
#include "App/App.hpp"
#include "App/Config.hpp"
#include "Viewer/core.hpp"

int main(int argc, char** argv)
{
    AppConfig cfg;
    std::string error;

    if (!ParseArgs(argc, argv, cfg, error)) {
        std::cerr << error << "\n" << Usage(argv[0]);
        return kExitUsage;
    }

    if (cfg.help) {
        std::cout << Usage(argv[0])
                  << "\nkeys: q/esc quit, r regenerate, l live on/off, 1/2/3 dfs/bfs/a-star, s save\n";
        return kExitOk;
    }

    try {
        return Viewer::getInstance().run(cfg);
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }
}
