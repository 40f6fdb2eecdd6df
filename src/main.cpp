#include "core/Common.hpp"
#include "App/App.hpp"
#include "App/Config.hpp"

int main(int argc, char** argv)
{
    AppConfig cfg;
    std::string error;

    if (!ParseArgs(argc, argv, cfg, error)) {
        std::cerr << error << "\n" << Usage(argv[0]);
        return kExitUsage;
    }

    if (cfg.help) {
        std::cout << Usage(argv[0]);
        return kExitOk;
    }

    return runApp(cfg);
}
