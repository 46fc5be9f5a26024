// ashface [faces_dir] [expression...]
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "app.hpp"

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    std::string faces_dir = "assets/faces";
    std::vector<std::string> names;
    if (argc > 1) faces_dir = argv[1];
    for (int i = 2; i < argc; ++i) names.emplace_back(argv[i]);

    ashface::App app;
    if (!app.init(faces_dir)) return 1;
    return app.run(names);
}
