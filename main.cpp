#include <string>
#include <vector>

#include "app/AmlGateApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    amlgate::app::AmlGateApp app;
    return app.Run(args);
}
