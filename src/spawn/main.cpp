#include "cli.hpp"
#include "platform/linux/sway_window_manager.hpp"

int main(int argc, char* argv[]) {
    SwayWindowManager wm;
    return run(argc, argv, wm);
}
