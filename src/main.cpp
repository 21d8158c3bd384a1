/**
 * @fileoverview main.cpp
 * @brief Entry point for the beatfield viewer.
 */

#include <exception>
#include <iostream>

#include "beatfield/app/sim_manager.hpp"

int main() {
    try {
        SimManager manager;
        if (!manager.init()) {
            return 1;
        }
        manager.run();
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
