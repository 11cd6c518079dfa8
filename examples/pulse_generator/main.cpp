/**
 * @file main.cpp
 * @brief Main application entry point file
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 */

#include "app.hpp"


/**
 * @brief Global application instance
 * 
 * Construction registers it with the safety system and as the Core 1
 * entry point target.
 */
Forge::App app;

int main() {
    app.run();
    return 0;
}
