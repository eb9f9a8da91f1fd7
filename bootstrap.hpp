#pragma once
#include <string>
#include <vector>
#include "action_result.hpp"

struct BootstrapResult {
    std::string fontPath;               // empty if no font was found
    std::vector<ActionResult> issues;   // problems to flash once the widget is up
};

// Load configs + error catalogue, open the log file, resolve the font
BootstrapResult runBootstrapChecks(int argc, char** argv);
