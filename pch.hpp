// pch.hpp
#pragma once

// ---------------------------------------------------------
// External libraries
// ---------------------------------------------------------
#include <nlohmann/json.hpp>
#include <SFML/Graphics.hpp>

// ---------------------------------------------------------
// Standard Library
// ---------------------------------------------------------
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <map>
#include <filesystem>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <optional>
#include <memory>
#include <functional>
#include <fstream>
#include <mutex>
#include <random>
#include <cmath>
