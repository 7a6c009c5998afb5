#pragma once

#include "knn_bruteforce.hpp"
#include <memory>
#include <string>

// "bruteforce" or "flat_ip". Anything else logs a warning and yields bruteforce.
std::unique_ptr<IndexBackend> create_backend(const std::string& backend_name);
