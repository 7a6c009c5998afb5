#include "backend_factory.hpp"
#include "knn_flat_ip.hpp"
#include "util.hpp"

std::unique_ptr<IndexBackend> create_backend(const std::string& backend_name) {
    if (backend_name == "bruteforce") {
        return std::make_unique<BruteforceIndex>();
    }

    if (backend_name == "flat_ip") {
        return std::make_unique<FlatIpIndex>();
    }

    LOG_WARN("Unknown index backend '" + backend_name + "', falling back to bruteforce");
    return std::make_unique<BruteforceIndex>();
}
