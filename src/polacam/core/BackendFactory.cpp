#include "polacam/core/Backend.hpp"
#include "cpu/CpuBackend.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace polacam {

std::unique_ptr<IBackend> makeBackend(BackendType type,
                                      std::size_t workerThreads /*=0*/)
{
    switch (type) {
        case BackendType::CPU:
            return std::make_unique<CpuBackend>(workerThreads);
    }
    throw std::invalid_argument("makeBackend: unknown backend type");
}

std::optional<BackendType> backendTypeFromName(const std::string& name)
{
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (n == "cpu") return BackendType::CPU;
    return std::nullopt;
}

} // namespace polacam
