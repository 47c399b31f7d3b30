#include "../platform_factory.hpp"

#include "linux_process_spawner.hpp"

namespace plx {

std::unique_ptr<IProcessSpawner> make_process_spawner() {
    return std::make_unique<LinuxProcessSpawner>();
}

} // namespace plx
