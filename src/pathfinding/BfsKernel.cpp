#include "landfall/pathfinding/BfsKernel.hpp"
#include "logging/Log.h"

namespace landfall::pf {

void BfsEngine::prepare(const TerrainMap& map) {
    if (_visited.ensure_capacity(map.width(), map.height())) {
        logsys::get()->debug("BfsEngine: visited buffer sized for {}x{} ({} tiles)",
                             map.width(), map.height(), _visited.capacity());
        _current.clear();
        _next.clear();
    }
    if (_visited.begin_search())
        logsys::get()->debug("BfsEngine: visited generation wrapped, buffer cleared");
}

} // namespace landfall::pf
