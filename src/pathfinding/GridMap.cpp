#include "landfall/pathfinding/GridMap.hpp"
#include "logging/Log.h"

#include <algorithm>
#include <sstream>

namespace landfall::pf {

void GridMap::set_terrain(int x, int y, Terrain t) {
    _terrain[to_ref(x, y, _b.w)] = t;
    refresh_around(x, y);
}

void GridMap::fill(int x0, int y0, int x1, int y1, Terrain t) {
    x0 = std::max(x0, 0); y0 = std::max(y0, 0);
    x1 = std::min(x1, _b.w - 1); y1 = std::min(y1, _b.h - 1);
    for (int y = y0; y <= y1; ++y)
        for (int x = x0; x <= x1; ++x)
            _terrain[to_ref(x, y, _b.w)] = t;

    // Shore flags can change one tile outside the painted rectangle.
    for (int y = std::max(y0 - 1, 0); y <= std::min(y1 + 1, _b.h - 1); ++y)
        for (int x = std::max(x0 - 1, 0); x <= std::min(x1 + 1, _b.w - 1); ++x)
            refresh_shore(to_ref(x, y, _b.w));
}

void GridMap::refresh_shore(TileRef t) {
    u8 flags = 0;
    if (_terrain[t] == Terrain::Land) {
        for_each_cardinal(t, u32(_b.w), _b.size(), [&](TileRef n) {
            if (_terrain[n] == Terrain::Ocean) flags |= kTouchesOcean;
            else if (_terrain[n] == Terrain::Lake) flags |= kTouchesLake;
        });
    }
    _shore[t] = flags;
}

void GridMap::refresh_around(int x, int y) {
    const TileRef t = to_ref(x, y, _b.w);
    refresh_shore(t);
    for_each_cardinal(t, u32(_b.w), _b.size(), [&](TileRef n) { refresh_shore(n); });
}

std::optional<GridMap> GridMap::from_ascii(std::string_view text) {
    std::vector<std::string_view> rows;
    int lineNo = 0;
    while (!text.empty()) {
        const auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
        ++lineNo;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty() || line.front() == ';') continue;

        if (!rows.empty() && line.size() != rows.front().size()) {
            logsys::get()->warn("GridMap::from_ascii: line {} has width {}, expected {}",
                                lineNo, line.size(), rows.front().size());
            return std::nullopt;
        }
        rows.push_back(line);
    }

    if (rows.empty()) {
        logsys::get()->warn("GridMap::from_ascii: no rows");
        return std::nullopt;
    }

    GridMap m(static_cast<int>(rows.front().size()), static_cast<int>(rows.size()));
    for (int y = 0; y < m._b.h; ++y) {
        for (int x = 0; x < m._b.w; ++x) {
            const char c = rows[static_cast<size_t>(y)][static_cast<size_t>(x)];
            const TileRef t = to_ref(x, y, m._b.w);
            switch (c) {
            case '.': m._terrain[t] = Terrain::Land;  break;
            case '~': m._terrain[t] = Terrain::Ocean; break;
            case '-': m._terrain[t] = Terrain::Lake;  break;
            default:
                if (c >= '1' && c <= '9') {
                    m._terrain[t] = Terrain::Land;
                    m._owner[t] = static_cast<PlayerId>(c - '0');
                    break;
                }
                logsys::get()->warn("GridMap::from_ascii: unexpected '{}' at ({}, {})", c, x, y);
                return std::nullopt;
            }
        }
    }

    for (TileRef t = 0; t < m._b.size(); ++t)
        m.refresh_shore(t);
    return m;
}

std::optional<std::string> GridMap::to_ascii() const {
    std::ostringstream oss;
    for (int y = 0; y < _b.h; ++y) {
        for (int x = 0; x < _b.w; ++x) {
            const TileRef t = to_ref(x, y, _b.w);
            const PlayerId p = _owner[t];
            if (p != kNoOwner && (_terrain[t] != Terrain::Land || p > 9)) {
                logsys::get()->warn("GridMap::to_ascii: owner {} at ({}, {}) has no ASCII form", p, x, y);
                return std::nullopt;
            }
            char c = '.';
            if (_terrain[t] == Terrain::Ocean)     c = '~';
            else if (_terrain[t] == Terrain::Lake) c = '-';
            else if (p != kNoOwner)                c = char('0' + p);
            oss << c;
        }
        oss << '\n';
    }
    return oss.str();
}

} // namespace landfall::pf
