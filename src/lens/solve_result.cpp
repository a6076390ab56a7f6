// SPDX-License-Identifier: MIT
#include "src/lens/solve_result.hpp"
#include <algorithm>
#include <limits>

namespace lensolve {

PaddedImageTable BatchResult::padded(std::optional<size_t> capacity) const {
    size_t widest = 0;
    for (const auto& r : results) {
        widest = std::max(widest, r.images.size());
    }

    PaddedImageTable table;
    table.rows = results.size();
    table.capacity = capacity.value_or(widest);

    const size_t cells = table.rows * table.capacity;
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    table.x.assign(cells, nan);
    table.y.assign(cells, nan);
    table.magnification.assign(cells, nan);
    table.valid.assign(cells, 0);
    table.counts.assign(table.rows, 0);

    for (size_t row = 0; row < table.rows; ++row) {
        const auto& images = results[row].images;
        const size_t stored = std::min(images.size(), table.capacity);
        if (images.size() > table.capacity) {
            ++table.truncated_count;
        }
        for (size_t col = 0; col < stored; ++col) {
            const size_t at = table.offset(row, col);
            table.x[at] = images[col].position.x;
            table.y[at] = images[col].position.y;
            table.magnification[at] = images[col].magnification;
            table.valid[at] = 1;
        }
        table.counts[row] = stored;
    }
    return table;
}

}  // namespace lensolve
