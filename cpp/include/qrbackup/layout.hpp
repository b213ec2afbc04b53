#pragma once

#include "qrbackup/image.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace qrbackup::layout {

struct PageGrid {
    int width = 1;
    int height = 1;

    std::size_t Capacity() const noexcept {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
};

struct Placement {
    std::size_t item = 0;
    int column = 0;
    int row = 0;
};

struct PagePlan {
    std::size_t page = 0;
    // Grid actually used by this page; smaller than the full grid only on a
    // partial final page.
    int columns = 0;
    int rows = 0;
    std::vector<Placement> placements;
};

std::size_t PageCount(std::size_t items, const PageGrid& grid);

// Items fill each page left to right, rows top-down, in input order.
std::vector<PagePlan> PlanPages(std::size_t items, const PageGrid& grid);

struct CellSize {
    int width = 0;
    int height = 0;
};

// Builds one grey page. `load_item` is called once per placement, in order, and
// each loaded image is released before the next is requested.
image::ImageBuffer ComposePage(const PagePlan& plan,
                               CellSize cell,
                               int column_gutter,
                               const std::function<image::ImageBuffer(std::size_t item)>& load_item);

}  // namespace qrbackup::layout
