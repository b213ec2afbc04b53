#include "qrbackup/layout.hpp"

#include <algorithm>
#include <stdexcept>

namespace qrbackup::layout {

std::size_t PageCount(std::size_t items, const PageGrid& grid) {
    if (grid.width < 1 || grid.height < 1) {
        throw std::invalid_argument("Page grid dimensions must be at least 1x1");
    }
    const std::size_t capacity = grid.Capacity();
    return (items + capacity - 1) / capacity;
}

std::vector<PagePlan> PlanPages(std::size_t items, const PageGrid& grid) {
    const std::size_t pages = PageCount(items, grid);
    const std::size_t capacity = grid.Capacity();
    const std::size_t width = static_cast<std::size_t>(grid.width);

    std::vector<PagePlan> plans;
    plans.reserve(pages);
    for (std::size_t page = 0; page < pages; ++page) {
        const std::size_t first = page * capacity;
        const std::size_t members = std::min(capacity, items - first);

        PagePlan plan;
        plan.page = page;
        plan.columns = static_cast<int>(std::min(members, width));
        plan.rows = static_cast<int>((members + width - 1) / width);
        plan.placements.reserve(members);
        for (std::size_t slot = 0; slot < members; ++slot) {
            Placement placement;
            placement.item = first + slot;
            placement.column = static_cast<int>(slot % width);
            placement.row = static_cast<int>(slot / width);
            plan.placements.push_back(placement);
        }
        plans.push_back(std::move(plan));
    }
    return plans;
}

image::ImageBuffer ComposePage(const PagePlan& plan,
                               CellSize cell,
                               int column_gutter,
                               const std::function<image::ImageBuffer(std::size_t item)>& load_item) {
    if (plan.columns < 1 || plan.rows < 1 || cell.width < 1 || cell.height < 1) {
        throw std::invalid_argument("Cannot compose an empty page");
    }
    const int page_width = plan.columns * cell.width + (plan.columns - 1) * column_gutter;
    const int page_height = plan.rows * cell.height;
    image::ImageBuffer page = image::Blank(page_width, page_height, 1);
    for (const auto& placement : plan.placements) {
        image::ImageBuffer item = image::ToGray(load_item(placement.item));
        image::Blit(page,
                    item,
                    placement.column * (cell.width + column_gutter),
                    placement.row * cell.height);
    }
    return page;
}

}  // namespace qrbackup::layout
