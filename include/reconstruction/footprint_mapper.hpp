// File: reconstruction/footprint_mapper.hpp

#ifndef FOOTPRINT_MAPPER_HPP
#define FOOTPRINT_MAPPER_HPP

#include <Eigen/Core>

#include "types/detection.hpp"

namespace reconstruction {

    // Half-open index range [row_begin, row_end) x [col_begin, col_end) of a grid.
    struct GridRegion {
        Eigen::Index row_begin{}, row_end{}, col_begin{}, col_end{};

        [[nodiscard]] Eigen::Index rows() const noexcept { return row_end - row_begin; }
        [[nodiscard]] Eigen::Index cols() const noexcept { return col_end - col_begin; }
        [[nodiscard]] bool empty() const noexcept { return rows() <= 0 || cols() <= 0; }

        bool operator==(const GridRegion &) const noexcept = default;
    };

    /**
     * @brief Maps a pixel bounding box onto the cells of a rows x cols grid that covers the whole image.
     *
     * The grid is stretched over the image: pixel x spans [0, image.width) across the columns and pixel y spans
     * [0, image.height) across the rows. Every cell the footprint touches is included. The footprint is clipped
     * to the grid, and the result always holds at least one cell so a sample can always be taken.
     */
    [[nodiscard]] GridRegion mapFootprint(const BoundingBox &bbox, const ImageSize &image, Eigen::Index rows,
                                          Eigen::Index cols);

    // Mean of the grid values inside the region.
    [[nodiscard]] double sampleMean(const Eigen::MatrixXd &grid, const GridRegion &region);

} // namespace reconstruction

#endif // FOOTPRINT_MAPPER_HPP
