// File: reconstruction/footprint_mapper.cpp

#include "reconstruction/footprint_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "common/logging/logger.hpp"

namespace reconstruction {

    namespace {
        // Maps the pixel interval [low, high] onto cell indices [begin, end) along one axis of `cells` cells.
        std::pair<Eigen::Index, Eigen::Index> mapAxis(const double low, const double high, const int extent_px,
                                                      const Eigen::Index cells) {
            const double cells_per_pixel = static_cast<double>(cells) / static_cast<double>(extent_px);

            const auto limit = static_cast<double>(cells);
            auto begin = static_cast<Eigen::Index>(std::clamp(std::floor(low * cells_per_pixel), 0.0, limit));
            auto end = static_cast<Eigen::Index>(std::clamp(std::ceil(high * cells_per_pixel), 0.0, limit));

            begin = std::clamp<Eigen::Index>(begin, 0, cells - 1);
            end = std::clamp<Eigen::Index>(end, begin + 1, cells);
            return {begin, end};
        }
    } // namespace

    GridRegion mapFootprint(const BoundingBox &bbox, const ImageSize &image, const Eigen::Index rows,
                            const Eigen::Index cols) {
        if (rows <= 0 || cols <= 0) {
            throw std::invalid_argument("Footprint mapping requires a non-empty grid.");
        }
        if (!image.isValid()) {
            throw std::invalid_argument("Footprint mapping requires a positive image size.");
        }

        const auto [col_begin, col_end] = mapAxis(bbox.minX(), bbox.maxX(), image.width, cols);
        const auto [row_begin, row_end] = mapAxis(bbox.minY(), bbox.maxY(), image.height, rows);

        GridRegion region{row_begin, row_end, col_begin, col_end};
        LOG_TRACE("Footprint ({}, {}, {}, {}) on {}x{} image -> rows [{}, {}), cols [{}, {})", bbox.x1, bbox.y1, bbox.x2,
                  bbox.y2, image.width, image.height, region.row_begin, region.row_end, region.col_begin,
                  region.col_end);
        return region;
    }

    double sampleMean(const Eigen::MatrixXd &grid, const GridRegion &region) {
        if (region.empty() || region.row_end > grid.rows() || region.col_end > grid.cols() || region.row_begin < 0 ||
            region.col_begin < 0) {
            throw std::out_of_range("Grid region lies outside the elevation grid.");
        }
        return grid.block(region.row_begin, region.col_begin, region.rows(), region.cols()).mean();
    }

} // namespace reconstruction
