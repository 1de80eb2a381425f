// File: common/formatting/fmt_eigen.hpp

#ifndef FMT_EIGEN_HPP
#define FMT_EIGEN_HPP

#include <Eigen/Core>
#include <fmt/format.h>

/*
 * Formatter for Eigen matrices using fmt library.
 * Column vectors print inline as "(x, y, z)", everything else prints one row per line.
 * An optional precision may be given, e.g. fmt::format("{:3}", position) prints 3 decimals.
 * Default: 4 decimal places.
 */
template<typename Scalar, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
struct fmt::formatter<Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols>> {
    int precision = 4;

    constexpr auto parse(fmt::format_parse_context &ctx) {
        auto it = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it >= '0' && *it <= '9') {
            int parsed_precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                parsed_precision = parsed_precision * 10 + (*it - '0');
                ++it;
            }
            precision = parsed_precision;
        }

        if (it != end && *it != '}') {
            throw fmt::format_error("Invalid format specifier for Eigen matrix");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const Eigen::Matrix<Scalar, Rows, Cols, Options, MaxRows, MaxCols> &mat, FormatContext &ctx) const {
        auto out = ctx.out();

        if (mat.cols() == 1) {
            *out++ = '(';
            for (Eigen::Index row = 0; row < mat.rows(); ++row) {
                if (row != 0) {
                    out = fmt::format_to(out, ", ");
                }
                out = fmt::format_to(out, "{:.{}f}", static_cast<double>(mat(row, 0)), precision);
            }
            *out++ = ')';
            return out;
        }

        for (Eigen::Index row = 0; row < mat.rows(); ++row) {
            out = fmt::format_to(out, "\n[");
            for (Eigen::Index col = 0; col < mat.cols(); ++col) {
                if (col != 0) {
                    out = fmt::format_to(out, ", ");
                }
                out = fmt::format_to(out, "{:.{}f}", static_cast<double>(mat(row, col)), precision);
            }
            *out++ = ']';
        }
        return out;
    }
};

#endif // FMT_EIGEN_HPP
