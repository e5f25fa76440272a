#pragma once

#include "core/Logging.hpp"
#include "core/time/ReferenceZone.hpp"
#include "core/types/Bucket.hpp"
#include "core/types/Target.hpp"

#include <QColor>
#include <QImage>

#include <filesystem>
#include <string>

namespace uptimegrid::infra {

/**
 * @brief Draws bucketed series as PNG images.
 *
 * The heatmap lays the scaffold out as one column per alignment period (a day
 * for the default grid) with one row per bucket inside it. The sparkline plots
 * Up as 1 and everything else in the past as 0.
 *
 * Requires a QGuiApplication for text rendering.
 */
class ChartRenderer {
public:
    /// Cell of the heatmap grid a bucket is drawn into.
    struct GridCell {
        int column{0};
        int row{0};

        bool operator==(const GridCell& other) const = default;
    };

    ChartRenderer(const core::ReferenceZone& zone, core::LoggerPtr logger);

    /**
     * @brief Renders the heatmap of a series.
     * @param series Buckets oldest first, as produced by the Aggregator.
     * @param title Heading drawn above the grid.
     * @param spec Spec the series was built with (rows per column).
     */
    QImage renderHeatmap(const core::BucketedSeries& series, const std::string& title,
                         const core::BucketSpec& spec) const;

    QImage renderSparkline(const core::BucketedSeries& series) const;

    /**
     * @brief Renders and atomically writes chart_<sanitized>.png.
     * @return False (after logging) if the image could not be written.
     */
    bool writeHeatmap(const std::filesystem::path& outputDir, const core::Target& target,
                      const core::BucketedSeries& series, const core::BucketSpec& spec) const;

    /**
     * @brief Renders and atomically writes sparkline_<sanitized>.png.
     */
    bool writeSparkline(const std::filesystem::path& outputDir, const core::Target& target,
                        const core::BucketedSeries& series) const;

    static std::string heatmapFileName(const core::Target& target);
    static std::string sparklineFileName(const core::Target& target);

    /**
     * @brief Grid position of bucket @p index out of @p count.
     *
     * The grid is filled from the newest bucket backwards so the last column
     * is always complete; a scaffold that is not a whole number of columns
     * leaves the top of the first column empty.
     */
    static GridCell heatmapCell(std::size_t index, std::size_t count, std::size_t rows);

    static std::size_t heatmapRows(const core::BucketSpec& spec);

    static QColor colorFor(const core::Bucket& bucket);

private:
    bool writePng(const std::filesystem::path& path, const QImage& image) const;

    const core::ReferenceZone& zone_;
    core::LoggerPtr logger_;
};

} // namespace uptimegrid::infra
