#include "infrastructure/report/ChartRenderer.hpp"

#include "infrastructure/storage/AtomicFile.hpp"

#include <QFont>
#include <QPainter>
#include <QPainterPath>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace uptimegrid::infra {

namespace {
constexpr int CELL_WIDTH = 22;
constexpr int CELL_HEIGHT = 14;
constexpr int MARGIN_LEFT = 52;
constexpr int MARGIN_TOP = 40;
constexpr int MARGIN_RIGHT = 16;
constexpr int DATE_LABEL_HEIGHT = 44;
constexpr int LEGEND_HEIGHT = 28;

constexpr int SPARKLINE_WIDTH = 240;
constexpr int SPARKLINE_HEIGHT = 48;
constexpr int PADDING = 4;

constexpr int FILLED_ALPHA = 110;

// Colors
const QColor COLOR_UP(0xFA, 0x46, 0x16);      // Orange
const QColor COLOR_DOWN(0x00, 0x21, 0xA5);    // Blue
const QColor COLOR_NO_DATA(0x33, 0x33, 0x33); // Dark gray
const QColor COLOR_FUTURE(Qt::white);
const QColor COLOR_GRID(0xDD, 0xDD, 0xDD);
const QColor COLOR_TEXT(0x22, 0x22, 0x22);
} // namespace

ChartRenderer::ChartRenderer(const core::ReferenceZone& zone, core::LoggerPtr logger)
    : zone_(zone), logger_(std::move(logger)) {}

std::string ChartRenderer::heatmapFileName(const core::Target& target) {
    return "chart_" + target.sanitizedName() + ".png";
}

std::string ChartRenderer::sparklineFileName(const core::Target& target) {
    return "sparkline_" + target.sanitizedName() + ".png";
}

std::size_t ChartRenderer::heatmapRows(const core::BucketSpec& spec) {
    auto rows = spec.effectiveAlignment() / spec.width;
    return static_cast<std::size_t>(std::max<std::int64_t>(1, rows));
}

ChartRenderer::GridCell ChartRenderer::heatmapCell(std::size_t index, std::size_t count,
                                                   std::size_t rows) {
    const std::size_t columns = (count + rows - 1) / rows;
    const std::size_t fromEnd = count - 1 - index;
    GridCell cell;
    cell.column = static_cast<int>(columns - 1 - fromEnd / rows);
    cell.row = static_cast<int>(rows - 1 - fromEnd % rows);
    return cell;
}

QColor ChartRenderer::colorFor(const core::Bucket& bucket) {
    QColor color;
    switch (bucket.resolved()) {
    case core::BucketValue::Up:
        color = COLOR_UP;
        break;
    case core::BucketValue::Down:
        color = COLOR_DOWN;
        break;
    case core::BucketValue::Future:
        return COLOR_FUTURE;
    default:
        return COLOR_NO_DATA;
    }
    if (bucket.isForwardFilled()) {
        color.setAlpha(FILLED_ALPHA);
    }
    return color;
}

QImage ChartRenderer::renderHeatmap(const core::BucketedSeries& series, const std::string& title,
                                    const core::BucketSpec& spec) const {
    const std::size_t count = series.buckets.size();
    const std::size_t rows = heatmapRows(spec);
    const int columns = count == 0 ? 1 : static_cast<int>((count + rows - 1) / rows);

    const int gridWidth = columns * CELL_WIDTH;
    const int gridHeight = static_cast<int>(rows) * CELL_HEIGHT;
    const int width = std::max(MARGIN_LEFT + gridWidth + MARGIN_RIGHT, 360);
    const int height = MARGIN_TOP + gridHeight + DATE_LABEL_HEIGHT + LEGEND_HEIGHT;

    QImage image(width, height, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::white);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, false);
    painter.setRenderHint(QPainter::TextAntialiasing);

    QFont titleFont = painter.font();
    titleFont.setPixelSize(16);
    titleFont.setBold(true);
    painter.setFont(titleFont);
    painter.setPen(COLOR_TEXT);
    painter.drawText(QRect(0, 8, width, 24), Qt::AlignHCenter | Qt::AlignVCenter,
                     QString::fromStdString(title));

    QFont labelFont = painter.font();
    labelFont.setPixelSize(10);
    labelFont.setBold(false);
    painter.setFont(labelFont);

    // Cells
    for (std::size_t i = 0; i < count; ++i) {
        const auto& bucket = series.buckets[i];
        auto cell = heatmapCell(i, count, rows);
        QRect rect(MARGIN_LEFT + cell.column * CELL_WIDTH, MARGIN_TOP + cell.row * CELL_HEIGHT,
                   CELL_WIDTH, CELL_HEIGHT);
        painter.fillRect(rect, colorFor(bucket));
        painter.setPen(COLOR_GRID);
        painter.drawRect(rect.adjusted(0, 0, -1, -1));
    }

    // Row labels: wall-clock time of each row, taken from the last column
    painter.setPen(COLOR_TEXT);
    const std::size_t labelEvery = std::max<std::size_t>(1, rows / 8);
    for (std::size_t row = 0; row < rows && row < count; row += labelEvery) {
        const std::size_t index = count - rows + row;
        if (index >= count) {
            continue;
        }
        auto start = zone_.toDateTime(series.buckets[index].start());
        QRect rect(0, MARGIN_TOP + static_cast<int>(row) * CELL_HEIGHT, MARGIN_LEFT - 6,
                   CELL_HEIGHT);
        painter.drawText(rect, Qt::AlignRight | Qt::AlignVCenter,
                         start.toString(QStringLiteral("HH:mm")));
    }

    // Column labels: date of the newest bucket in each column
    const int labelY = MARGIN_TOP + gridHeight + 4;
    const int columnLabelEvery = std::max(1, columns / 15);
    for (int column = columns - 1; column >= 0; column -= columnLabelEvery) {
        const std::size_t lastIndex =
            count - 1 - static_cast<std::size_t>(columns - 1 - column) * rows;
        if (lastIndex >= count) {
            continue;
        }
        auto date = zone_.toDateTime(series.buckets[lastIndex].start());
        painter.save();
        painter.translate(MARGIN_LEFT + column * CELL_WIDTH + CELL_WIDTH / 2 + 4, labelY);
        painter.rotate(90);
        painter.drawText(0, 0, date.toString(QStringLiteral("MM-dd")));
        painter.restore();
    }

    // Legend
    struct LegendEntry {
        QColor color;
        const char* label;
    };
    const LegendEntry legend[] = {
        {COLOR_UP, "Up"}, {COLOR_DOWN, "Down"}, {COLOR_NO_DATA, "No data"},
        {COLOR_FUTURE, "Future"}};
    int x = MARGIN_LEFT;
    const int legendY = MARGIN_TOP + gridHeight + DATE_LABEL_HEIGHT + 6;
    for (const auto& entry : legend) {
        QRect swatch(x, legendY, 12, 12);
        painter.fillRect(swatch, entry.color);
        painter.setPen(COLOR_GRID);
        painter.drawRect(swatch.adjusted(0, 0, -1, -1));
        painter.setPen(COLOR_TEXT);
        painter.drawText(x + 16, legendY + 10, QString::fromLatin1(entry.label));
        x += 80;
    }

    painter.end();
    return image;
}

QImage ChartRenderer::renderSparkline(const core::BucketedSeries& series) const {
    QImage image(SPARKLINE_WIDTH, SPARKLINE_HEIGHT, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing);

    const int w = SPARKLINE_WIDTH - 2 * PADDING;
    const int h = SPARKLINE_HEIGHT - 2 * PADDING;

    std::vector<double> values;
    for (const auto& bucket : series.buckets) {
        if (bucket.isFuture()) {
            break;
        }
        values.push_back(bucket.resolved() == core::BucketValue::Up ? 1.0 : 0.0);
    }

    if (values.size() < 2) {
        // Draw a placeholder line when no data
        painter.setPen(QPen(COLOR_NO_DATA, 1));
        painter.drawLine(PADDING, SPARKLINE_HEIGHT / 2, SPARKLINE_WIDTH - PADDING,
                         SPARKLINE_HEIGHT / 2);
        painter.end();
        return image;
    }

    // The x axis covers the whole scaffold so future points leave a gap
    const auto slots = std::max<std::size_t>(2, series.buckets.size());
    const double xStep = static_cast<double>(w) / static_cast<double>(slots - 1);

    QPainterPath linePath;
    QPainterPath fillPath;
    for (std::size_t i = 0; i < values.size(); ++i) {
        double x = PADDING + static_cast<double>(i) * xStep;
        double y = PADDING + (1.0 - values[i]) * h;
        if (i == 0) {
            linePath.moveTo(x, y);
            fillPath.moveTo(x, PADDING + h);
        } else {
            linePath.lineTo(x, y);
        }
        fillPath.lineTo(x, y);
    }
    fillPath.lineTo(PADDING + static_cast<double>(values.size() - 1) * xStep, PADDING + h);
    fillPath.closeSubpath();

    QColor fill = COLOR_UP;
    fill.setAlpha(40);
    painter.fillPath(fillPath, fill);
    painter.setPen(QPen(COLOR_UP, 1.5));
    painter.drawPath(linePath);

    painter.end();
    return image;
}

bool ChartRenderer::writePng(const std::filesystem::path& path, const QImage& image) const {
    return writeAtomically(
        path, [&image](QIODevice& device) { return image.save(&device, "PNG"); }, logger_);
}

bool ChartRenderer::writeHeatmap(const std::filesystem::path& outputDir,
                                 const core::Target& target, const core::BucketedSeries& series,
                                 const core::BucketSpec& spec) const {
    auto image = renderHeatmap(series, target.displayName + " uptime", spec);
    auto path = outputDir / heatmapFileName(target);
    if (!writePng(path, image)) {
        return false;
    }
    logger_->debug("Wrote heatmap for {} to {}", target.address, path.string());
    return true;
}

bool ChartRenderer::writeSparkline(const std::filesystem::path& outputDir,
                                   const core::Target& target,
                                   const core::BucketedSeries& series) const {
    auto path = outputDir / sparklineFileName(target);
    if (!writePng(path, renderSparkline(series))) {
        return false;
    }
    logger_->debug("Wrote sparkline for {} to {}", target.address, path.string());
    return true;
}

} // namespace uptimegrid::infra
