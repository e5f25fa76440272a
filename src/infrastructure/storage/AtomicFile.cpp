#include "infrastructure/storage/AtomicFile.hpp"

#include "core/types/Failure.hpp"

#include <QSaveFile>

namespace uptimegrid::infra {

namespace {

const std::string& persistFailure() {
    static const std::string name =
        core::failureKindToString(core::FailureKind::PersistFailure);
    return name;
}

} // namespace

bool writeAtomically(const std::filesystem::path& path, const DeviceWriter& writer,
                     const core::LoggerPtr& logger) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            logger->error("[{}] Could not create directory {}: {}", persistFailure(),
                          parent.string(), ec.message());
            return false;
        }
    }

    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        logger->error("[{}] Could not open {} for writing: {}", persistFailure(), path.string(),
                      file.errorString().toStdString());
        return false;
    }

    if (!writer(file)) {
        file.cancelWriting();
        logger->error("[{}] Could not write {}: {}", persistFailure(), path.string(),
                      file.errorString().toStdString());
        return false;
    }

    if (!file.commit()) {
        logger->error("[{}] Could not replace {}: {}", persistFailure(), path.string(),
                      file.errorString().toStdString());
        return false;
    }
    return true;
}

bool writeAtomically(const std::filesystem::path& path, const std::string& content,
                     const core::LoggerPtr& logger) {
    return writeAtomically(
        path,
        [&content](QIODevice& device) {
            auto written = device.write(content.data(), static_cast<qint64>(content.size()));
            return written == static_cast<qint64>(content.size());
        },
        logger);
}

} // namespace uptimegrid::infra
