#pragma once

#include "core/Logging.hpp"

#include <QIODevice>

#include <filesystem>
#include <functional>
#include <string>

namespace uptimegrid::infra {

/// Writes the payload into the device; returns false to abandon the file.
using DeviceWriter = std::function<bool(QIODevice&)>;

/**
 * @brief Replaces @p path with the bytes produced by @p writer.
 *
 * Data goes to a temporary file in the same directory that is renamed over
 * the target only after everything was written, so readers never observe a
 * partial file. Parent directories are created as needed. Failures are logged
 * as PersistFailure and leave the previous file untouched.
 *
 * @return True if the file was replaced.
 */
bool writeAtomically(const std::filesystem::path& path, const DeviceWriter& writer,
                     const core::LoggerPtr& logger);

bool writeAtomically(const std::filesystem::path& path, const std::string& content,
                     const core::LoggerPtr& logger);

} // namespace uptimegrid::infra
