//! # Documentation Logger Implementation

#include "pipeline/doc_logger.hpp"

#include "log/log.hpp"

namespace polydoc::pipeline {

void DefaultDocLogger::progress(const std::string& stage) {
    POLYDOC_LOG_INFO("docgen", stage);
}

void DefaultDocLogger::debug(const std::string& message) {
    POLYDOC_LOG_DEBUG("docgen", message);
}

void DefaultDocLogger::info(const std::string& message) {
    POLYDOC_LOG_INFO("docgen", message);
}

void DefaultDocLogger::warn(const std::string& message) {
    ++warnings_;
    POLYDOC_LOG_WARN("docgen", message);
}

void DefaultDocLogger::error(const std::string& message) {
    ++errors_;
    POLYDOC_LOG_ERROR("docgen", message);
}

void DefaultDocLogger::report() {
    auto warnings = warnings_.load();
    auto errors = errors_.load();
    auto summary = "Generation completed with " + std::to_string(warnings) + " warning" +
                   (warnings == 1 ? "" : "s") + " and " + std::to_string(errors) + " error" +
                   (errors == 1 ? "" : "s");
    if (errors > 0) {
        POLYDOC_LOG_WARN("docgen", summary);
    } else {
        POLYDOC_LOG_INFO("docgen", summary);
    }
    log::Logger::instance().flush();
}

} // namespace polydoc::pipeline
