//! # Output Writers
//!
//! Destination of rendered files. Paths are relative to the writer's root
//! and always use `/` as separator.
//!
//! | Writer               | Destination                      |
//! |----------------------|----------------------------------|
//! | `FileOutputWriter`   | Files below a root directory     |
//! | `MemoryOutputWriter` | An in-memory path -> content map |

#ifndef POLYDOC_RENDER_OUTPUT_WRITER_HPP
#define POLYDOC_RENDER_OUTPUT_WRITER_HPP

#include "common.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace polydoc::render {

class OutputWriter {
public:
    virtual ~OutputWriter() = default;

    /// Writes `content` to `path`, creating parent directories.
    [[nodiscard]] virtual auto write(const std::string& path, const std::string& content)
        -> Result<Unit, std::string> = 0;

    /// Copies the local file `source` to `path`.
    [[nodiscard]] virtual auto copy(const std::string& source, const std::string& path)
        -> Result<Unit, std::string> = 0;
};

class FileOutputWriter : public OutputWriter {
public:
    explicit FileOutputWriter(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] auto write(const std::string& path, const std::string& content)
        -> Result<Unit, std::string> override;
    [[nodiscard]] auto copy(const std::string& source, const std::string& path)
        -> Result<Unit, std::string> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& {
        return root_;
    }

private:
    std::filesystem::path root_;
};

/// Keeps every written file in memory. Copies read the source from disk.
class MemoryOutputWriter : public OutputWriter {
public:
    [[nodiscard]] auto write(const std::string& path, const std::string& content)
        -> Result<Unit, std::string> override;
    [[nodiscard]] auto copy(const std::string& source, const std::string& path)
        -> Result<Unit, std::string> override;

    [[nodiscard]] auto files() const -> const std::map<std::string, std::string>& {
        return files_;
    }

    /// Content of `path`, or nullptr when nothing was written there.
    [[nodiscard]] auto find(const std::string& path) const -> const std::string*;

private:
    std::map<std::string, std::string> files_;
};

} // namespace polydoc::render

#endif // POLYDOC_RENDER_OUTPUT_WRITER_HPP
