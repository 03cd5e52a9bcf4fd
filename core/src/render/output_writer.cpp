//! # Output Writers Implementation

#include "render/output_writer.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace polydoc::render {

namespace fs = std::filesystem;

namespace {

auto read_file(const std::string& source) -> std::optional<std::string> {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto prepare_parent(const fs::path& target) -> Result<Unit, std::string> {
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return "cannot create directory '" + target.parent_path().string() +
                   "': " + ec.message();
        }
    }
    return Unit{};
}

} // namespace

// ============================================================================
// FileOutputWriter
// ============================================================================

auto FileOutputWriter::write(const std::string& path, const std::string& content)
    -> Result<Unit, std::string> {
    fs::path target = root_ / fs::path(path);
    auto prepared = prepare_parent(target);
    if (is_err(prepared)) {
        return prepared;
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return "cannot open '" + target.string() + "' for writing";
    }
    out << content;
    if (!out) {
        return "failed writing '" + target.string() + "'";
    }
    return Unit{};
}

auto FileOutputWriter::copy(const std::string& source, const std::string& path)
    -> Result<Unit, std::string> {
    fs::path target = root_ / fs::path(path);
    auto prepared = prepare_parent(target);
    if (is_err(prepared)) {
        return prepared;
    }

    std::error_code ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return "cannot copy '" + source + "' to '" + target.string() + "': " + ec.message();
    }
    return Unit{};
}

// ============================================================================
// MemoryOutputWriter
// ============================================================================

auto MemoryOutputWriter::write(const std::string& path, const std::string& content)
    -> Result<Unit, std::string> {
    files_[path] = content;
    return Unit{};
}

auto MemoryOutputWriter::copy(const std::string& source, const std::string& path)
    -> Result<Unit, std::string> {
    auto content = read_file(source);
    if (!content) {
        return "cannot read '" + source + "'";
    }
    files_[path] = std::move(*content);
    return Unit{};
}

auto MemoryOutputWriter::find(const std::string& path) const -> const std::string* {
    auto it = files_.find(path);
    return it != files_.end() ? &it->second : nullptr;
}

} // namespace polydoc::render
