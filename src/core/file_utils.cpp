// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "archive_fetch/core/file_utils.h"

#include <cerrno>
#include <fstream>
#include <sstream>

namespace archive_fetch {

auto storage_error(std::string context, const std::error_code& ec) -> error {
    error_code code = error_code::storage_error;
    if (ec == std::errc::no_space_on_device || ec == std::errc::file_too_large) {
        code = error_code::disk_full;
    } else if (ec == std::errc::permission_denied ||
               ec == std::errc::operation_not_permitted ||
               ec == std::errc::read_only_file_system) {
        code = error_code::permission_denied;
    }
    return error{code, context + ": " + ec.message()};
}

auto storage_error_from_errno(std::string context) -> error {
    int err = errno;
    if (err == 0) {
        return error{error_code::file_write_error, std::move(context)};
    }
    return storage_error(std::move(context), std::error_code(err, std::generic_category()));
}

auto write_file_atomically(const std::filesystem::path& path, std::string_view content)
    -> result<void> {
    auto temp_path = path;
    temp_path += ".tmp";

    {
        errno = 0;
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(storage_error_from_errno("cannot create " + temp_path.string()));
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            auto err = storage_error_from_errno("cannot write " + temp_path.string());
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return unexpected(err);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(storage_error("cannot replace " + path.string(), ec));
    }
    return {};
}

auto read_text_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_read_error, "cannot open " + path.string()});
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return unexpected(error{error_code::file_read_error, "cannot read " + path.string()});
    }
    return oss.str();
}

auto regular_file_size(const std::filesystem::path& path) -> std::optional<uint64_t> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

}  // namespace archive_fetch
