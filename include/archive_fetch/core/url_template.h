// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file url_template.h
 * @brief Derives numbered archive URLs from the first URL of a sequence
 */

#ifndef ARCHIVE_FETCH_CORE_URL_TEMPLATE_H
#define ARCHIVE_FETCH_CORE_URL_TEMPLATE_H

#include <archive_fetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace archive_fetch {

/**
 * @brief URL pattern with a zero-padded numeric sequence suffix
 *
 * The suffix is the last run of digits immediately before the file
 * extension in the last path segment. The query string is kept verbatim.
 *
 * @code
 * auto tmpl = url_template::parse(
 *     "https://host/dl/takeout-20240101T000000Z-001.zip?j=abc&i=0");
 * tmpl.value().url_for(12);
 * // https://host/dl/takeout-20240101T000000Z-012.zip?j=abc&i=0
 * tmpl.value().filename_for(12);
 * // takeout-20240101T000000Z-012.zip
 * @endcode
 */
class url_template {
public:
    /**
     * @brief Parse the first URL of a sequence
     * @return template, or invalid_url_template if no numeric suffix exists
     */
    [[nodiscard]] static auto parse(std::string_view first_url) -> result<url_template>;

    [[nodiscard]] auto url_for(uint64_t index) const -> std::string;

    /**
     * @brief Local file name for a sequence index
     */
    [[nodiscard]] auto filename_for(uint64_t index) const -> std::string;

    /**
     * @brief Recover the sequence index from a local file name
     * @return index, or nullopt if @p filename does not follow the pattern
     */
    [[nodiscard]] auto index_of(std::string_view filename) const -> std::optional<uint64_t>;

    /**
     * @brief Index encoded in the URL that was parsed
     */
    [[nodiscard]] auto parsed_index() const noexcept -> uint64_t { return parsed_index_; }

    [[nodiscard]] auto width() const noexcept -> std::size_t { return width_; }

    [[nodiscard]] auto source() const noexcept -> const std::string& { return source_; }

private:
    url_template() = default;

    [[nodiscard]] auto pad(uint64_t index) const -> std::string;

    std::string source_;
    std::string directory_;  // scheme, host and path up to the last '/'
    std::string stem_;       // last segment before the digits
    std::string extension_;
    std::string query_;      // including the leading '?', may be empty
    std::size_t width_ = 0;
    uint64_t parsed_index_ = 0;
};

}  // namespace archive_fetch

#endif  // ARCHIVE_FETCH_CORE_URL_TEMPLATE_H
