#pragma once

#include "sextant/value/query_result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sextant::navigation {

// Filtered, selectable window over an immutable result. The source is shared
// and never modified; replacing it swaps the whole result at once.
class ListView final {
public:
    ListView() = default;
    ListView(std::shared_ptr<const value::QueryResult> source, std::vector<std::size_t> key_columns);

    // Replaces the source and re-applies the filter. The selection follows
    // the previously selected key when it is still visible, else the first
    // visible row.
    void set_source(std::shared_ptr<const value::QueryResult> source, std::vector<std::size_t> key_columns);

    // Case-insensitive substring match over every rendered cell; empty clears.
    void set_filter(std::string_view text);

    bool select(std::size_t position) noexcept;
    void move_selection(std::int64_t delta) noexcept;

    [[nodiscard]] const std::shared_ptr<const value::QueryResult>& source() const noexcept { return source_; }
    [[nodiscard]] const std::vector<std::size_t>& visible_rows() const noexcept { return visible_; }
    [[nodiscard]] const std::vector<std::size_t>& key_columns() const noexcept { return key_columns_; }
    [[nodiscard]] const std::string& filter() const noexcept { return filter_; }
    [[nodiscard]] std::optional<std::size_t> selection() const noexcept { return selection_; }

    // Index into source()->rows() of the selected entry.
    [[nodiscard]] std::optional<std::size_t> selected_row() const noexcept;
    [[nodiscard]] const value::Row* selected() const noexcept;
    [[nodiscard]] std::optional<std::string> selected_key() const;

    // Visible position of the first row whose key equals the text.
    [[nodiscard]] std::optional<std::size_t> find_key(std::string_view key) const;

    [[nodiscard]] std::string row_key(std::size_t row) const;

private:
    void rebuild_visible();
    void restore_selection(const std::optional<std::string>& key);

    std::shared_ptr<const value::QueryResult> source_{};
    std::vector<std::size_t> key_columns_{};
    std::vector<std::size_t> visible_{};
    std::string filter_{};
    std::optional<std::size_t> selection_{};
};

}  // namespace sextant::navigation
