#include "sextant/navigation/list_view.hpp"

#include "sextant/value/value_format.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sextant::navigation {

namespace {

constexpr char kKeySeparator = '\x1f';

std::string lower(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

}  // namespace

ListView::ListView(std::shared_ptr<const value::QueryResult> source, std::vector<std::size_t> key_columns)
{
    set_source(std::move(source), std::move(key_columns));
}

void ListView::set_source(std::shared_ptr<const value::QueryResult> source, std::vector<std::size_t> key_columns)
{
    const auto previous = selected_key();
    source_ = std::move(source);
    key_columns_ = std::move(key_columns);
    rebuild_visible();
    restore_selection(previous);
}

void ListView::set_filter(std::string_view text)
{
    const auto previous = selected_key();
    filter_ = std::string{text};
    rebuild_visible();
    restore_selection(previous);
}

bool ListView::select(std::size_t position) noexcept
{
    if (position >= visible_.size()) {
        return false;
    }
    selection_ = position;
    return true;
}

void ListView::move_selection(std::int64_t delta) noexcept
{
    if (visible_.empty()) {
        selection_.reset();
        return;
    }
    const auto last = static_cast<std::int64_t>(visible_.size()) - 1;
    const auto current = static_cast<std::int64_t>(selection_.value_or(0U));
    selection_ = static_cast<std::size_t>(std::clamp<std::int64_t>(current + delta, 0, last));
}

std::optional<std::size_t> ListView::selected_row() const noexcept
{
    if (!selection_ || *selection_ >= visible_.size()) {
        return std::nullopt;
    }
    return visible_[*selection_];
}

const value::Row* ListView::selected() const noexcept
{
    const auto row = selected_row();
    if (!row) {
        return nullptr;
    }
    return &source_->rows()[*row];
}

std::optional<std::string> ListView::selected_key() const
{
    const auto row = selected_row();
    if (!row) {
        return std::nullopt;
    }
    return row_key(*row);
}

std::optional<std::size_t> ListView::find_key(std::string_view key) const
{
    for (std::size_t position = 0; position < visible_.size(); ++position) {
        if (row_key(visible_[position]) == key) {
            return position;
        }
    }
    return std::nullopt;
}

std::string ListView::row_key(std::size_t row) const
{
    if (!source_ || row >= source_->row_count()) {
        return {};
    }

    const auto& cells = source_->rows()[row];
    std::string key;
    const auto append = [&](std::size_t column) {
        if (!key.empty()) {
            key.push_back(kKeySeparator);
        }
        key.append(value::format_value(cells[column]));
    };

    // Rows without a declared key are identified by their full content.
    if (key_columns_.empty()) {
        for (std::size_t column = 0; column < cells.size(); ++column) {
            append(column);
        }
        return key;
    }
    for (const auto column : key_columns_) {
        if (column < cells.size()) {
            append(column);
        }
    }
    return key;
}

void ListView::rebuild_visible()
{
    visible_.clear();
    if (!source_) {
        return;
    }

    const auto needle = lower(filter_);
    const auto& rows = source_->rows();
    for (std::size_t row = 0; row < rows.size(); ++row) {
        if (needle.empty()) {
            visible_.push_back(row);
            continue;
        }
        const auto matches = std::any_of(rows[row].begin(), rows[row].end(), [&](const value::Value& cell) {
            return lower(value::format_value(cell)).find(needle) != std::string::npos;
        });
        if (matches) {
            visible_.push_back(row);
        }
    }
}

void ListView::restore_selection(const std::optional<std::string>& key)
{
    selection_.reset();
    if (visible_.empty()) {
        return;
    }
    if (key) {
        if (const auto position = find_key(*key)) {
            selection_ = position;
            return;
        }
    }
    selection_ = 0U;
}

}  // namespace sextant::navigation
