#pragma once

#include "sextant/backend/backend.hpp"

#include <string>
#include <vector>

namespace sextant::backend {

// Forwards to another sink, flagging the named columns as primary key so that
// rows can be identified again after a refresh.
class PrimaryKeySink final : public RowSink {
public:
    PrimaryKeySink(RowSink& inner, std::vector<std::string> key_columns);

    void on_columns(std::vector<value::ColumnDescriptor> columns) override;
    [[nodiscard]] bool on_batch(std::vector<value::Row> rows) override;
    void on_command(std::string command_tag, std::optional<std::uint64_t> rows_affected) override;

private:
    RowSink& inner_;
    std::vector<std::string> key_columns_{};
};

}  // namespace sextant::backend
