#include "sextant/query/sql_text.hpp"

#include <cctype>
#include <cstdint>

namespace sextant::query {

namespace {

enum class Region : std::uint8_t {
    Code = 0,
    SingleQuote,
    DoubleQuote,
    LineComment,
    BlockComment
};

// Walks SQL text one character at a time, tracking quoted and commented
// regions. Doubled quote characters stay inside their literal.
class SqlScanner final {
public:
    explicit SqlScanner(std::string_view text) noexcept
        : text_{text}
    {
    }

    [[nodiscard]] bool done() const noexcept { return index_ >= text_.size(); }
    [[nodiscard]] std::size_t position() const noexcept { return index_; }
    [[nodiscard]] Region region() const noexcept { return region_; }

    // Advances past one character (or a two-character token) and reports the
    // region it belonged to.
    Region step() noexcept
    {
        const char ch = text_[index_];
        const char next = index_ + 1U < text_.size() ? text_[index_ + 1U] : '\0';
        const auto entered = region_;

        switch (region_) {
        case Region::LineComment:
            if (ch == '\n') {
                region_ = Region::Code;
            }
            break;
        case Region::BlockComment:
            if (ch == '*' && next == '/') {
                region_ = Region::Code;
                ++index_;
            }
            break;
        case Region::SingleQuote:
        case Region::DoubleQuote: {
            const char quote = region_ == Region::SingleQuote ? '\'' : '"';
            if (ch == quote) {
                if (next == quote) {
                    ++index_;
                } else {
                    region_ = Region::Code;
                }
            }
            break;
        }
        case Region::Code:
            if (ch == '-' && next == '-') {
                region_ = Region::LineComment;
                ++index_;
                ++index_;
                return Region::LineComment;
            }
            if (ch == '/' && next == '*') {
                region_ = Region::BlockComment;
                ++index_;
                ++index_;
                return Region::BlockComment;
            }
            if (ch == '\'') {
                region_ = Region::SingleQuote;
            } else if (ch == '"') {
                region_ = Region::DoubleQuote;
            }
            break;
        }

        ++index_;
        return entered;
    }

private:
    std::string_view text_{};
    std::size_t index_ = 0U;
    Region region_ = Region::Code;
};

bool is_space(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && is_space(text[start])) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && is_space(text[end - 1U])) {
        --end;
    }
    return std::string{text.substr(start, end - start)};
}

bool has_executable_text(std::string_view text)
{
    SqlScanner scanner{text};
    while (!scanner.done()) {
        const auto at = scanner.position();
        const auto region = scanner.step();
        if (region == Region::LineComment || region == Region::BlockComment) {
            continue;
        }
        if (region != Region::Code || !is_space(text[at])) {
            return true;
        }
    }
    return false;
}

bool statement_complete(std::string_view text)
{
    SqlScanner scanner{text};
    std::int32_t depth = 0;
    bool terminated = false;

    while (!scanner.done()) {
        const auto at = scanner.position();
        const auto region = scanner.step();
        if (region != Region::Code) {
            if (region == Region::SingleQuote || region == Region::DoubleQuote) {
                terminated = false;
            }
            continue;
        }

        const char ch = text[at];
        if (is_space(ch)) {
            continue;
        }
        if (scanner.region() != Region::Code) {
            // Opening quote of a new literal.
            terminated = false;
            continue;
        }
        if (ch == '(') {
            ++depth;
        } else if (ch == ')' && depth > 0) {
            --depth;
        }
        terminated = ch == ';' && depth == 0;
    }

    return terminated && scanner.region() != Region::SingleQuote && scanner.region() != Region::DoubleQuote
           && scanner.region() != Region::BlockComment;
}

}  // namespace sextant::query
