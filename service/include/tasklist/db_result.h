#ifndef TASKLIST_DB_RESULT_H
#define TASKLIST_DB_RESULT_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <boost/lexical_cast.hpp>
#include <tasklist/exceptions.h>

namespace tasklist {

/**
 * @brief Driver side of a result set. Values are the server's text form;
 * std::nullopt stands for SQL NULL.
 */
class ResultImpl {
public:
    virtual ~ResultImpl() = default;
    virtual std::size_t row_count() const = 0;
    virtual std::optional<std::string_view> value(std::size_t row, std::string_view column) const = 0;
    virtual std::int64_t affected_rows() const = 0;
};

// One column of one row, converted on demand
class Cell {
public:
    Cell(std::string_view column, std::optional<std::string_view> text)
        : column_(column), text_(text) {}

    template<typename T>
    T as() const {
        if (!text_) {
            throw StoreError("NULL in column " + std::string(column_));
        }
        if constexpr (std::is_same_v<T, std::string>) {
            return std::string(*text_);
        } else if constexpr (std::is_integral_v<T>) {
            try {
                return boost::lexical_cast<T>(*text_);
            } catch (const boost::bad_lexical_cast&) {
                throw StoreError("Column " + std::string(column_) + " is not numeric");
            }
        } else {
            static_assert(sizeof(T) == 0, "Unsupported Cell conversion");
        }
    }

private:
    std::string_view column_;
    std::optional<std::string_view> text_;
};

class Row {
public:
    Row(std::shared_ptr<const ResultImpl> result, std::size_t index)
        : result_(std::move(result)), index_(index) {}

    Cell operator[](std::string_view column) const {
        return Cell(column, result_->value(index_, column));
    }

private:
    std::shared_ptr<const ResultImpl> result_;
    std::size_t index_;
};

/**
 * @brief Result set handed back by Database::query. A default-constructed
 * DbResult is empty.
 */
class DbResult {
public:
    DbResult() = default;
    explicit DbResult(std::shared_ptr<const ResultImpl> impl) : impl_(std::move(impl)) {}

    std::size_t size() const;
    bool empty() const { return size() == 0; }
    std::int64_t affected_rows() const;

    // Throws StoreError when @p index is past the end
    Row operator[](std::size_t index) const;

private:
    std::shared_ptr<const ResultImpl> impl_;
};

} // namespace tasklist

#endif
