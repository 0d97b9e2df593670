#ifndef DBLIB_ROW_CURSOR_HPP
#define DBLIB_ROW_CURSOR_HPP

/**
 * @file RowCursor.hpp
 * @brief Lazy, single-pass sequence of mapped rows
 * @details Rows are fetched one step() at a time. Once exhausted the cursor
 * stays exhausted; run the query again for a fresh pass. A cursor must not
 * outlive the SqlSession that prepared it.
 */

#include "DatabaseTypes.hpp"
#include "SqlSession.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace DbLib {

template <typename EntityType> class RowCursor {
public:
  using Mapper = std::function<EntityType(const Row &)>;

  RowCursor(std::unique_ptr<SqlStatement> statement, Mapper mapper)
      : statement_(std::move(statement)), mapper_(std::move(mapper)) {}

  RowCursor(RowCursor &&) = default;
  RowCursor &operator=(RowCursor &&) = default;

  /**
   * @brief Fetches the next row, std::nullopt once exhausted
   */
  std::optional<EntityType> next() {
    if (!statement_ || !statement_->step()) {
      statement_.reset();
      return std::nullopt;
    }
    ++consumed_;
    return mapper_(statement_->currentRow());
  }

  bool isExhausted() const { return !statement_; }
  size_t consumed() const { return consumed_; }

  /**
   * @brief Drains the remaining rows
   */
  std::vector<EntityType> toVector() {
    std::vector<EntityType> result;
    while (auto entity = next())
      result.push_back(std::move(*entity));
    return result;
  }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = EntityType;
    using difference_type = std::ptrdiff_t;
    using pointer = const EntityType *;
    using reference = const EntityType &;

    iterator() = default;
    explicit iterator(RowCursor *cursor) : cursor_(cursor) { advance(); }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }

    iterator &operator++() {
      advance();
      return *this;
    }

    bool operator==(const iterator &other) const {
      return cursor_ == other.cursor_;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    void advance() {
      current_ = cursor_->next();
      if (!current_)
        cursor_ = nullptr;
    }

    RowCursor *cursor_ = nullptr;
    std::optional<EntityType> current_;
  };

  iterator begin() { return isExhausted() ? iterator() : iterator(this); }
  iterator end() { return iterator(); }

private:
  std::unique_ptr<SqlStatement> statement_;
  Mapper mapper_;
  size_t consumed_ = 0;
};

} // namespace DbLib

#endif // DBLIB_ROW_CURSOR_HPP
