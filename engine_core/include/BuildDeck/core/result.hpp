#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used across BuildDeck
 *
 * Operations that can fail in ordinary ways return a Result instead of
 * throwing. The error type defaults to a message string; modules whose
 * callers must branch on the failure use an enum instead.
 *
 * @code
 * Result<void> r = settings.load(path);
 * if (r.isError()) {
 *   BUILDDECK_LOG_WARN("Settings: " + r.error());
 * }
 * @endcode
 */

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace BuildDeck {

template <typename T, typename E = std::string> class Result {
public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

  [[nodiscard]] bool isOk() const { return m_data.index() == 0; }
  [[nodiscard]] bool isError() const { return m_data.index() == 1; }

  [[nodiscard]] T& value() & { return std::get<0>(m_data); }
  [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

  [[nodiscard]] const E& error() const { return std::get<1>(m_data); }

  [[nodiscard]] T valueOr(T fallback) const {
    return isOk() ? std::get<0>(m_data) : std::move(fallback);
  }

private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : m_data(tag, std::forward<V>(v)) {}

  std::variant<T, E> m_data;
};

template <typename E> class Result<void, E> {
public:
  static Result ok() { return Result(); }

  static Result error(E err) {
    Result r;
    r.m_error = std::move(err);
    return r;
  }

  [[nodiscard]] bool isOk() const { return !m_error.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }

  [[nodiscard]] const E& error() const { return *m_error; }

private:
  Result() = default;

  std::optional<E> m_error;
};

} // namespace BuildDeck
